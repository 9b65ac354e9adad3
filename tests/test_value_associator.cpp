#include <catch2/catch_all.hpp>
#include "../extraction/fmx_value_associator.h"
#include "../documents/fmx_memory_document.h"

using namespace fmx::extract;

namespace {

  struct associator_fixture {
    fmx_memory_page page;
    fmx_extraction_options options;
    fmx_label_dictionary dictionary = fmx_label_dictionary::default_dictionary();

    fmx_value_span value_of(size_t line, size_t pos, std::set<size_t> consumed = std::set<size_t>()) {
        fmx_token_model tokens(0, page.words(), options.line_bucket);
        fmx_label_detector detector(tokens, dictionary, options);
        fmx_value_associator associator(tokens, detector, options);
        fmx_page_extraction_context ctx;
        fmx_label_match label;
        REQUIRE(detector.colon_at(line, pos, ctx, label));
        return associator.associate(label, consumed);
    }
  };

}

SCENARIO("Values stop at the next label") {
    GIVEN("The line 'Name: John  DOB: 1990'") {
        associator_fixture f;
        f.page.add_word("Name:", 0, 0, 30, 10)
              .add_word("John", 35, 0, 60, 10)
              .add_word("DOB:", 65, 0, 90, 10)
              .add_word("1990", 95, 0, 120, 10);

        THEN("Name gets John") {
            fmx_value_span value = f.value_of(0, 0);
            REQUIRE(value.text == "John");
            REQUIRE(value.rect == fmx_rect(35, 0, 60, 10));
        }
        THEN("DOB gets 1990") {
            REQUIRE(f.value_of(0, 2).text == "1990");
        }
    }

    GIVEN("A value followed by a dictionary label") {
        associator_fixture f;
        f.page.add_word("Employer:", 0, 0, 45, 10)
              .add_word("Acme", 50, 0, 75, 10)
              .add_word("Occupation", 78, 0, 120, 10)
              .add_word("Clerk", 123, 0, 150, 10);

        THEN("The dictionary label ends the value") {
            REQUIRE(f.value_of(0, 0).text == "Acme");
        }
    }

    GIVEN("Words separated by a wide gap") {
        associator_fixture f;
        f.page.add_word("City:", 0, 0, 25, 10)
              .add_word("Harare", 30, 0, 60, 10)
              .add_word("Zimbabwe", 63, 0, 100, 10)
              .add_word("Page", 250, 0, 270, 10);

        THEN("The gap ends the value") {
            REQUIRE(f.value_of(0, 0).text == "Harare Zimbabwe");
        }
    }
}

SCENARIO("Values may sit on the next line") {
    GIVEN("A label alone on its line with the value below") {
        associator_fixture f;
        f.page.add_word("Address:", 0, 0, 40, 10)
              .add_word("12", 0, 15, 10, 25)
              .add_word("Main", 13, 15, 35, 25)
              .add_word("Street", 38, 15, 70, 25);

        THEN("The next line is taken") {
            fmx_value_span value = f.value_of(0, 0);
            REQUIRE(value.text == "12 Main Street");
            REQUIRE(value.rect == fmx_rect(0, 15, 70, 25));
            REQUIRE(value.token_indices.size() == 3);
        }
        THEN("Consumed tokens are not candidates") {
            REQUIRE(f.value_of(0, 0, {1}).text == "Main Street");
        }
    }

    GIVEN("Text far below the label") {
        associator_fixture f;
        f.page.add_word("Address:", 0, 0, 40, 10)
              .add_word("Footer", 0, 60, 30, 70);

        THEN("The value is empty and keeps the label rectangle") {
            fmx_value_span value = f.value_of(0, 0);
            REQUIRE(value.empty());
            REQUIRE(value.rect == fmx_rect(0, 0, 40, 10));
        }
    }
}

SCENARIO("Equally distant candidates go to the nearer centroid") {
    GIVEN("Two tokens at the same horizontal gap on slightly different baselines") {
        associator_fixture f;
        f.page.add_word("Ref:", 0, 0, 30, 10)
              .add_word("above", 40, -4, 60, 5)
              .add_word("level", 40, 4, 60, 14);

        THEN("The token whose centre is closer to the label wins") {
            REQUIRE(f.value_of(1, 0).text == "level");
        }
    }
}

SCENARIO("Markers and colon labels are never values") {
    GIVEN("A check mark and another label right of a label") {
        associator_fixture f;
        f.page.add_word("Agree:", 0, 0, 30, 10)
              .add_word("x", 35, 0, 40, 10)
              .add_word("Notes:", 45, 0, 75, 10);

        THEN("No value is found") {
            REQUIRE(f.value_of(0, 0).empty());
        }
    }
}
