#include <catch2/catch_all.hpp>
#include "../extraction/fmx_token_model.h"
#include "../extraction/fmx_extraction_record.h"
#include "../extraction/fmx_log.h"

using namespace fmx::extract;

SCENARIO("Words are organized into lines") {
    GIVEN("Words out of order with a blank entry") {
        std::vector<fmx_word> words = {
            {"Smith", fmx_rect(45, 1, 80, 11)},
            {"   ", fmx_rect(90, 0, 95, 10)},
            {"Address:", fmx_rect(0, 20, 40, 30)},
            {"Surname:", fmx_rect(0, 0, 40, 10)}
        };
        fmx_token_model model(2, words, 3);

        THEN("Blank words are dropped") {
            REQUIRE(model.size() == 3);
            REQUIRE(model.page() == 2);
            REQUIRE(model.at(0).page == 2);
        }
        THEN("Lines run top to bottom and left to right") {
            REQUIRE(model.lines().size() == 2);
            REQUIRE(model.at(model.lines()[0][0]).text == "Surname:");
            REQUIRE(model.at(model.lines()[0][1]).text == "Smith");
            REQUIRE(model.at(model.lines()[1][0]).text == "Address:");
            REQUIRE(model.line_of(0) == 0);
            REQUIRE(model.line_of(1) == 1);
        }
        THEN("Region queries use word centres in reading order") {
            std::vector<size_t> found = model.tokens_in(fmx_rect(0, 0, 100, 12));
            REQUIRE(found.size() == 2);
            REQUIRE(model.at(found[0]).text == "Surname:");
            REQUIRE(model.tokens_in(fmx_rect(30, 0, 50, 12)).empty());
        }
        THEN("Bad indices throw") {
            REQUIRE_THROWS_AS(model.at(3), std::out_of_range);
        }
    }
}

SCENARIO("Extraction records carry their provenance") {
    log::set_quiet(true);

    GIVEN("A record with a rectangle") {
        fmx_extraction_record record("Surname", "Smith", 1, fmx_rect(45, 0, 80, 10), method::form_field);

        THEN("Coordinates and summary are formatted") {
            REQUIRE(record.coordinates() == "45.0,0.0,80.0,10.0");
            REQUIRE(record.summary_line() == "- [Form Field] Surname: 'Smith'");
        }
        THEN("It reads back from its variant form") {
            fmx_extraction_record copy;
            REQUIRE(fmx_extraction_record::from_variant(record.to_variant().map_value(), copy));
            REQUIRE(copy.key == "Surname");
            REQUIRE(copy.page == 1);
            REQUIRE(copy.has_rect);
            REQUIRE(copy.rect == record.rect);
        }
    }

    GIVEN("Stored records with bad coordinates or no key") {
        fmxv_map data;
        data["key"] = "Surname";
        data["value"] = "Smith";
        data["coords"] = "45,zero,80";

        THEN("Malformed coordinates are dropped") {
            fmx_extraction_record record;
            REQUIRE(fmx_extraction_record::from_variant(data, record));
            REQUIRE(record.value == "Smith");
            REQUIRE_FALSE(record.has_rect);
            REQUIRE(record.coordinates().empty());
        }
        THEN("A record needs a key") {
            fmxv_map no_key;
            no_key["value"] = "Smith";
            fmx_extraction_record record;
            REQUIRE_FALSE(fmx_extraction_record::from_variant(no_key, record));
        }
    }

    GIVEN("A page context") {
        fmx_page_extraction_context ctx;
        ctx.consume({1, 3});
        ctx.processed_keys.insert("Surname");

        THEN("Consumed tokens and keys are tracked") {
            REQUIRE(ctx.is_consumed(3));
            REQUIRE_FALSE(ctx.is_consumed(2));
            REQUIRE(ctx.has_key("Surname"));
            REQUIRE_FALSE(ctx.has_key("surname"));
        }
    }
}
