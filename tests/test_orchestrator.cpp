#include <catch2/catch_all.hpp>
#include "../extraction/fmx_orchestrator.h"
#include "../extraction/fmx_log.h"
#include "../documents/fmx_memory_document.h"
#include <set>
#include <stdexcept>

using namespace fmx::extract;

namespace {

  // Consumes the whole page, emits a record and then fails
  class failing_strategy : public fmx_strategy {
  public:
    fmx_strategy_kind kind() const override { return fmx_strategy_kind::widget; }
    fmx_string name() const override { return "Failing"; }

    void extract(const fmx_page_view& page, fmx_page_extraction_context& ctx,
                 std::vector<fmx_extraction_record>& out, std::vector<fmx_string>&) const override {
        ctx.consume(page.tokens.reading_order());
        out.push_back(fmx_extraction_record("Bogus", "value", page.page_number, fmx_rect(0, 0, 1, 1), "Widget"));
        throw std::runtime_error("boom");
    }
  };

  bool unique_keys(const std::vector<fmx_extraction_record>& records) {
      std::set<std::pair<fmx_string, int>> seen;
      for (const auto& r : records) {
          if (!seen.insert(std::make_pair(r.key, r.page)).second) return false;
      }
      return true;
  }

}

SCENARIO("The heuristic pipeline combines its strategies") {
    log::set_quiet(true);

    GIVEN("A page with colon, compound, standalone and checkbox labels") {
        fmx_memory_page page;
        page.add_word("Surname:", 0, 0, 40, 10).add_word("Smith", 45, 0, 80, 10)
            .add_word("Tel", 0, 20, 15, 30).add_word("No.:", 18, 20, 35, 30).add_word("0123456", 40, 20, 80, 30)
            .add_word("Gender:", 0, 40, 35, 50).add_word("X", 45, 40, 52, 50)
            .add_word("Male", 55, 40, 80, 50).add_word("Female", 100, 40, 135, 50)
            .add_word("Occupation", 0, 80, 50, 90).add_word("Teacher", 60, 80, 100, 90);

        fmx_extraction_setup setup;
        fmx_orchestrator orchestrator(setup, heuristic_strategies());
        std::vector<fmx_string> warnings;

        WHEN("Processing the page") {
            std::vector<fmx_extraction_record> records = orchestrator.process_page(0, page, warnings);

            THEN("Every strategy contributes in priority order") {
                REQUIRE(warnings.empty());
                REQUIRE(records.size() == 4);
                REQUIRE(records[0].key == "Male");
                REQUIRE(records[0].value == "Checked");
                REQUIRE(records[0].method == "Checkbox Option");
                REQUIRE(records[1].key == "Tel No.");
                REQUIRE(records[1].value == "0123456");
                REQUIRE(records[1].method == "Compound Label");
                REQUIRE(records[2].key == "Surname");
                REQUIRE(records[2].value == "Smith");
                REQUIRE(records[2].method == "Form Field");
                REQUIRE(records[3].key == "Occupation");
                REQUIRE(records[3].value == "Teacher");
                REQUIRE(records[3].method == "Label Match");
            }
            THEN("The shorter 'Tel' label never fires") {
                for (const auto& r : records) {
                    REQUIRE(r.key != "Tel");
                }
            }
        }
    }
}

SCENARIO("Option words without checkboxes stay ordinary text") {
    log::set_quiet(true);

    GIVEN("A text form using two title options as values") {
        fmx_memory_page page;
        page.add_word("Title:", 0, 0, 30, 10).add_word("Mr", 35, 0, 50, 10)
            .add_word("Referred", 0, 20, 45, 30).add_word("by:", 48, 20, 62, 30)
            .add_word("Dr", 67, 20, 80, 30).add_word("Jones", 83, 20, 110, 30);

        fmx_extraction_setup setup;
        fmx_orchestrator orchestrator(setup, heuristic_strategies());
        std::vector<fmx_string> warnings;
        std::vector<fmx_extraction_record> records = orchestrator.process_page(0, page, warnings);

        THEN("The label matchers read them as values") {
            REQUIRE(warnings.empty());
            REQUIRE(records.size() == 2);
            REQUIRE(records[0].key == "Title");
            REQUIRE(records[0].value == "Mr");
            REQUIRE(records[0].method == "Form Field");
            REQUIRE(records[1].key == "Referred By");
            REQUIRE(records[1].value == "Dr Jones");
        }
    }
}

SCENARIO("Only the first record of a key survives on a page") {
    log::set_quiet(true);

    GIVEN("A text field widget and a printed label with the same name") {
        fmx_memory_page page;
        page.add_word("Surname:", 0, 0, 40, 10).add_word("Jones", 45, 0, 80, 10)
            .add_word("Name:", 0, 20, 30, 30).add_word("Ann", 35, 20, 55, 30)
            .add_word("Name:", 0, 40, 30, 50).add_word("Bob", 35, 40, 55, 50)
            .add_widget("surname", fmx_widget_type::text, "Smith", fmx_rect(300, 0, 400, 10));

        fmx_extraction_setup setup;
        fmx_orchestrator orchestrator(setup, heuristic_strategies());
        std::vector<fmx_string> warnings;
        std::vector<fmx_extraction_record> records = orchestrator.process_page(0, page, warnings);

        THEN("The widget wins and no key repeats") {
            REQUIRE(unique_keys(records));
            REQUIRE(records[0].key == "Surname");
            REQUIRE(records[0].value == "Smith");
            REQUIRE(records[0].method == "Widget");
            REQUIRE(records.size() == 2);
            REQUIRE(records[1].key == "Name");
            REQUIRE(records[1].value == "Ann");
        }
    }
}

SCENARIO("A failing strategy is isolated") {
    log::set_quiet(true);

    GIVEN("A strategy that throws after consuming the page") {
        fmx_memory_page page;
        page.add_word("Surname:", 0, 0, 40, 10).add_word("Smith", 45, 0, 80, 10);

        fmx_extraction_setup setup;
        fmx_orchestrator orchestrator(setup, std::vector<fmx_strategy_kind>());
        orchestrator.add_strategy(std::make_unique<failing_strategy>());
        orchestrator.add_strategy(make_strategy(fmx_strategy_kind::colon_label, orchestrator.get_setup()));
        REQUIRE(orchestrator.strategy_count() == 2);

        WHEN("Processing the page") {
            std::vector<fmx_string> warnings;
            std::vector<fmx_extraction_record> records = orchestrator.process_page(0, page, warnings);

            THEN("Its records and consumed tokens are rolled back") {
                REQUIRE(records.size() == 1);
                REQUIRE(records[0].key == "Surname");
                REQUIRE(records[0].value == "Smith");
            }
            THEN("A warning names the strategy and the error") {
                REQUIRE(warnings.size() == 1);
                REQUIRE(warnings[0].contains("Failing"));
                REQUIRE(warnings[0].contains("boom"));
            }
        }
    }

    GIVEN("A malformed table next to a colon label") {
        fmx_memory_page page;
        page.add_word("Surname:", 0, 0, 40, 10).add_word("Smith", 45, 0, 80, 10);
        fmx_table_grid broken;
        broken.cells = {{"Name"}, {"Ann"}};
        broken.cell_rects = {{fmx_rect(0, 100, 50, 120)}};
        page.add_table(broken);

        fmx_extraction_setup setup;
        fmx_orchestrator orchestrator(setup, heuristic_strategies());
        std::vector<fmx_string> warnings;
        std::vector<fmx_extraction_record> records = orchestrator.process_page(0, page, warnings);

        THEN("The table strategy fails alone") {
            REQUIRE(warnings.size() == 1);
            REQUIRE(warnings[0].contains("Tables"));
            REQUIRE(records.size() == 1);
            REQUIRE(records[0].key == "Surname");
        }
    }
}

SCENARIO("Config strategies read the declared template") {
    log::set_quiet(true);

    GIVEN("A template with a field and a checkbox") {
        fmx_form_template form;
        form.form_type = "Loan";
        fmx_field_config surname;
        surname.name = "Surname";
        surname.label = "Surname:";
        form.fields.push_back(surname);
        fmx_field_config email;
        email.name = "Email";
        email.label = "Email:";
        email.required = true;
        form.fields.push_back(email);
        fmx_checkbox_config married;
        married.name = "Married";
        married.label = "Married";
        form.checkboxes.push_back(married);

        fmx_memory_page page;
        page.add_word("Surname:", 0, 0, 40, 10).add_word("Smith", 45, 0, 80, 10)
            .add_word("Married", 0, 20, 40, 30).add_word("X", 45, 20, 52, 30);

        fmx_extraction_setup setup;
        setup.form = &form;
        fmx_orchestrator orchestrator(setup, config_strategies());
        std::vector<fmx_string> warnings;
        std::vector<fmx_extraction_record> records = orchestrator.process_page(0, page, warnings);

        THEN("Field and checkbox are recorded under their config names") {
            REQUIRE(records.size() == 2);
            REQUIRE(records[0].key == "Surname");
            REQUIRE(records[0].method == "Config Field");
            REQUIRE(records[1].key == "Married");
            REQUIRE(records[1].value == "Checked");
            REQUIRE(records[1].method == "Config Checkbox");
        }
        THEN("The missing required field is reported") {
            REQUIRE(warnings.size() == 1);
            REQUIRE(warnings[0].contains("Email"));
        }
        THEN("Fields of other pages are not looked for") {
            std::vector<fmx_string> page_warnings;
            REQUIRE(orchestrator.process_page(1, page, page_warnings).empty());
            REQUIRE(page_warnings.empty());
        }
    }

    GIVEN("Config strategies without a template") {
        fmx_memory_page page;
        page.add_word("Surname:", 0, 0, 40, 10);
        fmx_extraction_setup setup;
        fmx_orchestrator orchestrator(setup, config_strategies());
        std::vector<fmx_string> warnings;

        THEN("Both fail in isolation") {
            REQUIRE(orchestrator.process_page(0, page, warnings).empty());
            REQUIRE(warnings.size() == 2);
        }
    }
}

SCENARIO("Widget values are normalized") {
    log::set_quiet(true);

    GIVEN("Widgets of every kind") {
        fmx_memory_page page;
        page.add_widget("agree_terms", fmx_widget_type::checkbox, "Yes", fmx_rect(0, 0, 10, 10))
            .add_widget("newsletter", fmx_widget_type::checkbox, "Off", fmx_rect(0, 20, 10, 30))
            .add_widget("gender", fmx_widget_type::radio, "female", fmx_rect(0, 40, 10, 50))
            .add_widget("city", fmx_widget_type::combo, " (Harare) ", fmx_rect(0, 60, 100, 70))
            .add_widget("notes", fmx_widget_type::text, "", fmx_rect(0, 80, 100, 90));

        fmx_extraction_setup setup;
        fmx_orchestrator orchestrator(setup, {fmx_strategy_kind::widget});
        std::vector<fmx_string> warnings;
        std::vector<fmx_extraction_record> records = orchestrator.process_page(0, page, warnings);

        THEN("Unchecked and empty widgets are dropped") {
            REQUIRE(records.size() == 3);
            REQUIRE(records[0].key == "Agree Terms");
            REQUIRE(records[0].value == "Checked");
            REQUIRE(records[1].key == "Gender");
            REQUIRE(records[1].value == "Female");
            REQUIRE(records[2].key == "City");
            REQUIRE(records[2].value == "Harare");
        }
    }
}
