#include <catch2/catch_all.hpp>
#include "../extraction/fmx_form_template.h"
#include "../extraction/fmx_field_types.h"
#include "../api/json/fmx_json.h"

using namespace fmx::extract;

SCENARIO("Templates are built from parsed configuration") {
    GIVEN("A template in the data_elements layout") {
        fmxv_map data;
        fmx_json json(&data);
        REQUIRE(json.parse(R"({
            "form_type": "Loan Application",
            "identification_string": "LOAN  APPLICATION FORM",
            "data_elements": {
                "fields": [
                    {"name": "Surname", "label": "Surname:"},
                    {"name": "DOB", "label": "Date of Birth:", "page_num": 1, "field_type": "date", "required": true},
                    {"name": "Dependants", "label": "Dependants:", "field_type": "number", "instance": 2},
                    {"name": "Notes", "label": "Notes:", "allow_empty": true, "field_type": "poem"}
                ],
                "checkboxes": [
                    {"name": "Married"},
                    {"name": "Agree", "label": "I agree", "page_num": 2}
                ]
            }
        })"));

        WHEN("Reading it") {
            fmx_form_template form;
            REQUIRE(form.from_variant(data));

            THEN("Fields carry their settings and defaults") {
                REQUIRE(form.form_type == "Loan Application");
                REQUIRE(form.fields.size() == 4);
                REQUIRE(form.fields[0].page_num == 0);
                REQUIRE(form.fields[0].field_type == fmx_field_type::text);
                REQUIRE(form.fields[1].page_num == 1);
                REQUIRE(form.fields[1].required);
                REQUIRE(form.fields[1].field_type == fmx_field_type::date);
                REQUIRE(form.fields[2].field_type == fmx_field_type::count);
                REQUIRE(form.fields[2].instance == 2);
                REQUIRE(form.fields[3].allow_empty);
            }
            THEN("Unknown field types fall back to text") {
                REQUIRE(form.fields[3].field_type == fmx_field_type::text);
            }
            THEN("Checkbox labels default to the name") {
                REQUIRE(form.checkboxes.size() == 2);
                REQUIRE(form.checkboxes[0].label == "Married");
                REQUIRE(form.checkboxes[1].label == "I agree");
                REQUIRE(form.checkboxes[1].page_num == 2);
            }
            THEN("The identification string matches regardless of case and spacing") {
                REQUIRE(form.identifies("Bank of X\nloan application   form\nSurname:"));
                REQUIRE_FALSE(form.identifies("Credit card application"));
            }
        }
    }

    GIVEN("Fields at the top level") {
        fmxv_map data;
        fmx_json json(&data);
        REQUIRE(json.parse(R"({"form_type": "Short", "fields": [{"name": "Name", "label": "Name:"}]})"));

        THEN("They are read as well") {
            fmx_form_template form;
            REQUIRE(form.from_variant(data));
            REQUIRE(form.fields.size() == 1);
            REQUIRE(form.has_elements());
        }
    }

    GIVEN("Broken templates") {
        fmx_form_template form;
        form.form_type = "Kept";

        THEN("A template without form_type is rejected") {
            fmxv_map data;
            data["identification_string"] = "X";
            REQUIRE_FALSE(form.from_variant(data));
            REQUIRE(form.form_type == "Kept");
        }
        THEN("A field without label is rejected") {
            fmxv_map data;
            fmx_json json(&data);
            REQUIRE(json.parse(R"({"form_type": "T", "fields": [{"name": "Name"}]})"));
            REQUIRE_FALSE(form.from_variant(data));
        }
    }
}

SCENARIO("Forms are identified by their first page") {
    GIVEN("Two templates") {
        std::vector<fmx_form_template> templates(2);
        templates[0].form_type = "Loan";
        templates[0].identification_string = "Loan Application";
        templates[1].form_type = "Account";
        templates[1].identification_string = "Account Opening";

        THEN("The first matching one is chosen") {
            const fmx_form_template* form = identify_form(templates, "ACCOUNT OPENING FORM");
            REQUIRE(form != nullptr);
            REQUIRE(form->form_type == "Account");
        }
        THEN("No match gives nullptr") {
            REQUIRE(identify_form(templates, "Insurance claim") == nullptr);
        }
    }
}

SCENARIO("Field types validate and narrow values") {
    THEN("Type names parse, including the number alias") {
        fmx_field_type type = fmx_field_type::text;
        REQUIRE(parse_field_type("Email", type));
        REQUIRE(type == fmx_field_type::email);
        REQUIRE(parse_field_type("number", type));
        REQUIRE(type == fmx_field_type::count);
        REQUIRE_FALSE(parse_field_type("poem", type));
        REQUIRE(field_type_name(fmx_field_type::nationality) == "nationality");
    }

    THEN("Whole values are validated") {
        REQUIRE(validate_field(fmx_field_type::date, "01/02/1990"));
        REQUIRE_FALSE(validate_field(fmx_field_type::date, "1990"));
        REQUIRE(validate_field(fmx_field_type::email, "ann.smith@example.com"));
        REQUIRE(validate_field(fmx_field_type::money, "12,500.00"));
        REQUIRE(validate_field(fmx_field_type::id, "AB123456"));
        REQUIRE(validate_field(fmx_field_type::name, "Ann Smith"));
        REQUIRE_FALSE(validate_field(fmx_field_type::name, "ann"));
        REQUIRE(validate_field(fmx_field_type::education, "diploma"));
        REQUIRE(validate_field(fmx_field_type::nationality, "Zimbabwean"));
        REQUIRE(validate_field(fmx_field_type::count, "3"));
        REQUIRE_FALSE(validate_field(fmx_field_type::count, "45"));
        REQUIRE(validate_field(fmx_field_type::text, "anything"));
        REQUIRE_FALSE(validate_field(fmx_field_type::text, "  "));
    }

    THEN("Narrowing finds the first fitting part") {
        REQUIRE(narrow_field(fmx_field_type::date, "born 1/2/1990 in Harare") == "1/2/1990");
        REQUIRE(narrow_field(fmx_field_type::email, "mail: ann@example.com thanks") == "ann@example.com");
        REQUIRE(narrow_field(fmx_field_type::count, "45 or 2") == "2");
        REQUIRE(narrow_field(fmx_field_type::date, "unknown") == "");
        REQUIRE(narrow_field(fmx_field_type::text, "  as is ") == "as is");
    }
}
