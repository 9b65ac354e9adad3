#include <catch2/catch_all.hpp>
#include "../api/json/fmx_json.h"
#include "../utils/fmx_env.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>

SCENARIO("fmx_variant converts between loosely typed values") {
    GIVEN("Values read from configuration") {
        fmx_variant text("42");
        fmx_variant flag("yes");
        fmx_variant number(3.5);

        THEN("Numeric strings convert to numbers") {
            REQUIRE(text.converts_to(fmx_variant::int_state));
            REQUIRE(text.convert(fmx_variant::int_state).int_value() == 42);
        }
        THEN("Yes/no strings convert to booleans") {
            REQUIRE(flag.convert(fmx_variant::bool_state).bool_value());
        }
        THEN("Non-numeric strings don't convert to numbers") {
            REQUIRE_FALSE(flag.converts_to(fmx_variant::double_state));
        }
        THEN("Doubles print as strings") {
            REQUIRE(number.convert(fmx_variant::string_state).string_value() == "3.5");
        }
    }

    GIVEN("A map with mixed entries") {
        fmxv_map map;
        map["page_num"] = 2;
        map["allow_empty"] = "true";
        map["label"] = "Surname:";
        map["missing"] = fmx_variant();

        THEN("Lookups fall back to defaults for absent or null keys") {
            REQUIRE(fmxv_get_int(map, "page_num") == 2);
            REQUIRE(fmxv_get_bool(map, "allow_empty"));
            REQUIRE(fmxv_get_string(map, "label") == "Surname:");
            REQUIRE(fmxv_get_string(map, "missing", "none") == "none");
            REQUIRE(fmxv_find(map, "missing") == nullptr);
            REQUIRE(fmxv_get_double(map, "label", 1.5) == 1.5);
        }
    }

    GIVEN("A map assigned one of its own entries") {
        fmxv_map inner;
        inner["k"] = "v";
        fmx_variant outer;
        outer.to_map()["inner"] = inner;
        outer = outer.to_map()["inner"];
        THEN("The entry survives the assignment") {
            REQUIRE(outer.is_map());
            REQUIRE(fmxv_get_string(outer.map_value(), "k") == "v");
        }
    }
}

SCENARIO("fmx_json reads and writes variant maps") {
    GIVEN("A JSON template text") {
        fmxv_map data;
        fmx_json json(&data);

        WHEN("It is a valid object") {
            REQUIRE(json.parse(R"({"form_type": "Loan", "fields": [{"name": "Surname", "page_num": 0}], "ok": true})"));
            THEN("Nested values are available") {
                REQUIRE(fmxv_get_string(data, "form_type") == "Loan");
                REQUIRE(data["fields"].is_vector());
                REQUIRE(data["fields"].vector_value()[0].map_value().at("name") == fmx_variant("Surname"));
                REQUIRE(data["ok"].is_bool());
            }
            THEN("Writing it again gives equivalent JSON") {
                fmxv_map again;
                fmx_json reader(&again);
                REQUIRE(reader.parse(json.create()));
                REQUIRE(again == data);
            }
        }

        WHEN("It is broken or not an object") {
            THEN("Parsing fails") {
                REQUIRE_FALSE(json.parse("{\"a\": "));
                REQUIRE_FALSE(json.parse("[1, 2]"));
            }
        }

        WHEN("The file does not exist") {
            THEN("Loading fails") {
                REQUIRE_FALSE(json.load_file("/nonexistent/formex/template.json"));
            }
        }
    }
}

SCENARIO("Environment files feed the engine settings") {
    GIVEN("An env file with comments and quoted values") {
        const char* path = "formex_test.env";
        {
            std::ofstream out(path);
            out << "# engine tunables\n";
            out << "FMX_TEST_WORD_GAP=12.5\n";
            out << "FMX_TEST_NAME=\"two words\"\n";
            out << "FMX_TEST_BROKEN=abc\n";
        }

        WHEN("It is loaded") {
            REQUIRE(load_env_file(path));
            THEN("Values are typed on lookup") {
                REQUIRE(env_double("FMX_TEST_WORD_GAP", 10) == 12.5);
                REQUIRE(env_string("FMX_TEST_NAME", "") == "two words");
                REQUIRE(env_double("FMX_TEST_BROKEN", 7) == 7);
                REQUIRE(env_int("FMX_TEST_UNSET_VALUE", 4) == 4);
            }
        }
        std::remove(path);
    }

    GIVEN("A missing env file") {
        THEN("Loading reports failure") {
            REQUIRE_FALSE(load_env_file("/nonexistent/formex/.env"));
        }
    }
}
