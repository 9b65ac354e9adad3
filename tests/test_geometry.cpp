#include <catch2/catch_all.hpp>
#include "../utils/fmx_geometry.h"

SCENARIO("fmx_rect provides the rectangle maths of the engine") {
    GIVEN("A rectangle in top-down page space") {
        fmx_rect rect(10, 20, 110, 70);

        THEN("Size and centre are derived from the corners") {
            REQUIRE(rect.width() == 100.0);
            REQUIRE(rect.height() == 50.0);
            REQUIRE(rect.center_x() == 60.0);
            REQUIRE(rect.center_y() == 45.0);
            REQUIRE_FALSE(rect.is_empty());
        }

        WHEN("Testing containment and intersection") {
            THEN("Edges count as inside") {
                REQUIRE(rect.contains_point(10, 20));
                REQUIRE_FALSE(rect.contains_point(9.9, 20));
                REQUIRE(rect.contains(fmx_rect(20, 30, 50, 40)));
                REQUIRE(rect.intersects(fmx_rect(110, 70, 120, 80)));
                REQUIRE_FALSE(rect.intersects(fmx_rect(111, 20, 120, 30)));
            }
        }

        WHEN("Combining rectangles") {
            fmx_rect other(100, 0, 200, 30);
            THEN("include gives the union and expanded grows every side") {
                REQUIRE(rect.include(other) == fmx_rect(10, 0, 200, 70));
                REQUIRE(rect.expanded(5) == fmx_rect(5, 15, 115, 75));
            }
            THEN("The centroid distance is Euclidean") {
                fmx_rect shifted(13, 24, 113, 74);
                REQUIRE(rect.centroid_distance(shifted) == Catch::Approx(5.0));
            }
        }
    }

    GIVEN("A degenerate rectangle") {
        fmx_rect line(0, 10, 50, 10);
        THEN("It is empty") {
            REQUIRE(line.is_empty());
        }
    }
}

SCENARIO("Provenance strings round-trip through fmx_rect") {
    GIVEN("A rectangle") {
        fmx_rect rect(1, 2, 3.5, 4);

        THEN("It prints with one decimal") {
            REQUIRE(rect.to_string() == "1.0,2.0,3.5,4.0");
        }
        THEN("Its string parses back") {
            fmx_rect parsed;
            REQUIRE(fmx_rect::parse(rect.to_string(), parsed));
            REQUIRE(parsed == rect);
        }
    }

    GIVEN("Malformed provenance") {
        fmx_rect untouched(7, 7, 8, 8);
        THEN("Parsing fails and leaves the output alone") {
            REQUIRE_FALSE(fmx_rect::parse("1,2,3", untouched));
            REQUIRE_FALSE(fmx_rect::parse("a,2,3,4", untouched));
            REQUIRE_FALSE(fmx_rect::parse("5,5,5,9", untouched));
            REQUIRE_FALSE(fmx_rect::parse("", untouched));
            REQUIRE(untouched == fmx_rect(7, 7, 8, 8));
        }
        THEN("Spaces around numbers are accepted") {
            fmx_rect parsed;
            REQUIRE(fmx_rect::parse(" 0, 0 ,10, 10", parsed));
            REQUIRE(parsed == fmx_rect(0, 0, 10, 10));
        }
    }
}
