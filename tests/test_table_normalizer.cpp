#include <catch2/catch_all.hpp>
#include "../extraction/fmx_table_normalizer.h"

using namespace fmx::extract;

namespace {

  // Grid of 50x20 cells from the given texts
  fmx_table_grid make_grid(const std::vector<std::vector<fmx_string>>& cells) {
      fmx_table_grid grid;
      grid.cells = cells;
      for (size_t r = 0; r < cells.size(); ++r) {
          std::vector<fmx_rect> row;
          for (size_t c = 0; c < cells[r].size(); ++c) {
              row.push_back(fmx_rect(c * 50.0, r * 20.0, (c + 1) * 50.0, (r + 1) * 20.0));
          }
          grid.cell_rects.push_back(row);
      }
      return grid;
  }

}

SCENARIO("Tables become header-keyed records") {
    GIVEN("A table with one data row") {
        fmx_table_grid grid = make_grid({{"Name", "Age:"}, {"Ann", "7"}});

        WHEN("Normalizing it as the first table of page 0") {
            std::vector<fmx_extraction_record> records = fmx_table_normalizer::normalize(grid, 1, 0);

            THEN("Keys name the table and the header") {
                REQUIRE(records.size() == 2);
                REQUIRE(records[0].key == "Table 1 - Name");
                REQUIRE(records[0].value == "Ann");
                REQUIRE(records[0].method == "Table");
                REQUIRE(records[0].rect == fmx_rect(0, 20, 50, 40));
                REQUIRE(records[1].key == "Table 1 - Age");
                REQUIRE(records[1].value == "7");
            }
        }
    }

    GIVEN("A table with several data rows") {
        fmx_table_grid grid = make_grid({{"Item", "Amount"}, {"Rent", "500"}, {"Food", "200"}});

        THEN("Keys carry the row number") {
            std::vector<fmx_extraction_record> records = fmx_table_normalizer::normalize(grid, 2, 0);
            REQUIRE(records.size() == 4);
            REQUIRE(records[0].key == "Table 2 - Row 1 - Item");
            REQUIRE(records[3].key == "Table 2 - Row 2 - Amount");
            REQUIRE(records[3].value == "200");
        }
    }

    GIVEN("Headerless columns and fill-only cells") {
        fmx_table_grid grid = make_grid({{"Name", "", "Phone"}, {"Ann", "note", "_____"}});

        THEN("They are skipped") {
            std::vector<fmx_extraction_record> records = fmx_table_normalizer::normalize(grid, 1, 0);
            REQUIRE(records.size() == 1);
            REQUIRE(records[0].key == "Table 1 - Name");
        }
    }

    GIVEN("A header without data") {
        fmx_table_grid grid = make_grid({{"Name", "Age"}});

        THEN("Nothing is produced") {
            REQUIRE(fmx_table_normalizer::normalize(grid, 1, 0).empty());
        }
    }

    GIVEN("A dash in a data cell") {
        fmx_table_grid grid = make_grid({{"Name", "Spouse"}, {"Ann", "-"}});

        THEN("It is kept as a value") {
            std::vector<fmx_extraction_record> records = fmx_table_normalizer::normalize(grid, 1, 0);
            REQUIRE(records.size() == 2);
            REQUIRE(records[1].key == "Table 1 - Spouse");
            REQUIRE(records[1].value == "-");
        }
    }

    GIVEN("Cell rectangles that don't match the cells") {
        fmx_table_grid grid = make_grid({{"Name", "Age"}, {"Ann", "7"}});
        grid.cell_rects[1].pop_back();

        THEN("The table is rejected as a strategy fault") {
            REQUIRE_THROWS_AS(fmx_table_normalizer::normalize(grid, 1, 0), fmx_strategy_exception);
        }
    }
}
