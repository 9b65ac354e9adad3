#include "fmx_table_normalizer.h"
#include "fmx_text_normalizer.h"

namespace fmx::extract {

namespace {

  void check_shape(const fmx_table_grid& table, int index)
  {
    bool valid = table.cells.size() == table.cell_rects.size();
    for (size_t r = 0; valid && r < table.cells.size(); ++r)
    {
      valid = table.cells[r].size() == table.cell_rects[r].size();
    }
    if (!valid)
    {
      throw fmx_strategy_exception(method::table, "cell rectangles of table " + fmx_string(std::to_string(index)) +
                                                  " don't match its cells");
    }
  }

  bool has_values(const std::vector<fmx_string>& row)
  {
    for (const auto& cell : row)
    {
      if (!clean_value(cell).empty()) return true;
    }
    return false;
  }

}

std::vector<fmx_extraction_record> fmx_table_normalizer::normalize(const fmx_table_grid& table, int index, int page)
{
  check_shape(table, index);

  std::vector<fmx_extraction_record> result;
  if (table.row_count() < 2)
  {
    return result;
  }

  std::vector<fmx_string> headers;
  for (const auto& cell : table.cells[0])
  {
    headers.push_back(clean_key(cell));
  }

  size_t filled_rows = 0;
  for (size_t r = 1; r < table.row_count(); ++r)
  {
    if (has_values(table.cells[r])) ++filled_rows;
  }

  fmx_string prefix = "Table " + fmx_string(std::to_string(index)) + " - ";
  for (size_t r = 1; r < table.row_count(); ++r)
  {
    for (size_t c = 0; c < table.column_count(r); ++c)
    {
      if (c >= headers.size() || headers[c].empty())
      {
        continue;
      }
      const fmx_string& raw = table.cell(r, c);
      if (is_fill_artifact(raw))
      {
        continue;
      }
      fmx_string value = clean_value(raw);
      if (value.empty())
      {
        continue;
      }
      fmx_string key = filled_rows > 1 ? prefix + "Row " + fmx_string(std::to_string(r)) + " - " + headers[c]
                                       : prefix + headers[c];
      result.push_back(fmx_extraction_record(key, value, page, table.cell_rect(r, c), method::table));
    }
  }
  return result;
}

} // namespace fmx::extract
