#ifndef FMX_TABLE_NORMALIZER_H
#define FMX_TABLE_NORMALIZER_H

#include "fmx_extraction_record.h"
#include "../documents/fmx_doc_source.h"

namespace fmx::extract {

// Turns a detected table into records. Row 0 holds the headers; every
// non-empty cell below it becomes "Table <index> - <header>", or
// "Table <index> - Row <r> - <header>" when the table has several data
// rows. Headerless columns and fill-only cells are skipped.
class fmx_table_normalizer
{
public:
  // index is 1-based. Throws fmx_strategy_exception when the cell
  // rectangles don't match the cells.
  static std::vector<fmx_extraction_record> normalize(const fmx_table_grid& table, int index, int page);
};

} // namespace fmx::extract

#endif // FMX_TABLE_NORMALIZER_H
