#ifndef FMX_DOC_SOURCE_H
#define FMX_DOC_SOURCE_H

#include "../utils/fmx_string.h"
#include "../utils/fmx_geometry.h"
#include "../utils/fmx_exceptions.h"
#include <vector>

// Positioned word as delivered by a document engine, top-down page space
struct fmx_word {
  fmx_string text;
  fmx_rect rect;
};

enum class fmx_widget_type {
  text,
  checkbox,
  radio,
  combo,
  list
};

fmx_string widget_type_name(fmx_widget_type type);
bool parse_widget_type(const fmx_string& name, fmx_widget_type& out);

struct fmx_widget {
  fmx_string field_name;
  fmx_widget_type field_type = fmx_widget_type::text;
  fmx_string field_value;
  fmx_rect rect;
};

// Detected table: row 0 is the header row
class fmx_table_grid {
public:
  std::vector<std::vector<fmx_string>> cells;
  std::vector<std::vector<fmx_rect>> cell_rects;

  size_t row_count() const;
  size_t column_count(size_t row) const;

  // Throw std::out_of_range for cells outside the grid
  const fmx_string& cell(size_t row, size_t col) const;
  const fmx_rect& cell_rect(size_t row, size_t col) const;

  fmx_rect bounds() const;
};

// Groups rectangles into text lines by baseline (y1). Lines are returned
// top to bottom, each sorted left to right, as indices into rects.
std::vector<std::vector<size_t>> group_lines(const std::vector<fmx_rect>& rects, double tolerance);

// One page of a document, read-only
class fmx_page_source {
public:
  virtual ~fmx_page_source() = default;

  virtual double width() const = 0;
  virtual double height() const = 0;

  virtual std::vector<fmx_word> words() const = 0;
  virtual std::vector<fmx_rect> vector_shapes() const = 0;
  virtual std::vector<fmx_table_grid> tables() const = 0;
  virtual std::vector<fmx_widget> widgets() const = 0;

  // All occurrences of a phrase as a whole word sequence in reading order.
  // Case-insensitive; the last word may carry a trailing colon.
  virtual std::vector<fmx_rect> search_text(const fmx_string& phrase) const;

  // Words whose centre lies inside the region, in reading order
  virtual fmx_string text_in_region(const fmx_rect& region) const;

  // Full page text in reading order, one line per text line
  fmx_string text() const;
};

// A scoped handle on a paginated document. open() acquires it, close()
// releases it; page access needs an open handle.
class fmx_document {
public:
  virtual ~fmx_document() = default;

  virtual bool open() = 0;
  // Throws fmx_document_closed_exception when the handle isn't open
  virtual void close() = 0;
  virtual bool is_open() const = 0;

  virtual size_t page_count() const = 0;
  // Throws fmx_document_closed_exception or std::out_of_range
  virtual const fmx_page_source& page(size_t index) const = 0;

  virtual fmx_string source_name() const = 0;
};

// Releases the document when leaving scope. A handle that is already
// closed is not an error here.
class fmx_document_guard {
  fmx_document& document;
  bool opened;

public:
  explicit fmx_document_guard(fmx_document& doc);
  ~fmx_document_guard();

  fmx_document_guard(const fmx_document_guard&) = delete;
  fmx_document_guard& operator=(const fmx_document_guard&) = delete;

  bool is_open() const { return opened; }
  void release();
};

#endif // FMX_DOC_SOURCE_H
