#ifndef FMX_EXTRACTION_RECORD_H
#define FMX_EXTRACTION_RECORD_H

#include "../utils/fmx_geometry.h"
#include "../utils/fmx_variant.h"
#include <set>
#include <vector>

namespace fmx::extract {

namespace method {
  extern const char* const widget;
  extern const char* const table;
  extern const char* const compound_label;
  extern const char* const form_field;
  extern const char* const label_match;
  extern const char* const checkbox_option;
  extern const char* const config_field;
  extern const char* const config_checkbox;
}

struct fmx_extraction_record {
  fmx_string key;
  fmx_string value;
  int page = 0;
  bool has_rect = false;
  fmx_rect rect;
  fmx_string method;

  fmx_extraction_record() = default;
  fmx_extraction_record(const fmx_string& key, const fmx_string& value, int page,
                        const fmx_rect& rect, const fmx_string& method);

  // Provenance as "x0,y0,x1,y1", empty without a rectangle
  fmx_string coordinates() const;

  // {key, value, page_num, coords, method}
  fmx_variant to_variant() const;

  // Reads a record back; an unparsable "coords" entry is dropped with a
  // warning and the record keeps no rectangle
  static bool from_variant(const fmxv_map& data, fmx_extraction_record& out);

  // "- [<method>] <key>: '<value>'"
  fmx_string summary_line() const;
};

// Consumed token indices and emitted keys of one page. Owned by the
// orchestrator for a single page pass.
struct fmx_page_extraction_context {
  int page = 0;
  std::set<size_t> processed_indices;
  std::set<fmx_string> processed_keys;

  bool is_consumed(size_t index) const { return processed_indices.count(index) > 0; }
  bool has_key(const fmx_string& key) const { return processed_keys.count(key) > 0; }
  void consume(const std::vector<size_t>& indices);
};

} // namespace fmx::extract

#endif // FMX_EXTRACTION_RECORD_H
