#ifndef FMX_LABEL_DICTIONARY_H
#define FMX_LABEL_DICTIONARY_H

#include "../utils/fmx_variant.h"
#include <vector>

namespace fmx::extract {

struct fmx_checkbox_group {
  fmx_string name;
  std::vector<fmx_string> options;
};

// Known label vocabulary of the heuristic pipeline. JSON layout:
// {"compound_labels": [...], "standalone_labels": [...],
//  "checkbox_groups": [{"name": "Gender", "options": ["Male", "Female"]}]}
class fmx_label_dictionary
{
public:
  std::vector<fmx_string> compound_labels;
  std::vector<fmx_string> standalone_labels;
  std::vector<fmx_checkbox_group> checkbox_groups;

  static fmx_label_dictionary default_dictionary();

  // Replaces the whole dictionary; false leaves it unchanged
  bool from_variant(const fmxv_map& data);
  bool load_file(const fmx_string& path);
};

} // namespace fmx::extract

#endif // FMX_LABEL_DICTIONARY_H
