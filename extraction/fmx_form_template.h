#ifndef FMX_FORM_TEMPLATE_H
#define FMX_FORM_TEMPLATE_H

#include "fmx_field_types.h"
#include "../utils/fmx_variant.h"
#include <vector>

namespace fmx::extract {

struct fmx_field_config {
  fmx_string name;
  fmx_string label;
  int page_num = 0;
  int instance = 0;
  bool allow_empty = false;
  bool required = false;
  fmx_field_type field_type = fmx_field_type::text;
};

struct fmx_checkbox_config {
  fmx_string name;
  fmx_string label;
  int page_num = 0;
  int instance = 0;
};

// A declared form layout, built from already parsed configuration data:
// {form_type, identification_string,
//  data_elements: {fields: [...], checkboxes: [...]}}
// fields/checkboxes may also sit at the top level.
class fmx_form_template
{
public:
  fmx_string form_type;
  fmx_string identification_string;
  std::vector<fmx_field_config> fields;
  std::vector<fmx_checkbox_config> checkboxes;

  // Errors are logged; false means the template is unusable
  bool from_variant(const fmxv_map& data);
  bool load_file(const fmx_string& path);

  // Identification string occurs in the text, ignoring case and spacing
  bool identifies(const fmx_string& first_page_text) const;

  bool has_elements() const { return !fields.empty() || !checkboxes.empty(); }
};

// First template whose identification string occurs in the text, or nullptr
const fmx_form_template* identify_form(const std::vector<fmx_form_template>& templates,
                                       const fmx_string& first_page_text);

} // namespace fmx::extract

#endif // FMX_FORM_TEMPLATE_H
