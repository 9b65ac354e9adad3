#ifndef FMX_TEMPLATE_PARSER_H
#define FMX_TEMPLATE_PARSER_H

#include "fmx_label_detector.h"
#include "fmx_form_template.h"

namespace fmx::extract {

// Sequential parser of the template-driven pipeline. Scans every line
// left to right, matching the declared labels case-sensitively and
// longest first. A label takes the following tokens of its line up to the
// next declared label; an empty value may continue on the next line.
// The n-th occurrence of a label belongs to the field with instance n.
class fmx_template_parser
{
  const fmx_token_model& tokens;
  const fmx_extraction_options& options;

  std::vector<size_t> next_line_value(size_t line, const fmx_rect& label, const fmx_label_set& labels,
                                      const std::set<size_t>& consumed) const;

public:
  fmx_template_parser(const fmx_token_model& tokens, const fmx_extraction_options& options);

  // One record per matched field, keyed by the field name. Fields are
  // taken as given; the caller selects those of the page. Label and value
  // tokens are consumed in ctx.
  std::vector<fmx_extraction_record> parse(const std::vector<fmx_field_config>& fields,
                                           fmx_page_extraction_context& ctx) const;
};

// Label text a field or checkbox is searched by, the name when unset
fmx_string field_label(const fmx_field_config& field);

} // namespace fmx::extract

#endif // FMX_TEMPLATE_PARSER_H
