#ifndef FMX_VALUE_ASSOCIATOR_H
#define FMX_VALUE_ASSOCIATOR_H

#include "fmx_label_detector.h"

namespace fmx::extract {

struct fmx_value_span {
  fmx_string text;
  fmx_rect rect;
  std::vector<size_t> token_indices;

  bool empty() const { return text.empty(); }
};

// Finds the value belonging to a label anchor. Candidates come from a
// same-line region right of the label and a next-line region below it;
// the nearest one starts the value, which then grows to the right until
// a wide gap, another label or the end of the region. Without a value
// the span is empty and carries the label's rectangle.
class fmx_value_associator
{
  const fmx_token_model& tokens;
  const fmx_label_detector& detector;
  const fmx_extraction_options& options;

  bool usable(size_t index, const fmx_label_match& label, const std::set<size_t>& consumed) const;

public:
  fmx_value_associator(const fmx_token_model& tokens, const fmx_label_detector& detector,
                       const fmx_extraction_options& options);

  fmx_rect same_line_region(const fmx_rect& label) const;
  fmx_rect next_line_region(const fmx_rect& label) const;

  fmx_value_span associate(const fmx_label_match& label, const std::set<size_t>& consumed) const;
};

} // namespace fmx::extract

#endif // FMX_VALUE_ASSOCIATOR_H
