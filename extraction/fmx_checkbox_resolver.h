#ifndef FMX_CHECKBOX_RESOLVER_H
#define FMX_CHECKBOX_RESOLVER_H

#include "fmx_token_model.h"
#include "fmx_extraction_options.h"
#include <set>
#include <vector>

namespace fmx::extract {

enum class fmx_checkbox_state {
  checked,
  unchecked,
  not_found
};

// "Checked", "Unchecked", "Not Found"
fmx_string checkbox_state_name(fmx_checkbox_state state);

struct fmx_checkbox_result {
  fmx_checkbox_state state = fmx_checkbox_state::not_found;
  // Widget, glyph or box that decided, the label itself when nothing did
  fmx_rect rect;
  // Marker tokens used for the decision
  std::vector<size_t> token_indices;
};

// Decides checkbox state next to a label. A checkbox or radio widget near
// the label wins; otherwise a check mark glyph near the label means
// checked; otherwise the closest box-sized vector shape decides by the
// text inside it. Nothing found is "Not Found".
class fmx_checkbox_resolver
{
  const fmx_page_source& page;
  const fmx_token_model& tokens;
  const fmx_extraction_options& options;
  std::vector<fmx_widget> widgets;
  std::vector<fmx_rect> boxes;

public:
  fmx_checkbox_resolver(const fmx_page_source& page, const fmx_token_model& tokens,
                        const fmx_extraction_options& options);

  // Marker tokens used are added to consumed
  fmx_checkbox_result resolve(const fmx_rect& label, std::set<size_t>& consumed) const;

  // Options of one group. Every widget, glyph and box belongs to the
  // option nearest to it, so none is assigned twice.
  std::vector<fmx_checkbox_result> resolve_group(const std::vector<fmx_rect>& labels,
                                                 std::set<size_t>& consumed) const;
};

// Euclidean distance between the closest edges, 0 when overlapping
double edge_distance(const fmx_rect& a, const fmx_rect& b);

} // namespace fmx::extract

#endif // FMX_CHECKBOX_RESOLVER_H
