#ifndef FMX_STRATEGIES_H
#define FMX_STRATEGIES_H

#include "fmx_token_model.h"
#include "fmx_extraction_record.h"
#include "fmx_extraction_options.h"
#include "fmx_label_dictionary.h"
#include "fmx_form_template.h"
#include <memory>

namespace fmx::extract {

// Everything the strategies read besides the page
struct fmx_extraction_setup {
  fmx_extraction_options options;
  fmx_label_dictionary dictionary = fmx_label_dictionary::default_dictionary();
  // Set in config mode only
  const fmx_form_template* form = nullptr;
};

// One page as seen by the strategies
struct fmx_page_view {
  int page_number;
  const fmx_page_source& source;
  const fmx_token_model& tokens;
};

enum class fmx_strategy_kind {
  widget,
  table,
  checkbox_group,
  compound_label,
  colon_label,
  standalone_label,
  template_field,
  config_checkbox
};

class fmx_strategy {
public:
  virtual ~fmx_strategy() = default;
  virtual fmx_strategy_kind kind() const = 0;
  virtual fmx_string name() const = 0;

  // Appends records and consumes their tokens in ctx. Warnings that are
  // not faults (missing required fields) go to warnings. Internal faults
  // are thrown.
  virtual void extract(const fmx_page_view& page, fmx_page_extraction_context& ctx,
                       std::vector<fmx_extraction_record>& out, std::vector<fmx_string>& warnings) const = 0;
};

// The setup must outlive the strategy
std::unique_ptr<fmx_strategy> make_strategy(fmx_strategy_kind kind, const fmx_extraction_setup& setup);

// Widgets, Tables, Checkbox Groups, Compound, Colon and Standalone Labels
std::vector<fmx_strategy_kind> heuristic_strategies();
// Template Fields, Config Checkboxes
std::vector<fmx_strategy_kind> config_strategies();

} // namespace fmx::extract

#endif // FMX_STRATEGIES_H
