#ifndef FMX_ORCHESTRATOR_H
#define FMX_ORCHESTRATOR_H

#include "fmx_strategies.h"

namespace fmx::extract {

// Runs the strategies of one pipeline over a page in priority order and
// merges their records: the first record of a key on a page wins. A
// strategy that throws is rolled back (its records and consumed tokens
// are dropped) and reported as a warning; the remaining strategies
// still run.
class fmx_orchestrator
{
  fmx_extraction_setup setup;
  std::vector<std::unique_ptr<fmx_strategy>> strategies;

public:
  fmx_orchestrator(const fmx_extraction_setup& setup, const std::vector<fmx_strategy_kind>& kinds);

  // strategies refer to the owned setup
  fmx_orchestrator(const fmx_orchestrator&) = delete;
  fmx_orchestrator& operator=(const fmx_orchestrator&) = delete;

  void add_strategy(std::unique_ptr<fmx_strategy> strategy);
  size_t strategy_count() const { return strategies.size(); }
  const fmx_extraction_setup& get_setup() const { return setup; }

  // Fresh context per call; nothing is carried from page to page
  std::vector<fmx_extraction_record> process_page(int page_number, const fmx_page_source& page,
                                                  std::vector<fmx_string>& warnings) const;
};

} // namespace fmx::extract

#endif // FMX_ORCHESTRATOR_H
