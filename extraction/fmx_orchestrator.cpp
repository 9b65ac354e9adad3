#include "fmx_orchestrator.h"
#include "fmx_log.h"

namespace fmx::extract {

fmx_orchestrator::fmx_orchestrator(const fmx_extraction_setup& setup, const std::vector<fmx_strategy_kind>& kinds)
  : setup(setup)
{
  for (auto kind : kinds)
  {
    strategies.push_back(make_strategy(kind, this->setup));
  }
}

void fmx_orchestrator::add_strategy(std::unique_ptr<fmx_strategy> strategy)
{
  if (strategy)
  {
    strategies.push_back(std::move(strategy));
  }
}

std::vector<fmx_extraction_record> fmx_orchestrator::process_page(int page_number, const fmx_page_source& page,
                                                                  std::vector<fmx_string>& warnings) const
{
  fmx_token_model tokens(page_number, page.words(), setup.options.line_bucket);
  fmx_page_view view{page_number, page, tokens};
  fmx_page_extraction_context ctx;
  ctx.page = page_number;

  std::vector<fmx_extraction_record> result;
  for (const auto& strategy : strategies)
  {
    fmx_page_extraction_context snapshot = ctx;
    std::vector<fmx_extraction_record> produced;
    std::vector<fmx_string> notes;
    try
    {
      strategy->extract(view, ctx, produced, notes);
    }
    catch (const std::exception& e)
    {
      ctx = snapshot;
      fmx_string message = "Extractor strategy '" + strategy->name() + "' failed on page " +
                           fmx_string(std::to_string(page_number)) + " with error: " + e.what();
      log::warning(message);
      warnings.push_back(message);
      continue;
    }

    for (const auto& note : notes)
    {
      log::warning(note);
      warnings.push_back(note);
    }
    for (const auto& record : produced)
    {
      if (ctx.has_key(record.key))
      {
        continue;
      }
      ctx.processed_keys.insert(record.key);
      result.push_back(record);
    }
  }
  return result;
}

} // namespace fmx::extract
