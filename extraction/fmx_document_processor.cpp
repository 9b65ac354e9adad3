#include "fmx_document_processor.h"
#include "fmx_log.h"

namespace fmx::extract {

namespace status {
  const char* const success = "SUCCESS";
  const char* const success_no_data = "SUCCESS_NO_DATA";
  const char* const error_opening_file = "ERROR_OPENING_FILE";
  const char* const config_error = "CONFIG_ERROR";
}

fmx_variant fmx_document_result::to_variant() const
{
  fmxv_map data;
  data["filename"] = filename;
  data["method"] = method;
  data["status"] = status;

  fmxv_vector record_list;
  for (const auto& record : records)
  {
    record_list.push_back(record.to_variant());
  }
  data["records"] = record_list;

  fmxv_vector warning_list;
  for (const auto& warning : warnings)
  {
    warning_list.push_back(warning);
  }
  data["warnings"] = warning_list;
  return data;
}

fmx_document_processor::fmx_document_processor(const fmx_extraction_options& options,
                                               const fmx_label_dictionary& dictionary,
                                               const std::vector<fmx_form_template>& templates)
  : options(options), dictionary(dictionary), templates(templates)
{
}

void fmx_document_processor::run(fmx_orchestrator& orchestrator, const fmx_document& document,
                                 fmx_document_result& result) const
{
  for (size_t i = 0; i < document.page_count(); ++i)
  {
    std::vector<fmx_extraction_record> records =
      orchestrator.process_page(static_cast<int>(i), document.page(i), result.warnings);
    result.records.insert(result.records.end(), records.begin(), records.end());
  }
  result.status = result.records.empty() ? status::success_no_data : status::success;
}

fmx_document_result fmx_document_processor::process(fmx_document& document, fmx_processing_mode mode) const
{
  fmx_document_result result;
  result.filename = document.source_name();
  result.method = mode == fmx_processing_mode::config ? "Config-Based" : "Dynamic Heuristic";
  log::info("Processing '" + result.filename + "' using " + result.method + " mode...");

  fmx_document_guard guard(document);
  if (!guard.is_open())
  {
    log::error("Could not open " + result.filename);
    result.status = status::error_opening_file;
    return result;
  }

  fmx_extraction_setup setup;
  setup.options = options;
  setup.dictionary = dictionary;
  std::vector<fmx_strategy_kind> kinds = heuristic_strategies();

  try
  {
    if (mode == fmx_processing_mode::config)
    {
      fmx_string first_page = document.page_count() > 0 ? document.page(0).text() : fmx_string();
      const fmx_form_template* form = identify_form(templates, first_page);
      if (form == nullptr)
      {
        log::info("No matching config found for '" + result.filename + "'. Falling back to dynamic mode.");
        result.method = "Dynamic (Fallback)";
      }
      else if (!form->has_elements())
      {
        log::error("Config for form type '" + form->form_type + "' has no fields or checkboxes");
        result.status = status::config_error;
        return result;
      }
      else
      {
        result.method = "Config: " + form->form_type;
        setup.form = form;
        kinds = config_strategies();
      }
    }

    fmx_orchestrator orchestrator(setup, kinds);
    run(orchestrator, document, result);
  }
  catch (const fmx_document_exception& e)
  {
    log::error(e.what());
    result.records.clear();
    result.warnings.push_back(e.what());
    result.status = status::error_opening_file;
    return result;
  }

  if (result.records.empty())
  {
    log::info("  No data extracted from '" + result.filename + "'");
  }
  else
  {
    log::info("  Extracted " + fmx_string(std::to_string(result.records.size())) + " data elements from '" +
              result.filename + "'");
  }
  return result;
}

} // namespace fmx::extract
