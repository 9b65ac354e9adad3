#ifndef FMX_DOCUMENT_PROCESSOR_H
#define FMX_DOCUMENT_PROCESSOR_H

#include "fmx_orchestrator.h"

namespace fmx::extract {

namespace status {
  extern const char* const success;
  extern const char* const success_no_data;
  extern const char* const error_opening_file;
  extern const char* const config_error;
}

enum class fmx_processing_mode {
  config,
  heuristic
};

struct fmx_document_result {
  fmx_string filename;
  // "Config: <form type>", "Dynamic Heuristic", "Dynamic (Fallback)"
  fmx_string method;
  fmx_string status;
  std::vector<fmx_extraction_record> records;
  std::vector<fmx_string> warnings;

  // {filename, method, status, records: [...], warnings: [...]}
  fmx_variant to_variant() const;
};

// Processes whole documents: opens them through a guard, picks the
// template in config mode (falling back to the heuristic pipeline when
// none matches) and collects the records of every page in page order.
class fmx_document_processor
{
  fmx_extraction_options options;
  fmx_label_dictionary dictionary;
  std::vector<fmx_form_template> templates;

  void run(fmx_orchestrator& orchestrator, const fmx_document& document, fmx_document_result& result) const;

public:
  fmx_document_processor(const fmx_extraction_options& options, const fmx_label_dictionary& dictionary,
                         const std::vector<fmx_form_template>& templates);

  fmx_document_result process(fmx_document& document, fmx_processing_mode mode) const;
};

} // namespace fmx::extract

#endif // FMX_DOCUMENT_PROCESSOR_H
