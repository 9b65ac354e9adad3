#include "documents/pdf/fmx_pdf_document.h"
#include "extraction/fmx_document_processor.h"
#include "extraction/fmx_log.h"
#include "api/json/fmx_json.h"
#include "utils/fmx_env.h"
#include <iostream>
#include <memory>

using namespace fmx::extract;

static void print_usage()
{
  std::cerr << "Usage: formex [--mode config|heuristic] [--template file.json]... "
            << "[--labels file.json] [--quiet] <file.pdf|page-dump.json>" << std::endl;
}

int main(int argc, char *argv[])
{
  fmxv_vector args;
  for (int i = 1; i < argc; i++)
  {
    args.push_back(fmx_string(argv[i]));
  }

  load_env_file(".env");

  fmx_processing_mode mode = fmx_processing_mode::heuristic;
  std::vector<fmx_form_template> templates;
  fmx_label_dictionary dictionary = fmx_label_dictionary::default_dictionary();
  fmx_string input;

  for (size_t i = 0; i < args.size(); i++)
  {
    fmx_string arg = args[i].to_string();
    bool has_value = i + 1 < args.size();
    if (arg == "--quiet")
    {
      log::set_quiet(true);
    }
    else if (arg == "--mode" && has_value)
    {
      fmx_string value = args[++i].to_string();
      if (value == "config") mode = fmx_processing_mode::config;
      else if (value == "heuristic") mode = fmx_processing_mode::heuristic;
      else
      {
        log::error("Unknown mode '" + value + "'");
        print_usage();
        return 2;
      }
    }
    else if (arg == "--template" && has_value)
    {
      fmx_form_template form;
      fmx_string path = args[++i].to_string();
      if (!form.load_file(path))
      {
        log::error("Could not load template " + path);
        return 2;
      }
      templates.push_back(form);
    }
    else if (arg == "--labels" && has_value)
    {
      fmx_string path = args[++i].to_string();
      if (!dictionary.load_file(path))
      {
        log::error("Could not load label dictionary " + path);
        return 2;
      }
    }
    else if (arg.starts_with("--") || !input.empty())
    {
      print_usage();
      return 2;
    }
    else
    {
      input = arg;
    }
  }

  if (input.empty())
  {
    print_usage();
    return 2;
  }
  if (mode == fmx_processing_mode::config && templates.empty())
  {
    log::warning("Config mode without templates, every document falls back to dynamic mode");
  }

  std::unique_ptr<fmx_document> document;
  if (input.to_lower().ends_with(".json"))
  {
    document = std::make_unique<fmx_memory_document>(input);
  }
  else
  {
    document = std::make_unique<fmx_pdf_document>(input);
  }

  fmx_document_processor processor(fmx_extraction_options::from_environment(), dictionary, templates);
  fmx_document_result result = processor.process(*document, mode);

  for (const auto& record : result.records)
  {
    log::info(record.summary_line());
  }

  fmxv_map output = result.to_variant().to_map();
  fmx_json json(&output);
  std::cout << json.create(2) << std::endl;

  return result.status == status::error_opening_file || result.status == status::config_error ? 1 : 0;
}
