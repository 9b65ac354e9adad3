#include "fmx_extraction_record.h"
#include "fmx_log.h"

namespace fmx::extract {

namespace method {
  const char* const widget = "Widget";
  const char* const table = "Table";
  const char* const compound_label = "Compound Label";
  const char* const form_field = "Form Field";
  const char* const label_match = "Label Match";
  const char* const checkbox_option = "Checkbox Option";
  const char* const config_field = "Config Field";
  const char* const config_checkbox = "Config Checkbox";
}

fmx_extraction_record::fmx_extraction_record(const fmx_string& key, const fmx_string& value, int page,
                                             const fmx_rect& rect, const fmx_string& method)
  : key(key), value(value), page(page), has_rect(true), rect(rect), method(method)
{
}

fmx_string fmx_extraction_record::coordinates() const
{
  return has_rect ? rect.to_string() : fmx_string();
}

fmx_variant fmx_extraction_record::to_variant() const
{
  fmxv_map data;
  data["key"] = key;
  data["value"] = value;
  data["page_num"] = page;
  data["method"] = method;
  data["coords"] = has_rect ? fmx_variant(coordinates()) : fmx_variant();
  return data;
}

bool fmx_extraction_record::from_variant(const fmxv_map& data, fmx_extraction_record& out)
{
  if (fmxv_find(data, "key") == nullptr)
  {
    return false;
  }
  out = fmx_extraction_record();
  out.key = fmxv_get_string(data, "key");
  out.value = fmxv_get_string(data, "value");
  out.page = static_cast<int>(fmxv_get_int(data, "page_num"));
  out.method = fmxv_get_string(data, "method");

  fmx_string coords = fmxv_get_string(data, "coords");
  if (!coords.empty())
  {
    if (fmx_rect::parse(coords, out.rect))
    {
      out.has_rect = true;
    }
    else
    {
      log::warning("skipping malformed coordinates '" + coords + "' of '" + out.key + "'");
    }
  }
  return true;
}

fmx_string fmx_extraction_record::summary_line() const
{
  return "- [" + method + "] " + key + ": '" + value + "'";
}

void fmx_page_extraction_context::consume(const std::vector<size_t>& indices)
{
  processed_indices.insert(indices.begin(), indices.end());
}

} // namespace fmx::extract
