#include "fmx_form_template.h"
#include "fmx_log.h"
#include "../api/json/fmx_json.h"

namespace fmx::extract {

namespace {

  const fmxv_vector* element_list(const fmxv_map& data, const fmx_string& key)
  {
    const fmx_variant* elements = fmxv_find(data, "data_elements");
    if (elements != nullptr && elements->is_map())
    {
      const fmx_variant* list = fmxv_find(elements->map_value(), key);
      if (list != nullptr && list->is_vector())
      {
        return &list->vector_value();
      }
    }
    const fmx_variant* list = fmxv_find(data, key);
    if (list != nullptr && list->is_vector())
    {
      return &list->vector_value();
    }
    return nullptr;
  }

}

bool fmx_form_template::from_variant(const fmxv_map& data)
{
  fmx_form_template loaded;
  loaded.form_type = fmxv_get_string(data, "form_type").trim();
  loaded.identification_string = fmxv_get_string(data, "identification_string").trim();
  if (loaded.form_type.empty())
  {
    log::error("template without form_type");
    return false;
  }

  const fmxv_vector* field_list = element_list(data, "fields");
  if (field_list != nullptr)
  {
    for (const auto& entry : *field_list)
    {
      if (!entry.is_map())
      {
        log::error(loaded.form_type + ": field entry is not an object");
        return false;
      }
      const fmxv_map& f = entry.map_value();
      fmx_field_config field;
      field.name = fmxv_get_string(f, "name");
      field.label = fmxv_get_string(f, "label").normalize_whitespace();
      if (field.name.empty() || field.label.empty())
      {
        log::error(loaded.form_type + ": field needs name and label");
        return false;
      }
      field.page_num = static_cast<int>(fmxv_get_int(f, "page_num", 0));
      field.instance = static_cast<int>(fmxv_get_int(f, "instance", 0));
      field.allow_empty = fmxv_get_bool(f, "allow_empty", false);
      field.required = fmxv_get_bool(f, "required", false);
      fmx_string type = fmxv_get_string(f, "field_type", "text");
      if (!parse_field_type(type, field.field_type))
      {
        log::warning(loaded.form_type + ": field '" + field.name + "' has unknown type '" + type + "', using text");
        field.field_type = fmx_field_type::text;
      }
      loaded.fields.push_back(field);
    }
  }

  const fmxv_vector* box_list = element_list(data, "checkboxes");
  if (box_list != nullptr)
  {
    for (const auto& entry : *box_list)
    {
      if (!entry.is_map())
      {
        log::error(loaded.form_type + ": checkbox entry is not an object");
        return false;
      }
      const fmxv_map& c = entry.map_value();
      fmx_checkbox_config box;
      box.name = fmxv_get_string(c, "name");
      if (box.name.empty())
      {
        log::error(loaded.form_type + ": checkbox needs a name");
        return false;
      }
      box.label = fmxv_get_string(c, "label", box.name).normalize_whitespace();
      box.page_num = static_cast<int>(fmxv_get_int(c, "page_num", 0));
      box.instance = static_cast<int>(fmxv_get_int(c, "instance", 0));
      loaded.checkboxes.push_back(box);
    }
  }

  *this = loaded;
  return true;
}

bool fmx_form_template::load_file(const fmx_string& path)
{
  fmxv_map data;
  fmx_json json(&data);
  if (!json.load_file(path))
  {
    return false;
  }
  return from_variant(data);
}

bool fmx_form_template::identifies(const fmx_string& first_page_text) const
{
  fmx_string needle = identification_string.normalize_whitespace();
  if (needle.empty())
  {
    return false;
  }
  return first_page_text.normalize_whitespace().contains_ignore_case(needle);
}

const fmx_form_template* identify_form(const std::vector<fmx_form_template>& templates,
                                       const fmx_string& first_page_text)
{
  for (const auto& t : templates)
  {
    if (t.identifies(first_page_text))
    {
      return &t;
    }
  }
  return nullptr;
}

} // namespace fmx::extract
