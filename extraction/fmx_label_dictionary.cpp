#include "fmx_label_dictionary.h"
#include "fmx_log.h"
#include "../api/json/fmx_json.h"

namespace fmx::extract {

namespace {

  bool read_strings(const fmxv_map& data, const fmx_string& key, std::vector<fmx_string>& out)
  {
    const fmx_variant* list = fmxv_find(data, key);
    if (list == nullptr)
    {
      return true;
    }
    if (!list->is_vector())
    {
      log::error("label dictionary: '" + key + "' is not a list");
      return false;
    }
    for (const auto& entry : list->vector_value())
    {
      if (!entry.is_string() || entry.string_value().trim().empty())
      {
        log::error("label dictionary: '" + key + "' holds a non-text entry");
        return false;
      }
      out.push_back(entry.string_value().normalize_whitespace());
    }
    return true;
  }

}

fmx_label_dictionary fmx_label_dictionary::default_dictionary()
{
  fmx_label_dictionary d;
  d.compound_labels = {
    "Date of Birth", "Place of Birth", "Passport No.", "Passport Number",
    "I.D Card No.", "ID Number", "ID No.", "Full Name", "First Name", "Last Name",
    "Maiden Name", "Residential Address", "Postal Address", "Physical Address",
    "Email Address", "Tel No.", "Phone Number", "Cell No.", "Mobile Number",
    "Marital Status", "No of Dependants", "Number of Dependants", "Level of Education",
    "Period of residence", "Gross monthly income", "Net monthly income",
    "Loan Amount", "Loan Amount Required", "Loan Purpose", "Term preferred",
    "Name of Employer", "Employer Address", "Years of Service", "Account Number",
    "Bank Name", "Branch Code"
  };
  d.standalone_labels = {
    "Surname", "Forename(s)", "Forenames", "Name", "Address", "Nationality",
    "Occupation", "Employer", "Tel", "Cell", "Phone", "Email", "e-mail",
    "Gender", "Title", "Date", "Signature", "Citizenship", "Profession"
  };
  d.checkbox_groups = {
    {"Title", {"Mr", "Mrs", "Miss", "Ms", "Dr"}},
    {"Gender", {"Male", "Female"}},
    {"Marital Status", {"Married", "Single", "Divorced", "Widowed"}}
  };
  return d;
}

bool fmx_label_dictionary::from_variant(const fmxv_map& data)
{
  fmx_label_dictionary loaded;
  if (!read_strings(data, "compound_labels", loaded.compound_labels) ||
      !read_strings(data, "standalone_labels", loaded.standalone_labels))
  {
    return false;
  }

  const fmx_variant* groups = fmxv_find(data, "checkbox_groups");
  if (groups != nullptr)
  {
    if (!groups->is_vector())
    {
      log::error("label dictionary: 'checkbox_groups' is not a list");
      return false;
    }
    for (const auto& entry : groups->vector_value())
    {
      if (!entry.is_map())
      {
        log::error("label dictionary: checkbox group is not an object");
        return false;
      }
      fmx_checkbox_group group;
      group.name = fmxv_get_string(entry.map_value(), "name");
      if (!read_strings(entry.map_value(), "options", group.options))
      {
        return false;
      }
      if (group.options.empty())
      {
        log::warning("label dictionary: checkbox group '" + group.name + "' has no options");
        continue;
      }
      loaded.checkbox_groups.push_back(group);
    }
  }

  *this = loaded;
  return true;
}

bool fmx_label_dictionary::load_file(const fmx_string& path)
{
  fmxv_map data;
  fmx_json json(&data);
  if (!json.load_file(path))
  {
    return false;
  }
  return from_variant(data);
}

} // namespace fmx::extract
