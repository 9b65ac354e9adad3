#include "fmx_field_types.h"
#include <regex>

namespace fmx::extract {

namespace {

  // Largest plausible number of dependants
  const long max_count = 20;

  const std::regex& pattern_for(fmx_field_type type)
  {
    static const std::regex any(".+");
    static const std::regex name("[A-Z][A-Za-z'\\-]+(?:\\s+[A-Z][A-Za-z'\\-]+)*");
    static const std::regex date("\\d{1,2}[/.\\-]\\d{1,2}[/.\\-]\\d{4}");
    static const std::regex id("[A-Za-z]{0,2}\\d{4,}[A-Za-z]?");
    static const std::regex email("[a-zA-Z0-9._%+\\-]+@[a-zA-Z0-9.\\-]+\\.[a-zA-Z]{2,}");
    static const std::regex money("\\d{1,3}(?:,\\d{3})+(?:\\.\\d{2})?|\\d+(?:\\.\\d{2})?");
    static const std::regex education("Degree|Diploma|Certificate|Masters|PhD", std::regex::icase);
    static const std::regex nationality("[A-Z][a-z]+");
    static const std::regex count("\\d+");

    switch (type)
    {
      case fmx_field_type::name: return name;
      case fmx_field_type::date: return date;
      case fmx_field_type::id: return id;
      case fmx_field_type::email: return email;
      case fmx_field_type::money: return money;
      case fmx_field_type::education: return education;
      case fmx_field_type::nationality: return nationality;
      case fmx_field_type::count: return count;
      case fmx_field_type::text: break;
    }
    return any;
  }

  bool within_count(const fmx_string& value)
  {
    return value.size() <= 3 && std::stol(value.to_std_const()) <= max_count;
  }

}

fmx_string field_type_name(fmx_field_type type)
{
  switch (type)
  {
    case fmx_field_type::text: return "text";
    case fmx_field_type::name: return "name";
    case fmx_field_type::date: return "date";
    case fmx_field_type::id: return "id";
    case fmx_field_type::email: return "email";
    case fmx_field_type::money: return "money";
    case fmx_field_type::education: return "education";
    case fmx_field_type::nationality: return "nationality";
    case fmx_field_type::count: return "count";
  }
  return "text";
}

bool parse_field_type(const fmx_string& name, fmx_field_type& out)
{
  fmx_string lower = name.trim().to_lower();
  if (lower.empty() || lower == "text") out = fmx_field_type::text;
  else if (lower == "name") out = fmx_field_type::name;
  else if (lower == "date") out = fmx_field_type::date;
  else if (lower == "id") out = fmx_field_type::id;
  else if (lower == "email") out = fmx_field_type::email;
  else if (lower == "money") out = fmx_field_type::money;
  else if (lower == "education") out = fmx_field_type::education;
  else if (lower == "nationality") out = fmx_field_type::nationality;
  else if (lower == "count" || lower == "number") out = fmx_field_type::count;
  else return false;
  return true;
}

bool validate_field(fmx_field_type type, const fmx_string& value)
{
  fmx_string v = value.trim();
  if (v.empty())
  {
    return false;
  }
  if (!std::regex_match(v.to_std_const(), pattern_for(type)))
  {
    return false;
  }
  return type != fmx_field_type::count || within_count(v);
}

fmx_string narrow_field(fmx_field_type type, const fmx_string& text)
{
  fmx_string t = text.trim();
  if (type == fmx_field_type::text)
  {
    return t;
  }

  const std::string& s = t.to_std_const();
  for (std::sregex_iterator it(s.begin(), s.end(), pattern_for(type)), end; it != end; ++it)
  {
    fmx_string candidate(it->str());
    if (type != fmx_field_type::count || within_count(candidate))
    {
      return candidate;
    }
  }
  return fmx_string();
}

} // namespace fmx::extract
