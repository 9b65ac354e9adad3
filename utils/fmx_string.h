#ifndef FMX_STRING_H
#define FMX_STRING_H

#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <ostream>

// Wrapper around std::string with the helpers the extraction code needs
class fmx_string
{
  std::string str;
public:
  static const size_t npos = std::string::npos;
  fmx_string() : str() {}
  fmx_string(const char* s) : str(s) {}
  fmx_string(const char* s, size_t len) : str(s, len) {}
  fmx_string(const std::string& s) : str(s) {}
  fmx_string(size_t count, char c) : str(count, c) {}

  std::string& to_std() { return str; }
  const std::string& to_std_const() const { return str; }
  const char* c_str() const { return str.c_str(); }

  fmx_string operator+(const fmx_string& s) const { return str + s.str; }
  fmx_string operator+(const char* s) const { return str + s; }
  fmx_string& operator+=(const fmx_string& s) { str += s.str; return *this; }
  fmx_string& operator+=(char c) { str += c; return *this; }
  bool operator==(const fmx_string& s) const { return str == s.str; }
  bool operator!=(const fmx_string& s) const { return str != s.str; }
  bool operator<(const fmx_string& s) const { return str < s.str; }

  bool empty() const { return str.empty(); }
  size_t size() const { return str.size(); }
  size_t length() const { return str.length(); }
  void clear() { str.clear(); }

  char& operator[](size_t i) { return str[i]; }
  char operator[](size_t i) const { return str[i]; }
  char back() const { return str.back(); }

  fmx_string substr(size_t pos, size_t len = npos) const { return str.substr(pos, len); }

  double to_double(double def = 0) const
  {
    try
    {
      size_t used = 0;
      double d = std::stod(str, &used);
      return used == str.size() ? d : def;
    }
    catch (const std::invalid_argument&)
    {
      return def;
    }
    catch (const std::out_of_range&)
    {
      return def;
    }
  }

  size_t find(const fmx_string& s, size_t pos = 0) const { return str.find(s.str, pos); }
  bool contains(const fmx_string& s) const { return str.find(s.str) != std::string::npos; }

  fmx_string to_lower() const
  {
    fmx_string res = *this;
    for (size_t i = 0; i < res.size(); ++i)
    {
      res[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(res[i])));
    }
    return res;
  }

  bool equals_ignore_case(const fmx_string& other) const
  {
    if (size() != other.size()) return false;
    for (size_t i = 0; i < size(); ++i)
    {
      if (std::tolower(static_cast<unsigned char>(str[i])) !=
          std::tolower(static_cast<unsigned char>(other.str[i])))
      {
        return false;
      }
    }
    return true;
  }

  bool contains_ignore_case(const fmx_string& s) const
  {
    return to_lower().contains(s.to_lower());
  }

  fmx_string& replace(const fmx_string& from, const fmx_string& to)
  {
    if (from.empty()) return *this;
    for (size_t pos = 0; (pos = str.find(from.str, pos)) != std::string::npos; pos += to.size())
      str.replace(pos, from.size(), to.str);
    return *this;
  }

  size_t split(const fmx_string& delim, std::vector<fmx_string>& out) const
  {
    size_t pos = 0;
    size_t lastPos = 0;
    while ((pos = str.find(delim.str, lastPos)) != std::string::npos)
    {
      out.push_back(str.substr(lastPos, pos - lastPos));
      lastPos = pos + delim.size();
    }
    out.push_back(str.substr(lastPos));
    return out.size();
  }

  std::vector<fmx_string> split(const fmx_string& delim) const
  {
    std::vector<fmx_string> out;
    split(delim, out);
    return out;
  }

  // Words separated by any run of whitespace, no empty entries
  std::vector<fmx_string> words() const
  {
    std::vector<fmx_string> out;
    std::string current;
    for (char c : str)
    {
      if (std::isspace(static_cast<unsigned char>(c)))
      {
        if (!current.empty()) out.push_back(current);
        current.clear();
      }
      else
      {
        current += c;
      }
    }
    if (!current.empty()) out.push_back(current);
    return out;
  }

  fmx_string trim() const
  {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return fmx_string();
    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
  }

  bool starts_with(const fmx_string& prefix) const
  {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix.str) == 0;
  }

  bool ends_with(const fmx_string& suffix) const
  {
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix.str) == 0;
  }

  fmx_string join(const std::vector<fmx_string>& parts) const
  {
    if (parts.empty()) return fmx_string();
    fmx_string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
      result += *this + parts[i];
    }
    return result;
  }

  // Digits with an optional sign and at most one decimal point
  bool is_numeric() const
  {
    if (str.empty()) return false;
    size_t start = 0;
    if (str[0] == '-' || str[0] == '+') start = 1;
    if (start >= str.size()) return false;

    bool has_dot = false;
    bool has_digit = false;
    for (size_t i = start; i < str.size(); ++i) {
      if (str[i] == '.') {
        if (has_dot) return false;
        has_dot = true;
      } else if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
        return false;
      } else {
        has_digit = true;
      }
    }
    return has_digit;
  }

  fmx_string normalize_whitespace() const
  {
    fmx_string result;
    bool in_whitespace = false;

    for (char c : str) {
      if (std::isspace(static_cast<unsigned char>(c))) {
        if (!in_whitespace) {
          result += ' ';
          in_whitespace = true;
        }
      } else {
        result += c;
        in_whitespace = false;
      }
    }

    return result.trim();
  }

  // Upper-cases the first letter of every whitespace separated word and
  // lower-cases the rest. Only ASCII letters change.
  fmx_string title_case() const
  {
    fmx_string result = to_lower();
    bool word_start = true;

    for (size_t i = 0; i < result.size(); ++i) {
      unsigned char c = static_cast<unsigned char>(result[i]);
      if (std::isspace(c)) {
        word_start = true;
      } else {
        if (word_start && c < 0x80 && std::isalpha(c)) {
          result[i] = static_cast<char>(std::toupper(c));
        }
        word_start = false;
      }
    }

    return result;
  }
};

inline fmx_string operator+(const char* lhs, const fmx_string& rhs) {
  return fmx_string(lhs) + rhs;
}

inline std::ostream& operator<<(std::ostream& os, const fmx_string& s) {
  return os << s.to_std_const();
}

#endif // FMX_STRING_H
