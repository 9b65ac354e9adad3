#include "fmx_variant.h"
#include <cmath>
#include <sstream>

void fmx_variant::copy_from(const fmx_variant &other)
{
  if (this == &other)
  {
    return;
  }
  reset(other.is);
  switch (other.is)
  {
    case string_state: *cast_content<fmx_string>() = other.string_value(); break;
    case int_state: *cast_content<long long>() = other.int_value(); break;
    case double_state: *cast_content<double>() = other.double_value(); break;
    case bool_state: *cast_content<bool>() = other.bool_value(); break;
    case vector_state: *cast_content<fmxv_vector>() = other.vector_value(); break;
    case map_state: *cast_content<fmxv_map>() = other.map_value(); break;
    case none: break;
  }
}

void fmx_variant::clear()
{
  switch (is)
  {
    case string_state: delete cast_content<fmx_string>(); break;
    case int_state: delete cast_content<long long>(); break;
    case double_state: delete cast_content<double>(); break;
    case bool_state: delete cast_content<bool>(); break;
    case vector_state: delete cast_content<fmxv_vector>(); break;
    case map_state: delete cast_content<fmxv_map>(); break;
    case none: break;
  }
  content = nullptr;
  is = none;
}

void fmx_variant::reset(fmx_variant::state to)
{
  clear();
  is = to;
  switch (is)
  {
    case string_state: content = new fmx_string; break;
    case int_state: content = new long long(0); break;
    case double_state: content = new double(0.0); break;
    case bool_state: content = new bool(false); break;
    case vector_state: content = new fmxv_vector; break;
    case map_state: content = new fmxv_map; break;
    case none: break;
  }
}

fmx_variant::~fmx_variant()
{
  clear();
}

fmx_variant::fmx_variant() : content(nullptr), is(none)
{
}

fmx_variant::fmx_variant(const char *from_string) : content(new fmx_string(from_string)), is(string_state)
{
}

fmx_variant::fmx_variant(const fmx_string &from_string) : content(new fmx_string(from_string)), is(string_state)
{
}

fmx_variant::fmx_variant(int from_int) : content(new long long(from_int)), is(int_state)
{
}

fmx_variant::fmx_variant(bool from_bool) : content(new bool(from_bool)), is(bool_state)
{
}

fmx_variant::fmx_variant(long long from_int) : content(new long long(from_int)), is(int_state)
{
}

fmx_variant::fmx_variant(double from_double) : content(new double(from_double)), is(double_state)
{
}

fmx_variant::fmx_variant(const fmxv_vector &from_vector) : content(new fmxv_vector(from_vector)), is(vector_state)
{
}

fmx_variant::fmx_variant(const fmxv_map &from_map) : content(new fmxv_map(from_map)), is(map_state)
{
}

fmx_variant::fmx_variant(const fmx_variant &other) : content(nullptr), is(none)
{
  copy_from(other);
}

fmx_variant::state fmx_variant::in_state() const { return is; }
bool fmx_variant::is_null() const { return is == none; }
bool fmx_variant::is_string() const { return is == string_state; }
bool fmx_variant::is_int() const { return is == int_state; }
bool fmx_variant::is_bool() const { return is == bool_state; }
bool fmx_variant::is_double() const { return is == double_state; }
bool fmx_variant::is_vector() const { return is == vector_state; }
bool fmx_variant::is_map() const { return is == map_state; }

fmx_string &fmx_variant::to_string()
{
  if (is != string_state)
  {
    *this = convert(string_state);
  }
  return *cast_content<fmx_string>();
}

long long &fmx_variant::to_int()
{
  if (is != int_state)
  {
    *this = convert(int_state);
  }
  return *cast_content<long long>();
}

bool &fmx_variant::to_bool()
{
  if (is != bool_state)
  {
    *this = convert(bool_state);
  }
  return *cast_content<bool>();
}

double &fmx_variant::to_double()
{
  if (is != double_state)
  {
    *this = convert(double_state);
  }
  return *cast_content<double>();
}

fmxv_vector &fmx_variant::to_vector()
{
  if (is != vector_state)
  {
    *this = convert(vector_state);
  }
  return *cast_content<fmxv_vector>();
}

fmxv_map &fmx_variant::to_map()
{
  if (is != map_state)
  {
    *this = convert(map_state);
  }
  return *cast_content<fmxv_map>();
}

const fmx_string &fmx_variant::string_value() const { return *cast_content<fmx_string>(); }
const long long &fmx_variant::int_value() const { return *cast_content<long long>(); }
const bool &fmx_variant::bool_value() const { return *cast_content<bool>(); }
const double &fmx_variant::double_value() const { return *cast_content<double>(); }
const fmxv_vector &fmx_variant::vector_value() const { return *cast_content<fmxv_vector>(); }
const fmxv_map &fmx_variant::map_value() const { return *cast_content<fmxv_map>(); }

bool fmx_variant::converts_to(fmx_variant::state s) const
{
  if (is == s)
  {
    return true;
  }
  if (is == string_state)
  {
    fmx_string lower = string_value().trim().to_lower();
    return (s == bool_state && (lower == "true" || lower == "false" ||
                                lower == "yes" || lower == "no" || lower.is_numeric())) ||
           ((s == int_state || s == double_state) && lower.is_numeric());
  }
  if (is == bool_state)
  {
    return s == int_state || s == string_state;
  }
  if (is == int_state || is == double_state)
  {
    return s == int_state || s == double_state || s == string_state || s == bool_state;
  }
  return false;
}

fmx_variant fmx_variant::convert(fmx_variant::state to) const
{
  fmx_variant res;
  res.reset(to);

  if (is == to)
  {
    res = *this;
    return res;
  }
  if (is == string_state)
  {
    fmx_string trimmed = string_value().trim();
    if (to == int_state)
    {
      res = (long long)std::llround(trimmed.to_double(0));
    }
    else if (to == bool_state)
    {
      fmx_string lower = trimmed.to_lower();
      res = lower == "true" || lower == "yes" || lower == "t" || trimmed.to_double(0) != 0.0;
    }
    else if (to == double_state)
    {
      res = trimmed.to_double(0);
    }
  }
  else if (is == bool_state)
  {
    if (to == int_state)
    {
      res = (long long)(bool_value() ? 1 : 0);
    }
    else if (to == string_state)
    {
      res = bool_value() ? "true" : "false";
    }
  }
  else if (is == int_state)
  {
    if (to == double_state)
    {
      res = (double)int_value();
    }
    else if (to == bool_state)
    {
      res = int_value() != 0;
    }
    else if (to == string_state)
    {
      res = fmx_string(std::to_string(int_value()));
    }
  }
  else if (is == double_state)
  {
    if (to == int_state)
    {
      res = (long long)double_value();
    }
    else if (to == bool_state)
    {
      res = double_value() != 0.0;
    }
    else if (to == string_state)
    {
      std::ostringstream ss;
      ss << double_value();
      res = fmx_string(ss.str());
    }
  }
  return res;
}

fmx_variant &fmx_variant::operator=(const fmx_variant &other)
{
  if (this != &other)
  {
    // other may live inside our own content (e.g. a map entry)
    fmx_variant copy;
    copy.copy_from(other);
    std::swap(content, copy.content);
    std::swap(is, copy.is);
  }
  return *this;
}

bool fmx_variant::operator==(const fmx_variant &other) const
{
  if (is == none || other.is == none)
  {
    return is == other.is;
  }
  if (is_string())
  {
    return other.converts_to(string_state) &&
           string_value() == other.convert(string_state).string_value();
  }
  if (is_int())
  {
    return other.converts_to(int_state) && int_value() == other.convert(int_state).int_value();
  }
  if (is_bool())
  {
    return other.converts_to(bool_state) && bool_value() == other.convert(bool_state).bool_value();
  }
  if (is_double())
  {
    return other.converts_to(double_state) && double_value() == other.convert(double_state).double_value();
  }
  if (is_vector())
  {
    return other.is_vector() && vector_value() == other.vector_value();
  }
  return other.is_map() && map_value() == other.map_value();
}

const fmx_variant* fmxv_find(const fmxv_map& map, const fmx_string& key)
{
  fmxv_map::const_iterator it = map.find(key);
  if (it == map.end() || it->second.is_null())
  {
    return nullptr;
  }
  return &it->second;
}

fmx_string fmxv_get_string(const fmxv_map& map, const fmx_string& key, const fmx_string& def)
{
  const fmx_variant* v = fmxv_find(map, key);
  if (v == nullptr || !v->converts_to(fmx_variant::string_state))
  {
    return def;
  }
  return v->convert(fmx_variant::string_state).string_value();
}

long long fmxv_get_int(const fmxv_map& map, const fmx_string& key, long long def)
{
  const fmx_variant* v = fmxv_find(map, key);
  if (v == nullptr || !v->converts_to(fmx_variant::int_state))
  {
    return def;
  }
  return v->convert(fmx_variant::int_state).int_value();
}

bool fmxv_get_bool(const fmxv_map& map, const fmx_string& key, bool def)
{
  const fmx_variant* v = fmxv_find(map, key);
  if (v == nullptr || !v->converts_to(fmx_variant::bool_state))
  {
    return def;
  }
  return v->convert(fmx_variant::bool_state).bool_value();
}

double fmxv_get_double(const fmxv_map& map, const fmx_string& key, double def)
{
  const fmx_variant* v = fmxv_find(map, key);
  if (v == nullptr || !v->converts_to(fmx_variant::double_state))
  {
    return def;
  }
  return v->convert(fmx_variant::double_state).double_value();
}
