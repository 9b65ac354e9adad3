#ifndef FMX_VARIANT_H
#define FMX_VARIANT_H

#include "fmx_string.h"
#include <map>
#include <vector>

class fmx_variant;

typedef std::vector<fmx_variant> fmxv_vector;
typedef std::map<fmx_string, fmx_variant> fmxv_map;

// Loosely typed value used for parsed configuration and for results that
// leave the engine (JSON, persistence collaborators).
class fmx_variant
{
public:
  enum state
  {
    none,
    string_state,
    int_state,
    bool_state,
    double_state,
    vector_state,
    map_state
  };

private:
  void* content;
  state is;

  void copy_from(const fmx_variant &other);

  template<typename to>
  to* cast_content() const
  {
    return static_cast<to*>(content);
  }

public:
  void clear();
  void reset(state to);
  ~fmx_variant();
  fmx_variant();
  fmx_variant(const char* from_string);
  fmx_variant(const fmx_string &from_string);
  fmx_variant(int from_int);
  fmx_variant(bool from_bool);
  fmx_variant(long long from_int);
  fmx_variant(double from_double);
  fmx_variant(const fmxv_vector &from_vector);
  fmx_variant(const fmxv_map &from_map);
  fmx_variant(const fmx_variant &other);

  state in_state() const;
  bool is_null() const;
  bool is_string() const;
  bool is_int() const;
  bool is_bool() const;
  bool is_double() const;
  bool is_vector() const;
  bool is_map() const;

  // Converting access, changes the stored type when necessary
  fmx_string& to_string();
  long long& to_int();
  bool& to_bool();
  double& to_double();
  fmxv_vector& to_vector();
  fmxv_map& to_map();

  // Only valid after a type check
  const fmx_string& string_value() const;
  const long long& int_value() const;
  const bool& bool_value() const;
  const double& double_value() const;
  const fmxv_vector& vector_value() const;
  const fmxv_map& map_value() const;

  bool converts_to(state s) const;
  fmx_variant convert(state to) const;

  fmx_variant& operator=(const fmx_variant &other);

  bool operator==(const fmx_variant &other) const;
  bool operator!=(const fmx_variant& other) const
  {
    return !(*this == other);
  }
};

// Lookup helpers for const maps. A missing key or an inconvertible value
// yields the default.
fmx_string fmxv_get_string(const fmxv_map& map, const fmx_string& key, const fmx_string& def = fmx_string());
long long fmxv_get_int(const fmxv_map& map, const fmx_string& key, long long def = 0);
bool fmxv_get_bool(const fmxv_map& map, const fmx_string& key, bool def = false);
double fmxv_get_double(const fmxv_map& map, const fmx_string& key, double def = 0.0);
const fmx_variant* fmxv_find(const fmxv_map& map, const fmx_string& key);

#endif // FMX_VARIANT_H
