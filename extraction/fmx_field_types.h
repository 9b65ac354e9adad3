#ifndef FMX_FIELD_TYPES_H
#define FMX_FIELD_TYPES_H

#include "../utils/fmx_string.h"

namespace fmx::extract {

enum class fmx_field_type {
  text,
  name,
  date,
  id,
  email,
  money,
  education,
  nationality,
  count
};

fmx_string field_type_name(fmx_field_type type);

// Accepts the names above plus "number" for count. Unknown names fail.
bool parse_field_type(const fmx_string& name, fmx_field_type& out);

// Whole value conforms to the type
bool validate_field(fmx_field_type type, const fmx_string& value);

// First part of the text that conforms to the type, empty if none.
// text returns the trimmed input.
fmx_string narrow_field(fmx_field_type type, const fmx_string& text);

} // namespace fmx::extract

#endif // FMX_FIELD_TYPES_H
