#ifndef FMX_TEXT_NORMALIZER_H
#define FMX_TEXT_NORMALIZER_H

#include "../utils/fmx_string.h"

namespace fmx::extract {

// Keys: runs of three or more '_'/'.' become a space, whitespace is
// collapsed and trailing colons are dropped. Dynamically detected keys
// are title-cased (all-capital words such as "DOB" are kept), config keys
// pass title_case = false.
fmx_string clean_key(const fmx_string& text, bool title_case = true);

// Values: drops ()[]| and every colon that is not between two
// alphanumerics ("10:30" survives), turns runs of two or more '_'/'.'
// into a space and collapses whitespace. Single letters are kept.
fmx_string clean_value(const fmx_string& text);

// Only fill characters ('_', '.') and whitespace
bool is_fill_artifact(const fmx_string& text);

// "Name:" style token: ends in ':', has a letter before it
bool is_colon_label(const fmx_string& text);

// One code point from the check mark set (x X ✓ ✔ ☑ ☒ ✗ ✘ √)
bool is_marker_glyph(const fmx_string& text);

// Any whitespace separated piece is a marker, brackets ignored ("[x]")
bool contains_marker_glyph(const fmx_string& text);

} // namespace fmx::extract

#endif // FMX_TEXT_NORMALIZER_H
