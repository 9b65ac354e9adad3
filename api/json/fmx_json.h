#ifndef FMX_JSON_H
#define FMX_JSON_H

#include "../../utils/fmx_variant.h"

// Reads and writes a variant map as a JSON object. The map is owned by the
// caller and must outlive this object.
class fmx_json {
public:
  explicit fmx_json(fmxv_map* map_ptr);

  // Clears the map, then fills it from a JSON object. Parse errors and
  // non-object documents are reported on stderr and return false.
  bool parse(const fmx_string& json_string);

  bool load_file(const fmx_string& path);

  // indent < 0 gives compact output
  fmx_string create(int indent = -1) const;

private:
  fmxv_map* data_map;
};

#endif // FMX_JSON_H
