#ifndef FMX_ENV_H
#define FMX_ENV_H

#include "fmx_string.h"

// Reads KEY=VALUE lines into the process environment. Blank lines and
// lines starting with '#' are skipped. Returns false if the file can't be opened.
bool load_env_file(const fmx_string& filepath);

// Environment lookups with a fallback for unset or unparsable values
fmx_string env_string(const char* name, const fmx_string& def);
double env_double(const char* name, double def);
int env_int(const char* name, int def);

#endif // FMX_ENV_H
