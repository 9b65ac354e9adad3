#ifndef FMX_LOG_H
#define FMX_LOG_H

#include "../utils/fmx_string.h"

namespace fmx::extract::log {

// Progress output goes to stdout unless quiet; warnings and errors
// always go to stderr
void set_quiet(bool quiet);
bool is_quiet();

void info(const fmx_string& message);
void warning(const fmx_string& message);
void error(const fmx_string& message);

} // namespace fmx::extract::log

#endif // FMX_LOG_H
