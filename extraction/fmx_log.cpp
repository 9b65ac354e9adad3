#include "fmx_log.h"
#include <atomic>
#include <iostream>

namespace fmx::extract::log {

namespace {
  std::atomic<bool> quiet_flag(false);
}

void set_quiet(bool quiet)
{
  quiet_flag = quiet;
}

bool is_quiet()
{
  return quiet_flag;
}

void info(const fmx_string& message)
{
  if (!quiet_flag)
  {
    std::cout << message << std::endl;
  }
}

void warning(const fmx_string& message)
{
  std::cerr << "Warning: " << message << std::endl;
}

void error(const fmx_string& message)
{
  std::cerr << "Error: " << message << std::endl;
}

} // namespace fmx::extract::log
