#include "fmx_env.h"
#include <fstream>
#include <cstdlib>
#include <cmath>
#include <iostream>

bool load_env_file(const fmx_string& filepath) {
  std::ifstream file(filepath.c_str());
  if (!file.is_open()) {
    return false;
  }

  std::string line;
  while (std::getline(file, line)) {
    fmx_string fmx_line(line);
    fmx_line = fmx_line.trim();

    if (fmx_line.empty() || fmx_line.starts_with("#")) {
      continue;
    }

    size_t pos = fmx_line.find("=");
    if (pos == fmx_string::npos) {
      continue;
    }

    fmx_string key = fmx_line.substr(0, pos).trim();
    fmx_string value = fmx_line.substr(pos + 1).trim();
    if (value.size() >= 2 && value[0] == '"' && value.back() == '"') {
      value = value.substr(1, value.size() - 2);
    }

    setenv(key.c_str(), value.c_str(), 1);
  }
  return true;
}

fmx_string env_string(const char* name, const fmx_string& def) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return def;
  }
  return fmx_string(value);
}

double env_double(const char* name, double def) {
  fmx_string value = env_string(name, fmx_string());
  if (value.empty()) {
    return def;
  }
  double d = value.trim().to_double(NAN);
  if (std::isnan(d)) {
    std::cerr << "Warning: ignoring non-numeric " << name << "='" << value << "'" << std::endl;
    return def;
  }
  return d;
}

int env_int(const char* name, int def) {
  double d = env_double(name, def);
  return static_cast<int>(std::lround(d));
}
