/**
 * @file config.cpp
 * @brief Environment variable parsing
 */

#include "contact_sheet/config.hpp"

#include <cstdlib>
#include <exception>

#include "contact_sheet/logging.hpp"

namespace contact_sheet {
namespace Config {

double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  try {
    size_t used = 0;
    double parsed = std::stod(val, &used);
    if (val[used] == '\0')
      return parsed;
  } catch (const std::exception &) {
    /// fall through to the warning below
  }
  LOG_WARN("Ignoring malformed {}='{}', using {}", name, val, default_val);
  return default_val;
}

int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  try {
    size_t used = 0;
    int parsed = std::stoi(val, &used);
    if (val[used] == '\0')
      return parsed;
  } catch (const std::exception &) {
  }
  LOG_WARN("Ignoring malformed {}='{}', using {}", name, val, default_val);
  return default_val;
}

std::string get_env_string(const char *name, const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

} // namespace Config
} // namespace contact_sheet
