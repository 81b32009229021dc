/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Command-line options override these values; the environment only
 *          supplies defaults and tool locations.
 *
 */

#ifndef CONTACT_SHEET_CONFIG_HPP
#define CONTACT_SHEET_CONFIG_HPP

#include <string>

#include "types.hpp"

namespace contact_sheet {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or malformed
 * @return Parsed double value or default
 * @note A malformed value is reported with LOG_WARN.
 */
double get_env_double(const char *name, double default_val);

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or malformed
 * @return Parsed integer value or default
 */
int get_env_int(const char *name, int default_val);

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
std::string get_env_string(const char *name, const std::string &default_val);

/// Renderer executable (name looked up on PATH, or a path)
inline const std::string &ffmpeg_bin() {
  static std::string val = get_env_string("CONTACT_SHEET_FFMPEG", "ffmpeg");
  return val;
}

/// Duration probe executable (name looked up on PATH, or a path)
inline const std::string &ffprobe_bin() {
  static std::string val = get_env_string("CONTACT_SHEET_FFPROBE", "ffprobe");
  return val;
}

/// Default seconds between thumbnails
inline double interval_sec() {
  static double val =
      get_env_double("CONTACT_SHEET_INTERVAL", DEFAULT_INTERVAL_SEC);
  return val;
}

/// Default grid width
inline int columns() {
  static int val = get_env_int("CONTACT_SHEET_COLUMNS", DEFAULT_COLUMNS);
  return val;
}

/// Default thumbnail height in pixels
inline int thumb_height() {
  static int val =
      get_env_int("CONTACT_SHEET_THUMB_HEIGHT", DEFAULT_THUMB_HEIGHT);
  return val;
}

/**
 * @brief JPEG quality scale for the rendered sheet
 * @note 1 = best, 31 = worst
 */
inline int jpeg_quality() {
  static int val =
      get_env_int("CONTACT_SHEET_JPEG_QUALITY", DEFAULT_JPEG_QUALITY);
  return val;
}

/// Print the timing summary at exit
inline bool timing_enabled() {
  static bool val = (get_env_int("CONTACT_SHEET_TIMING", 0) != 0);
  return val;
}

} // namespace Config
} // namespace contact_sheet

#endif // CONTACT_SHEET_CONFIG_HPP
