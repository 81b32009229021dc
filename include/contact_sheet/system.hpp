/**
 * @file system.hpp
 * @brief Filesystem and formatting utilities
 *
 * @details Provides:
 *
 *          - Output path defaulting and parent directory creation
 *
 *          - Path hardening for argv positions
 *
 *          - Time formatting utilities
 */

#ifndef CONTACT_SHEET_SYSTEM_HPP
#define CONTACT_SHEET_SYSTEM_HPP

#include <string>

namespace contact_sheet {

// **---- Output Paths ----**

/**
 * @brief Default sheet location for a video.
 * @return "<video dir>/<video stem>_contact.jpg"
 */
std::string default_output_path(const std::string &video);

/**
 * @brief Create the parent directory of a file path if missing.
 * @param path Output file path
 * @param error Output: reason on failure
 * @return true if the directory exists afterwards
 */
bool ensure_parent_directory(const std::string &path, std::string &error);

/**
 * @brief Make a relative path safe to place where a tool expects a file.
 * @note "-clip.mp4" would be parsed as an option; it becomes "./-clip.mp4".
 */
std::string safe_path_argument(const std::string &path);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

} // namespace contact_sheet

#endif // CONTACT_SHEET_SYSTEM_HPP
