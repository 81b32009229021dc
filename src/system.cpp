/**
 * @file system.cpp
 * @brief Filesystem and formatting utilities implementation
 */

#include "contact_sheet/system.hpp"

#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "contact_sheet/logging.hpp"

namespace contact_sheet {

namespace fs = std::filesystem;

// **---- Output Paths ----**

std::string default_output_path(const std::string &video) {
  fs::path p(video);
  std::string name = p.stem().string() + "_contact.jpg";
  return (p.parent_path() / name).string();
}

bool ensure_parent_directory(const std::string &path, std::string &error) {
  fs::path dir = fs::path(path).parent_path();
  if (dir.empty())
    return true;

  std::error_code ec;
  if (fs::is_directory(dir, ec))
    return true;

  LOG_INFO("Creating output directory: '{}'", dir.string());
  fs::create_directories(dir, ec);
  if (ec) {
    error = fmt::format("could not create output directory '{}': {}",
                        dir.string(), ec.message());
    return false;
  }
  return true;
}

std::string safe_path_argument(const std::string &path) {
  if (!path.empty() && path[0] == '-')
    return "./" + path;
  return path;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  constexpr double kMaxSeconds = 359999.0 * 3600.0;
  if (!(seconds >= 0))
    seconds = 0;
  if (seconds > kMaxSeconds)
    seconds = kMaxSeconds;
  long total = static_cast<long>(seconds);
  long h = total / 3600;
  long m = (total % 3600) / 60;
  long s = total % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace contact_sheet
