/**
 * @file video_selector.cpp
 * @brief Directory scanning and video selection implementation
 */

#include "contact_sheet/video_selector.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <istream>
#include <ostream>
#include <system_error>

#include <fmt/core.h>

#include "contact_sheet/logging.hpp"

namespace contact_sheet {

namespace fs = std::filesystem;

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string join(const std::vector<std::string> &items, const char *sep) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0)
      out += sep;
    out += items[i];
  }
  return out;
}

} // anonymous namespace

// **---- Scanning ----**

const std::vector<std::string> &default_video_extensions() {
  static const std::vector<std::string> exts = {".mp4", ".mkv", ".avi",
                                                ".mov", ".wmv", ".flv"};
  return exts;
}

std::vector<std::string>
normalize_extensions(const std::vector<std::string> &extensions) {
  std::vector<std::string> out;
  for (const auto &e : extensions) {
    if (e.empty() || e == ".")
      continue;
    std::string ext = to_lower(e);
    if (ext[0] != '.')
      ext.insert(ext.begin(), '.');
    if (std::find(out.begin(), out.end(), ext) == out.end())
      out.push_back(ext);
  }
  return out.empty() ? default_video_extensions() : out;
}

bool list_video_files(const std::string &dir,
                      const std::vector<std::string> &extensions,
                      std::vector<std::string> &files, std::string &error) {
  files.clear();

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    error = fmt::format("directory not found: '{}'", dir);
    return false;
  }

  fs::directory_iterator it(dir, ec);
  if (ec) {
    error = fmt::format("cannot read directory '{}': {}", dir, ec.message());
    return false;
  }

  std::vector<fs::path> found;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec)
      break;
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec))
      continue;
    std::string ext = to_lower(it->path().extension().string());
    if (std::find(extensions.begin(), extensions.end(), ext) !=
        extensions.end()) {
      found.push_back(it->path());
    }
  }
  if (ec) {
    error = fmt::format("error while reading directory '{}': {}", dir,
                        ec.message());
    return false;
  }

  std::sort(found.begin(), found.end(),
            [](const fs::path &a, const fs::path &b) {
              return a.filename().string() < b.filename().string();
            });
  for (const auto &p : found) {
    files.push_back(p.string());
  }
  return true;
}

// **---- Resolvers ----**

std::optional<std::string>
NonInteractiveResolver::resolve(const std::vector<std::string> &candidates) {
  if (candidates.size() == 1)
    return candidates.front();
  LOG_ERROR("Multiple video files found but running in non-interactive mode.");
  LOG_ERROR("Please specify a single video file on the command line.");
  return std::nullopt;
}

std::optional<std::string>
PromptResolver::resolve(const std::vector<std::string> &candidates) {
  if (candidates.size() == 1)
    return candidates.front();

  out_ << "\nFound multiple video files:\n";
  for (size_t i = 0; i < candidates.size(); ++i) {
    out_ << fmt::format("  {}: {}\n", i + 1,
                        fs::path(candidates[i]).filename().string());
  }

  std::string line;
  while (true) {
    out_ << fmt::format(
        "Enter the number of the video file to process (1-{}): ",
        candidates.size());
    out_.flush();

    if (!std::getline(in_, line)) {
      out_ << "\nOperation cancelled by user.\n";
      return std::nullopt;
    }

    errno = 0;
    char *end = nullptr;
    long choice = std::strtol(line.c_str(), &end, 10);
    while (end && *end && std::isspace(static_cast<unsigned char>(*end)))
      ++end;
    if (end == line.c_str() || (end && *end) || errno == ERANGE) {
      out_ << "Invalid input. Please enter a number.\n";
      continue;
    }
    if (choice < 1 || choice > static_cast<long>(candidates.size())) {
      out_ << "Invalid choice. Please enter a number from the list.\n";
      continue;
    }
    return candidates[static_cast<size_t>(choice - 1)];
  }
}

// **---- Selection ----**

Selection select_video(const std::string &dir,
                       const std::vector<std::string> &extensions,
                       VideoResolver &resolver) {
  Selection selection;

  std::error_code ec;
  fs::path abs = fs::absolute(dir, ec);
  std::string shown = ec ? dir : abs.string();
  LOG_INFO("Scanning directory '{}' for video files ({})...", shown,
           join(extensions, ", "));

  std::vector<std::string> files;
  std::string error;
  if (!list_video_files(dir, extensions, files, error)) {
    selection.code = ErrorCode::VideoNotFound;
    selection.diagnostic = error;
    LOG_ERROR("{}", error);
    return selection;
  }

  if (files.empty()) {
    LOG_INFO("No video files with extensions ({}) found in '{}'.",
             join(extensions, ", "), shown);
    return selection;
  }

  if (files.size() == 1) {
    LOG_INFO("Found one video file: {}",
             fs::path(files.front()).filename().string());
  }

  selection.video = resolver.resolve(files);
  if (!selection.video) {
    selection.code = ErrorCode::NoSelection;
    selection.diagnostic =
        fmt::format("no video selected among {} candidates", files.size());
  }
  return selection;
}

} // namespace contact_sheet
