/**
 * @file duration_probe.cpp
 * @brief Duration probe implementation
 */

#include "contact_sheet/duration_probe.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>

#include <fmt/core.h>

#include "contact_sheet/logging.hpp"

namespace contact_sheet {

namespace {

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n\f\v";
  size_t first = s.find_first_not_of(ws);
  if (first == std::string::npos)
    return "";
  size_t last = s.find_last_not_of(ws);
  return s.substr(first, last - first + 1);
}

} // anonymous namespace

ProbeResult parse_duration(const std::string &output) {
  ProbeResult result;
  std::string text = trim(output);

  if (text.empty()) {
    result.warnings.push_back("probe returned an empty duration, assuming 0");
    return result;
  }

  /// strtod accepts "nan"/"inf"; those are rejected below
  errno = 0;
  char *end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0' || errno == ERANGE ||
      !std::isfinite(value)) {
    result.code = ErrorCode::ProbeParseFailure;
    result.diagnostic =
        fmt::format("could not parse probe output '{}' as seconds", text);
    return result;
  }

  if (value < 0) {
    result.warnings.push_back(
        fmt::format("probe returned a negative duration ({}s), using 0", value));
    return result;
  }

  result.duration = value;
  return result;
}

std::vector<std::string> probe_arguments(const std::string &ffprobe,
                                         const std::string &video) {
  return {ffprobe,
          "-v",
          "error",
          "-show_entries",
          "format=duration",
          "-of",
          "default=noprint_wrappers=1:nokey=1",
          video};
}

ProbeResult probe_duration(ProcessRunner &runner, const std::string &ffprobe,
                           const std::string &video) {
  auto argv = probe_arguments(ffprobe, video);

  TIMER_START(probe);
  ProcessResult proc = runner.run(argv);
  TIMER_END(probe);

  ProbeResult result;
  if (!proc.started) {
    result.code = ErrorCode::ToolNotFound;
    result.diagnostic = fmt::format("{}: {}", ffprobe, trim(proc.stderr_text));
    LOG_ERROR("Could not run the duration probe: {}", result.diagnostic);
    return result;
  }

  if (proc.exit_code != 0) {
    result.code = ErrorCode::ProbeExecutionFailure;
    result.diagnostic = fmt::format(
        "command: {}\nexit code: {}\nstderr: {}", quote_command(argv),
        proc.exit_code, trim(proc.stderr_text));
    LOG_ERROR("Error running ffprobe on '{}'", video);
    LOG_ERROR("  Command: {}", quote_command(argv));
    LOG_ERROR("  Stderr: {}", trim(proc.stderr_text));
    return result;
  }

  result = parse_duration(proc.stdout_text);
  if (!result.ok()) {
    LOG_ERROR("Error parsing ffprobe output for '{}': {}", video,
              result.diagnostic);
    return result;
  }
  for (const auto &w : result.warnings) {
    LOG_WARN("{} ('{}')", w, video);
  }
  return result;
}

} // namespace contact_sheet
