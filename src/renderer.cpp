/**
 * @file renderer.cpp
 * @brief Renderer invocation implementation
 */

#include "contact_sheet/renderer.hpp"

#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "contact_sheet/logging.hpp"

namespace contact_sheet {

namespace fs = std::filesystem;

namespace {

std::string trim_trailing(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' ||
                        s.back() == ' ' || s.back() == '\t')) {
    s.pop_back();
  }
  return s;
}

} // anonymous namespace

std::optional<std::string> remove_partial_output(const std::string &path) {
  std::error_code ec;
  fs::file_status status = fs::symlink_status(path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    return fmt::format("could not check '{}': {}", path, ec.message());
  }
  if (!fs::exists(status))
    return std::nullopt;

  /// Only a file (or a link) can be a partial render
  if (!fs::is_regular_file(status) && !fs::is_symlink(status)) {
    return fmt::format("'{}' is not a regular file, left in place", path);
  }

  fs::remove(path, ec);
  if (ec) {
    return fmt::format("could not remove incomplete file '{}': {}", path,
                       ec.message());
  }
  LOG_INFO("Removed incomplete output file '{}'", path);
  return std::nullopt;
}

RenderResult render_sheet(ProcessRunner &runner, const std::string &ffmpeg,
                          const RenderRequest &request) {
  auto argv = render_arguments(request, ffmpeg);

  LOG_PHASE("Generating contact sheet ({}x{} grid, {} thumbnails)...",
            request.config.columns, request.plan.rows,
            request.plan.thumbnail_count);

  TIMER_START(render);
  ProcessResult proc = runner.run(argv);
  TIMER_END(render);

  RenderResult result;
  if (proc.succeeded()) {
    result.output_path = request.output_path;
    LOG_SUCCESS("Successfully generated contact sheet: '{}'",
                request.output_path);
    return result;
  }

  result.code = ErrorCode::RenderExecutionFailure;
  std::string stderr_text = trim_trailing(proc.stderr_text);
  if (proc.started) {
    result.diagnostic =
        fmt::format("command: {}\nexit code: {}\nstderr: {}",
                    quote_command(argv), proc.exit_code, stderr_text);
  } else {
    result.diagnostic = fmt::format("command: {}\nnot started: {}",
                                    quote_command(argv), stderr_text);
  }
  LOG_ERROR("Error running ffmpeg:");
  LOG_ERROR("  Command: {}", quote_command(argv));
  LOG_ERROR("  Stderr: {}", stderr_text);

  if (auto warning = remove_partial_output(request.output_path)) {
    LOG_WARN("{}", *warning);
    result.warnings.push_back(*warning);
  }
  return result;
}

} // namespace contact_sheet
