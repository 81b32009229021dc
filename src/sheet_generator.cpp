/**
 * @file sheet_generator.cpp
 * @brief Contact sheet generation implementation
 *
 * @details Orchestrates the workflow:
 *
 *          0. Tool discovery
 *
 *          1. Config validation (before any process is spawned)
 *
 *          2. Duration probe
 *
 *          3. Grid planning
 *
 *          4. Render request construction
 *
 *          5. Rendering with cleanup on failure
 */

#include "contact_sheet/sheet_generator.hpp"

#include <cstdio>
#include <filesystem>
#include <utility>

#include <fmt/color.h>
#include <fmt/core.h>

#include "contact_sheet/duration_probe.hpp"
#include "contact_sheet/filter_graph.hpp"
#include "contact_sheet/logging.hpp"
#include "contact_sheet/renderer.hpp"
#include "contact_sheet/sheet_planner.hpp"
#include "contact_sheet/system.hpp"

namespace contact_sheet {

namespace {

SheetResult failure(Stage stage, ErrorCode code, std::string diagnostic) {
  SheetResult result;
  result.stage = stage;
  result.code = code;
  result.diagnostic = std::move(diagnostic);
  return result;
}

} // anonymous namespace

// **---- Constructor ----**

SheetGenerator::SheetGenerator(ProcessRunner &runner, std::string ffprobe_name,
                               std::string ffmpeg_name, int jpeg_quality)
    : runner_(runner), ffprobe_name_(std::move(ffprobe_name)),
      ffmpeg_name_(std::move(ffmpeg_name)), jpeg_quality_(jpeg_quality) {}

// **---- Tool Discovery ----**

SheetResult SheetGenerator::check_tools() {
  for (const std::string *name : {&ffprobe_name_, &ffmpeg_name_}) {
    auto found = runner_.locate(*name);
    if (!found) {
      LOG_ERROR("Command '{}' not found.", *name);
      LOG_ERROR("Please ensure '{}' (part of FFmpeg) is installed and in "
                "your system's PATH.",
                *name);
      tools_ready_ = false;
      return failure(Stage::Tools, ErrorCode::ToolNotFound,
                     fmt::format("required tool '{}' not found", *name));
    }
    if (name == &ffprobe_name_)
      ffprobe_path_ = *found;
    else
      ffmpeg_path_ = *found;
  }
  tools_ready_ = true;
  return SheetResult{};
}

// **---- Main Processing ----**

SheetResult SheetGenerator::run(const std::string &video,
                                const SheetConfig &config,
                                const std::string &output_path) {
  if (!tools_ready_) {
    SheetResult tools = check_tools();
    if (!tools.ok())
      return tools;
  }

  std::string name = std::filesystem::path(video).filename().string();
  LOG_PHASE("Processing '{}'...", name);

  // **----- CONFIG -----**

  PlanResult checked = validate_config(config);
  if (!checked.ok()) {
    LOG_ERROR("Invalid configuration: {}", checked.diagnostic);
    return failure(Stage::Plan, checked.code, checked.diagnostic);
  }

  // **----- PROBE -----**

  std::string video_arg = safe_path_argument(video);
  ProbeResult probe = probe_duration(runner_, ffprobe_path_, video_arg);
  if (!probe.ok()) {
    return failure(Stage::Probe, probe.code, probe.diagnostic);
  }

  // **----- PLAN -----**

  PlanResult planned = plan_sheet(probe.duration, config);
  if (!planned.ok()) {
    if (planned.code == ErrorCode::EmptyVideo) {
      LOG_ERROR("Video '{}' has zero duration. Skipping.", name);
    } else {
      LOG_ERROR("Cannot plan contact sheet for '{}': {}", name,
                planned.diagnostic);
    }
    SheetResult result =
        failure(Stage::Plan, planned.code, planned.diagnostic);
    result.duration = probe.duration;
    result.warnings = probe.warnings;
    return result;
  }
  LOG_INFO("Duration: {} ({:.2f}s) -> {} thumbnails every {}s",
           format_time(probe.duration), probe.duration,
           planned.plan.thumbnail_count, config.interval);

  // **----- RENDER -----**

  RenderRequest request =
      build_render_request(planned.plan, config, video_arg,
                           safe_path_argument(output_path), jpeg_quality_);
  RenderResult rendered = render_sheet(runner_, ffmpeg_path_, request);

  SheetResult result;
  result.duration = probe.duration;
  result.plan = planned.plan;
  result.warnings = probe.warnings;
  result.warnings.insert(result.warnings.end(), rendered.warnings.begin(),
                         rendered.warnings.end());
  if (!rendered.ok()) {
    result.stage = Stage::Render;
    result.code = rendered.code;
    result.diagnostic = rendered.diagnostic;
    return result;
  }

  result.output_path = output_path;
  print_sheet_summary(video, config, result);
  return result;
}

// **---- Sheet Summary ----**

void SheetGenerator::print_sheet_summary(const std::string &video,
                                         const SheetConfig &config,
                                         const SheetResult &result) const {
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================= SHEET SUMMARY ====================\n");
  fmt::print("{:<20} {}\n", "Video:",
             std::filesystem::path(video).filename().string());
  fmt::print("{:<20} {}\n", "Duration:", format_time(result.duration));
  fmt::print("{:<20} {}\n", "Thumbnails:", result.plan.thumbnail_count);
  fmt::print("{:<20} {}x{}\n", "Grid:", config.columns, result.plan.rows);
  fmt::print("{:<20} {}\n", "Output:", result.output_path);
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

} // namespace contact_sheet
