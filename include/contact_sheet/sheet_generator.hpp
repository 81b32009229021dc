/**
 * @file sheet_generator.hpp
 * @brief Contact sheet generation orchestration
 *
 * @details The SheetGenerator class runs the whole workflow for one video:
 *
 *          0. Locate ffprobe and ffmpeg (once, before any video work)
 *
 *          1. Validate the sheet config
 *
 *          2. Probe the video duration
 *
 *          3. Plan the thumbnail grid
 *
 *          4. Build the render request
 *
 *          5. Render, cleaning up partial output on failure
 *
 * @note Strictly sequential; both external runs block. Each run() is
 *       independent and nothing is cached between calls.
 */

#ifndef CONTACT_SHEET_SHEET_GENERATOR_HPP
#define CONTACT_SHEET_SHEET_GENERATOR_HPP

#include <string>
#include <vector>

#include "process.hpp"
#include "types.hpp"

namespace contact_sheet {

/**
 * @struct SheetResult
 * @brief Single tagged outcome of a run.
 */
struct SheetResult {
  Stage stage = Stage::Done;      //< Stage that failed, Done on success
  ErrorCode code = ErrorCode::Ok;
  std::string output_path;        //< Artifact on success
  std::string diagnostic;         //< Human-readable failure reason
  double duration = 0.0;          //< Probed duration (if reached)
  SheetPlan plan;                 //< Grid plan (if reached)
  std::vector<std::string> warnings;

  bool ok() const { return code == ErrorCode::Ok; }
};

/**
 * @class SheetGenerator
 * @brief Orchestrates probe, plan, construct and render for one video.
 */
class SheetGenerator {
  ProcessRunner &runner_;
  std::string ffprobe_name_;
  std::string ffmpeg_name_;
  int jpeg_quality_;

  std::string ffprobe_path_; //< Resolved by check_tools()
  std::string ffmpeg_path_;
  bool tools_ready_ = false;

  /**
   * @brief Print summary of the produced sheet.
   */
  void print_sheet_summary(const std::string &video, const SheetConfig &config,
                           const SheetResult &result) const;

public:
  /**
   * @brief Construct a generator.
   * @param runner Process capability (must outlive the generator)
   * @param ffprobe_name Probe executable name or path
   * @param ffmpeg_name Renderer executable name or path
   * @param jpeg_quality Renderer -q:v value
   */
  SheetGenerator(ProcessRunner &runner, std::string ffprobe_name,
                 std::string ffmpeg_name,
                 int jpeg_quality = DEFAULT_JPEG_QUALITY);

  /**
   * @brief Locate both external tools.
   * @return Ok, or ToolNotFound naming the missing tool
   */
  SheetResult check_tools();

  /**
   * @brief Generate a contact sheet.
   *
   * @param video Source video path (never modified)
   * @param config Sampling and layout options
   * @param output_path Destination image path
   * @return Ok with output path, or the failing stage and reason
   *
   * @attention Calls check_tools() first if it has not succeeded yet.
   */
  SheetResult run(const std::string &video, const SheetConfig &config,
                  const std::string &output_path);
};

} // namespace contact_sheet

#endif // CONTACT_SHEET_SHEET_GENERATOR_HPP
