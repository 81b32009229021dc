/**
 * @file renderer.hpp
 * @brief Renderer invocation and partial-output cleanup
 *
 * @details Runs ffmpeg for a RenderRequest. On any failure the file at the
 *          output path is removed, so on return the path either holds a
 *          complete sheet or does not exist.
 */

#ifndef CONTACT_SHEET_RENDERER_HPP
#define CONTACT_SHEET_RENDERER_HPP

#include <optional>
#include <string>
#include <vector>

#include "filter_graph.hpp"
#include "process.hpp"
#include "types.hpp"

namespace contact_sheet {

/**
 * @struct RenderResult
 * @brief Produced artifact path, or the failure with diagnostics.
 */
struct RenderResult {
  ErrorCode code = ErrorCode::Ok;
  std::string output_path;           //< Artifact on success
  std::string diagnostic;            //< Command and renderer stderr
  std::vector<std::string> warnings; //< e.g. cleanup failures

  bool ok() const { return code == ErrorCode::Ok; }
};

/**
 * @brief Delete a partially written output file.
 * @details Only a regular file or a symlink is removed; a directory or other
 *          node at @p path is left untouched and reported as a warning.
 * @return Warning text if something exists at @p path and was not removed
 */
std::optional<std::string> remove_partial_output(const std::string &path);

/**
 * @brief Render the contact sheet.
 *
 * @param runner Process capability
 * @param ffmpeg Resolved renderer executable
 * @param request Request built by build_render_request()
 * @return Ok with the output path, or RenderExecutionFailure
 */
RenderResult render_sheet(ProcessRunner &runner, const std::string &ffmpeg,
                          const RenderRequest &request);

} // namespace contact_sheet

#endif // CONTACT_SHEET_RENDERER_HPP
