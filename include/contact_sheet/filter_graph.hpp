/**
 * @file filter_graph.hpp
 * @brief Structured render pipeline and renderer command construction
 *
 * @details The renderer's -vf argument is held as a FilterGraph value
 *          (sampling, scaling, timestamp label, tiling) and only turned into
 *          text by serialize(). Four stages, in order:
 *
 *          1. fps=1/<interval>          one frame every interval seconds
 *
 *          2. scale=-1:<height>         fixed height, width keeps aspect
 *
 *          3. drawtext=...              HH:MM:SS label on a translucent box
 *
 *          4. tile=layout=<c>x<r>:...   grid with padding and margin
 *
 * @attention Only validated numbers are interpolated into the filter text.
 *            Video and output paths are separate argv elements.
 */

#ifndef CONTACT_SHEET_FILTER_GRAPH_HPP
#define CONTACT_SHEET_FILTER_GRAPH_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace contact_sheet {

/**
 * @struct TimestampLabel
 * @brief drawtext settings for the per-thumbnail timestamp.
 */
struct TimestampLabel {
  int x = 10;
  int y = 10;
  int font_size = 24;
  int font_alpha_pct = 80; //< white@0.8
  int box_alpha_pct = 50;  //< black@0.5
  int box_border = 5;
};

/**
 * @struct TileLayout
 * @brief Grid geometry for the tile filter.
 */
struct TileLayout {
  int columns = 0;
  int rows = 0;
  int padding = 10; //< Pixels between cells
  int margin = 10;  //< Pixels around the grid
};

/**
 * @struct FilterGraph
 * @brief Contact sheet filter pipeline.
 */
struct FilterGraph {
  double sample_interval = 0; //< Seconds between sampled frames
  int scale_height = 0;       //< Thumbnail height in pixels
  TimestampLabel label;
  TileLayout tile;

  /// Renderer filter syntax, e.g. "fps=1/30,scale=-1:250,drawtext=...,tile=..."
  std::string serialize() const;
};

/**
 * @struct RenderRequest
 * @brief Everything the renderer needs for one sheet. Consumed once.
 */
struct RenderRequest {
  std::string video;
  SheetPlan plan;
  SheetConfig config;
  FilterGraph filter;
  std::string output_path;
  int jpeg_quality = DEFAULT_JPEG_QUALITY; //< -q:v, clamped to 1..31
};

/**
 * @brief Assemble a render request from an already validated plan.
 * @param jpeg_quality Clamped into the renderer's 1..31 range
 */
RenderRequest build_render_request(const SheetPlan &plan,
                                   const SheetConfig &config,
                                   const std::string &video,
                                   const std::string &output_path,
                                   int jpeg_quality = DEFAULT_JPEG_QUALITY);

/**
 * @brief Renderer command line for a request.
 * @note -frames:v 1 collapses the tiled stream to exactly one image;
 *       -y overwrites without prompting.
 */
std::vector<std::string> render_arguments(const RenderRequest &request,
                                          const std::string &ffmpeg);

} // namespace contact_sheet

#endif // CONTACT_SHEET_FILTER_GRAPH_HPP
