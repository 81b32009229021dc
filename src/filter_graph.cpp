/**
 * @file filter_graph.cpp
 * @brief Filter pipeline serialization and renderer argv
 */

#include "contact_sheet/filter_graph.hpp"

#include <algorithm>

#include <fmt/core.h>

namespace contact_sheet {

namespace {

/// 80 -> "0.8", 50 -> "0.5", 100 -> "1"
std::string alpha(int pct) {
  return fmt::format("{}", std::min(100, std::max(0, pct)) / 100.0);
}

} // anonymous namespace

std::string FilterGraph::serialize() const {
  std::string out;
  out.reserve(256);

  out += fmt::format("fps=1/{},", sample_interval);
  out += fmt::format("scale=-1:{},", scale_height);

  /// %{pts\:hms} renders the frame time as HH:MM:SS(.mmm); the colon is
  /// escaped so drawtext does not read it as an option separator.
  out += fmt::format("drawtext=text='%{{pts\\:hms}}':x={}:y={}:fontsize={}:"
                     "fontcolor=white@{}:box=1:boxcolor=black@{}:"
                     "boxborderw={},",
                     label.x, label.y, label.font_size,
                     alpha(label.font_alpha_pct), alpha(label.box_alpha_pct),
                     label.box_border);

  out += fmt::format("tile=layout={}x{}:padding={}:margin={}", tile.columns,
                     tile.rows, tile.padding, tile.margin);
  return out;
}

RenderRequest build_render_request(const SheetPlan &plan,
                                   const SheetConfig &config,
                                   const std::string &video,
                                   const std::string &output_path,
                                   int jpeg_quality) {
  RenderRequest request;
  request.video = video;
  request.plan = plan;
  request.config = config;
  request.output_path = output_path;
  request.jpeg_quality = std::min(31, std::max(1, jpeg_quality));

  request.filter.sample_interval = config.interval;
  request.filter.scale_height = config.thumb_height;
  request.filter.tile.columns = config.columns;
  request.filter.tile.rows = plan.rows;
  return request;
}

std::vector<std::string> render_arguments(const RenderRequest &request,
                                          const std::string &ffmpeg) {
  return {ffmpeg,
          "-hide_banner",
          "-loglevel",
          "warning",
          "-i",
          request.video,
          "-vf",
          request.filter.serialize(),
          "-frames:v",
          "1",
          "-q:v",
          std::to_string(request.jpeg_quality),
          "-y",
          request.output_path};
}

} // namespace contact_sheet
