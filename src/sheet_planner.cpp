/**
 * @file sheet_planner.cpp
 * @brief Thumbnail grid planning implementation
 */

#include "contact_sheet/sheet_planner.hpp"

#include <cmath>
#include <limits>

#include <fmt/core.h>

namespace contact_sheet {

PlanResult validate_config(const SheetConfig &config) {
  PlanResult result;
  if (!(config.interval > 0) || !std::isfinite(config.interval)) {
    result.code = ErrorCode::InvalidConfig;
    result.diagnostic = fmt::format(
        "interval must be a positive number of seconds (got {})",
        config.interval);
  } else if (config.columns <= 0) {
    result.code = ErrorCode::InvalidConfig;
    result.diagnostic = fmt::format(
        "columns must be a positive integer (got {})", config.columns);
  } else if (config.thumb_height <= 0) {
    result.code = ErrorCode::InvalidConfig;
    result.diagnostic = fmt::format(
        "thumbnail height must be a positive integer (got {})",
        config.thumb_height);
  }
  return result;
}

PlanResult plan_sheet(double duration, const SheetConfig &config) {
  PlanResult result = validate_config(config);
  if (!result.ok())
    return result;

  if (!(duration > 0)) {
    result.code = ErrorCode::EmptyVideo;
    result.diagnostic = "video has zero duration";
    return result;
  }

  double count = std::ceil(duration / config.interval);
  if (count > std::numeric_limits<int>::max()) {
    result.code = ErrorCode::InvalidConfig;
    result.diagnostic = fmt::format(
        "interval {}s yields too many thumbnails for a {}s video",
        config.interval, duration);
    return result;
  }

  /// Unreachable for duration > 0 and interval > 0; kept as a guard
  if (count < 1) {
    result.code = ErrorCode::NoThumbnails;
    result.diagnostic = fmt::format(
        "calculated 0 thumbnails (duration={:.2f}s, interval={}s)", duration,
        config.interval);
    return result;
  }

  result.plan.thumbnail_count = static_cast<int>(count);
  result.plan.rows = static_cast<int>(
      (static_cast<long long>(result.plan.thumbnail_count) + config.columns -
       1) /
      config.columns);
  return result;
}

} // namespace contact_sheet
