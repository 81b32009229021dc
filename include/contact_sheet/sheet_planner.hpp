/**
 * @file sheet_planner.hpp
 * @brief Thumbnail grid planning
 *
 * @details Pure functions: no I/O, no logging, deterministic. Safe to test
 *          with literal (duration, interval, columns) triples.
 */

#ifndef CONTACT_SHEET_SHEET_PLANNER_HPP
#define CONTACT_SHEET_SHEET_PLANNER_HPP

#include <string>

#include "types.hpp"

namespace contact_sheet {

/**
 * @struct PlanResult
 * @brief A SheetPlan or the reason none can be produced.
 */
struct PlanResult {
  ErrorCode code = ErrorCode::Ok;
  SheetPlan plan;
  std::string diagnostic;

  bool ok() const { return code == ErrorCode::Ok; }
};

/**
 * @brief Check interval/columns/thumb_height are all > 0.
 * @return Ok, or InvalidConfig with a message naming the first bad field
 */
PlanResult validate_config(const SheetConfig &config);

/**
 * @brief Compute the grid plan for a video.
 *
 * @param duration Video length in seconds (>= 0)
 * @param config Sampling and layout options
 * @return Plan, or InvalidConfig / EmptyVideo / NoThumbnails
 *
 * @attention Config is validated before duration is looked at, so a bad
 *            config yields InvalidConfig regardless of duration.
 */
PlanResult plan_sheet(double duration, const SheetConfig &config);

} // namespace contact_sheet

#endif // CONTACT_SHEET_SHEET_PLANNER_HPP
