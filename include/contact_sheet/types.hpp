/**
 * @file types.hpp
 * @brief Core data types and constants for Contact Sheet
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Default sheet geometry constants
 *
 *          - SheetConfig / SheetPlan for grid planning
 *
 *          - ErrorCode and Stage for tagged failure reporting
 */

#ifndef CONTACT_SHEET_TYPES_HPP
#define CONTACT_SHEET_TYPES_HPP

#include <string>

namespace contact_sheet {

// **----- CONSTANTS -----**

constexpr double DEFAULT_INTERVAL_SEC = 30.0;
constexpr int DEFAULT_COLUMNS = 5;
constexpr int DEFAULT_THUMB_HEIGHT = 250;

/**
 * @brief JPEG quality scale passed to the renderer (-q:v).
 * @note 1 = best, 31 = worst. 2-5 gives good sheets at a sane file size.
 */
constexpr int DEFAULT_JPEG_QUALITY = 3;

// **----- DATA STRUCTURES -----**

/**
 * @struct SheetConfig
 * @brief User-supplied sampling and layout options.
 * @note All three fields must be > 0 before a plan can be made.
 */
struct SheetConfig {
  double interval = DEFAULT_INTERVAL_SEC; //< Seconds between samples
  int columns = DEFAULT_COLUMNS;          //< Grid width in thumbnails
  int thumb_height = DEFAULT_THUMB_HEIGHT; //< Thumbnail height in pixels
};

/**
 * @struct SheetPlan
 * @brief Derived grid plan.
 * @note thumbnail_count = ceil(duration / interval),
 *       rows = ceil(thumbnail_count / columns).
 */
struct SheetPlan {
  int thumbnail_count = 0; //< Number of sampled frames
  int rows = 0;            //< Grid height in thumbnails
};

inline bool operator==(const SheetPlan &a, const SheetPlan &b) {
  return a.thumbnail_count == b.thumbnail_count && a.rows == b.rows;
}

// **----- ERRORS -----**

/**
 * @brief Failure taxonomy for a single run.
 */
enum class ErrorCode {
  Ok,
  ToolNotFound,
  ProbeParseFailure,
  ProbeExecutionFailure,
  InvalidConfig,
  EmptyVideo,
  NoThumbnails,
  RenderExecutionFailure,
  VideoNotFound,
  NoSelection,
  OutputDirectory,
};

/**
 * @brief Processing stage that produced an outcome.
 */
enum class Stage { Tools, Select, Probe, Plan, Render, Done };

/// Stable name for an ErrorCode (used in logs and tests)
const char *error_code_name(ErrorCode code);

/// Stable name for a Stage
const char *stage_name(Stage stage);

} // namespace contact_sheet

#endif // CONTACT_SHEET_TYPES_HPP
