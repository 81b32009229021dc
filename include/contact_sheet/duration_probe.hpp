/**
 * @file duration_probe.hpp
 * @brief Video duration lookup through the external probe tool
 *
 * @details Runs ffprobe against a single video and normalizes every outcome
 *          into a ProbeResult:
 *
 *          - "12.5"        -> 12.5
 *
 *          - "" / "-3.0"   -> 0.0 plus a warning (not an error)
 *
 *          - "abc"         -> ProbeParseFailure
 *
 *          - non-zero exit -> ProbeExecutionFailure with the tool's stderr
 *
 * @note No retry. A failed probe is surfaced to the caller immediately.
 */

#ifndef CONTACT_SHEET_DURATION_PROBE_HPP
#define CONTACT_SHEET_DURATION_PROBE_HPP

#include <string>
#include <vector>

#include "process.hpp"
#include "types.hpp"

namespace contact_sheet {

/**
 * @struct ProbeResult
 * @brief Duration in seconds, or the reason it could not be obtained.
 */
struct ProbeResult {
  ErrorCode code = ErrorCode::Ok;
  double duration = 0.0;             //< Seconds, >= 0 when ok()
  std::vector<std::string> warnings; //< Normalizations applied
  std::string diagnostic;            //< Human-readable failure detail

  bool ok() const { return code == ErrorCode::Ok; }
};

/**
 * @brief Parse the probe's standard output.
 * @param output Raw stdout; surrounding whitespace is ignored
 * @return ProbeResult with either a duration or ProbeParseFailure
 */
ProbeResult parse_duration(const std::string &output);

/**
 * @brief Build the probe command line for a video.
 * @param ffprobe Resolved probe executable
 * @param video Video path (passed as a single argv element)
 */
std::vector<std::string> probe_arguments(const std::string &ffprobe,
                                         const std::string &video);

/**
 * @brief Query a video's duration.
 *
 * @param runner Process capability
 * @param ffprobe Resolved probe executable
 * @param video Video path
 * @return Duration or failure; warnings are also logged with LOG_WARN
 */
ProbeResult probe_duration(ProcessRunner &runner, const std::string &ffprobe,
                           const std::string &video);

} // namespace contact_sheet

#endif // CONTACT_SHEET_DURATION_PROBE_HPP
