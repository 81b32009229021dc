/**
 * @file video_selector.hpp
 * @brief Directory scanning and single-video selection
 *
 * @details When no video is named on the command line, the scan directory
 *          is listed for known video extensions and one candidate is picked
 *          through a VideoResolver:
 *
 *          - NonInteractiveResolver: only a single candidate is accepted
 *
 *          - PromptResolver: numbered list, user picks one
 *
 * @note The sheet generator never prompts; selection happens before it runs.
 */

#ifndef CONTACT_SHEET_VIDEO_SELECTOR_HPP
#define CONTACT_SHEET_VIDEO_SELECTOR_HPP

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace contact_sheet {

/// Extensions scanned when none are given
const std::vector<std::string> &default_video_extensions();

/**
 * @brief Lower-case extensions and ensure a leading dot.
 * @return Normalized list, or default_video_extensions() if empty
 */
std::vector<std::string>
normalize_extensions(const std::vector<std::string> &extensions);

/**
 * @brief List video files in a directory.
 *
 * @param dir Directory to scan (not recursive)
 * @param extensions Normalized extensions (".mp4")
 * @param files Output: full paths sorted by file name
 * @param error Output: reason on failure
 * @return false if the directory is missing or unreadable
 */
bool list_video_files(const std::string &dir,
                      const std::vector<std::string> &extensions,
                      std::vector<std::string> &files, std::string &error);

/**
 * @class VideoResolver
 * @brief Strategy for picking one video out of several candidates.
 */
class VideoResolver {
public:
  virtual ~VideoResolver() = default;

  /**
   * @param candidates Non-empty list of video paths
   * @return Chosen path, or nullopt if cancelled / refused
   */
  virtual std::optional<std::string>
  resolve(const std::vector<std::string> &candidates) = 0;
};

/**
 * @class NonInteractiveResolver
 * @brief Accepts exactly one candidate.
 */
class NonInteractiveResolver : public VideoResolver {
public:
  std::optional<std::string>
  resolve(const std::vector<std::string> &candidates) override;
};

/**
 * @class PromptResolver
 * @brief Asks the user to pick a numbered candidate.
 * @note Re-prompts on bad input; end of input cancels.
 */
class PromptResolver : public VideoResolver {
public:
  PromptResolver(std::istream &in, std::ostream &out) : in_(in), out_(out) {}

  std::optional<std::string>
  resolve(const std::vector<std::string> &candidates) override;

private:
  std::istream &in_;
  std::ostream &out_;
};

/**
 * @struct Selection
 * @brief Outcome of select_video().
 */
struct Selection {
  ErrorCode code = ErrorCode::Ok;
  std::optional<std::string> video; //< Empty with Ok = nothing to process
  std::string diagnostic;

  bool ok() const { return code == ErrorCode::Ok; }
};

/**
 * @brief Scan a directory and resolve one video.
 *
 * @return Ok + video; Ok + no video when the directory holds no candidates;
 *         VideoNotFound if the directory cannot be listed; NoSelection if
 *         the resolver declined.
 */
Selection select_video(const std::string &dir,
                       const std::vector<std::string> &extensions,
                       VideoResolver &resolver);

} // namespace contact_sheet

#endif // CONTACT_SHEET_VIDEO_SELECTOR_HPP
