/**
 * @file process.hpp
 * @brief External process execution and executable discovery
 *
 * @details The only I/O the core performs is running the probe and the
 *          renderer. That capability is modelled as the ProcessRunner
 *          interface so planning and cleanup can be tested with a fake.
 *
 *          - SystemProcessRunner: fork/execvp with captured stdout/stderr
 *
 *          - find_executable: PATH lookup done once, up front
 *
 * @note Arguments are passed as an argv vector, never through a shell, so
 *       paths containing quotes or spaces cannot alter the command.
 */

#ifndef CONTACT_SHEET_PROCESS_HPP
#define CONTACT_SHEET_PROCESS_HPP

#include <optional>
#include <string>
#include <vector>

namespace contact_sheet {

/**
 * @struct ProcessResult
 * @brief Outcome of a single blocking process run.
 */
struct ProcessResult {
  bool started = false;    //< false if the executable could not be spawned
  int exit_code = -1;      //< Exit status (128 + signal if killed)
  std::string stdout_text; //< Captured standard output
  std::string stderr_text; //< Captured standard error

  bool succeeded() const { return started && exit_code == 0; }
};

/**
 * @class ProcessRunner
 * @brief Injected capability for running external tools.
 */
class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;

  /**
   * @brief Run argv[0] with the given arguments and wait for it to exit.
   * @param argv Program followed by its arguments (must not be empty)
   */
  virtual ProcessResult run(const std::vector<std::string> &argv) = 0;

  /**
   * @brief Resolve an executable name to a runnable path.
   * @return Path, or nullopt if the tool is not available
   */
  virtual std::optional<std::string> locate(const std::string &name) = 0;
};

/**
 * @class SystemProcessRunner
 * @brief ProcessRunner backed by fork/execvp and pipes.
 *
 * @note stdout and stderr are drained together with poll() so a child that
 *       fills one pipe cannot block while we wait on the other.
 *       No timeout is applied; a hung child hangs the call.
 */
class SystemProcessRunner : public ProcessRunner {
public:
  ProcessResult run(const std::vector<std::string> &argv) override;
  std::optional<std::string> locate(const std::string &name) override;
};

/**
 * @brief Look up an executable.
 *
 * @param name Bare name (searched on PATH) or a path containing '/'
 * @param path_env PATH value to search (nullptr = read from environment)
 * @return Full path of the first executable regular file, or nullopt
 */
std::optional<std::string> find_executable(const std::string &name,
                                           const char *path_env = nullptr);

/**
 * @brief Render argv as a shell-quoted command line for diagnostics.
 * @note Display only. Nothing built here is ever executed.
 */
std::string quote_command(const std::vector<std::string> &argv);

} // namespace contact_sheet

#endif // CONTACT_SHEET_PROCESS_HPP
