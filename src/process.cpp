/**
 * @file process.cpp
 * @brief External process execution implementation
 *
 * @details fork/execvp with three pipes:
 *
 *          - stdout and stderr of the child, drained with poll()
 *
 *          - a close-on-exec status pipe that carries errno back to the
 *            parent when execvp fails, so "could not start" is told apart
 *            from "started and exited non-zero"
 *
 * @note Linux-specific (pipe2, O_CLOEXEC).
 */

#include "contact_sheet/process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "contact_sheet/logging.hpp"

namespace contact_sheet {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

constexpr const char *DEFAULT_PATH = "/usr/local/bin:/usr/bin:/bin";

/// Close a descriptor if open and mark it closed
void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

/// Retry waitpid across EINTR and translate the status
int wait_for_child(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR)
      return -1;
  }
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

/// Read both pipes until EOF on each
void drain_pipes(int &out_fd, int &err_fd, std::string &out_text,
                 std::string &err_text) {
  char buffer[4096];
  while (out_fd >= 0 || err_fd >= 0) {
    struct pollfd fds[2];
    nfds_t count = 0;
    int *owners[2];
    std::string *sinks[2];
    if (out_fd >= 0) {
      fds[count] = {out_fd, POLLIN, 0};
      owners[count] = &out_fd;
      sinks[count] = &out_text;
      ++count;
    }
    if (err_fd >= 0) {
      fds[count] = {err_fd, POLLIN, 0};
      owners[count] = &err_fd;
      sinks[count] = &err_text;
      ++count;
    }

    int ready = ::poll(fds, count, -1);
    if (ready == -1) {
      if (errno == EINTR)
        continue;
      LOG_WARN("poll() failed while reading child output: {}",
               std::strerror(errno));
      close_fd(out_fd);
      close_fd(err_fd);
      return;
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0)
        continue;
      ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
      if (n > 0) {
        sinks[i]->append(buffer, static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        close_fd(*owners[i]);
      }
    }
  }
}

bool is_executable_file(const fs::path &candidate) {
  std::error_code ec;
  if (!fs::is_regular_file(candidate, ec))
    return false;
  return ::access(candidate.c_str(), X_OK) == 0;
}

bool is_shell_safe(const std::string &arg) {
  if (arg.empty())
    return false;
  for (unsigned char c : arg) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
              (c >= '0' && c <= '9') ||
              (c != 0 && std::strchr("@%+=:,./_-", c) != nullptr);
    if (!ok)
      return false;
  }
  return true;
}

} // anonymous namespace

// **---- SystemProcessRunner ----**

ProcessResult SystemProcessRunner::run(const std::vector<std::string> &argv) {
  ProcessResult result;
  if (argv.empty()) {
    LOG_ERROR("Refusing to run an empty command");
    return result;
  }

  /// argv must be fully built before fork; the child only calls
  /// async-signal-safe functions.
  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &a : argv) {
    args.push_back(const_cast<char *>(a.c_str()));
  }
  args.push_back(nullptr);

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  auto close_all = [&]() {
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[0]);
    close_fd(exec_pipe[1]);
  };
  if (::pipe2(out_pipe, O_CLOEXEC) == -1 ||
      ::pipe2(err_pipe, O_CLOEXEC) == -1 ||
      ::pipe2(exec_pipe, O_CLOEXEC) == -1) {
    result.stderr_text =
        fmt::format("failed to create pipes: {}", std::strerror(errno));
    close_all();
    return result;
  }

  pid_t pid = ::fork();
  if (pid == -1) {
    result.stderr_text = fmt::format("fork failed: {}", std::strerror(errno));
    close_all();
    return result;
  }

  if (pid == 0) {
    // **---- CHILD ----**
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::execvp(args[0], args.data());

    int err = errno;
    ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  // **---- PARENT ----**
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);

  /// Blocks until execvp succeeds (pipe closed by CLOEXEC) or reports errno
  int exec_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n == -1 && errno == EINTR);
  close_fd(exec_pipe[0]);

  drain_pipes(out_pipe[0], err_pipe[0], result.stdout_text,
              result.stderr_text);
  result.exit_code = wait_for_child(pid);

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    result.started = false;
    result.stderr_text = fmt::format("cannot execute '{}': {}", argv[0],
                                     std::strerror(exec_errno));
  } else {
    result.started = true;
  }
  return result;
}

std::optional<std::string>
SystemProcessRunner::locate(const std::string &name) {
  return find_executable(name);
}

// **---- Discovery ----**

std::optional<std::string> find_executable(const std::string &name,
                                           const char *path_env) {
  if (name.empty())
    return std::nullopt;

  if (name.find('/') != std::string::npos) {
    if (is_executable_file(name))
      return name;
    return std::nullopt;
  }

  if (!path_env)
    path_env = std::getenv("PATH");
  std::string search = path_env ? path_env : DEFAULT_PATH;

  size_t pos = 0;
  while (pos <= search.size()) {
    size_t end = search.find(':', pos);
    if (end == std::string::npos)
      end = search.size();
    std::string dir = search.substr(pos, end - pos);
    /// An empty PATH entry means the current directory
    fs::path candidate = fs::path(dir.empty() ? "." : dir) / name;
    if (is_executable_file(candidate))
      return candidate.string();
    pos = end + 1;
  }
  return std::nullopt;
}

std::string quote_command(const std::vector<std::string> &argv) {
  std::string out;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0)
      out += ' ';
    const std::string &arg = argv[i];
    if (is_shell_safe(arg)) {
      out += arg;
      continue;
    }
    out += '\'';
    for (char c : arg) {
      if (c == '\'')
        out += "'\"'\"'";
      else
        out += c;
    }
    out += '\'';
  }
  return out;
}

} // namespace contact_sheet
