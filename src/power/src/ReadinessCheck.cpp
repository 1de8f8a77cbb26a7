/**
 * @file ReadinessCheck.cpp
 * @brief fork/execv runner for the suspend readiness script.
 */

#include "src/power/inc/ReadinessCheck.hpp"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <fmt/core.h>

namespace spindown {

namespace power {

namespace {

/// Child side: never returns.
[[noreturn]] void execChild(const char* path, int errPipe) noexcept {
  const int NULL_FD = ::open("/dev/null", O_RDONLY);
  if (NULL_FD >= 0) {
    ::dup2(NULL_FD, STDIN_FILENO);
    if (NULL_FD != STDIN_FILENO) {
      ::close(NULL_FD);
    }
  }

  char* const argv[] = {const_cast<char*>(path), nullptr};
  ::execv(path, argv);

  // Only reached on failure; the pipe is close-on-exec so success closes it silently
  const int ERR = errno;
  [[maybe_unused]] const ssize_t W = ::write(errPipe, &ERR, sizeof(ERR));
  ::_exit(EXEC_FAILURE_EXIT);
}

/// Read the child's exec errno, if any. Returns 0 when exec succeeded.
int readExecErrno(int fd) noexcept {
  int childErr = 0;
  ssize_t n = 0;
  do {
    n = ::read(fd, &childErr, sizeof(childErr));
  } while (n < 0 && errno == EINTR);
  return (n == static_cast<ssize_t>(sizeof(childErr))) ? childErr : 0;
}

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(ScriptStatus status) noexcept {
  switch (status) {
  case ScriptStatus::READY:
    return "READY";
  case ScriptStatus::NOT_READY:
    return "NOT_READY";
  case ScriptStatus::SPAWN_FAILED:
    return "SPAWN_FAILED";
  case ScriptStatus::EXEC_FAILED:
    return "EXEC_FAILED";
  case ScriptStatus::SIGNALED:
    return "SIGNALED";
  }
  return "UNKNOWN";
}

std::string ScriptResult::toString() const {
  switch (status) {
  case ScriptStatus::NOT_READY:
    return fmt::format("NOT_READY (exit {})", exitCode);
  case ScriptStatus::SIGNALED:
    return fmt::format("SIGNALED (signal {})", signal);
  case ScriptStatus::SPAWN_FAILED:
  case ScriptStatus::EXEC_FAILED:
    if (sysErrno != 0) {
      return fmt::format("{} ({})", power::toString(status), std::strerror(sysErrno));
    }
    return power::toString(status);
  case ScriptStatus::READY:
    break;
  }
  return power::toString(status);
}

/* ----------------------------- API ----------------------------- */

ScriptResult runReadinessCheck(const char* path) noexcept {
  ScriptResult result{};

  if (path == nullptr || *path == '\0') {
    result.status = ScriptStatus::EXEC_FAILED;
    result.sysErrno = ENOENT;
    return result;
  }

  int errPipe[2] = {-1, -1};
  if (::pipe2(errPipe, O_CLOEXEC) != 0) {
    result.sysErrno = errno;
    return result;
  }

  const pid_t PID = ::fork();
  if (PID < 0) {
    result.sysErrno = errno;
    ::close(errPipe[0]);
    ::close(errPipe[1]);
    return result;
  }

  if (PID == 0) {
    ::close(errPipe[0]);
    execChild(path, errPipe[1]);
  }

  ::close(errPipe[1]);
  const int EXEC_ERR = readExecErrno(errPipe[0]);
  ::close(errPipe[0]);

  int wstatus = 0;
  pid_t waited = -1;
  do {
    waited = ::waitpid(PID, &wstatus, 0);
  } while (waited < 0 && errno == EINTR);

  if (waited < 0) {
    result.sysErrno = errno;
    return result;
  }

  if (EXEC_ERR != 0) {
    result.status = ScriptStatus::EXEC_FAILED;
    result.sysErrno = EXEC_ERR;
    if (WIFEXITED(wstatus)) {
      result.exitCode = WEXITSTATUS(wstatus);
    }
    return result;
  }

  if (WIFSIGNALED(wstatus)) {
    result.status = ScriptStatus::SIGNALED;
    result.signal = WTERMSIG(wstatus);
    return result;
  }

  if (WIFEXITED(wstatus)) {
    result.exitCode = WEXITSTATUS(wstatus);
    result.status = (result.exitCode == 0) ? ScriptStatus::READY : ScriptStatus::NOT_READY;
    return result;
  }

  // Stopped/continued are not reported without WUNTRACED; treat anything else as spawn failure
  result.status = ScriptStatus::SPAWN_FAILED;
  return result;
}

} // namespace power

} // namespace spindown
