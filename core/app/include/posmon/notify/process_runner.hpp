#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace posmon {

// -----------------------------------------------------------------------------
// ProcessResult — outcome of one external command
// -----------------------------------------------------------------------------
struct ProcessResult {
  bool started{false};    // fork + exec succeeded
  bool timed_out{false};  // killed at the deadline
  int exit_code{-1};      // valid when the child exited normally
  int signal{0};          // terminating signal, 0 if none
  std::string error;      // fork / exec / waitpid failure text

  bool ok() const { return started && !timed_out && signal == 0 && exit_code == 0; }

  // One-line description for SinkReport::detail, e.g. "exit status 1".
  std::string describe() const;
};

// -----------------------------------------------------------------------------
// runCommand(argv, timeout)
// -----------------------------------------------------------------------------
//
// @brief  fork + execvp `argv`, wait at most `timeout`.
//
// @details
// The parent polls waitpid(WNOHANG) every 10 ms. At the deadline the child is
// sent SIGKILL and reaped, and the result has timed_out set. stdin is
// /dev/null; stdout and stderr are inherited.
//
// exec failure in the child is reported through a close-on-exec pipe, so a
// missing program shows up as started == false with the errno text instead
// of a generic exit status 127.
//
// Never throws. Safe to call from several threads at once (each call waits
// only for its own pid).
// -----------------------------------------------------------------------------
ProcessResult runCommand(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout);

// -----------------------------------------------------------------------------
// launchDetached(argv)
// -----------------------------------------------------------------------------
// Double fork: the intermediate child calls setsid(), forks the real program
// and exits at once, so the program is re-parented to init and never needs
// reaping. Returns as soon as the intermediate child is reaped and exec has
// been confirmed. Used for the modal popup, whose lifetime is the user's.
// -----------------------------------------------------------------------------
ProcessResult launchDetached(const std::vector<std::string>& argv);

}  // namespace posmon
