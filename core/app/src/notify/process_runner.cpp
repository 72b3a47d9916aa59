#include "posmon/notify/process_runner.hpp"

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

namespace posmon {

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(10);

// argv as the char* array execvp wants. Built before fork() so the child
// does not allocate.
std::vector<char*> makeArgv(const std::vector<std::string>& argv) {
  std::vector<char*> out;
  out.reserve(argv.size() + 1);
  for (const auto& a : argv) {
    out.push_back(const_cast<char*>(a.c_str()));
  }
  out.push_back(nullptr);
  return out;
}

// Child side, after fork(): stdin from /dev/null, exec, report errno.
[[noreturn]] void execChild(char* const* argv, int err_fd) {
  int devnull = ::open("/dev/null", O_RDONLY);
  if (devnull >= 0) {
    ::dup2(devnull, STDIN_FILENO);
    ::close(devnull);
  }
  ::execvp(argv[0], argv);
  int err = errno;
  ssize_t ignored = ::write(err_fd, &err, sizeof(err));
  (void)ignored;
  ::_exit(127);
}

// Reads the exec errno from the close-on-exec pipe. 0 means exec succeeded
// (the write end was closed by exec without anything written).
int readExecErrno(int fd) {
  int err = 0;
  ssize_t n;
  do {
    n = ::read(fd, &err, sizeof(err));
  } while (n < 0 && errno == EINTR);
  return n == static_cast<ssize_t>(sizeof(err)) ? err : 0;
}

pid_t waitBlocking(pid_t pid, int* status) {
  pid_t r;
  do {
    r = ::waitpid(pid, status, 0);
  } while (r < 0 && errno == EINTR);
  return r;
}

void decodeStatus(int status, ProcessResult& result) {
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.signal = WTERMSIG(status);
  }
}

}  // namespace

std::string ProcessResult::describe() const {
  if (!started) {
    return error.empty() ? "not started" : error;
  }
  if (timed_out) {
    return "timed out";
  }
  if (signal != 0) {
    return "killed by signal " + std::to_string(signal);
  }
  if (exit_code != 0) {
    return "exit status " + std::to_string(exit_code);
  }
  return "ok";
}

// -----------------------------------------------------------------------------
// runCommand()
// -----------------------------------------------------------------------------
ProcessResult runCommand(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout) {
  ProcessResult result;
  if (argv.empty()) {
    result.error = "empty command";
    return result;
  }

  auto cargv = makeArgv(argv);

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    result.error = std::string("pipe: ") + std::strerror(errno);
    return result;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    result.error = std::string("fork: ") + std::strerror(errno);
    ::close(fds[0]);
    ::close(fds[1]);
    return result;
  }
  if (pid == 0) {
    ::close(fds[0]);
    execChild(cargv.data(), fds[1]);
  }

  ::close(fds[1]);
  int exec_err = readExecErrno(fds[0]);
  ::close(fds[0]);

  int status = 0;
  if (exec_err != 0) {
    waitBlocking(pid, &status);
    result.error = argv[0] + ": " + std::strerror(exec_err);
    return result;
  }
  result.started = true;

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      decodeStatus(status, result);
      return result;
    }
    if (r < 0 && errno != EINTR) {
      result.error = std::string("waitpid: ") + std::strerror(errno);
      result.exit_code = -1;
      return result;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      ::kill(pid, SIGKILL);
      waitBlocking(pid, &status);
      result.timed_out = true;
      return result;
    }
    std::this_thread::sleep_for(kReapPollInterval);
  }
}

// -----------------------------------------------------------------------------
// launchDetached()
// -----------------------------------------------------------------------------
ProcessResult launchDetached(const std::vector<std::string>& argv) {
  ProcessResult result;
  if (argv.empty()) {
    result.error = "empty command";
    return result;
  }

  auto cargv = makeArgv(argv);

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    result.error = std::string("pipe: ") + std::strerror(errno);
    return result;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    result.error = std::string("fork: ") + std::strerror(errno);
    ::close(fds[0]);
    ::close(fds[1]);
    return result;
  }
  if (pid == 0) {
    ::close(fds[0]);
    ::setsid();
    pid_t grandchild = ::fork();
    if (grandchild == 0) {
      execChild(cargv.data(), fds[1]);
    }
    ::_exit(grandchild < 0 ? 1 : 0);
  }

  ::close(fds[1]);
  int status = 0;
  waitBlocking(pid, &status);
  int exec_err = readExecErrno(fds[0]);
  ::close(fds[0]);

  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    result.error = "detached launch of " + argv[0] + " failed to fork";
    return result;
  }
  if (exec_err != 0) {
    result.error = argv[0] + ": " + std::strerror(exec_err);
    return result;
  }

  result.started = true;
  result.exit_code = 0;
  return result;
}

}  // namespace posmon
