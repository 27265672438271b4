/***
 * Name: agentrun::support::RunProcess
 * Purpose: Exec a command, stream a payload to its stdin, capture its output.
 * Inputs: args (argv strings), stdin_data, result (out), err (out)
 * Outputs: true when the child ran and was reaped; result holds exit code and output
 * Theory of Operation: fork/execvp with two O_CLOEXEC pipes. The parent polls
 *   the output pipe and the (non-blocking) stdin pipe together, closing stdin
 *   once the payload is written. SIGPIPE is blocked on the calling thread while
 *   writing so a child that exits early yields EPIPE instead of a signal.
 */
#include "agentrun/support/process.h"

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <ctime>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace agentrun {
namespace support {

namespace {

constexpr int kExecFailure = 127;
constexpr std::size_t kReadChunk = 4096;

void closeFd(int& fd) {
  if (fd >= 0) {
    (void)::close(fd);
    fd = -1;
  }
}

// Blocks SIGPIPE on this thread for the lifetime of the guard and discards a
// SIGPIPE raised meanwhile.
class SigpipeGuard {
 public:
  SigpipeGuard() {
    sigemptyset(&pipe_set_);
    sigaddset(&pipe_set_, SIGPIPE);
    (void)pthread_sigmask(SIG_BLOCK, &pipe_set_, &old_set_);
  }
  ~SigpipeGuard() {
    const struct timespec zero {};
    while (sigtimedwait(&pipe_set_, nullptr, &zero) > 0) {
    }
    (void)pthread_sigmask(SIG_SETMASK, &old_set_, nullptr);
  }
  SigpipeGuard(const SigpipeGuard&) = delete;
  SigpipeGuard& operator=(const SigpipeGuard&) = delete;

 private:
  sigset_t pipe_set_{};
  sigset_t old_set_{};
};

// Pointers alias the strings in args, which must outlive the exec.
std::vector<char*> argvOf(std::vector<std::string>& args) {
  std::vector<char*> argv;
  argv.reserve(args.size() + 1U);
  for (auto& arg : args) argv.push_back(arg.data());
  argv.push_back(nullptr);
  return argv;
}

}  // namespace

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
auto RunProcess(std::vector<std::string> args, const std::string& stdin_data, ProcessResult& result,
                std::string& err) -> bool {
  if (args.empty()) {
    err = "empty command";
    return false;
  }
  std::array<int, 2> out_pipe{-1, -1};
  std::array<int, 2> in_pipe{-1, -1};
  if (pipe2(out_pipe.data(), O_CLOEXEC) != 0 || pipe2(in_pipe.data(), O_CLOEXEC) != 0) {
    err = std::string("failed to create pipe: ") + std::strerror(errno);
    closeFd(out_pipe[0]);
    closeFd(out_pipe[1]);
    closeFd(in_pipe[0]);
    closeFd(in_pipe[1]);
    return false;
  }
  auto argv = argvOf(args);
  const SigpipeGuard sigpipe_guard;
  const auto pid = fork();
  if (pid < 0) {
    err = "failed to fork() for " + args.front();
    closeFd(out_pipe[0]);
    closeFd(out_pipe[1]);
    closeFd(in_pipe[0]);
    closeFd(in_pipe[1]);
    return false;
  }
  if (pid == 0) {
    (void)dup2(in_pipe[0], STDIN_FILENO);
    (void)dup2(out_pipe[1], STDOUT_FILENO);
    (void)dup2(out_pipe[1], STDERR_FILENO);
    execvp(argv[0], argv.data());
    _exit(kExecFailure);
  }
  closeFd(out_pipe[1]);
  closeFd(in_pipe[0]);
  int in_fd = in_pipe[1];
  int out_fd = out_pipe[0];
  if (stdin_data.empty()) {
    closeFd(in_fd);
  } else {
    (void)fcntl(in_fd, F_SETFL, fcntl(in_fd, F_GETFL) | O_NONBLOCK);
  }

  std::size_t written = 0;
  bool poll_failed = false;
  std::array<char, kReadChunk> buffer{};
  result.output.clear();
  while (out_fd >= 0) {
    std::array<pollfd, 2> fds{};
    nfds_t count = 0;
    fds[count++] = pollfd{out_fd, POLLIN, 0};
    if (in_fd >= 0) {
      fds[count++] = pollfd{in_fd, POLLOUT, 0};
    }
    if (poll(fds.data(), count, -1) < 0) {
      if (errno == EINTR) {
        continue;
      }
      err = std::string("poll() failed: ") + std::strerror(errno);
      poll_failed = true;
      break;
    }
    if (in_fd >= 0 && (fds[1].revents & (POLLOUT | POLLERR | POLLHUP)) != 0) {
      const auto rc = ::write(in_fd, stdin_data.data() + written, stdin_data.size() - written);
      if (rc > 0) {
        written += static_cast<std::size_t>(rc);
      }
      if (written >= stdin_data.size() || (rc < 0 && errno != EAGAIN && errno != EINTR)) {
        closeFd(in_fd);
      }
    }
    if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
      const auto got = ::read(out_fd, buffer.data(), buffer.size());
      if (got > 0) {
        result.output.append(buffer.data(), static_cast<std::size_t>(got));
      } else if (got == 0 || errno != EINTR) {
        closeFd(out_fd);
      }
    }
  }
  closeFd(in_fd);
  closeFd(out_fd);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      err = "failed to waitpid() for " + args.front();
      return false;
    }
  }
  if (poll_failed) {
    return false;
  }
  constexpr int kSignalBase = 128;
  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : kSignalBase + WTERMSIG(status);
  return true;
}

}  // namespace support
}  // namespace agentrun
