#include "kubehost/runtime/process_runner.h"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

std::vector<char*> ToExecArgv(const std::vector<std::string>& args) {
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);
  return argv;
}

bool IsProcessGroupAlive(pid_t pgid) {
  if (pgid <= 0) {
    return false;
  }
  if (::kill(-pgid, 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

bool WaitForProcessGroupExit(pid_t pgid, int timeout_ms) {
  const int step_ms = 100;
  int waited_ms = 0;
  while (waited_ms < timeout_ms) {
    const pid_t wait_result = ::waitpid(pgid, nullptr, WNOHANG);
    if (wait_result == pgid) {
      return true;
    }
    if (!IsProcessGroupAlive(pgid)) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(step_ms));
    waited_ms += step_ms;
  }
  const pid_t wait_result = ::waitpid(pgid, nullptr, WNOHANG);
  if (wait_result == pgid) {
    return true;
  }
  return !IsProcessGroupAlive(pgid);
}

void ClosePipe(int fds[2]) {
  for (int i = 0; i < 2; ++i) {
    if (fds[i] >= 0) {
      ::close(fds[i]);
      fds[i] = -1;
    }
  }
}

//! Reports the child's errno through the exec status pipe and terminates the child.
[[noreturn]] void FailChild(int status_fd) {
  const int child_errno = errno;
  (void)::write(status_fd, &child_errno, sizeof(child_errno));
  _exit(127);
}

bool RedirectToFile(const char* path, int flags, int target_fd) {
  const int fd = ::open(path, flags, 0644);
  if (fd < 0) {
    return false;
  }
  if (::dup2(fd, target_fd) < 0) {
    ::close(fd);
    return false;
  }
  ::close(fd);
  return true;
}

//! Waits for the exec status pipe to close. Returns the child's errno when exec failed.
int ReadExecStatus(int status_fd) {
  int child_errno = 0;
  ssize_t read_count = 0;
  do {
    read_count = ::read(status_fd, &child_errno, sizeof(child_errno));
  } while (read_count < 0 && errno == EINTR);
  return read_count > 0 ? child_errno : 0;
}

int WaitForExitCode(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

//! Feeds `input` to `in_fd` while draining `out_fd` until both sides are done.
void PumpChildIo(int in_fd, const std::string& input, int out_fd, std::string& output) {
  size_t written = 0;
  if (in_fd >= 0 && input.empty()) {
    ::close(in_fd);
    in_fd = -1;
  }
  if (in_fd >= 0) {
    (void)::fcntl(in_fd, F_SETFL, ::fcntl(in_fd, F_GETFL) | O_NONBLOCK);
  }

  char buffer[4096];
  while (in_fd >= 0 || out_fd >= 0) {
    pollfd fds[2];
    nfds_t count = 0;
    int in_index = -1;
    int out_index = -1;
    if (in_fd >= 0) {
      in_index = static_cast<int>(count);
      fds[count++] = pollfd{in_fd, POLLOUT, 0};
    }
    if (out_fd >= 0) {
      out_index = static_cast<int>(count);
      fds[count++] = pollfd{out_fd, POLLIN, 0};
    }
    if (::poll(fds, count, -1) < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }

    if (in_index >= 0 && fds[in_index].revents != 0) {
      const ssize_t n = ::write(in_fd, input.data() + written, input.size() - written);
      if (n > 0) {
        written += static_cast<size_t>(n);
      }
      // EPIPE means the child stopped reading; whatever it does next is its exit status.
      if (written >= input.size() || (n < 0 && errno != EAGAIN && errno != EINTR)) {
        ::close(in_fd);
        in_fd = -1;
      }
    }

    if (out_index >= 0 && fds[out_index].revents != 0) {
      const ssize_t n = ::read(out_fd, buffer, sizeof(buffer));
      if (n > 0) {
        output.append(buffer, static_cast<size_t>(n));
      } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
        ::close(out_fd);
        out_fd = -1;
      }
    }
  }
}

class ScopedIgnoreSigpipe {
 public:
  ScopedIgnoreSigpipe() {
    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    active_ = ::sigaction(SIGPIPE, &ignore, &previous_) == 0;
  }

  ~ScopedIgnoreSigpipe() {
    if (active_) {
      (void)::sigaction(SIGPIPE, &previous_, nullptr);
    }
  }

 private:
  struct sigaction previous_ {};
  bool active_ = false;
};

bool IsExecutableFile(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

}  // namespace

namespace kubehost::runtime {

std::optional<ProcessResult> PosixProcessRunner::Run(const RunProcessRequest& request, std::string& error) {
  if (request.argv.empty()) {
    error = "process argv cannot be empty";
    return std::nullopt;
  }

  const bool feed_stdin = request.stdin_mode == StdinMode::kString;
  const bool capture =
      request.output_mode == OutputMode::kCaptureStdout || request.output_mode == OutputMode::kCaptureCombined;

  int exec_pipe[2] = {-1, -1};
  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  if (::pipe(exec_pipe) != 0 || (feed_stdin && ::pipe(in_pipe) != 0) || (capture && ::pipe(out_pipe) != 0)) {
    error = "failed to create pipes for '" + request.argv.front() + "': " + std::strerror(errno);
    ClosePipe(exec_pipe);
    ClosePipe(in_pipe);
    ClosePipe(out_pipe);
    return std::nullopt;
  }
  if (::fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC) != 0) {
    error = "failed to mark exec status pipe close-on-exec";
    ClosePipe(exec_pipe);
    ClosePipe(in_pipe);
    ClosePipe(out_pipe);
    return std::nullopt;
  }

  ScopedIgnoreSigpipe sigpipe_guard;
  const pid_t pid = ::fork();
  if (pid < 0) {
    error = "failed to fork process";
    ClosePipe(exec_pipe);
    ClosePipe(in_pipe);
    ClosePipe(out_pipe);
    return std::nullopt;
  }

  if (pid == 0) {
    ::close(exec_pipe[0]);

    if (feed_stdin) {
      ::close(in_pipe[1]);
      if (::dup2(in_pipe[0], STDIN_FILENO) < 0) {
        FailChild(exec_pipe[1]);
      }
      ::close(in_pipe[0]);
    } else if (request.stdin_mode == StdinMode::kNull) {
      if (!RedirectToFile("/dev/null", O_RDONLY, STDIN_FILENO)) {
        FailChild(exec_pipe[1]);
      }
    }

    switch (request.output_mode) {
      case OutputMode::kInherit:
        break;
      case OutputMode::kDiscard:
        if (!RedirectToFile("/dev/null", O_WRONLY, STDOUT_FILENO) ||
            !RedirectToFile("/dev/null", O_WRONLY, STDERR_FILENO)) {
          FailChild(exec_pipe[1]);
        }
        break;
      case OutputMode::kCaptureStdout:
      case OutputMode::kCaptureCombined:
        ::close(out_pipe[0]);
        if (::dup2(out_pipe[1], STDOUT_FILENO) < 0) {
          FailChild(exec_pipe[1]);
        }
        if (request.output_mode == OutputMode::kCaptureCombined && ::dup2(out_pipe[1], STDERR_FILENO) < 0) {
          FailChild(exec_pipe[1]);
        }
        ::close(out_pipe[1]);
        break;
    }

    ::signal(SIGPIPE, SIG_DFL);
    for (const auto& [key, value] : request.env) {
      if (::setenv(key.c_str(), value.c_str(), 1) != 0) {
        FailChild(exec_pipe[1]);
      }
    }
    if (!request.cwd.empty() && ::chdir(request.cwd.c_str()) != 0) {
      FailChild(exec_pipe[1]);
    }

    auto argv = ToExecArgv(request.argv);
    ::execvp(argv[0], argv.data());
    FailChild(exec_pipe[1]);
  }

  ::close(exec_pipe[1]);
  if (feed_stdin) {
    ::close(in_pipe[0]);
  }
  if (capture) {
    ::close(out_pipe[1]);
  }

  const int child_errno = ReadExecStatus(exec_pipe[0]);
  ::close(exec_pipe[0]);
  if (child_errno != 0) {
    if (feed_stdin) {
      ::close(in_pipe[1]);
    }
    if (capture) {
      ::close(out_pipe[0]);
    }
    (void)WaitForExitCode(pid);
    std::ostringstream oss;
    oss << "failed to exec '" << request.argv.front() << "': " << std::strerror(child_errno);
    error = oss.str();
    return std::nullopt;
  }

  ProcessResult result;
  PumpChildIo(feed_stdin ? in_pipe[1] : -1, request.stdin_data, capture ? out_pipe[0] : -1, result.output);
  result.exit_code = WaitForExitCode(pid);
  error.clear();
  return result;
}

std::optional<StartedProcess> PosixProcessRunner::Start(const StartProcessRequest& request, std::string& error) {
  if (request.argv.empty()) {
    error = "process argv cannot be empty";
    return std::nullopt;
  }

  if (!request.log_path.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(request.log_path.parent_path(), ec);
    if (ec) {
      error = "failed to create log directory: " + ec.message();
      return std::nullopt;
    }
  }

  int exec_pipe[2] = {-1, -1};
  if (::pipe(exec_pipe) != 0) {
    error = "failed to create exec status pipe";
    return std::nullopt;
  }
  if (::fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC) != 0) {
    error = "failed to mark exec status pipe close-on-exec";
    ClosePipe(exec_pipe);
    return std::nullopt;
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    error = "failed to fork process";
    ClosePipe(exec_pipe);
    return std::nullopt;
  }

  if (pid == 0) {
    ::close(exec_pipe[0]);
    // New session: the child keeps running after the invoking terminal goes away.
    ::setsid();

    if (!request.cwd.empty() && ::chdir(request.cwd.c_str()) != 0) {
      FailChild(exec_pipe[1]);
    }

    const char* sink_path = "/dev/null";
    std::string sink_path_storage;
    if (!request.log_path.empty()) {
      sink_path_storage = request.log_path.string();
      sink_path = sink_path_storage.c_str();
    }

    if (!RedirectToFile("/dev/null", O_RDONLY, STDIN_FILENO) ||
        !RedirectToFile(sink_path, O_CREAT | O_WRONLY | O_APPEND, STDOUT_FILENO) ||
        ::dup2(STDOUT_FILENO, STDERR_FILENO) < 0) {
      FailChild(exec_pipe[1]);
    }

    auto argv = ToExecArgv(request.argv);
    ::execvp(argv[0], argv.data());
    FailChild(exec_pipe[1]);
  }

  ::close(exec_pipe[1]);
  const int child_errno = ReadExecStatus(exec_pipe[0]);
  ::close(exec_pipe[0]);

  if (child_errno != 0) {
    std::ostringstream oss;
    oss << "failed to exec '" << request.argv.front() << "': " << std::strerror(child_errno);
    error = oss.str();
    (void)::waitpid(pid, nullptr, 0);
    return std::nullopt;
  }

  error.clear();
  return StartedProcess{static_cast<int>(pid)};
}

bool PosixProcessRunner::Stop(int pid, std::string& error) {
  if (pid <= 0) {
    std::ostringstream oss;
    oss << "invalid pid " << pid;
    error = oss.str();
    return false;
  }

  const pid_t pgid = static_cast<pid_t>(pid);
  if (::kill(-pgid, SIGTERM) != 0) {
    if (errno == ESRCH) {
      error.clear();
      return true;
    }
    std::ostringstream oss;
    oss << "failed to send SIGTERM to process group " << pgid << ": " << std::strerror(errno);
    error = oss.str();
    return false;
  }

  if (WaitForProcessGroupExit(pgid, 3000)) {
    error.clear();
    return true;
  }

  if (::kill(-pgid, SIGKILL) != 0 && errno != ESRCH) {
    std::ostringstream oss;
    oss << "failed to send SIGKILL to process group " << pgid << ": " << std::strerror(errno);
    error = oss.str();
    return false;
  }

  if (!WaitForProcessGroupExit(pgid, 1000)) {
    std::ostringstream oss;
    oss << "process group " << pgid << " did not exit after SIGKILL";
    error = oss.str();
    return false;
  }

  error.clear();
  return true;
}

bool PosixProcessRunner::IsAlive(int pid) {
  if (pid <= 0) {
    return false;
  }
  // Reap our own exited children first; a zombie still answers kill(pid, 0).
  if (::waitpid(static_cast<pid_t>(pid), nullptr, WNOHANG) == static_cast<pid_t>(pid)) {
    return false;
  }
  if (::kill(static_cast<pid_t>(pid), 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

std::optional<std::filesystem::path> PosixProcessRunner::LookPath(const std::string& name) {
  if (name.empty()) {
    return std::nullopt;
  }
  if (name.find('/') != std::string::npos) {
    if (IsExecutableFile(name)) {
      return std::filesystem::path(name);
    }
    return std::nullopt;
  }

  const char* path_env = std::getenv("PATH");
  const std::string search = (path_env != nullptr && path_env[0] != '\0') ? path_env : "/usr/local/bin:/usr/bin:/bin";
  std::stringstream entries(search);
  std::string dir;
  while (std::getline(entries, dir, ':')) {
    if (dir.empty()) {
      dir = ".";
    }
    const auto candidate = std::filesystem::path(dir) / name;
    if (IsExecutableFile(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

std::optional<ProcessResult> DryRunProcessRunner::Run(const RunProcessRequest& request, std::string& error) {
  if (request.argv.empty()) {
    error = "process argv cannot be empty";
    return std::nullopt;
  }
  std::cout << "[dry-run] " << FormatArgv(request.argv) << "\n";
  error.clear();
  return ProcessResult{};
}

std::optional<StartedProcess> DryRunProcessRunner::Start(const StartProcessRequest& request, std::string& error) {
  if (request.argv.empty()) {
    error = "process argv cannot be empty";
    return std::nullopt;
  }
  std::cout << "[dry-run] " << FormatArgv(request.argv) << " &\n";
  error.clear();
  return StartedProcess{next_pid_++};
}

bool DryRunProcessRunner::Stop(int pid, std::string& error) {
  if (pid <= 0) {
    std::ostringstream oss;
    oss << "invalid pid " << pid;
    error = oss.str();
    return false;
  }
  std::cout << "[dry-run] kill -TERM -" << pid << "\n";
  error.clear();
  return true;
}

bool DryRunProcessRunner::IsAlive(int pid) { return pid >= 12000 && pid < next_pid_; }

std::optional<std::filesystem::path> DryRunProcessRunner::LookPath(const std::string& name) {
  if (name.empty()) {
    return std::nullopt;
  }
  return std::filesystem::path(name);
}

std::string FormatArgv(const std::vector<std::string>& argv) {
  std::string result;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0) {
      result += ' ';
    }
    const auto& arg = argv[i];
    if (arg.empty() || arg.find_first_of(" \t\n") != std::string::npos) {
      result += '"' + arg + '"';
    } else {
      result += arg;
    }
  }
  return result;
}

}  // namespace kubehost::runtime
