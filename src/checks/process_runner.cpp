#include "checks/process_runner.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace plugeval::checks {

namespace {

// Closes on scope exit unless released.
class FdGuard {
public:
  explicit FdGuard(int fd = -1) : fd_(fd) {}
  ~FdGuard() {
    Reset();
  }
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  int Get() const {
    return fd_;
  }

  void Reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

bool MakePipe(FdGuard& read_end, FdGuard& write_end, std::string& error) {
  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    error = std::string("failed to create pipe: ") + std::strerror(errno);
    return false;
  }
  read_end.Reset(fds[0]);
  write_end.Reset(fds[1]);
  return true;
}

// Child side between fork and exec. Reports failures as an errno value on
// `exec_error_fd` (close-on-exec, so a successful exec sends nothing).
[[noreturn]] void ExecChild(const ProcessRequest& request, std::vector<char*>& argv,
                            int stdout_fd, int stderr_fd, int exec_error_fd) {
  ::setpgid(0, 0);
  if (::dup2(stdout_fd, STDOUT_FILENO) < 0 || ::dup2(stderr_fd, STDERR_FILENO) < 0) {
    const int code = errno;
    (void)!::write(exec_error_fd, &code, sizeof(code));
    ::_exit(127);
  }
  const int devnull = ::open("/dev/null", O_RDONLY);
  if (devnull >= 0) {
    ::dup2(devnull, STDIN_FILENO);
    ::close(devnull);
  }

  if (!request.working_dir.empty() && ::chdir(request.working_dir.c_str()) != 0) {
    const int code = errno;
    (void)!::write(exec_error_fd, &code, sizeof(code));
    ::_exit(127);
  }
  for (const auto& [key, value] : request.env_overrides) {
    ::setenv(key.c_str(), value.c_str(), 1);
  }

  ::execvp(argv[0], argv.data());
  const int code = errno;
  (void)!::write(exec_error_fd, &code, sizeof(code));
  ::_exit(127);
}

void DrainReadable(int fd, std::string& sink, bool& open) {
  char buffer[4096];
  const ssize_t n = ::read(fd, buffer, sizeof(buffer));
  if (n > 0) {
    sink.append(buffer, static_cast<std::size_t>(n));
    return;
  }
  if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
    open = false;
  }
}

void RecordStatus(int status, ProcessResult& result) {
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
    result.exit_code = -result.term_signal;
  }
}

int WaitForChild(pid_t pid, ProcessResult& result) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  RecordStatus(status, result);
  return 0;
}

// A child may close its output streams and keep running; reap it without
// blocking past `deadline`. Returns true once reaped.
bool ReapBefore(pid_t pid, std::chrono::steady_clock::time_point deadline,
                ProcessResult& result) {
  while (std::chrono::steady_clock::now() < deadline) {
    int status = 0;
    const pid_t reaped = ::waitpid(pid, &status, WNOHANG);
    if (reaped == pid) {
      RecordStatus(status, result);
      return true;
    }
    if (reaped < 0 && errno != EINTR) {
      return false;
    }
    ::usleep(10000);
  }
  return false;
}

} // namespace

bool RunProcess(const ProcessRequest& request, ProcessResult& result, std::string& error) {
  result = ProcessResult{};
  error.clear();

  if (request.argv.empty() || request.argv.front().empty()) {
    error = "empty command";
    return false;
  }

  FdGuard out_read;
  FdGuard out_write;
  FdGuard err_read;
  FdGuard err_write;
  FdGuard exec_read;
  FdGuard exec_write;
  if (!MakePipe(out_read, out_write, error) || !MakePipe(err_read, err_write, error) ||
      !MakePipe(exec_read, exec_write, error)) {
    return false;
  }

  std::vector<char*> argv;
  argv.reserve(request.argv.size() + 1U);
  for (const auto& arg : request.argv) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    error = std::string("fork failed: ") + std::strerror(errno);
    return false;
  }
  if (pid == 0) {
    ExecChild(request, argv, out_write.Get(), err_write.Get(), exec_write.Get());
  }

  out_write.Reset();
  err_write.Reset();
  exec_write.Reset();

  // Blocks until exec succeeds (EOF) or the child reports why it could not.
  int exec_errno = 0;
  ssize_t got = 0;
  do {
    got = ::read(exec_read.Get(), &exec_errno, sizeof(exec_errno));
  } while (got < 0 && errno == EINTR);
  if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
    WaitForChild(pid, result);
    error = "failed to execute '" + request.argv.front() + "': " + std::strerror(exec_errno);
    return false;
  }

  const auto deadline = std::chrono::steady_clock::now() + request.timeout;
  bool stdout_open = true;
  bool stderr_open = true;
  while (stdout_open || stderr_open) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      result.timed_out = true;
      break;
    }

    pollfd fds[2] = {
        {stdout_open ? out_read.Get() : -1, POLLIN, 0},
        {stderr_open ? err_read.Get() : -1, POLLIN, 0},
    };
    const int ready = ::poll(fds, 2, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = std::string("poll failed: ") + std::strerror(errno);
      ::kill(-pid, SIGKILL);
      WaitForChild(pid, result);
      return false;
    }
    if (ready == 0) {
      continue;
    }
    if (stdout_open && (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
      DrainReadable(out_read.Get(), result.stdout_text, stdout_open);
    }
    if (stderr_open && (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
      DrainReadable(err_read.Get(), result.stderr_text, stderr_open);
    }
  }

  if (!result.timed_out && ReapBefore(pid, deadline, result)) {
    return true;
  }
  result.timed_out = true;
  ::kill(-pid, SIGKILL);
  if (WaitForChild(pid, result) != 0) {
    error = std::string("waitpid failed: ") + std::strerror(errno);
    return false;
  }
  return true;
}

} // namespace plugeval::checks
