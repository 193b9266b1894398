#include "acta/process/runner.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace acta::process {

namespace {

constexpr int kPollIntervalMs = 50;

// Writing to a child that already exited must not kill the parent.
void ignore_sigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { (void)std::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void set_close_on_exec(const int fd) {
  const int flags = fcntl(fd, F_GETFD, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
  }
}

struct Pipe {
  int read_end = -1;
  int write_end = -1;

  bool open() {
    int fds[2] = {-1, -1};
    if (pipe(fds) != 0) {
      return false;
    }
    read_end = fds[0];
    write_end = fds[1];
    return true;
  }

  void close_both() {
    close_fd(read_end);
    close_fd(write_end);
  }
};

void append_capped(std::string &out, bool &truncated, const char *data, const std::size_t size) {
  const std::size_t remaining = kMaxOutputBytes > out.size() ? kMaxOutputBytes - out.size() : 0;
  const std::size_t to_copy = std::min(remaining, size);
  out.append(data, to_copy);
  if (to_copy < size) {
    truncated = true;
  }
}

// Reads everything currently available; closes the fd at EOF.
void drain(int &fd, std::string &out, bool &truncated, const OutputCallback *callback) {
  std::array<char, 4096> buffer{};
  while (fd >= 0) {
    const ssize_t bytes = read(fd, buffer.data(), buffer.size());
    if (bytes > 0) {
      append_capped(out, truncated, buffer.data(), static_cast<std::size_t>(bytes));
      if (callback != nullptr && *callback) {
        (*callback)(std::string_view(buffer.data(), static_cast<std::size_t>(bytes)));
      }
      continue;
    }
    if (bytes < 0 && errno == EINTR) {
      continue;
    }
    if (bytes == 0 || (errno != EAGAIN && errno != EWOULDBLOCK)) {
      close_fd(fd);
    }
    return;
  }
}

// Pushes as much pending input as the pipe accepts; closes stdin once done or broken.
void feed(int &fd, const std::string &input, std::size_t &written) {
  while (fd >= 0 && written < input.size()) {
    const ssize_t bytes = write(fd, input.data() + written, input.size() - written);
    if (bytes > 0) {
      written += static_cast<std::size_t>(bytes);
      continue;
    }
    if (bytes < 0 && errno == EINTR) {
      continue;
    }
    if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return;
    }
    close_fd(fd);
    return;
  }
  close_fd(fd);
}

// True once the child has exited, without reaping it.
bool has_exited(const pid_t pid) {
  siginfo_t info{};
  info.si_pid = 0;
  if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
    return errno == ECHILD;
  }
  return info.si_pid == pid;
}

int decode_wait_status(const int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return kSpawnFailureExitCode;
}

ProcessResult spawn_failure(const std::string &message) {
  ProcessResult result;
  result.exit_code = kSpawnFailureExitCode;
  result.error = message;
  return result;
}

[[noreturn]] void child_fail(const int error_fd) {
  const int code = errno;
  (void)!write(error_fd, &code, sizeof(code));
  _exit(127);
}

} // namespace

void ProcessHandle::attach(const pid_t pid) {
  std::lock_guard<std::mutex> lock(mutex_);
  pid_ = pid;
  if (pending_signal_ != 0) {
    (void)::kill(pid_, pending_signal_);
    pending_signal_ = 0;
  }
}

void ProcessHandle::detach() {
  std::lock_guard<std::mutex> lock(mutex_);
  pid_ = 0;
  done_ = true;
}

void ProcessHandle::send(const int signal_number) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (done_) {
    return;
  }
  signalled_ = true;
  if (pid_ <= 0) {
    pending_signal_ = signal_number;
    return;
  }
  (void)::kill(pid_, signal_number);
}

void ProcessHandle::terminate() { send(SIGTERM); }

void ProcessHandle::kill() { send(SIGKILL); }

bool ProcessHandle::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pid_ > 0;
}

ProcessResult run_process(const ProcessRequest &request, const OutputCallback &on_stdout,
                          ProcessHandle *handle) {
  if (request.executable.empty()) {
    if (handle != nullptr) {
      handle->detach();
    }
    return spawn_failure("no executable given");
  }
  ignore_sigpipe();

  Pipe in;
  Pipe out;
  Pipe err;
  Pipe exec_status;
  if (!in.open() || !out.open() || !err.open() || !exec_status.open()) {
    const std::string reason = std::strerror(errno);
    in.close_both();
    out.close_both();
    err.close_both();
    exec_status.close_both();
    if (handle != nullptr) {
      handle->detach();
    }
    return spawn_failure("failed to create pipes: " + reason);
  }
  set_close_on_exec(exec_status.write_end);

  std::vector<char *> argv;
  argv.reserve(request.args.size() + 2);
  argv.push_back(const_cast<char *>(request.executable.c_str()));
  for (const auto &arg : request.args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);
  const std::string working_dir = request.working_dir.string();

  const pid_t pid = fork();
  if (pid < 0) {
    const std::string reason = std::strerror(errno);
    in.close_both();
    out.close_both();
    err.close_both();
    exec_status.close_both();
    if (handle != nullptr) {
      handle->detach();
    }
    return spawn_failure("failed to fork: " + reason);
  }

  if (pid == 0) {
    (void)std::signal(SIGPIPE, SIG_DFL);
    (void)dup2(in.read_end, STDIN_FILENO);
    (void)dup2(out.write_end, STDOUT_FILENO);
    (void)dup2(err.write_end, STDERR_FILENO);
    close(in.read_end);
    close(in.write_end);
    close(out.read_end);
    close(out.write_end);
    close(err.read_end);
    close(err.write_end);
    close(exec_status.read_end);

    if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
      child_fail(exec_status.write_end);
    }
    execvp(request.executable.c_str(), argv.data());
    child_fail(exec_status.write_end);
  }

  if (handle != nullptr) {
    handle->attach(pid);
  }
  close_fd(in.read_end);
  close_fd(out.write_end);
  close_fd(err.write_end);
  close_fd(exec_status.write_end);

  int exec_errno = 0;
  ssize_t status_bytes = 0;
  do {
    status_bytes = read(exec_status.read_end, &exec_errno, sizeof(exec_errno));
  } while (status_bytes < 0 && errno == EINTR);
  close_fd(exec_status.read_end);

  if (status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    (void)waitpid(pid, &status, 0);
    if (handle != nullptr) {
      handle->detach();
    }
    in.close_both();
    out.close_both();
    err.close_both();
    return spawn_failure("cannot run " + request.executable + ": " + std::strerror(exec_errno));
  }

  set_non_blocking(in.write_end);
  set_non_blocking(out.read_end);
  set_non_blocking(err.read_end);

  ProcessResult result;
  std::size_t written = 0;
  bool exited = false;
  while (!exited) {
    feed(in.write_end, request.input, written);
    drain(out.read_end, result.stdout_text, result.stdout_truncated, &on_stdout);
    drain(err.read_end, result.stderr_text, result.stderr_truncated, nullptr);

    if (has_exited(pid)) {
      // Pipes held open by grandchildren must not keep the run alive.
      drain(out.read_end, result.stdout_text, result.stdout_truncated, &on_stdout);
      drain(err.read_end, result.stderr_text, result.stderr_truncated, nullptr);
      exited = true;
      continue;
    }

    std::array<pollfd, 3> fds{};
    nfds_t count = 0;
    if (out.read_end >= 0) {
      fds[count++] = {.fd = out.read_end, .events = POLLIN, .revents = 0};
    }
    if (err.read_end >= 0) {
      fds[count++] = {.fd = err.read_end, .events = POLLIN, .revents = 0};
    }
    if (in.write_end >= 0) {
      fds[count++] = {.fd = in.write_end, .events = POLLOUT, .revents = 0};
    }
    (void)poll(fds.data(), count, kPollIntervalMs);
  }

  in.close_both();
  out.close_both();
  err.close_both();

  if (handle != nullptr) {
    handle->detach();
  }
  int status = 0;
  pid_t waited = 0;
  do {
    waited = waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);
  result.exit_code = waited == pid ? decode_wait_status(status) : kSpawnFailureExitCode;
  return result;
}

} // namespace acta::process
