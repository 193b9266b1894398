#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace acta::process {

inline constexpr std::size_t kMaxOutputBytes = 1024 * 1024;
inline constexpr int kSpawnFailureExitCode = -1;

struct ProcessRequest {
  std::string executable;
  std::vector<std::string> args;
  std::filesystem::path working_dir;
  std::string input;
};

struct ProcessResult {
  /// `128 + signal` for a signal exit, kSpawnFailureExitCode when the process never ran.
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  std::optional<std::string> error;

  [[nodiscard]] bool spawned() const { return !error.has_value(); }
};

using OutputCallback = std::function<void(std::string_view chunk)>;

class ProcessHandle {
public:
  void terminate();
  void kill();
  [[nodiscard]] bool running() const;
  [[nodiscard]] bool signalled() const { return signalled_.load(); }

private:
  friend ProcessResult run_process(const ProcessRequest &, const OutputCallback &,
                                   ProcessHandle *);

  void attach(pid_t pid);
  void detach();
  void send(int signal_number);

  mutable std::mutex mutex_;
  pid_t pid_ = 0;
  int pending_signal_ = 0;
  bool done_ = false;
  std::atomic<bool> signalled_{false};
};

[[nodiscard]] ProcessResult run_process(const ProcessRequest &request,
                                        const OutputCallback &on_stdout = {},
                                        ProcessHandle *handle = nullptr);

} // namespace acta::process
