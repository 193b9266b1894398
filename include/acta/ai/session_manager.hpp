#pragma once

#include "acta/ai/session.hpp"
#include "acta/common/result.hpp"
#include "acta/process/runner.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace acta::ai {

struct SessionManagerOptions {
  std::size_t history_turns = kDefaultHistoryTurns;
  std::filesystem::path working_dir;
  std::filesystem::path scratch_dir;
  std::chrono::milliseconds shutdown_grace{1000};
};

struct SendResult {
  bool accepted = true;
  bool turn_started = false;
};

struct OutputSnapshot {
  std::string chunk;
  bool alive = true;
  bool busy = false;
  std::optional<int> exit_code;
  std::optional<std::string> error;
};

class SessionManager {
public:
  explicit SessionManager(SessionManagerOptions options = {});
  ~SessionManager();

  SessionManager(const SessionManager &) = delete;
  SessionManager &operator=(const SessionManager &) = delete;

  [[nodiscard]] common::Result<std::string> start(const std::string &cli_path);
  [[nodiscard]] common::Result<SendResult> send(const std::string &session_id,
                                                const std::string &input);
  [[nodiscard]] common::Result<OutputSnapshot> read_output(const std::string &session_id);
  /// SIGTERM only; shutdown() is what escalates to SIGKILL.
  [[nodiscard]] common::Result<bool> stop(const std::string &session_id);
  void shutdown();

  [[nodiscard]] std::vector<std::string> list_sessions() const;

private:
  struct TurnRequest {
    std::string session_id;
    std::uint64_t seq = 0;
    std::string cli_path;
    CliFlavor flavor = CliFlavor::StructuredSession;
    std::string input;
    std::string prompt;
    std::optional<std::string> resume_token;
  };

  struct Worker {
    std::string session_id;
    std::shared_ptr<process::ProcessHandle> handle;
    std::shared_ptr<std::atomic<bool>> finished;
    std::thread thread;
  };

  void run_turn(const TurnRequest &request, process::ProcessHandle &handle);
  void finish_turn(const TurnRequest &request, const TurnOutcome &outcome);
  void reap_finished_workers_locked();
  [[nodiscard]] std::filesystem::path scratch_file_for(const TurnRequest &request) const;

  SessionManagerOptions options_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Session> sessions_;
  std::vector<Worker> workers_;
  bool shut_down_ = false;
};

} // namespace acta::ai
