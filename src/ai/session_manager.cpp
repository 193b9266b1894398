#include "acta/ai/session_manager.hpp"

#include "acta/ai/thread_events.hpp"
#include "acta/common/fs.hpp"
#include "acta/common/random.hpp"
#include "acta/observability/global.hpp"

#include <algorithm>
#include <system_error>

namespace acta::ai {

namespace {

constexpr const char *kComponent = "ai";
constexpr auto kShutdownPollInterval = std::chrono::milliseconds(50);

common::Status missing_session(const std::string &session_id) {
  return common::Status::error("unknown AI session: " + session_id,
                               common::ErrorCode::SessionNotFound);
}

std::string join_chunks(const std::deque<std::string> &chunks) {
  std::string out;
  for (const auto &chunk : chunks) {
    if (!out.empty()) {
      out += "\n\n";
    }
    out += chunk;
  }
  return out;
}

} // namespace

SessionManager::SessionManager(SessionManagerOptions options) : options_(std::move(options)) {}

SessionManager::~SessionManager() { shutdown(); }

common::Result<std::string> SessionManager::start(const std::string &cli_path) {
  const std::string path = common::trim(cli_path);
  if (path.empty()) {
    return common::Result<std::string>::failure("AI CLI path is empty",
                                                common::ErrorCode::Validation);
  }

  Session session;
  session.id = common::random_uuid();
  session.cli_path = path;
  session.flavor = detect_cli_flavor(path);
  const std::string id = session.id;
  const std::string flavor(cli_flavor_name(session.flavor));

  std::size_t active = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
      return common::Result<std::string>::failure("AI session manager is shut down",
                                                  common::ErrorCode::Internal);
    }
    reap_finished_workers_locked();
    sessions_.emplace(id, std::move(session));
    active = sessions_.size();
  }

  observability::record_session_event(id, "start", "flavor=" + flavor + " cli=" + path);
  observability::record_active_sessions(active);
  return common::Result<std::string>::success(id);
}

common::Result<SendResult> SessionManager::send(const std::string &session_id,
                                                const std::string &input) {
  std::unique_lock<std::mutex> lock(mutex_);
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return common::Result<SendResult>::failure(missing_session(session_id));
  }
  Session &session = it->second;
  if (!session.alive) {
    return common::Result<SendResult>::failure("AI session has ended: " + session_id,
                                               common::ErrorCode::SessionEnded);
  }
  if (session.busy) {
    return common::Result<SendResult>::failure("AI session is busy: " + session_id,
                                               common::ErrorCode::SessionBusy);
  }

  if (session.needs_bootstrap) {
    session.system_instruction = input;
    session.needs_bootstrap = false;
    lock.unlock();
    observability::record_session_event(session_id, "bootstrap");
    return common::Result<SendResult>::success(SendResult{.accepted = true, .turn_started = false});
  }

  reap_finished_workers_locked();

  TurnRequest request;
  request.session_id = session_id;
  request.seq = ++session.turn_seq;
  request.cli_path = session.cli_path;
  request.flavor = session.flavor;
  request.input = input;
  request.resume_token = session.resume_token;
  request.prompt = session.resume_token.has_value()
                       ? input
                       : build_prompt(session.system_instruction, session.history,
                                      options_.history_turns, input);

  Worker worker;
  worker.session_id = session_id;
  worker.handle = std::make_shared<process::ProcessHandle>();
  worker.finished = std::make_shared<std::atomic<bool>>(false);
  try {
    worker.thread = std::thread([this, request, handle = worker.handle,
                                 finished = worker.finished]() {
      run_turn(request, *handle);
      finished->store(true);
    });
  } catch (const std::system_error &e) {
    lock.unlock();
    observability::record_error(kComponent, std::string("cannot start turn worker: ") + e.what());
    return common::Result<SendResult>::failure(
        std::string("cannot start turn worker: ") + e.what(), common::ErrorCode::Internal);
  }
  session.busy = true;
  workers_.push_back(std::move(worker));
  return common::Result<SendResult>::success(SendResult{.accepted = true, .turn_started = true});
}

std::filesystem::path SessionManager::scratch_file_for(const TurnRequest &request) const {
  std::filesystem::path dir = options_.scratch_dir;
  if (dir.empty()) {
    std::error_code ec;
    dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
      dir = "/tmp";
    }
  }
  return dir / ("acta-ai-" + request.session_id + "-" + std::to_string(request.seq) + ".txt");
}

void SessionManager::run_turn(const TurnRequest &request, process::ProcessHandle &handle) {
  const auto scratch = scratch_file_for(request);
  const Invocation invocation = build_invocation(request.flavor, request.resume_token, scratch);
  observability::record_ai_turn_start(request.session_id,
                                      std::string(cli_flavor_name(request.flavor)),
                                      invocation.resumed);

  LineScanner scanner;
  std::optional<std::string> thread_id;
  const LineScanner::LineFn on_line = [&thread_id](const std::string &line) {
    if (auto candidate = parse_thread_started(line); candidate.has_value()) {
      thread_id = std::move(candidate);
    }
  };

  process::ProcessRequest process_request;
  process_request.executable = request.cli_path;
  process_request.args = invocation.args;
  process_request.working_dir = options_.working_dir;
  process_request.input = request.prompt;

  const auto started = std::chrono::steady_clock::now();
  const auto result = process::run_process(
      process_request, [&](const std::string_view chunk) { scanner.feed(chunk, on_line); },
      &handle);
  scanner.finish(on_line);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  TurnOutcome outcome;
  outcome.input = request.input;
  outcome.exit_code = result.exit_code;
  outcome.stdout_text = result.stdout_text;
  outcome.stderr_text = result.stderr_text;
  outcome.thread_id = std::move(thread_id);
  outcome.error = result.error;

  if (invocation.answer_file.has_value()) {
    if (result.spawned()) {
      if (auto text = common::read_text_file(*invocation.answer_file); text.ok()) {
        outcome.answer = common::trim(text.value());
      }
    }
    std::error_code ec;
    std::filesystem::remove(*invocation.answer_file, ec);
  } else {
    outcome.answer = common::trim(result.stdout_text);
  }

  if (outcome.error.has_value()) {
    observability::record_error(kComponent, *outcome.error);
  }
  if (handle.signalled()) {
    observability::record_session_event(request.session_id, "turn.cancelled",
                                        "exit_code=" + std::to_string(outcome.exit_code));
  }
  observability::record_ai_turn_end(request.session_id, outcome.exit_code, elapsed,
                                    turn_succeeded(outcome));
  finish_turn(request, outcome);
}

void SessionManager::finish_turn(const TurnRequest &request, const TurnOutcome &outcome) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(request.session_id);
    if (it != sessions_.end() && it->second.alive && it->second.turn_seq == request.seq) {
      Session &session = it->second;
      apply_turn_outcome(session, outcome);
      if (session.history.size() > options_.history_turns) {
        session.history.erase(session.history.begin(),
                              session.history.end() -
                                  static_cast<std::ptrdiff_t>(options_.history_turns));
      }
      return;
    }
  }
  observability::record_session_event(request.session_id, "turn.discarded",
                                      "seq=" + std::to_string(request.seq));
}

common::Result<OutputSnapshot> SessionManager::read_output(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return common::Result<OutputSnapshot>::failure(missing_session(session_id));
  }
  Session &session = it->second;
  observability::record_metric(
      observability::OutputQueueDepthMetric{.depth = session.output_queue.size()});

  OutputSnapshot snapshot;
  snapshot.chunk = join_chunks(session.output_queue);
  session.output_queue.clear();
  snapshot.alive = session.alive;
  snapshot.busy = session.busy;
  snapshot.exit_code = session.last_exit_code;
  snapshot.error = session.last_error;
  return common::Result<OutputSnapshot>::success(std::move(snapshot));
}

common::Result<bool> SessionManager::stop(const std::string &session_id) {
  std::size_t active = 0;
  bool terminated = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return common::Result<bool>::failure(missing_session(session_id));
    }
    it->second.alive = false;
    it->second.busy = false;
    for (const auto &worker : workers_) {
      if (worker.session_id == session_id && !worker.finished->load()) {
        worker.handle->terminate();
        terminated = true;
      }
    }
    sessions_.erase(it);
    active = sessions_.size();
  }

  observability::record_session_event(session_id, "stop",
                                      terminated ? "terminated running turn" : "");
  observability::record_active_sessions(active);
  return common::Result<bool>::success(true);
}

void SessionManager::shutdown() {
  std::vector<Worker> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_ && workers_.empty()) {
      return;
    }
    shut_down_ = true;
    for (const auto &worker : workers_) {
      if (!worker.finished->load()) {
        worker.handle->terminate();
      }
    }
    sessions_.clear();
    workers.swap(workers_);
  }

  const auto deadline = std::chrono::steady_clock::now() + options_.shutdown_grace;
  for (auto &worker : workers) {
    while (!worker.finished->load() && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(kShutdownPollInterval);
    }
    if (!worker.finished->load()) {
      worker.handle->kill();
    }
  }
  for (auto &worker : workers) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
  observability::record_active_sessions(0);
}

std::vector<std::string> SessionManager::list_sessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(sessions_.size());
  for (const auto &[id, session] : sessions_) {
    if (session.alive) {
      ids.push_back(id);
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

void SessionManager::reap_finished_workers_locked() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->finished->load()) {
      if (it->thread.joinable()) {
        it->thread.join();
      }
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace acta::ai
