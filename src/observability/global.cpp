#include "acta/observability/global.hpp"

#include <mutex>

namespace acta::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_entry_written(const std::string &operation, const std::string &file,
                          const std::string &entry_id) {
  record_event(EntryWrittenEvent{.operation = operation, .file = file, .entry_id = entry_id});
}

void record_session_event(const std::string &session_id, const std::string &action,
                          const std::string &detail) {
  record_event(SessionEvent{.session_id = session_id, .action = action, .detail = detail});
}

void record_ai_turn_start(const std::string &session_id, const std::string &flavor,
                          const bool resumed) {
  record_event(AiTurnStartEvent{.session_id = session_id, .flavor = flavor, .resumed = resumed});
}

void record_ai_turn_end(const std::string &session_id, const int exit_code,
                        const std::chrono::milliseconds duration, const bool success) {
  record_event(AiTurnEndEvent{.session_id = session_id,
                              .exit_code = exit_code,
                              .duration = duration,
                              .success = success});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_active_sessions(const std::uint64_t count) {
  record_metric(ActiveSessionsMetric{.count = count});
}

} // namespace acta::observability
