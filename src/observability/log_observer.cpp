#include "acta/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace acta::observability {

LogObserver::LogObserver(const bool verbose) : out_(std::cerr), verbose_(verbose) {}

LogObserver::LogObserver(std::ostream &out, const bool verbose) : out_(out), verbose_(verbose) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  if (level == "DEBUG" && !verbose_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, EntryWrittenEvent>) {
          log_line("INFO", "entry." + evt.operation + " id=" + evt.entry_id + " file=" + evt.file);
        } else if constexpr (std::is_same_v<T, SessionEvent>) {
          std::string line = "ai.session." + evt.action + " session=" + evt.session_id;
          if (!evt.detail.empty()) {
            line += " " + evt.detail;
          }
          log_line("INFO", line);
        } else if constexpr (std::is_same_v<T, AiTurnStartEvent>) {
          log_line("DEBUG", "ai.turn.start session=" + evt.session_id + " flavor=" + evt.flavor +
                                " resumed=" + (evt.resumed ? std::string("true")
                                                           : std::string("false")));
        } else if constexpr (std::is_same_v<T, AiTurnEndEvent>) {
          log_line(evt.success ? "INFO" : "WARN",
                   "ai.turn.end session=" + evt.session_id +
                       " exit_code=" + std::to_string(evt.exit_code) +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ActiveSessionsMetric>) {
          log_line("DEBUG", "metric.active_sessions=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, OutputQueueDepthMetric>) {
          log_line("DEBUG", "metric.output_queue_depth=" + std::to_string(m.depth));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace acta::observability
