#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace acta::observability {

struct EntryWrittenEvent {
  std::string operation;
  std::string file;
  std::string entry_id;
};

struct SessionEvent {
  std::string session_id;
  std::string action;
  std::string detail;
};

struct AiTurnStartEvent {
  std::string session_id;
  std::string flavor;
  bool resumed = false;
};

struct AiTurnEndEvent {
  std::string session_id;
  int exit_code = 0;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<EntryWrittenEvent, SessionEvent, AiTurnStartEvent, AiTurnEndEvent, ErrorEvent>;

struct ActiveSessionsMetric {
  std::uint64_t count = 0;
};

struct OutputQueueDepthMetric {
  std::uint64_t depth = 0;
};

using ObserverMetric = std::variant<ActiveSessionsMetric, OutputQueueDepthMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace acta::observability
