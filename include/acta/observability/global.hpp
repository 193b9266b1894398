#pragma once

#include "acta/observability/observer.hpp"

#include <memory>

namespace acta::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_entry_written(const std::string &operation, const std::string &file,
                          const std::string &entry_id);
void record_session_event(const std::string &session_id, const std::string &action,
                          const std::string &detail = "");
void record_ai_turn_start(const std::string &session_id, const std::string &flavor, bool resumed);
void record_ai_turn_end(const std::string &session_id, int exit_code,
                        std::chrono::milliseconds duration, bool success);
void record_error(const std::string &component, const std::string &message);
void record_active_sessions(std::uint64_t count);

} // namespace acta::observability
