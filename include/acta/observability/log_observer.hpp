#pragma once

#include "acta/observability/observer.hpp"

#include <iosfwd>
#include <mutex>

namespace acta::observability {

class LogObserver final : public IObserver {
public:
  explicit LogObserver(bool verbose = false);
  LogObserver(std::ostream &out, bool verbose);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(std::string_view level, const std::string &message);

  std::ostream &out_;
  bool verbose_;
  std::mutex mutex_;
};

} // namespace acta::observability
