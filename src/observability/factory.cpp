#include "acta/observability/factory.hpp"

#include "acta/common/fs.hpp"
#include "acta/observability/log_observer.hpp"
#include "acta/observability/noop_observer.hpp"

namespace acta::observability {

std::unique_ptr<IObserver> create_observer(const std::string &backend) {
  const std::string normalized = common::to_lower(common::trim(backend));
  if (normalized == "none" || normalized == "noop") {
    return std::make_unique<NoopObserver>();
  }
  if (normalized == "debug") {
    return std::make_unique<LogObserver>(true);
  }
  return std::make_unique<LogObserver>();
}

} // namespace acta::observability
