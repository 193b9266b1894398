#pragma once

#include "acta/observability/observer.hpp"

#include <memory>
#include <string>

namespace acta::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const std::string &backend);

} // namespace acta::observability
