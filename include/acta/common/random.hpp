#pragma once

#include <string>

namespace acta::common {

[[nodiscard]] std::string random_uuid();

} // namespace acta::common
