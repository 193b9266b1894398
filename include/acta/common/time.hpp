#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <optional>
#include <string>

namespace acta::common {

using TimePoint = std::chrono::system_clock::time_point;
using Clock = std::function<TimePoint()>;

[[nodiscard]] Clock system_clock();

[[nodiscard]] std::tm to_local_tm(TimePoint when);
[[nodiscard]] std::string format_date(TimePoint when);
[[nodiscard]] std::string format_date_time(TimePoint when);
[[nodiscard]] std::int64_t to_epoch_ms(TimePoint when);

[[nodiscard]] std::optional<TimePoint> local_time(int year, int month, int day, int hour = 0,
                                                  int minute = 0);

[[nodiscard]] std::int64_t parse_created_ms(const std::string &created);

[[nodiscard]] bool is_iso_date(const std::string &value);

} // namespace acta::common
