#include "acta/common/time.hpp"

#include "acta/common/fs.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace acta::common {

namespace {

bool all_digits(const std::string &value, const std::size_t pos, const std::size_t count) {
  if (pos + count > value.size()) {
    return false;
  }
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (std::isdigit(static_cast<unsigned char>(value[i])) == 0) {
      return false;
    }
  }
  return true;
}

int to_int(const std::string &value, const std::size_t pos, const std::size_t count) {
  return std::stoi(value.substr(pos, count));
}

} // namespace

Clock system_clock() {
  return [] { return std::chrono::system_clock::now(); };
}

std::tm to_local_tm(const TimePoint when) {
  const auto t = std::chrono::system_clock::to_time_t(when);
  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  return tm;
}

std::string format_date(const TimePoint when) {
  const std::tm tm = to_local_tm(when);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d");
  return out.str();
}

std::string format_date_time(const TimePoint when) {
  const std::tm tm = to_local_tm(when);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d %H:%M");
  return out.str();
}

std::int64_t to_epoch_ms(const TimePoint when) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count();
}

std::optional<TimePoint> local_time(const int year, const int month, const int day,
                                    const int hour, const int minute) {
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour < 0 || hour > 23 || minute < 0 ||
      minute > 59) {
    return std::nullopt;
  }
  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_isdst = -1;
  const std::time_t t = std::mktime(&tm);
  if (t == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(t);
}

bool is_iso_date(const std::string &value) {
  return value.size() == 10 && all_digits(value, 0, 4) && value[4] == '-' &&
         all_digits(value, 5, 2) && value[7] == '-' && all_digits(value, 8, 2);
}

std::int64_t parse_created_ms(const std::string &created) {
  const std::string value = trim(created);
  if (value.size() < 10 || !is_iso_date(value.substr(0, 10))) {
    return 0;
  }

  const int year = to_int(value, 0, 4);
  const int month = to_int(value, 5, 2);
  const int day = to_int(value, 8, 2);

  std::optional<TimePoint> when;
  if (value.size() == 10) {
    when = local_time(year, month, day);
  } else if (value.size() == 16 && value[10] == ' ' && all_digits(value, 11, 2) &&
             value[13] == ':' && all_digits(value, 14, 2)) {
    when = local_time(year, month, day, to_int(value, 11, 2), to_int(value, 14, 2));
  }
  return when.has_value() ? to_epoch_ms(*when) : 0;
}

} // namespace acta::common
