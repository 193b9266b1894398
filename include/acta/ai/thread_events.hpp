#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace acta::ai {

inline constexpr std::string_view kThreadStartedType = "thread.started";

class LineScanner {
public:
  using LineFn = std::function<void(const std::string &line)>;

  void feed(std::string_view chunk, const LineFn &on_line);
  void finish(const LineFn &on_line);

private:
  std::string pending_;
};

[[nodiscard]] std::optional<std::string> parse_thread_started(const std::string &line);

} // namespace acta::ai
