#include "acta/ai/thread_events.hpp"

#include "acta/common/fs.hpp"
#include "acta/common/json_util.hpp"

namespace acta::ai {

void LineScanner::feed(const std::string_view chunk, const LineFn &on_line) {
  pending_.append(chunk.data(), chunk.size());
  std::size_t start = 0;
  while (true) {
    const std::size_t newline = pending_.find('\n', start);
    if (newline == std::string::npos) {
      break;
    }
    std::string line = pending_.substr(start, newline - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    on_line(line);
    start = newline + 1;
  }
  pending_.erase(0, start);
}

void LineScanner::finish(const LineFn &on_line) {
  if (!pending_.empty()) {
    std::string line = std::move(pending_);
    pending_.clear();
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    on_line(line);
  }
}

std::optional<std::string> parse_thread_started(const std::string &line) {
  const std::string trimmed = common::trim(line);
  if (trimmed.empty() || trimmed.front() != '{') {
    return std::nullopt;
  }
  if (common::json_get_string(trimmed, "type") != kThreadStartedType) {
    return std::nullopt;
  }
  std::string thread_id = common::json_get_string(trimmed, "thread_id");
  if (thread_id.empty()) {
    return std::nullopt;
  }
  return thread_id;
}

} // namespace acta::ai
