#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace acta::entries {

struct Entry {
  std::string id;
  std::string date;
  std::string created;
  std::int64_t created_at_ms = 0;
  std::vector<std::string> tags;
  std::string body;
  std::filesystem::path source_file;
};

[[nodiscard]] std::string normalize_tag(const std::string &raw);

/// Splits on `,` and `、`, normalizes, drops empties and later duplicates.
[[nodiscard]] std::vector<std::string> normalize_tags(const std::vector<std::string> &raw);

[[nodiscard]] std::vector<std::string> parse_tag_line(const std::string &line);

[[nodiscard]] std::string join_tags(const std::vector<std::string> &tags);

} // namespace acta::entries
