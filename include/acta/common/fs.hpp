#pragma once

#include "acta/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace acta::common {

enum class LineEnding { Lf, Crlf };

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] std::string trim_end(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split_lines(const std::string &text);

[[nodiscard]] std::string normalize_newlines(const std::string &text);
[[nodiscard]] LineEnding detect_line_ending(const std::string &text);
[[nodiscard]] std::string apply_line_ending(const std::string &lf_text, LineEnding ending);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);
[[nodiscard]] Status write_text_file_atomic(const std::filesystem::path &path,
                                            const std::string &content);
[[nodiscard]] Status append_text_file(const std::filesystem::path &path,
                                      const std::string &content);

} // namespace acta::common
