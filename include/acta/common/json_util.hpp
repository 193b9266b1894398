#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace acta::common {

[[nodiscard]] std::string json_escape(const std::string &value);

[[nodiscard]] std::string json_quote(const std::string &value);

[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

using JsonRawMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] std::optional<JsonRawMap> json_object_fields(const std::string &json);

[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);
[[nodiscard]] std::optional<std::int64_t> json_get_int(const std::string &json,
                                                       const std::string &field);
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &json,
                                                              const std::string &field);

[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

} // namespace acta::common
