#pragma once

#include "acta/common/fs.hpp"
#include "acta/entries/entry.hpp"

#include <array>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace acta::entries {

inline constexpr std::string_view kBlockOpenTag = "acta:comment";
inline constexpr std::string_view kBlockCloseTag = "/acta:comment";

inline constexpr std::string_view kHeaderId = "id";
inline constexpr std::string_view kHeaderCreated = "created";
inline constexpr std::string_view kHeaderCreatedMs = "created_ms";
inline constexpr std::string_view kHeaderTags = "tags";

inline constexpr std::array<std::string_view, 4> kHeaderKeys = {kHeaderId, kHeaderCreated,
                                                                kHeaderCreatedMs, kHeaderTags};

using HeaderField = std::pair<std::string, std::string>;

struct BlockHeader {
  std::optional<std::string> id;
  std::optional<std::string> created;
  std::optional<std::string> created_ms;
  std::optional<std::string> tags;
  std::vector<HeaderField> extra;
};

[[nodiscard]] BlockHeader parse_block_header(const std::string &header_text);

struct DecodedBlock {
  Entry entry;
  std::vector<HeaderField> extra_fields;
  bool synthesized_id = false;
  std::size_t offset = 0;
  std::size_t length = 0;
};

struct DecodedFile {
  common::LineEnding line_ending = common::LineEnding::Lf;
  std::string text;
  std::vector<DecodedBlock> blocks;

  [[nodiscard]] std::optional<std::size_t> find(const std::string &id) const;
};

/// Validation failure when the body or a tag would break the block delimiters.
[[nodiscard]] common::Status check_encodable(const Entry &entry);

[[nodiscard]] std::string encode_entry_block(const Entry &entry,
                                             const std::vector<HeaderField> &extra = {});

[[nodiscard]] DecodedFile decode_day_file(const std::string &raw_text, const std::string &date,
                                          const std::filesystem::path &source_file);

[[nodiscard]] std::string replace_block(const DecodedFile &file, std::size_t index,
                                        const Entry &updated);

[[nodiscard]] std::string remove_block(const DecodedFile &file, std::size_t index);

} // namespace acta::entries
