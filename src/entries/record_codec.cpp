#include "acta/entries/record_codec.hpp"

#include "acta/common/time.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>

namespace acta::entries {

namespace {

constexpr std::string_view kCommentOpen = "<!--";
constexpr std::string_view kCommentClose = "-->";

bool is_key_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

bool is_blank(const char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

std::size_t skip_blanks(const std::string &text, std::size_t pos) {
  while (pos < text.size() && is_blank(text[pos])) {
    ++pos;
  }
  return pos;
}

bool matches_at(const std::string &text, const std::size_t pos, const std::string_view token) {
  return pos <= text.size() && text.compare(pos, token.size(), token) == 0;
}

// `<!--` ws `/acta:comment` ws `-->` starting at pos; returns one past the closing `-->`.
std::optional<std::size_t> match_close_marker(const std::string &text, std::size_t pos) {
  if (!matches_at(text, pos, kCommentOpen)) {
    return std::nullopt;
  }
  pos = skip_blanks(text, pos + kCommentOpen.size());
  if (!matches_at(text, pos, kBlockCloseTag)) {
    return std::nullopt;
  }
  pos = skip_blanks(text, pos + kBlockCloseTag.size());
  if (!matches_at(text, pos, kCommentClose)) {
    return std::nullopt;
  }
  return pos + kCommentClose.size();
}

// Position just after the `acta:comment` line break, when `<!--` at pos opens a block.
std::optional<std::size_t> match_open_marker(const std::string &text, std::size_t pos) {
  pos = skip_blanks(text, pos + kCommentOpen.size());
  if (!matches_at(text, pos, kBlockOpenTag)) {
    return std::nullopt;
  }
  pos += kBlockOpenTag.size();
  while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) {
    ++pos;
  }
  if (pos >= text.size() || text[pos] != '\n') {
    return std::nullopt;
  }
  return pos + 1;
}

std::optional<std::int64_t> parse_positive_int(const std::string &value) {
  const std::string trimmed = common::trim(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  const long long parsed = std::strtoll(trimmed.c_str(), &end, 10);
  if (end == nullptr || *end != '\0' || parsed == 0) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(parsed);
}

Entry entry_from_header(const BlockHeader &header, const std::string &body,
                        const std::string &date, const std::filesystem::path &source_file) {
  Entry entry;
  entry.id = header.id.value_or("");
  entry.date = date;
  entry.created = header.created.has_value() && !header.created->empty() ? *header.created : date;
  if (auto ms = header.created_ms.has_value() ? parse_positive_int(*header.created_ms)
                                              : std::nullopt;
      ms.has_value()) {
    entry.created_at_ms = *ms;
  } else {
    entry.created_at_ms = common::parse_created_ms(entry.created);
  }
  entry.tags = parse_tag_line(header.tags.value_or(""));
  entry.body = body;
  entry.source_file = source_file;
  return entry;
}

std::string finish(const DecodedFile &file, std::string normalized) {
  return common::apply_line_ending(normalized, file.line_ending);
}

} // namespace

BlockHeader parse_block_header(const std::string &header_text) {
  BlockHeader header;
  for (const auto &raw_line : common::split_lines(header_text)) {
    std::size_t pos = skip_blanks(raw_line, 0);
    const std::size_t key_start = pos;
    while (pos < raw_line.size() && is_key_char(raw_line[pos])) {
      ++pos;
    }
    if (pos == key_start) {
      continue;
    }
    std::string key = raw_line.substr(key_start, pos - key_start);
    pos = skip_blanks(raw_line, pos);
    if (pos >= raw_line.size() || raw_line[pos] != ':') {
      continue;
    }
    std::string value = common::trim(raw_line.substr(pos + 1));

    if (key == kHeaderId) {
      header.id = std::move(value);
    } else if (key == kHeaderCreated) {
      header.created = std::move(value);
    } else if (key == kHeaderCreatedMs) {
      header.created_ms = std::move(value);
    } else if (key == kHeaderTags) {
      header.tags = std::move(value);
    } else {
      header.extra.emplace_back(std::move(key), std::move(value));
    }
  }
  return header;
}

std::optional<std::size_t> DecodedFile::find(const std::string &id) const {
  for (std::size_t i = 0; i < blocks.size(); ++i) {
    if (blocks[i].entry.id == id) {
      return i;
    }
  }
  return std::nullopt;
}

common::Status check_encodable(const Entry &entry) {
  const std::string body = common::normalize_newlines(entry.body);
  for (std::size_t line = 0; line < body.size();) {
    std::size_t pos = line;
    while (pos < body.size() && (body[pos] == ' ' || body[pos] == '\t')) {
      ++pos;
    }
    if (match_close_marker(body, pos).has_value()) {
      return common::Status::error("entry body contains a line that ends an entry block",
                                   common::ErrorCode::Validation);
    }
    const std::size_t next = body.find('\n', line);
    if (next == std::string::npos) {
      break;
    }
    line = next + 1;
  }
  for (const auto &tag : entry.tags) {
    if (tag.find(kCommentClose) != std::string::npos) {
      return common::Status::error("tag contains \"-->\": " + tag, common::ErrorCode::Validation);
    }
  }
  return common::Status::success();
}

std::string encode_entry_block(const Entry &entry, const std::vector<HeaderField> &extra) {
  std::ostringstream out;
  out << kCommentOpen << " " << kBlockOpenTag << "\n";
  out << kHeaderId << ": " << entry.id << "\n";
  out << kHeaderCreated << ": " << entry.created << "\n";
  out << kHeaderCreatedMs << ": " << entry.created_at_ms << "\n";
  out << kHeaderTags << ": " << join_tags(entry.tags) << "\n";
  for (const auto &[key, value] : extra) {
    out << key << ": " << value << "\n";
  }
  out << kCommentClose << "\n";
  out << common::trim_end(common::normalize_newlines(entry.body)) << "\n";
  out << kCommentOpen << " " << kBlockCloseTag << " " << kCommentClose << "\n\n";
  return out.str();
}

DecodedFile decode_day_file(const std::string &raw_text, const std::string &date,
                            const std::filesystem::path &source_file) {
  DecodedFile file;
  file.line_ending = common::detect_line_ending(raw_text);
  file.text = common::normalize_newlines(raw_text);
  const std::string &text = file.text;
  const std::string basename = source_file.filename().string();

  std::size_t pos = 0;
  while (true) {
    const std::size_t start = text.find(kCommentOpen, pos);
    if (start == std::string::npos) {
      break;
    }

    const auto header_start = match_open_marker(text, start);
    if (!header_start.has_value()) {
      pos = start + kCommentOpen.size();
      continue;
    }
    const std::size_t header_end = text.find("-->\n", *header_start);
    if (header_end == std::string::npos) {
      break;
    }
    const std::size_t body_start = header_end + kCommentClose.size() + 1;

    std::optional<std::size_t> body_end;
    std::optional<std::size_t> block_end;
    for (std::size_t candidate = text.find("\n<!--", body_start); candidate != std::string::npos;
         candidate = text.find("\n<!--", candidate + 1)) {
      if (auto close = match_close_marker(text, candidate + 1); close.has_value()) {
        body_end = candidate;
        block_end = close;
        break;
      }
    }
    if (!block_end.has_value()) {
      pos = start + kCommentOpen.size();
      continue;
    }

    const BlockHeader header =
        parse_block_header(text.substr(*header_start, header_end - *header_start));
    const std::string body = common::trim_end(text.substr(body_start, *body_end - body_start));

    DecodedBlock block;
    block.entry = entry_from_header(header, body, date, source_file);
    if (block.entry.id.empty()) {
      block.entry.id = basename + ":" + std::to_string(start);
      block.synthesized_id = true;
    }
    block.extra_fields = header.extra;
    block.offset = start;

    std::size_t span_end = *block_end;
    for (int i = 0; i < 2 && span_end < text.size() && text[span_end] == '\n'; ++i) {
      ++span_end;
    }
    block.length = span_end - start;

    file.blocks.push_back(std::move(block));
    pos = *block_end;
  }

  return file;
}

std::string replace_block(const DecodedFile &file, const std::size_t index, const Entry &updated) {
  const DecodedBlock &block = file.blocks.at(index);
  std::string out = file.text.substr(0, block.offset);
  out += encode_entry_block(updated, block.extra_fields);
  out += file.text.substr(block.offset + block.length);
  return finish(file, std::move(out));
}

std::string remove_block(const DecodedFile &file, const std::size_t index) {
  const DecodedBlock &block = file.blocks.at(index);
  std::string out = file.text.substr(0, block.offset);
  out += file.text.substr(block.offset + block.length);
  return finish(file, std::move(out));
}

} // namespace acta::entries
