#include "acta/entries/entry.hpp"

#include "acta/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace acta::entries {

namespace {

constexpr std::string_view kFullwidthHash = "\xEF\xBC\x83";      // U+FF03
constexpr std::string_view kIdeographicSpace = "\xE3\x80\x80";   // U+3000
constexpr std::string_view kIdeographicComma = "\xE3\x80\x81";   // U+3001

bool has_at(const std::string &value, const std::size_t pos, const std::string_view needle) {
  return value.compare(pos, needle.size(), needle) == 0;
}

// Stored tag lines are separated by `,` or `、`, so neither can live inside one tag.
std::vector<std::string> split_tag_list(const std::string &text) {
  std::vector<std::string> parts;
  std::string current;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == ',') {
      parts.push_back(std::move(current));
      current.clear();
      continue;
    }
    if (has_at(text, i, kIdeographicComma)) {
      parts.push_back(std::move(current));
      current.clear();
      i += kIdeographicComma.size() - 1;
      continue;
    }
    current.push_back(text[i]);
  }
  parts.push_back(std::move(current));
  return parts;
}

} // namespace

std::string normalize_tag(const std::string &raw) {
  std::string value = common::trim(raw);
  if (!value.empty() && value.front() == '#') {
    value.erase(0, 1);
  } else if (has_at(value, 0, kFullwidthHash)) {
    value.erase(0, kFullwidthHash.size());
  }

  std::string collapsed;
  collapsed.reserve(value.size());
  bool in_space = false;
  for (std::size_t i = 0; i < value.size(); ++i) {
    bool space = std::isspace(static_cast<unsigned char>(value[i])) != 0;
    std::size_t width = 1;
    if (!space && has_at(value, i, kIdeographicSpace)) {
      space = true;
      width = kIdeographicSpace.size();
    }
    if (space) {
      if (!in_space) {
        collapsed.push_back(' ');
      }
      in_space = true;
      i += width - 1;
      continue;
    }
    in_space = false;
    collapsed.push_back(value[i]);
  }
  return common::trim(collapsed);
}

std::vector<std::string> normalize_tags(const std::vector<std::string> &raw) {
  std::vector<std::string> out;
  out.reserve(raw.size());
  for (const auto &tag : raw) {
    for (const auto &piece : split_tag_list(tag)) {
      std::string normalized = normalize_tag(piece);
      if (normalized.empty()) {
        continue;
      }
      if (std::find(out.begin(), out.end(), normalized) == out.end()) {
        out.push_back(std::move(normalized));
      }
    }
  }
  return out;
}

std::vector<std::string> parse_tag_line(const std::string &line) { return normalize_tags({line}); }

std::string join_tags(const std::vector<std::string> &tags) {
  std::string out;
  for (const auto &tag : normalize_tags(tags)) {
    if (!out.empty()) {
      out += ", ";
    }
    out += tag;
  }
  return out;
}

} // namespace acta::entries
