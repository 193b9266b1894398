#include "acta/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

namespace acta::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

std::string trim_end(const std::string &input) {
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();
  return std::string(input.begin(), last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start <= text.size()) {
    const auto newline = text.find('\n', start);
    if (newline == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, newline - start));
    start = newline + 1;
  }
  return lines;
}

std::string normalize_newlines(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch == '\r') {
      out.push_back('\n');
      if (i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      continue;
    }
    out.push_back(ch);
  }
  return out;
}

LineEnding detect_line_ending(const std::string &text) {
  return text.find("\r\n") != std::string::npos ? LineEnding::Crlf : LineEnding::Lf;
}

std::string apply_line_ending(const std::string &lf_text, const LineEnding ending) {
  if (ending == LineEnding::Lf) {
    return lf_text;
  }
  std::string out;
  out.reserve(lf_text.size() + lf_text.size() / 16);
  for (const char ch : lf_text) {
    if (ch == '\n') {
      out += "\r\n";
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set", ErrorCode::NotFound);
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(
        "Failed to create directory: " + path.string() + ": " + ec.message(), ErrorCode::Io);
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

Result<std::string> read_text_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure("Unable to open file: " + path.string(), ErrorCode::Io);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Result<std::string>::failure("Failed reading file: " + path.string(), ErrorCode::Io);
  }
  return Result<std::string>::success(buffer.str());
}

Status write_text_file_atomic(const std::filesystem::path &path, const std::string &content) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";

  std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
  if (!out) {
    return Status::error("Unable to open temporary file: " + tmp.string(), ErrorCode::Io);
  }
  out << content;
  out.close();
  if (!out) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    return Status::error("Failed writing temporary file: " + tmp.string(), ErrorCode::Io);
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    return Status::error("Failed replacing " + path.string() + ": " + ec.message(),
                         ErrorCode::Io);
  }
  return Status::success();
}

Status append_text_file(const std::filesystem::path &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::app);
  if (!out) {
    return Status::error("Unable to open file for append: " + path.string(), ErrorCode::Io);
  }
  out << content;
  out.flush();
  if (!out) {
    return Status::error("Failed appending to " + path.string(), ErrorCode::Io);
  }
  return Status::success();
}

} // namespace acta::common
