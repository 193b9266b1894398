#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace acta::ai {

enum class CliFlavor {
  SimplePrint,
  StructuredSession,
};

[[nodiscard]] std::string_view cli_flavor_name(CliFlavor flavor);

[[nodiscard]] CliFlavor detect_cli_flavor(const std::string &cli_path);

struct Invocation {
  std::vector<std::string> args;
  std::optional<std::filesystem::path> answer_file;
  bool resumed = false;
};

[[nodiscard]] Invocation build_invocation(CliFlavor flavor,
                                          const std::optional<std::string> &resume_token,
                                          const std::filesystem::path &scratch_file);

} // namespace acta::ai
