#pragma once

#include "acta/ai/prompt.hpp"
#include "acta/common/result.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace acta::config {

inline constexpr const char *kSettingsFileName = "acta-settings.json";
inline constexpr const char *kDefaultDataFolder = "Documents/Acta";

struct Settings {
  std::string data_dir;
  std::string ai_cli_path;
  std::string ai_instruction_markdown;
  std::size_t ai_history_turns = ai::kDefaultHistoryTurns;
  std::string log_backend = "log";
};

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> settings_path();
void set_settings_path_override(std::optional<std::filesystem::path> path);
[[nodiscard]] std::optional<std::filesystem::path> settings_path_override();

[[nodiscard]] std::string settings_to_json(const Settings &settings);
[[nodiscard]] common::Result<Settings> settings_from_json(const std::string &json);

[[nodiscard]] common::Result<Settings> load_settings_file();
[[nodiscard]] common::Result<Settings> load_settings();
[[nodiscard]] common::Status save_settings(const Settings &settings);
/// Environment overrides held in `live` never reach the file.
[[nodiscard]] common::Status update_settings(Settings &live,
                                             const std::function<void(Settings &)> &change);
void apply_env_overrides(Settings &settings);

[[nodiscard]] common::Result<std::filesystem::path> default_data_dir();
[[nodiscard]] common::Result<std::filesystem::path> resolve_data_dir(const Settings &settings);
[[nodiscard]] common::Result<std::filesystem::path> set_data_dir(Settings &settings,
                                                                 const std::string &dir);

[[nodiscard]] std::string build_bootstrap_instruction(const Settings &settings,
                                                      const std::filesystem::path &data_dir);

} // namespace acta::config
