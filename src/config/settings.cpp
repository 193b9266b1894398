#include "acta/config/settings.hpp"

#include "acta/common/fs.hpp"
#include "acta/common/json_util.hpp"
#include "acta/observability/global.hpp"

#include <cstdlib>
#include <sstream>

namespace acta::config {

namespace {

constexpr const char *kComponent = "config";

std::optional<std::filesystem::path> g_settings_path_override;

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto path = settings_path_override(); path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*path, ec) || path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*path);
    }
    return common::Result<std::filesystem::path>::success(path->parent_path());
  }
  if (const auto dir = env_value("ACTA_CONFIG_DIR"); dir.has_value()) {
    return common::Result<std::filesystem::path>::success(common::expand_path(*dir));
  }
  if (const auto xdg = env_value("XDG_CONFIG_HOME"); xdg.has_value()) {
    return common::Result<std::filesystem::path>::success(std::filesystem::path(*xdg) / "acta");
  }
  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }
  return common::Result<std::filesystem::path>::success(home.value() / ".config" / "acta");
}

common::Result<std::filesystem::path> settings_path() {
  if (const auto path = settings_path_override(); path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*path, ec) || path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*path / kSettingsFileName);
    }
    return common::Result<std::filesystem::path>::success(*path);
  }
  const auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / kSettingsFileName);
}

void set_settings_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_settings_path_override = std::nullopt;
    return;
  }
  g_settings_path_override = std::filesystem::path(common::expand_path(path->string()));
}

std::optional<std::filesystem::path> settings_path_override() { return g_settings_path_override; }

std::string settings_to_json(const Settings &settings) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"dataDir\": " << common::json_quote(settings.data_dir) << ",\n";
  out << "  \"aiCliPath\": " << common::json_quote(settings.ai_cli_path) << ",\n";
  out << "  \"aiInstructionMarkdown\": " << common::json_quote(settings.ai_instruction_markdown)
      << ",\n";
  out << "  \"aiHistoryTurns\": " << settings.ai_history_turns << "\n";
  out << "}\n";
  return out.str();
}

common::Result<Settings> settings_from_json(const std::string &json) {
  const auto fields = common::json_object_fields(json);
  if (!fields.has_value()) {
    return common::Result<Settings>::failure("settings are not a JSON object",
                                             common::ErrorCode::Parse);
  }

  Settings settings;
  settings.data_dir = common::trim(common::json_get_string(json, "dataDir"));
  settings.ai_cli_path = common::trim(common::json_get_string(json, "aiCliPath"));
  settings.ai_instruction_markdown = common::json_get_string(json, "aiInstructionMarkdown");
  if (const auto turns = common::json_get_int(json, "aiHistoryTurns");
      turns.has_value() && *turns >= 0) {
    settings.ai_history_turns = static_cast<std::size_t>(*turns);
  }
  return common::Result<Settings>::success(std::move(settings));
}

void apply_env_overrides(Settings &settings) {
  if (const auto dir = env_value("ACTA_DATA_DIR"); dir.has_value()) {
    settings.data_dir = *dir;
  }
  if (const auto cli = env_value("ACTA_AI_CLI"); cli.has_value()) {
    settings.ai_cli_path = *cli;
  }
  if (const auto backend = env_value("ACTA_LOG"); backend.has_value()) {
    settings.log_backend = *backend;
  }
}

common::Result<Settings> load_settings_file() {
  const auto path_result = settings_path();
  if (!path_result.ok()) {
    return common::Result<Settings>::failure(path_result.status());
  }
  const auto &path = path_result.value();

  Settings settings;
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    const auto text = common::read_text_file(path);
    if (!text.ok()) {
      return common::Result<Settings>::failure(text.status());
    }
    auto parsed = settings_from_json(text.value());
    if (parsed.ok()) {
      settings = std::move(parsed.value());
    } else {
      observability::record_error(kComponent,
                                  path.string() + ": " + parsed.error() + ", using defaults");
    }
  }
  return common::Result<Settings>::success(std::move(settings));
}

common::Result<Settings> load_settings() {
  auto settings = load_settings_file();
  if (settings.ok()) {
    apply_env_overrides(settings.value());
  }
  return settings;
}

common::Status update_settings(Settings &live, const std::function<void(Settings &)> &change) {
  auto stored = load_settings_file();
  if (!stored.ok()) {
    return stored.status();
  }
  change(stored.value());
  if (auto saved = save_settings(stored.value()); !saved.ok()) {
    return saved;
  }
  change(live);
  return common::Status::success();
}

common::Status save_settings(const Settings &settings) {
  const auto path_result = settings_path();
  if (!path_result.ok()) {
    return path_result.status();
  }
  const auto &path = path_result.value();
  if (!path.parent_path().empty()) {
    if (auto ensured = common::ensure_dir(path.parent_path()); !ensured.ok()) {
      return ensured.status();
    }
  }
  return common::write_text_file_atomic(path, settings_to_json(settings));
}

common::Result<std::filesystem::path> default_data_dir() {
  const auto home = common::home_dir();
  if (!home.ok()) {
    return home;
  }
  return common::Result<std::filesystem::path>::success(home.value() / kDefaultDataFolder);
}

common::Result<std::filesystem::path> resolve_data_dir(const Settings &settings) {
  const std::string configured = common::trim(settings.data_dir);
  if (configured.empty()) {
    return default_data_dir();
  }
  return common::Result<std::filesystem::path>::success(
      std::filesystem::path(common::expand_path(configured)));
}

common::Result<std::filesystem::path> set_data_dir(Settings &settings, const std::string &dir) {
  const std::string trimmed = common::trim(dir);
  if (trimmed.empty()) {
    return common::Result<std::filesystem::path>::failure("data directory is empty",
                                                          common::ErrorCode::Validation);
  }
  const std::filesystem::path resolved(common::expand_path(trimmed));
  if (auto ensured = common::ensure_dir(resolved); !ensured.ok()) {
    return ensured;
  }

  const auto change = [&resolved](Settings &target) { target.data_dir = resolved.string(); };
  if (auto saved = update_settings(settings, change); !saved.ok()) {
    return common::Result<std::filesystem::path>::failure(saved);
  }
  return common::Result<std::filesystem::path>::success(resolved);
}

std::string build_bootstrap_instruction(const Settings &settings,
                                        const std::filesystem::path &data_dir) {
  std::string out;
  if (!data_dir.empty()) {
    out = "<data>" + data_dir.string() + "</data>";
  }
  const std::string instruction = common::trim(settings.ai_instruction_markdown);
  if (!instruction.empty()) {
    if (!out.empty()) {
      out += "\n\n";
    }
    out += instruction;
  }
  return out;
}

} // namespace acta::config
