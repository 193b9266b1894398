#include "test_framework.hpp"

#include "acta/config/settings.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

struct SettingsPathGuard {
  explicit SettingsPathGuard(const std::filesystem::path &path) {
    acta::config::set_settings_path_override(path);
  }
  ~SettingsPathGuard() { acta::config::set_settings_path_override(std::nullopt); }

  SettingsPathGuard(const SettingsPathGuard &) = delete;
  SettingsPathGuard &operator=(const SettingsPathGuard &) = delete;
};

} // namespace

void register_config_tests(std::vector<acta::tests::TestCase> &tests) {
  using acta::tests::require;
  namespace config = acta::config;
  namespace common = acta::common;
  namespace t = acta::testing;

  tests.push_back({"config_missing_file_yields_defaults", [] {
                     t::TempWorkspace ws;
                     SettingsPathGuard guard(ws.path() / "settings.json");
                     t::EnvGuard data("ACTA_DATA_DIR", std::nullopt);
                     t::EnvGuard cli("ACTA_AI_CLI", std::nullopt);
                     t::EnvGuard log("ACTA_LOG", std::nullopt);

                     auto loaded = config::load_settings();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().data_dir.empty(), "data dir");
                     require(loaded.value().ai_cli_path.empty(), "cli path");
                     require(loaded.value().ai_history_turns == 8, "history turns");
                     require(loaded.value().log_backend == "log", "log backend");
                   }});

  tests.push_back({"config_save_then_load", [] {
                     t::TempWorkspace ws;
                     SettingsPathGuard guard(ws.path() / "nested" / "settings.json");
                     t::EnvGuard data("ACTA_DATA_DIR", std::nullopt);
                     t::EnvGuard cli("ACTA_AI_CLI", std::nullopt);

                     config::Settings settings;
                     settings.data_dir = "/srv/journal";
                     settings.ai_cli_path = "/usr/local/bin/codex";
                     settings.ai_instruction_markdown = "# Rules\n\n- be \"brief\"\n";
                     settings.ai_history_turns = 3;
                     require(config::save_settings(settings).ok(), "save failed");
                     require(ws.exists("nested/settings.json"), "file not written");

                     auto loaded = config::load_settings();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().data_dir == "/srv/journal", "data dir");
                     require(loaded.value().ai_cli_path == "/usr/local/bin/codex", "cli");
                     require(loaded.value().ai_instruction_markdown == settings.ai_instruction_markdown,
                             "instruction");
                     require(loaded.value().ai_history_turns == 3, "turns");
                   }});

  tests.push_back({"config_directory_override_appends_file_name", [] {
                     t::TempWorkspace ws;
                     SettingsPathGuard guard(ws.path());
                     auto path = config::settings_path();
                     require(path.ok(), path.error());
                     require(path.value() == ws.path() / config::kSettingsFileName,
                             path.value().string());
                     require(config::config_dir().value() == ws.path(), "config dir");
                   }});

  tests.push_back({"config_unparsable_file_falls_back_to_defaults", [] {
                     t::TempWorkspace ws;
                     ws.create_file("settings.json", "not json at all");
                     SettingsPathGuard guard(ws.path() / "settings.json");
                     t::EnvGuard data("ACTA_DATA_DIR", std::nullopt);

                     auto loaded = config::load_settings();
                     require(loaded.ok(), "load should not fail");
                     require(loaded.value().data_dir.empty(), "defaults expected");
                     require(!config::settings_from_json("[1, 2]").ok(), "array accepted");
                     require(config::settings_from_json("[1]").code() == common::ErrorCode::Parse,
                             "parse code");
                   }});

  tests.push_back({"config_partial_json_keeps_defaults", [] {
                     auto parsed = config::settings_from_json(
                         R"({"aiCliPath": "  /opt/claude  ", "unknown": true})");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().ai_cli_path == "/opt/claude", "trimmed cli path");
                     require(parsed.value().ai_history_turns == 8, "default turns");
                     require(parsed.value().data_dir.empty(), "default data dir");
                   }});

  tests.push_back({"config_env_overrides_win", [] {
                     t::TempWorkspace ws;
                     ws.create_file("settings.json",
                                    R"({"dataDir": "/from/file", "aiCliPath": "/file/cli"})");
                     SettingsPathGuard guard(ws.path() / "settings.json");
                     t::EnvGuard data("ACTA_DATA_DIR", std::string("/from/env"));
                     t::EnvGuard cli("ACTA_AI_CLI", std::nullopt);
                     t::EnvGuard log("ACTA_LOG", std::string("none"));

                     auto loaded = config::load_settings();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().data_dir == "/from/env", "env data dir");
                     require(loaded.value().ai_cli_path == "/file/cli", "file cli path");
                     require(loaded.value().log_backend == "none", "log backend");
                   }});

  tests.push_back({"config_dir_prefers_env_then_xdg", [] {
                     config::set_settings_path_override(std::nullopt);
                     {
                       t::EnvGuard dir("ACTA_CONFIG_DIR", std::string("/tmp/acta-cfg"));
                       t::EnvGuard xdg("XDG_CONFIG_HOME", std::string("/tmp/xdg"));
                       require(config::config_dir().value() == "/tmp/acta-cfg", "ACTA_CONFIG_DIR");
                     }
                     {
                       t::EnvGuard dir("ACTA_CONFIG_DIR", std::nullopt);
                       t::EnvGuard xdg("XDG_CONFIG_HOME", std::string("/tmp/xdg"));
                       require(config::config_dir().value() == std::filesystem::path("/tmp/xdg") /
                                                                   "acta",
                               "XDG_CONFIG_HOME");
                     }
                     {
                       t::EnvGuard dir("ACTA_CONFIG_DIR", std::nullopt);
                       t::EnvGuard xdg("XDG_CONFIG_HOME", std::nullopt);
                       t::EnvGuard home("HOME", std::string("/home/tester"));
                       require(config::config_dir().value() ==
                                   std::filesystem::path("/home/tester/.config/acta"),
                               "home fallback");
                       require(config::resolve_data_dir(config::Settings{}).value() ==
                                   std::filesystem::path("/home/tester/Documents/Acta"),
                               "default data dir");
                     }
                   }});

  tests.push_back({"config_set_data_dir_creates_and_persists", [] {
                     t::TempWorkspace ws;
                     SettingsPathGuard guard(ws.path() / "settings.json");
                     t::EnvGuard data("ACTA_DATA_DIR", std::nullopt);

                     config::Settings settings;
                     require(config::set_data_dir(settings, "   ").code() ==
                                 common::ErrorCode::Validation,
                             "blank dir accepted");
                     require(!ws.exists("settings.json"), "blank dir persisted");

                     const auto target = ws.path() / "journal" / "2026";
                     auto updated = config::set_data_dir(settings, "  " + target.string() + " ");
                     require(updated.ok(), updated.error());
                     require(updated.value() == target, "resolved path");
                     require(std::filesystem::is_directory(target), "directory not created");
                     require(settings.data_dir == target.string(), "settings updated");
                     require(config::load_settings().value().data_dir == target.string(),
                             "not persisted");
                   }});

  tests.push_back({"config_bootstrap_instruction_layout", [] {
                     config::Settings settings;
                     settings.ai_instruction_markdown = "\n  Keep answers short.  \n";
                     require(config::build_bootstrap_instruction(settings, "/data/journal") ==
                                 "<data>/data/journal</data>\n\nKeep answers short.",
                             "instruction layout");
                     settings.ai_instruction_markdown.clear();
                     require(config::build_bootstrap_instruction(settings, "/d") == "<data>/d</data>",
                             "data only");
                   }});
  tests.push_back({"config_updates_keep_env_overrides_out_of_the_file", [] {
                     t::TempWorkspace ws;
                     ws.create_file("settings.json",
                                    R"({"dataDir": "/from/file", "aiCliPath": "/file/cli"})");
                     SettingsPathGuard guard(ws.path() / "settings.json");
                     t::EnvGuard data("ACTA_DATA_DIR", std::string("/from/env"));
                     t::EnvGuard cli("ACTA_AI_CLI", std::string("/env/cli"));

                     auto live = config::load_settings();
                     require(live.ok(), live.error());
                     require(live.value().ai_cli_path == "/env/cli", "override applied");

                     const auto target = ws.path() / "journal";
                     auto moved = config::set_data_dir(live.value(), target.string());
                     require(moved.ok(), moved.error());
                     require(live.value().data_dir == target.string(), "live data dir");
                     require(live.value().ai_cli_path == "/env/cli", "live override kept");

                     auto stored = config::load_settings_file();
                     require(stored.ok(), stored.error());
                     require(stored.value().data_dir == target.string(), "stored data dir");
                     require(stored.value().ai_cli_path == "/file/cli",
                             "override persisted: " + stored.value().ai_cli_path);

                     auto changed = config::update_settings(live.value(), [](config::Settings &s) {
                       s.ai_instruction_markdown = "note";
                     });
                     require(changed.ok(), changed.error());
                     require(live.value().ai_instruction_markdown == "note", "live change");
                     const std::string text = ws.read_file("settings.json");
                     require(text.find("/env/cli") == std::string::npos &&
                                 text.find("/from/env") == std::string::npos,
                             text);
                   }});
}
