#include "test_framework.hpp"

#include "acta/cli/commands.hpp"
#include "acta/common/fs.hpp"
#include "acta/config/settings.hpp"
#include "acta/observability/global.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CliRun {
  int code = 0;
  std::string out;
  std::string err;
};

class StreamRedirect {
public:
  explicit StreamRedirect(const std::string &input)
      : in_(input), old_in_(std::cin.rdbuf(in_.rdbuf())), old_out_(std::cout.rdbuf(out_.rdbuf())),
        old_err_(std::cerr.rdbuf(err_.rdbuf())) {}

  ~StreamRedirect() {
    std::cin.rdbuf(old_in_);
    std::cout.rdbuf(old_out_);
    std::cerr.rdbuf(old_err_);
    std::cin.clear();
  }

  StreamRedirect(const StreamRedirect &) = delete;
  StreamRedirect &operator=(const StreamRedirect &) = delete;

  [[nodiscard]] std::string out() const { return out_.str(); }
  [[nodiscard]] std::string err() const { return err_.str(); }

private:
  std::istringstream in_;
  std::ostringstream out_;
  std::ostringstream err_;
  std::streambuf *old_in_;
  std::streambuf *old_out_;
  std::streambuf *old_err_;
};

// Runs `acta --config <ws>/settings.json <args...>` with the given stdin.
CliRun run_cli(const acta::testing::TempWorkspace &ws, const std::vector<std::string> &args,
               const std::string &input = "") {
  std::vector<std::string> owned = {"acta", "--config", (ws.path() / "settings.json").string()};
  owned.insert(owned.end(), args.begin(), args.end());
  std::vector<char *> argv;
  argv.reserve(owned.size());
  for (auto &arg : owned) {
    argv.push_back(arg.data());
  }

  CliRun run;
  {
    StreamRedirect redirect(input);
    run.code = acta::cli::run_cli(static_cast<int>(argv.size()), argv.data());
    run.out = redirect.out();
    run.err = redirect.err();
  }
  acta::config::set_settings_path_override(std::nullopt);
  acta::observability::set_global_observer(nullptr);
  return run;
}

struct CliEnv {
  acta::testing::TempWorkspace ws;
  acta::testing::EnvGuard data{"ACTA_DATA_DIR", std::nullopt};
  acta::testing::EnvGuard cli{"ACTA_AI_CLI", std::nullopt};
  acta::testing::EnvGuard log{"ACTA_LOG", std::string("none")};

  [[nodiscard]] std::filesystem::path journal() const { return ws.path() / "journal"; }

  void use_journal() const {
    const auto set = run_cli(ws, {"config", "set-data-dir", journal().string()});
    if (set.code != 0) {
      throw std::runtime_error("set-data-dir failed: " + set.err);
    }
  }

  [[nodiscard]] std::string add(const std::vector<std::string> &args,
                                const std::string &input = "") const {
    std::vector<std::string> full = {"add"};
    full.insert(full.end(), args.begin(), args.end());
    const auto run = run_cli(ws, full, input);
    if (run.code != 0) {
      throw std::runtime_error("add failed: " + run.err);
    }
    return acta::common::trim(run.out);
  }
};

} // namespace

void register_cli_tests(std::vector<acta::tests::TestCase> &tests) {
  using acta::tests::require;

  tests.push_back({"cli_config_set_data_dir_persists_and_prints_path", [] {
                     CliEnv env;
                     const auto set =
                         run_cli(env.ws, {"config", "set-data-dir", env.journal().string()});
                     require(set.code == 0, set.err);
                     require(set.out == env.journal().string() + "\n", set.out);
                     require(std::filesystem::is_directory(env.journal()), "dir not created");
                     require(env.ws.read_file("settings.json").find(env.journal().string()) !=
                                 std::string::npos,
                             "data dir not persisted");

                     const auto path = run_cli(env.ws, {"config-path"});
                     require(path.code == 0 &&
                                 path.out == (env.ws.path() / "settings.json").string() + "\n",
                             path.out);
                     const auto show = run_cli(env.ws, {"config", "show"});
                     require(show.out.find("data dir: " + env.journal().string()) !=
                                 std::string::npos,
                             show.out);
                   }});

  tests.push_back({"cli_add_then_list_shows_entry", [] {
                     CliEnv env;
                     env.use_journal();
                     const std::string id = env.add({"-t", "work", "-t", "#home", "walked", "home"});
                     require(id.size() == 36, "id line: " + id);

                     const auto listed = run_cli(env.ws, {"list"});
                     require(listed.code == 0, listed.err);
                     require(listed.out.find(id) != std::string::npos, listed.out);
                     require(listed.out.find("    walked home\n") != std::string::npos, listed.out);
                     require(listed.out.find("#work  #home") != std::string::npos, listed.out);

                     const auto json = run_cli(env.ws, {"list", "--json"});
                     require(json.code == 0 && json.out.front() == '[', json.out);
                     require(json.out.find("\"id\":\"" + id + "\"") != std::string::npos, json.out);
                   }});

  tests.push_back({"cli_add_dash_reads_stdin", [] {
                     CliEnv env;
                     env.use_journal();
                     const std::string id = env.add({"-"}, "from stdin\nsecond line\n");
                     const auto json = run_cli(env.ws, {"list", "--json"});
                     require(json.out.find(id) != std::string::npos, json.out);
                     require(json.out.find("\"body\":\"from stdin\\nsecond line\"") !=
                                 std::string::npos,
                             json.out);
                   }});

  tests.push_back({"cli_list_tag_filter_requires_every_tag", [] {
                     CliEnv env;
                     env.use_journal();
                     const std::string both = env.add({"-t", "work", "-t", "home", "both"});
                     const std::string work = env.add({"-t", "work", "work only"});

                     const auto filtered =
                         run_cli(env.ws, {"list", "--json", "-t", "work", "-t", "#home"});
                     require(filtered.code == 0, filtered.err);
                     require(filtered.out.find(both) != std::string::npos, filtered.out);
                     require(filtered.out.find(work) == std::string::npos,
                             "entry missing a tag listed: " + filtered.out);

                     const auto single = run_cli(env.ws, {"list", "--json", "-t", "work"});
                     require(single.out.find(both) != std::string::npos &&
                                 single.out.find(work) != std::string::npos,
                             single.out);
                   }});

  tests.push_back({"cli_update_and_delete_by_id", [] {
                     CliEnv env;
                     env.use_journal();
                     const std::string id = env.add({"draft"});

                     const auto updated = run_cli(env.ws, {"update", id, "-t", "done", "final"});
                     require(updated.code == 0 && updated.out == "updated " + id + "\n",
                             updated.out + updated.err);
                     const auto json = run_cli(env.ws, {"list", "--json"});
                     require(json.out.find("\"body\":\"final\"") != std::string::npos, json.out);
                     require(json.out.find("\"tags\":[\"done\"]") != std::string::npos, json.out);

                     const auto deleted = run_cli(env.ws, {"delete", id});
                     require(deleted.code == 0 && deleted.out == "deleted " + id + "\n",
                             deleted.out + deleted.err);
                     const auto empty = run_cli(env.ws, {"list"});
                     require(empty.out.rfind("No entries in", 0) == 0, empty.out);
                   }});

  tests.push_back({"cli_errors_exit_1_with_message_on_stderr", [] {
                     CliEnv env;
                     env.use_journal();

                     const auto update = run_cli(env.ws, {"update", "missing-id", "body"});
                     require(update.code == 1, "update exit code");
                     require(update.err == "entry not found: missing-id\n", update.err);
                     require(update.out.empty(), update.out);

                     const auto remove = run_cli(env.ws, {"delete", "missing-id"});
                     require(remove.code == 1 && remove.err == "entry not found: missing-id\n",
                             remove.err);

                     const auto blank = run_cli(env.ws, {"add", "   "});
                     require(blank.code == 1, "blank add exit code");
                     require(blank.err.rfind("ValidationError: ", 0) == 0, blank.err);

                     const auto usage = run_cli(env.ws, {"delete"});
                     require(usage.code == 1 && usage.err.find("usage:") != std::string::npos,
                             usage.err);

                     const auto unknown = run_cli(env.ws, {"frobnicate"});
                     require(unknown.code == 1 &&
                                 unknown.err.find("Unknown command: frobnicate") != std::string::npos,
                             unknown.err);

                     const auto missing_config = run_cli(env.ws, {"--config"});
                     require(missing_config.code == 1, "dangling --config accepted");
                   }});

  tests.push_back({"cli_config_set_ai_cli_and_version", [] {
                     CliEnv env;
                     const auto set = run_cli(env.ws, {"config", "set-ai-cli", "/opt/ai/cli"});
                     require(set.code == 0 && set.out == "/opt/ai/cli\n", set.out + set.err);
                     require(env.ws.read_file("settings.json").find("/opt/ai/cli") !=
                                 std::string::npos,
                             "cli path not persisted");

                     const auto version = run_cli(env.ws, {"version"});
                     require(version.code == 0 && version.out.rfind("acta ", 0) == 0, version.out);
                   }});
}
