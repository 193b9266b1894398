#include "acta/cli/commands.hpp"

#include "acta/ai/session_manager.hpp"
#include "acta/common/fs.hpp"
#include "acta/config/settings.hpp"
#include "acta/entries/entry_store.hpp"
#include "acta/observability/factory.hpp"
#include "acta/observability/global.hpp"
#include "acta/rpc/protocol.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace acta::cli {

namespace {

constexpr auto kChatPollInterval = std::chrono::milliseconds(220);

std::string version_string() {
#ifdef ACTA_VERSION
  std::string version = ACTA_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "acta " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

std::vector<std::string> take_tags(std::vector<std::string> &args) {
  std::vector<std::string> tags;
  std::string tag;
  while (take_option(args, "--tag", "-t", tag)) {
    tags.push_back(tag);
  }
  return tags;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_settings_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_settings_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

struct CliContext {
  config::Settings settings;
  std::filesystem::path data_dir;
};

common::Result<CliContext> load_context() {
  auto settings = config::load_settings();
  if (!settings.ok()) {
    return common::Result<CliContext>::failure(settings.status());
  }
  auto data_dir = config::resolve_data_dir(settings.value());
  if (!data_dir.ok()) {
    return common::Result<CliContext>::failure(data_dir.status());
  }
  return common::Result<CliContext>::success(
      CliContext{.settings = std::move(settings.value()), .data_dir = data_dir.value()});
}

int report(const common::Status &status) {
  std::cerr << common::error_code_name(status.code()) << ": " << status.error() << "\n";
  return 1;
}

void print_entry(const entries::Entry &entry) {
  std::cout << entry.created << "  " << entry.id;
  for (const auto &tag : entry.tags) {
    std::cout << "  #" << tag;
  }
  std::cout << "\n";
  for (const auto &line : common::split_lines(entry.body)) {
    std::cout << "    " << line << "\n";
  }
  std::cout << "\n";
}

int run_list(const CliContext &ctx, std::vector<std::string> args) {
  const bool as_json = take_flag(args, "--json");
  const auto wanted = entries::normalize_tags(take_tags(args));

  entries::EntryStore store(ctx.data_dir);
  std::vector<entries::Entry> listed = store.list();
  if (!wanted.empty()) {
    std::erase_if(listed, [&wanted](const entries::Entry &entry) {
      return std::any_of(wanted.begin(), wanted.end(), [&entry](const std::string &tag) {
        return std::find(entry.tags.begin(), entry.tags.end(), tag) == entry.tags.end();
      });
    });
  }

  if (as_json) {
    std::cout << "[";
    for (std::size_t i = 0; i < listed.size(); ++i) {
      if (i > 0) {
        std::cout << ",";
      }
      std::cout << rpc::entry_to_json(listed[i]);
    }
    std::cout << "]\n";
    return 0;
  }
  if (listed.empty()) {
    std::cout << "No entries in " << ctx.data_dir.string() << "\n";
    return 0;
  }
  for (const auto &entry : listed) {
    print_entry(entry);
  }
  return 0;
}

int run_add(const CliContext &ctx, std::vector<std::string> args) {
  const auto tags = take_tags(args);
  std::string body;
  if (args.empty() || (args.size() == 1 && args[0] == "-")) {
    body = read_stdin_all();
  } else {
    body = join_tokens(args);
  }

  entries::EntryStore store(ctx.data_dir);
  auto added = store.add(body, tags);
  if (!added.ok()) {
    return report(added.status());
  }
  std::cout << added.value().id << "\n";
  return 0;
}

int run_update(const CliContext &ctx, std::vector<std::string> args) {
  const auto tags = take_tags(args);
  if (args.empty()) {
    std::cerr << "usage: acta update ID [-t TAG]... BODY\n";
    return 1;
  }
  const std::string id = args[0];
  const std::string body =
      args.size() == 1 || (args.size() == 2 && args[1] == "-") ? read_stdin_all()
                                                               : join_tokens(args, 1);

  entries::EntryStore store(ctx.data_dir);
  auto updated = store.update(id, body, tags);
  if (!updated.ok()) {
    return report(updated.status());
  }
  if (!updated.value()) {
    std::cerr << "entry not found: " << id << "\n";
    return 1;
  }
  std::cout << "updated " << id << "\n";
  return 0;
}

int run_delete(const CliContext &ctx, std::vector<std::string> args) {
  if (args.size() != 1) {
    std::cerr << "usage: acta delete ID\n";
    return 1;
  }
  entries::EntryStore store(ctx.data_dir);
  auto deleted = store.remove(args[0]);
  if (!deleted.ok()) {
    return report(deleted.status());
  }
  if (!deleted.value()) {
    std::cerr << "entry not found: " << args[0] << "\n";
    return 1;
  }
  std::cout << "deleted " << args[0] << "\n";
  return 0;
}

// Polls until the running turn is over, printing whatever arrives.
bool wait_for_turn(ai::SessionManager &manager, const std::string &session_id) {
  while (true) {
    auto read = manager.read_output(session_id);
    if (!read.ok()) {
      report(read.status());
      return false;
    }
    if (!read.value().chunk.empty()) {
      std::cout << read.value().chunk << "\n\n";
      std::cout.flush();
    }
    if (!read.value().busy) {
      return read.value().alive;
    }
    std::this_thread::sleep_for(kChatPollInterval);
  }
}

int run_chat(const CliContext &ctx, std::vector<std::string> args) {
  std::string cli_path = ctx.settings.ai_cli_path;
  (void)take_option(args, "--cli", "", cli_path);
  if (common::trim(cli_path).empty()) {
    std::cerr << "no AI CLI configured; use --cli PATH or set aiCliPath\n";
    return 1;
  }

  ai::SessionManagerOptions options;
  options.history_turns = ctx.settings.ai_history_turns;
  options.working_dir = ctx.data_dir;
  ai::SessionManager manager(options);

  auto started = manager.start(cli_path);
  if (!started.ok()) {
    return report(started.status());
  }
  const std::string session_id = started.value();
  if (auto sent = manager.send(session_id,
                               config::build_bootstrap_instruction(ctx.settings, ctx.data_dir));
      !sent.ok()) {
    return report(sent.status());
  }

  std::cout << "Chatting with " << cli_path << " (/quit to exit)\n";
  std::string line;
  while (true) {
    std::cout << "> ";
    std::cout.flush();
    if (!std::getline(std::cin, line)) {
      break;
    }
    const std::string input = common::trim(line);
    if (input.empty()) {
      continue;
    }
    if (input == "/quit" || input == "/exit") {
      break;
    }
    auto sent = manager.send(session_id, input);
    if (!sent.ok()) {
      report(sent.status());
      continue;
    }
    if (!wait_for_turn(manager, session_id)) {
      break;
    }
  }

  (void)manager.stop(session_id);
  return 0;
}

int run_serve(const CliContext &ctx) {
  ai::SessionManagerOptions options;
  options.history_turns = ctx.settings.ai_history_turns;
  options.working_dir = ctx.data_dir;
  rpc::RpcHandler handler(ctx.settings, ctx.data_dir, options);
  handler.serve(std::cin, std::cout);
  return 0;
}

int run_config(CliContext ctx, std::vector<std::string> args) {
  if (args.empty() || args[0] == "show") {
    const auto path = config::settings_path();
    std::cout << "settings: " << (path.ok() ? path.value().string() : path.error()) << "\n";
    std::cout << "data dir: " << ctx.data_dir.string() << "\n";
    std::cout << config::settings_to_json(ctx.settings);
    return 0;
  }

  if (args[0] == "set-data-dir") {
    if (args.size() < 2) {
      std::cerr << "usage: acta config set-data-dir DIR\n";
      return 1;
    }
    auto resolved = config::set_data_dir(ctx.settings, join_tokens(args, 1));
    if (!resolved.ok()) {
      return report(resolved.status());
    }
    std::cout << resolved.value().string() << "\n";
    return 0;
  }

  if (args[0] == "set-ai-cli") {
    if (args.size() < 2) {
      std::cerr << "usage: acta config set-ai-cli PATH\n";
      return 1;
    }
    const std::string cli_path = common::trim(join_tokens(args, 1));
    const auto change = [&cli_path](config::Settings &target) { target.ai_cli_path = cli_path; };
    if (auto saved = config::update_settings(ctx.settings, change); !saved.ok()) {
      return report(saved);
    }
    std::cout << ctx.settings.ai_cli_path << "\n";
    return 0;
  }

  std::cerr << "unknown config command: " << args[0] << "\n";
  return 1;
}

} // namespace

void print_help() {
  std::cout << version_string() << ": dated Markdown journal with an AI side console\n\n";
  std::cout << "usage: acta [--config PATH] <command> [options]\n\n";
  std::cout << "entries:\n";
  std::cout << "  list [--json] [-t TAG]...       List entries, newest first\n";
  std::cout << "  add [-t TAG]... [BODY | -]      Add an entry to today's file\n";
  std::cout << "  update ID [-t TAG]... BODY      Replace an entry's body and tags\n";
  std::cout << "  delete ID                       Remove an entry\n\n";
  std::cout << "ai:\n";
  std::cout << "  chat [--cli PATH]               Converse with the configured AI CLI\n";
  std::cout << "  serve                           JSON-lines RPC on stdin/stdout\n\n";
  std::cout << "settings:\n";
  std::cout << "  config show                     Print settings\n";
  std::cout << "  config set-data-dir DIR         Change the data directory\n";
  std::cout << "  config set-ai-cli PATH          Change the AI CLI\n";
  std::cout << "  config-path                     Print the settings file path\n";
  std::cout << "  version                         Show version\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::settings_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }

  auto ctx = load_context();
  if (!ctx.ok()) {
    return report(ctx.status());
  }
  observability::set_global_observer(
      observability::create_observer(ctx.value().settings.log_backend));

  int code = 1;
  if (subcommand == "list") {
    code = run_list(ctx.value(), std::move(args));
  } else if (subcommand == "add") {
    code = run_add(ctx.value(), std::move(args));
  } else if (subcommand == "update") {
    code = run_update(ctx.value(), std::move(args));
  } else if (subcommand == "delete") {
    code = run_delete(ctx.value(), std::move(args));
  } else if (subcommand == "chat") {
    code = run_chat(ctx.value(), std::move(args));
  } else if (subcommand == "serve") {
    code = run_serve(ctx.value());
  } else if (subcommand == "config") {
    code = run_config(ctx.value(), std::move(args));
  } else {
    std::cerr << "Unknown command: " << subcommand << "\n";
    print_help();
  }

  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return code;
}

} // namespace acta::cli
