#include "acta/rpc/protocol.hpp"

#include "acta/common/fs.hpp"
#include "acta/common/json_util.hpp"
#include "acta/observability/global.hpp"

#include <istream>
#include <ostream>
#include <sstream>

namespace acta::rpc {

namespace {

constexpr const char *kComponent = "rpc";

std::string bool_json(const bool value) { return value ? "true" : "false"; }

common::Status missing_param(const std::string &name) {
  return common::Status::error("missing parameter: " + name, common::ErrorCode::Validation);
}

} // namespace

RpcResponse RpcResponse::success(std::string id, std::string result) {
  RpcResponse response;
  response.id = std::move(id);
  response.result = std::move(result);
  return response;
}

RpcResponse RpcResponse::failure(std::string id, const common::Status &status) {
  RpcResponse response;
  response.id = std::move(id);
  response.error = status.error();
  response.code = status.code();
  return response;
}

std::string RpcResponse::to_json() const {
  std::ostringstream out;
  out << "{\"id\":" << id << ",";
  if (error.has_value()) {
    out << "\"error\":" << common::json_quote(*error) << ",\"code\":"
        << common::json_quote(std::string(common::error_code_name(code)));
  } else {
    out << "\"result\":" << result;
  }
  out << "}";
  return out.str();
}

common::Result<RpcRequest> parse_rpc_request(const std::string &line) {
  const auto fields = common::json_object_fields(line);
  if (!fields.has_value()) {
    return common::Result<RpcRequest>::failure("request is not a JSON object",
                                               common::ErrorCode::Parse);
  }

  RpcRequest request;
  if (const auto id = fields->find("id"); id != fields->end() && !id->second.empty()) {
    request.id = id->second;
  }
  request.method = common::json_get_string(line, "method");
  if (request.method.empty()) {
    return common::Result<RpcRequest>::failure("request has no method", common::ErrorCode::Parse);
  }
  if (std::string params = common::json_get_object(line, "params"); !params.empty()) {
    request.params = std::move(params);
  }
  return common::Result<RpcRequest>::success(std::move(request));
}

std::string entry_to_json(const entries::Entry &entry) {
  std::ostringstream out;
  out << "{\"id\":" << common::json_quote(entry.id)
      << ",\"date\":" << common::json_quote(entry.date)
      << ",\"created\":" << common::json_quote(entry.created)
      << ",\"createdAtMs\":" << entry.created_at_ms
      << ",\"tags\":" << common::json_string_array(entry.tags)
      << ",\"body\":" << common::json_quote(entry.body)
      << ",\"sourceFile\":" << common::json_quote(entry.source_file.string()) << "}";
  return out.str();
}

RpcHandler::RpcHandler(config::Settings settings, const std::filesystem::path &data_dir,
                       ai::SessionManagerOptions session_options)
    : settings_(std::move(settings)), store_(std::make_unique<entries::EntryStore>(data_dir)),
      sessions_(std::move(session_options)) {}

RpcResponse RpcHandler::handle(const RpcRequest &request) {
  const std::string &method = request.method;
  if (method == "getDataDir") {
    return handle_get_data_dir(request);
  }
  if (method == "setDataDir") {
    return handle_set_data_dir(request);
  }
  if (method == "getAiSettings") {
    return handle_get_ai_settings(request);
  }
  if (method == "saveAiSettings") {
    return handle_save_ai_settings(request);
  }
  if (method == "getBootstrapInstruction") {
    return handle_bootstrap_instruction(request);
  }
  if (method == "listEntries") {
    return handle_list_entries(request);
  }
  if (method == "addEntry") {
    return handle_add_entry(request);
  }
  if (method == "updateEntry") {
    return handle_update_entry(request);
  }
  if (method == "deleteEntry") {
    return handle_delete_entry(request);
  }
  if (method == "aiStartSession") {
    return handle_ai_start(request);
  }
  if (method == "aiSendInput") {
    return handle_ai_send(request);
  }
  if (method == "aiReadOutput") {
    return handle_ai_read(request);
  }
  if (method == "aiStopSession") {
    return handle_ai_stop(request);
  }
  return RpcResponse::failure(
      request.id, common::Status::error("unknown method: " + method, common::ErrorCode::NotFound));
}

std::string RpcHandler::handle_line(const std::string &line) {
  auto request = parse_rpc_request(line);
  if (!request.ok()) {
    observability::record_error(kComponent, request.error());
    return RpcResponse::failure("null", request.status()).to_json();
  }
  auto response = handle(request.value());
  if (response.error.has_value() && response.code != common::ErrorCode::Validation &&
      response.code != common::ErrorCode::SessionBusy) {
    observability::record_error(kComponent, request.value().method + ": " + *response.error);
  }
  return response.to_json();
}

void RpcHandler::serve(std::istream &in, std::ostream &out) {
  std::string line;
  while (std::getline(in, line)) {
    if (common::trim(line).empty()) {
      continue;
    }
    out << handle_line(line) << "\n";
    out.flush();
  }
  sessions_.shutdown();
}

RpcResponse RpcHandler::handle_get_data_dir(const RpcRequest &request) const {
  return RpcResponse::success(
      request.id, "{\"dataDir\":" + common::json_quote(store_->data_dir().string()) + "}");
}

RpcResponse RpcHandler::handle_set_data_dir(const RpcRequest &request) {
  const std::string dir = common::json_get_string(request.params, "dir");
  auto resolved = config::set_data_dir(settings_, dir);
  if (!resolved.ok()) {
    return RpcResponse::failure(request.id, resolved.status());
  }
  store_ = std::make_unique<entries::EntryStore>(resolved.value());
  return RpcResponse::success(
      request.id, "{\"dataDir\":" + common::json_quote(resolved.value().string()) + "}");
}

RpcResponse RpcHandler::handle_get_ai_settings(const RpcRequest &request) const {
  std::ostringstream out;
  out << "{\"cliPath\":" << common::json_quote(settings_.ai_cli_path)
      << ",\"instructionMarkdown\":" << common::json_quote(settings_.ai_instruction_markdown)
      << ",\"historyTurns\":" << settings_.ai_history_turns << "}";
  return RpcResponse::success(request.id, out.str());
}

RpcResponse RpcHandler::handle_save_ai_settings(const RpcRequest &request) {
  const auto fields = common::json_object_fields(request.params);
  const auto has = [&fields](const std::string &name) {
    return fields.has_value() && fields->count(name) > 0;
  };
  std::optional<std::string> cli_path;
  std::optional<std::string> instruction;
  if (has("cliPath")) {
    cli_path = common::trim(common::json_get_string(request.params, "cliPath"));
  }
  if (has("instructionMarkdown")) {
    instruction = common::json_get_string(request.params, "instructionMarkdown");
  }

  const auto change = [&cli_path, &instruction](config::Settings &target) {
    if (cli_path.has_value()) {
      target.ai_cli_path = *cli_path;
    }
    if (instruction.has_value()) {
      target.ai_instruction_markdown = *instruction;
    }
  };
  if (auto status = config::update_settings(settings_, change); !status.ok()) {
    return RpcResponse::failure(request.id, status);
  }
  return handle_get_ai_settings(request);
}

RpcResponse RpcHandler::handle_bootstrap_instruction(const RpcRequest &request) const {
  const std::string instruction =
      config::build_bootstrap_instruction(settings_, store_->data_dir());
  return RpcResponse::success(request.id,
                              "{\"instruction\":" + common::json_quote(instruction) + "}");
}

RpcResponse RpcHandler::handle_list_entries(const RpcRequest &request) const {
  std::ostringstream out;
  out << "[";
  bool first = true;
  for (const auto &entry : store_->list()) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << entry_to_json(entry);
  }
  out << "]";
  return RpcResponse::success(request.id, out.str());
}

RpcResponse RpcHandler::handle_add_entry(const RpcRequest &request) {
  auto added = store_->add(common::json_get_string(request.params, "body"),
                           common::json_get_string_array(request.params, "tags"));
  if (!added.ok()) {
    return RpcResponse::failure(request.id, added.status());
  }
  return RpcResponse::success(request.id, entry_to_json(added.value()));
}

RpcResponse RpcHandler::handle_update_entry(const RpcRequest &request) {
  const std::string id = common::json_get_string(request.params, "id");
  if (id.empty()) {
    return RpcResponse::failure(request.id, missing_param("id"));
  }
  auto updated = store_->update(id, common::json_get_string(request.params, "body"),
                                common::json_get_string_array(request.params, "tags"));
  if (!updated.ok()) {
    return RpcResponse::failure(request.id, updated.status());
  }
  return RpcResponse::success(request.id, "{\"updated\":" + bool_json(updated.value()) + "}");
}

RpcResponse RpcHandler::handle_delete_entry(const RpcRequest &request) {
  const std::string id = common::json_get_string(request.params, "id");
  if (id.empty()) {
    return RpcResponse::failure(request.id, missing_param("id"));
  }
  auto deleted = store_->remove(id);
  if (!deleted.ok()) {
    return RpcResponse::failure(request.id, deleted.status());
  }
  return RpcResponse::success(request.id, "{\"deleted\":" + bool_json(deleted.value()) + "}");
}

RpcResponse RpcHandler::handle_ai_start(const RpcRequest &request) {
  std::string cli_path = common::trim(common::json_get_string(request.params, "cliPath"));
  if (cli_path.empty()) {
    cli_path = settings_.ai_cli_path;
  }
  auto started = sessions_.start(cli_path);
  if (!started.ok()) {
    return RpcResponse::failure(request.id, started.status());
  }
  return RpcResponse::success(request.id,
                              "{\"sessionId\":" + common::json_quote(started.value()) + "}");
}

RpcResponse RpcHandler::handle_ai_send(const RpcRequest &request) {
  const std::string session_id = common::json_get_string(request.params, "sessionId");
  if (session_id.empty()) {
    return RpcResponse::failure(request.id, missing_param("sessionId"));
  }
  auto sent = sessions_.send(session_id, common::json_get_string(request.params, "input"));
  if (!sent.ok()) {
    return RpcResponse::failure(request.id, sent.status());
  }
  return RpcResponse::success(request.id,
                              "{\"accepted\":" + bool_json(sent.value().accepted) +
                                  ",\"turnStarted\":" + bool_json(sent.value().turn_started) +
                                  "}");
}

RpcResponse RpcHandler::handle_ai_read(const RpcRequest &request) {
  const std::string session_id = common::json_get_string(request.params, "sessionId");
  if (session_id.empty()) {
    return RpcResponse::failure(request.id, missing_param("sessionId"));
  }
  auto read = sessions_.read_output(session_id);
  if (!read.ok()) {
    return RpcResponse::failure(request.id, read.status());
  }
  const auto &snapshot = read.value();
  std::ostringstream out;
  out << "{\"chunk\":" << common::json_quote(snapshot.chunk)
      << ",\"alive\":" << bool_json(snapshot.alive) << ",\"busy\":" << bool_json(snapshot.busy)
      << ",\"exitCode\":"
      << (snapshot.exit_code.has_value() ? std::to_string(*snapshot.exit_code) : "null")
      << ",\"error\":" << (snapshot.error.has_value() ? common::json_quote(*snapshot.error) : "null")
      << "}";
  return RpcResponse::success(request.id, out.str());
}

RpcResponse RpcHandler::handle_ai_stop(const RpcRequest &request) {
  const std::string session_id = common::json_get_string(request.params, "sessionId");
  if (session_id.empty()) {
    return RpcResponse::failure(request.id, missing_param("sessionId"));
  }
  auto stopped = sessions_.stop(session_id);
  if (!stopped.ok()) {
    return RpcResponse::failure(request.id, stopped.status());
  }
  return RpcResponse::success(request.id, "{\"stopped\":" + bool_json(stopped.value()) + "}");
}

} // namespace acta::rpc
