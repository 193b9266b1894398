#pragma once

#include "acta/ai/session_manager.hpp"
#include "acta/common/result.hpp"
#include "acta/config/settings.hpp"
#include "acta/entries/entry_store.hpp"

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace acta::rpc {

struct RpcRequest {
  std::string id = "null";
  std::string method;
  std::string params = "{}";
};

struct RpcResponse {
  std::string id = "null";
  std::string result = "null";
  std::optional<std::string> error;
  common::ErrorCode code = common::ErrorCode::None;

  [[nodiscard]] static RpcResponse success(std::string id, std::string result);
  [[nodiscard]] static RpcResponse failure(std::string id, const common::Status &status);

  [[nodiscard]] std::string to_json() const;
};

[[nodiscard]] common::Result<RpcRequest> parse_rpc_request(const std::string &line);

[[nodiscard]] std::string entry_to_json(const entries::Entry &entry);

class RpcHandler {
public:
  RpcHandler(config::Settings settings, const std::filesystem::path &data_dir,
             ai::SessionManagerOptions session_options = {});

  [[nodiscard]] RpcResponse handle(const RpcRequest &request);
  [[nodiscard]] std::string handle_line(const std::string &line);
  void serve(std::istream &in, std::ostream &out);

  [[nodiscard]] const config::Settings &settings() const { return settings_; }

private:
  [[nodiscard]] RpcResponse handle_get_data_dir(const RpcRequest &request) const;
  [[nodiscard]] RpcResponse handle_set_data_dir(const RpcRequest &request);
  [[nodiscard]] RpcResponse handle_get_ai_settings(const RpcRequest &request) const;
  [[nodiscard]] RpcResponse handle_save_ai_settings(const RpcRequest &request);
  [[nodiscard]] RpcResponse handle_bootstrap_instruction(const RpcRequest &request) const;
  [[nodiscard]] RpcResponse handle_list_entries(const RpcRequest &request) const;
  [[nodiscard]] RpcResponse handle_add_entry(const RpcRequest &request);
  [[nodiscard]] RpcResponse handle_update_entry(const RpcRequest &request);
  [[nodiscard]] RpcResponse handle_delete_entry(const RpcRequest &request);
  [[nodiscard]] RpcResponse handle_ai_start(const RpcRequest &request);
  [[nodiscard]] RpcResponse handle_ai_send(const RpcRequest &request);
  [[nodiscard]] RpcResponse handle_ai_read(const RpcRequest &request);
  [[nodiscard]] RpcResponse handle_ai_stop(const RpcRequest &request);

  config::Settings settings_;
  std::unique_ptr<entries::EntryStore> store_;
  ai::SessionManager sessions_;
};

} // namespace acta::rpc
