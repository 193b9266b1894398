#pragma once

#include "acta/ai/cli_flavor.hpp"
#include "acta/ai/prompt.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace acta::ai {

struct Session {
  std::string id;
  std::string cli_path;
  CliFlavor flavor = CliFlavor::StructuredSession;

  bool needs_bootstrap = true;
  std::string system_instruction;
  std::optional<std::string> resume_token;
  std::vector<Turn> history;
  std::deque<std::string> output_queue;

  bool alive = true;
  bool busy = false;
  std::optional<int> last_exit_code;
  std::optional<std::string> last_error;
  /// Matches a completion to the turn that started it.
  std::uint64_t turn_seq = 0;
};

struct TurnOutcome {
  std::string input;
  int exit_code = 0;
  std::string answer;
  std::string stdout_text;
  std::string stderr_text;
  std::optional<std::string> thread_id;
  std::optional<std::string> error;
};

[[nodiscard]] bool turn_succeeded(const TurnOutcome &outcome);

[[nodiscard]] std::string failure_diagnostic(const TurnOutcome &outcome);

void apply_turn_outcome(Session &session, const TurnOutcome &outcome);

} // namespace acta::ai
