#include "acta/ai/session.hpp"

#include "acta/common/fs.hpp"

namespace acta::ai {

bool turn_succeeded(const TurnOutcome &outcome) {
  return !outcome.error.has_value() && outcome.exit_code == 0 &&
         !common::trim(outcome.answer).empty();
}

std::string failure_diagnostic(const TurnOutcome &outcome) {
  if (std::string text = common::trim(outcome.stderr_text); !text.empty()) {
    return text;
  }
  if (std::string text = common::trim(outcome.stdout_text); !text.empty()) {
    return text;
  }
  std::string marker = "[AI run failed: code=" + std::to_string(outcome.exit_code) + "]";
  if (outcome.error.has_value()) {
    marker += " " + *outcome.error;
  }
  return marker;
}

void apply_turn_outcome(Session &session, const TurnOutcome &outcome) {
  session.busy = false;
  session.last_exit_code = outcome.exit_code;
  session.last_error = outcome.error;

  if (!turn_succeeded(outcome)) {
    session.resume_token.reset();
    session.output_queue.push_back(failure_diagnostic(outcome));
    return;
  }

  const std::string answer = common::trim(outcome.answer);
  session.history.push_back(Turn{.user = outcome.input, .assistant = answer});
  session.output_queue.push_back(answer);
  if (outcome.thread_id.has_value() && !outcome.thread_id->empty()) {
    session.resume_token = outcome.thread_id;
  }
}

} // namespace acta::ai
