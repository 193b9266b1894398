#include "acta/ai/prompt.hpp"

#include "acta/common/fs.hpp"

#include <algorithm>
#include <sstream>

namespace acta::ai {

std::string build_prompt(const std::string &system_instruction, const std::vector<Turn> &history,
                         const std::size_t history_window, const std::string &input) {
  std::ostringstream out;
  const std::string instruction = common::trim(system_instruction);
  if (!instruction.empty()) {
    out << instruction << "\n\n";
  }

  const std::size_t count = std::min(history_window, history.size());
  if (count > 0) {
    out << "Conversation so far:\n";
    for (std::size_t i = history.size() - count; i < history.size(); ++i) {
      out << "User: " << history[i].user << "\n";
      out << "Assistant: " << history[i].assistant << "\n\n";
    }
    out << "User: " << input;
    return out.str();
  }

  out << input;
  return out.str();
}

} // namespace acta::ai
