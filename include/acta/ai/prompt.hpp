#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace acta::ai {

inline constexpr std::size_t kDefaultHistoryTurns = 8;

struct Turn {
  std::string user;
  std::string assistant;
};

[[nodiscard]] std::string build_prompt(const std::string &system_instruction,
                                       const std::vector<Turn> &history,
                                       std::size_t history_window, const std::string &input);

} // namespace acta::ai
