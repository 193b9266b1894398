#include "acta/ai/cli_flavor.hpp"

#include "acta/common/fs.hpp"

namespace acta::ai {

std::string_view cli_flavor_name(const CliFlavor flavor) {
  switch (flavor) {
  case CliFlavor::SimplePrint:
    return "simple-print";
  case CliFlavor::StructuredSession:
    return "structured-session";
  }
  return "structured-session";
}

CliFlavor detect_cli_flavor(const std::string &cli_path) {
  const std::string name =
      common::to_lower(std::filesystem::path(common::trim(cli_path)).filename().string());
  if (name.find("claude") != std::string::npos) {
    return CliFlavor::SimplePrint;
  }
  return CliFlavor::StructuredSession;
}

Invocation build_invocation(const CliFlavor flavor, const std::optional<std::string> &resume_token,
                            const std::filesystem::path &scratch_file) {
  Invocation invocation;
  if (flavor == CliFlavor::SimplePrint) {
    invocation.args = {"-p"};
    return invocation;
  }

  const bool resume = resume_token.has_value() && !resume_token->empty();
  invocation.args = {"exec", "--skip-git-repo-check"};
  if (!resume) {
    // Ask for JSONL events so the thread id can be picked up.
    invocation.args.emplace_back("--json");
  }
  invocation.args.emplace_back("--output-last-message");
  invocation.args.push_back(scratch_file.string());
  if (resume) {
    invocation.args.emplace_back("resume");
    invocation.args.push_back(*resume_token);
    invocation.resumed = true;
  }
  invocation.args.emplace_back("-");
  invocation.answer_file = scratch_file;
  return invocation;
}

} // namespace acta::ai
