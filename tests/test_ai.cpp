#include "test_framework.hpp"

#include "acta/ai/cli_flavor.hpp"
#include "acta/ai/prompt.hpp"
#include "acta/ai/session.hpp"
#include "acta/ai/thread_events.hpp"

#include <algorithm>

namespace {

bool has_arg(const std::vector<std::string> &args, const std::string &arg) {
  return std::find(args.begin(), args.end(), arg) != args.end();
}

} // namespace

void register_ai_tests(std::vector<acta::tests::TestCase> &tests) {
  using acta::tests::require;
  namespace ai = acta::ai;

  tests.push_back({"ai_flavor_detection_uses_file_name", [] {
                     require(ai::detect_cli_flavor("/usr/local/bin/claude") ==
                                 ai::CliFlavor::SimplePrint,
                             "claude");
                     require(ai::detect_cli_flavor("C:/tools/Claude-Code") ==
                                 ai::CliFlavor::SimplePrint,
                             "case insensitive");
                     require(ai::detect_cli_flavor("/usr/bin/codex") ==
                                 ai::CliFlavor::StructuredSession,
                             "codex");
                     require(ai::detect_cli_flavor("/opt/claude/bin/mockcli") ==
                                 ai::CliFlavor::StructuredSession,
                             "only the file name counts");
                   }});

  tests.push_back({"ai_invocation_for_simple_print", [] {
                     const auto invocation = ai::build_invocation(
                         ai::CliFlavor::SimplePrint, std::string("ignored"), "/tmp/answer.txt");
                     require(invocation.args == std::vector<std::string>({"-p"}), "args");
                     require(!invocation.answer_file.has_value(), "answer comes from stdout");
                     require(!invocation.resumed, "never resumed");
                   }});

  tests.push_back({"ai_invocation_for_structured_session", [] {
                     const auto fresh = ai::build_invocation(ai::CliFlavor::StructuredSession,
                                                             std::nullopt, "/tmp/answer.txt");
                     require(fresh.args == std::vector<std::string>(
                                               {"exec", "--skip-git-repo-check", "--json",
                                                "--output-last-message", "/tmp/answer.txt", "-"}),
                             "fresh args");
                     require(fresh.answer_file == std::filesystem::path("/tmp/answer.txt"),
                             "answer file");
                     require(!fresh.resumed, "fresh turn is not resumed");

                     const auto resumed = ai::build_invocation(
                         ai::CliFlavor::StructuredSession, std::string("thread-9"),
                         "/tmp/answer.txt");
                     require(resumed.resumed, "resumed flag");
                     require(!has_arg(resumed.args, "--json"), "no json on resume");
                     require(resumed.args.size() >= 3 &&
                                 resumed.args[resumed.args.size() - 3] == "resume" &&
                                 resumed.args[resumed.args.size() - 2] == "thread-9" &&
                                 resumed.args.back() == "-",
                             "resume args");
                   }});

  tests.push_back({"ai_line_scanner_splits_across_chunks", [] {
                     ai::LineScanner scanner;
                     std::vector<std::string> lines;
                     const auto collect = [&lines](const std::string &line) {
                       lines.push_back(line);
                     };
                     scanner.feed("{\"type\":\"thr", collect);
                     scanner.feed("ead.started\"}\r\nsecond\nthi", collect);
                     scanner.feed("rd", collect);
                     scanner.finish(collect);
                     require(lines == std::vector<std::string>(
                                          {"{\"type\":\"thread.started\"}", "second", "third"}),
                             "lines mismatch");
                   }});

  tests.push_back({"ai_thread_started_event_is_recognized", [] {
                     require(ai::parse_thread_started(
                                 R"({"type":"thread.started","thread_id":"abc-123"})") ==
                                 std::optional<std::string>("abc-123"),
                             "thread id");
                     require(ai::parse_thread_started(
                                 R"(  {"thread_id":"x","type":"thread.started","extra":{}} )") ==
                                 std::optional<std::string>("x"),
                             "key order and whitespace");
                     require(!ai::parse_thread_started(R"({"type":"turn.completed"})").has_value(),
                             "other event");
                     require(!ai::parse_thread_started(R"({"type":"thread.started"})").has_value(),
                             "missing id");
                     require(!ai::parse_thread_started("thread.started abc").has_value(),
                             "plain text");
                   }});

  tests.push_back({"ai_prompt_uses_bounded_history_window", [] {
                     std::vector<ai::Turn> history;
                     for (int i = 1; i <= 5; ++i) {
                       history.push_back({"q" + std::to_string(i), "a" + std::to_string(i)});
                     }
                     const std::string prompt = ai::build_prompt("be brief", history, 2, "q6");
                     require(prompt.rfind("be brief\n\n", 0) == 0, "instruction first");
                     require(prompt.find("q3") == std::string::npos, "old turn included");
                     require(prompt.find("User: q4\nAssistant: a4\n") != std::string::npos,
                             "q4 missing");
                     require(prompt.find("q4") < prompt.find("q5"), "oldest first");
                     require(prompt.size() >= 8 && prompt.substr(prompt.size() - 8) == "User: q6",
                             "input last");

                     require(ai::build_prompt("", {}, 8, "hello") == "hello", "bare input");
                     require(ai::build_prompt("sys", history, 0, "x") == "sys\n\nx",
                             "zero window");
                   }});

  tests.push_back({"ai_successful_outcome_commits_thread_and_history", [] {
                     ai::Session session;
                     session.busy = true;
                     session.last_error = "old";
                     ai::TurnOutcome outcome;
                     outcome.input = "hello";
                     outcome.answer = "  hi there \n";
                     outcome.thread_id = "t-1";
                     ai::apply_turn_outcome(session, outcome);
                     require(!session.busy, "busy cleared");
                     require(session.last_exit_code == 0, "exit code");
                     require(!session.last_error.has_value(), "error cleared");
                     require(session.resume_token == std::optional<std::string>("t-1"), "token");
                     require(session.history.size() == 1 && session.history[0].user == "hello" &&
                                 session.history[0].assistant == "hi there",
                             "history");
                     require(session.output_queue.size() == 1 &&
                                 session.output_queue.front() == "hi there",
                             "queue");

                     ai::TurnOutcome next;
                     next.input = "again";
                     next.answer = "sure";
                     ai::apply_turn_outcome(session, next);
                     require(session.resume_token == std::optional<std::string>("t-1"),
                             "token kept without a new thread id");
                   }});

  tests.push_back({"ai_failed_outcome_clears_token_and_queues_diagnostic", [] {
                     ai::Session session;
                     session.busy = true;
                     session.resume_token = "t-1";
                     ai::TurnOutcome outcome;
                     outcome.input = "hello";
                     outcome.exit_code = 2;
                     outcome.answer = "partial";
                     outcome.stdout_text = "out text";
                     outcome.stderr_text = "  err text\n";
                     outcome.thread_id = "t-2";
                     ai::apply_turn_outcome(session, outcome);
                     require(!session.busy, "busy cleared");
                     require(!session.resume_token.has_value(), "token cleared");
                     require(session.history.empty(), "no history on failure");
                     require(session.output_queue.back() == "err text", "stderr preferred");
                     require(session.last_exit_code == 2, "exit code");

                     ai::TurnOutcome empty_answer;
                     empty_answer.stdout_text = "only stdout";
                     require(!ai::turn_succeeded(empty_answer), "empty answer is a failure");
                     require(ai::failure_diagnostic(empty_answer) == "only stdout",
                             "stdout fallback");

                     ai::TurnOutcome silent;
                     silent.exit_code = 9;
                     require(ai::failure_diagnostic(silent) == "[AI run failed: code=9]",
                             "generic marker");
                   }});

  tests.push_back({"ai_spawn_failure_sets_last_error", [] {
                     ai::Session session;
                     session.busy = true;
                     ai::TurnOutcome outcome;
                     outcome.exit_code = -1;
                     outcome.error = "cannot run /nope: No such file or directory";
                     ai::apply_turn_outcome(session, outcome);
                     require(session.last_error == outcome.error, "last error");
                     require(session.output_queue.back().rfind("[AI run failed: code=-1]", 0) == 0,
                             "diagnostic marker");
                   }});
}
