#include "test_framework.hpp"

#include "acta/process/runner.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <mutex>
#include <thread>

void register_process_tests(std::vector<acta::tests::TestCase> &tests) {
  using acta::tests::require;
  namespace process = acta::process;
  namespace t = acta::testing;

  tests.push_back({"process_feeds_stdin_and_collects_stdout", [] {
                     process::ProcessRequest request;
                     request.executable = "cat";
                     request.input = "hello\nworld\n";
                     const auto result = process::run_process(request);
                     require(result.spawned(), "cat did not spawn");
                     require(result.exit_code == 0, "exit code");
                     require(result.stdout_text == "hello\nworld\n", "stdout: " +
                                                                         result.stdout_text);
                     require(result.stderr_text.empty(), "stderr should be empty");
                   }});

  tests.push_back({"process_separates_streams_and_reports_exit_code", [] {
                     process::ProcessRequest request;
                     request.executable = "/bin/sh";
                     request.args = {"-c", "echo out; echo err >&2; exit 7"};
                     const auto result = process::run_process(request);
                     require(result.exit_code == 7, "exit code");
                     require(result.stdout_text == "out\n", "stdout");
                     require(result.stderr_text == "err\n", "stderr");
                     require(!result.error.has_value(), "no runner error");
                   }});

  tests.push_back({"process_signal_exit_maps_to_128_plus_signal", [] {
                     process::ProcessRequest request;
                     request.executable = "/bin/sh";
                     request.args = {"-c", "kill -TERM $$"};
                     const auto result = process::run_process(request);
                     require(result.exit_code == 143, "exit code " +
                                                          std::to_string(result.exit_code));
                   }});

  tests.push_back({"process_missing_binary_is_a_spawn_failure", [] {
                     process::ProcessRequest request;
                     request.executable = "/nonexistent/acta-no-such-binary";
                     request.input = "ignored";
                     const auto result = process::run_process(request);
                     require(!result.spawned(), "should not spawn");
                     require(result.exit_code == process::kSpawnFailureExitCode, "exit code");
                     require(result.error->find("acta-no-such-binary") != std::string::npos,
                             "error should name the binary");
                   }});

  tests.push_back({"process_non_executable_file_is_a_spawn_failure", [] {
                     t::TempWorkspace ws;
                     ws.create_file("plain.txt", "not a program");
                     process::ProcessRequest request;
                     request.executable = (ws.path() / "plain.txt").string();
                     const auto result = process::run_process(request);
                     require(!result.spawned(), "plain file should not spawn");
                     require(result.exit_code == -1, "exit code");
                   }});

  tests.push_back({"process_runs_in_working_directory", [] {
                     t::TempWorkspace ws;
                     process::ProcessRequest request;
                     request.executable = "pwd";
                     request.args = {"-P"};
                     request.working_dir = ws.path();
                     const auto result = process::run_process(request);
                     require(result.exit_code == 0, "pwd failed");
                     require(result.stdout_text ==
                                 std::filesystem::canonical(ws.path()).string() + "\n",
                             "cwd: " + result.stdout_text);
                   }});

  tests.push_back({"process_stdout_callback_sees_data_before_exit", [] {
                     t::TempWorkspace ws;
                     const auto flag = ws.path() / "seen";
                     process::ProcessRequest request;
                     request.executable = "/bin/sh";
                     request.args = {"-c", "echo first; i=0; while [ ! -f '" + flag.string() +
                                               "' ] && [ $i -lt 100 ]; do sleep 0.05; "
                                               "i=$((i+1)); done; "
                                               "if [ -f '" + flag.string() +
                                               "' ]; then echo second; else echo timeout; fi"};
                     std::string streamed;
                     const auto result =
                         process::run_process(request, [&](const std::string_view chunk) {
                           streamed.append(chunk.data(), chunk.size());
                           if (streamed.find("first\n") != std::string::npos) {
                             ws.create_file("seen", "");
                           }
                         });
                     require(result.stdout_text == "first\nsecond\n",
                             "stdout: " + result.stdout_text);
                     require(streamed == result.stdout_text, "callback saw different data");
                   }});

  tests.push_back({"process_large_input_does_not_deadlock", [] {
                     process::ProcessRequest request;
                     request.executable = "cat";
                     request.input = std::string(512 * 1024, 'x');
                     const auto result = process::run_process(request);
                     require(result.exit_code == 0, "cat failed");
                     require(result.stdout_text.size() == request.input.size(), "size mismatch");
                   }});

  tests.push_back({"process_output_is_capped", [] {
                     process::ProcessRequest request;
                     request.executable = "head";
                     request.args = {"-c", std::to_string(process::kMaxOutputBytes + 4096),
                                     "/dev/zero"};
                     const auto result = process::run_process(request);
                     require(result.stdout_truncated, "truncation not flagged");
                     require(result.stdout_text.size() == process::kMaxOutputBytes, "cap size");
                     require(!result.stderr_truncated, "stderr not truncated");
                   }});

  tests.push_back({"process_handle_terminates_running_child", [] {
                     process::ProcessHandle handle;
                     process::ProcessRequest request;
                     request.executable = "/bin/sh";
                     request.args = {"-c", "exec sleep 30"};
                     process::ProcessResult result;
                     std::thread runner([&] { result = process::run_process(request, {}, &handle); });
                     require(t::wait_until([&] { return handle.running(); }), "never started");
                     handle.terminate();
                     runner.join();
                     require(result.exit_code == 143, "exit code " +
                                                          std::to_string(result.exit_code));
                     require(handle.signalled(), "signalled flag");
                     require(!handle.running(), "handle still running");
                     handle.kill();
                   }});

  tests.push_back({"process_handle_signal_before_start_is_delivered", [] {
                     process::ProcessHandle handle;
                     handle.terminate();
                     process::ProcessRequest request;
                     request.executable = "/bin/sh";
                     request.args = {"-c", "exec sleep 30"};
                     const auto started = std::chrono::steady_clock::now();
                     const auto result = process::run_process(request, {}, &handle);
                     require(std::chrono::steady_clock::now() - started < std::chrono::seconds(10),
                             "pending signal was not delivered");
                     require(result.exit_code == 143, "exit code " +
                                                          std::to_string(result.exit_code));
                   }});
}
