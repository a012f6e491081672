#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "clawwatch/process/command_runner.hpp"

#include <chrono>

void register_process_tests(std::vector<clawwatch::tests::TestCase> &tests) {
  using clawwatch::tests::require;
  namespace pr = clawwatch::process;
  namespace ct = clawwatch::testing;

  tests.push_back({"process_runner_captures_both_streams", [] {
                     pr::ShellCommandRunner runner;
                     const auto result = runner.run("echo out; echo err 1>&2", pr::CommandOptions{});
                     require(result.ok, "command should succeed");
                     require(result.exit_code == 0, "exit code");
                     require(result.output == "out", "stdout: " + result.output);
                     require(result.errors == "err", "stderr: " + result.errors);
                     require(result.combined() == "out\nerr", "combined output");
                   }});

  tests.push_back({"process_runner_reports_exit_code", [] {
                     pr::ShellCommandRunner runner;
                     const auto result = runner.run("exit 3", pr::CommandOptions{});
                     require(!result.ok, "non-zero exit is a failure");
                     require(result.exit_code == 3, "exit code " + std::to_string(result.exit_code));
                     require(!result.timed_out, "not a timeout");
                   }});

  tests.push_back({"process_runner_kills_on_timeout", [] {
                     pr::ShellCommandRunner runner;
                     pr::CommandOptions options;
                     options.timeout = std::chrono::milliseconds(200);
                     const auto started = std::chrono::steady_clock::now();
                     const auto result = runner.run("sleep 5; echo late", options);
                     const auto elapsed = std::chrono::steady_clock::now() - started;

                     require(result.timed_out, "should time out");
                     require(!result.ok, "timeout is a failure");
                     require(result.output.find("late") == std::string::npos,
                             "command should not finish");
                     require(elapsed < std::chrono::seconds(3), "runner waited too long");
                   }});

  tests.push_back({"process_runner_honours_cwd", [] {
                     ct::TempWorkspace workspace;
                     workspace.create_file("marker.txt", "here");
                     pr::ShellCommandRunner runner;
                     pr::CommandOptions options;
                     options.cwd = workspace.path().string();
                     const auto result = runner.run("cat marker.txt", options);
                     require(result.ok, result.errors);
                     require(result.output == "here", "cwd was not applied");

                     options.cwd = (workspace.path() / "missing").string();
                     require(runner.run("true", options).exit_code == 126,
                             "missing cwd should fail before exec");
                   }});

  tests.push_back({"process_shell_quote_survives_the_shell", [] {
                     require(pr::shell_quote("it's") == "'it'\\''s'", "quote escaping");
                     pr::ShellCommandRunner runner;
                     const auto result =
                         runner.run("printf %s " + pr::shell_quote("a 'b' $HOME"), pr::CommandOptions{});
                     require(result.output == "a 'b' $HOME", "quoted text changed: " + result.output);
                   }});
}
