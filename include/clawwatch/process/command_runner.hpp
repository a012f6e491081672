#pragma once

#include <chrono>
#include <string>

namespace clawwatch::process {

struct CommandOptions {
  std::chrono::milliseconds timeout{std::chrono::seconds(15)};
  std::string cwd;
};

struct CommandResult {
  bool ok = false;
  int exit_code = -1;
  bool timed_out = false;
  std::string output;
  std::string errors;

  [[nodiscard]] std::string combined() const;
};

class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  /// Runs `command` through the shell. Failures to spawn, non-zero exits and timeouts are
  /// all reported through the result; this never throws.
  [[nodiscard]] virtual CommandResult run(const std::string &command,
                                          const CommandOptions &options) = 0;
};

/// Runs commands with `/bin/sh -c` in a fresh process group. On timeout the whole group is
/// killed so grandchildren spawned by the command do not outlive it.
class ShellCommandRunner final : public CommandRunner {
public:
  [[nodiscard]] CommandResult run(const std::string &command,
                                  const CommandOptions &options) override;
};

[[nodiscard]] std::string shell_quote(const std::string &value);

} // namespace clawwatch::process
