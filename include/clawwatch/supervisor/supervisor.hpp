#pragma once

#include "clawwatch/common/result.hpp"
#include "clawwatch/config/schema.hpp"
#include "clawwatch/process/command_runner.hpp"

#include <string>
#include <vector>

namespace clawwatch::supervisor {

struct ProcessInfo {
  std::string name;
  std::string status;

  [[nodiscard]] bool online() const { return status == "online"; }
};

enum class RestartOutcome {
  Restarted,
  NotRegistered,
  Failed,
};

struct RestartResult {
  RestartOutcome outcome = RestartOutcome::Failed;
  std::string detail;
};

/// Control plane of the process supervisor that manages the monitored processes.
class ProcessSupervisor {
public:
  virtual ~ProcessSupervisor() = default;

  [[nodiscard]] virtual bool ping() = 0;
  [[nodiscard]] virtual common::Result<std::vector<ProcessInfo>> list() = 0;
  [[nodiscard]] virtual RestartResult restart(const std::string &name) = 0;
  /// Register and start the processes declared in `descriptor`; `only` limits it to one.
  [[nodiscard]] virtual common::Status start(const std::string &descriptor,
                                             const std::string &only) = 0;
};

class Pm2Supervisor final : public ProcessSupervisor {
public:
  Pm2Supervisor(process::CommandRunner &runner, config::SupervisorConfig config);

  [[nodiscard]] bool ping() override;
  [[nodiscard]] common::Result<std::vector<ProcessInfo>> list() override;
  [[nodiscard]] RestartResult restart(const std::string &name) override;
  [[nodiscard]] common::Status start(const std::string &descriptor,
                                     const std::string &only) override;

private:
  [[nodiscard]] process::CommandResult invoke(const std::string &args, std::uint64_t timeout_secs,
                                              const std::string &cwd) const;

  process::CommandRunner &runner_;
  config::SupervisorConfig config_;
};

/// Parse `pm2 jlist` output. Leading noise before the JSON array is skipped.
[[nodiscard]] common::Result<std::vector<ProcessInfo>> parse_process_list(const std::string &text);

[[nodiscard]] std::string to_string(RestartOutcome outcome);

} // namespace clawwatch::supervisor
