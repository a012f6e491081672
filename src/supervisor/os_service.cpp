#include "clawwatch/supervisor/os_service.hpp"

#include "clawwatch/common/fs.hpp"

#include <chrono>

namespace clawwatch::supervisor {

SystemdServiceControl::SystemdServiceControl(process::CommandRunner &runner,
                                             config::OsServiceConfig config)
    : runner_(runner), config_(std::move(config)) {}

common::Result<std::string> SystemdServiceControl::query_status(const std::string &unit) {
  process::CommandOptions options;
  options.timeout = std::chrono::seconds(config_.timeout_secs);
  const auto result =
      runner_.run(config_.command + " is-active " + process::shell_quote(unit), options);

  // is-active exits non-zero for every state but `active`, and still prints the state.
  const auto lines = common::split_lines(result.output);
  if (!lines.empty() && !common::trim(lines.front()).empty() && !result.timed_out) {
    return common::Result<std::string>::success(common::trim(lines.front()));
  }
  return common::Result<std::string>::failure("status query for " + unit + " failed: " +
                                              result.combined());
}

common::Status SystemdServiceControl::restart(const std::string &unit) {
  process::CommandOptions options;
  options.timeout = std::chrono::seconds(config_.timeout_secs);
  const auto result =
      runner_.run(config_.command + " restart " + process::shell_quote(unit), options);
  if (!result.ok) {
    return common::Status::error("restart " + unit + " failed: " + result.combined());
  }
  return common::Status::success();
}

} // namespace clawwatch::supervisor
