#pragma once

#include "clawwatch/common/result.hpp"
#include "clawwatch/config/schema.hpp"
#include "clawwatch/process/command_runner.hpp"

#include <string>

namespace clawwatch::supervisor {

/// OS-level service manager, used for the tunnel service that runs outside the supervisor.
class OsServiceControl {
public:
  virtual ~OsServiceControl() = default;
  [[nodiscard]] virtual common::Result<std::string> query_status(const std::string &unit) = 0;
  [[nodiscard]] virtual common::Status restart(const std::string &unit) = 0;
};

class SystemdServiceControl final : public OsServiceControl {
public:
  SystemdServiceControl(process::CommandRunner &runner, config::OsServiceConfig config);

  [[nodiscard]] common::Result<std::string> query_status(const std::string &unit) override;
  [[nodiscard]] common::Status restart(const std::string &unit) override;

private:
  process::CommandRunner &runner_;
  config::OsServiceConfig config_;
};

} // namespace clawwatch::supervisor
