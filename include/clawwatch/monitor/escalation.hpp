#pragma once

#include "clawwatch/config/schema.hpp"
#include "clawwatch/process/command_runner.hpp"
#include "clawwatch/state/snapshot.hpp"

#include <cstdint>
#include <string>

namespace clawwatch::monitor {

enum class EscalationOutcome {
  Disabled,
  CooldownActive,
  BudgetExhausted,
  Recovered,
  StillFailed,
};

[[nodiscard]] std::string to_string(EscalationOutcome outcome);

[[nodiscard]] bool attempted(EscalationOutcome outcome);

/// Rate-limited invocation of the external recovery script. The cooldown is checked before the
/// attempt budget, so a cooling-down cycle never touches the counter.
class EscalationController {
public:
  EscalationController(config::EscalationConfig config, process::CommandRunner &runner);

  [[nodiscard]] EscalationOutcome escalate(state::EscalationState &state, std::int64_t now_ms);

  [[nodiscard]] std::string command_line() const;
  [[nodiscard]] const config::EscalationConfig &config() const { return config_; }

private:
  config::EscalationConfig config_;
  process::CommandRunner &runner_;
};

} // namespace clawwatch::monitor
