#include "clawwatch/monitor/escalation.hpp"

#include "clawwatch/observability/global.hpp"

#include <chrono>

namespace clawwatch::monitor {

std::string to_string(const EscalationOutcome outcome) {
  switch (outcome) {
  case EscalationOutcome::Disabled:
    return "disabled";
  case EscalationOutcome::CooldownActive:
    return "cooldown";
  case EscalationOutcome::BudgetExhausted:
    return "budget exhausted";
  case EscalationOutcome::Recovered:
    return "recovered";
  case EscalationOutcome::StillFailed:
    return "still failed";
  }
  return "disabled";
}

bool attempted(const EscalationOutcome outcome) {
  return outcome == EscalationOutcome::Recovered || outcome == EscalationOutcome::StillFailed;
}

EscalationController::EscalationController(config::EscalationConfig config,
                                           process::CommandRunner &runner)
    : config_(std::move(config)), runner_(runner) {}

std::string EscalationController::command_line() const {
  return config_.interpreter + " " + process::shell_quote(config_.script_path) + " --repair";
}

EscalationOutcome EscalationController::escalate(state::EscalationState &state,
                                                 const std::int64_t now_ms) {
  if (!config_.enabled) {
    return EscalationOutcome::Disabled;
  }

  const auto cooldown_ms = static_cast<std::int64_t>(config_.cooldown_secs) * 1000;
  if (state.last_attempt_ms.has_value() && now_ms - *state.last_attempt_ms < cooldown_ms) {
    const auto remaining = (cooldown_ms - (now_ms - *state.last_attempt_ms)) / 1000;
    observability::record_escalation(to_string(EscalationOutcome::CooldownActive),
                                     state.attempt_count,
                                     std::to_string(remaining) + "s remaining");
    return EscalationOutcome::CooldownActive;
  }

  if (state.attempt_count >= config_.max_retries) {
    observability::record_escalation(to_string(EscalationOutcome::BudgetExhausted),
                                     state.attempt_count,
                                     "max " + std::to_string(config_.max_retries));
    return EscalationOutcome::BudgetExhausted;
  }

  state.last_attempt_ms = now_ms;
  ++state.attempt_count;
  observability::record_info("escalation", "running " + command_line() + " (attempt " +
                                               std::to_string(state.attempt_count) + "/" +
                                               std::to_string(config_.max_retries) + ")");

  process::CommandOptions options;
  options.timeout = std::chrono::seconds(config_.timeout_secs);
  const auto result = runner_.run(command_line(), options);

  if (result.ok) {
    state.attempt_count = 0;
    observability::record_escalation(to_string(EscalationOutcome::Recovered), state.attempt_count);
    return EscalationOutcome::Recovered;
  }

  std::string detail = result.timed_out ? "timed out" : "exit " + std::to_string(result.exit_code);
  observability::record_escalation(to_string(EscalationOutcome::StillFailed), state.attempt_count,
                                   detail);
  return EscalationOutcome::StillFailed;
}

} // namespace clawwatch::monitor
