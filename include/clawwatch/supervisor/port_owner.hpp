#pragma once

#include "clawwatch/common/result.hpp"
#include "clawwatch/process/command_runner.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace clawwatch::supervisor {

class PortOwner {
public:
  virtual ~PortOwner() = default;
  [[nodiscard]] virtual std::optional<int> find_listener(std::uint16_t port) = 0;
  /// Force-kill `pid`. A process that is already gone counts as success.
  [[nodiscard]] virtual common::Status terminate(int pid) = 0;
};

class LsofPortOwner final : public PortOwner {
public:
  explicit LsofPortOwner(process::CommandRunner &runner);

  [[nodiscard]] std::optional<int> find_listener(std::uint16_t port) override;
  [[nodiscard]] common::Status terminate(int pid) override;

private:
  process::CommandRunner &runner_;
};

[[nodiscard]] std::optional<int> parse_listener_pid(const std::string &text);

} // namespace clawwatch::supervisor
