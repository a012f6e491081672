#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace clawwatch::common {

/// Milliseconds since the Unix epoch. Every persisted timestamp uses this unit.
[[nodiscard]] std::int64_t now_ms();

using Clock = std::function<std::int64_t()>;

[[nodiscard]] Clock system_clock();

/// Blocking wait, swapped out in tests so settle delays cost nothing.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

[[nodiscard]] Sleeper thread_sleeper();

[[nodiscard]] std::string format_clock_time(std::int64_t epoch_ms);

/// Compact age such as `42s`, `5m 3s`, `2h 10m` or `3d 4h`.
[[nodiscard]] std::string format_age(std::int64_t seconds);

} // namespace clawwatch::common
