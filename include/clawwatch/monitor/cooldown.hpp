#pragma once

#include "clawwatch/state/snapshot.hpp"

#include <cstdint>

namespace clawwatch::monitor {

/// True when `record` has never been notified about, or the last notification is at least
/// `cooldown_secs` old.
[[nodiscard]] bool should_notify(const state::ServiceRecord &record, std::int64_t now_ms,
                                 std::uint64_t cooldown_secs);

} // namespace clawwatch::monitor
