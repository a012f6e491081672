#include "clawwatch/monitor/cooldown.hpp"

namespace clawwatch::monitor {

bool should_notify(const state::ServiceRecord &record, const std::int64_t now_ms,
                   const std::uint64_t cooldown_secs) {
  if (!record.last_notify_ms.has_value()) {
    return true;
  }
  return now_ms - *record.last_notify_ms >= static_cast<std::int64_t>(cooldown_secs) * 1000;
}

} // namespace clawwatch::monitor
