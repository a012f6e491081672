#pragma once

#include "clawwatch/config/schema.hpp"
#include "clawwatch/observability/observer.hpp"

#include <memory>

namespace clawwatch::observability {

/// `log`/`stderr` and `stdout` write log lines, `none` is silent, a comma list combines
/// backends. An empty backend is silent; an unknown one falls back to `log`.
[[nodiscard]] std::unique_ptr<IObserver>
create_observer(const config::ObservabilityConfig &observability);

} // namespace clawwatch::observability
