#include "clawwatch/observability/factory.hpp"

#include "clawwatch/common/fs.hpp"
#include "clawwatch/observability/log_observer.hpp"
#include "clawwatch/observability/multi_observer.hpp"

#include <iostream>
#include <sstream>

namespace clawwatch::observability {

namespace {

class SilentObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

// nullptr for names that are not a backend.
std::unique_ptr<IObserver> make_backend(const std::string &name) {
  if (name == "log" || name == "stderr") {
    return std::make_unique<LogObserver>();
  }
  if (name == "stdout") {
    return std::make_unique<LogObserver>(std::cout);
  }
  if (name == "none" || name == "noop") {
    return std::make_unique<SilentObserver>();
  }
  return nullptr;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &observability) {
  const std::string backend = common::to_lower(common::trim(observability.backend));
  if (backend.empty()) {
    return std::make_unique<SilentObserver>();
  }

  if (backend.find(',') == std::string::npos) {
    if (auto observer = make_backend(backend); observer != nullptr) {
      return observer;
    }
    return std::make_unique<LogObserver>();
  }

  auto multi = std::make_unique<MultiObserver>();
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    multi->add(make_backend(common::trim(part)));
  }
  if (multi->size() == 0) {
    return std::make_unique<LogObserver>();
  }
  return multi;
}

} // namespace clawwatch::observability
