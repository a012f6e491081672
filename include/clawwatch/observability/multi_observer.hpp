#pragma once

#include "clawwatch/observability/observer.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace clawwatch::observability {

/// Fans events out to several backends. A backend that throws is reported on stderr and the
/// remaining backends still receive the event.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }
  [[nodiscard]] std::uint64_t failures() const { return failures_.load(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  template <typename Fn> void for_each_backend(Fn &&fn);

  std::vector<std::unique_ptr<IObserver>> observers_;
  std::atomic<std::uint64_t> failures_{0};
};

} // namespace clawwatch::observability
