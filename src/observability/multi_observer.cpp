#include "clawwatch/observability/multi_observer.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace clawwatch::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer != nullptr) {
    observers_.push_back(std::move(observer));
  }
}

template <typename Fn> void MultiObserver::for_each_backend(Fn &&fn) {
  for (auto &observer : observers_) {
    try {
      fn(*observer);
    } catch (const std::exception &e) {
      ++failures_;
      std::cerr << "[observability] " << observer->name() << " failed: " << e.what() << "\n";
    }
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for_each_backend([&event](IObserver &observer) { observer.record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for_each_backend([&metric](IObserver &observer) { observer.record_metric(metric); });
}

void MultiObserver::flush() {
  for_each_backend([](IObserver &observer) { observer.flush(); });
}

} // namespace clawwatch::observability
