#include "apiari/observability/multi_observer.hpp"

namespace apiari::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer) {
    observers_.push_back(std::move(observer));
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (auto &observer : observers_) {
    observer->record_event(event);
  }
}

void MultiObserver::flush() {
  for (auto &observer : observers_) {
    observer->flush();
  }
}

} // namespace apiari::observability
