#pragma once

#include "apiari/observability/observer.hpp"

namespace apiari::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace apiari::observability
