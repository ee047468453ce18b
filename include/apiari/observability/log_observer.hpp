#pragma once

#include "apiari/observability/observer.hpp"

#include <iosfwd>

namespace apiari::observability {

/// Writes one "[LEVEL] event key=value..." line per event.
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  std::ostream *out_;
};

} // namespace apiari::observability
