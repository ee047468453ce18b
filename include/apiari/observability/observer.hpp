#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace apiari::observability {

struct StreamPolledEvent {
  std::string path;
  std::size_t records = 0;
  std::size_t skipped = 0;
  std::uint64_t offset = 0;
};

struct StreamAppendedEvent {
  std::string path;
  std::uint64_t bytes = 0;
};

struct StateLoadedEvent {
  std::string path;
  bool found = false;
};

struct StateSavedEvent {
  std::string path;
  std::uint64_t bytes = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<StreamPolledEvent, StreamAppendedEvent, StateLoadedEvent,
                                   StateSavedEvent, ErrorEvent>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace apiari::observability
