#include "apiari/observability/global.hpp"

#include <mutex>

namespace apiari::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_stream_polled(const std::string &path, const std::size_t records,
                          const std::size_t skipped, const std::uint64_t offset) {
  record_event(
      StreamPolledEvent{.path = path, .records = records, .skipped = skipped, .offset = offset});
}

void record_stream_appended(const std::string &path, const std::uint64_t bytes) {
  record_event(StreamAppendedEvent{.path = path, .bytes = bytes});
}

void record_state_loaded(const std::string &path, const bool found) {
  record_event(StateLoadedEvent{.path = path, .found = found});
}

void record_state_saved(const std::string &path, const std::uint64_t bytes) {
  record_event(StateSavedEvent{.path = path, .bytes = bytes});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace apiari::observability
