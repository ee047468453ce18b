#include "apiari/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace apiari::observability {

namespace {

void log_line(std::ostream &out, const std::string &level, const std::string &message) {
  out << "[" << level << "] " << message << "\n";
}

} // namespace

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, StreamPolledEvent>) {
          log_line(*out_, "DEBUG",
                   "stream.poll path=" + evt.path + " records=" + std::to_string(evt.records) +
                       " skipped=" + std::to_string(evt.skipped) +
                       " offset=" + std::to_string(evt.offset));
        } else if constexpr (std::is_same_v<T, StreamAppendedEvent>) {
          log_line(*out_, "DEBUG",
                   "stream.append path=" + evt.path + " bytes=" + std::to_string(evt.bytes));
        } else if constexpr (std::is_same_v<T, StateLoadedEvent>) {
          log_line(*out_, "DEBUG",
                   "state.load path=" + evt.path +
                       " found=" + (evt.found ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, StateSavedEvent>) {
          log_line(*out_, "INFO",
                   "state.save path=" + evt.path + " bytes=" + std::to_string(evt.bytes));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(*out_, "ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::flush() { out_->flush(); }

} // namespace apiari::observability
