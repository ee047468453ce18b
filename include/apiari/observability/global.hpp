#pragma once

#include "apiari/observability/observer.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace apiari::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);

void record_stream_polled(const std::string &path, std::size_t records, std::size_t skipped,
                          std::uint64_t offset);
void record_stream_appended(const std::string &path, std::uint64_t bytes);
void record_state_loaded(const std::string &path, bool found);
void record_state_saved(const std::string &path, std::uint64_t bytes);
void record_error(const std::string &component, const std::string &message);

} // namespace apiari::observability
