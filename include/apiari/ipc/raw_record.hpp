#pragma once

#include "apiari/common/json_codec.hpp"

#include <string>

namespace apiari::ipc {

/// A record that keeps the verbatim text of one JSON value.
struct RawRecord {
  std::string json;

  bool operator==(const RawRecord &) const = default;
};

} // namespace apiari::ipc

namespace apiari::common {

template <> struct JsonCodec<ipc::RawRecord> {
  static Result<std::string> encode(const ipc::RawRecord &record);
  static Result<ipc::RawRecord> decode(const std::string &json);
};

} // namespace apiari::common
