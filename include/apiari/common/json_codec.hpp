#pragma once

#include "apiari/common/json_util.hpp"
#include "apiari/common/result.hpp"

#include <string>

namespace apiari::common {

/// Maps a type onto a single JSON value. Specialize for every record or state type:
///
///   template <> struct JsonCodec<MyType> {
///     static Result<std::string> encode(const MyType &value);
///     static Result<MyType> decode(const std::string &json);
///   };
///
/// decode() only ever sees text that already passed json_is_valid().
template <typename T> struct JsonCodec;

template <typename T> [[nodiscard]] Result<std::string> encode_json(const T &value) {
  auto encoded = JsonCodec<T>::encode(value);
  if (!encoded.ok()) {
    return Result<std::string>::failure(encoded.error(), ErrorKind::Encode);
  }
  const std::string &text = encoded.value();
  if (text.find('\n') != std::string::npos || text.find('\r') != std::string::npos) {
    return Result<std::string>::failure("encoded value spans multiple lines", ErrorKind::Encode);
  }
  if (!json_is_valid(text)) {
    return Result<std::string>::failure("encoded value is not well-formed JSON",
                                        ErrorKind::Encode);
  }
  return encoded;
}

template <typename T> [[nodiscard]] Result<T> decode_json(const std::string &text) {
  if (!json_is_valid(text)) {
    return Result<T>::failure("malformed JSON", ErrorKind::Decode);
  }
  auto decoded = JsonCodec<T>::decode(text);
  if (!decoded.ok()) {
    return Result<T>::failure(decoded.error(), ErrorKind::Decode);
  }
  return decoded;
}

} // namespace apiari::common
