#include "apiari/ipc/raw_record.hpp"

#include "apiari/common/fs.hpp"

namespace apiari::common {

Result<std::string> JsonCodec<ipc::RawRecord>::encode(const ipc::RawRecord &record) {
  const std::string trimmed = trim(record.json);
  if (!json_is_valid(trimmed)) {
    return Result<std::string>::failure("raw record is not well-formed JSON", ErrorKind::Encode);
  }
  return Result<std::string>::success(json_pretty(trimmed, 0));
}

Result<ipc::RawRecord> JsonCodec<ipc::RawRecord>::decode(const std::string &json) {
  return Result<ipc::RawRecord>::success(ipc::RawRecord{.json = trim(json)});
}

} // namespace apiari::common
