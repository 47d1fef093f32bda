#include "record_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"
#include "lieko/v1/record.pb.h"

namespace lieko::storage::common {

using util::ErrorCode;
using util::StorageError;

std::string EncodeCollection(const model::RecordMap& records) {
  lieko::v1::CollectionSnapshot snapshot;
  for (const auto* record : records.Records()) {
    *snapshot.add_records() = *record;
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(snapshot, &json);
  if (!status.ok()) {
    throw StorageError(ErrorCode::JsonParsingError, "encode collection: " + std::string(status.message()));
  }
  return json;
}

model::RecordMap DecodeCollection(std::string_view json, const std::string& source) {
  model::RecordMap records;
  if (json.empty()) {
    return records;
  }

  lieko::v1::CollectionSnapshot            snapshot;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &snapshot, options);
  if (!status.ok()) {
    throw StorageError(ErrorCode::JsonParsingError, source + ": " + std::string(status.message()));
  }

  for (auto& record : *snapshot.mutable_records()) {
    auto id = model::RecordId(record);
    if (!id || !model::IsValidId(*id)) {
      throw StorageError(ErrorCode::JsonParsingError, source + ": record without a valid id");
    }
    if (!records.Insert(*id, std::move(record))) {
      throw StorageError(ErrorCode::JsonParsingError, source + ": duplicate record id '" + *id + "'");
    }
  }
  return records;
}

} // namespace lieko::storage::common
