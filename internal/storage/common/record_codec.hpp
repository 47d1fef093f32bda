#pragma once

#include <string>
#include <string_view>

#include "internal/model/record.hpp"

namespace lieko::storage::common {

/*
  On-disk JSON form of a collection:

    {"records":[{"id":"a",...},{"id":"b",...}]}

  A list rather than an id-keyed object keeps insertion order.
*/

std::string EncodeCollection(const model::RecordMap& records);

// Throws StorageError(JSON_PARSING_ERROR) on malformed input,
// including records without a valid id or with duplicate ids.
model::RecordMap DecodeCollection(std::string_view json, const std::string& source);

} // namespace lieko::storage::common
