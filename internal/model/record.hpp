#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lieko::model {

/*
  Records are open field maps of dynamically typed values.

  google::protobuf::Struct already models null/bool/number/string/
  list/object, so it is used as-is instead of a parallel value type.
*/
using Record = google::protobuf::Struct;
using Value  = google::protobuf::Value;

inline constexpr std::string_view kIdField        = "id";
inline constexpr std::string_view kCreatedAtField = "createdAt";
inline constexpr std::string_view kUpdatedAtField = "updatedAt";

// ^[A-Za-z0-9_-]+$
bool IsValidId(std::string_view id);

// Returns the id field when it is present and a string.
std::optional<std::string> RecordId(const Record& record);

void SetString(Record& record, std::string_view field, std::string_view value);

std::vector<std::string> SplitPath(std::string_view path);

// Dot-path lookup, nullptr when any segment is missing or an
// intermediate value is not an object.
const Value* FindPath(const Record& record, std::string_view path);
Value*       MutablePath(Record& record, std::string_view path);

// Structural equality; numbers compare by value.
bool DeepEquals(const Value& a, const Value& b);

/*
  Id -> record mapping of one collection.

  Iteration follows insertion order; replacing a record keeps its slot.
*/
class RecordMap {
 public:
  bool Contains(const std::string& id) const;

  const Record* Find(const std::string& id) const;

  // false if the id is already taken
  bool Insert(const std::string& id, Record record);

  // replace in place, append when absent
  void Put(const std::string& id, Record record);

  bool Erase(const std::string& id);

  std::size_t Size() const {
    return order_.size();
  }

  bool Empty() const {
    return order_.empty();
  }

  const std::vector<std::string>& Ids() const {
    return order_;
  }

  // records in insertion order
  std::vector<const Record*> Records() const;

 private:
  std::vector<std::string>                order_;
  std::unordered_map<std::string, Record> records_;
};

} // namespace lieko::model
