#include "record.hpp"

#include <algorithm>

namespace lieko::model {

bool IsValidId(std::string_view id) {
  if (id.empty()) return false;
  return std::all_of(id.begin(), id.end(), [](char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
  });
}

std::optional<std::string> RecordId(const Record& record) {
  auto it = record.fields().find(std::string(kIdField));
  if (it == record.fields().end() || it->second.kind_case() != Value::kStringValue) {
    return std::nullopt;
  }
  return it->second.string_value();
}

void SetString(Record& record, std::string_view field, std::string_view value) {
  (*record.mutable_fields())[std::string(field)].set_string_value(std::string(value));
}

std::vector<std::string> SplitPath(std::string_view path) {
  std::vector<std::string> parts;
  std::size_t              start = 0;
  while (true) {
    const auto dot = path.find('.', start);
    if (dot == std::string_view::npos) {
      parts.emplace_back(path.substr(start));
      break;
    }
    parts.emplace_back(path.substr(start, dot - start));
    start = dot + 1;
  }
  return parts;
}

const Value* FindPath(const Record& record, std::string_view path) {
  const Record* current = &record;
  const Value*  found   = nullptr;

  for (const auto& segment : SplitPath(path)) {
    if (!current) return nullptr;

    auto it = current->fields().find(segment);
    if (it == current->fields().end()) return nullptr;

    found   = &it->second;
    current = found->kind_case() == Value::kStructValue ? &found->struct_value() : nullptr;
  }
  return found;
}

Value* MutablePath(Record& record, std::string_view path) {
  Record* current = &record;
  Value*  found   = nullptr;

  for (const auto& segment : SplitPath(path)) {
    if (!current) return nullptr;

    auto* fields = current->mutable_fields();
    auto  it     = fields->find(segment);
    if (it == fields->end()) return nullptr;

    found   = &it->second;
    current = found->kind_case() == Value::kStructValue ? found->mutable_struct_value() : nullptr;
  }
  return found;
}

bool DeepEquals(const Value& a, const Value& b) {
  if (a.kind_case() != b.kind_case()) return false;

  switch (a.kind_case()) {
    case Value::kNullValue:
      return true;
    case Value::kNumberValue:
      return a.number_value() == b.number_value();
    case Value::kStringValue:
      return a.string_value() == b.string_value();
    case Value::kBoolValue:
      return a.bool_value() == b.bool_value();
    case Value::kListValue: {
      const auto& lhs = a.list_value().values();
      const auto& rhs = b.list_value().values();
      if (lhs.size() != rhs.size()) return false;
      for (int i = 0; i < lhs.size(); ++i) {
        if (!DeepEquals(lhs[i], rhs[i])) return false;
      }
      return true;
    }
    case Value::kStructValue: {
      const auto& lhs = a.struct_value().fields();
      const auto& rhs = b.struct_value().fields();
      if (lhs.size() != rhs.size()) return false;
      for (const auto& [key, value] : lhs) {
        auto it = rhs.find(key);
        if (it == rhs.end() || !DeepEquals(value, it->second)) return false;
      }
      return true;
    }
    case Value::KIND_NOT_SET:
      return true;
  }
  return false;
}

// ------------------------------------------------------------------
// RecordMap
// ------------------------------------------------------------------

bool RecordMap::Contains(const std::string& id) const {
  return records_.find(id) != records_.end();
}

const Record* RecordMap::Find(const std::string& id) const {
  auto it = records_.find(id);
  return it == records_.end() ? nullptr : &it->second;
}

bool RecordMap::Insert(const std::string& id, Record record) {
  auto [it, inserted] = records_.emplace(id, std::move(record));
  if (inserted) order_.push_back(id);
  return inserted;
}

void RecordMap::Put(const std::string& id, Record record) {
  auto it = records_.find(id);
  if (it != records_.end()) {
    it->second = std::move(record);
    return;
  }
  records_.emplace(id, std::move(record));
  order_.push_back(id);
}

bool RecordMap::Erase(const std::string& id) {
  if (records_.erase(id) == 0) return false;
  order_.erase(std::find(order_.begin(), order_.end(), id));
  return true;
}

std::vector<const Record*> RecordMap::Records() const {
  std::vector<const Record*> out;
  out.reserve(order_.size());
  for (const auto& id : order_) {
    out.push_back(&records_.at(id));
  }
  return out;
}

} // namespace lieko::model
