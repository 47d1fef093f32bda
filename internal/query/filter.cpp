#include "filter.hpp"

#include <google/protobuf/util/json_util.h>
#include <re2/re2.h>

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

#include "internal/util/errors.hpp"

namespace lieko::query {

using model::Value;

namespace {

std::string Lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool IsOperatorObject(const Value& v) {
  if (v.kind_case() != Value::kStructValue) return false;
  const auto& fields = v.struct_value().fields();
  return std::any_of(fields.begin(), fields.end(), [](const auto& kv) { return !kv.first.empty() && kv.first[0] == '$'; });
}

// <0, 0, >0 when both sides share an ordered kind; nullopt otherwise.
std::optional<int> Compare(const Value& a, const Value& b) {
  if (a.kind_case() != b.kind_case()) return std::nullopt;

  switch (a.kind_case()) {
    case Value::kNumberValue:
      if (a.number_value() < b.number_value()) return -1;
      if (a.number_value() > b.number_value()) return 1;
      return 0;
    case Value::kStringValue:
      return a.string_value().compare(b.string_value());
    case Value::kBoolValue:
      return static_cast<int>(a.bool_value()) - static_cast<int>(b.bool_value());
    default:
      return std::nullopt;
  }
}

bool InList(const Value& value, const Value& list) {
  if (list.kind_case() != Value::kListValue) return false;
  const auto& items = list.list_value().values();
  return std::any_of(items.begin(), items.end(), [&](const Value& item) { return model::DeepEquals(value, item); });
}

const re2::RE2& CompiledPattern(PatternCache& patterns, const std::string& pattern) {
  auto& compiled = patterns[pattern];
  if (!compiled) {
    re2::RE2::Options options;
    options.set_log_errors(false);
    compiled = std::make_unique<re2::RE2>(pattern, options);
  }
  return *compiled;
}

bool RegexSearch(PatternCache& patterns, const std::string& subject, const std::string& pattern) {
  const auto& re = CompiledPattern(patterns, pattern);
  if (!re.ok()) return false;
  return re2::RE2::PartialMatch(subject, re);
}

bool MatchesFilter(const model::Record& record, const Filter& filter, PatternCache& patterns);

bool ApplyOperator(const std::string& op, const Value* field, const Value& arg, PatternCache& patterns) {
  if (!field) return false;

  if (op == "$eq") return model::DeepEquals(*field, arg);
  if (op == "$ne") return !model::DeepEquals(*field, arg);
  if (op == "$in") return InList(*field, arg);
  if (op == "$nin") return arg.kind_case() == Value::kListValue && !InList(*field, arg);

  if (op == "$gt" || op == "$gte" || op == "$lt" || op == "$lte") {
    const auto cmp = Compare(*field, arg);
    if (!cmp) return false;
    if (op == "$gt") return *cmp > 0;
    if (op == "$gte") return *cmp >= 0;
    if (op == "$lt") return *cmp < 0;
    return *cmp <= 0;
  }

  if (op == "$contains" || op == "$regex") {
    if (field->kind_case() != Value::kStringValue || arg.kind_case() != Value::kStringValue) return false;
    if (op == "$contains") return field->string_value().find(arg.string_value()) != std::string::npos;
    return RegexSearch(patterns, field->string_value(), arg.string_value());
  }

  return false;
}

bool MatchesCondition(const model::Record& record, const std::string& path, const Value& condition, PatternCache& patterns) {
  const Value* field = model::FindPath(record, path);

  if (!IsOperatorObject(condition)) {
    return field && model::DeepEquals(*field, condition);
  }

  for (const auto& [op, arg] : condition.struct_value().fields()) {
    if (!ApplyOperator(op, field, arg, patterns)) return false;
  }
  return true;
}

bool MatchesAll(const model::Record& record, const Value& operand, PatternCache& patterns) {
  if (operand.kind_case() != Value::kListValue) return false;
  for (const auto& sub : operand.list_value().values()) {
    if (sub.kind_case() != Value::kStructValue || !MatchesFilter(record, sub.struct_value(), patterns)) return false;
  }
  return true;
}

bool MatchesAny(const model::Record& record, const Value& operand, PatternCache& patterns) {
  if (operand.kind_case() != Value::kListValue) return false;
  for (const auto& sub : operand.list_value().values()) {
    if (sub.kind_case() == Value::kStructValue && MatchesFilter(record, sub.struct_value(), patterns)) return true;
  }
  return false;
}

} // namespace

bool ContainsText(const Value& value, std::string_view lowered_term) {
  switch (value.kind_case()) {
    case Value::kStringValue:
      return Lower(value.string_value()).find(lowered_term) != std::string::npos;
    case Value::kStructValue:
      for (const auto& [key, child] : value.struct_value().fields()) {
        if (ContainsText(child, lowered_term)) return true;
      }
      return false;
    case Value::kListValue:
      for (const auto& child : value.list_value().values()) {
        if (ContainsText(child, lowered_term)) return true;
      }
      return false;
    default:
      return false;
  }
}

namespace {

bool MatchesFilter(const model::Record& record, const Filter& filter, PatternCache& patterns) {
  for (const auto& [key, condition] : filter.fields()) {
    if (key == "$and") {
      if (!MatchesAll(record, condition, patterns)) return false;
    } else if (key == "$or") {
      if (!MatchesAny(record, condition, patterns)) return false;
    } else if (key == "$search") {
      if (condition.kind_case() != Value::kStringValue) return false;

      const auto term = Lower(condition.string_value());
      bool       hit  = false;
      for (const auto& [name, value] : record.fields()) {
        if (ContainsText(value, term)) {
          hit = true;
          break;
        }
      }
      if (!hit) return false;
    } else if (!MatchesCondition(record, key, condition, patterns)) {
      return false;
    }
  }
  return true;
}

} // namespace

Matcher::Matcher(const Filter& filter) : filter_(filter) {
}

Matcher::~Matcher() = default;

bool Matcher::Matches(const model::Record& record) const {
  return MatchesFilter(record, filter_, patterns_);
}

bool Matches(const model::Record& record, const Filter& filter) {
  return Matcher(filter).Matches(record);
}

Filter ParseFilter(std::string_view json) {
  Filter filter;
  if (json.empty()) return filter;

  Value parsed;
  auto  status = google::protobuf::util::JsonStringToMessage(std::string(json), &parsed);
  if (!status.ok()) {
    throw util::ValidationError(util::ErrorCode::InvalidFilter, "filter is not valid JSON: " + std::string(status.message()));
  }
  if (parsed.kind_case() != Value::kStructValue) {
    throw util::ValidationError(util::ErrorCode::InvalidFilter, "filter must be a JSON object");
  }
  filter = parsed.struct_value();
  return filter;
}

} // namespace lieko::query
