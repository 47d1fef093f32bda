#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "internal/model/record.hpp"

namespace re2 {
class RE2;
}

namespace lieko::query {

/*
  Filter evaluation.

  A filter is a JSON object. Each top-level key is one condition and all
  conditions must hold:

    "field.path": value             deep equality
    "field.path": {"$op": arg,...}  every operator must hold
    "$and": [filter, ...]           all (empty holds)
    "$or":  [filter, ...]           any (empty fails)
    "$search": "term"               case-insensitive substring of any string

  Evaluation never throws. Unknown operators, invalid patterns, missing
  fields and ordering across different value kinds all evaluate false.

  $regex uses RE2 syntax and runs in time linear in the subject.
  Backreferences and lookaround are not supported and evaluate false.
*/
using Filter = model::Record;

using PatternCache = std::unordered_map<std::string, std::unique_ptr<re2::RE2>>;

// Holds one filter for a scan; each $regex pattern is compiled on first use.
class Matcher {
 public:
  explicit Matcher(const Filter& filter);
  ~Matcher();

  Matcher(const Matcher&)            = delete;
  Matcher& operator=(const Matcher&) = delete;

  bool Matches(const model::Record& record) const;

 private:
  const Filter&        filter_;
  mutable PatternCache patterns_;
};

// One-off evaluation; scans should hold a Matcher.
bool Matches(const model::Record& record, const Filter& filter);

// Case-insensitive substring match over every string in the value tree.
bool ContainsText(const model::Value& value, std::string_view lowered_term);

// Throws ValidationError(INVALID_FILTER). Empty input is the empty filter.
Filter ParseFilter(std::string_view json);

} // namespace lieko::query
