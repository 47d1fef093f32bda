#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/record.hpp"

namespace lieko::query {

struct SortSpec {
  std::string field;
  bool        descending = false;
};

// "field", "field:asc" or "field:desc". Throws ValidationError(INVALID_REQUEST_BODY).
std::optional<SortSpec> ParseSort(std::string_view spec);

struct PageRequest {
  std::optional<SortSpec>  sort;
  uint64_t                 offset = 0;
  uint64_t                 limit  = 0; // 0 = no limit
  std::vector<std::string> fields;     // empty = all fields
};

struct Page {
  std::vector<model::Record> records;
  uint64_t                   total_count = 0;
  uint64_t                   page        = 1;
  uint64_t                   max_page    = 1;
};

/*
  Stable sort on one field. Values of different kinds order by kind:
  absent < null < bool < number < string < object < array.
*/
void SortRecords(std::vector<const model::Record*>& records, const SortSpec& sort);

// Keeps only the named top-level fields that are present.
model::Record Project(const model::Record& record, const std::vector<std::string>& fields);

/*
  sort -> offset/limit -> projection over already filtered records.
  total_count is taken before slicing.
*/
Page Paginate(std::vector<const model::Record*> matched, const PageRequest& request);

} // namespace lieko::query
