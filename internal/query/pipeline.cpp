#include "pipeline.hpp"

#include <algorithm>
#include <limits>

#include "internal/util/errors.hpp"

namespace lieko::query {

using model::Value;

namespace {

int KindRank(const Value* v) {
  if (!v) return 0;
  switch (v->kind_case()) {
    case Value::kNullValue:
      return 1;
    case Value::kBoolValue:
      return 2;
    case Value::kNumberValue:
      return 3;
    case Value::kStringValue:
      return 4;
    case Value::kStructValue:
      return 5;
    case Value::kListValue:
      return 6;
    case Value::KIND_NOT_SET:
    default:
      return 1;
  }
}

int CompareForSort(const Value* a, const Value* b) {
  const int ra = KindRank(a);
  const int rb = KindRank(b);
  if (ra != rb) return ra < rb ? -1 : 1;

  if (!a) return 0;
  switch (a->kind_case()) {
    case Value::kBoolValue:
      return static_cast<int>(a->bool_value()) - static_cast<int>(b->bool_value());
    case Value::kNumberValue:
      if (a->number_value() < b->number_value()) return -1;
      if (a->number_value() > b->number_value()) return 1;
      return 0;
    case Value::kStringValue: {
      const int cmp = a->string_value().compare(b->string_value());
      return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
    }
    default:
      return 0;
  }
}

} // namespace

std::optional<SortSpec> ParseSort(std::string_view spec) {
  if (spec.empty()) return std::nullopt;

  SortSpec   sort;
  const auto colon = spec.rfind(':');
  if (colon == std::string_view::npos) {
    sort.field = std::string(spec);
  } else {
    sort.field           = std::string(spec.substr(0, colon));
    const auto direction = spec.substr(colon + 1);
    if (direction == "desc") {
      sort.descending = true;
    } else if (direction != "asc") {
      throw util::ValidationError(util::ErrorCode::InvalidRequestBody,
                                  "sort direction must be 'asc' or 'desc', got '" + std::string(direction) + "'");
    }
  }

  if (sort.field.empty()) {
    throw util::ValidationError(util::ErrorCode::InvalidRequestBody, "sort field is empty");
  }
  return sort;
}

void SortRecords(std::vector<const model::Record*>& records, const SortSpec& sort) {
  std::stable_sort(records.begin(), records.end(), [&](const model::Record* lhs, const model::Record* rhs) {
    const int cmp = CompareForSort(model::FindPath(*lhs, sort.field), model::FindPath(*rhs, sort.field));
    return sort.descending ? cmp > 0 : cmp < 0;
  });
}

model::Record Project(const model::Record& record, const std::vector<std::string>& fields) {
  if (fields.empty()) return record;

  model::Record projected;
  for (const auto& name : fields) {
    auto it = record.fields().find(name);
    if (it != record.fields().end()) {
      (*projected.mutable_fields())[name] = it->second;
    }
  }
  return projected;
}

Page Paginate(std::vector<const model::Record*> matched, const PageRequest& request) {
  if (request.sort) {
    SortRecords(matched, *request.sort);
  }

  Page page;
  page.total_count = matched.size();
  if (request.limit > 0) {
    const uint64_t skipped_pages = request.offset / request.limit;
    page.page     = skipped_pages == std::numeric_limits<uint64_t>::max() ? skipped_pages : skipped_pages + 1;
    page.max_page = page.total_count / request.limit + (page.total_count % request.limit != 0 ? 1 : 0);
  }

  // limit and offset are caller supplied; size - begin never wraps.
  const uint64_t begin = std::min<uint64_t>(request.offset, matched.size());
  const uint64_t end   = request.limit > 0 ? begin + std::min<uint64_t>(request.limit, matched.size() - begin) : matched.size();

  page.records.reserve(end - begin);
  for (uint64_t i = begin; i < end; ++i) {
    page.records.push_back(Project(*matched[i], request.fields));
  }
  return page;
}

} // namespace lieko::query
