#include "document_store.hpp"

#include <algorithm>
#include <cctype>

#include "internal/core/collection_io.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace lieko::core {

using util::ErrorCode;

namespace {

std::string Lower(const std::string& s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

util::NotFound RecordNotFound(const std::string& id) {
  return util::NotFound(ErrorCode::RecordNotFound, "record '" + id + "' not found");
}

} // namespace

DocumentStore::DocumentStore(EngineContext ctx) : ctx_(ctx), batch_(std::move(ctx)) {
}

model::RecordMap DocumentStore::LoadExisting(const storage::CollectionRef& ref) {
  ctx_.registry->EnsureExists(ref, false);
  return ctx_.storage->Load(ref);
}

void DocumentStore::CheckCollection(const storage::CollectionRef& ref) {
  ctx_.registry->EnsureExists(ref, false);
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

query::Page DocumentStore::Query(const storage::CollectionRef& ref, const query::Filter& filter, const query::PageRequest& page) {
  auto           stored = LoadExisting(ref);
  query::Matcher matcher(filter);

  std::vector<const model::Record*> matched;
  for (const auto* record : stored.Records()) {
    if (matcher.Matches(*record)) matched.push_back(record);
  }
  return query::Paginate(std::move(matched), page);
}

query::Page DocumentStore::Search(const storage::CollectionRef& ref, const std::string& term, const std::vector<std::string>& search_fields,
                                  const query::PageRequest& page) {
  if (term.empty()) {
    throw util::ValidationError(ErrorCode::MissingRequiredFields, "search term is required");
  }

  auto       stored  = LoadExisting(ref);
  const auto lowered = Lower(term);

  std::vector<const model::Record*> matched;
  for (const auto* record : stored.Records()) {
    bool hit = false;
    if (search_fields.empty()) {
      hit = std::any_of(record->fields().begin(), record->fields().end(),
                        [&](const auto& kv) { return query::ContainsText(kv.second, lowered); });
    } else {
      hit = std::any_of(search_fields.begin(), search_fields.end(), [&](const std::string& path) {
        const auto* value = model::FindPath(*record, path);
        return value && query::ContainsText(*value, lowered);
      });
    }
    if (hit) matched.push_back(record);
  }
  return query::Paginate(std::move(matched), page);
}

model::Record DocumentStore::GetRecord(const storage::CollectionRef& ref, const std::string& id, const std::vector<std::string>& fields) {
  RequireValidId(id);

  auto        stored = LoadExisting(ref);
  const auto* record = stored.Find(id);
  if (!record) throw RecordNotFound(id);
  return query::Project(*record, fields);
}

std::optional<model::Record> DocumentStore::FindOne(const storage::CollectionRef& ref, const query::Filter& filter) {
  auto           stored = LoadExisting(ref);
  query::Matcher matcher(filter);
  for (const auto* record : stored.Records()) {
    if (matcher.Matches(*record)) return *record;
  }
  return std::nullopt;
}

uint64_t DocumentStore::Count(const storage::CollectionRef& ref, const query::Filter& filter) {
  auto           stored = LoadExisting(ref);
  query::Matcher matcher(filter);
  uint64_t       count = 0;
  for (const auto* record : stored.Records()) {
    if (matcher.Matches(*record)) ++count;
  }
  return count;
}

std::vector<std::string> DocumentStore::Keys(const storage::CollectionRef& ref) {
  return LoadExisting(ref).Ids();
}

std::vector<std::pair<std::string, model::Record>> DocumentStore::Entries(const storage::CollectionRef& ref) {
  auto stored = LoadExisting(ref);

  std::vector<std::pair<std::string, model::Record>> entries;
  entries.reserve(stored.Size());
  for (const auto& id : stored.Ids()) {
    entries.emplace_back(id, *stored.Find(id));
  }
  return entries;
}

uint64_t DocumentStore::Size(const storage::CollectionRef& ref) {
  return LoadExisting(ref).Size();
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

model::Record DocumentStore::Create(const storage::CollectionRef& ref, model::Record record) {
  std::string id;
  auto        id_it = record.fields().find(std::string(model::kIdField));
  if (id_it == record.fields().end()) {
    id = util::ToString(util::GenerateUUID());
    model::SetString(record, model::kIdField, id);
  } else if (id_it->second.kind_case() != model::Value::kStringValue) {
    throw util::ValidationError(ErrorCode::InvalidIdFormat, "record id must be a string");
  } else {
    id = id_it->second.string_value();
  }
  RequireValidId(id);
  RequireValidRef(ref);

  auto guard = ctx_.serializer->Acquire(ref.ResourceKey());
  ctx_.registry->EnsureExists(ref, true);
  auto stored = ctx_.storage->Load(ref);

  if (stored.Contains(id)) {
    throw util::AlreadyExists(ErrorCode::RecordExists, "record '" + id + "' already exists");
  }

  StampCreated(record, util::ToIso8601(util::Now()));
  stored.Insert(id, record);
  PersistCollection(ctx_, ref, stored);
  return record;
}

model::Record DocumentStore::Set(const storage::CollectionRef& ref, const std::string& id, const model::Record& data) {
  RequireValidId(id);
  RequireValidRef(ref);

  auto guard = ctx_.serializer->Acquire(ref.ResourceKey());
  ctx_.registry->EnsureExists(ref, true);
  auto stored = ctx_.storage->Load(ref);

  const auto    now      = util::ToIso8601(util::Now());
  const auto*   existing = stored.Find(id);
  model::Record record;
  if (existing) {
    record = *existing;
    MergeTopLevel(record, data);
    StampUpdated(record, now);
  } else {
    MergeTopLevel(record, data);
    model::SetString(record, model::kIdField, id);
    StampCreated(record, now);
  }

  stored.Put(id, record);
  PersistCollection(ctx_, ref, stored);
  return record;
}

model::Record DocumentStore::Update(const storage::CollectionRef& ref, const std::string& id, const model::Record& patch) {
  RequireValidId(id);
  RequireValidRef(ref);

  auto guard  = ctx_.serializer->Acquire(ref.ResourceKey());
  auto stored = LoadExisting(ref);

  const auto* existing = stored.Find(id);
  if (!existing) throw RecordNotFound(id);

  model::Record record = *existing;
  MergeTopLevel(record, patch);
  StampUpdated(record, util::ToIso8601(util::Now()));

  stored.Put(id, record);
  PersistCollection(ctx_, ref, stored);
  return record;
}

bool DocumentStore::Delete(const storage::CollectionRef& ref, const std::string& id) {
  RequireValidId(id);
  RequireValidRef(ref);

  auto guard  = ctx_.serializer->Acquire(ref.ResourceKey());
  auto stored = LoadExisting(ref);

  if (!stored.Erase(id)) return false;

  PersistCollection(ctx_, ref, stored);
  return true;
}

model::Record DocumentStore::Increment(const storage::CollectionRef& ref, const std::string& id, const std::string& field, double amount) {
  RequireValidId(id);
  if (field.empty()) {
    throw util::ValidationError(ErrorCode::MissingRequiredFields, "field is required");
  }
  RequireValidRef(ref);

  auto guard  = ctx_.serializer->Acquire(ref.ResourceKey());
  auto stored = LoadExisting(ref);

  const auto* existing = stored.Find(id);
  if (!existing) throw RecordNotFound(id);

  model::Record record = *existing;
  auto*         value  = model::MutablePath(record, field);
  if (!value || value->kind_case() != model::Value::kNumberValue) {
    throw util::ValidationError(ErrorCode::InvalidField, "field '" + field + "' is missing or not a number");
  }
  value->set_number_value(value->number_value() + amount);
  StampUpdated(record, util::ToIso8601(util::Now()));

  stored.Put(id, record);
  PersistCollection(ctx_, ref, stored);
  return record;
}

model::Record DocumentStore::Decrement(const storage::CollectionRef& ref, const std::string& id, const std::string& field, double amount) {
  return Increment(ref, id, field, -amount);
}

void DocumentStore::DropCollection(const storage::CollectionRef& ref) {
  RequireValidRef(ref);

  auto guard = ctx_.serializer->Acquire(ref.ResourceKey());
  ctx_.registry->EnsureExists(ref, false);
  ctx_.registry->Drop(ref);
}

} // namespace lieko::core
