#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace lieko::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Projects
// ------------------------------------------------------------------

Result MemoryRepository::InsertProject(Transaction& t, const model::ProjectRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.projects.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "project " + r.id);
  s.projects[r.id] = r;
  return Result::Ok();
}

std::optional<model::ProjectRecord> MemoryRepository::GetProject(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.projects.find(id);
  if (it == s.projects.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ProjectRecord> MemoryRepository::ListProjects(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::ProjectRecord> records;
  records.reserve(s.projects.size());
  for (const auto& [_, record] : s.projects) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.id < b.id;
  });
  return records;
}

Result MemoryRepository::TouchProject(Transaction& t, const std::string& id, uint64_t updated_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.projects.find(id);
  if (it == s.projects.end()) return Result::Err(ErrorCode::NotFound, "project " + id);
  it->second.updated_at_ms = updated_at_ms;
  return Result::Ok();
}

Result MemoryRepository::DeleteProject(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.projects.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "project " + id);

  std::erase_if(s.collections, [&](const auto& entry) { return entry.first.first == id; });
  std::erase_if(s.tokens, [&](const auto& entry) { return entry.second.project_id == id; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Collections
// ------------------------------------------------------------------

Result MemoryRepository::RegisterCollection(Transaction& t, const model::CollectionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.projects.contains(r.project_id)) return Result::Err(ErrorCode::ConstraintViolation, "project " + r.project_id);
  s.collections.try_emplace({r.project_id, r.name}, r);
  return Result::Ok();
}

std::vector<model::CollectionRecord> MemoryRepository::ListCollections(Transaction& t, const std::string& project_id) {
  const auto&                          s = TX(t).View();
  std::vector<model::CollectionRecord> records;
  for (auto it = s.collections.lower_bound({project_id, ""}); it != s.collections.end() && it->first.first == project_id; ++it) {
    records.push_back(it->second);
  }
  return records;
}

std::vector<model::CollectionRecord> MemoryRepository::ListAllCollections(Transaction& t) {
  const auto&                          s = TX(t).View();
  std::vector<model::CollectionRecord> records;
  records.reserve(s.collections.size());
  for (const auto& [_, record] : s.collections) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::DeleteCollection(Transaction& t, const std::string& project_id, const std::string& name) {
  TX(t).Mutable().collections.erase({project_id, name});
  return Result::Ok();
}

// ------------------------------------------------------------------
// Tokens
// ------------------------------------------------------------------

Result MemoryRepository::InsertToken(Transaction& t, const model::TokenRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.projects.contains(r.project_id)) return Result::Err(ErrorCode::ConstraintViolation, "project " + r.project_id);
  if (s.tokens.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "token " + r.id);
  for (const auto& [_, token] : s.tokens) {
    if (token.secret == r.secret) return Result::Err(ErrorCode::AlreadyExists, "token secret");
  }
  s.tokens[r.id] = r;
  return Result::Ok();
}

std::optional<model::TokenRecord> MemoryRepository::FindTokenBySecret(Transaction& t, const std::string& secret) {
  for (const auto& [_, token] : TX(t).View().tokens) {
    if (token.secret == secret) return token;
  }
  return std::nullopt;
}

std::vector<model::TokenRecord> MemoryRepository::ListTokens(Transaction& t, const std::string& project_id) {
  std::vector<model::TokenRecord> records;
  for (const auto& [_, token] : TX(t).View().tokens) {
    if (token.project_id == project_id) records.push_back(token);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.id < b.id;
  });
  return records;
}

Result MemoryRepository::DeleteToken(Transaction& t, const std::string& project_id, const std::string& token_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.tokens.find(token_id);
  if (it == s.tokens.end() || it->second.project_id != project_id) {
    return Result::Err(ErrorCode::NotFound, "token " + token_id);
  }
  s.tokens.erase(it);
  return Result::Ok();
}

} // namespace lieko::db::memory
