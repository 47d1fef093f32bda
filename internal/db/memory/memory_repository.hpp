#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace lieko::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertProject(Transaction&, const model::ProjectRecord&) override;
  std::optional<model::ProjectRecord> GetProject(Transaction&, const std::string&) override;
  std::vector<model::ProjectRecord> ListProjects(Transaction&) override;
  Result TouchProject(Transaction&, const std::string& id, uint64_t updated_at_ms) override;
  Result DeleteProject(Transaction&, const std::string&) override;

  Result RegisterCollection(Transaction&, const model::CollectionRecord&) override;
  std::vector<model::CollectionRecord> ListCollections(Transaction&, const std::string& project_id) override;
  std::vector<model::CollectionRecord> ListAllCollections(Transaction&) override;
  Result DeleteCollection(Transaction&, const std::string& project_id, const std::string& name) override;

  Result InsertToken(Transaction&, const model::TokenRecord&) override;
  std::optional<model::TokenRecord> FindTokenBySecret(Transaction&, const std::string& secret) override;
  std::vector<model::TokenRecord> ListTokens(Transaction&, const std::string& project_id) override;
  Result DeleteToken(Transaction&, const std::string& project_id, const std::string& token_id) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ProjectRecord> projects;
    // (project_id, name), ordered so listings come out sorted by name
    std::map<std::pair<std::string, std::string>, model::CollectionRecord> collections;
    std::unordered_map<std::string, model::TokenRecord> tokens;
  };

  // held by the open transaction for its whole lifetime
  std::mutex mutex_;
  State      committed_;
};

} // namespace lieko::db::memory
