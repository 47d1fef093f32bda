#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace lieko::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace lieko::db::sqlite
