#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/collection_record.hpp"
#include "internal/db/model/project_record.hpp"
#include "internal/db/model/token_record.hpp"

namespace lieko::db {

/*
  Project metadata repository.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Deleting a project deletes its collections and tokens

  The DB is the source of truth for:
    projects
    collection membership
    tokens
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Projects
  // ---------------------------------------------------------------------

  virtual Result InsertProject(Transaction&, const model::ProjectRecord&) = 0;

  virtual std::optional<model::ProjectRecord> GetProject(Transaction&, const std::string& id) = 0;

  // ordered by creation time
  virtual std::vector<model::ProjectRecord> ListProjects(Transaction&) = 0;

  virtual Result TouchProject(Transaction&, const std::string& id, uint64_t updated_at_ms) = 0;

  virtual Result DeleteProject(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Collections
  // ---------------------------------------------------------------------

  // Inserts when (project_id, name) is new; an existing entry is left as is.
  virtual Result RegisterCollection(Transaction&, const model::CollectionRecord&) = 0;

  // ordered by name
  virtual std::vector<model::CollectionRecord> ListCollections(Transaction&, const std::string& project_id) = 0;

  virtual std::vector<model::CollectionRecord> ListAllCollections(Transaction&) = 0;

  virtual Result DeleteCollection(Transaction&, const std::string& project_id, const std::string& name) = 0;

  // ---------------------------------------------------------------------
  // Tokens
  // ---------------------------------------------------------------------

  virtual Result InsertToken(Transaction&, const model::TokenRecord&) = 0;

  virtual std::optional<model::TokenRecord> FindTokenBySecret(Transaction&, const std::string& secret) = 0;

  virtual std::vector<model::TokenRecord> ListTokens(Transaction&, const std::string& project_id) = 0;

  virtual Result DeleteToken(Transaction&, const std::string& project_id, const std::string& token_id) = 0;
};

} // namespace lieko::db
