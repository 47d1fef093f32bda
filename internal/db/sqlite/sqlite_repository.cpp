#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace lieko::db::sqlite {

using lieko::db::ErrorCode;
using lieko::db::Result;

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) st_ = nullptr;
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  explicit operator bool() const {
    return st_ != nullptr;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::ProjectRecord ReadProject(sqlite3_stmt* st) {
  model::ProjectRecord r;
  r.id            = ColText(st, 0);
  r.name          = ColText(st, 1);
  r.description   = ColText(st, 2);
  r.owner_id      = ColText(st, 3);
  r.created_at_ms = ColU64(st, 4);
  r.updated_at_ms = ColU64(st, 5);
  return r;
}

model::CollectionRecord ReadCollection(sqlite3_stmt* st) {
  model::CollectionRecord r;
  r.project_id    = ColText(st, 0);
  r.name          = ColText(st, 1);
  r.created_at_ms = ColU64(st, 2);
  r.updated_at_ms = ColU64(st, 3);
  return r;
}

model::TokenRecord ReadToken(sqlite3_stmt* st) {
  model::TokenRecord r;
  r.id            = ColText(st, 0);
  r.project_id    = ColText(st, 1);
  r.name          = ColText(st, 2);
  r.secret        = ColText(st, 3);
  r.permission    = static_cast<lieko::model::PermissionTier>(ColI32(st, 4));
  r.active        = ColI32(st, 5) != 0;
  r.created_at_ms = ColU64(st, 6);
  return r;
}

constexpr const char* kProjectColumns    = "id,name,description,owner_id,created_at_ms,updated_at_ms";
constexpr const char* kCollectionColumns = "project_id,name,created_at_ms,updated_at_ms";
constexpr const char* kTokenColumns      = "id,project_id,name,secret,permission,active,created_at_ms";

template <typename Row, typename Reader>
std::vector<Row> ReadAll(sqlite3_stmt* st, Reader reader) {
  std::vector<Row> rows;
  while (sqlite3_step(st) == SQLITE_ROW) {
    rows.push_back(reader(st));
  }
  return rows;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Projects
// ------------------------------------------------------------------

Result SqliteRepository::InsertProject(Transaction& t, const model::ProjectRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO projects(id,name,description,owner_id,created_at_ms,updated_at_ms) VALUES(?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.name);
  BindText(st.get(), 3, r.description);
  BindText(st.get(), 4, r.owner_id);
  BindU64(st.get(), 5, r.created_at_ms);
  BindU64(st.get(), 6, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ProjectRecord> SqliteRepository::GetProject(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kProjectColumns + " FROM projects WHERE id=?;";
  Statement         st(db, sql.c_str());
  if (!st) return std::nullopt;

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  return ReadProject(st.get());
}

std::vector<model::ProjectRecord> SqliteRepository::ListProjects(Transaction& t) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kProjectColumns + " FROM projects ORDER BY created_at_ms, id;";
  Statement         st(db, sql.c_str());
  if (!st) return {};

  return ReadAll<model::ProjectRecord>(st.get(), ReadProject);
}

Result SqliteRepository::TouchProject(Transaction& t, const std::string& id, uint64_t updated_at_ms) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE projects SET updated_at_ms=? WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, updated_at_ms);
  BindText(st.get(), 2, id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "project " + id);
  return result;
}

Result SqliteRepository::DeleteProject(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM projects WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "project " + id);
  return result;
}

// ------------------------------------------------------------------
// Collections
// ------------------------------------------------------------------

Result SqliteRepository::RegisterCollection(Transaction& t, const model::CollectionRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT OR IGNORE INTO project_collections(project_id,name,created_at_ms,updated_at_ms) VALUES(?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.project_id);
  BindText(st.get(), 2, r.name);
  BindU64(st.get(), 3, r.created_at_ms);
  BindU64(st.get(), 4, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::CollectionRecord> SqliteRepository::ListCollections(Transaction& t, const std::string& project_id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kCollectionColumns + " FROM project_collections WHERE project_id=? ORDER BY name;";
  Statement         st(db, sql.c_str());
  if (!st) return {};

  BindText(st.get(), 1, project_id);
  return ReadAll<model::CollectionRecord>(st.get(), ReadCollection);
}

std::vector<model::CollectionRecord> SqliteRepository::ListAllCollections(Transaction& t) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kCollectionColumns + " FROM project_collections ORDER BY project_id, name;";
  Statement         st(db, sql.c_str());
  if (!st) return {};

  return ReadAll<model::CollectionRecord>(st.get(), ReadCollection);
}

Result SqliteRepository::DeleteCollection(Transaction& t, const std::string& project_id, const std::string& name) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM project_collections WHERE project_id=? AND name=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, project_id);
  BindText(st.get(), 2, name);

  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Tokens
// ------------------------------------------------------------------

Result SqliteRepository::InsertToken(Transaction& t, const model::TokenRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO project_tokens(id,project_id,name,secret,permission,active,created_at_ms) VALUES(?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.project_id);
  BindText(st.get(), 3, r.name);
  BindText(st.get(), 4, r.secret);
  BindI32(st.get(), 5, static_cast<int>(r.permission));
  BindI32(st.get(), 6, r.active ? 1 : 0);
  BindU64(st.get(), 7, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::TokenRecord> SqliteRepository::FindTokenBySecret(Transaction& t, const std::string& secret) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kTokenColumns + " FROM project_tokens WHERE secret=?;";
  Statement         st(db, sql.c_str());
  if (!st) return std::nullopt;

  BindText(st.get(), 1, secret);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  return ReadToken(st.get());
}

std::vector<model::TokenRecord> SqliteRepository::ListTokens(Transaction& t, const std::string& project_id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kTokenColumns + " FROM project_tokens WHERE project_id=? ORDER BY created_at_ms, id;";
  Statement         st(db, sql.c_str());
  if (!st) return {};

  BindText(st.get(), 1, project_id);
  return ReadAll<model::TokenRecord>(st.get(), ReadToken);
}

Result SqliteRepository::DeleteToken(Transaction& t, const std::string& project_id, const std::string& token_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM project_tokens WHERE id=? AND project_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, token_id);
  BindText(st.get(), 2, project_id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "token " + token_id);
  return result;
}

} // namespace lieko::db::sqlite
