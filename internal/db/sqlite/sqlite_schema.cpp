#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace lieko::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS projects (id TEXT PRIMARY KEY, name TEXT NOT NULL, description TEXT NOT NULL DEFAULT '', owner_id TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS project_collections (project_id TEXT NOT NULL REFERENCES projects(id) ON DELETE CASCADE, name TEXT NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, PRIMARY KEY (project_id, name));",
      "CREATE TABLE IF NOT EXISTS project_tokens (id TEXT PRIMARY KEY, project_id TEXT NOT NULL REFERENCES projects(id) ON DELETE CASCADE, name TEXT NOT NULL, secret TEXT NOT NULL UNIQUE, permission INTEGER NOT NULL, active INTEGER NOT NULL DEFAULT 1, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS project_tokens_by_project ON project_tokens(project_id);",
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO schema_migrations(version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

} // namespace lieko::db::sqlite
