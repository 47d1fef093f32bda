#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace lieko::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  The connection is shared by all threads; TransactionMutex() keeps
  transactions on it from interleaving.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace lieko::db::sqlite
