#pragma once

#include "sqlite_db.hpp"

namespace lieko::db::sqlite {

// Creates the metadata tables when missing. Safe to run on every start.
void BootstrapSchema(SqliteDB& db);

} // namespace lieko::db::sqlite
