#pragma once

#include "sqlite_db.hpp"

namespace fieldwake::db::sqlite {

// Idempotent. Stamps PRAGMA user_version and refuses a file written by a
// newer schema than this build knows.
void BootstrapSchema(SqliteDB& db);

} // namespace fieldwake::db::sqlite
