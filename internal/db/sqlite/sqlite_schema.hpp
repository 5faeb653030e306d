#pragma once

#include "sqlite_db.hpp"

namespace claims::db::sqlite {

// Version written to claims_schema_migrations by BootstrapSchema.
constexpr int kSchemaVersion = 1;

// Creates the claim tables if missing, records kSchemaVersion and checks the
// expected columns exist. Throws when the database carries a newer version.
void BootstrapSchema(SqliteDB& db);

// Highest recorded version, 0 when none. Requires the migrations table.
int ReadSchemaVersion(SqliteDB& db);

} // namespace claims::db::sqlite
