#pragma once

#include <memory>

#include "pg_pool.hpp"

namespace claims::db::postgres {

// Version written to claims_schema_migrations by BootstrapSchema.
constexpr int kSchemaVersion = 1;

// Creates the claim tables if missing, records kSchemaVersion and checks the
// expected columns exist. Throws when the database carries a newer version.
void BootstrapSchema(const std::shared_ptr<PgPool>& pool);

// Highest recorded version, 0 when none. Requires the migrations table.
int ReadSchemaVersion(const std::shared_ptr<PgPool>& pool);

}
