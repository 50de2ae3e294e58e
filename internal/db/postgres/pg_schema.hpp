#pragma once

#include "pg_pool.hpp"

namespace fieldwake::db::postgres {

void BootstrapSchema(PgPool& pool);

} // namespace fieldwake::db::postgres
