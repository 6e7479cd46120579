#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "internal/db/api/types.hpp"
#include "internal/db/sql/sql_params.hpp"

namespace usbforge::db::sql {

/*
  Dynamic WHERE/ORDER/LIMIT tails for the list queries, shared by the
  SQL backends. Placeholders are '?'; postgres rewrites them.
*/

struct Clause {
  std::string sql;
  Params      params;
};

// " WHERE ... ORDER BY created_at_ms DESC, id DESC LIMIT n"
Clause JobListClause(const JobFilter& filter, std::size_t limit);

// " WHERE ... ORDER BY created_at_ms <dir>, id <dir> LIMIT n"
Clause LogListClause(const LogFilter& filter, std::size_t limit);

// Rewrites '?' placeholders outside string literals to $1..$n.
std::string ToPostgres(std::string_view sql);

} // namespace usbforge::db::sql
