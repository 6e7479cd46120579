#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace usbforge::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both use ordered binding → canonical SQL is written with '?' and
  rewritten for postgres by ToPostgres().
*/

using Param = std::variant<
    std::nullptr_t,
    int32_t,
    int64_t,
    uint64_t,
    std::string
>;

using Params = std::vector<Param>;

inline Param Nullable(const std::optional<std::string>& v) {
  if (!v) return nullptr;
  return *v;
}

inline Param Nullable(const std::optional<int64_t>& v) {
  if (!v) return nullptr;
  return *v;
}

// 0 timestamps are stored as NULL
inline Param NullableMillis(uint64_t ms) {
  if (ms == 0) return nullptr;
  return ms;
}

inline Param NullableText(const std::string& v) {
  if (v.empty()) return nullptr;
  return v;
}

}
