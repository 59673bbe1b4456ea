#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace rag_core {

enum class DbErrorKind { BusyOrLocked, Constraint, Readonly, Io, CantOpen, Full, Schema, Generic };

namespace detail {

struct DbErrorCode {
  int primary;
  DbErrorKind kind;
};

inline constexpr DbErrorCode kDbErrorCodes[] = {
    {SQLITE_BUSY, DbErrorKind::BusyOrLocked}, {SQLITE_LOCKED, DbErrorKind::BusyOrLocked},
    {SQLITE_CONSTRAINT, DbErrorKind::Constraint}, {SQLITE_READONLY, DbErrorKind::Readonly},
    {SQLITE_IOERR, DbErrorKind::Io},           {SQLITE_CANTOPEN, DbErrorKind::CantOpen},
    {SQLITE_FULL, DbErrorKind::Full},          {SQLITE_ERROR, DbErrorKind::Schema},
    {SQLITE_SCHEMA, DbErrorKind::Schema},
};

}  // namespace detail

// Extended codes are reduced to their primary code first.
inline DbErrorKind classify_sqlite_code(int code) {
  const int primary = code & 0xff;
  for (const auto& entry : detail::kDbErrorCodes) {
    if (entry.primary == primary) {
      return entry.kind;
    }
  }
  return DbErrorKind::Generic;
}

inline const char* kind_to_string(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::BusyOrLocked: return "busy_or_locked";
    case DbErrorKind::Constraint: return "constraint";
    case DbErrorKind::Readonly: return "readonly";
    case DbErrorKind::Io: return "io";
    case DbErrorKind::CantOpen: return "cantopen";
    case DbErrorKind::Full: return "full";
    case DbErrorKind::Schema: return "schema";
    case DbErrorKind::Generic: break;
  }
  return "generic";
}

// Message for VectorStoreError:
// "<operation> failed: (<kind>) <sqlite message> [code=N, xcode=M]"
inline std::string format_db_error(const std::string& operation, const sqlite::sqlite_exception& e) {
  const int code = e.get_code();
  return operation + " failed: (" + kind_to_string(classify_sqlite_code(code)) + ") " + e.errstr() +
         " [code=" + std::to_string(code) + ", xcode=" + std::to_string(e.get_extended_code()) + "]";
}

}  // namespace rag_core
