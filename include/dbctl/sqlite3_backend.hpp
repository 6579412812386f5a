// Copyright (c) 2024 liudegui. MIT License.
//
// dbctl::Sqlite3Backend -- backend traits for SQLite3.
//
// Design:
//   - Aggregates the SQLite3 driver types into a single traits struct
//   - Template parameter of Database<Backend> and everything built on it
//   - No virtual dispatch: just type aliases
//
// A backend's Db type must provide: Open(const char*), Close() -> Error,
// IsOpen(), ExecDml(), CompileStatement(), BeginTransaction(), Commit(),
// Rollback(), InTransaction(), SetBusyTimeout().

#pragma once

#include "dbctl/sqlite3_db.hpp"

namespace dbctl {

struct Sqlite3Backend {
  using Db        = Sqlite3Db;
  using Query     = Sqlite3Query;
  using Statement = Sqlite3Statement;
};

}  // namespace dbctl
