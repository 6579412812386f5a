// Copyright (c) 2024 liudegui. MIT License.
//
// dbctl::Sqlite3Statement -- prepared statement with RAII.
//
// Design:
//   - Wraps sqlite3_stmt* with RAII, move-only
//   - 1-based parameter binding (SQLite3 convention)
//   - ExecDml() for INSERT/UPDATE/DELETE, ExecQuery() for SELECT
//   - Result codes mapped through Error::SetSqlite3(); no exceptions

#pragma once

#include <cstdint>

#include "sqlite3.h"

#include "dbctl/error.hpp"
#include "dbctl/sqlite3_query.hpp"

namespace dbctl {

class Sqlite3Db;

// ---------------------------------------------------------------------------
// Sqlite3Statement
// ---------------------------------------------------------------------------

class Sqlite3Statement {
 public:
  Sqlite3Statement() = default;

  ~Sqlite3Statement() { Finalize(); }

  Sqlite3Statement(Sqlite3Statement&& other) noexcept
      : db_(other.db_), stmt_(other.stmt_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
  }

  Sqlite3Statement& operator=(Sqlite3Statement&& other) noexcept {
    if (this != &other) {
      Finalize();
      db_ = other.db_;
      stmt_ = other.stmt_;
      other.db_ = nullptr;
      other.stmt_ = nullptr;
    }
    return *this;
  }

  Sqlite3Statement(const Sqlite3Statement&) = delete;
  Sqlite3Statement& operator=(const Sqlite3Statement&) = delete;

  // --- Execute ---

  /// Execute DML. Returns affected row count, or -1 on error.
  /// The statement is reset afterwards and may be bound and run again.
  int32_t ExecDml(Error* out_error = nullptr) {
    if (!CheckValid(out_error)) { return -1; }

    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
      int32_t changes = sqlite3_changes(db_);
      sqlite3_reset(stmt_);
      return changes;
    }

    // sqlite3_reset() repeats the step's error code; keep the first one.
    if (out_error != nullptr) { out_error->SetSqlite3(rc, db_); }
    sqlite3_reset(stmt_);
    return -1;
  }

  /// Execute a query. The statement handle moves into the returned
  /// Sqlite3Query and this statement becomes empty.
  Sqlite3Query ExecQuery(Error* out_error = nullptr) {
    if (!CheckValid(out_error)) { return Sqlite3Query{}; }

    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
      Sqlite3Query q(db_, stmt_, rc == SQLITE_DONE);
      stmt_ = nullptr;
      return q;
    }

    if (out_error != nullptr) { out_error->SetSqlite3(rc, db_); }
    sqlite3_reset(stmt_);
    return Sqlite3Query{};
  }

  /// Rowid of the most recent successful INSERT on this connection.
  int64_t LastInsertId() const {
    return (db_ != nullptr) ? sqlite3_last_insert_rowid(db_) : 0;
  }

  // --- Bind (1-based index) ---

  int32_t ParamCount() const {
    return (stmt_ != nullptr) ? sqlite3_bind_parameter_count(stmt_) : 0;
  }

  Error Bind(int32_t param, const char* value) {
    if (value == nullptr) { return BindNull(param); }
    if (stmt_ == nullptr) { return NotInitialized(); }
    return Check(sqlite3_bind_text(stmt_, param, value, -1, SQLITE_TRANSIENT));
  }

  Error Bind(int32_t param, int32_t value) {
    if (stmt_ == nullptr) { return NotInitialized(); }
    return Check(sqlite3_bind_int(stmt_, param, value));
  }

  Error Bind(int32_t param, int64_t value) {
    if (stmt_ == nullptr) { return NotInitialized(); }
    return Check(sqlite3_bind_int64(stmt_, param, value));
  }

  Error Bind(int32_t param, double value) {
    if (stmt_ == nullptr) { return NotInitialized(); }
    return Check(sqlite3_bind_double(stmt_, param, value));
  }

  Error Bind(int32_t param, const uint8_t* blob, int32_t len) {
    if (stmt_ == nullptr) { return NotInitialized(); }
    return Check(sqlite3_bind_blob(stmt_, param, blob, len, SQLITE_TRANSIENT));
  }

  Error BindNull(int32_t param) {
    if (stmt_ == nullptr) { return NotInitialized(); }
    return Check(sqlite3_bind_null(stmt_, param));
  }

  // --- Reset ---

  /// Reset for re-execution and clear all bindings.
  Error Reset() {
    if (stmt_ == nullptr) { return NotInitialized(); }
    sqlite3_reset(stmt_);
    return Check(sqlite3_clear_bindings(stmt_));
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
  }

  bool Valid() const { return stmt_ != nullptr; }

 private:
  friend class Sqlite3Db;

  Sqlite3Statement(sqlite3* db, sqlite3_stmt* stmt)
      : db_(db), stmt_(stmt) {}

  bool CheckValid(Error* out_error) const {
    if (db_ != nullptr && stmt_ != nullptr) { return true; }
    if (out_error != nullptr) {
      out_error->Set(ErrorCode::kMisuse, "Statement not initialized");
    }
    return false;
  }

  Error Check(int32_t rc) const {
    if (rc == SQLITE_OK) { return Error::Ok(); }
    return Error::FromSqlite3(rc, db_);
  }

  static Error NotInitialized() {
    return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
  }

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

}  // namespace dbctl
