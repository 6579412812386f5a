// Copyright (c) 2024 liudegui. MIT License.
//
// dbctl::Sqlite3Db -- one physical SQLite3 connection with RAII.
//
// Design:
//   - Wraps sqlite3* with RAII, move-only
//   - Error reporting via Error return / Error* out parameter (no exceptions)
//   - Close() reports SQLITE_BUSY instead of leaking the handle silently
//   - Opens with URI filenames enabled, so shared-cache in-memory
//     databases ("file:x?mode=memory&cache=shared") work across connections

#pragma once

#include <cstdint>

#include "sqlite3.h"

#include "dbctl/error.hpp"
#include "dbctl/sqlite3_query.hpp"
#include "dbctl/sqlite3_statement.hpp"

namespace dbctl {

// ---------------------------------------------------------------------------
// Sqlite3Db
// ---------------------------------------------------------------------------

class Sqlite3Db {
 public:
  Sqlite3Db() = default;

  ~Sqlite3Db() {
    if (db_ != nullptr) { sqlite3_close_v2(db_); }
  }

  Sqlite3Db(Sqlite3Db&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
  }

  Sqlite3Db& operator=(Sqlite3Db&& other) noexcept {
    if (this != &other) {
      if (db_ != nullptr) { sqlite3_close_v2(db_); }
      db_ = other.db_;
      other.db_ = nullptr;
    }
    return *this;
  }

  Sqlite3Db(const Sqlite3Db&) = delete;
  Sqlite3Db& operator=(const Sqlite3Db&) = delete;

  // --- Open / Close ---

  Error Open(const char* dsn) {
    if (dsn == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "dsn is null");
    }
    if (db_ != nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Database already open");
    }
    int32_t flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                    SQLITE_OPEN_URI;
    int32_t rc = sqlite3_open_v2(dsn, &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
      Error err = Error::FromSqlite3(rc, db_);
      sqlite3_close(db_);
      db_ = nullptr;
      return err;
    }
    sqlite3_extended_result_codes(db_, 1);
    return Error::Ok();
  }

  /// Close the connection. Fails with kBusy (and stays open) while
  /// statements or queries compiled on it are still alive.
  Error Close() {
    if (db_ == nullptr) { return Error::Ok(); }
    int32_t rc = sqlite3_close(db_);
    if (rc != SQLITE_OK) { return Error::FromSqlite3(rc, db_); }
    db_ = nullptr;
    return Error::Ok();
  }

  bool IsOpen() const { return db_ != nullptr; }

  // --- DML ---

  /// Execute one or more ';'-separated statements without parameters.
  /// Returns the number of rows changed by the last one, or -1 on error.
  int32_t ExecDml(const char* sql, Error* out_error = nullptr) {
    if (!CheckOpen(sql, out_error)) { return -1; }

    char* errmsg = nullptr;
    int32_t rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc == SQLITE_OK) {
      return sqlite3_changes(db_);
    }

    if (out_error != nullptr) {
      ErrorCode code = FromSqlite3Code(rc);
      out_error->Set(code == ErrorCode::kOk ? ErrorCode::kError : code,
                     errmsg != nullptr ? errmsg : sqlite3_errmsg(db_));
    }
    if (errmsg != nullptr) { sqlite3_free(errmsg); }
    return -1;
  }

  // --- Statement ---

  /// Compile a single prepared statement.
  Sqlite3Statement CompileStatement(const char* sql,
                                    Error* out_error = nullptr) {
    if (!CheckOpen(sql, out_error)) { return Sqlite3Statement{}; }

    const char* tail = nullptr;
    sqlite3_stmt* stmt = nullptr;
    int32_t rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, &tail);
    if (rc != SQLITE_OK) {
      if (out_error != nullptr) { out_error->SetSqlite3(rc, db_); }
      return Sqlite3Statement{};
    }
    if (stmt == nullptr) {
      // Empty text or a lone comment compiles to nothing.
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kMisuse, "sql contains no statement");
      }
      return Sqlite3Statement{};
    }
    if (HasTrailingStatement(tail)) {
      sqlite3_finalize(stmt);
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kMisuse,
                       "sql contains more than one statement");
      }
      return Sqlite3Statement{};
    }
    return Sqlite3Statement(db_, stmt);
  }

  // --- Transaction ---

  Error BeginTransaction() {
    Error err;
    ExecDml("BEGIN TRANSACTION;", &err);
    return err;
  }

  Error Commit() {
    Error err;
    ExecDml("COMMIT TRANSACTION;", &err);
    return err;
  }

  Error Rollback() {
    Error err;
    ExecDml("ROLLBACK;", &err);
    return err;
  }

  bool InTransaction() const {
    if (db_ == nullptr) { return false; }
    return sqlite3_get_autocommit(db_) == 0;
  }

  // --- Misc ---

  void SetBusyTimeout(int32_t ms) {
    if (db_ != nullptr) { sqlite3_busy_timeout(db_, ms); }
  }

 private:
  // Whitespace, separators and comments compile to no statement.
  bool HasTrailingStatement(const char* tail) const {
    while (tail != nullptr && *tail != '\0') {
      sqlite3_stmt* next = nullptr;
      const char* rest = nullptr;
      int32_t rc = sqlite3_prepare_v2(db_, tail, -1, &next, &rest);
      if (rc != SQLITE_OK) { return true; }
      if (next != nullptr) {
        sqlite3_finalize(next);
        return true;
      }
      if (rest == tail) { break; }
      tail = rest;
    }
    return false;
  }

  bool CheckOpen(const char* sql, Error* out_error) const {
    if (db_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNotOpen, "Database not open");
      }
      return false;
    }
    if (sql == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNullParam, "sql is null");
      }
      return false;
    }
    return true;
  }

  sqlite3* db_ = nullptr;
};

}  // namespace dbctl
