// Copyright (c) 2024 liudegui. MIT License.
//
// dbctl::Sqlite3Query -- forward-only row cursor over a stepped statement.
//
// Design:
//   - Owns the sqlite3_stmt* it steps (RAII, move-only)
//   - Positioned on the first row when constructed (Eof() if none)
//   - NextRow() reports stepping errors instead of folding them into Eof()
//   - Typed accessors with null defaults; no exceptions

#pragma once

#include <cstdint>
#include <cstring>

#include "sqlite3.h"

#include "dbctl/error.hpp"

namespace dbctl {

class Sqlite3Statement;

// ---------------------------------------------------------------------------
// Sqlite3Query
// ---------------------------------------------------------------------------

class Sqlite3Query {
 public:
  Sqlite3Query() = default;

  ~Sqlite3Query() { Finalize(); }

  Sqlite3Query(Sqlite3Query&& other) noexcept
      : db_(other.db_),
        stmt_(other.stmt_),
        eof_(other.eof_),
        num_fields_(other.num_fields_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
    other.eof_ = true;
    other.num_fields_ = 0;
  }

  Sqlite3Query& operator=(Sqlite3Query&& other) noexcept {
    if (this != &other) {
      Finalize();
      db_ = other.db_;
      stmt_ = other.stmt_;
      eof_ = other.eof_;
      num_fields_ = other.num_fields_;
      other.db_ = nullptr;
      other.stmt_ = nullptr;
      other.eof_ = true;
      other.num_fields_ = 0;
    }
    return *this;
  }

  Sqlite3Query(const Sqlite3Query&) = delete;
  Sqlite3Query& operator=(const Sqlite3Query&) = delete;

  // --- Field info ---

  int32_t NumFields() const { return num_fields_; }

  const char* FieldName(int32_t col) const {
    if (!ValidColumn(col)) { return nullptr; }
    return sqlite3_column_name(stmt_, col);
  }

  int32_t FieldIndex(const char* name) const {
    if (stmt_ == nullptr || name == nullptr) { return -1; }
    for (int32_t i = 0; i < num_fields_; ++i) {
      const char* col_name = sqlite3_column_name(stmt_, i);
      if (col_name != nullptr && std::strcmp(name, col_name) == 0) {
        return i;
      }
    }
    return -1;
  }

  // --- Field values (current row) ---

  const char* FieldValue(int32_t col) const {
    if (eof_ || !ValidColumn(col)) { return nullptr; }
    return reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
  }

  bool FieldIsNull(int32_t col) const {
    if (eof_ || !ValidColumn(col)) { return true; }
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
  }

  int32_t GetInt(int32_t col, int32_t null_value = 0) const {
    if (FieldIsNull(col)) { return null_value; }
    return sqlite3_column_int(stmt_, col);
  }

  int64_t GetInt64(int32_t col, int64_t null_value = 0) const {
    if (FieldIsNull(col)) { return null_value; }
    return sqlite3_column_int64(stmt_, col);
  }

  double GetDouble(int32_t col, double null_value = 0.0) const {
    if (FieldIsNull(col)) { return null_value; }
    return sqlite3_column_double(stmt_, col);
  }

  const char* GetString(int32_t col, const char* null_value = "") const {
    if (FieldIsNull(col)) { return null_value; }
    const char* val = FieldValue(col);
    return (val != nullptr) ? val : null_value;
  }

  const uint8_t* GetBlob(int32_t col, int32_t& out_len) const {
    out_len = 0;
    if (FieldIsNull(col)) { return nullptr; }
    const void* blob = sqlite3_column_blob(stmt_, col);
    out_len = sqlite3_column_bytes(stmt_, col);
    return static_cast<const uint8_t*>(blob);
  }

  // --- Navigation ---

  bool Eof() const { return eof_; }

  /// Step to the next row. Eof() turns true at the end of data or on
  /// error; the error (if any) is written to out_error.
  void NextRow(Error* out_error = nullptr) {
    if (stmt_ == nullptr || eof_) { return; }
    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) { return; }
    eof_ = true;
    if (rc != SQLITE_DONE && out_error != nullptr) {
      out_error->SetSqlite3(rc, db_);
    }
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
    db_ = nullptr;
    eof_ = true;
    num_fields_ = 0;
  }

  bool Valid() const { return stmt_ != nullptr; }

 private:
  friend class Sqlite3Statement;

  Sqlite3Query(sqlite3* db, sqlite3_stmt* stmt, bool eof)
      : db_(db), stmt_(stmt), eof_(eof) {
    if (stmt_ != nullptr) {
      num_fields_ = sqlite3_column_count(stmt_);
    }
  }

  bool ValidColumn(int32_t col) const {
    return stmt_ != nullptr && col >= 0 && col < num_fields_;
  }

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
  bool eof_ = true;
  int32_t num_fields_ = 0;
};

}  // namespace dbctl
