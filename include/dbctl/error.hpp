// Copyright (c) 2024 liudegui. MIT License.
//
// dbctl::Error -- driver-level error value.
//
// Design:
//   - ErrorCode enum class with fixed-width underlying type
//   - Error struct: code + fixed-size message buffer
//   - Driver primitives never throw; they return or fill an Error
//   - Maps SQLite3 result codes to dbctl error codes

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

#include "sqlite3.h"

namespace dbctl {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------

enum class ErrorCode : int32_t {
  kOk = 0,
  kError = -1,
  kNotOpen = -2,
  kBusy = -3,
  kNotFound = -4,
  kConstraint = -5,
  kMismatch = -6,
  kMisuse = -7,
  kRange = -8,
  kNullParam = -9,
  kIoError = -10,
  kFull = -11,

  // Controller-level failure kinds (see failure.hpp).
  kInitialization = -20,
  kNotInitialized = -21,
  kComposite = -22,
  kNonErrorPayload = -23,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk: return "ok";
    case ErrorCode::kError: return "error";
    case ErrorCode::kNotOpen: return "not open";
    case ErrorCode::kBusy: return "busy";
    case ErrorCode::kNotFound: return "not found";
    case ErrorCode::kConstraint: return "constraint";
    case ErrorCode::kMismatch: return "mismatch";
    case ErrorCode::kMisuse: return "misuse";
    case ErrorCode::kRange: return "range";
    case ErrorCode::kNullParam: return "null param";
    case ErrorCode::kIoError: return "io error";
    case ErrorCode::kFull: return "full";
    case ErrorCode::kInitialization: return "initialization";
    case ErrorCode::kNotInitialized: return "not initialized";
    case ErrorCode::kComposite: return "composite";
    case ErrorCode::kNonErrorPayload: return "non-error payload";
  }
  return "unknown";
}

/// Map a SQLite3 result code (primary or extended) to an ErrorCode.
inline ErrorCode FromSqlite3Code(int32_t rc) {
  switch (rc & 0xFF) {
    case SQLITE_OK:
    case SQLITE_ROW:
    case SQLITE_DONE:
      return ErrorCode::kOk;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::kBusy;
    case SQLITE_NOTFOUND: return ErrorCode::kNotFound;
    case SQLITE_CONSTRAINT: return ErrorCode::kConstraint;
    case SQLITE_MISMATCH: return ErrorCode::kMismatch;
    case SQLITE_MISUSE: return ErrorCode::kMisuse;
    case SQLITE_RANGE: return ErrorCode::kRange;
    case SQLITE_IOERR: return ErrorCode::kIoError;
    case SQLITE_FULL: return ErrorCode::kFull;
    default: return ErrorCode::kError;
  }
}

// ---------------------------------------------------------------------------
// Error
// ---------------------------------------------------------------------------

struct Error {
  static constexpr uint32_t kMaxMessageLen = 256;

  ErrorCode code = ErrorCode::kOk;
  char message[kMaxMessageLen] = {};

  bool ok() const { return code == ErrorCode::kOk; }
  explicit operator bool() const { return ok(); }

  void Set(ErrorCode c, const char* msg) {
    code = c;
    if (msg != nullptr) {
      std::strncpy(message, msg, kMaxMessageLen - 1);
      message[kMaxMessageLen - 1] = '\0';
    } else {
      message[0] = '\0';
    }
  }

  void SetFormat(ErrorCode c, const char* fmt, ...) {
    code = c;
    if (fmt != nullptr) {
      va_list ap;
      va_start(ap, fmt);
      std::vsnprintf(message, kMaxMessageLen, fmt, ap);
      va_end(ap);
    } else {
      message[0] = '\0';
    }
  }

  /// Set from a failing SQLite3 call: code mapped from rc, message from db.
  void SetSqlite3(int32_t rc, sqlite3* db) {
    ErrorCode c = FromSqlite3Code(rc);
    Set(c == ErrorCode::kOk ? ErrorCode::kError : c,
        db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
  }

  void Clear() {
    code = ErrorCode::kOk;
    message[0] = '\0';
  }

  static Error Ok() { return Error{}; }

  static Error Make(ErrorCode c, const char* msg = nullptr) {
    Error e;
    e.Set(c, msg);
    return e;
  }

  static Error FromSqlite3(int32_t rc, sqlite3* db) {
    Error e;
    e.SetSqlite3(rc, db);
    return e;
  }
};

}  // namespace dbctl
