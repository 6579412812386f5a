// Copyright (c) 2024 liudegui. MIT License.
//
// dbctl::BasicRows / dbctl::BasicRow -- throwing views over a backend query.
//
// Design:
//   - Rows owns the backend query and finalizes it on every exit path
//   - Row defers the query's error to Scan(), so "no row" and "query
//     failed" are both decided by the caller of Scan()
//   - Scan() converts column text into the destination type and throws
//     DriverError on NULL, malformed text or a column count mismatch
//
// Scan destinations: int32_t, int64_t, double, bool, std::string,
// std::vector<uint8_t> (NULL scans as empty).

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "dbctl/error.hpp"
#include "dbctl/failure.hpp"
#include "dbctl/sqlite3_backend.hpp"

namespace dbctl {
namespace detail {

// ---------------------------------------------------------------------------
// Column conversion
// ---------------------------------------------------------------------------

inline bool NullInto(const char* type_name, Error* out_error) {
  out_error->SetFormat(ErrorCode::kMismatch,
                       "converting NULL to %s is unsupported", type_name);
  return false;
}

inline bool ParseInt64(const char* text, const char* type_name, int64_t* out,
                       Error* out_error) {
  errno = 0;
  char* end = nullptr;
  long long value = std::strtoll(text, &end, 10);
  if (end == text || *end != '\0') {
    out_error->SetFormat(ErrorCode::kMismatch,
                         "converting \"%s\" to %s: invalid syntax", text,
                         type_name);
    return false;
  }
  if (errno == ERANGE) {
    out_error->SetFormat(ErrorCode::kRange,
                         "converting \"%s\" to %s: value out of range", text,
                         type_name);
    return false;
  }
  *out = static_cast<int64_t>(value);
  return true;
}

template <typename Query>
bool ScanColumn(const Query& q, int32_t col, int64_t& out, Error* out_error) {
  if (q.FieldIsNull(col)) { return NullInto("int64", out_error); }
  return ParseInt64(q.FieldValue(col), "int64", &out, out_error);
}

template <typename Query>
bool ScanColumn(const Query& q, int32_t col, int32_t& out, Error* out_error) {
  if (q.FieldIsNull(col)) { return NullInto("int32", out_error); }
  int64_t wide = 0;
  if (!ParseInt64(q.FieldValue(col), "int32", &wide, out_error)) {
    return false;
  }
  if (wide < std::numeric_limits<int32_t>::min() ||
      wide > std::numeric_limits<int32_t>::max()) {
    out_error->SetFormat(ErrorCode::kRange,
                         "converting \"%s\" to int32: value out of range",
                         q.FieldValue(col));
    return false;
  }
  out = static_cast<int32_t>(wide);
  return true;
}

template <typename Query>
bool ScanColumn(const Query& q, int32_t col, double& out, Error* out_error) {
  if (q.FieldIsNull(col)) { return NullInto("double", out_error); }
  const char* text = q.FieldValue(col);
  char* end = nullptr;
  double value = std::strtod(text, &end);
  if (end == text || *end != '\0') {
    out_error->SetFormat(ErrorCode::kMismatch,
                         "converting \"%s\" to double: invalid syntax", text);
    return false;
  }
  out = value;
  return true;
}

template <typename Query>
bool ScanColumn(const Query& q, int32_t col, bool& out, Error* out_error) {
  if (q.FieldIsNull(col)) { return NullInto("bool", out_error); }
  const char* text = q.FieldValue(col);
  static const char* const kTrue[] = {"1", "t", "T", "true", "TRUE", "True"};
  static const char* const kFalse[] = {"0", "f", "F", "false", "FALSE",
                                       "False"};
  for (const char* word : kTrue) {
    if (std::strcmp(text, word) == 0) {
      out = true;
      return true;
    }
  }
  for (const char* word : kFalse) {
    if (std::strcmp(text, word) == 0) {
      out = false;
      return true;
    }
  }
  out_error->SetFormat(ErrorCode::kMismatch,
                       "converting \"%s\" to bool: invalid syntax", text);
  return false;
}

template <typename Query>
bool ScanColumn(const Query& q, int32_t col, std::string& out,
                Error* out_error) {
  if (q.FieldIsNull(col)) { return NullInto("string", out_error); }
  int32_t len = 0;
  const uint8_t* bytes = q.GetBlob(col, len);
  out.assign(reinterpret_cast<const char*>(bytes),
             static_cast<size_t>(bytes != nullptr ? len : 0));
  return true;
}

template <typename Query>
bool ScanColumn(const Query& q, int32_t col, std::vector<uint8_t>& out,
                Error*) {
  int32_t len = 0;
  const uint8_t* bytes = q.GetBlob(col, len);
  if (bytes == nullptr || len <= 0) {
    out.clear();
  } else {
    out.assign(bytes, bytes + len);
  }
  return true;
}

template <typename Query>
void ScanInto(const Query&, int32_t, const std::string&) {}

template <typename Query, typename First, typename... Rest>
void ScanInto(const Query& q, int32_t col, const std::string& sql,
              First& first, Rest&... rest) {
  Error err;
  if (!ScanColumn(q, col, first, &err)) {
    const char* name = q.FieldName(col);
    throw DriverError(err, "Scan error on column index " +
                               std::to_string(col) + ", name \"" +
                               (name != nullptr ? name : "") + "\"",
                      sql, std::vector<std::string>());
  }
  ScanInto(q, col + 1, sql, rest...);
}

template <typename Query, typename... Dest>
void ScanRow(const Query& q, const std::string& sql, Dest&... dest) {
  const int32_t want = static_cast<int32_t>(sizeof...(Dest));
  if (q.NumFields() != want) {
    Error err;
    err.SetFormat(ErrorCode::kRange,
                  "expected %d destination arguments in Scan, not %d",
                  q.NumFields(), want);
    throw DriverError(err, "Scan", sql, std::vector<std::string>());
  }
  ScanInto(q, 0, sql, dest...);
}

}  // namespace detail

// ---------------------------------------------------------------------------
// BasicRows -- row-set
// ---------------------------------------------------------------------------

template <typename Backend = Sqlite3Backend>
class BasicRows {
 public:
  using QueryType = typename Backend::Query;

  BasicRows() = default;

  BasicRows(QueryType query, std::string sql)
      : query_(std::move(query)), sql_(std::move(sql)) {}

  BasicRows(BasicRows&&) noexcept = default;
  BasicRows& operator=(BasicRows&&) noexcept = default;

  BasicRows(const BasicRows&) = delete;
  BasicRows& operator=(const BasicRows&) = delete;

  /// Advance to the next row. The first call positions on the first row.
  /// Returns false at the end of data; throws DriverError if stepping fails.
  bool Next() {
    if (!query_.Valid()) { return false; }
    if (!started_) {
      started_ = true;
      return !query_.Eof();
    }
    Error err;
    query_.NextRow(&err);
    if (!err.ok()) {
      throw DriverError(err, "Iterate rows", sql_, std::vector<std::string>());
    }
    return !query_.Eof();
  }

  std::vector<std::string> Columns() const {
    CheckOpen("Columns");
    std::vector<std::string> columns;
    for (int32_t i = 0; i < query_.NumFields(); ++i) {
      const char* name = query_.FieldName(i);
      columns.emplace_back(name != nullptr ? name : "");
    }
    return columns;
  }

  /// Scan the current row into `dest...`, one destination per column.
  template <typename... Dest>
  void Scan(Dest&... dest) const {
    CheckOpen("Scan");
    if (!started_ || query_.Eof()) {
      throw DriverError(
          Error::Make(ErrorCode::kMisuse, "Scan called without calling Next"),
          "Scan", sql_, std::vector<std::string>());
    }
    detail::ScanRow(query_, sql_, dest...);
  }

  bool IsNull(int32_t col) const { return query_.FieldIsNull(col); }

  /// Raw backend cursor, for the typed accessors with null defaults.
  const QueryType& Query() const { return query_; }

  void Close() { query_.Finalize(); }

  bool Closed() const { return !query_.Valid(); }

 private:
  void CheckOpen(const char* what) const {
    if (!query_.Valid()) {
      throw DriverError(Error::Make(ErrorCode::kMisuse, "rows are closed"),
                        what, sql_, std::vector<std::string>());
    }
  }

  QueryType query_;
  std::string sql_;
  bool started_ = false;
};

// ---------------------------------------------------------------------------
// BasicRow -- single-row result
// ---------------------------------------------------------------------------

template <typename Backend = Sqlite3Backend>
class BasicRow {
 public:
  using QueryType = typename Backend::Query;

  /// A row whose query failed; Scan() throws `err`.
  BasicRow(const Error& err, std::string sql, std::vector<std::string> args)
      : err_(err), sql_(std::move(sql)), args_(std::move(args)) {}

  BasicRow(QueryType query, std::string sql, std::vector<std::string> args)
      : query_(std::move(query)), sql_(std::move(sql)),
        args_(std::move(args)) {}

  BasicRow(BasicRow&&) noexcept = default;
  BasicRow& operator=(BasicRow&&) noexcept = default;

  BasicRow(const BasicRow&) = delete;
  BasicRow& operator=(const BasicRow&) = delete;

  /// True if the query produced a row. Throws the deferred query error.
  bool Found() const {
    ThrowIfFailed();
    return !query_.Eof();
  }

  /// Scan the first row. Throws DriverError(kNotFound) when there is none.
  template <typename... Dest>
  void Scan(Dest&... dest) {
    ThrowIfFailed();
    if (query_.Eof()) {
      throw DriverError(
          Error::Make(ErrorCode::kNotFound, "no rows in result set"),
          "Scan row", sql_, args_);
    }
    detail::ScanRow(query_, sql_, dest...);
    query_.Finalize();
  }

  const Error& Err() const { return err_; }

 private:
  void ThrowIfFailed() const {
    if (!err_.ok()) { throw DriverError(err_, "Query row", sql_, args_); }
  }

  Error err_;
  QueryType query_;
  std::string sql_;
  std::vector<std::string> args_;
};

using Rows = BasicRows<Sqlite3Backend>;
using Row  = BasicRow<Sqlite3Backend>;

}  // namespace dbctl
