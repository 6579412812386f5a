// Copyright (c) 2024 liudegui. MIT License.
//
// dbctl::BasicStmt -- throwing prepared statement bound to one connection.
//
// Also holds the exec/query helpers shared by the statement, transaction
// and controller layers: compile, bind, run, and turn a failed Error into a
// DriverError that names the SQL and its arguments.
//
// A statement borrows its connection; it must not outlive the transaction
// (or controller callback) that prepared it.

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "dbctl/args.hpp"
#include "dbctl/error.hpp"
#include "dbctl/failure.hpp"
#include "dbctl/result.hpp"
#include "dbctl/rows.hpp"
#include "dbctl/sqlite3_backend.hpp"

namespace dbctl {
namespace detail {

template <typename Backend, typename... Args>
typename Backend::Statement CompileOrThrow(typename Backend::Db& db,
                                           const std::string& sql,
                                           const char* context,
                                           const Args&... args) {
  Error err;
  typename Backend::Statement stmt = db.CompileStatement(sql.c_str(), &err);
  if (!stmt.Valid()) {
    throw DriverError(err, context, sql, FormatArgs(args...));
  }
  return stmt;
}

template <typename Backend, typename... Args>
Result ExecStatement(typename Backend::Statement& stmt, const std::string& sql,
                     const Args&... args) {
  Error err = stmt.Reset();
  if (err.ok()) { err = BindArgs(stmt, args...); }
  if (!err.ok()) {
    throw DriverError(err, "Exec SQL with exception", sql,
                      FormatArgs(args...));
  }
  int32_t changes = stmt.ExecDml(&err);
  if (changes < 0) {
    throw DriverError(err, "Exec SQL with exception", sql,
                      FormatArgs(args...));
  }
  return Result(stmt.LastInsertId(), changes);
}

template <typename Backend, typename... Args>
Result ExecOn(typename Backend::Db& db, const std::string& sql,
              const Args&... args) {
  typename Backend::Statement stmt = CompileOrThrow<Backend>(
      db, sql, "Exec SQL with exception", args...);
  return ExecStatement<Backend>(stmt, sql, args...);
}

/// Compile, bind and run a query. Returns the failure in `out_error`
/// instead of throwing.
template <typename Backend, typename... Args>
typename Backend::Query RunQuery(typename Backend::Db& db,
                                 const std::string& sql, Error* out_error,
                                 const Args&... args) {
  typename Backend::Statement stmt =
      db.CompileStatement(sql.c_str(), out_error);
  if (!stmt.Valid()) { return typename Backend::Query{}; }
  Error err = BindArgs(stmt, args...);
  if (!err.ok()) {
    *out_error = err;
    return typename Backend::Query{};
  }
  return stmt.ExecQuery(out_error);
}

template <typename Backend, typename... Args>
BasicRows<Backend> QueryOn(typename Backend::Db& db, const std::string& sql,
                           const Args&... args) {
  Error err;
  typename Backend::Query query = RunQuery<Backend>(db, sql, &err, args...);
  if (!err.ok()) {
    throw DriverError(err, "Query SQL with exception", sql,
                      FormatArgs(args...));
  }
  return BasicRows<Backend>(std::move(query), sql);
}

template <typename Backend, typename... Args>
BasicRow<Backend> QueryRowOn(typename Backend::Db& db, const std::string& sql,
                             const Args&... args) {
  Error err;
  typename Backend::Query query = RunQuery<Backend>(db, sql, &err, args...);
  if (!err.ok()) {
    return BasicRow<Backend>(err, sql, FormatArgs(args...));
  }
  return BasicRow<Backend>(std::move(query), sql, FormatArgs(args...));
}

}  // namespace detail

// ---------------------------------------------------------------------------
// BasicStmt
// ---------------------------------------------------------------------------

template <typename Backend = Sqlite3Backend>
class BasicStmt {
 public:
  using DbType        = typename Backend::Db;
  using StatementType = typename Backend::Statement;

  BasicStmt(DbType& db, std::string sql)
      : db_(&db),
        sql_(std::move(sql)),
        stmt_(detail::CompileOrThrow<Backend>(db, sql_,
                                              "Prepare SQL with exception")) {}

  BasicStmt(BasicStmt&&) noexcept = default;
  BasicStmt& operator=(BasicStmt&&) noexcept = default;

  BasicStmt(const BasicStmt&) = delete;
  BasicStmt& operator=(const BasicStmt&) = delete;

  template <typename... Args>
  Result Exec(const Args&... args) {
    CheckOpen();
    return detail::ExecStatement<Backend>(stmt_, sql_, args...);
  }

  /// Each query runs on its own compiled copy, so the returned rows stay
  /// valid across later Exec() calls on this statement.
  template <typename... Args>
  BasicRows<Backend> Query(const Args&... args) {
    CheckOpen();
    return detail::QueryOn<Backend>(*db_, sql_, args...);
  }

  template <typename... Args>
  BasicRow<Backend> QueryRow(const Args&... args) {
    CheckOpen();
    return detail::QueryRowOn<Backend>(*db_, sql_, args...);
  }

  void Close() { stmt_.Finalize(); }

  const std::string& Sql() const { return sql_; }

 private:
  void CheckOpen() const {
    if (!stmt_.Valid()) {
      throw DriverError(
          Error::Make(ErrorCode::kMisuse, "statement is closed"),
          "Prepared statement", sql_, std::vector<std::string>());
    }
  }

  DbType* db_;
  std::string sql_;
  StatementType stmt_;
};

using Stmt = BasicStmt<Sqlite3Backend>;

}  // namespace dbctl
