// Copyright (c) 2024 liudegui. MIT License.
//
// dbctl::BasicTx -- a transaction on one leased connection.
//
// Design:
//   - Begin() leases a connection and starts the transaction; the lease is
//     held until the BasicTx is destroyed
//   - Commit()/Rollback() end it; afterwards every call throws
//     DriverError(kMisuse)
//   - A transaction destroyed while still active is rolled back
//   - TryCommit()/TryRollback() report through Error for callers that must
//     not throw (the transaction manager's failure path)

#pragma once

#include <string>
#include <utility>
#include <vector>

#include "dbctl/db.hpp"
#include "dbctl/error.hpp"
#include "dbctl/failure.hpp"
#include "dbctl/log.hpp"
#include "dbctl/result.hpp"
#include "dbctl/rows.hpp"
#include "dbctl/stmt.hpp"

namespace dbctl {

template <typename Backend = Sqlite3Backend>
class BasicTx {
 public:
  using DatabaseType = Database<Backend>;
  using Connection   = typename DatabaseType::Connection;

  /// Lease a connection from `db` and begin a transaction on it.
  static BasicTx Begin(DatabaseType& db) {
    Error err;
    Connection conn = db.Acquire(&err);
    if (!conn.Valid()) {
      throw DriverError(err, "Begin transaction");
    }
    err = conn->BeginTransaction();
    if (!err.ok()) {
      throw DriverError(err, "Begin transaction");
    }
    return BasicTx(std::move(conn));
  }

  ~BasicTx() {
    if (!done_ && conn_.Valid()) {
      Error err = conn_->Rollback();
      Logger()->warn("abandoned transaction rolled back{}{}",
                     err.ok() ? "" : ": ", err.message);
    }
  }

  BasicTx(BasicTx&& other) noexcept
      : conn_(std::move(other.conn_)), done_(other.done_) {
    other.done_ = true;
  }

  BasicTx& operator=(BasicTx&&) = delete;
  BasicTx(const BasicTx&) = delete;
  BasicTx& operator=(const BasicTx&) = delete;

  // --- Statements ---

  template <typename... Args>
  Result Exec(const std::string& sql, const Args&... args) {
    CheckActive(sql);
    return detail::ExecOn<Backend>(*conn_, sql, args...);
  }

  template <typename... Args>
  BasicRows<Backend> Query(const std::string& sql, const Args&... args) {
    CheckActive(sql);
    return detail::QueryOn<Backend>(*conn_, sql, args...);
  }

  template <typename... Args>
  BasicRow<Backend> QueryRow(const std::string& sql, const Args&... args) {
    CheckActive(sql);
    return detail::QueryRowOn<Backend>(*conn_, sql, args...);
  }

  BasicStmt<Backend> Prepare(const std::string& sql) {
    CheckActive(sql);
    return BasicStmt<Backend>(*conn_, sql);
  }

  // --- Finalization ---

  void Commit() {
    Error err = TryCommit();
    if (!err.ok()) { throw DriverError(err, "Commit transaction"); }
  }

  void Rollback() {
    Error err = TryRollback();
    if (!err.ok()) { throw DriverError(err, "Rollback transaction"); }
  }

  Error TryCommit() {
    if (done_) { return DoneError(); }
    done_ = true;
    return conn_->Commit();
  }

  Error TryRollback() {
    if (done_) { return DoneError(); }
    done_ = true;
    return conn_->Rollback();
  }

  bool Done() const { return done_; }

 private:
  explicit BasicTx(Connection conn) : conn_(std::move(conn)) {}

  static Error DoneError() {
    return Error::Make(ErrorCode::kMisuse,
                       "transaction has already been committed or rolled back");
  }

  void CheckActive(const std::string& sql) const {
    if (done_) {
      throw DriverError(DoneError(), "Transaction", sql,
                        std::vector<std::string>());
    }
  }

  Connection conn_;
  bool done_ = false;
};

using Tx = BasicTx<Sqlite3Backend>;

}  // namespace dbctl
