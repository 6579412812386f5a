// Copyright (c) 2024 liudegui. MIT License.
//
// dbctl::BasicController -- the database access controller.
//
// Design:
//   - Owns one Connection Handle (a pooled Database) from construction
//     until Release()
//   - Operate() is the single entry point: every operation, Release()
//     included, runs its work inside one RecoveryBoundary
//   - With no failure handler registered, failures reach the caller
//     unchanged; otherwise the handlers decide, and an operation whose
//     failure was handled returns a default value
//   - NotInitializedError is thrown before the boundary and never reaches
//     a handler
//
// Usage:
//   auto controller = dbctl::OpenController(config);
//   controller.Execute("INSERT INTO t(id) VALUES (?)", 1);
//   controller.RunInTransaction([](dbctl::Tx& tx) {
//     tx.Exec("UPDATE t SET id = id + 1");
//     return dbctl::TxFinale::kCommit;
//   });
//   controller.Release();
//
// Operations may run concurrently. RegisterFailureHandler() and Release()
// must not overlap any other call.

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "dbctl/callback.hpp"
#include "dbctl/config.hpp"
#include "dbctl/db.hpp"
#include "dbctl/error.hpp"
#include "dbctl/failure.hpp"
#include "dbctl/log.hpp"
#include "dbctl/recovery.hpp"
#include "dbctl/result.hpp"
#include "dbctl/rows.hpp"
#include "dbctl/stmt.hpp"
#include "dbctl/transaction.hpp"
#include "dbctl/tx.hpp"

namespace dbctl {

template <typename Backend = Sqlite3Backend>
class BasicController {
 public:
  using DatabaseType = Database<Backend>;
  using Connection   = typename DatabaseType::Connection;

  /// Take ownership of an open handle. Throws InitializationError if
  /// `handle` is null or not open.
  explicit BasicController(std::unique_ptr<DatabaseType> handle)
      : handle_(std::move(handle)) {
    if (handle_ == nullptr) {
      throw InitializationError("The database handle is null");
    }
    if (!handle_->IsOpen()) {
      throw InitializationError("The database handle is not open");
    }
  }

  BasicController(BasicController&&) noexcept = default;
  BasicController& operator=(BasicController&&) noexcept = default;

  BasicController(const BasicController&) = delete;
  BasicController& operator=(const BasicController&) = delete;

  // --- Failure handling ---

  void RegisterFailureHandler(FailureHandler handler) {
    boundary_.Register(std::move(handler));
  }

  size_t HandlerCount() const { return boundary_.HandlerCount(); }

  bool IsInitialized() const { return handle_ != nullptr; }

  // --- Operate ---

  void Operate(BasicConnectionCallback<Backend>& callback) {
    NeedInitialized();
    DatabaseType& db = *handle_;
    boundary_.Guard([&db, &callback]() { callback.OnDb(db); });
  }

  template <typename F>
  detail::EnableIfCallable<F, BasicConnectionCallback<Backend>, void> Operate(
      F&& fn) {
    BasicConnectionCallbackFunc<Backend> callback(std::forward<F>(fn));
    Operate(callback);
  }

  // --- Query execution ---

  template <typename... Args>
  Result Execute(const std::string& query, const Args&... args) {
    Result result;
    Operate([&](DatabaseType& db) {
      Connection conn = Lease(db);
      result = detail::ExecOn<Backend>(*conn, query, args...);
    });
    return result;
  }

  /// Run `query` and hand each row to `callback` until the rows run out or
  /// it returns kStop. Returns the number of rows handed over.
  template <typename... Args>
  uint32_t QueryForRows(BasicRowsCallback<Backend>& callback,
                        const std::string& query, const Args&... args) {
    uint32_t count = 0;
    Operate([&](DatabaseType& db) {
      Connection conn = Lease(db);
      BasicRows<Backend> rows = detail::QueryOn<Backend>(*conn, query, args...);
      while (rows.Next()) {
        ++count;
        if (callback.NextRow(rows) == IterateControl::kStop) { break; }
      }
    });
    return count;
  }

  template <typename F, typename... Args>
  detail::EnableIfCallable<F, BasicRowsCallback<Backend>, uint32_t>
  QueryForRows(F&& fn, const std::string& query, const Args&... args) {
    BasicRowsCallbackFunc<Backend> callback(std::forward<F>(fn));
    return QueryForRows(callback, query, args...);
  }

  /// Hand the single-row result of `query` to `callback`. An empty result
  /// is not a failure here; it surfaces when the callback scans.
  template <typename... Args>
  void QueryForRow(BasicRowCallback<Backend>& callback,
                   const std::string& query, const Args&... args) {
    Operate([&](DatabaseType& db) {
      Connection conn = Lease(db);
      BasicRow<Backend> row = detail::QueryRowOn<Backend>(*conn, query, args...);
      callback.ResultRow(row);
    });
  }

  template <typename F, typename... Args>
  detail::EnableIfCallable<F, BasicRowCallback<Backend>, void> QueryForRow(
      F&& fn, const std::string& query, const Args&... args) {
    BasicRowCallbackFunc<Backend> callback(std::forward<F>(fn));
    QueryForRow(callback, query, args...);
  }

  // --- Transactions ---

  void RunInTransaction(BasicTxCallback<Backend>& callback) {
    Operate([&callback](DatabaseType& db) { RunTransaction(db, callback); });
  }

  template <typename F>
  detail::EnableIfCallable<F, BasicTxCallback<Backend>, void> RunInTransaction(
      F&& fn) {
    BasicTxCallbackFunc<Backend> callback(std::forward<F>(fn));
    RunInTransaction(callback);
  }

  /// Run BootCallback() in a transaction and IfTrue() after it when it
  /// returns true. Commits either way unless one of them throws.
  void RunConditionallyInTransaction(
      BasicConditionalTxCallback<Backend>& callback) {
    BasicTxCallbackFunc<Backend> tx_callback(
        [&callback](BasicTx<Backend>& tx) {
          if (callback.BootCallback(tx)) { callback.IfTrue(tx); }
          return TxFinale::kCommit;
        });
    RunInTransaction(tx_callback);
  }

  void RunConditionallyInTransaction(
      typename BasicConditionalTxCallbackFunc<Backend>::BootFn boot,
      typename BasicConditionalTxCallbackFunc<Backend>::ThenFn then) {
    BasicConditionalTxCallbackFunc<Backend> callback(std::move(boot),
                                                     std::move(then));
    RunConditionallyInTransaction(callback);
  }

  /// Run every query in one transaction; all of them apply or none do.
  void ExecuteManyInTransaction(const std::vector<std::string>& queries) {
    BasicTxCallbackFunc<Backend> callback = BuildTxForSqls<Backend>(queries);
    RunInTransaction(callback);
  }

  // --- Release ---

  /// Close the handle. On success the controller becomes unusable and every
  /// later call, Release() included, throws NotInitializedError. A close
  /// failure goes through the recovery boundary and keeps the handle.
  void Release() {
    NeedInitialized();
    boundary_.Guard([this]() {
      Error err = handle_->Close();
      if (!err.ok()) {
        Logger()->error("Release database connection error. {}", err.message);
        throw DriverError(err, "Release database connection");
      }
      handle_.reset();
    });
  }

 private:
  void NeedInitialized() const {
    if (handle_ == nullptr) { throw NotInitializedError(); }
  }

  static Connection Lease(DatabaseType& db) {
    Error err;
    Connection conn = db.Acquire(&err);
    if (!conn.Valid()) { throw DriverError(err, "Acquire connection"); }
    return conn;
  }

  std::unique_ptr<DatabaseType> handle_;
  RecoveryBoundary boundary_;
};

using Controller = BasicController<Sqlite3Backend>;

/// Open a Database from `config` and wrap it in a controller. Throws
/// DriverError if the database cannot be opened.
template <typename Backend = Sqlite3Backend>
BasicController<Backend> OpenController(const DbConfig& config) {
  std::unique_ptr<Database<Backend>> db(new Database<Backend>());
  Error err = db->Open(config);
  if (!err.ok()) {
    throw DriverError(err, "Open database " + config.ToString());
  }
  return BasicController<Backend>(std::move(db));
}

}  // namespace dbctl
