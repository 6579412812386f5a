// Copyright (c) 2024 liudegui. MIT License.
//
// dbctl::Database<Backend> -- pooled, thread-safe database handle.
//
// Design:
//   - Owns up to DbConfig::max_idle idle backend connections
//   - Acquire() leases a connection (idle first, else a new one); the lease
//     is RAII and hands the connection back when destroyed
//   - A connection handed back while still inside a transaction is rolled
//     back before it can be reused
//   - Error reporting via Error return / Error* out parameter (no exceptions)
//   - To switch backend: using MyDb = dbctl::Database<MyBackend>;
//
// Usage:
//   dbctl::Db db;
//   dbctl::DbConfig config;
//   config.dsn = "file:app?mode=memory&cache=shared";
//   db.Open(config);
//   dbctl::Error err;
//   auto conn = db.Acquire(&err);
//   conn->ExecDml("CREATE TABLE t(id INTEGER);", &err);
//
// Leases must not outlive the Database they came from.

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "dbctl/config.hpp"
#include "dbctl/error.hpp"
#include "dbctl/log.hpp"
#include "dbctl/sqlite3_backend.hpp"

namespace dbctl {

template <typename Backend = Sqlite3Backend>
class Database {
 public:
  using DbType        = typename Backend::Db;
  using QueryType     = typename Backend::Query;
  using StatementType = typename Backend::Statement;

  // -------------------------------------------------------------------------
  // Connection -- a leased backend connection
  // -------------------------------------------------------------------------

  class Connection {
   public:
    Connection() = default;

    ~Connection() { Return(); }

    Connection(Connection&& other) noexcept
        : owner_(other.owner_), db_(std::move(other.db_)) {
      other.owner_ = nullptr;
    }

    Connection& operator=(Connection&& other) noexcept {
      if (this != &other) {
        Return();
        owner_ = other.owner_;
        db_ = std::move(other.db_);
        other.owner_ = nullptr;
      }
      return *this;
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    bool Valid() const { return db_ != nullptr; }

    DbType& operator*() const { return *db_; }
    DbType* operator->() const { return db_.get(); }

    /// Hand the connection back to the pool before destruction.
    void Return() {
      if (owner_ != nullptr && db_ != nullptr) {
        owner_->Release(std::move(db_));
      }
      owner_ = nullptr;
      db_.reset();
    }

   private:
    friend class Database;

    Connection(Database* owner, std::unique_ptr<DbType> db)
        : owner_(owner), db_(std::move(db)) {}

    Database* owner_ = nullptr;
    std::unique_ptr<DbType> db_;
  };

  Database() = default;
  ~Database() = default;

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  // --- Open / Close ---

  /// Open the pool. The first connection is opened eagerly so a bad DSN
  /// fails here rather than on first use.
  Error Open(const DbConfig& config) {
    if (config.max_idle < 0) {
      return Error::Make(ErrorCode::kRange, "max_idle must be >= 0");
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (open_) {
        return Error::Make(ErrorCode::kMisuse, "Database already open");
      }
      config_ = config;
    }

    Error err;
    std::unique_ptr<DbType> first = OpenConnection(&err);
    if (first == nullptr) { return err; }

    std::lock_guard<std::mutex> lock(mutex_);
    open_ = true;
    if (config_.max_idle > 0) {
      idle_.push_back(std::move(first));
    } else if (IsMemoryDsn(config_.dsn)) {
      // A shared in-memory database lives only while a connection is open.
      anchor_ = std::move(first);
    } else {
      CloseConnection(std::move(first));
    }
    Logger()->debug("database opened: {}", config_.ToString());
    return Error::Ok();
  }

  Error Open(const char* dsn) {
    if (dsn == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "dsn is null");
    }
    DbConfig config;
    config.dsn = dsn;
    return Open(config);
  }

  /// Close every idle connection. Fails with kBusy, leaving the pool
  /// untouched, while any connection is still leased.
  Error Close() {
    std::vector<std::unique_ptr<DbType>> idle;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!open_) { return Error::Ok(); }
      if (in_use_ > 0) {
        Error err;
        err.SetFormat(ErrorCode::kBusy, "%u connection(s) still in use",
                      static_cast<unsigned>(in_use_));
        return err;
      }
      idle.swap(idle_);
      if (anchor_ != nullptr) { idle.push_back(std::move(anchor_)); }
      open_ = false;
    }

    Error first_err;
    for (auto& db : idle) {
      Error err = db->Close();
      if (!err.ok() && first_err.ok()) { first_err = err; }
    }
    return first_err;
  }

  bool IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
  }

  // --- Leasing ---

  /// Lease a connection. Returns an invalid Connection on failure.
  Connection Acquire(Error* out_error = nullptr) {
    std::unique_ptr<DbType> db;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!open_) {
        if (out_error != nullptr) {
          out_error->Set(ErrorCode::kNotOpen, "Database not open");
        }
        return Connection{};
      }
      if (!idle_.empty()) {
        db = std::move(idle_.back());
        idle_.pop_back();
      }
      ++in_use_;
    }

    if (db == nullptr) {
      db = OpenConnection(out_error);
      if (db == nullptr) {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_use_;
        return Connection{};
      }
    }
    return Connection(this, std::move(db));
  }

  size_t IdleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
  }

  size_t InUseCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
  }

  DbConfig Config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
  }

 private:
  static bool IsMemoryDsn(const std::string& dsn) {
    return dsn.find("mode=memory") != std::string::npos;
  }

  std::unique_ptr<DbType> OpenConnection(Error* out_error) {
    DbConfig config = Config();
    std::unique_ptr<DbType> db(new DbType());
    Error err = db->Open(config.dsn.c_str());
    if (!err.ok()) {
      if (out_error != nullptr) { *out_error = err; }
      return nullptr;
    }
    if (config.busy_timeout_ms > 0) {
      db->SetBusyTimeout(config.busy_timeout_ms);
    }
    Logger()->debug("connection opened: {}", config.dsn);
    return db;
  }

  static void CloseConnection(std::unique_ptr<DbType> db) {
    Error err = db->Close();
    if (!err.ok()) {
      Logger()->warn("connection close failed: {}", err.message);
    } else {
      Logger()->debug("connection closed");
    }
  }

  void Release(std::unique_ptr<DbType> db) {
    if (db->InTransaction()) {
      Error err = db->Rollback();
      Logger()->warn("connection returned inside a transaction, rolled back{}{}",
                     err.ok() ? "" : ": ", err.message);
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --in_use_;
      if (open_ && !db->InTransaction() &&
          idle_.size() < static_cast<size_t>(config_.max_idle)) {
        idle_.push_back(std::move(db));
        return;
      }
    }
    CloseConnection(std::move(db));
  }

  mutable std::mutex mutex_;
  DbConfig config_;
  bool open_ = false;
  std::vector<std::unique_ptr<DbType>> idle_;
  std::unique_ptr<DbType> anchor_;  // keeps mode=memory alive, max_idle == 0
  size_t in_use_ = 0;
};

// ---------------------------------------------------------------------------
// Default type aliases -- users just use dbctl::Db
// ---------------------------------------------------------------------------

using Db = Database<Sqlite3Backend>;

}  // namespace dbctl
