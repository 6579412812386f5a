// Copyright (c) 2024 liudegui. MIT License.
// Tests for the transaction manager and the controller's transaction
// operations.

#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "dbctl/controller.hpp"
#include "fault_backend.hpp"

using namespace dbctl;

static DbConfig SharedMemory(const char* name) {
  DbConfig config;
  config.dsn = std::string("file:") + name + "?mode=memory&cache=shared";
  return config;
}

template <typename Backend>
static BasicController<Backend> OpenTestController(const char* name) {
  auto controller = OpenController<Backend>(SharedMemory(name));
  controller.Execute("CREATE TABLE t(id INTEGER PRIMARY KEY)");
  return controller;
}

template <typename Backend>
static std::vector<int64_t> Ids(BasicController<Backend>& controller) {
  std::vector<int64_t> ids;
  controller.QueryForRows(
      [&](BasicRows<Backend>& rows) {
        int64_t id = 0;
        rows.Scan(id);
        ids.push_back(id);
        return IterateControl::kContinue;
      },
      "SELECT id FROM t ORDER BY id");
  return ids;
}

// ---------------------------------------------------------------------------
// RunInTransaction
// ---------------------------------------------------------------------------

TEST_CASE("Transaction: commit makes writes visible", "[transaction]") {
  auto controller = OpenTestController<Sqlite3Backend>("tx_commit");
  controller.RunInTransaction([](Tx& tx) {
    tx.Exec("INSERT INTO t VALUES (?)", 1);
    tx.Exec("INSERT INTO t VALUES (?)", 2);
    return TxFinale::kCommit;
  });
  REQUIRE(Ids(controller) == std::vector<int64_t>{1, 2});
}

TEST_CASE("Transaction: rollback discards writes", "[transaction]") {
  auto controller = OpenTestController<Sqlite3Backend>("tx_rollback");
  controller.RunInTransaction([](Tx& tx) {
    tx.Exec("INSERT INTO t VALUES (1)");
    return TxFinale::kRollback;
  });
  REQUIRE(Ids(controller).empty());
}

TEST_CASE("Transaction: interface callback", "[transaction]") {
  class InsertOne : public TxCallback {
   public:
    TxFinale InTx(Tx& tx) override {
      tx.Exec("INSERT INTO t VALUES (?)", 42);
      return TxFinale::kCommit;
    }
  };

  auto controller = OpenTestController<Sqlite3Backend>("tx_iface");
  InsertOne callback;
  controller.RunInTransaction(callback);
  REQUIRE(Ids(controller) == std::vector<int64_t>{42});
}

TEST_CASE("Transaction: callback failure rolls back and keeps the cause",
          "[transaction]") {
  auto controller = OpenTestController<Sqlite3Backend>("tx_throw");
  std::exception_ptr slot;
  controller.RegisterFailureHandler(CaptureFailureInto(&slot));

  controller.RunInTransaction([](Tx& tx) -> TxFinale {
    tx.Exec("INSERT INTO t VALUES (1)");
    throw std::out_of_range("callback gave up");
  });

  REQUIRE(Ids(controller).empty());
  REQUIRE(slot != nullptr);
  REQUIRE_THROWS_AS(std::rethrow_exception(slot), std::out_of_range);
  REQUIRE(FailureMessage(slot) == "callback gave up");
}

TEST_CASE("Transaction: callback failure without handlers reaches caller",
          "[transaction]") {
  auto controller = OpenTestController<Sqlite3Backend>("tx_throw_plain");
  REQUIRE_THROWS_AS(controller.RunInTransaction([](Tx& tx) -> TxFinale {
                      tx.Exec("INSERT INTO t VALUES (1)");
                      throw std::runtime_error("boom");
                    }),
                    std::runtime_error);
  REQUIRE(Ids(controller).empty());
}

TEST_CASE("Transaction: failed rollback yields a composite failure",
          "[transaction]") {
  auto controller = OpenTestController<Sqlite3Backend>("tx_composite");

  // Committing inside the callback consumes the transaction, so the
  // automatic rollback after the throw must fail.
  try {
    controller.RunInTransaction([](Tx& tx) -> TxFinale {
      tx.Exec("INSERT INTO t VALUES (1)");
      tx.Commit();
      throw std::runtime_error("after commit");
    });
    FAIL("expected CompositeFailure");
  } catch (const CompositeFailure& e) {
    REQUIRE(FailureMessage(e.Original()) == "after commit");
    REQUIRE_THROWS_AS(std::rethrow_exception(e.Rollback()), DriverError);
    REQUIRE(std::string(e.what()).find(
                "Transaction has error: after commit. "
                "Rollback has error too: Rollback transaction") == 0);
  }
  REQUIRE(Ids(controller) == std::vector<int64_t>{1});
}

TEST_CASE("Transaction: driver rollback failure yields a composite failure",
          "[transaction]") {
  FaultScope faults;
  // The pool closes the connection whose rollback failed; keep the shared
  // in-memory database alive without it.
  Sqlite3Db keeper;
  REQUIRE(keeper.Open(SharedMemory("tx_fault_rollback").dsn.c_str()).ok());
  auto controller = OpenTestController<FaultBackend>("tx_fault_rollback");
  std::exception_ptr slot;
  controller.RegisterFailureHandler(CaptureFailureInto(&slot));

  faults->fail_rollback = true;
  controller.RunInTransaction([](BasicTx<FaultBackend>& tx) -> TxFinale {
    tx.Exec("INSERT INTO t VALUES (7)");
    throw std::runtime_error("original");
  });
  faults->fail_rollback = false;

  REQUIRE(slot != nullptr);
  try {
    std::rethrow_exception(slot);
  } catch (const CompositeFailure& e) {
    REQUIRE(FailureMessage(e.Original()) == "original");
    try {
      std::rethrow_exception(e.Rollback());
    } catch (const DriverError& rollback) {
      REQUIRE(rollback.code() == ErrorCode::kIoError);
    }
  }
  REQUIRE(Ids(controller).empty());
}

TEST_CASE("Transaction: begin failure skips the callback", "[transaction]") {
  FaultScope faults;
  auto controller = OpenTestController<FaultBackend>("tx_fault_begin");
  faults->fail_begin = true;

  bool called = false;
  REQUIRE_THROWS_AS(
      controller.RunInTransaction([&](BasicTx<FaultBackend>&) {
        called = true;
        return TxFinale::kCommit;
      }),
      DriverError);
  REQUIRE_FALSE(called);
}

TEST_CASE("Transaction: commit failure is a driver error", "[transaction]") {
  FaultScope faults;
  auto controller = OpenTestController<FaultBackend>("tx_fault_commit");
  faults->fail_commit = true;

  try {
    controller.RunInTransaction([](BasicTx<FaultBackend>& tx) {
      tx.Exec("INSERT INTO t VALUES (3)");
      return TxFinale::kCommit;
    });
    FAIL("expected DriverError");
  } catch (const DriverError& e) {
    REQUIRE(e.code() == ErrorCode::kIoError);
    REQUIRE(std::string(e.what()).find("Commit transaction") == 0);
  }
  faults->fail_commit = false;
  REQUIRE(Ids(controller).empty());
}

TEST_CASE("Transaction: unknown finale rolls back", "[transaction]") {
  auto controller = OpenTestController<Sqlite3Backend>("tx_unknown_finale");
  try {
    controller.RunInTransaction([](Tx& tx) {
      tx.Exec("INSERT INTO t VALUES (1)");
      return static_cast<TxFinale>(9);
    });
    FAIL("expected DbError");
  } catch (const DbError& e) {
    REQUIRE(e.code() == ErrorCode::kMisuse);
  }
  REQUIRE(Ids(controller).empty());
}

// ---------------------------------------------------------------------------
// ExecuteManyInTransaction / BuildTxForSqls
// ---------------------------------------------------------------------------

TEST_CASE("Transaction: execute many inserts every row", "[transaction]") {
  auto controller = OpenTestController<Sqlite3Backend>("tx_many");
  REQUIRE_NOTHROW(controller.ExecuteManyInTransaction(
      {"INSERT INTO t VALUES (1)", "INSERT INTO t VALUES (2)"}));
  REQUIRE(Ids(controller) == std::vector<int64_t>{1, 2});
}

TEST_CASE("Transaction: execute many is all or nothing", "[transaction]") {
  auto controller = OpenTestController<Sqlite3Backend>("tx_many_invalid");
  try {
    controller.ExecuteManyInTransaction({"INSERT INTO t VALUES (1)",
                                         "INSERT INTO t VALUES (2)",
                                         "INVALID SQL"});
    FAIL("expected DriverError");
  } catch (const DriverError& e) {
    REQUIRE(e.query() == "INVALID SQL");
  }
  REQUIRE(Ids(controller).empty());
}

TEST_CASE("Transaction: execute many with no queries", "[transaction]") {
  auto controller = OpenTestController<Sqlite3Backend>("tx_many_empty");
  REQUIRE_NOTHROW(controller.ExecuteManyInTransaction({}));
  REQUIRE(Ids(controller).empty());
}

TEST_CASE("Transaction: BuildTxForSqls is reusable", "[transaction]") {
  auto controller = OpenTestController<Sqlite3Backend>("tx_build");
  auto callback = BuildTxForSqls({"INSERT INTO t VALUES (5)"});
  controller.RunInTransaction(callback);
  REQUIRE_THROWS_AS(controller.RunInTransaction(callback), DriverError);
  REQUIRE(Ids(controller) == std::vector<int64_t>{5});
}

// ---------------------------------------------------------------------------
// RunConditionallyInTransaction
// ---------------------------------------------------------------------------

TEST_CASE("Transaction: conditional runs the body when boot agrees",
          "[transaction]") {
  auto controller = OpenTestController<Sqlite3Backend>("tx_cond_true");
  controller.RunConditionallyInTransaction(
      [](Tx& tx) {
        int64_t count = -1;
        tx.QueryRow("SELECT count(*) FROM t").Scan(count);
        return count == 0;
      },
      [](Tx& tx) { tx.Exec("INSERT INTO t VALUES (1)"); });
  REQUIRE(Ids(controller) == std::vector<int64_t>{1});
}

TEST_CASE("Transaction: conditional skips the body and still commits",
          "[transaction]") {
  auto controller = OpenTestController<Sqlite3Backend>("tx_cond_false");
  bool ran = false;
  controller.RunConditionallyInTransaction(
      [](Tx& tx) {
        tx.Exec("INSERT INTO t VALUES (8)");
        return false;
      },
      [&](Tx&) { ran = true; });
  REQUIRE_FALSE(ran);
  REQUIRE(Ids(controller) == std::vector<int64_t>{8});
}

TEST_CASE("Transaction: conditional body failure rolls back boot writes",
          "[transaction]") {
  class BootThenFail : public ConditionalTxCallback {
   public:
    bool BootCallback(Tx& tx) override {
      tx.Exec("INSERT INTO t VALUES (1)");
      return true;
    }
    void IfTrue(Tx& tx) override { tx.Exec("INSERT INTO t VALUES (1)"); }
  };

  auto controller = OpenTestController<Sqlite3Backend>("tx_cond_fail");
  BootThenFail callback;
  try {
    controller.RunConditionallyInTransaction(callback);
    FAIL("expected DriverError");
  } catch (const DriverError& e) {
    REQUIRE(e.code() == ErrorCode::kConstraint);
  }
  REQUIRE(Ids(controller).empty());
}

// ---------------------------------------------------------------------------
// Concurrency
// ---------------------------------------------------------------------------

TEST_CASE("Transaction: concurrent callers share one controller",
          "[transaction]") {
  const char* path = "dbctl_tx_threads.db";
  std::remove(path);
  std::remove("dbctl_tx_threads.db-journal");

  DbConfig config;
  config.dsn = path;
  config.max_idle = 4;
  config.busy_timeout_ms = 10000;
  auto controller = OpenController(config);
  controller.Execute("CREATE TABLE t(id INTEGER PRIMARY KEY)");

  constexpr int32_t kThreads = 4;
  constexpr int32_t kPerThread = 25;
  std::atomic<int32_t> failures{0};
  std::vector<std::thread> threads;
  for (int32_t t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      for (int32_t i = 0; i < kPerThread; ++i) {
        const int32_t id = t * kPerThread + i;
        try {
          if (i % 2 == 0) {
            controller.Execute("INSERT INTO t VALUES (?)", id);
          } else {
            controller.RunInTransaction([id](Tx& tx) {
              tx.Exec("INSERT INTO t VALUES (?)", id);
              return TxFinale::kCommit;
            });
          }
        } catch (const std::exception&) {
          ++failures;
        }
      }
    });
  }
  for (auto& th : threads) { th.join(); }

  REQUIRE(failures.load() == 0);
  REQUIRE(Ids(controller).size() == static_cast<size_t>(kThreads * kPerThread));

  controller.Release();
  std::remove(path);
}
