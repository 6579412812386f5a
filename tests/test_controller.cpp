// Copyright (c) 2024 liudegui. MIT License.
// Tests for dbctl::BasicController: construction, operate, queries, release.

#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <exception>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/sinks/ostream_sink.h>

#include "dbctl/controller.hpp"
#include "fault_backend.hpp"

using namespace dbctl;

static DbConfig SharedMemory(const char* name) {
  DbConfig config;
  config.dsn = std::string("file:") + name + "?mode=memory&cache=shared";
  config.max_idle = 2;
  return config;
}

static Controller OpenTestController(const char* name) {
  Controller controller = OpenController(SharedMemory(name));
  controller.Execute("CREATE TABLE t(id INTEGER PRIMARY KEY, name TEXT)");
  return controller;
}

static int64_t CountRows(Controller& controller) {
  int64_t count = -1;
  controller.QueryForRow([&](Row& row) { row.Scan(count); },
                         "SELECT count(*) FROM t");
  return count;
}

// Captures the dbctl logger output for one test.
class LogCapture {
 public:
  LogCapture() {
    SetLogSink(std::make_shared<spdlog::sinks::ostream_sink_mt>(out_));
  }
  ~LogCapture() { spdlog::drop(kLoggerName); }

  std::string Text() const { return out_.str(); }

 private:
  std::ostringstream out_;
};

class CollectIds : public RowsCallback {
 public:
  explicit CollectIds(size_t stop_after) : stop_after_(stop_after) {}

  IterateControl NextRow(Rows& rows) override {
    int64_t id = 0;
    rows.Scan(id);
    ids.push_back(id);
    return ids.size() >= stop_after_ ? IterateControl::kStop
                                     : IterateControl::kContinue;
  }

  std::vector<int64_t> ids;

 private:
  size_t stop_after_;
};

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

TEST_CASE("Controller: null handle is rejected", "[controller]") {
  REQUIRE_THROWS_AS(Controller(std::unique_ptr<Db>()), InitializationError);
}

TEST_CASE("Controller: unopened handle is rejected", "[controller]") {
  std::unique_ptr<Db> db(new Db());
  REQUIRE_THROWS_AS(Controller(std::move(db)), InitializationError);
}

TEST_CASE("Controller: starts with no handlers", "[controller]") {
  std::unique_ptr<Db> db(new Db());
  REQUIRE(db->Open(SharedMemory("ctl_construct")).ok());
  Controller controller(std::move(db));
  REQUIRE(controller.IsInitialized());
  REQUIRE(controller.HandlerCount() == 0);
}

TEST_CASE("Controller: OpenController with a bad dsn", "[controller]") {
  DbConfig config;
  config.dsn = "file:/nonexistent-dir/sub/x.db?mode=ro";
  REQUIRE_THROWS_AS(OpenController(config), DriverError);
}

// ---------------------------------------------------------------------------
// Operate / Execute
// ---------------------------------------------------------------------------

TEST_CASE("Controller: operate hands over the handle", "[controller]") {
  Controller controller = OpenTestController("ctl_operate");
  bool called = false;
  controller.Operate([&](Db& db) {
    called = true;
    REQUIRE(db.IsOpen());
  });
  REQUIRE(called);
}

TEST_CASE("Controller: operate with an interface callback", "[controller]") {
  Controller controller = OpenTestController("ctl_operate_iface");
  int calls = 0;
  ConnectionCallbackFunc callback([&](Db&) { ++calls; });
  controller.Operate(callback);
  controller.Operate(callback);
  REQUIRE(calls == 2);
}

TEST_CASE("Controller: execute returns result", "[controller]") {
  Controller controller = OpenTestController("ctl_execute");
  Result r = controller.Execute("INSERT INTO t(id, name) VALUES(?, ?)", 5,
                                "five");
  REQUIRE(r.LastInsertId() == 5);
  REQUIRE(r.RowsAffected() == 1);
  REQUIRE(CountRows(controller) == 1);
}

TEST_CASE("Controller: execute failure propagates without handlers",
          "[controller]") {
  Controller controller = OpenTestController("ctl_execute_fail");
  try {
    controller.Execute("INSERT INTO missing VALUES(?)", 1);
    FAIL("expected DriverError");
  } catch (const DriverError& e) {
    REQUIRE(e.query() == "INSERT INTO missing VALUES(?)");
    REQUIRE(e.args() == std::vector<std::string>{"1"});
  }
}

TEST_CASE("Controller: handled failure yields an empty result",
          "[controller]") {
  Controller controller = OpenTestController("ctl_execute_handled");
  std::exception_ptr slot;
  controller.RegisterFailureHandler(CaptureFailureInto(&slot));
  REQUIRE(controller.HandlerCount() == 1);

  Result r = controller.Execute("INSERT INTO missing VALUES(1)");
  REQUIRE_FALSE(r.Valid());
  REQUIRE(slot != nullptr);
  REQUIRE_THROWS_AS(std::rethrow_exception(slot), DriverError);
}

TEST_CASE("Controller: any thrown value reaches the boundary",
          "[controller]") {
  Controller controller = OpenTestController("ctl_any_value");
  REQUIRE_THROWS_AS(controller.Operate([](Db&) { throw 42; }), int);

  std::exception_ptr slot;
  controller.RegisterFailureHandler(CaptureFailureInto(&slot));
  REQUIRE_THROWS_AS(controller.Operate([](Db&) { throw 42; }),
                    NonErrorFailurePayload);
  REQUIRE(slot == nullptr);
}

TEST_CASE("Controller: handlers see the identical payload in order",
          "[controller]") {
  Controller controller = OpenTestController("ctl_handler_order");
  std::vector<std::string> order;
  std::exception_ptr first;
  std::exception_ptr second;
  controller.RegisterFailureHandler([&](const std::exception_ptr& f) {
    order.push_back("first");
    first = f;
  });
  controller.RegisterFailureHandler([&](const std::exception_ptr& f) {
    order.push_back("second");
    second = f;
  });

  controller.Operate([](Db&) { throw std::runtime_error("forced"); });
  REQUIRE(order == std::vector<std::string>{"first", "second"});
  REQUIRE(first != nullptr);
  REQUIRE(first == second);
}

TEST_CASE("Controller: a rethrowing handler escapes", "[controller]") {
  Controller controller = OpenTestController("ctl_handler_rethrow");
  int later = 0;
  controller.RegisterFailureHandler([](const std::exception_ptr&) {
    throw std::logic_error("handler says no");
  });
  controller.RegisterFailureHandler([&](const std::exception_ptr&) {
    ++later;
  });

  REQUIRE_THROWS_AS(
      controller.Operate([](Db&) { throw std::runtime_error("forced"); }),
      std::logic_error);
  REQUIRE(later == 0);
}

// ---------------------------------------------------------------------------
// QueryForRows / QueryForRow
// ---------------------------------------------------------------------------

TEST_CASE("Controller: query rows until exhausted", "[controller]") {
  Controller controller = OpenTestController("ctl_rows_all");
  controller.ExecuteManyInTransaction({"INSERT INTO t(id) VALUES (1)",
                                       "INSERT INTO t(id) VALUES (2)",
                                       "INSERT INTO t(id) VALUES (3)"});

  std::vector<int64_t> ids;
  uint32_t count = controller.QueryForRows(
      [&](Rows& rows) {
        int64_t id = 0;
        rows.Scan(id);
        ids.push_back(id);
        return IterateControl::kContinue;
      },
      "SELECT id FROM t WHERE id >= ? ORDER BY id", 2);
  REQUIRE(count == 2);
  REQUIRE(ids == std::vector<int64_t>{2, 3});
}

TEST_CASE("Controller: stop after the third row", "[controller]") {
  Controller controller = OpenTestController("ctl_rows_stop");
  controller.RunInTransaction([](Tx& tx) {
    auto stmt = tx.Prepare("INSERT INTO t(id) VALUES (?)");
    for (int32_t i = 1; i <= 10; ++i) { stmt.Exec(i); }
    return TxFinale::kCommit;
  });

  CollectIds callback(3);
  uint32_t count =
      controller.QueryForRows(callback, "SELECT id FROM t ORDER BY id");
  REQUIRE(count == 3);
  REQUIRE(callback.ids == std::vector<int64_t>{1, 2, 3});
}

TEST_CASE("Controller: query rows on an empty table", "[controller]") {
  Controller controller = OpenTestController("ctl_rows_empty");
  CollectIds callback(100);
  REQUIRE(controller.QueryForRows(callback, "SELECT id FROM t") == 0);
  REQUIRE(callback.ids.empty());
}

TEST_CASE("Controller: query rows open failure names the query",
          "[controller]") {
  Controller controller = OpenTestController("ctl_rows_fail");
  CollectIds callback(100);
  try {
    controller.QueryForRows(callback, "SELECT id FROM nowhere WHERE id = ?", 3);
    FAIL("expected DriverError");
  } catch (const DriverError& e) {
    REQUIRE(e.query() == "SELECT id FROM nowhere WHERE id = ?");
    REQUIRE(e.args() == std::vector<std::string>{"3"});
  }
  REQUIRE(callback.ids.empty());
}

TEST_CASE("Controller: rows are closed when the callback throws",
          "[controller]") {
  Controller controller = OpenTestController("ctl_rows_throw");
  controller.Execute("INSERT INTO t(id) VALUES (1)");

  REQUIRE_THROWS_AS(controller.QueryForRows(
                        [](Rows&) -> IterateControl {
                          throw std::runtime_error("callback failed");
                        },
                        "SELECT id FROM t"),
                    std::runtime_error);

  // Release only succeeds when no lease or statement is left behind.
  controller.Release();
  REQUIRE_FALSE(controller.IsInitialized());
}

TEST_CASE("Controller: query row", "[controller]") {
  Controller controller = OpenTestController("ctl_row");
  controller.Execute("INSERT INTO t(id, name) VALUES (?, ?)", 9, "nine");

  std::string name;
  controller.QueryForRow([&](Row& row) { row.Scan(name); },
                         "SELECT name FROM t WHERE id = ?", 9);
  REQUIRE(name == "nine");
}

TEST_CASE("Controller: query row leaves an empty result to the callback",
          "[controller]") {
  Controller controller = OpenTestController("ctl_row_empty");

  bool found = true;
  controller.QueryForRow([&](Row& row) { found = row.Found(); },
                         "SELECT name FROM t WHERE id = ?", 1);
  REQUIRE_FALSE(found);

  std::exception_ptr slot;
  controller.RegisterFailureHandler(CaptureFailureInto(&slot));
  controller.QueryForRow(
      [](Row& row) {
        std::string name;
        row.Scan(name);
      },
      "SELECT name FROM t WHERE id = ?", 1);
  REQUIRE(slot != nullptr);
  try {
    std::rethrow_exception(slot);
  } catch (const DriverError& e) {
    REQUIRE(e.code() == ErrorCode::kNotFound);
  }
}

// ---------------------------------------------------------------------------
// Release
// ---------------------------------------------------------------------------

TEST_CASE("Controller: every call after release is not initialized",
          "[controller]") {
  Controller controller = OpenTestController("ctl_release");
  int handled = 0;
  controller.RegisterFailureHandler(
      [&](const std::exception_ptr&) { ++handled; });

  controller.Release();
  REQUIRE_FALSE(controller.IsInitialized());

  CollectIds callback(1);
  REQUIRE_THROWS_AS(controller.Execute("SELECT 1"), NotInitializedError);
  REQUIRE_THROWS_AS(controller.QueryForRows(callback, "SELECT 1"),
                    NotInitializedError);
  REQUIRE_THROWS_AS(
      controller.RunInTransaction([](Tx&) { return TxFinale::kCommit; }),
      NotInitializedError);
  REQUIRE_THROWS_AS(controller.ExecuteManyInTransaction({"SELECT 1"}),
                    NotInitializedError);
  REQUIRE_THROWS_AS(controller.Release(), NotInitializedError);
  REQUIRE(handled == 0);
}

TEST_CASE("Controller: release failure while a lease is held",
          "[controller]") {
  LogCapture log;
  Controller controller = OpenTestController("ctl_release_busy");

  REQUIRE_THROWS_AS(controller.Operate([&](Db& db) {
                      auto conn = db.Acquire();
                      controller.Release();
                    }),
                    DriverError);
  REQUIRE(controller.IsInitialized());
  REQUIRE(log.Text().find("Release database connection error.") !=
          std::string::npos);

  controller.Release();
  REQUIRE_FALSE(controller.IsInitialized());
}

TEST_CASE("Controller: release failure goes to handlers", "[controller]") {
  FaultScope faults;
  LogCapture log;
  auto controller = OpenController<FaultBackend>(SharedMemory("ctl_release_io"));
  std::exception_ptr slot;
  controller.RegisterFailureHandler(CaptureFailureInto(&slot));

  faults->fail_close = true;
  controller.Release();
  REQUIRE(slot != nullptr);
  REQUIRE(controller.IsInitialized());
  try {
    std::rethrow_exception(slot);
  } catch (const DriverError& e) {
    REQUIRE(e.code() == ErrorCode::kIoError);
  }
}
