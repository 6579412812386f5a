// Copyright (c) 2024 liudegui. MIT License.
//
// dbctl controller demo -- queries, transactions and failure handling.
//
// Usage:
//   ./dbctl_demo [config.yaml]
//
// Without a config file the demo uses a shared in-memory database.

#include <cstdint>
#include <cstdio>
#include <exception>
#include <string>

#include "dbctl/config.hpp"
#include "dbctl/controller.hpp"

int main(int argc, char** argv) {
  dbctl::DbConfig config;
  if (argc > 1) {
    dbctl::Error err = dbctl::LoadDbConfig(argv[1], &config);
    if (!err.ok()) {
      std::fprintf(stderr, "Config failed: %s\n", err.message);
      return 1;
    }
  } else {
    config.dsn = "file:dbctl_demo?mode=memory&cache=shared";
  }
  std::printf("%s\n", config.ToString().c_str());

  try {
    auto controller = dbctl::OpenController(config);

    // Execute
    controller.Execute(
        "CREATE TABLE IF NOT EXISTS emp(empno INTEGER PRIMARY KEY, "
        "empname TEXT)");
    controller.ExecuteManyInTransaction({
        "DELETE FROM emp",
        "INSERT INTO emp VALUES(1, 'Alice')",
        "INSERT INTO emp VALUES(2, 'Bob')",
        "INSERT INTO emp VALUES(3, 'Charlie')",
    });
    std::printf("Inserted 3 rows\n");

    // Row-by-row query
    std::printf("\n--- Query ---\n");
    uint32_t seen = controller.QueryForRows(
        [](dbctl::Rows& rows) {
          int64_t empno = 0;
          std::string empname;
          rows.Scan(empno, empname);
          std::printf("  empno=%lld  empname=%s\n",
                      static_cast<long long>(empno), empname.c_str());
          return dbctl::IterateControl::kContinue;
        },
        "SELECT empno, empname FROM emp ORDER BY empno");
    std::printf("Visited %u row(s)\n", seen);

    // Batch insert with a prepared statement inside a transaction
    std::printf("\n--- Batch insert in transaction ---\n");
    controller.RunInTransaction([](dbctl::Tx& tx) {
      auto stmt = tx.Prepare("INSERT INTO emp VALUES(?, ?)");
      for (int32_t i = 10; i < 20; ++i) {
        char name[32];
        std::snprintf(name, sizeof(name), "Employee%02d", i);
        stmt.Exec(i, name);
      }
      return dbctl::TxFinale::kCommit;
    });

    int64_t count = 0;
    controller.QueryForRow([&count](dbctl::Row& row) { row.Scan(count); },
                           "SELECT count(*) FROM emp");
    std::printf("After batch insert: %lld rows\n",
                static_cast<long long>(count));

    // Conditional transaction
    controller.RunConditionallyInTransaction(
        [](dbctl::Tx& tx) {
          int64_t bosses = 0;
          tx.QueryRow("SELECT count(*) FROM emp WHERE empname = 'Boss'")
              .Scan(bosses);
          return bosses == 0;
        },
        [](dbctl::Tx& tx) {
          dbctl::Result r =
              tx.Exec("UPDATE emp SET empname = 'Boss' WHERE empno = ?", 1);
          std::printf("Promoted %lld employee(s)\n",
                      static_cast<long long>(r.RowsAffected()));
        });

    // Failure capture
    std::printf("\n--- Failure handling ---\n");
    std::exception_ptr captured;
    controller.RegisterFailureHandler(dbctl::CaptureFailureInto(&captured));
    controller.ExecuteManyInTransaction({
        "DELETE FROM emp WHERE empno >= 10",
        "INVALID SQL",
    });
    std::printf("Captured: %s\n", dbctl::FailureMessage(captured).c_str());

    controller.QueryForRow([&count](dbctl::Row& row) { row.Scan(count); },
                           "SELECT count(*) FROM emp");
    std::printf("Rows after rolled-back delete: %lld\n",
                static_cast<long long>(count));

    controller.Release();
  } catch (const std::exception& e) {
    std::fprintf(stderr, "Failed: %s\n", e.what());
    return 1;
  }

  std::printf("\nDone.\n");
  return 0;
}
