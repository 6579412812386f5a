// Copyright (c) 2024 liudegui. MIT License.
//
// dbctl transaction manager -- Begin, run the callback, then commit or
// roll back as it decides.
//
// If the callback throws, the transaction is rolled back before the failure
// leaves RunTransaction():
//   - rollback succeeded: the original exception is rethrown unchanged
//   - rollback failed:    CompositeFailure(original, rollback) is thrown
// This scope sits inside the controller's recovery boundary and always
// fires first.

#pragma once

#include <exception>
#include <string>
#include <utility>
#include <vector>

#include "dbctl/callback.hpp"
#include "dbctl/db.hpp"
#include "dbctl/error.hpp"
#include "dbctl/failure.hpp"
#include "dbctl/log.hpp"
#include "dbctl/tx.hpp"

namespace dbctl {

template <typename Backend>
void RunTransaction(Database<Backend>& db, BasicTxCallback<Backend>& callback) {
  BasicTx<Backend> tx = BasicTx<Backend>::Begin(db);

  TxFinale finale = TxFinale::kRollback;
  try {
    finale = callback.InTx(tx);
  } catch (...) {
    std::exception_ptr original = std::current_exception();
    Error err = tx.TryRollback();
    if (err.ok()) {
      Logger()->warn("Transaction rolled back: {}", FailureMessage(original));
      throw;
    }
    CompositeFailure composite(
        original,
        std::make_exception_ptr(DriverError(err, "Rollback transaction")));
    Logger()->error("{}", composite.what());
    throw composite;
  }

  switch (finale) {
    case TxFinale::kCommit:
      tx.Commit();
      return;
    case TxFinale::kRollback:
      tx.Rollback();
      return;
  }

  Error err = tx.TryRollback();
  if (!err.ok()) {
    Logger()->error("Rollback after unknown finale failed: {}", err.message);
  }
  throw DbError(ErrorCode::kMisuse, "unknown transaction finale " +
                                        std::to_string(static_cast<int>(finale)));
}

/// Transaction callback that runs `queries` in order and commits. Any
/// failing query aborts the set through the rollback path.
template <typename Backend = Sqlite3Backend>
BasicTxCallbackFunc<Backend> BuildTxForSqls(std::vector<std::string> queries) {
  return BasicTxCallbackFunc<Backend>(
      [queries](BasicTx<Backend>& tx) {
        for (const std::string& query : queries) {
          tx.Exec(query);
        }
        return TxFinale::kCommit;
      });
}

}  // namespace dbctl
