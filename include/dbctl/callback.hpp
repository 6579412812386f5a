// Copyright (c) 2024 liudegui. MIT License.
//
// dbctl callback contracts -- the capabilities a controller operation calls
// back into.
//
// Each contract is an abstract class template over the backend, plus a
// ...Func adapter that lets a lambda stand in for it. Callbacks signal
// failure by throwing; the controller's recovery boundary takes it from
// there.

#pragma once

#include <cstdint>
#include <functional>
#include <type_traits>
#include <utility>

#include "dbctl/db.hpp"
#include "dbctl/rows.hpp"
#include "dbctl/sqlite3_backend.hpp"
#include "dbctl/tx.hpp"

namespace dbctl {

/// How a transaction callback wants its transaction finished.
enum class TxFinale : uint8_t {
  kCommit   = 1,
  kRollback = 2,
};

/// Whether row iteration should go on after the current row.
enum class IterateControl : uint8_t {
  kStop     = 0,
  kContinue = 1,
};

// ---------------------------------------------------------------------------
// ConnectionCallback
// ---------------------------------------------------------------------------

template <typename Backend = Sqlite3Backend>
class BasicConnectionCallback {
 public:
  virtual ~BasicConnectionCallback() = default;
  virtual void OnDb(Database<Backend>& db) = 0;
};

template <typename Backend = Sqlite3Backend>
class BasicConnectionCallbackFunc : public BasicConnectionCallback<Backend> {
 public:
  using Fn = std::function<void(Database<Backend>&)>;
  explicit BasicConnectionCallbackFunc(Fn fn) : fn_(std::move(fn)) {}
  void OnDb(Database<Backend>& db) override { fn_(db); }

 private:
  Fn fn_;
};

// ---------------------------------------------------------------------------
// RowsCallback -- called once per row of a row-set
// ---------------------------------------------------------------------------

template <typename Backend = Sqlite3Backend>
class BasicRowsCallback {
 public:
  virtual ~BasicRowsCallback() = default;
  virtual IterateControl NextRow(BasicRows<Backend>& rows) = 0;
};

template <typename Backend = Sqlite3Backend>
class BasicRowsCallbackFunc : public BasicRowsCallback<Backend> {
 public:
  using Fn = std::function<IterateControl(BasicRows<Backend>&)>;
  explicit BasicRowsCallbackFunc(Fn fn) : fn_(std::move(fn)) {}
  IterateControl NextRow(BasicRows<Backend>& rows) override {
    return fn_(rows);
  }

 private:
  Fn fn_;
};

// ---------------------------------------------------------------------------
// RowCallback -- called once with a single-row result
// ---------------------------------------------------------------------------

template <typename Backend = Sqlite3Backend>
class BasicRowCallback {
 public:
  virtual ~BasicRowCallback() = default;
  virtual void ResultRow(BasicRow<Backend>& row) = 0;
};

template <typename Backend = Sqlite3Backend>
class BasicRowCallbackFunc : public BasicRowCallback<Backend> {
 public:
  using Fn = std::function<void(BasicRow<Backend>&)>;
  explicit BasicRowCallbackFunc(Fn fn) : fn_(std::move(fn)) {}
  void ResultRow(BasicRow<Backend>& row) override { fn_(row); }

 private:
  Fn fn_;
};

// ---------------------------------------------------------------------------
// TxCallback -- body of a transaction
// ---------------------------------------------------------------------------

template <typename Backend = Sqlite3Backend>
class BasicTxCallback {
 public:
  virtual ~BasicTxCallback() = default;
  virtual TxFinale InTx(BasicTx<Backend>& tx) = 0;
};

template <typename Backend = Sqlite3Backend>
class BasicTxCallbackFunc : public BasicTxCallback<Backend> {
 public:
  using Fn = std::function<TxFinale(BasicTx<Backend>&)>;
  explicit BasicTxCallbackFunc(Fn fn) : fn_(std::move(fn)) {}
  TxFinale InTx(BasicTx<Backend>& tx) override { return fn_(tx); }

 private:
  Fn fn_;
};

// ---------------------------------------------------------------------------
// ConditionalTxCallback -- IfTrue() runs only when BootCallback() says so
// ---------------------------------------------------------------------------

template <typename Backend = Sqlite3Backend>
class BasicConditionalTxCallback {
 public:
  virtual ~BasicConditionalTxCallback() = default;
  virtual bool BootCallback(BasicTx<Backend>& tx) = 0;
  virtual void IfTrue(BasicTx<Backend>& tx) = 0;
};

template <typename Backend = Sqlite3Backend>
class BasicConditionalTxCallbackFunc
    : public BasicConditionalTxCallback<Backend> {
 public:
  using BootFn = std::function<bool(BasicTx<Backend>&)>;
  using ThenFn = std::function<void(BasicTx<Backend>&)>;

  BasicConditionalTxCallbackFunc(BootFn boot, ThenFn then)
      : boot_(std::move(boot)), then_(std::move(then)) {}

  bool BootCallback(BasicTx<Backend>& tx) override { return boot_(tx); }
  void IfTrue(BasicTx<Backend>& tx) override { then_(tx); }

 private:
  BootFn boot_;
  ThenFn then_;
};

namespace detail {

/// Return type R only for arguments that are not already `Interface`
/// implementations, so the callable overloads never shadow the interface
/// ones.
template <typename F, typename Interface, typename R>
using EnableIfCallable = typename std::enable_if<
    !std::is_base_of<Interface, typename std::decay<F>::type>::value,
    R>::type;

}  // namespace detail

// ---------------------------------------------------------------------------
// Default type aliases
// ---------------------------------------------------------------------------

using ConnectionCallback        = BasicConnectionCallback<Sqlite3Backend>;
using ConnectionCallbackFunc    = BasicConnectionCallbackFunc<Sqlite3Backend>;
using RowsCallback              = BasicRowsCallback<Sqlite3Backend>;
using RowsCallbackFunc          = BasicRowsCallbackFunc<Sqlite3Backend>;
using RowCallback               = BasicRowCallback<Sqlite3Backend>;
using RowCallbackFunc           = BasicRowCallbackFunc<Sqlite3Backend>;
using TxCallback                = BasicTxCallback<Sqlite3Backend>;
using TxCallbackFunc            = BasicTxCallbackFunc<Sqlite3Backend>;
using ConditionalTxCallback     = BasicConditionalTxCallback<Sqlite3Backend>;
using ConditionalTxCallbackFunc =
    BasicConditionalTxCallbackFunc<Sqlite3Backend>;

}  // namespace dbctl
