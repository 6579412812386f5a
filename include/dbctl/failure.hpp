// Copyright (c) 2024 liudegui. MIT License.
//
// dbctl failures -- abrupt-failure types raised above the driver layer.
//
// Design:
//   - Driver primitives report Error values; the controller layer turns a
//     failed Error into one of these exceptions
//   - DbError is the common root and carries an ErrorCode
//   - Any std::exception is an "error-shaped" payload; anything else thrown
//     through a callback is an arbitrary value

#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "dbctl/error.hpp"

namespace dbctl {

// ---------------------------------------------------------------------------
// DbError
// ---------------------------------------------------------------------------

class DbError : public std::runtime_error {
 public:
  DbError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

/// Construction was given a null (or closed) connection handle.
class InitializationError : public DbError {
 public:
  explicit InitializationError(const std::string& message)
      : DbError(ErrorCode::kInitialization, message) {}
};

/// The controller has no connection handle (never initialized, or released).
class NotInitializedError : public DbError {
 public:
  NotInitializedError()
      : DbError(ErrorCode::kNotInitialized,
                "The controller is not initialized") {}
};

// ---------------------------------------------------------------------------
// DriverError
// ---------------------------------------------------------------------------

/// A failed driver primitive: the driver's Error plus, where known, the SQL
/// text and its arguments.
class DriverError : public DbError {
 public:
  DriverError(const Error& cause, const std::string& context)
      : DriverError(cause, context, std::string(), std::vector<std::string>()) {}

  DriverError(const Error& cause, const std::string& context,
              std::string query, std::vector<std::string> args)
      : DbError(CodeOf(cause), Describe(cause, context, query, args)),
        cause_(cause),
        query_(std::move(query)),
        args_(std::move(args)) {}

  const Error& cause() const { return cause_; }
  const std::string& query() const { return query_; }
  const std::vector<std::string>& args() const { return args_; }

 private:
  static ErrorCode CodeOf(const Error& cause) {
    return cause.ok() ? ErrorCode::kError : cause.code;
  }

  static std::string Describe(const Error& cause, const std::string& context,
                              const std::string& query,
                              const std::vector<std::string>& args) {
    std::string msg = context;
    msg += ": ";
    msg += cause.message[0] != '\0' ? cause.message : ErrorCodeName(cause.code);
    if (!query.empty()) {
      msg += " SQL: [";
      msg += query;
      msg += "]";
    }
    if (!args.empty()) {
      msg += " Params: [";
      for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) { msg += ", "; }
        msg += args[i];
      }
      msg += "]";
    }
    return msg;
  }

  Error cause_;
  std::string query_;
  std::vector<std::string> args_;
};

// ---------------------------------------------------------------------------
// Payload helpers
// ---------------------------------------------------------------------------

/// Human-readable text of any failure payload.
inline std::string FailureMessage(const std::exception_ptr& failure) {
  if (!failure) { return "no failure"; }
  try {
    std::rethrow_exception(failure);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "non-error failure payload";
  }
}

/// True if the payload is a std::exception.
inline bool IsErrorPayload(const std::exception_ptr& failure) {
  if (!failure) { return false; }
  try {
    std::rethrow_exception(failure);
  } catch (const std::exception&) {
    return true;
  } catch (...) {
    return false;
  }
}

// ---------------------------------------------------------------------------
// CompositeFailure
// ---------------------------------------------------------------------------

/// A transaction callback failed and the automatic rollback failed too.
class CompositeFailure : public DbError {
 public:
  CompositeFailure(std::exception_ptr original, std::exception_ptr rollback)
      : DbError(ErrorCode::kComposite,
                "Transaction has error: " + FailureMessage(original) +
                    ". Rollback has error too: " + FailureMessage(rollback)),
        original_(std::move(original)),
        rollback_(std::move(rollback)) {}

  const std::exception_ptr& Original() const { return original_; }
  const std::exception_ptr& Rollback() const { return rollback_; }

 private:
  std::exception_ptr original_;
  std::exception_ptr rollback_;
};

/// A capturing failure handler was given something that is not an error.
class NonErrorFailurePayload : public DbError {
 public:
  NonErrorFailurePayload()
      : DbError(ErrorCode::kNonErrorPayload,
                "The failure payload is not an error object") {}
};

}  // namespace dbctl
