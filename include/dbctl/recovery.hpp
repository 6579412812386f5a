// Copyright (c) 2024 liudegui. MIT License.
//
// dbctl::RecoveryBoundary -- interception point for abrupt failures.
//
// Guard(body) runs body. If it throws:
//   - no handlers registered: the same exception is rethrown unchanged
//   - otherwise each handler is called, in registration order, with the
//     payload; the failure counts as handled once all of them return
//   - a handler that throws stops the dispatch, and its exception leaves
//     Guard() uncaught
//
// Handlers are registered without locking. Register them before the
// boundary is used from more than one thread.

#pragma once

#include <exception>
#include <functional>
#include <utility>
#include <vector>

#include "dbctl/failure.hpp"

namespace dbctl {

using FailureHandler = std::function<void(const std::exception_ptr& failure)>;

class RecoveryBoundary {
 public:
  void Register(FailureHandler handler) {
    handlers_.push_back(std::move(handler));
  }

  size_t HandlerCount() const { return handlers_.size(); }

  template <typename Body>
  void Guard(Body&& body) const {
    std::exception_ptr failure;
    try {
      body();
      return;
    } catch (...) {
      failure = std::current_exception();
    }
    Dispatch(failure);
  }

  void Dispatch(const std::exception_ptr& failure) const {
    if (handlers_.empty()) { std::rethrow_exception(failure); }
    for (const FailureHandler& handler : handlers_) {
      handler(failure);
    }
  }

 private:
  std::vector<FailureHandler> handlers_;
};

/// Build a handler that stores error-shaped payloads into `*slot` and
/// throws NonErrorFailurePayload for anything else.
inline FailureHandler CaptureFailureInto(std::exception_ptr* slot) {
  return [slot](const std::exception_ptr& failure) {
    if (!IsErrorPayload(failure)) { throw NonErrorFailurePayload(); }
    *slot = failure;
  };
}

}  // namespace dbctl
