// Copyright (c) 2024 liudegui. MIT License.
//
// dbctl query arguments -- binding and diagnostic formatting.
//
// Supported argument types: int32_t, int64_t, double, bool, const char*,
// std::string, std::nullptr_t (SQL NULL) and Blob. Arguments bind to
// placeholders 1..N in order.

#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "dbctl/error.hpp"

namespace dbctl {

/// Binary argument. Does not own the bytes; they must outlive the call.
struct Blob {
  const uint8_t* data = nullptr;
  int32_t size = 0;

  Blob() = default;
  Blob(const uint8_t* d, int32_t n) : data(d), size(n) {}
  explicit Blob(const std::vector<uint8_t>& bytes)
      : data(bytes.data()), size(static_cast<int32_t>(bytes.size())) {}
};

namespace detail {

// --- Binding ---

template <typename Statement>
Error BindArg(Statement& stmt, int32_t idx, int32_t value) {
  return stmt.Bind(idx, value);
}

template <typename Statement>
Error BindArg(Statement& stmt, int32_t idx, int64_t value) {
  return stmt.Bind(idx, value);
}

template <typename Statement>
Error BindArg(Statement& stmt, int32_t idx, double value) {
  return stmt.Bind(idx, value);
}

template <typename Statement>
Error BindArg(Statement& stmt, int32_t idx, bool value) {
  return stmt.Bind(idx, static_cast<int32_t>(value ? 1 : 0));
}

template <typename Statement>
Error BindArg(Statement& stmt, int32_t idx, const char* value) {
  return stmt.Bind(idx, value);
}

template <typename Statement>
Error BindArg(Statement& stmt, int32_t idx, const std::string& value) {
  return stmt.Bind(idx, value.c_str());
}

template <typename Statement>
Error BindArg(Statement& stmt, int32_t idx, std::nullptr_t) {
  return stmt.BindNull(idx);
}

template <typename Statement>
Error BindArg(Statement& stmt, int32_t idx, const Blob& value) {
  return stmt.Bind(idx, value.data, value.size);
}

template <typename Statement>
Error BindAll(Statement&, int32_t) {
  return Error::Ok();
}

template <typename Statement, typename First, typename... Rest>
Error BindAll(Statement& stmt, int32_t idx, const First& first,
              const Rest&... rest) {
  Error err = BindArg(stmt, idx, first);
  if (!err.ok()) { return err; }
  return BindAll(stmt, idx + 1, rest...);
}

/// Bind every argument, after checking the count against the placeholders.
template <typename Statement, typename... Args>
Error BindArgs(Statement& stmt, const Args&... args) {
  const int32_t expected = stmt.ParamCount();
  const int32_t given = static_cast<int32_t>(sizeof...(Args));
  if (expected != given) {
    Error err;
    err.SetFormat(ErrorCode::kRange, "expected %d arguments, got %d",
                  expected, given);
    return err;
  }
  return BindAll(stmt, 1, args...);
}

// --- Formatting ---

inline std::string FormatArg(int32_t value) { return std::to_string(value); }
inline std::string FormatArg(int64_t value) { return std::to_string(value); }

inline std::string FormatArg(double value) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%g", value);
  return buf;
}

inline std::string FormatArg(bool value) { return value ? "true" : "false"; }

inline std::string FormatArg(const char* value) {
  return (value != nullptr) ? value : "NULL";
}

inline std::string FormatArg(const std::string& value) { return value; }
inline std::string FormatArg(std::nullptr_t) { return "NULL"; }

inline std::string FormatArg(const Blob& value) {
  return "<blob " + std::to_string(value.size) + " bytes>";
}

template <typename... Args>
std::vector<std::string> FormatArgs(const Args&... args) {
  return std::vector<std::string>{FormatArg(args)...};
}

}  // namespace detail
}  // namespace dbctl
