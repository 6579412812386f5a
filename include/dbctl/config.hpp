// Copyright (c) 2024 liudegui. MIT License.
//
// dbctl::DbConfig -- connection settings handed to Database::Open().
//
// YAML layout:
//   db:
//     dsn: "file:app.db"
//     max_idle: 4
//     busy_timeout_ms: 2000
//
// DBCTL_DSN and DBCTL_MAX_IDLE override the file.

#pragma once

#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <string>

#include <yaml-cpp/yaml.h>

#include "dbctl/error.hpp"

namespace dbctl {

struct DbConfig {
  std::string dsn;
  /// Idle connections kept by the pool. With 0 every lease closes its
  /// connection on return; a mode=memory DSN then keeps one extra
  /// connection open so the database survives between leases.
  int32_t max_idle = 2;
  int32_t busy_timeout_ms = 0;

  std::string ToString() const {
    std::ostringstream out;
    out << "DSN: [" << dsn << "]. Max Idle: [" << max_idle << "]";
    return out.str();
  }
};

namespace detail {

inline Error ApplyConfigNode(const YAML::Node& root, DbConfig* out) {
  const YAML::Node db = root["db"];
  if (!db || !db.IsMap()) {
    return Error::Make(ErrorCode::kNotFound, "config has no 'db' map");
  }

  DbConfig config;
  if (db["dsn"]) { config.dsn = db["dsn"].as<std::string>(); }
  if (db["max_idle"]) { config.max_idle = db["max_idle"].as<int32_t>(); }
  if (db["busy_timeout_ms"]) {
    config.busy_timeout_ms = db["busy_timeout_ms"].as<int32_t>();
  }

  if (const char* dsn = std::getenv("DBCTL_DSN")) { config.dsn = dsn; }
  if (const char* max_idle = std::getenv("DBCTL_MAX_IDLE")) {
    char* end = nullptr;
    long value = std::strtol(max_idle, &end, 10);
    if (end == max_idle || *end != '\0') {
      return Error::Make(ErrorCode::kMismatch,
                         "DBCTL_MAX_IDLE is not an integer");
    }
    config.max_idle = static_cast<int32_t>(value);
  }

  if (config.dsn.empty()) {
    return Error::Make(ErrorCode::kNotFound, "db.dsn is required");
  }
  if (config.max_idle < 0) {
    return Error::Make(ErrorCode::kRange, "db.max_idle must be >= 0");
  }
  *out = config;
  return Error::Ok();
}

}  // namespace detail

/// Parse configuration from YAML text.
inline Error ParseDbConfig(const char* yaml, DbConfig* out) {
  if (yaml == nullptr || out == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "yaml or out is null");
  }
  try {
    return detail::ApplyConfigNode(YAML::Load(yaml), out);
  } catch (const YAML::Exception& e) {
    return Error::Make(ErrorCode::kMismatch, e.what());
  }
}

/// Load configuration from a YAML file.
inline Error LoadDbConfig(const char* path, DbConfig* out) {
  if (path == nullptr || out == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "path or out is null");
  }
  try {
    return detail::ApplyConfigNode(YAML::LoadFile(path), out);
  } catch (const YAML::BadFile& e) {
    return Error::Make(ErrorCode::kIoError, e.what());
  } catch (const YAML::Exception& e) {
    return Error::Make(ErrorCode::kMismatch, e.what());
  }
}

}  // namespace dbctl
