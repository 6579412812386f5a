// Copyright (c) 2024 liudegui. MIT License.
//
// dbctl logging -- the "dbctl" spdlog logger.
//
// Design:
//   - One named logger in the spdlog registry, created on first use
//   - Level from DBCTL_LOG_LEVEL (spdlog level names), default info
//   - SetLogSink() swaps in a logger writing to a caller-supplied sink

#pragma once

#include <cstdlib>
#include <memory>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace dbctl {

constexpr const char* kLoggerName = "dbctl";

namespace detail {

inline spdlog::level::level_enum ResolveLogLevel() {
  const char* level = std::getenv("DBCTL_LOG_LEVEL");
  if (level == nullptr || level[0] == '\0') { return spdlog::level::info; }
  return spdlog::level::from_str(level);
}

inline std::mutex& LoggerMutex() {
  static std::mutex mutex;
  return mutex;
}

}  // namespace detail

/// The library logger. Never null.
inline std::shared_ptr<spdlog::logger> Logger() {
  std::shared_ptr<spdlog::logger> logger = spdlog::get(kLoggerName);
  if (logger) { return logger; }

  std::lock_guard<std::mutex> lock(detail::LoggerMutex());
  logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
    logger->set_level(detail::ResolveLogLevel());
  }
  return logger;
}

/// Route library logging to `sink`, replacing the current logger.
inline void SetLogSink(spdlog::sink_ptr sink) {
  std::lock_guard<std::mutex> lock(detail::LoggerMutex());
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
  logger->set_level(detail::ResolveLogLevel());
  spdlog::drop(kLoggerName);
  spdlog::register_logger(logger);
}

}  // namespace dbctl
