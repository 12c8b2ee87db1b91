#pragma once

// Silent Vault logging
// Wraps Quill v11.x async structured logging.
//
// Usage:
//   #include "vault/core/Log.hh"
//   VAULT_LOG_INFO("Session started with {} keys", totalKeys);
//   VAULT_LOG_SESSION("Running -> Won after {:.1f}s", elapsed);

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>

namespace vault::log {

/// Initialize the logging subsystem (console + logs/ file sinks).
/// Call once at startup before any logging.
void init();

/// Initialize with an extra caller-provided file sink.
void init(const char* log_file_path);

/// Flush pending messages and stop the backend thread.
void shutdown();

/// Root logger. Valid after init().
quill::Logger* logger();

/// Session channel: start/win/loss transitions, written to logs/session.log.
quill::Logger* sessionLogger();

/// Set runtime log level (within compile-time ceiling).
void setLevel(quill::LogLevel level);

} // namespace vault::log

// Macros over the root logger.
// Compile-time filtering: in Release builds, DEBUG and TRACE are absent.
#define VAULT_LOG_TRACE(fmt, ...) QUILL_LOG_TRACE_L1(vault::log::logger(), fmt, ##__VA_ARGS__)
#define VAULT_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(vault::log::logger(), fmt, ##__VA_ARGS__)
#define VAULT_LOG_INFO(fmt, ...) QUILL_LOG_INFO(vault::log::logger(), fmt, ##__VA_ARGS__)
#define VAULT_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(vault::log::logger(), fmt, ##__VA_ARGS__)
#define VAULT_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(vault::log::logger(), fmt, ##__VA_ARGS__)
#define VAULT_LOG_CRITICAL(fmt, ...) QUILL_LOG_CRITICAL(vault::log::logger(), fmt, ##__VA_ARGS__)

#define VAULT_LOG_SESSION(fmt, ...) QUILL_LOG_INFO(vault::log::sessionLogger(), fmt, ##__VA_ARGS__)
