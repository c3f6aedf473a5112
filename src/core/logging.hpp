#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace conduit::control {
struct LogConfig;
}

namespace conduit::logging {

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Initialize the process logger with config-driven sink, format and level
quill::Logger* init_logger(const conduit::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// Correlation ID: {per-thread uuid}#{counter}
std::string generate_correlation_id();

// Fresh random UUID v4 (8-4-4-4-12, lower-case hex)
std::string generate_uuid();

// Process logger; falls back to a console logger before init_logger() runs
quill::Logger* get_logger();

// Logging macros for structured logging

// Request completion logging
#define LOG_REQUEST(logger, method, path, status, duration_us, client_ip, correlation_id) \
    LOG_INFO(logger,                                                                      \
             "Request completed: method={}, path={}, status={}, "                         \
             "duration_us={}, client_ip={}, correlation_id={}",                           \
             method, path, status, duration_us, client_ip, correlation_id)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, correlation_id, error_code, error_detail)        \
    LOG_ERROR(logger, "{}: correlation_id={}, error_code={}, error_detail={}", message, \
              correlation_id, error_code, error_detail)

// Backend call logging
#define LOG_BACKEND(logger, event, method, url, status, correlation_id)                  \
    LOG_INFO(logger, "Backend {}: method={}, url={}, status={}, correlation_id={}", event, \
             method, url, status, correlation_id)

}  // namespace conduit::logging
