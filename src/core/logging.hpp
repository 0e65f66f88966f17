#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace wren::control {
struct LogConfig;
}

namespace wren::logging {

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Initialize a worker logger with config-driven settings and install it
// as the calling thread's logger
quill::Logger* init_worker_logger(int worker_id, const wren::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// UUID v4 based correlation IDs: {uuid}#{counter}
std::string generate_correlation_id();

// Validate correlation ID format
bool is_valid_uuid(std::string_view uuid);

// Get current thread's logger (returns nullptr if not initialized)
quill::Logger* get_current_logger();

// Install logger for the calling thread (connection and push worker threads
// adopt the logger of the thread that spawned them)
void set_current_logger(quill::Logger* logger);

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

// Push stream lifecycle logging
#define LOG_STREAM(logger, event, path, events_sent, heartbeats_sent)                  \
    LOG_INFO(logger, "Push stream {}: path={}, events_sent={}, heartbeats_sent={}", event, \
             path, events_sent, heartbeats_sent)

}  // namespace wren::logging
