#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace warden::control {
struct LogConfig;
}

namespace warden::logging {

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Create (or fetch) a named logger with config-driven sink, level and rotation.
// The first logger created becomes the process default; the calling thread
// also adopts it as its current logger.
quill::Logger* init_logger(std::string_view name, const warden::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// UUID v4 generation for correlation IDs: {uuid}#{counter}
std::string generate_correlation_id();

// Plain random UUID v4 (audit event ids)
std::string generate_uuid();

// Validate correlation ID format ({uuid}#{counter})
bool is_valid_uuid(std::string_view uuid);

// Current thread's logger, falling back to the process default.
// Returns nullptr before init_logger() has been called.
quill::Logger* get_current_logger();

// Bind a logger to the calling thread (worker threads)
void set_current_logger(quill::Logger* logger);

// Null-safe wrappers: a missing logger drops the message

#define WARDEN_LOG_INFO(message, ...)                                          \
    do {                                                                   \
        if (quill::Logger* _wl = ::warden::logging::get_current_logger()) { \
            LOG_INFO(_wl, message, ##__VA_ARGS__);                             \
        }                                                                  \
    } while (0)

#define WARDEN_LOG_WARNING(message, ...)                                       \
    do {                                                                   \
        if (quill::Logger* _wl = ::warden::logging::get_current_logger()) { \
            LOG_WARNING(_wl, message, ##__VA_ARGS__);                          \
        }                                                                  \
    } while (0)

#define WARDEN_LOG_ERROR(message, ...)                                         \
    do {                                                                   \
        if (quill::Logger* _wl = ::warden::logging::get_current_logger()) { \
            LOG_ERROR(_wl, message, ##__VA_ARGS__);                            \
        }                                                                  \
    } while (0)

// Debug logging (eliminated in release builds)
#if defined(NDEBUG)
#define WARDEN_LOG_DEBUG(message, ...) ((void)0)
#else
#define WARDEN_LOG_DEBUG(message, ...)                                         \
    do {                                                                   \
        if (quill::Logger* _wl = ::warden::logging::get_current_logger()) { \
            LOG_DEBUG(_wl, message, ##__VA_ARGS__);                            \
        }                                                                  \
    } while (0)
#endif

// Authentication decision logging
#define WARDEN_LOG_AUTH(mode, principal_id, outcome, request_id)                       \
    WARDEN_LOG_INFO("Auth decision: mode={}, principal={}, outcome={}, request_id={}", \
                    mode, principal_id, outcome, request_id)

}  // namespace warden::logging
