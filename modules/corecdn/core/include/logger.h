#ifndef LITECDN_LOGGER_H
#define LITECDN_LOGGER_H

#include <string>
#include <functional>

// Log level enumeration for conditional logging
enum class LogLevel {
    DEBUG = 0,     // Every message (most verbose)
    INFO = 1,      // Important events
    WARNING = 2,   // Problems only
    ERROR = 3,     // Errors only
    NONE = 4,      // Disable all logging
};

// Tag prepended to every line, e.g. "[broker-7447]". Defaults to the process role.
void setSessionId(const std::string& session_id);

// Unconditional log line (used for startup banners and by the LOG_* macros).
void nativeLog(const std::string& message);

// Level-tagged log line. The LOG_* macros route here.
void log_message(LogLevel level, const std::string& message);

// Redirect log output (tests capture it; nullptr restores stderr).
void setLogCallback(std::function<void(const std::string&)> callback);

// Global log level. Default: INFO
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Parses "debug|info|warn|warning|error|none". Returns false on anything else.
bool parse_log_level(const std::string& value, LogLevel& out);
const char* log_level_to_string(LogLevel level);

// Async logging: lines are queued and written by a background thread.
// disable_async_logging() flushes whatever is still queued.
void enable_async_logging();
void disable_async_logging();
bool is_async_logging_enabled();

#define LOG_DEBUG(msg) if (get_log_level() <= LogLevel::DEBUG) log_message(LogLevel::DEBUG, msg)
#define LOG_INFO(msg)  if (get_log_level() <= LogLevel::INFO) log_message(LogLevel::INFO, msg)
#define LOG_WARN(msg)  if (get_log_level() <= LogLevel::WARNING) log_message(LogLevel::WARNING, msg)
#define LOG_ERROR(msg) if (get_log_level() <= LogLevel::ERROR) log_message(LogLevel::ERROR, msg)

#endif // LITECDN_LOGGER_H
