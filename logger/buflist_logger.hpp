#ifndef BUFLIST_LOGGER_HPP
#define BUFLIST_LOGGER_HPP

#include <cstring>

/**
 * buflist logger - routes zf_log output to the terminal and an optional file.
 *
 * Basic Usage:
 *   buflist::LoggerConfig config = buflist::logger_config_from_env();
 *   auto ret = buflist::start_logging(config);
 *
 *   ZF_LOGI("read %zu chunks", n);
 *
 * Environment:
 *   BUFLIST_LOG_FILE   append log lines to this file as well as stderr
 *   BUFLIST_LOG_LEVEL  verbose | debug | info | warn | error | fatal, or 1..6
 */

namespace buflist {

// === Colors for terminal ===
constexpr const char* COLOR_RED = "\x1b[31m";
constexpr const char* COLOR_YELLOW = "\x1b[33m";
constexpr const char* COLOR_WHITE = "\x1b[37m";
constexpr const char* COLOR_GREEN = "\x1b[32m";
constexpr const char* COLOR_BLUE = "\x1b[34m";
constexpr const char* COLOR_RESET = "\x1b[0m";
constexpr const char* COLOR_DARK_RED = "\x1b[31;1m";

// Log level constants (matching zf_log values)
constexpr int LOG_VERBOSE = 1;
constexpr int LOG_DEBUG   = 2;
constexpr int LOG_INFO    = 3;
constexpr int LOG_WARN    = 4;
constexpr int LOG_ERROR   = 5;
constexpr int LOG_FATAL   = 6;

enum class LoggerStatus {
    Success = 0,
    FilepathEmpty,
    AlreadyStarted,
    NotStarted,
    CouldNotOpenFile,
    FilePtrIsNull,
    FileFailedFlush,
    FileInvalidFd,
    FileNotSynced,
};

struct LoggerConfig {
    const char* log_filepath = nullptr; // console only when null
    int level = LOG_INFO;
    bool color = true;                  // ANSI colours on stderr
};

// Reads BUFLIST_LOG_FILE and BUFLIST_LOG_LEVEL on top of the defaults.
// Unknown level strings leave the default in place.
LoggerConfig logger_config_from_env() noexcept;

// Parses a level name or digit. Returns -1 when not recognised.
int parse_log_level(const char* text) noexcept;

// Functions - implemented in buflist_logger.cpp
LoggerStatus start_logging(const LoggerConfig& config = LoggerConfig{}) noexcept;
LoggerStatus reset_logfile(const char *log_filepath) noexcept;
LoggerStatus verify_logfile() noexcept;
void close_log_file() noexcept;
void set_log_level(int level) noexcept;
const char* to_str(LoggerStatus status) noexcept;

inline const char* filename(const char* file) noexcept {
    const char* slash = std::strrchr(file, '/');
    const char* backslash = std::strrchr(file, '\\');
    return slash ? slash + 1 : (backslash ? backslash + 1 : file);
}

} // namespace buflist

// Prefixes a message with the source file (and line outside release builds)
#if RELEASE_MODE
    #define BUFLIST_ADD_LOCATION(msg, ...) "%s: " msg, buflist::filename(__FILE__), ##__VA_ARGS__
#else
    #define BUFLIST_ADD_LOCATION(msg, ...) "%s @ line: %d: " msg, buflist::filename(__FILE__), __LINE__, ##__VA_ARGS__
#endif

#endif // BUFLIST_LOGGER_HPP
