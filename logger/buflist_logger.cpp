#include "buflist_logger.hpp"
#include "zf_log.h"

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <cstring>
#include <mutex>
#include <atomic>
#include <strings.h> // for strcasecmp
#include <fcntl.h>
#include <unistd.h>

static FILE* _log_file = nullptr;
static bool _logger_started = false;
static std::mutex log_mutex;
static std::atomic<bool> _use_color{true};
static std::atomic<bool> _shutting_down{false};

static void _unguarded_close_log_file() noexcept {
    if (_log_file) {
        fclose(_log_file);
    }
    _log_file = nullptr;
}

static void _thread_safe_close_log_file() noexcept {
    _shutting_down = true;
    std::lock_guard<std::mutex> lock(log_mutex);
    _unguarded_close_log_file();
}

static void zf_output_callback(const zf_log_message *msg, void *arg) {
    (void)arg;

    if (_shutting_down.load(std::memory_order_relaxed)) {
        return;
    }

    thread_local char time_str[64];
    thread_local struct tm tm_buf;

    time_t t = time(nullptr);
    struct tm *tm = localtime_r(&t, &tm_buf);
    if (tm == nullptr) {
        time_str[0] = '\0';
    } else {
        strftime(time_str, sizeof(time_str), "%Y-%m-%d %H:%M:%S", tm);
    }

    const char *color, *lvl_char;
    switch (msg->lvl) {
        case ZF_LOG_VERBOSE: color = buflist::COLOR_GREEN; lvl_char = "v"; break;
        case ZF_LOG_DEBUG: color = buflist::COLOR_BLUE; lvl_char = "d"; break;
        case ZF_LOG_INFO: color = buflist::COLOR_WHITE; lvl_char = "I"; break;
        case ZF_LOG_WARN: color = buflist::COLOR_YELLOW; lvl_char = "W"; break;
        case ZF_LOG_ERROR: color = buflist::COLOR_RED; lvl_char = "E"; break;
        case ZF_LOG_FATAL: color = buflist::COLOR_DARK_RED; lvl_char = "F"; break;
        default: color = buflist::COLOR_WHITE; lvl_char = "N"; break;
    }

    const int len = static_cast<int>(msg->p - msg->msg_b);
    if (_use_color.load(std::memory_order_relaxed)) {
        fprintf(stderr, "%s[%s] [%s] %.*s%s\n", color, time_str, lvl_char, len, msg->msg_b, buflist::COLOR_RESET);
    } else {
        fprintf(stderr, "[%s] [%s] %.*s\n", time_str, lvl_char, len, msg->msg_b);
    }
    fflush(stderr);

    std::lock_guard<std::mutex> lock(log_mutex);
    if (_log_file) {
        fprintf(_log_file, "[%s] [%s] %.*s\n", time_str, lvl_char, len, msg->msg_b);
        fflush(_log_file);
    }
}

namespace buflist {

int parse_log_level(const char* text) noexcept {
    if (text == nullptr || *text == '\0') return -1;

    if (text[1] == '\0' && text[0] >= '1' && text[0] <= '6') {
        return text[0] - '0';
    }

    static const struct { const char* name; int level; } names[] = {
        {"verbose", LOG_VERBOSE},
        {"debug", LOG_DEBUG},
        {"info", LOG_INFO},
        {"warn", LOG_WARN},
        {"warning", LOG_WARN},
        {"error", LOG_ERROR},
        {"fatal", LOG_FATAL},
    };
    for (const auto& entry : names) {
        if (strcasecmp(text, entry.name) == 0) return entry.level;
    }
    return -1;
}

LoggerConfig logger_config_from_env() noexcept {
    LoggerConfig config;

    const char* path = std::getenv("BUFLIST_LOG_FILE");
    if (path && *path) {
        config.log_filepath = path;
    }

    int level = parse_log_level(std::getenv("BUFLIST_LOG_LEVEL"));
    if (level > 0) {
        config.level = level;
    }

    // https://no-color.org
    const char* no_color = std::getenv("NO_COLOR");
    if (no_color && *no_color) {
        config.color = false;
    }
    return config;
}

LoggerStatus reset_logfile(const char *log_filepath) noexcept {
    if (!log_filepath) return LoggerStatus::FilepathEmpty;

    std::lock_guard<std::mutex> lock(log_mutex);
    if (!_logger_started) return LoggerStatus::NotStarted;
    _unguarded_close_log_file();

    _log_file = fopen(log_filepath, "a");
    if (!_log_file) {
        return LoggerStatus::CouldNotOpenFile;
    }
    return LoggerStatus::Success;
}

LoggerStatus verify_logfile() noexcept {
    std::lock_guard<std::mutex> lock(log_mutex);

    if (!_log_file) {
        return LoggerStatus::FilePtrIsNull;
    }

    if (fflush(_log_file) != 0) {
        _unguarded_close_log_file();
        return LoggerStatus::FileFailedFlush;
    }

    int fd = fileno(_log_file);
    if (fd < 0 || fcntl(fd, F_GETFL) == -1) {
        _unguarded_close_log_file();
        return LoggerStatus::FileInvalidFd;
    }

    if (fsync(fd) != 0) {
        _unguarded_close_log_file();
        return LoggerStatus::FileNotSynced;
    }

    return LoggerStatus::Success;
}

LoggerStatus start_logging(const LoggerConfig& config) noexcept {
    {
        std::lock_guard<std::mutex> lock(log_mutex);
        if (_logger_started) {
            return LoggerStatus::AlreadyStarted;
        }

        _use_color = config.color;
        zf_log_set_output_v(ZF_LOG_PUT_STD, nullptr, zf_output_callback);
        zf_log_set_output_level(config.level);
        _logger_started = true;
        atexit(_thread_safe_close_log_file);
    }

    if (config.log_filepath) {
        return reset_logfile(config.log_filepath);
    }
    return LoggerStatus::Success;
}

void close_log_file() noexcept {
    std::lock_guard<std::mutex> lock(log_mutex);
    _unguarded_close_log_file();
}

void set_log_level(int level) noexcept {
    // zf_log uses the same level values we defined
    zf_log_set_output_level(level);
}

const char* to_str(LoggerStatus status) noexcept {
    switch (status) {
        case LoggerStatus::Success: return "Success";
        case LoggerStatus::FilepathEmpty: return "Log file path is empty";
        case LoggerStatus::AlreadyStarted: return "Logger already started";
        case LoggerStatus::NotStarted: return "Logger not started";
        case LoggerStatus::CouldNotOpenFile: return "Could not open log file";
        case LoggerStatus::FilePtrIsNull: return "No log file open";
        case LoggerStatus::FileFailedFlush: return "Log file flush failed";
        case LoggerStatus::FileInvalidFd: return "Log file descriptor is invalid";
        case LoggerStatus::FileNotSynced: return "Log file sync failed";
        default: return "Unknown logger status";
    }
}

} // namespace buflist
