/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Logger - Component-tagged logging with spdlog
 *
 * One application logger ("pagestash") and one access logger ("access")
 * share the console sink and, when a log file is configured, a rotating
 * file sink. Application lines are prefixed with the component tag:
 *
 *   [2026-10-19 12:00:00.123] [warn] [fetch] Cache read failed for ...
 *   [2026-10-19 12:00:00.125] [info] 10.0.0.2 "GET /articles/1" 200 512 3ms HIT
 */

#ifndef PAGESTASH_UTIL_LOGGER_HPP
#define PAGESTASH_UTIL_LOGGER_HPP

#include "config/config.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace pagestash::util {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

struct LogConfig {
    LogLevel level{LogLevel::Info};
    std::string file_path;             // Empty for console only
    std::size_t max_file_size_mb{100}; // Max size before rotation
    std::size_t max_files{5};          // Number of rotated files to keep
    bool enable_console{true};
    bool enable_colors{true};

    /**
     * An unparseable level falls back to Info; Config::validate() rejects
     * those before the logger is configured
     */
    static LogConfig from_settings(const config::LogSettings& settings);
};

/**
 * One served request, as written to the access log
 */
struct AccessLogEntry {
    std::string client_ip;
    std::string method;
    std::string path;
    int status_code{0};
    std::size_t response_size{0};
    std::chrono::milliseconds latency{0};
    std::string cache_status{"BYPASS"};  // HIT, MISS or BYPASS
};

/**
 * Process-wide logger
 *
 * instance() before init() yields a console logger at Info. The destructor is
 * public so that the owning std::unique_ptr can release it.
 */
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    ~Logger();

    /**
     * Case-insensitive: trace, debug, info, warn, error, critical, off
     */
    static std::optional<LogLevel> parse_level(std::string_view level_str);

    template<typename... Args>
    void trace(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::trace, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::debug, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::info, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::warn, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::err, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::critical, component, fmt, std::forward<Args>(args)...);
    }

    void access(const AccessLogEntry& entry);

    /**
     * Flush both loggers
     */
    void shutdown();

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void configure(const LogConfig& config);

    template<typename... Args>
    void log(spdlog::level::level_enum level, std::string_view component,
             spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (!logger_ || !logger_->should_log(level)) {
            return;
        }
        logger_->log(level, "[{}] {}", component, fmt::format(fmt, std::forward<Args>(args)...));
    }

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::logger> access_logger_;
    mutable std::mutex mutex_;

    static std::unique_ptr<Logger> instance_;
    static std::once_flag init_flag_;
};

#define PAGESTASH_LOG_TRACE(component, ...) \
    ::pagestash::util::Logger::instance().trace(component, __VA_ARGS__)
#define PAGESTASH_LOG_DEBUG(component, ...) \
    ::pagestash::util::Logger::instance().debug(component, __VA_ARGS__)
#define PAGESTASH_LOG_INFO(component, ...) \
    ::pagestash::util::Logger::instance().info(component, __VA_ARGS__)
#define PAGESTASH_LOG_WARN(component, ...) \
    ::pagestash::util::Logger::instance().warn(component, __VA_ARGS__)
#define PAGESTASH_LOG_ERROR(component, ...) \
    ::pagestash::util::Logger::instance().error(component, __VA_ARGS__)
#define PAGESTASH_LOG_CRITICAL(component, ...) \
    ::pagestash::util::Logger::instance().critical(component, __VA_ARGS__)

// Component tags
namespace log_component {
    constexpr std::string_view Server = "server";
    constexpr std::string_view Config = "config";
    constexpr std::string_view Cache = "cache";
    constexpr std::string_view Fetch = "fetch";
    constexpr std::string_view Update = "update";
    constexpr std::string_view Upstream = "upstream";
}

} // namespace pagestash::util

#endif // PAGESTASH_UTIL_LOGGER_HPP
