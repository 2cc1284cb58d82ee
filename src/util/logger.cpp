/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Logger Implementation
 */

#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace pagestash::util {

std::unique_ptr<Logger> Logger::instance_;
std::once_flag Logger::init_flag_;

namespace {

constexpr const char* console_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* file_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

} // namespace

LogConfig LogConfig::from_settings(const config::LogSettings& settings) {
    LogConfig log_config;
    log_config.level = Logger::parse_level(settings.level).value_or(LogLevel::Info);
    log_config.file_path = settings.file;
    log_config.max_file_size_mb = settings.max_file_size_mb;
    log_config.max_files = settings.max_files;
    log_config.enable_console = settings.enable_console;
    log_config.enable_colors = settings.enable_colors;
    return log_config;
}

void Logger::init(const LogConfig& config) {
    bool created = false;
    std::call_once(init_flag_, [&config, &created]() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(config);
        created = true;
    });

    // Startup code may already have logged through the default console logger
    if (!created) {
        instance_->configure(config);
    }
}

Logger& Logger::instance() {
    std::call_once(init_flag_, []() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(LogConfig{});
    });
    return *instance_;
}

Logger::~Logger() {
    shutdown();
}

void Logger::configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<spdlog::sink_ptr> sinks;
    if (config.enable_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_color_mode(config.enable_colors ? spdlog::color_mode::automatic
                                                          : spdlog::color_mode::never);
        console_sink->set_pattern(console_pattern);
        sinks.push_back(std::move(console_sink));
    }
    if (!config.file_path.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path, config.max_file_size_mb * 1024 * 1024, config.max_files);
        file_sink->set_pattern(file_pattern);
        sinks.push_back(std::move(file_sink));
    }

    // Reconfiguring replaces the registered loggers of the same name
    spdlog::drop("pagestash");
    spdlog::drop("access");

    logger_ = std::make_shared<spdlog::logger>("pagestash", sinks.begin(), sinks.end());
    logger_->set_level(to_spdlog_level(config.level));
    logger_->flush_on(spdlog::level::warn);

    // Access lines are written whatever the application level is, unless off
    access_logger_ = std::make_shared<spdlog::logger>("access", sinks.begin(), sinks.end());
    access_logger_->set_level(config.level == LogLevel::Off ? spdlog::level::off
                                                            : spdlog::level::info);

    spdlog::register_logger(logger_);
    spdlog::register_logger(access_logger_);
    spdlog::set_default_logger(logger_);
}

std::optional<LogLevel> Logger::parse_level(std::string_view level_str) {
    std::string lower(level_str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

void Logger::access(const AccessLogEntry& entry) {
    if (!access_logger_) {
        return;
    }

    // 10.0.0.2 "GET /articles/1" 200 512 3ms HIT
    access_logger_->info(R"({} "{} {}" {} {} {}ms {})",
                         entry.client_ip.empty() ? "-" : entry.client_ip,
                         entry.method,
                         entry.path,
                         entry.status_code,
                         entry.response_size,
                         entry.latency.count(),
                         entry.cache_status);
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
    }
    if (access_logger_) {
        access_logger_->flush();
    }
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warn:     return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // namespace pagestash::util
