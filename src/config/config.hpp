/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Configuration System - Supports JSON file, environment variables, and CLI args
 *
 * Configuration hierarchy (highest precedence first):
 * 1. Command-line arguments
 * 2. Environment variables (PAGESTASH_*)
 * 3. Configuration file (JSON)
 * 4. Default values
 */

#ifndef PAGESTASH_CONFIG_CONFIG_HPP
#define PAGESTASH_CONFIG_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace pagestash::config {

/**
 * Raised for invalid or inconsistent configuration
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error("Configuration error: " + what) {}
};

/**
 * Server configuration
 */
struct ServerSettings {
    std::uint16_t port{8080};
    std::size_t threads{0};  // 0 = hardware_concurrency
    std::string bind_address{"0.0.0.0"};
};

/**
 * Origin server that generates responses on a cache miss
 */
struct UpstreamSettings {
    std::string host{"localhost"};
    std::uint16_t port{8000};
    std::uint32_t timeout_seconds{30};
};

/**
 * Page cache middleware configuration
 */
struct CacheMiddlewareSettings {
    std::string alias{"default"};      // Backend selected from `caches`
    std::uint32_t seconds{600};        // Default TTL when no max-age is sent
    std::string key_prefix;
    bool anonymous_only{false};        // Never cache for authenticated identities
    bool use_etags{true};
    bool head_uses_get_entries{true};  // HEAD lookups may be served from GET entries
};

/**
 * One cache backend, selected by alias
 */
struct CacheBackendSettings {
    std::string backend{"locmem"};     // locmem | dummy
    std::size_t max_size_mb{64};
    std::uint32_t timeout_seconds{300};
    std::string key_prefix;
    int version{1};
};

/**
 * Locale and time zone awareness of cache keys
 */
struct I18nSettings {
    bool use_i18n{false};
    std::string language_code{"en-us"};
    bool use_tz{false};
    std::string time_zone{"UTC"};
};

/**
 * Authentication subsystem
 */
struct AuthSettings {
    bool enabled{false};
    std::string session_cookie{"sessionid"};
};

/**
 * Logging configuration
 */
struct LogSettings {
    std::string level{"info"};
    std::string file;
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * Complete application configuration
 */
struct Config {
    ServerSettings server;
    UpstreamSettings upstream;
    CacheMiddlewareSettings cache_middleware;
    std::map<std::string, CacheBackendSettings> caches{{"default", CacheBackendSettings{}}};
    I18nSettings i18n;
    AuthSettings auth;
    LogSettings logging;

    /**
     * Validate configuration and throw ConfigError if invalid
     */
    void validate() const;
};

/**
 * Configuration manager - handles loading and parsing
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Parse command-line arguments and load configuration
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return true if configuration loaded successfully, false if --help was requested
     * @throws ConfigError on configuration errors
     */
    bool load(int argc, char* argv[]);

    /**
     * Get the current configuration (thread-safe)
     */
    Config get_config() const;

    std::filesystem::path get_config_path() const;

    static void print_help(const char* program_name);

private:
    void load_from_file(const std::filesystem::path& path);
    void apply_environment_overrides();
    void apply_cli_overrides(int argc, char* argv[]);

    static std::optional<std::string> get_env(const std::string& name);

    mutable std::mutex config_mutex_;
    Config config_;
    std::filesystem::path config_path_;
};

/**
 * Parse a boolean flag value (true/1/yes, false/0/no)
 */
std::optional<bool> parse_bool(const std::string& value);

// JSON serialization support
void to_json(nlohmann::json& j, const ServerSettings& s);
void from_json(const nlohmann::json& j, ServerSettings& s);
void to_json(nlohmann::json& j, const UpstreamSettings& u);
void from_json(const nlohmann::json& j, UpstreamSettings& u);
void to_json(nlohmann::json& j, const CacheMiddlewareSettings& c);
void from_json(const nlohmann::json& j, CacheMiddlewareSettings& c);
void to_json(nlohmann::json& j, const CacheBackendSettings& c);
void from_json(const nlohmann::json& j, CacheBackendSettings& c);
void to_json(nlohmann::json& j, const I18nSettings& i);
void from_json(const nlohmann::json& j, I18nSettings& i);
void to_json(nlohmann::json& j, const AuthSettings& a);
void from_json(const nlohmann::json& j, AuthSettings& a);
void to_json(nlohmann::json& j, const LogSettings& l);
void from_json(const nlohmann::json& j, LogSettings& l);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace pagestash::config

#endif // PAGESTASH_CONFIG_CONFIG_HPP
