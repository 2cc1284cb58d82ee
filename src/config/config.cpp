/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Configuration System Implementation
 */

#include "config/config.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace pagestash::config {

// JSON serialization implementations
void to_json(nlohmann::json& j, const ServerSettings& s) {
    j = nlohmann::json{
        {"port", s.port},
        {"threads", s.threads},
        {"bind_address", s.bind_address}
    };
}

void from_json(const nlohmann::json& j, ServerSettings& s) {
    if (j.contains("port")) j.at("port").get_to(s.port);
    if (j.contains("threads")) j.at("threads").get_to(s.threads);
    if (j.contains("bind_address")) j.at("bind_address").get_to(s.bind_address);
}

void to_json(nlohmann::json& j, const UpstreamSettings& u) {
    j = nlohmann::json{
        {"host", u.host},
        {"port", u.port},
        {"timeout_seconds", u.timeout_seconds}
    };
}

void from_json(const nlohmann::json& j, UpstreamSettings& u) {
    if (j.contains("host")) j.at("host").get_to(u.host);
    if (j.contains("port")) j.at("port").get_to(u.port);
    if (j.contains("timeout_seconds")) j.at("timeout_seconds").get_to(u.timeout_seconds);
}

void to_json(nlohmann::json& j, const CacheMiddlewareSettings& c) {
    j = nlohmann::json{
        {"alias", c.alias},
        {"seconds", c.seconds},
        {"key_prefix", c.key_prefix},
        {"anonymous_only", c.anonymous_only},
        {"use_etags", c.use_etags},
        {"head_uses_get_entries", c.head_uses_get_entries}
    };
}

void from_json(const nlohmann::json& j, CacheMiddlewareSettings& c) {
    if (j.contains("alias")) j.at("alias").get_to(c.alias);
    if (j.contains("seconds")) j.at("seconds").get_to(c.seconds);
    if (j.contains("key_prefix")) j.at("key_prefix").get_to(c.key_prefix);
    if (j.contains("anonymous_only")) j.at("anonymous_only").get_to(c.anonymous_only);
    if (j.contains("use_etags")) j.at("use_etags").get_to(c.use_etags);
    if (j.contains("head_uses_get_entries")) j.at("head_uses_get_entries").get_to(c.head_uses_get_entries);
}

void to_json(nlohmann::json& j, const CacheBackendSettings& c) {
    j = nlohmann::json{
        {"backend", c.backend},
        {"max_size_mb", c.max_size_mb},
        {"timeout_seconds", c.timeout_seconds},
        {"key_prefix", c.key_prefix},
        {"version", c.version}
    };
}

void from_json(const nlohmann::json& j, CacheBackendSettings& c) {
    if (j.contains("backend")) j.at("backend").get_to(c.backend);
    if (j.contains("max_size_mb")) j.at("max_size_mb").get_to(c.max_size_mb);
    if (j.contains("timeout_seconds")) j.at("timeout_seconds").get_to(c.timeout_seconds);
    if (j.contains("key_prefix")) j.at("key_prefix").get_to(c.key_prefix);
    if (j.contains("version")) j.at("version").get_to(c.version);
}

void to_json(nlohmann::json& j, const I18nSettings& i) {
    j = nlohmann::json{
        {"use_i18n", i.use_i18n},
        {"language_code", i.language_code},
        {"use_tz", i.use_tz},
        {"time_zone", i.time_zone}
    };
}

void from_json(const nlohmann::json& j, I18nSettings& i) {
    if (j.contains("use_i18n")) j.at("use_i18n").get_to(i.use_i18n);
    if (j.contains("language_code")) j.at("language_code").get_to(i.language_code);
    if (j.contains("use_tz")) j.at("use_tz").get_to(i.use_tz);
    if (j.contains("time_zone")) j.at("time_zone").get_to(i.time_zone);
}

void to_json(nlohmann::json& j, const AuthSettings& a) {
    j = nlohmann::json{
        {"enabled", a.enabled},
        {"session_cookie", a.session_cookie}
    };
}

void from_json(const nlohmann::json& j, AuthSettings& a) {
    if (j.contains("enabled")) j.at("enabled").get_to(a.enabled);
    if (j.contains("session_cookie")) j.at("session_cookie").get_to(a.session_cookie);
}

void to_json(nlohmann::json& j, const LogSettings& l) {
    j = nlohmann::json{
        {"level", l.level},
        {"file", l.file},
        {"max_file_size_mb", l.max_file_size_mb},
        {"max_files", l.max_files},
        {"enable_console", l.enable_console},
        {"enable_colors", l.enable_colors}
    };
}

void from_json(const nlohmann::json& j, LogSettings& l) {
    if (j.contains("level")) j.at("level").get_to(l.level);
    if (j.contains("file")) j.at("file").get_to(l.file);
    if (j.contains("max_file_size_mb")) j.at("max_file_size_mb").get_to(l.max_file_size_mb);
    if (j.contains("max_files")) j.at("max_files").get_to(l.max_files);
    if (j.contains("enable_console")) j.at("enable_console").get_to(l.enable_console);
    if (j.contains("enable_colors")) j.at("enable_colors").get_to(l.enable_colors);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"server", c.server},
        {"upstream", c.upstream},
        {"cache_middleware", c.cache_middleware},
        {"caches", c.caches},
        {"i18n", c.i18n},
        {"auth", c.auth},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("server")) j.at("server").get_to(c.server);
    if (j.contains("upstream")) j.at("upstream").get_to(c.upstream);
    if (j.contains("cache_middleware")) j.at("cache_middleware").get_to(c.cache_middleware);
    if (j.contains("caches")) j.at("caches").get_to(c.caches);
    if (j.contains("i18n")) j.at("i18n").get_to(c.i18n);
    if (j.contains("auth")) j.at("auth").get_to(c.auth);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

std::optional<bool> parse_bool(const std::string& value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "true" || lower == "1" || lower == "yes") return true;
    if (lower == "false" || lower == "0" || lower == "no") return false;
    return std::nullopt;
}

void Config::validate() const {
    if (server.port == 0) {
        throw ConfigError("server.port must be non-zero");
    }
    if (server.bind_address.empty()) {
        throw ConfigError("server.bind_address cannot be empty");
    }

    if (upstream.host.empty()) {
        throw ConfigError("upstream.host cannot be empty");
    }
    if (upstream.port == 0) {
        throw ConfigError("upstream.port must be non-zero");
    }

    for (const auto& [alias, backend] : caches) {
        if (backend.backend != "locmem" && backend.backend != "dummy") {
            throw ConfigError("caches." + alias + ".backend must be 'locmem' or 'dummy', got '" +
                              backend.backend + "'");
        }
        if (backend.backend == "locmem" && backend.max_size_mb == 0) {
            throw ConfigError("caches." + alias + ".max_size_mb must be non-zero");
        }
    }

    if (caches.find(cache_middleware.alias) == caches.end()) {
        throw ConfigError("cache_middleware.alias '" + cache_middleware.alias +
                          "' does not name a configured cache");
    }

    if (cache_middleware.anonymous_only && !auth.enabled) {
        throw ConfigError("cache_middleware.anonymous_only requires the authentication "
                          "subsystem (auth.enabled)");
    }

    if (!util::Logger::parse_level(logging.level)) {
        throw ConfigError("logging.level '" + logging.level + "' is not a valid level");
    }

    spdlog::debug("Configuration validated successfully");
}

ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

bool ConfigManager::load(int argc, char* argv[]) {
    std::lock_guard<std::mutex> lock(config_mutex_);

    config_ = Config{};

    // First pass: look for --help or --config
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            print_help(argv[0]);
            return false;
        }

        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path_ = argv[++i];
        } else if (arg.starts_with("--config=")) {
            config_path_ = arg.substr(9);
        }
    }

    if (!config_path_.empty()) {
        load_from_file(config_path_);
    }

    apply_environment_overrides();

    // CLI overrides have the highest precedence
    apply_cli_overrides(argc, argv);

    config_.validate();

    spdlog::info("Configuration loaded successfully");
    return true;
}

Config ConfigManager::get_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

std::filesystem::path ConfigManager::get_config_path() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_path_;
}

void ConfigManager::print_help(const char* program_name) {
    std::cout << "PAGESTASH - Two-Phase HTTP Page Cache\n"
              << "\n"
              << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help              Show this help message and exit\n"
              << "  -c, --config FILE       Path to JSON configuration file\n"
              << "  -p, --port PORT         Server HTTP port (default: 8080)\n"
              << "  -t, --threads NUM       Number of I/O threads (default: CPU cores)\n"
              << "  -b, --bind ADDRESS      Bind address (default: 0.0.0.0)\n"
              << "  --upstream HOST:PORT    Origin server for cache misses\n"
              << "  --cache-seconds SECS    Default page TTL (default: 600)\n"
              << "  --key-prefix PREFIX     Cache key prefix\n"
              << "\n"
              << "Environment Variables:\n"
              << "  PAGESTASH_CONFIG          Path to configuration file\n"
              << "  PAGESTASH_PORT            Server HTTP port\n"
              << "  PAGESTASH_THREADS         Number of I/O threads\n"
              << "  PAGESTASH_BIND            Bind address\n"
              << "  PAGESTASH_UPSTREAM        Origin server (host:port)\n"
              << "  PAGESTASH_CACHE_ALIAS     Cache backend alias\n"
              << "  PAGESTASH_CACHE_SECONDS   Default page TTL in seconds\n"
              << "  PAGESTASH_KEY_PREFIX      Cache key prefix\n"
              << "  PAGESTASH_ANONYMOUS_ONLY  Only cache anonymous requests (true/false)\n"
              << "  PAGESTASH_USE_I18N        Partition keys by language (true/false)\n"
              << "  PAGESTASH_USE_TZ          Partition keys by time zone (true/false)\n"
              << "  PAGESTASH_AUTH_ENABLED    Enable the authentication subsystem (true/false)\n"
              << "  PAGESTASH_LOG_LEVEL       Log level (trace/debug/info/warn/error/critical/off)\n"
              << "  PAGESTASH_LOG_FILE        Log file path (stdout if not set)\n"
              << "\n"
              << "Configuration Precedence (highest to lowest):\n"
              << "  1. Command-line arguments\n"
              << "  2. Environment variables\n"
              << "  3. Configuration file\n"
              << "  4. Default values\n"
              << "\n"
              << "Configuration File Format (JSON):\n"
              << "  {\n"
              << "    \"server\": {\"port\": 8080, \"threads\": 4},\n"
              << "    \"upstream\": {\"host\": \"localhost\", \"port\": 8000},\n"
              << "    \"cache_middleware\": {\n"
              << "      \"alias\": \"default\",\n"
              << "      \"seconds\": 600,\n"
              << "      \"key_prefix\": \"\",\n"
              << "      \"anonymous_only\": false\n"
              << "    },\n"
              << "    \"caches\": {\n"
              << "      \"default\": {\"backend\": \"locmem\", \"max_size_mb\": 64, \"timeout_seconds\": 300}\n"
              << "    },\n"
              << "    \"i18n\": {\"use_i18n\": false, \"language_code\": \"en-us\", \"use_tz\": false, \"time_zone\": \"UTC\"},\n"
              << "    \"auth\": {\"enabled\": false, \"session_cookie\": \"sessionid\"},\n"
              << "    \"logging\": {\"level\": \"info\", \"file\": \"\"}\n"
              << "  }\n";
}

void ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw ConfigError("configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open configuration file: " + path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config_ = j.get<Config>();
        spdlog::debug("Loaded configuration from {}", path.string());
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("invalid JSON in configuration file: " + std::string(e.what()));
    }
}

namespace {

std::uint32_t parse_uint(const std::string& name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        auto parsed = std::stoul(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::logic_error&) {
        throw ConfigError("invalid " + name + " value: " + value);
    }
}

bool parse_flag(const std::string& name, const std::string& value) {
    auto parsed = parse_bool(value);
    if (!parsed) {
        throw ConfigError("invalid " + name + " value: " + value);
    }
    return *parsed;
}

void parse_upstream(const std::string& value, UpstreamSettings& upstream) {
    auto colon_pos = value.rfind(':');
    if (colon_pos == std::string::npos) {
        throw ConfigError("invalid upstream format (expected host:port): " + value);
    }
    upstream.host = value.substr(0, colon_pos);
    upstream.port = static_cast<std::uint16_t>(parse_uint("upstream port", value.substr(colon_pos + 1)));
}

} // namespace

void ConfigManager::apply_environment_overrides() {
    if (config_path_.empty()) {
        if (auto env = get_env("PAGESTASH_CONFIG")) {
            config_path_ = *env;
            if (!config_path_.empty()) {
                load_from_file(config_path_);
            }
        }
    }

    if (auto env = get_env("PAGESTASH_PORT")) {
        config_.server.port = static_cast<std::uint16_t>(parse_uint("PAGESTASH_PORT", *env));
        spdlog::debug("Applied PAGESTASH_PORT={}", config_.server.port);
    }

    if (auto env = get_env("PAGESTASH_THREADS")) {
        config_.server.threads = parse_uint("PAGESTASH_THREADS", *env);
        spdlog::debug("Applied PAGESTASH_THREADS={}", config_.server.threads);
    }

    if (auto env = get_env("PAGESTASH_BIND")) {
        config_.server.bind_address = *env;
        spdlog::debug("Applied PAGESTASH_BIND={}", config_.server.bind_address);
    }

    if (auto env = get_env("PAGESTASH_UPSTREAM")) {
        parse_upstream(*env, config_.upstream);
        spdlog::debug("Applied PAGESTASH_UPSTREAM={}:{}", config_.upstream.host, config_.upstream.port);
    }

    // Cache middleware settings
    if (auto env = get_env("PAGESTASH_CACHE_ALIAS")) {
        config_.cache_middleware.alias = *env;
        spdlog::debug("Applied PAGESTASH_CACHE_ALIAS={}", config_.cache_middleware.alias);
    }

    if (auto env = get_env("PAGESTASH_CACHE_SECONDS")) {
        config_.cache_middleware.seconds = parse_uint("PAGESTASH_CACHE_SECONDS", *env);
        spdlog::debug("Applied PAGESTASH_CACHE_SECONDS={}", config_.cache_middleware.seconds);
    }

    if (auto env = get_env("PAGESTASH_KEY_PREFIX")) {
        config_.cache_middleware.key_prefix = *env;
        spdlog::debug("Applied PAGESTASH_KEY_PREFIX={}", config_.cache_middleware.key_prefix);
    }

    if (auto env = get_env("PAGESTASH_ANONYMOUS_ONLY")) {
        config_.cache_middleware.anonymous_only = parse_flag("PAGESTASH_ANONYMOUS_ONLY", *env);
        spdlog::debug("Applied PAGESTASH_ANONYMOUS_ONLY={}", config_.cache_middleware.anonymous_only);
    }

    // Locale and time zone
    if (auto env = get_env("PAGESTASH_USE_I18N")) {
        config_.i18n.use_i18n = parse_flag("PAGESTASH_USE_I18N", *env);
        spdlog::debug("Applied PAGESTASH_USE_I18N={}", config_.i18n.use_i18n);
    }

    if (auto env = get_env("PAGESTASH_USE_TZ")) {
        config_.i18n.use_tz = parse_flag("PAGESTASH_USE_TZ", *env);
        spdlog::debug("Applied PAGESTASH_USE_TZ={}", config_.i18n.use_tz);
    }

    if (auto env = get_env("PAGESTASH_AUTH_ENABLED")) {
        config_.auth.enabled = parse_flag("PAGESTASH_AUTH_ENABLED", *env);
        spdlog::debug("Applied PAGESTASH_AUTH_ENABLED={}", config_.auth.enabled);
    }

    // Logging settings
    if (auto env = get_env("PAGESTASH_LOG_LEVEL")) {
        config_.logging.level = *env;
        spdlog::debug("Applied PAGESTASH_LOG_LEVEL={}", config_.logging.level);
    }

    if (auto env = get_env("PAGESTASH_LOG_FILE")) {
        config_.logging.file = *env;
        spdlog::debug("Applied PAGESTASH_LOG_FILE={}", config_.logging.file);
    }
}

void ConfigManager::apply_cli_overrides(int argc, char* argv[]) {
    // Accepts both "--name value" and "--name=value"
    auto value_of = [&](int& i, const std::string& arg, const std::string& long_name,
                        const std::string& short_name) -> std::optional<std::string> {
        if ((arg == long_name || (!short_name.empty() && arg == short_name)) && i + 1 < argc) {
            return std::string(argv[++i]);
        }
        if (arg.starts_with(long_name + "=")) {
            return arg.substr(long_name.size() + 1);
        }
        return std::nullopt;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") continue;
        if (arg == "--config" || arg == "-c") { ++i; continue; }
        if (arg.starts_with("--config=")) continue;

        if (auto v = value_of(i, arg, "--port", "-p")) {
            config_.server.port = static_cast<std::uint16_t>(parse_uint("--port", *v));
        } else if (auto v = value_of(i, arg, "--threads", "-t")) {
            config_.server.threads = parse_uint("--threads", *v);
        } else if (auto v = value_of(i, arg, "--bind", "-b")) {
            config_.server.bind_address = *v;
        } else if (auto v = value_of(i, arg, "--upstream", "")) {
            parse_upstream(*v, config_.upstream);
        } else if (auto v = value_of(i, arg, "--cache-seconds", "")) {
            config_.cache_middleware.seconds = parse_uint("--cache-seconds", *v);
        } else if (auto v = value_of(i, arg, "--key-prefix", "")) {
            config_.cache_middleware.key_prefix = *v;
        }

        // Unknown argument (not an error, might be handled elsewhere)
    }
}

std::optional<std::string> ConfigManager::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace pagestash::config
