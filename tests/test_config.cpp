/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Tests for configuration parsing and validation
 */

#include "config/config.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <initializer_list>
#include <string>
#include <vector>

using namespace pagestash::config;

namespace {

// argv built from string literals; ConfigManager::load takes char**
class Args {
public:
    Args(std::initializer_list<const char*> args) {
        for (const char* arg : args) {
            storage_.emplace_back(arg);
        }
        for (auto& arg : storage_) {
            argv_.push_back(arg.data());
        }
    }

    int argc() { return static_cast<int>(argv_.size()); }
    char** argv() { return argv_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

} // namespace

TEST(Config, DefaultsAreValid) {
    Config config;
    EXPECT_NO_THROW(config.validate());

    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.cache_middleware.alias, "default");
    EXPECT_EQ(config.cache_middleware.seconds, 600u);
    EXPECT_FALSE(config.cache_middleware.anonymous_only);
    EXPECT_TRUE(config.cache_middleware.head_uses_get_entries);
    ASSERT_EQ(config.caches.count("default"), 1u);
    EXPECT_EQ(config.caches.at("default").backend, "locmem");
}

TEST(Config, RejectsUnknownAlias) {
    Config config;
    config.cache_middleware.alias = "missing";
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(Config, RejectsUnknownBackend) {
    Config config;
    config.caches["default"].backend = "redis";
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(Config, AnonymousOnlyRequiresAuth) {
    Config config;
    config.cache_middleware.anonymous_only = true;
    EXPECT_THROW(config.validate(), ConfigError);

    config.auth.enabled = true;
    EXPECT_NO_THROW(config.validate());
}

TEST(Config, RejectsInvalidLogLevel) {
    Config config;
    config.logging.level = "loud";
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(ParseBool, AcceptsCommonSpellings) {
    EXPECT_EQ(parse_bool("true"), true);
    EXPECT_EQ(parse_bool("YES"), true);
    EXPECT_EQ(parse_bool("1"), true);
    EXPECT_EQ(parse_bool("False"), false);
    EXPECT_EQ(parse_bool("no"), false);
    EXPECT_FALSE(parse_bool("maybe").has_value());
}

TEST(ConfigJson, PartialDocumentKeepsDefaults) {
    auto j = nlohmann::json::parse(R"({
        "cache_middleware": {"seconds": 60, "key_prefix": "site"},
        "caches": {
            "default": {"backend": "locmem", "max_size_mb": 16},
            "null": {"backend": "dummy"}
        },
        "i18n": {"use_i18n": true}
    })");
    auto config = j.get<Config>();

    EXPECT_EQ(config.cache_middleware.seconds, 60u);
    EXPECT_EQ(config.cache_middleware.key_prefix, "site");
    EXPECT_EQ(config.cache_middleware.alias, "default");
    EXPECT_EQ(config.caches.at("default").max_size_mb, 16u);
    EXPECT_EQ(config.caches.at("default").timeout_seconds, 300u);
    EXPECT_EQ(config.caches.at("null").backend, "dummy");
    EXPECT_TRUE(config.i18n.use_i18n);
    EXPECT_EQ(config.i18n.language_code, "en-us");
    EXPECT_EQ(config.server.port, 8080);
}

TEST(ConfigManager, CommandLineOverrides) {
    ConfigManager manager;
    Args args{"pagestash", "--port", "9090", "--upstream=origin:8001",
              "--cache-seconds", "30", "--key-prefix=blog"};

    ASSERT_TRUE(manager.load(args.argc(), args.argv()));
    auto config = manager.get_config();

    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.upstream.host, "origin");
    EXPECT_EQ(config.upstream.port, 8001);
    EXPECT_EQ(config.cache_middleware.seconds, 30u);
    EXPECT_EQ(config.cache_middleware.key_prefix, "blog");
}

TEST(ConfigManager, HelpStopsLoading) {
    ConfigManager manager;
    Args args{"pagestash", "--help"};
    EXPECT_FALSE(manager.load(args.argc(), args.argv()));
}

TEST(ConfigManager, RejectsMalformedValues) {
    ConfigManager manager;
    Args bad_port{"pagestash", "--port", "eighty"};
    EXPECT_THROW(manager.load(bad_port.argc(), bad_port.argv()), ConfigError);

    Args bad_upstream{"pagestash", "--upstream", "origin"};
    EXPECT_THROW(manager.load(bad_upstream.argc(), bad_upstream.argv()), ConfigError);
}

TEST(ConfigManager, LoadsFileAndLetsCommandLineWin) {
    auto path = std::filesystem::temp_directory_path() / "pagestash_test_config.json";
    {
        std::ofstream file(path);
        file << R"({"server": {"port": 7000}, "cache_middleware": {"seconds": 45}})";
    }

    ConfigManager manager;
    Args args{"pagestash", "--config", path.c_str(), "--port", "7001"};
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));
    auto config = manager.get_config();
    std::filesystem::remove(path);

    EXPECT_EQ(config.server.port, 7001);
    EXPECT_EQ(config.cache_middleware.seconds, 45u);
    EXPECT_EQ(manager.get_config_path(), path);
}

TEST(ConfigManager, MissingFileIsConfigError) {
    ConfigManager manager;
    Args args{"pagestash", "--config", "/nonexistent/pagestash.json"};
    EXPECT_THROW(manager.load(args.argc(), args.argv()), ConfigError);
}
