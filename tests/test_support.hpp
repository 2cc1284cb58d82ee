/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Test support - Recording backend, session and identity doubles
 */

#ifndef PAGESTASH_TESTS_TEST_SUPPORT_HPP
#define PAGESTASH_TESTS_TEST_SUPPORT_HPP

#include "cache/cache_backend.hpp"
#include "config/config.hpp"
#include "pipeline/request.hpp"
#include "pipeline/response.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pagestash::testing {

namespace http = boost::beast::http;

/**
 * In-memory backend that records every call and can be told to fail
 */
class RecordingBackend : public cache::CacheBackend {
public:
    struct Write {
        std::string key;
        std::string value;
        std::chrono::seconds ttl;
    };

    explicit RecordingBackend(std::chrono::seconds default_timeout = std::chrono::seconds(300))
        : default_timeout_(default_timeout) {}

    std::optional<std::string> get(const std::string& key) override {
        reads.push_back(key);
        if (fail_reads) {
            throw cache::CacheBackendError("read failed");
        }
        if (crash_reads) {
            throw std::runtime_error("backend crashed during read");
        }
        auto it = values.find(key);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void set(const std::string& key, std::string value, std::chrono::seconds ttl) override {
        if (fail_writes) {
            throw cache::CacheBackendError("write failed");
        }
        if (crash_writes) {
            throw std::runtime_error("backend crashed during write");
        }
        writes.push_back({key, value, ttl});
        if (ttl.count() > 0) {
            values[key] = std::move(value);
        }
    }

    std::chrono::seconds default_timeout() const override { return default_timeout_; }

    std::map<std::string, std::string> values;
    std::vector<std::string> reads;
    std::vector<Write> writes;
    bool fail_reads{false};
    bool fail_writes{false};
    bool crash_reads{false};   // Throw something other than CacheBackendError
    bool crash_writes{false};

private:
    std::chrono::seconds default_timeout_;
};

class FakeSession : public pipeline::Session {
public:
    explicit FakeSession(bool accessed) : accessed_(accessed) {}
    bool accessed() const override { return accessed_; }

private:
    bool accessed_;
};

class FakeIdentity : public pipeline::Identity {
public:
    explicit FakeIdentity(bool authenticated) : authenticated_(authenticated) {}
    bool is_authenticated() const override { return authenticated_; }

private:
    bool authenticated_;
};

inline pipeline::Request make_request(http::verb method, const std::string& target) {
    return pipeline::Request(method, target);
}

/**
 * Handler double: counts invocations and returns a copy of `response`
 */
struct CountingHandler {
    pipeline::Response response{http::status::ok, "<p>hello</p>"};
    int calls{0};

    pipeline::Response operator()(pipeline::Request&) {
        ++calls;
        return response;
    }
};

} // namespace pagestash::testing

#endif // PAGESTASH_TESTS_TEST_SUPPORT_HPP
