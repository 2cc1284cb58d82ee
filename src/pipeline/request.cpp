/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Request implementation
 */

#include "pipeline/request.hpp"

#include <cctype>

namespace pagestash::pipeline {

namespace {

std::string to_std(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

} // namespace

std::string canonical_header_name(std::string_view name) {
    std::string canonical = "HTTP_";
    canonical.reserve(canonical.size() + name.size());
    for (char c : name) {
        if (c == '-') {
            canonical.push_back('_');
        } else {
            canonical.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    return canonical;
}

Request::Request(http::verb method, std::string_view target) {
    message.method(method);
    message.target(beast::string_view(target.data(), target.size()));
    message.version(11);
}

std::string Request::method() const {
    return to_std(message.method_string());
}

std::string Request::full_path() const {
    return to_std(message.target());
}

std::optional<std::string> Request::meta(std::string_view canonical_name) const {
    std::optional<std::string> value;
    for (const auto& field : message) {
        auto name = field.name_string();
        if (canonical_header_name(std::string_view(name.data(), name.size())) != canonical_name) {
            continue;
        }
        if (value) {
            *value += ", ";
            *value += to_std(field.value());
        } else {
            value = to_std(field.value());
        }
    }
    return value;
}

Request& Request::set_header(std::string_view name, std::string_view value) {
    message.set(beast::string_view(name.data(), name.size()),
                beast::string_view(value.data(), value.size()));
    return *this;
}

bool Request::session_accessed() const {
    return session && session->accessed();
}

std::string_view Request::cache_status() const {
    if (served_from_cache) {
        return "HIT";
    }
    return should_store.value_or(false) ? "MISS" : "BYPASS";
}

} // namespace pagestash::pipeline
