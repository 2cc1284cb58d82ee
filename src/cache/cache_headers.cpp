/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Cache Headers Implementation
 */

#include "cache/cache_headers.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <limits>

namespace pagestash::cache {

namespace {

std::string_view trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string_view s) {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::optional<long long> parse_integer(std::string_view s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    if (s.empty()) {
        return std::nullopt;
    }

    bool negative = false;
    std::size_t i = 0;
    if (s[0] == '-' || s[0] == '+') {
        negative = s[0] == '-';
        i = 1;
    }
    if (i == s.size()) {
        return std::nullopt;
    }

    long long value = 0;
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return std::nullopt;
        }
        if (value > (std::numeric_limits<long long>::max() - 9) / 10) {
            return std::nullopt;
        }
        value = value * 10 + (s[i] - '0');
    }
    return negative ? -value : value;
}

std::string render_cache_control(const std::vector<CacheDirective>& directives) {
    std::string out;
    for (const auto& [name, value] : directives) {
        if (!out.empty()) {
            out += ", ";
        }
        out += name;
        if (value) {
            out += '=';
            out += *value;
        }
    }
    return out;
}

} // namespace

std::vector<std::string> split_header_tokens(std::string_view value) {
    std::vector<std::string> tokens;
    std::size_t pos = 0;
    while (pos <= value.size()) {
        auto comma = value.find(',', pos);
        auto token = trim(value.substr(pos, comma == std::string_view::npos ? std::string_view::npos
                                                                             : comma - pos));
        if (!token.empty()) {
            tokens.emplace_back(token);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        pos = comma + 1;
    }
    return tokens;
}

std::vector<CacheDirective> parse_cache_control(std::string_view value) {
    std::vector<CacheDirective> directives;
    for (const auto& token : split_header_tokens(value)) {
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            directives.emplace_back(to_lower(token), std::nullopt);
        } else {
            directives.emplace_back(to_lower(trim(std::string_view(token).substr(0, eq))),
                                    std::string(trim(std::string_view(token).substr(eq + 1))));
        }
    }
    return directives;
}

std::optional<std::chrono::seconds> get_max_age(const pipeline::Response& response) {
    auto cache_control = response.header("Cache-Control");
    if (!cache_control) {
        return std::nullopt;
    }

    for (const auto& [name, value] : parse_cache_control(*cache_control)) {
        if (name != "max-age" || !value) {
            continue;
        }
        auto seconds = parse_integer(*value);
        if (!seconds) {
            return std::nullopt;
        }
        return std::chrono::seconds(std::max<long long>(*seconds, 0));
    }
    return std::nullopt;
}

void patch_cache_control_max_age(pipeline::Response& response, std::chrono::seconds max_age) {
    std::vector<CacheDirective> directives;
    if (auto existing = response.header("Cache-Control")) {
        directives = parse_cache_control(*existing);
    }

    bool replaced = false;
    for (auto& [name, value] : directives) {
        if (name != "max-age") {
            continue;
        }
        auto current = value ? parse_integer(*value) : std::nullopt;
        auto effective = current ? std::min<long long>(*current, max_age.count()) : max_age.count();
        value = std::to_string(std::max<long long>(effective, 0));
        replaced = true;
    }
    if (!replaced) {
        directives.emplace_back("max-age", std::to_string(max_age.count()));
    }

    response.set_header("Cache-Control", render_cache_control(directives));
}

std::string http_date(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[64];
    auto len = std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return std::string(buf, len);
}

void patch_response_headers(pipeline::Response& response,
                            std::chrono::seconds timeout,
                            bool use_etags,
                            std::chrono::system_clock::time_point now) {
    if (timeout.count() < 0) {
        timeout = std::chrono::seconds(0);
    }

    if (use_etags && !response.has_header("ETag")) {
        auto set_etag = [](pipeline::Response& r) {
            if (!r.has_header("ETag")) {
                r.set_header("ETag", "\"" + hash_hex(r.body()) + "\"");
            }
        };
        if (response.is_deferred()) {
            response.add_post_render_callback(set_etag);
        } else {
            set_etag(response);
        }
    }

    if (!response.has_header("Last-Modified")) {
        response.set_header("Last-Modified", http_date(now));
    }
    if (!response.has_header("Expires")) {
        response.set_header("Expires", http_date(now + timeout));
    }

    patch_cache_control_max_age(response, timeout);
}

HeaderList vary_header_list(const pipeline::Response& response) {
    HeaderList header_list;
    auto vary = response.header("Vary");
    if (!vary) {
        return header_list;
    }

    for (const auto& token : split_header_tokens(*vary)) {
        header_list.push_back(pipeline::canonical_header_name(token));
    }
    return header_list;
}

} // namespace pagestash::cache
