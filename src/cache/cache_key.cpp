/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Cache Key Implementation - XXH3-based path and header hashing
 */

#include "cache/cache_key.hpp"

#include <xxhash.h>

#include <cctype>
#include <iomanip>
#include <memory>
#include <new>
#include <sstream>

namespace pagestash::cache {

namespace {

constexpr std::string_view header_namespace = "pagestash.cache_header";
constexpr std::string_view page_namespace = "pagestash.cache_page";

struct Xxh3StateDeleter {
    void operator()(XXH3_state_t* state) const noexcept { XXH3_freeState(state); }
};

std::string to_hex(XXH128_hash_t hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(16) << hash.high64
        << std::setw(16) << hash.low64;
    return oss.str();
}

bool is_uri_char(unsigned char c) {
    if (std::isalnum(c)) {
        return true;
    }
    switch (c) {
        case '-': case '.': case '_': case '~':
        case '/': case '#': case '%': case '[': case ']':
        case '=': case ':': case ';': case '$': case '&':
        case '(': case ')': case '+': case ',': case '!':
        case '?': case '*': case '@': case '\'':
            return true;
        default:
            return false;
    }
}

bool starts_with_nocase(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) {
            return false;
        }
    }
    return true;
}

std::string_view strip_authority(std::string_view target) {
    std::size_t scheme_len = 0;
    if (starts_with_nocase(target, "http://")) {
        scheme_len = 7;
    } else if (starts_with_nocase(target, "https://")) {
        scheme_len = 8;
    } else {
        return target;
    }

    auto rest = target.substr(scheme_len);
    auto path_start = rest.find_first_of("/?#");
    if (path_start == std::string_view::npos) {
        return "/";
    }
    return rest.substr(path_start);
}

void append_locale_suffix(std::string& key, const pipeline::Request& request,
                          const KeyContext& context) {
    if (context.use_i18n) {
        key += '.';
        key += request.language_code.value_or(context.language_code);
    }
    if (context.use_tz) {
        key += '.';
        key += request.time_zone.value_or(context.time_zone);
    }
}

} // namespace

std::string normalize_path(std::string_view target) {
    static constexpr char hex_chars[] = "0123456789ABCDEF";

    auto path = strip_authority(target);

    std::string normalized;
    if (path.empty() || (path.front() != '/')) {
        normalized.push_back('/');
    }
    normalized.reserve(normalized.size() + path.size());

    for (std::size_t i = 0; i < path.size(); ++i) {
        auto c = static_cast<unsigned char>(path[i]);

        if (c == '%' && i + 2 < path.size() &&
            std::isxdigit(static_cast<unsigned char>(path[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(path[i + 2]))) {
            normalized.push_back('%');
            normalized.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(path[i + 1]))));
            normalized.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(path[i + 2]))));
            i += 2;
            continue;
        }

        if (is_uri_char(c)) {
            normalized.push_back(static_cast<char>(c));
        } else {
            normalized.push_back('%');
            normalized.push_back(hex_chars[c >> 4]);
            normalized.push_back(hex_chars[c & 0x0F]);
        }
    }

    return normalized;
}

std::string hash_hex(std::string_view data) {
    return to_hex(XXH3_128bits(data.data(), data.size()));
}

std::string header_list_key(std::string_view key_prefix,
                            const pipeline::Request& request,
                            const KeyContext& context) {
    std::string key;
    key.reserve(header_namespace.size() + key_prefix.size() + 34);
    key += header_namespace;
    key += '.';
    key += key_prefix;
    key += '.';
    key += hash_hex(normalize_path(request.full_path()));

    append_locale_suffix(key, request, context);
    return key;
}

std::string page_key(const pipeline::Request& request,
                     std::string_view method,
                     const HeaderList& header_list,
                     std::string_view key_prefix,
                     const KeyContext& context) {
    std::unique_ptr<XXH3_state_t, Xxh3StateDeleter> state(XXH3_createState());
    if (!state) {
        throw std::bad_alloc();
    }
    XXH3_128bits_reset(state.get());

    for (const auto& header : header_list) {
        if (auto value = request.meta(header)) {
            XXH3_128bits_update(state.get(), value->data(), value->size());
        }
    }
    auto headers_hash = to_hex(XXH3_128bits_digest(state.get()));

    std::string key;
    key.reserve(page_namespace.size() + key_prefix.size() + method.size() + 72);
    key += page_namespace;
    key += '.';
    key += key_prefix;
    key += '.';
    key += method;
    key += '.';
    key += hash_hex(normalize_path(request.full_path()));
    key += '.';
    key += headers_hash;

    append_locale_suffix(key, request, context);
    return key;
}

} // namespace pagestash::cache
