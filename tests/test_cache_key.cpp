/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Tests for header-list and page key derivation
 */

#include "cache/cache_key.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace pagestash;
using pagestash::testing::make_request;
namespace http = boost::beast::http;

TEST(CanonicalHeaderName, UppercasesAndReplacesDashes) {
    EXPECT_EQ(pipeline::canonical_header_name("Accept-Language"), "HTTP_ACCEPT_LANGUAGE");
    EXPECT_EQ(pipeline::canonical_header_name("cookie"), "HTTP_COOKIE");
    EXPECT_EQ(pipeline::canonical_header_name("X-Custom-Header"), "HTTP_X_CUSTOM_HEADER");
}

TEST(RequestMeta, LooksUpHeadersByCanonicalName) {
    auto request = make_request(http::verb::get, "/");
    request.set_header("Accept-Language", "de");

    EXPECT_EQ(request.meta("HTTP_ACCEPT_LANGUAGE"), "de");
    EXPECT_FALSE(request.meta("HTTP_COOKIE").has_value());
}

TEST(NormalizePath, KeepsPlainPathsAndQueries) {
    EXPECT_EQ(cache::normalize_path("/articles/1"), "/articles/1");
    EXPECT_EQ(cache::normalize_path("/search?q=a&page=2"), "/search?q=a&page=2");
}

TEST(NormalizePath, PercentEncodesNonUriBytes) {
    EXPECT_EQ(cache::normalize_path("/caf\xC3\xA9"), "/caf%C3%A9");
    EXPECT_EQ(cache::normalize_path("/a b"), "/a%20b");
}

TEST(NormalizePath, UppercasesExistingEscapes) {
    EXPECT_EQ(cache::normalize_path("/x?q=%2f"), "/x?q=%2F");
}

TEST(NormalizePath, StripsAbsoluteFormAuthority) {
    EXPECT_EQ(cache::normalize_path("http://example.com/articles/1?x=1"), "/articles/1?x=1");
    EXPECT_EQ(cache::normalize_path("https://example.com"), "/");
}

TEST(HashHex, Is32LowercaseHexCharacters) {
    auto digest = cache::hash_hex("hello");
    ASSERT_EQ(digest.size(), 32u);
    for (char c : digest) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << digest;
    }
    EXPECT_EQ(digest, cache::hash_hex("hello"));
    EXPECT_NE(digest, cache::hash_hex("hello!"));
}

TEST(HeaderListKey, HasNamespacePrefixAndPathHash) {
    auto request = make_request(http::verb::get, "/articles/1");
    auto key = cache::header_list_key("site", request, {});

    EXPECT_EQ(key, "pagestash.cache_header.site." + cache::hash_hex("/articles/1"));
}

TEST(HeaderListKey, IgnoresHeaderValues) {
    auto a = make_request(http::verb::get, "/p");
    auto b = make_request(http::verb::get, "/p");
    b.set_header("Accept-Language", "fr").set_header("Cookie", "x=1");

    EXPECT_EQ(cache::header_list_key("", a, {}), cache::header_list_key("", b, {}));
}

TEST(HeaderListKey, AppendsLanguageAndTimeZone) {
    cache::KeyContext context;
    context.use_i18n = true;
    context.use_tz = true;

    auto request = make_request(http::verb::get, "/p");
    request.language_code = "de";
    request.time_zone = "Europe/Berlin";

    auto key = cache::header_list_key("", request, context);
    EXPECT_TRUE(key.ends_with(".de.Europe/Berlin")) << key;

    // Falls back to the deployment defaults
    auto plain = make_request(http::verb::get, "/p");
    auto fallback = cache::header_list_key("", plain, context);
    EXPECT_TRUE(fallback.ends_with(".en-us.UTC")) << fallback;
}

TEST(PageKey, IsDeterministic) {
    auto request = make_request(http::verb::get, "/p?x=1");
    request.set_header("Accept-Language", "en");
    cache::HeaderList headers{"HTTP_ACCEPT_LANGUAGE"};

    EXPECT_EQ(cache::page_key(request, "GET", headers, "pre", {}),
              cache::page_key(request, "GET", headers, "pre", {}));
}

TEST(PageKey, HasExpectedShape) {
    auto request = make_request(http::verb::get, "/articles/1");
    auto key = cache::page_key(request, "GET", {}, "site", {});

    EXPECT_EQ(key, "pagestash.cache_page.site.GET." + cache::hash_hex("/articles/1") + "." +
                   cache::hash_hex(""));
}

TEST(PageKey, DependsOnlyOnListedHeaders) {
    cache::HeaderList headers{"HTTP_ACCEPT_LANGUAGE"};

    auto a = make_request(http::verb::get, "/p");
    a.set_header("Accept-Language", "en").set_header("User-Agent", "one");
    auto b = make_request(http::verb::get, "/p");
    b.set_header("Accept-Language", "en").set_header("User-Agent", "two");
    auto c = make_request(http::verb::get, "/p");
    c.set_header("Accept-Language", "fr");

    EXPECT_EQ(cache::page_key(a, "GET", headers, "", {}), cache::page_key(b, "GET", headers, "", {}));
    EXPECT_NE(cache::page_key(a, "GET", headers, "", {}), cache::page_key(c, "GET", headers, "", {}));
}

TEST(PageKey, HeaderOrderIsSignificant) {
    auto request = make_request(http::verb::get, "/p");
    request.set_header("Accept-Language", "en").set_header("Cookie", "c=1");

    cache::HeaderList forward{"HTTP_ACCEPT_LANGUAGE", "HTTP_COOKIE"};
    cache::HeaderList reversed{"HTTP_COOKIE", "HTTP_ACCEPT_LANGUAGE"};

    EXPECT_NE(cache::page_key(request, "GET", forward, "", {}),
              cache::page_key(request, "GET", reversed, "", {}));
}

TEST(PageKey, MissingHeadersContributeNothing) {
    cache::HeaderList headers{"HTTP_ACCEPT_LANGUAGE", "HTTP_COOKIE"};

    auto with_cookie_only = make_request(http::verb::get, "/p");
    with_cookie_only.set_header("Cookie", "c=1");

    EXPECT_EQ(cache::page_key(with_cookie_only, "GET", headers, "", {}),
              cache::page_key(with_cookie_only, "GET", {"HTTP_COOKIE"}, "", {}));
}

TEST(PageKey, VariesByMethodAndPrefix) {
    auto request = make_request(http::verb::get, "/p");

    EXPECT_NE(cache::page_key(request, "GET", {}, "", {}), cache::page_key(request, "HEAD", {}, "", {}));
    EXPECT_NE(cache::page_key(request, "GET", {}, "a", {}), cache::page_key(request, "GET", {}, "b", {}));
}
