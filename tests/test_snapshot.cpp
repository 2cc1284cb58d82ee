/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Tests for the stored header-list and response formats
 */

#include "cache/snapshot.hpp"

#include <gtest/gtest.h>

using namespace pagestash;
namespace http = boost::beast::http;

TEST(HeaderListCodec, PreservesOrderAndEmptiness) {
    cache::HeaderList header_list{"HTTP_COOKIE", "HTTP_ACCEPT_LANGUAGE"};
    EXPECT_EQ(cache::encode_header_list(header_list), R"(["HTTP_COOKIE","HTTP_ACCEPT_LANGUAGE"])");
    EXPECT_EQ(cache::decode_header_list(cache::encode_header_list(header_list)), header_list);

    auto empty = cache::decode_header_list(cache::encode_header_list({}));
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(HeaderListCodec, RejectsMalformedData) {
    EXPECT_FALSE(cache::decode_header_list("not json").has_value());
    EXPECT_FALSE(cache::decode_header_list(R"({"a": 1})").has_value());
    EXPECT_FALSE(cache::decode_header_list(R"(["HTTP_COOKIE", 3])").has_value());
}

TEST(ResponseCodec, RestoresStatusHeadersAndBinaryBody) {
    std::string body("bin\0ary\xff", 8);
    pipeline::Response response(http::status::ok, body, "application/octet-stream");
    response.set_header("Vary", "Cookie");
    response.message().insert("Set-Cookie", "a=1");
    response.message().insert("Set-Cookie", "b=2");

    auto decoded = cache::decode_response(cache::encode_response(response));
    ASSERT_TRUE(decoded.has_value());

    EXPECT_EQ(decoded->status_code(), 200);
    EXPECT_EQ(decoded->body(), body);
    EXPECT_EQ(decoded->header("Content-Type"), "application/octet-stream");
    EXPECT_EQ(decoded->header("Vary"), "Cookie");
    EXPECT_EQ(decoded->message().count("Set-Cookie"), 2u);
    EXPECT_FALSE(decoded->is_deferred());
}

TEST(ResponseCodec, DecodedCopyIsIndependent) {
    pipeline::Response response(http::status::ok, "original");
    auto stored = cache::encode_response(response);

    auto first = cache::decode_response(stored);
    ASSERT_TRUE(first.has_value());
    first->set_body("changed");
    first->set_header("X-Extra", "1");

    auto second = cache::decode_response(stored);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->body(), "original");
    EXPECT_FALSE(second->has_header("X-Extra"));
}

TEST(ResponseCodec, RejectsMalformedData) {
    EXPECT_FALSE(cache::decode_response("").has_value());
    EXPECT_FALSE(cache::decode_response("garbage").has_value());
    EXPECT_FALSE(cache::decode_response(cache::encode_header_list({"HTTP_COOKIE"})).has_value());
}
