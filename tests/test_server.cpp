/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * End-to-end tests: page cache served over a loopback HTTP server
 */

#include "middleware/combined_cache.hpp"
#include "server/connection.hpp"
#include "server/server.hpp"

#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <string_view>

using namespace pagestash;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

class ServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_unique<cache::CacheRegistry>(config_.caches);
        page_cache_ = std::make_unique<middleware::CombinedCache>(config_, *registry_);

        server::ServerConfig server_config;
        server_config.port = 0;
        server_config.bind_address = "127.0.0.1";
        server_config.thread_count = 2;
        server_ = std::make_unique<server::Server>(server_config);

        server::RequestHandler handler = [this](pipeline::Request& request) {
            auto response = page_cache_->handle(request, [this](pipeline::Request&) {
                ++origin_calls_;
                return pipeline::Response(http::status::ok, "<p>page</p>");
            });
            response.set_header("X-Cache", request.cache_status());
            return response;
        };
        server_->start([handler](tcp::socket socket) {
            server::handle_connection(std::move(socket), handler);
        });
    }

    void TearDown() override {
        server_->stop();
        server_->wait();
    }

    http::response<http::string_body> send(http::verb verb, const std::string& target) {
        asio::io_context ioc;
        beast::tcp_stream stream(ioc);
        connect(stream);
        beast::flat_buffer buffer;
        auto response = exchange(stream, buffer, verb, target, false);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return response;
    }

    void connect(beast::tcp_stream& stream) {
        stream.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), server_->bound_port()));
    }

    static http::response<http::string_body> exchange(beast::tcp_stream& stream,
                                                      beast::flat_buffer& buffer, http::verb verb,
                                                      const std::string& target, bool keep_alive) {
        http::request<http::string_body> request{verb, target, 11};
        request.set(http::field::host, "localhost");
        request.keep_alive(keep_alive);
        request.prepare_payload();
        http::write(stream, request);

        http::response_parser<http::string_body> parser;
        parser.skip(verb == http::verb::head);
        http::read(stream, buffer, parser);
        return parser.release();
    }

    static std::string header(const http::response<http::string_body>& response,
                              std::string_view name) {
        auto value = response[beast::string_view(name.data(), name.size())];
        return std::string(value.data(), value.size());
    }

    config::Config config_;
    std::unique_ptr<cache::CacheRegistry> registry_;
    std::unique_ptr<middleware::CombinedCache> page_cache_;
    std::unique_ptr<server::Server> server_;
    std::atomic<int> origin_calls_{0};
};

} // namespace

TEST_F(ServerTest, BindsEphemeralPort) {
    EXPECT_NE(server_->bound_port(), 0);
}

TEST_F(ServerTest, SecondGetIsServedFromCache) {
    auto first = send(http::verb::get, "/articles/1");
    EXPECT_EQ(first.result(), http::status::ok);
    EXPECT_EQ(first.body(), "<p>page</p>");
    EXPECT_EQ(header(first, "X-Cache"), "MISS");
    EXPECT_EQ(header(first, "Cache-Control"), "max-age=600");
    EXPECT_EQ(header(first, "Server"), "PAGESTASH/0.1.0");

    auto second = send(http::verb::get, "/articles/1");
    EXPECT_EQ(second.body(), "<p>page</p>");
    EXPECT_EQ(header(second, "X-Cache"), "HIT");
    EXPECT_EQ(header(second, "ETag"), header(first, "ETag"));

    EXPECT_EQ(origin_calls_.load(), 1);
    EXPECT_GE(server_->connections_accepted(), 2u);
}

TEST_F(ServerTest, PostBypassesCache) {
    auto first = send(http::verb::post, "/form");
    auto second = send(http::verb::post, "/form");

    EXPECT_EQ(header(first, "X-Cache"), "BYPASS");
    EXPECT_EQ(header(second, "X-Cache"), "BYPASS");
    EXPECT_EQ(origin_calls_.load(), 2);
}

TEST_F(ServerTest, HeadMissSendsLengthWithoutBody) {
    auto response = send(http::verb::head, "/articles/2");

    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_TRUE(response.body().empty());
    EXPECT_EQ(header(response, "Content-Length"), "11");
    EXPECT_EQ(header(response, "X-Cache"), "MISS");
}

TEST_F(ServerTest, HeadHitFromGetEntryKeepsConnectionFramed) {
    asio::io_context ioc;
    beast::tcp_stream stream(ioc);
    connect(stream);
    beast::flat_buffer buffer;

    auto get = exchange(stream, buffer, http::verb::get, "/articles/3", true);
    EXPECT_EQ(get.body(), "<p>page</p>");

    auto head = exchange(stream, buffer, http::verb::head, "/articles/3", true);
    EXPECT_EQ(header(head, "X-Cache"), "HIT");
    EXPECT_EQ(header(head, "Content-Length"), "11");
    EXPECT_TRUE(head.body().empty());

    // A body leaking from the HEAD answer would be parsed as this response
    auto again = exchange(stream, buffer, http::verb::get, "/articles/3", false);
    EXPECT_EQ(again.result(), http::status::ok);
    EXPECT_EQ(header(again, "X-Cache"), "HIT");
    EXPECT_EQ(again.body(), "<p>page</p>");

    EXPECT_EQ(origin_calls_.load(), 1);
}
