/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Response - Pipeline view of an outgoing HTTP response
 *
 * A response is either final (body present) or deferred: a renderer produces
 * the body later, after middleware has inspected the headers. Post-render
 * callbacks run once the body is final.
 */

#ifndef PAGESTASH_PIPELINE_RESPONSE_HPP
#define PAGESTASH_PIPELINE_RESPONSE_HPP

#include <boost/beast/http.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pagestash::pipeline {

namespace beast = boost::beast;
namespace http = beast::http;

class Response {
public:
    using Renderer = std::function<std::string()>;
    using PostRenderCallback = std::function<void(Response&)>;

    Response();
    explicit Response(http::status status, std::string body = {},
                      std::string_view content_type = "text/html; charset=utf-8");

    /**
     * Build a deferred response whose body is produced by `renderer`
     */
    static Response deferred(http::status status, Renderer renderer,
                             std::string_view content_type = "text/html; charset=utf-8");

    int status_code() const { return static_cast<int>(message_.result_int()); }
    void set_status(http::status status) { message_.result(status); }

    bool has_header(std::string_view name) const;
    std::optional<std::string> header(std::string_view name) const;
    void set_header(std::string_view name, std::string_view value);

    const std::string& body() const { return message_.body(); }
    void set_body(std::string body) { message_.body() = std::move(body); }

    http::response<http::string_body>& message() { return message_; }
    const http::response<http::string_body>& message() const { return message_; }

    /**
     * True while the body has not been produced yet
     */
    bool is_deferred() const { return !rendered_; }

    /**
     * Produce the body of a deferred response and run post-render callbacks.
     * No-op for responses that are already final.
     */
    void render();

    /**
     * Run `callback` once the body is final; immediately if it already is
     */
    void add_post_render_callback(PostRenderCallback callback);

private:
    http::response<http::string_body> message_;
    Renderer renderer_;
    std::vector<PostRenderCallback> post_render_callbacks_;
    bool rendered_{true};
};

} // namespace pagestash::pipeline

#endif // PAGESTASH_PIPELINE_RESPONSE_HPP
