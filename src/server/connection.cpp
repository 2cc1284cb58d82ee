/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Connection implementation
 */

#include "server/connection.hpp"
#include "util/logger.hpp"
#include "util/metrics.hpp"

namespace pagestash::server {

namespace component = util::log_component;

namespace {

constexpr std::string_view server_name = "PAGESTASH/0.1.0";

bool is_malformed_request(const beast::error_code& ec) {
    return ec == http::error::bad_method ||
           ec == http::error::bad_target ||
           ec == http::error::bad_version ||
           ec == http::error::bad_field ||
           ec == http::error::bad_value ||
           ec == http::error::bad_content_length ||
           ec == http::error::partial_message;
}

} // namespace

Connection::Connection(tcp::socket socket, RequestHandler handler)
    : stream_(std::move(socket))
    , handler_(std::move(handler))
{
    beast::error_code ec;
    auto endpoint = stream_.socket().remote_endpoint(ec);
    if (!ec) {
        client_ip_ = endpoint.address().to_string();
    }
}

void Connection::start() {
    asio::dispatch(
        stream_.get_executor(),
        beast::bind_front_handler(&Connection::do_read, shared_from_this())
    );
}

void Connection::close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        PAGESTASH_LOG_TRACE(component::Server, "Shutdown of {} failed: {}", client_ip_, ec.message());
    }
}

void Connection::do_read() {
    request_ = {};
    stream_.expires_after(io_timeout);

    http::async_read(
        stream_,
        buffer_,
        request_,
        beast::bind_front_handler(&Connection::on_read, shared_from_this())
    );
}

void Connection::on_read(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    if (ec == http::error::end_of_stream) {
        close();
        return;
    }

    if (ec) {
        if (is_malformed_request(ec)) {
            PAGESTASH_LOG_WARN(component::Server, "Malformed request from {}: {}",
                               client_ip_, ec.message());
            util::Metrics::instance().request_started();
            keep_alive_ = false;
            head_request_ = false;
            method_ = "-";
            path_ = "-";
            cache_status_ = "BYPASS";
            started_ = std::chrono::steady_clock::now();
            response_ = build_error_response(http::status::bad_request,
                                             "Malformed HTTP request: " + ec.message());
            do_write();
            return;
        }
        if (ec != asio::error::operation_aborted && ec != beast::error::timeout) {
            PAGESTASH_LOG_DEBUG(component::Server, "Read error: {}", ec.message());
        }
        close();
        return;
    }

    handle_request();
    do_write();
}

void Connection::handle_request() {
    auto& metrics = util::Metrics::instance();
    metrics.request_started();
    started_ = std::chrono::steady_clock::now();

    keep_alive_ = request_.keep_alive();
    head_request_ = request_.method() == http::verb::head;
    method_ = std::string(request_.method_string().data(), request_.method_string().size());
    path_ = std::string(request_.target().data(), request_.target().size());
    cache_status_ = "BYPASS";

    if (request_.version() != 10 && request_.version() != 11) {
        response_ = build_error_response(http::status::http_version_not_supported,
                                         "Only HTTP/1.0 and HTTP/1.1 are supported");
        return;
    }

    auto version = request_.version();
    try {
        pipeline::Request request;
        request.message = std::move(request_);
        request.remote_addr = client_ip_;

        auto response = handler_(request);
        response.render();
        cache_status_ = request.cache_status();

        response_ = std::move(response.message());
        response_.version(version);
    } catch (const std::exception& e) {
        PAGESTASH_LOG_ERROR(component::Server, "Handler exception for {} {}: {}",
                            method_, path_, e.what());
        response_ = build_error_response(http::status::internal_server_error,
                                         "Internal server error");
    }
}

void Connection::do_write() {
    response_.set(http::field::server, beast::string_view(server_name.data(), server_name.size()));
    response_.set(http::field::connection, keep_alive_ ? "keep-alive" : "close");
    if (!head_request_) {
        response_.prepare_payload();
    } else if (!response_.body().empty()) {
        // Served from a GET entry or by a handler that wrote a body
        response_.prepare_payload();
        response_.body().clear();
    }

    stream_.expires_after(io_timeout);

    http::async_write(
        stream_,
        response_,
        beast::bind_front_handler(&Connection::on_write, shared_from_this())
    );
}

void Connection::on_write(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    auto status = response_.result_int();
    util::Metrics::instance().request_completed(!ec && status < 500);

    util::AccessLogEntry entry;
    entry.client_ip = client_ip_;
    entry.method = method_;
    entry.path = path_;
    entry.status_code = static_cast<int>(status);
    entry.response_size = response_.body().size();
    entry.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
    entry.cache_status = cache_status_;
    util::Logger::instance().access(entry);

    if (ec) {
        if (ec != asio::error::operation_aborted) {
            PAGESTASH_LOG_DEBUG(component::Server, "Write error: {}", ec.message());
        }
        close();
        return;
    }

    if (!keep_alive_) {
        close();
        return;
    }

    response_ = {};
    do_read();
}

http::response<http::string_body> Connection::build_error_response(
    http::status status, const std::string& message)
{
    http::response<http::string_body> response{status, 11};
    response.set(http::field::content_type, "application/json");
    response.body() = "{\"error\": \"" + message + "\"}";
    return response;
}

void handle_connection(tcp::socket socket, RequestHandler handler) {
    std::make_shared<Connection>(std::move(socket), std::move(handler))->start();
}

} // namespace pagestash::server
