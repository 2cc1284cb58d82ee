/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Connection handler - HTTP/1.1 keep-alive session with Boost.Beast
 */

#ifndef PAGESTASH_SERVER_CONNECTION_HPP
#define PAGESTASH_SERVER_CONNECTION_HPP

#include "pipeline/request.hpp"
#include "pipeline/response.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace pagestash::server {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

/**
 * Produces the response for one parsed request. May return a deferred
 * response; the connection renders it before writing.
 */
using RequestHandler = std::function<pipeline::Response(pipeline::Request&)>;

/**
 * One client connection
 *
 * Reads requests in a loop while the client keeps the connection alive,
 * hands each to the handler and writes an access log line per response.
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
    static constexpr std::chrono::seconds io_timeout{30};

    Connection(tcp::socket socket, RequestHandler handler);
    ~Connection() = default;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&&) = delete;
    Connection& operator=(Connection&&) = delete;

    void start();
    void close();

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes_transferred);

    void handle_request();
    http::response<http::string_body> build_error_response(http::status status,
                                                           const std::string& message);

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    http::response<http::string_body> response_;
    RequestHandler handler_;
    bool keep_alive_{false};
    bool head_request_{false};  // Answer carries framing headers but no body

    // Access log state of the request being answered
    std::string method_;
    std::string path_;
    std::string cache_status_{"BYPASS"};
    std::chrono::steady_clock::time_point started_;

    std::string client_ip_;
};

/**
 * Create and start a connection; for use with Server::start()
 */
void handle_connection(tcp::socket socket, RequestHandler handler);

} // namespace pagestash::server

#endif // PAGESTASH_SERVER_CONNECTION_HPP
