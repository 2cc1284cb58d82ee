/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Server component - Acceptor, worker pool and signal-driven shutdown
 */

#ifndef PAGESTASH_SERVER_SERVER_HPP
#define PAGESTASH_SERVER_SERVER_HPP

#include "config/config.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace pagestash::server {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

struct ServerConfig {
    std::uint16_t port{8080};
    std::size_t thread_count{1};
    std::string bind_address{"0.0.0.0"};

    /**
     * Resolve `threads == 0` to the number of hardware threads
     */
    static ServerConfig from_settings(const config::ServerSettings& settings);
};

/**
 * Called for every accepted socket
 */
using ConnectionHandler = std::function<void(tcp::socket)>;

/**
 * Owns the io_context, its worker threads and the TCP acceptor
 *
 * Workers are std::jthread; SIGINT and SIGTERM trigger stop().
 */
class Server {
public:
    explicit Server(const ServerConfig& config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    /**
     * Bind, listen and start the workers
     * @throws std::runtime_error if the acceptor cannot be set up
     */
    void start(ConnectionHandler handler);

    /**
     * Stop accepting and stop the io_context; idempotent
     */
    void stop();

    /**
     * Block until all workers exited
     */
    void wait();

    /**
     * Port the acceptor is bound to; differs from the configured port when
     * that was 0
     */
    std::uint16_t bound_port() const noexcept { return bound_port_.load(); }

    std::uint64_t connections_accepted() const noexcept { return connections_accepted_.load(); }

private:
    void run_io_context(std::stop_token stop_token);
    void do_accept();
    void setup_signal_handling();

    ServerConfig config_;
    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    tcp::acceptor acceptor_;
    asio::signal_set signals_;

    std::vector<std::jthread> thread_pool_;
    ConnectionHandler connection_handler_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> bound_port_{0};
    std::atomic<std::uint64_t> connections_accepted_{0};
};

} // namespace pagestash::server

#endif // PAGESTASH_SERVER_SERVER_HPP
