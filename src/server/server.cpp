/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Server implementation
 */

#include "server/server.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace pagestash::server {

namespace component = util::log_component;

ServerConfig ServerConfig::from_settings(const config::ServerSettings& settings) {
    ServerConfig config;
    config.port = settings.port;
    config.bind_address = settings.bind_address;
    config.thread_count = settings.threads > 0
        ? settings.threads
        : std::max<std::size_t>(1, std::thread::hardware_concurrency());
    return config;
}

Server::Server(const ServerConfig& config)
    : config_(config)
    , io_context_(static_cast<int>(config.thread_count))
    , work_guard_(asio::make_work_guard(io_context_))
    , acceptor_(io_context_)
    , signals_(io_context_, SIGINT, SIGTERM)
{
    PAGESTASH_LOG_DEBUG(component::Server, "Initializing with {} threads on {}:{}",
                        config_.thread_count, config_.bind_address, config_.port);
}

Server::~Server() {
    stop();
    wait();
}

void Server::start(ConnectionHandler handler) {
    if (running_.exchange(true)) {
        PAGESTASH_LOG_WARN(component::Server, "Already running, ignoring start request");
        return;
    }

    connection_handler_ = std::move(handler);
    setup_signal_handling();

    auto fail = [this](const std::string& what, const boost::system::error_code& ec) {
        PAGESTASH_LOG_ERROR(component::Server, "{}: {}", what, ec.message());
        running_ = false;
        throw std::runtime_error(what + ": " + ec.message());
    };

    boost::system::error_code ec;
    auto address = asio::ip::make_address(config_.bind_address, ec);
    if (ec) {
        fail("Invalid bind address '" + config_.bind_address + "'", ec);
    }
    tcp::endpoint endpoint(address, config_.port);

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        fail("Failed to open acceptor", ec);
    }

    acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (ec) {
        PAGESTASH_LOG_WARN(component::Server, "Failed to set reuse_address: {}", ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        fail("Failed to bind to " + config_.bind_address + ":" + std::to_string(config_.port), ec);
    }

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        fail("Failed to listen", ec);
    }

    auto local = acceptor_.local_endpoint(ec);
    if (ec) {
        fail("Failed to query bound endpoint", ec);
    }
    bound_port_ = local.port();
    PAGESTASH_LOG_INFO(component::Server, "Listening on {}:{}", config_.bind_address, bound_port_.load());

    do_accept();

    thread_pool_.reserve(config_.thread_count);
    for (std::size_t i = 0; i < config_.thread_count; ++i) {
        thread_pool_.emplace_back([this](std::stop_token st) {
            run_io_context(st);
        });
    }

    PAGESTASH_LOG_INFO(component::Server, "Started with {} worker threads", config_.thread_count);
}

void Server::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    PAGESTASH_LOG_INFO(component::Server, "Initiating graceful shutdown...");

    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        PAGESTASH_LOG_WARN(component::Server, "Error closing acceptor: {}", ec.message());
    }

    signals_.cancel(ec);
    work_guard_.reset();

    for (auto& thread : thread_pool_) {
        thread.request_stop();
    }
    io_context_.stop();
}

void Server::wait() {
    for (auto& thread : thread_pool_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    if (!thread_pool_.empty()) {
        thread_pool_.clear();
        PAGESTASH_LOG_INFO(component::Server, "All worker threads terminated");
    }
}

void Server::run_io_context(std::stop_token stop_token) {
    while (!stop_token.stop_requested()) {
        try {
            io_context_.run();
            break;
        } catch (const std::exception& e) {
            PAGESTASH_LOG_ERROR(component::Server, "Exception in worker thread: {}", e.what());
        }
    }
}

void Server::do_accept() {
    if (!running_) {
        return;
    }

    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!running_) {
                return;
            }

            if (ec) {
                if (ec == asio::error::operation_aborted) {
                    return;
                }
                PAGESTASH_LOG_ERROR(component::Server, "Accept error: {}", ec.message());
                do_accept();
                return;
            }

            ++connections_accepted_;
            PAGESTASH_LOG_TRACE(component::Server, "Connection #{} accepted", connections_accepted_.load());

            if (connection_handler_) {
                try {
                    connection_handler_(std::move(socket));
                } catch (const std::exception& e) {
                    PAGESTASH_LOG_ERROR(component::Server, "Connection handler exception: {}", e.what());
                }
            }

            do_accept();
        }
    );
}

void Server::setup_signal_handling() {
    signals_.async_wait([this](boost::system::error_code ec, int signal_number) {
        if (ec) {
            return;
        }
        PAGESTASH_LOG_INFO(component::Server, "Received signal {} - initiating shutdown", signal_number);
        stop();
    });
}

} // namespace pagestash::server
