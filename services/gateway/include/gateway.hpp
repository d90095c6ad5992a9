#pragma once
#include "auth.hpp"
#include "rate_limiter.hpp"
#include "config_store.hpp"
#include "orchestrator.hpp"
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <chrono>
#include <cstddef>
#include <string>

struct GatewayConfig {
    std::string address{"127.0.0.1"};
    unsigned short port{4000};
    AuthConfig auth;
    std::size_t max_message_bytes{1024 * 1024};
    double connections_per_sec{10};
    std::chrono::seconds handshake_timeout{30};
};

// WebSocket listener. Each connection is one coroutine on its own strand:
// handshake auth, then read, answer and write strictly in turn.
class Gateway {
public:
    using WebSocket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    Gateway(boost::asio::io_context& ioc, GatewayConfig cfg, Orchestrator& orchestrator, ConfigStore& config);

    // Binds, listens and starts accepting. Throws boost::system::system_error.
    void start();
    void stop();
    unsigned short port() const { return bound_port_; }

private:
    boost::asio::awaitable<void> accept_loop();
    boost::asio::awaitable<void> session(boost::asio::ip::tcp::socket socket);
    boost::asio::awaitable<void> serve(WebSocket& ws, const std::string& peer, const std::string& conversation_id);

    boost::asio::io_context& ioc_;
    GatewayConfig cfg_;
    Orchestrator& orchestrator_;
    ConfigStore& config_;
    boost::asio::ip::tcp::acceptor acceptor_;
    ConnectionRateLimiter limiter_;
    unsigned short bound_port_{0};
};
