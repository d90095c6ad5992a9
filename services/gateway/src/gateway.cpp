#include "../include/gateway.hpp"
#include "../include/message_codec.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

static std::string peer_name(const tcp::socket& socket) {
    beast::error_code ec;
    auto ep = socket.remote_endpoint(ec);
    if (ec) return "unknown";
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

static asio::awaitable<void> send_http(beast::tcp_stream& stream, const http::request<http::string_body>& req,
                                       http::status status, std::string body) {
    http::response<http::string_body> res{status, req.version()};
    res.set(http::field::server, "rag_gateway");
    res.set(http::field::content_type, "text/plain");
    res.keep_alive(false);
    res.body() = std::move(body);
    res.prepare_payload();
    beast::error_code ec;
    co_await http::async_write(stream, res, asio::redirect_error(asio::use_awaitable, ec));
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

Gateway::Gateway(asio::io_context& ioc, GatewayConfig cfg, Orchestrator& orchestrator, ConfigStore& config)
    : ioc_(ioc),
      cfg_(std::move(cfg)),
      orchestrator_(orchestrator),
      config_(config),
      acceptor_(ioc),
      limiter_(cfg_.connections_per_sec) {}

void Gateway::start() {
    tcp::endpoint ep{asio::ip::make_address(cfg_.address), cfg_.port};
    acceptor_.open(ep.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(ep);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    bound_port_ = acceptor_.local_endpoint().port();
    spdlog::info("Gateway listening on ws://{}:{}{}", cfg_.address, bound_port_,
                 cfg_.auth.secret.empty() ? " (authentication disabled)" : "");
    asio::co_spawn(ioc_, accept_loop(), [](std::exception_ptr e) {
        if (!e) return;
        try {
            std::rethrow_exception(e);
        } catch (const std::exception& ex) {
            spdlog::error("Accept loop stopped: {}", ex.what());
        }
    });
}

void Gateway::stop() {
    asio::post(ioc_, [this] {
        beast::error_code ec;
        acceptor_.close(ec);
    });
}

asio::awaitable<void> Gateway::accept_loop() {
    while (acceptor_.is_open()) {
        beast::error_code ec;
        tcp::socket socket = co_await acceptor_.async_accept(asio::make_strand(ioc_),
                                                             asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            if (ec == asio::error::operation_aborted) break;
            spdlog::warn("Accept failed: {}", ec.message());
            continue;
        }
        if (!limiter_.try_acquire()) {
            spdlog::warn("Global connection rate limit exceeded for {}. Dropping connection.", peer_name(socket));
            socket.close(ec);
            continue;
        }
        auto ex = socket.get_executor();
        asio::co_spawn(ex, session(std::move(socket)), [](std::exception_ptr e) {
            if (!e) return;
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                spdlog::error("Connection task failed: {}", ex.what());
            }
        });
    }
}

asio::awaitable<void> Gateway::session(tcp::socket socket) {
    const std::string peer = peer_name(socket);
    beast::error_code ec;
    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;
    http::request<http::string_body> req;

    stream.expires_after(cfg_.handshake_timeout);
    co_await http::async_read(stream, buffer, req, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        spdlog::warn("Handshake read from {} failed: {}", peer, ec.message());
        co_return;
    }
    if (!websocket::is_upgrade(req)) {
        co_await send_http(stream, req, http::status::bad_request, "websocket upgrade required");
        co_return;
    }

    auto status = authenticate(cfg_.auth, parse_query_string(std::string(req.target())), unix_now());
    if (status != AuthStatus::Ok) {
        spdlog::warn("Rejected handshake from {}: {}", peer, to_string(status));
        co_await send_http(stream, req, http::status::unauthorized, to_string(status));
        co_return;
    }

    stream.expires_never();
    WebSocket ws(std::move(stream));
    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "rag_gateway");
    }));
    ws.read_message_max(cfg_.max_message_bytes);
    co_await ws.async_accept(req, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        spdlog::warn("WebSocket accept for {} failed: {}", peer, ec.message());
        co_return;
    }

    const std::string conversation_id = random_id();
    spdlog::info("New WebSocket connection {} (conversation {})", peer, conversation_id);
    co_await serve(ws, peer, conversation_id);
    spdlog::info("Connection {} closed", peer);
}

asio::awaitable<void> Gateway::serve(WebSocket& ws, const std::string& peer, const std::string& conversation_id) {
    beast::error_code ec;
    for (;;) {
        beast::flat_buffer buffer;
        co_await ws.async_read(buffer, asio::redirect_error(asio::use_awaitable, ec));
        if (ec == websocket::error::closed) co_return;
        if (ec == websocket::error::message_too_big) {
            // The transport has already answered with close code 1009.
            spdlog::error("Protocol error from {}: message exceeds {} bytes", peer, cfg_.max_message_bytes);
            co_return;
        }
        if (ec) {
            spdlog::warn("Read from {} failed: {}", peer, ec.message());
            co_return;
        }
        if (!ws.got_text()) {
            spdlog::warn("Ignoring binary message from {}", peer);
            continue;
        }

        InboundMessage msg;
        std::string protocol_error;
        try {
            msg = decode_message(beast::buffers_to_string(buffer.data()), cfg_.max_message_bytes);
        } catch (const ProtocolError& e) {
            protocol_error = e.what();
        }
        if (!protocol_error.empty()) {
            spdlog::error("Protocol error from {}: {}", peer, protocol_error);
            std::string out = encode_error(protocol_error, Encoding::Json);
            ws.text(true);
            co_await ws.async_write(asio::buffer(out), asio::redirect_error(asio::use_awaitable, ec));
            co_await ws.async_close(websocket::close_code::policy_error,
                                    asio::redirect_error(asio::use_awaitable, ec));
            co_return;
        }

        const SnapshotPtr snapshot = config_.current();
        std::string reply;
        try {
            Reply r = co_await orchestrator_.handle(Query{msg.content, conversation_id}, snapshot);
            reply = encode_response(r.text, msg.encoding);
        } catch (const GenerationError&) {
            reply = encode_error(generation_failure_text(*snapshot->prompts), msg.encoding);
        } catch (const std::exception& e) {
            spdlog::error("Request from {} failed: {}", peer, e.what());
            reply = encode_error(generation_failure_text(*snapshot->prompts), msg.encoding);
        }

        // A reply for a connection that went away is dropped; the pipeline's
        // cache and history writes have already completed.
        ws.text(true);
        co_await ws.async_write(asio::buffer(reply), asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            spdlog::info("Discarding reply for {}: {}", peer, ec.message());
            co_return;
        }
    }
}
