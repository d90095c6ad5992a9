#include "../include/admin_server.hpp"
#include "../include/gateway.hpp"
#include "errors.hpp"
#include "settings.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

static void usage() {
    std::cerr << "rag_gateway usage:\n"
              << "  rag_gateway [--addr host:port] [--http-port N] [--prompts <file>] [--schema <file>]\n"
              << "              [--api-key <secret>] [--log-level <level>]\n"
              << "Settings not given as flags are read from the environment (SERVER_ADDR, HTTP_PORT, ...).\n";
}

static bool split_addr(const std::string& addr, std::string& host, unsigned short& port) {
    auto colon = addr.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == addr.size()) return false;
    try {
        int p = std::stoi(addr.substr(colon + 1));
        if (p < 0 || p > 65535) return false;
        port = (unsigned short)p;
    } catch (const std::logic_error&) {
        return false;
    }
    host = addr.substr(0, colon);
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') host = host.substr(1, host.size() - 2);
    return true;
}

int main(int argc, char** argv) {
    Settings settings;
    try {
        settings = Settings::from_env();
    } catch (const ConfigError& e) {
        std::cerr << "[gateway] " << e.what() << "\n";
        return 2;
    }
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--addr" && i + 1 < argc) settings.server_addr = argv[++i];
        else if (a == "--http-port" && i + 1 < argc) settings.http_port = (unsigned short)std::atoi(argv[++i]);
        else if (a == "--prompts" && i + 1 < argc) settings.prompts_path = argv[++i];
        else if (a == "--schema" && i + 1 < argc) settings.schema_path = argv[++i];
        else if (a == "--api-key" && i + 1 < argc) settings.api_key = argv[++i];
        else if (a == "--log-level" && i + 1 < argc) settings.log_level = argv[++i];
        else { usage(); return a == "--help" || a == "-h" ? 0 : 1; }
    }
    configure_logging(settings.log_level);

    GatewayConfig gw;
    if (!split_addr(settings.server_addr, gw.address, gw.port)) {
        std::cerr << "[gateway] SERVER_ADDR must be host:port, got '" << settings.server_addr << "'\n";
        return 2;
    }
    gw.auth.secret = settings.api_key;
    gw.auth.tolerance_secs = settings.auth_tolerance_secs;
    gw.max_message_bytes = settings.max_message_bytes;
    gw.connections_per_sec = settings.connections_per_sec;

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int rc = 0;
    try {
        std::cout << "[gateway] Starting RAG gateway on " << settings.server_addr << "...\n";
        RagRuntime runtime(settings);
        boost::asio::io_context ioc;
        Gateway gateway(ioc, gw, runtime.orchestrator(), runtime.config());
        gateway.start();

        AdminServer admin(settings.http_port, runtime.config());
        if (settings.http_port != 0) admin.start();

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            spdlog::info("Signal {} received, shutting down", sig);
            gateway.stop();
            admin.stop();
            ioc.stop();
        });

        std::vector<std::thread> threads;
        const std::size_t n = settings.worker_threads;
        for (std::size_t i = 1; i < n; ++i) threads.emplace_back([&ioc] { ioc.run(); });
        ioc.run();
        for (auto& t : threads) t.join();
        // Backend calls still running complete into the stopped io_context.
        runtime.executor().stop();
        runtime.executor().join();
        std::cout << "[gateway] Stopped\n";
    } catch (const ConfigError& e) {
        std::cerr << "[gateway] Configuration error: " << e.what() << "\n";
        rc = 2;
    } catch (const std::exception& e) {
        std::cerr << "[gateway] Failed to start: " << e.what() << std::endl;
        rc = 1;
    }
    curl_global_cleanup();
    return rc;
}
