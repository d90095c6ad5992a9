#pragma once
#include "config_store.hpp"
#include <map>
#include <string>

struct AdminResponse {
    unsigned int status{200};
    std::string body;
};

// Routes of the admin listener, independent of the HTTP transport.
AdminResponse handle_admin_request(ConfigStore& config, const std::string& method, const std::string& path,
                                   const std::map<std::string, std::string>& query);

std::string reload_report_json(const ReloadReport& report);

// libmicrohttpd listener for the admin routes. No authentication.
class AdminServer {
public:
    AdminServer(unsigned short port, ConfigStore& config);
    ~AdminServer();

    AdminServer(const AdminServer&) = delete;
    AdminServer& operator=(const AdminServer&) = delete;

    // Throws std::runtime_error when the daemon cannot start.
    void start();
    void stop();

    ConfigStore& config() { return config_; }

private:
    unsigned short port_;
    ConfigStore& config_;
    struct MHD_Daemon* daemon_ {nullptr};
};
