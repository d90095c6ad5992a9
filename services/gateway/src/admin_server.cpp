#include "../include/admin_server.hpp"
#include <microhttpd.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstring>
#include <stdexcept>

using json = nlohmann::json;

#if MHD_VERSION >= 0x00097002
using MhdResult = MHD_Result;
#else
using MhdResult = int;
#endif

std::string reload_report_json(const ReloadReport& report) {
    json details = json::array();
    json sources = json::object();
    for (const auto& o : report.outcomes) {
        details.push_back(o.detail);
        sources[o.source] = {{"status", to_string(o.status)}, {"detail", o.detail}};
    }
    json out = {
        {"success", report.success},
        {"message", report.success ? "Prompts reloaded" : "Reload failed for one or more sources"},
        {"details", details},
        {"sources", sources},
        {"version", report.version}
    };
    return out.dump();
}

static std::string config_json(const ConfigSnapshot& snap) {
    json indexes = json::array();
    for (const auto& idx : snap.schema->indexes) indexes.push_back(idx.name);
    json intents = json::array();
    for (const auto& kv : snap.prompts->intents) {
        intents.push_back({{"name", kv.first}, {"action", to_string(kv.second.action)}});
    }
    json out = {
        {"version", snap.version},
        {"prompts_origin", snap.prompts_origin},
        {"loaded_at", snap.loaded_at},
        {"indexes", indexes},
        {"intents", intents}
    };
    return out.dump();
}

AdminResponse handle_admin_request(ConfigStore& config, const std::string& method, const std::string& path,
                                   const std::map<std::string, std::string>& query) {
    if (path == "/api/reload-prompts" && (method == "GET" || method == "POST")) {
        auto it = query.find("source");
        auto source = parse_reload_source(it == query.end() ? "" : it->second);
        if (!source) {
            json err = {{"success", false}, {"message", "source must be local, remote or omitted"}};
            return {400, err.dump()};
        }
        auto report = config.reload(*source);
        return {report.success ? 200u : 400u, reload_report_json(report)};
    }
    if (method == "GET" && path == "/api/config") {
        return {200, config_json(*config.current())};
    }
    if (method == "GET" && path == "/healthz") {
        return {200, json({{"ok", true}}).dump()};
    }
    return {404, json({{"error", "not found"}}).dump()};
}

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

static MhdResult send_response(struct MHD_Connection* conn, unsigned int status, const std::string& body,
                               const char* ctype = "application/json") {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MHD_add_response_header(resp, "Access-Control-Allow-Origin", "*");
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static std::map<std::string, std::string> parse_query(struct MHD_Connection* conn) {
    std::map<std::string, std::string> out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> MhdResult {
            auto* m = static_cast<std::map<std::string, std::string>*>(cls);
            (*m)[key ? key : ""] = val ? val : "";
            return MHD_YES;
        }, &out);
    return out;
}

static MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    auto* server = static_cast<AdminServer*>(cls);
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (0 == strcmp(method, MHD_HTTP_METHOD_POST)) {
        if (*upload_data_size) {
            ci->body.append(upload_data, *upload_data_size);
            *upload_data_size = 0;
            return MHD_YES;
        }
    }

    try {
        auto res = handle_admin_request(server->config(), ci->method, ci->url, parse_query(connection));
        spdlog::info("Admin {} {} -> {}", ci->method, ci->url, res.status);
        return send_response(connection, res.status, res.body);
    } catch (const std::exception& e) {
        spdlog::error("Admin {} {} failed: {}", ci->method, ci->url, e.what());
        json err = {{"success", false}, {"message", e.what()}};
        return send_response(connection, MHD_HTTP_INTERNAL_SERVER_ERROR, err.dump());
    }
}

static void request_completed(void* /*cls*/, struct MHD_Connection*, void** con_cls,
                              enum MHD_RequestTerminationCode) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

AdminServer::AdminServer(unsigned short port, ConfigStore& config) : port_(port), config_(config) {}

AdminServer::~AdminServer() {
    stop();
}

void AdminServer::start() {
    daemon_ = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, port_, nullptr, nullptr,
                               &handler, this,
                               MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                               MHD_OPTION_END);
    if (!daemon_) {
        throw std::runtime_error("Failed to start admin HTTP server on port " + std::to_string(port_));
    }
    spdlog::info("Admin API listening on http://0.0.0.0:{}", port_);
}

void AdminServer::stop() {
    if (daemon_) {
        MHD_stop_daemon(daemon_);
        daemon_ = nullptr;
    }
}
