#include "../include/config_store.hpp"
#include "../include/http.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <system_error>

using json = nlohmann::json;

SnapshotPtr make_snapshot(PromptConfig prompts, IndexSchema schema, std::uint64_t version,
                          const std::string& origin) {
    auto snap = std::make_shared<ConfigSnapshot>();
    snap->prompts = std::make_shared<const PromptConfig>(std::move(prompts));
    snap->schema = std::make_shared<const IndexSchema>(std::move(schema));
    snap->version = version;
    snap->prompts_origin = origin;
    snap->loaded_at = unix_now();
    return snap;
}

std::optional<ReloadSource> parse_reload_source(const std::string& s) {
    auto v = to_lower(trim(s));
    if (v.empty() || v == "both" || v == "all") return ReloadSource::Both;
    if (v == "local") return ReloadSource::Local;
    if (v == "remote") return ReloadSource::Remote;
    return std::nullopt;
}

const char* to_string(SourceStatus status) {
    switch (status) {
        case SourceStatus::Reloaded: return "reloaded";
        case SourceStatus::Unchanged: return "unchanged";
        case SourceStatus::Disabled: return "disabled";
        case SourceStatus::Failed: return "failed";
    }
    return "unknown";
}

HttpRemoteConfigSource::HttpRemoteConfigSource(std::string url, std::string bearer_token, long timeout_ms)
    : url_(std::move(url)), token_(std::move(bearer_token)), timeout_ms_(timeout_ms) {}

std::optional<RemoteDocument> HttpRemoteConfigSource::fetch() {
    HttpRequest req;
    req.url = url_;
    req.timeout_ms = timeout_ms_;
    req.headers["Accept"] = "application/json";
    if (!token_.empty()) req.headers["Authorization"] = "Bearer " + token_;
    {
        std::lock_guard<std::mutex> lock(etag_mtx_);
        if (!etag_.empty()) req.headers["If-None-Match"] = etag_;
    }

    HttpResponse resp;
    try {
        resp = http_send(req);
    } catch (const BackendError& e) {
        throw ConfigError(ConfigErrorKind::SourceUnavailable, e.what());
    }
    if (resp.status == 304) return std::nullopt;
    if (resp.status != 200) {
        throw ConfigError(ConfigErrorKind::SourceUnavailable,
                          "remote config returned status " + std::to_string(resp.status));
    }
    RemoteDocument doc;
    doc.prompts_json = extract_remote_prompts(resp.body);
    auto it = resp.headers.find("etag");
    if (it != resp.headers.end()) doc.etag = it->second;
    return doc;
}

void HttpRemoteConfigSource::commit(const RemoteDocument& doc) {
    if (doc.etag.empty()) return;
    std::lock_guard<std::mutex> lock(etag_mtx_);
    etag_ = doc.etag;
}

std::string extract_remote_prompts(const std::string& body) {
    json root;
    try {
        root = json::parse(body);
    } catch (const json::parse_error& e) {
        throw ConfigError(ConfigErrorKind::Invalid, std::string("remote config is not valid JSON: ") + e.what());
    }
    if (root.is_object() && root.contains("parameters")) {
        const json::json_pointer ptr("/parameters/prompts/defaultValue/value");
        if (!root.contains(ptr) || !root.at(ptr).is_string()) {
            throw ConfigError(ConfigErrorKind::Invalid,
                              "missing parameters.prompts.defaultValue.value in remote config");
        }
        return root.at(ptr).get<std::string>();
    }
    return body;
}

ConfigStore::ConfigStore(ConfigPaths paths, std::unique_ptr<RemoteConfigSource> remote)
    : paths_(std::move(paths)), remote_(std::move(remote)) {
    auto local = read_local();
    PromptConfig prompts = std::move(local.prompts);
    std::string origin = "local";
    if (remote_) {
        try {
            if (auto doc = remote_->fetch()) {
                prompts = parse_prompt_config(doc->prompts_json);
                remote_->commit(*doc);
                origin = "remote";
                spdlog::info("Loaded prompt configuration from remote source");
            }
        } catch (const ConfigError& e) {
            spdlog::warn("Remote prompts unavailable, using local file {}: {}", paths_.prompts.string(), e.what());
        }
    }
    prompts_mtime_ = local.prompts_mtime;
    schema_mtime_ = local.schema_mtime;
    current_.store(make_snapshot(std::move(prompts), std::move(local.schema), 1, origin));
    spdlog::info("Configuration loaded (prompts: {}, schema: {})", origin, paths_.schema.string());
}

ConfigStore::ConfigStore(SnapshotPtr initial) {
    if (!initial || !initial->prompts || !initial->schema) {
        throw ConfigError(ConfigErrorKind::Invalid, "initial snapshot is incomplete");
    }
    current_.store(std::move(initial));
}

ConfigStore::LocalFiles ConfigStore::read_local() const {
    if (paths_.prompts.empty() || paths_.schema.empty()) {
        throw ConfigError(ConfigErrorKind::SourceUnavailable, "local config paths are not set");
    }
    LocalFiles out;
    std::string prompts_text, schema_text;
    std::error_code ec;
    out.prompts_mtime = std::filesystem::last_write_time(paths_.prompts, ec);
    if (ec) throw ConfigError(ConfigErrorKind::SourceUnavailable, paths_.prompts.string() + ": " + ec.message());
    out.schema_mtime = std::filesystem::last_write_time(paths_.schema, ec);
    if (ec) throw ConfigError(ConfigErrorKind::SourceUnavailable, paths_.schema.string() + ": " + ec.message());
    try {
        prompts_text = read_text_file(paths_.prompts);
        schema_text = read_text_file(paths_.schema);
    } catch (const std::runtime_error& e) {
        throw ConfigError(ConfigErrorKind::SourceUnavailable, e.what());
    }
    out.prompts = parse_prompt_config(prompts_text);
    out.schema = parse_index_schema(schema_text);
    return out;
}

bool ConfigStore::local_unchanged() {
    std::optional<std::filesystem::file_time_type> prompts_seen, schema_seen;
    {
        std::lock_guard<std::mutex> lock(reload_mtx_);
        prompts_seen = prompts_mtime_;
        schema_seen = schema_mtime_;
    }
    if (!prompts_seen || !schema_seen) return false;
    std::error_code e1, e2;
    auto p = std::filesystem::last_write_time(paths_.prompts, e1);
    auto s = std::filesystem::last_write_time(paths_.schema, e2);
    return !e1 && !e2 && p == *prompts_seen && s == *schema_seen;
}

ReloadReport ConfigStore::reload(ReloadSource source) {
    const bool want_local = source == ReloadSource::Local || source == ReloadSource::Both;
    const bool want_remote = source == ReloadSource::Remote || source == ReloadSource::Both;
    ReloadReport report;

    SourceOutcome local_out{"local"};
    std::optional<LocalFiles> staged_local;
    std::uint64_t local_ticket = 0;
    if (want_local) {
        local_ticket = ++local_tickets_;
        if (local_unchanged()) {
            local_out.status = SourceStatus::Unchanged;
            local_out.detail = "Local unchanged";
        } else {
            try {
                staged_local = read_local();
                local_out.status = SourceStatus::Reloaded;
                local_out.detail = "Local reloaded";
            } catch (const ConfigError& e) {
                local_out.status = SourceStatus::Failed;
                local_out.error = e.kind();
                local_out.detail = std::string("Local error: ") + e.what();
            }
        }
    }

    SourceOutcome remote_out{"remote"};
    std::optional<RemoteDocument> remote_doc;
    std::optional<PromptConfig> staged_remote;
    std::uint64_t remote_ticket = 0;
    if (want_remote) {
        if (!remote_) {
            remote_out.status = SourceStatus::Disabled;
            remote_out.detail = "Remote disabled";
        } else {
            remote_ticket = ++remote_tickets_;
            try {
                remote_doc = remote_->fetch();
                if (remote_doc) {
                    staged_remote = parse_prompt_config(remote_doc->prompts_json);
                    remote_out.status = SourceStatus::Reloaded;
                    remote_out.detail = "Remote reloaded";
                } else {
                    remote_out.status = SourceStatus::Unchanged;
                    remote_out.detail = "Remote unchanged";
                }
            } catch (const ConfigError& e) {
                remote_doc.reset();
                remote_out.status = SourceStatus::Failed;
                remote_out.error = e.kind();
                remote_out.detail = std::string("Remote error: ") + e.what();
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(reload_mtx_);
        const SnapshotPtr base = current();
        std::shared_ptr<const PromptConfig> prompts = base->prompts;
        std::shared_ptr<const IndexSchema> schema = base->schema;
        std::string origin = base->prompts_origin;
        bool changed = false;

        if (staged_local) {
            if (local_ticket < applied_local_ticket_) {
                local_out.status = SourceStatus::Unchanged;
                local_out.detail = "Local superseded by a newer reload";
            } else {
                applied_local_ticket_ = local_ticket;
                schema = std::make_shared<const IndexSchema>(std::move(staged_local->schema));
                // Local only supplies the schema while remote prompts are current.
                const bool keep_remote = base->prompts_origin == "remote" && want_remote &&
                                         remote_out.status == SourceStatus::Unchanged;
                if (!keep_remote) {
                    prompts = std::make_shared<const PromptConfig>(std::move(staged_local->prompts));
                    origin = "local";
                }
                prompts_mtime_ = staged_local->prompts_mtime;
                schema_mtime_ = staged_local->schema_mtime;
                changed = true;
            }
        }

        if (staged_remote) {
            if (remote_ticket < applied_remote_ticket_) {
                remote_out.status = SourceStatus::Unchanged;
                remote_out.detail = "Remote superseded by a newer fetch";
            } else {
                applied_remote_ticket_ = remote_ticket;
                prompts = std::make_shared<const PromptConfig>(std::move(*staged_remote));
                origin = "remote";
                changed = true;
                remote_->commit(*remote_doc);
            }
        }

        if (changed) {
            auto next = std::make_shared<ConfigSnapshot>();
            next->prompts = std::move(prompts);
            next->schema = std::move(schema);
            next->version = base->version + 1;
            next->prompts_origin = origin;
            next->loaded_at = unix_now();
            current_.store(std::move(next), std::memory_order_release);
            spdlog::info("Configuration snapshot replaced (version {})", base->version + 1);
        }
        report.version = current()->version;
    }

    if (want_local) report.outcomes.push_back(std::move(local_out));
    if (want_remote) report.outcomes.push_back(std::move(remote_out));
    for (const auto& o : report.outcomes) {
        if (o.status == SourceStatus::Failed) {
            report.success = false;
            spdlog::warn("Reload {}: {}", o.source, o.detail);
        } else {
            spdlog::info("Reload {}: {}", o.source, o.detail);
        }
    }
    return report;
}
