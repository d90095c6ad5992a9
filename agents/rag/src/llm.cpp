#include "../include/llm.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static std::string strip_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

// Transport failures keep their kind; non-2xx and bad bodies are reported
// against the endpoint that produced them.
static json post_model(const std::string& url, const json& body, long timeout_ms,
                       const std::map<std::string, std::string>& headers = {}) {
    HttpResponse r;
    try {
        r = http_post_json(url, body.dump(), timeout_ms, headers);
    } catch (const BackendError& e) {
        throw GenerationError(e.kind(), e.what());
    }
    if (r.status < 200 || r.status >= 300) {
        throw GenerationError(BackendErrorKind::Unavailable,
                              url + " failed: status " + std::to_string(r.status));
    }
    auto data = json::parse(r.body, nullptr, false);
    if (data.is_discarded()) {
        throw GenerationError(BackendErrorKind::InvalidResponse, url + " returned invalid JSON");
    }
    return data;
}

static std::vector<float> to_vector(const json& arr, const std::string& what) {
    if (!arr.is_array() || arr.empty()) {
        throw GenerationError(BackendErrorKind::InvalidResponse, what + ": missing embedding");
    }
    std::vector<float> vec;
    vec.reserve(arr.size());
    for (auto& v : arr) {
        if (!v.is_number()) throw GenerationError(BackendErrorKind::InvalidResponse, what + ": non-numeric embedding");
        vec.push_back(v.get<float>());
    }
    return vec;
}

static json chat_messages(const std::string& system_prompt, const std::string& user_prompt) {
    json messages = json::array();
    if (!system_prompt.empty()) messages.push_back(json{{"role", "system"}, {"content", system_prompt}});
    messages.push_back(json{{"role", "user"}, {"content", user_prompt}});
    return messages;
}

OllamaClient::OllamaClient(LlmConfig cfg) : cfg_(std::move(cfg)) {
    cfg_.base_url = strip_slash(cfg_.base_url.empty() ? "http://localhost:11434" : cfg_.base_url);
}

std::string OllamaClient::complete(const std::string& system_prompt, const std::string& user_prompt) {
    json body = {
        {"model", cfg_.model},
        {"stream", false},
        {"messages", chat_messages(system_prompt, user_prompt)}
    };
    auto data = post_model(cfg_.base_url + "/api/chat", body, cfg_.timeout_ms);
    const json::json_pointer ptr("/message/content");
    if (!data.contains(ptr) || !data.at(ptr).is_string()) {
        throw GenerationError(BackendErrorKind::InvalidResponse, "ollama chat: missing message.content");
    }
    return data.at(ptr).get<std::string>();
}

std::vector<float> OllamaClient::embed(const std::string& text) {
    json body = {
        {"model", cfg_.model},
        {"prompt", text}
    };
    auto data = post_model(cfg_.base_url + "/api/embeddings", body, cfg_.timeout_ms);
    return to_vector(data.value("embedding", json()), "ollama embeddings");
}

OpenAiClient::OpenAiClient(LlmConfig cfg) : cfg_(std::move(cfg)) {
    cfg_.base_url = strip_slash(cfg_.base_url.empty() ? "https://api.openai.com/v1" : cfg_.base_url);
}

std::string OpenAiClient::complete(const std::string& system_prompt, const std::string& user_prompt) {
    json body = {
        {"model", cfg_.model},
        {"messages", chat_messages(system_prompt, user_prompt)}
    };
    std::map<std::string, std::string> headers;
    if (!cfg_.api_key.empty()) headers["Authorization"] = "Bearer " + cfg_.api_key;
    auto data = post_model(cfg_.base_url + "/chat/completions", body, cfg_.timeout_ms, headers);
    const json::json_pointer ptr("/choices/0/message/content");
    if (!data.contains(ptr) || !data.at(ptr).is_string()) {
        throw GenerationError(BackendErrorKind::InvalidResponse, "openai chat: missing choices[0].message.content");
    }
    return data.at(ptr).get<std::string>();
}

std::vector<float> OpenAiClient::embed(const std::string& text) {
    json body = {
        {"model", cfg_.model},
        {"input", text}
    };
    std::map<std::string, std::string> headers;
    if (!cfg_.api_key.empty()) headers["Authorization"] = "Bearer " + cfg_.api_key;
    auto data = post_model(cfg_.base_url + "/embeddings", body, cfg_.timeout_ms, headers);
    const json::json_pointer ptr("/data/0/embedding");
    return to_vector(data.contains(ptr) ? data.at(ptr) : json(), "openai embeddings");
}

std::optional<LlmKind> parse_llm_kind(const std::string& s) {
    auto v = to_lower(trim(s));
    if (v.empty() || v == "ollama") return LlmKind::Ollama;
    if (v == "openai") return LlmKind::OpenAi;
    return std::nullopt;
}

std::unique_ptr<LanguageModel> make_language_model(const LlmConfig& cfg) {
    switch (cfg.kind) {
        case LlmKind::Ollama: return std::make_unique<OllamaClient>(cfg);
        case LlmKind::OpenAi: return std::make_unique<OpenAiClient>(cfg);
    }
    return nullptr;
}
