#include "../include/prompt_config.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static const char* kRequiredQueryTemplates[] = {
    "rag_topic_inference",
    "fallback_topic_resolver",
    "rag_final_answer",
};

static IntentAction parse_action(const std::string& intent, const std::string& action) {
    if (action == "direct_response") return IntentAction::DirectResponse;
    if (action == "call_rag_tool") return IntentAction::RetrievalAugmented;
    if (action == "general_llm_call") return IntentAction::GeneralChat;
    throw ConfigError(ConfigErrorKind::Invalid, "intent '" + intent + "': unknown action '" + action + "'");
}

static std::map<std::string, std::string> string_map(const json& root, const char* key) {
    std::map<std::string, std::string> out;
    if (!root.contains(key)) return out;
    const auto& obj = root.at(key);
    if (!obj.is_object()) {
        throw ConfigError(ConfigErrorKind::Invalid, std::string(key) + " must be an object");
    }
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!it.value().is_string()) {
            throw ConfigError(ConfigErrorKind::Invalid, std::string(key) + "." + it.key() + " must be a string");
        }
        out[it.key()] = it.value().get<std::string>();
    }
    return out;
}

PromptConfig parse_prompt_config(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ConfigError(ConfigErrorKind::Invalid, std::string("prompt config is not valid JSON: ") + e.what());
    }
    if (!root.is_object()) throw ConfigError(ConfigErrorKind::Invalid, "prompt config must be a JSON object");

    PromptConfig cfg;
    cfg.core_prompts = string_map(root, "core_prompts");
    cfg.query_templates = string_map(root, "query_templates");
    cfg.response_templates = string_map(root, "response_templates");

    for (const char* name : kRequiredQueryTemplates) {
        if (!cfg.query_templates.count(name)) {
            throw ConfigError(ConfigErrorKind::Invalid, std::string("missing query_templates.") + name);
        }
    }

    if (root.contains("intents")) {
        const auto& intents = root.at("intents");
        if (!intents.is_object()) throw ConfigError(ConfigErrorKind::Invalid, "intents must be an object");
        for (auto it = intents.begin(); it != intents.end(); ++it) {
            const auto& j = it.value();
            if (!j.is_object()) {
                throw ConfigError(ConfigErrorKind::Invalid, "intent '" + it.key() + "' must be an object");
            }
            IntentDefinition def;
            try {
                def.description = j.value("description", std::string());
                def.action = parse_action(it.key(), j.value("action", std::string("call_rag_tool")));
                for (const auto& kw : j.value("keywords", json::array())) {
                    auto norm = normalize_query(kw.get<std::string>());
                    if (!norm.empty()) def.keywords.push_back(norm);
                }
                def.template_name = j.value("template", std::string());
            } catch (const json::exception& e) {
                throw ConfigError(ConfigErrorKind::Invalid, "intent '" + it.key() + "': " + e.what());
            }
            switch (def.action) {
                case IntentAction::DirectResponse:
                    if (def.template_name.empty()) def.template_name = it.key();
                    if (!cfg.response_templates.count(def.template_name)) {
                        throw ConfigError(ConfigErrorKind::Invalid,
                                          "intent '" + it.key() + "': missing response_templates." + def.template_name);
                    }
                    break;
                case IntentAction::RetrievalAugmented:
                    if (def.template_name.empty()) def.template_name = "rag_final_answer";
                    if (!cfg.query_templates.count(def.template_name)) {
                        throw ConfigError(ConfigErrorKind::Invalid,
                                          "intent '" + it.key() + "': missing query_templates." + def.template_name);
                    }
                    break;
                case IntentAction::GeneralChat:
                    if (def.template_name.empty()) def.template_name = "general_chat";
                    break;
            }
            cfg.intents.emplace(it.key(), std::move(def));
        }
    }
    return cfg;
}

IndexSchema parse_index_schema(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ConfigError(ConfigErrorKind::Invalid, std::string("index schema is not valid JSON: ") + e.what());
    }
    const json* list = &root;
    if (root.is_object()) {
        if (!root.contains("indexes")) throw ConfigError(ConfigErrorKind::Invalid, "index schema has no 'indexes'");
        list = &root.at("indexes");
    }
    if (!list->is_array()) throw ConfigError(ConfigErrorKind::Invalid, "indexes must be an array");

    IndexSchema schema;
    try {
        for (const auto& j : *list) {
            IndexDefinition def;
            def.name = to_lower(trim(j.at("name").get<std::string>()));
            if (def.name.empty()) throw ConfigError(ConfigErrorKind::Invalid, "index with empty name");
            def.fields = j.value("fields", std::vector<std::string>{});
            def.description = j.value("description", std::string());
            schema.indexes.push_back(std::move(def));
        }
    } catch (const json::exception& e) {
        throw ConfigError(ConfigErrorKind::Invalid, std::string("index schema: ") + e.what());
    }
    return schema;
}

const IndexDefinition* IndexSchema::find(const std::string& name) const {
    auto key = to_lower(trim(name));
    for (const auto& idx : indexes) {
        if (idx.name == key) return &idx;
    }
    return nullptr;
}

std::string IndexSchema::to_json() const {
    json arr = json::array();
    for (const auto& idx : indexes) {
        json j = {{"name", idx.name}, {"fields", idx.fields}};
        if (!idx.description.empty()) j["description"] = idx.description;
        arr.push_back(j);
    }
    return arr.dump();
}

std::string IndexSchema::summary() const {
    std::string out;
    for (const auto& idx : indexes) {
        out += "- " + idx.name + ": fields=";
        for (size_t i = 0; i < idx.fields.size(); ++i) {
            if (i) out += ", ";
            out += idx.fields[i];
        }
        out += "\n";
    }
    return out;
}

static bool contains_sequence(const std::vector<std::string>& words, const std::vector<std::string>& seq) {
    if (seq.empty() || seq.size() > words.size()) return false;
    for (size_t i = 0; i + seq.size() <= words.size(); ++i) {
        bool ok = true;
        for (size_t j = 0; j < seq.size() && ok; ++j) ok = words[i + j] == seq[j];
        if (ok) return true;
    }
    return false;
}

std::optional<IntentMatch> match_intent(const PromptConfig& cfg, const std::string& normalized_query) {
    auto words = split_words(normalized_query);
    std::optional<IntentMatch> best;
    size_t best_len = 0;
    // std::map iterates by name, so the first longest match wins ties.
    for (const auto& kv : cfg.intents) {
        for (const auto& kw : kv.second.keywords) {
            if (kw.size() <= best_len) continue;
            if (contains_sequence(words, split_words(kw))) {
                best = IntentMatch{kv.first, &kv.second};
                best_len = kw.size();
            }
        }
    }
    return best;
}

std::string intent_descriptions(const PromptConfig& cfg) {
    std::string out;
    for (const auto& kv : cfg.intents) {
        if (!out.empty()) out += "\n";
        out += "- " + kv.first + ": " + kv.second.description;
    }
    return out;
}

std::string render_template(const std::string& tmpl, const std::map<std::string, std::string>& vars) {
    std::string out;
    out.reserve(tmpl.size());
    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t open = tmpl.find('{', pos);
        if (open == std::string::npos) break;
        size_t close = tmpl.find('}', open + 1);
        if (close == std::string::npos) break;
        out.append(tmpl, pos, open - pos);
        auto it = vars.find(tmpl.substr(open + 1, close - open - 1));
        if (it != vars.end()) {
            out += it->second;
            pos = close + 1;
        } else {
            out.push_back('{');
            pos = open + 1;
        }
    }
    out.append(tmpl, pos, std::string::npos);
    return out;
}

std::string core_prompt_or(const PromptConfig& cfg, const std::string& name, const std::string& def) {
    auto it = cfg.core_prompts.find(name);
    return it == cfg.core_prompts.end() ? def : it->second;
}

const char* to_string(IntentAction action) {
    switch (action) {
        case IntentAction::DirectResponse: return "direct_response";
        case IntentAction::RetrievalAugmented: return "call_rag_tool";
        case IntentAction::GeneralChat: return "general_llm_call";
    }
    return "unknown";
}
