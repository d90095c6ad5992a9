#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class IntentAction {
    DirectResponse, // answer with a response_templates entry, no retrieval
    RetrievalAugmented,
    GeneralChat,
};

struct IntentDefinition {
    std::string description;
    std::vector<std::string> keywords; // normalized on load
    IntentAction action{IntentAction::RetrievalAugmented};
    std::string template_name;
};

// Immutable after parse; reload builds a new one.
struct PromptConfig {
    std::map<std::string, IntentDefinition> intents;
    std::map<std::string, std::string> core_prompts;
    std::map<std::string, std::string> query_templates;
    std::map<std::string, std::string> response_templates;
};

struct IndexDefinition {
    std::string name; // lower-cased
    std::vector<std::string> fields;
    std::string description;
};

struct IndexSchema {
    std::vector<IndexDefinition> indexes;

    const IndexDefinition* find(const std::string& name) const;
    std::string to_json() const;
    // "- name: fields=a, b" per line
    std::string summary() const;
};

struct IntentMatch {
    std::string name;
    const IntentDefinition* intent{nullptr};
};

// Throw ConfigError(Invalid) on malformed JSON or missing required templates.
PromptConfig parse_prompt_config(const std::string& json_text);
IndexSchema parse_index_schema(const std::string& json_text);

std::optional<IntentMatch> match_intent(const PromptConfig& cfg, const std::string& normalized_query);
std::string intent_descriptions(const PromptConfig& cfg);

std::string render_template(const std::string& tmpl, const std::map<std::string, std::string>& vars);
std::string core_prompt_or(const PromptConfig& cfg, const std::string& name, const std::string& def);

const char* to_string(IntentAction action);
