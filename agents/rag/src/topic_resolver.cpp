#include "../include/topic_resolver.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <spdlog/spdlog.h>

const char* to_string(ResolveStage stage) {
    switch (stage) {
        case ResolveStage::Primary: return "primary";
        case ResolveStage::Fallback: return "fallback";
    }
    return "unknown";
}

std::string TopicResolver::build_prompt(ResolveStage stage, const std::string& question,
                                        const PromptConfig& prompts, const IndexSchema& schema) const {
    const char* name = stage == ResolveStage::Primary ? "rag_topic_inference" : "fallback_topic_resolver";
    auto it = prompts.query_templates.find(name);
    if (it == prompts.query_templates.end()) {
        throw ConfigError(ConfigErrorKind::Invalid, std::string("missing query_templates.") + name);
    }
    const std::string schema_json = schema.to_json();
    return render_template(it->second, {
        {"schema_json", schema_json},
        {"schema", schema_json},
        {"schema_summary", schema.summary()},
        {"user_question", question},
    });
}

std::optional<std::string> TopicResolver::infer(ResolveStage stage, const std::string& question,
                                                const PromptConfig& prompts, const IndexSchema& schema) {
    auto prompt = build_prompt(stage, question, prompts, schema);
    spdlog::debug("Topic {} prompt:\n{}", to_string(stage), prompt);
    std::string answer;
    try {
        answer = model_.complete(core_prompt_or(prompts, "system", ""), prompt);
    } catch (const GenerationError& e) {
        spdlog::warn("Topic {} inference failed ({}): {}", to_string(stage), to_string(e.kind()), e.what());
        return std::nullopt;
    }
    auto topic = match_index(answer, schema);
    spdlog::info("Topic {} inference: '{}' -> {}", to_string(stage), trim(answer), topic ? *topic : "none");
    return topic;
}

std::optional<std::string> TopicResolver::resolve(const std::string& question,
                                                  const PromptConfig& prompts, const IndexSchema& schema) {
    if (auto topic = infer(ResolveStage::Primary, question, prompts, schema)) return topic;
    return infer(ResolveStage::Fallback, question, prompts, schema);
}

std::optional<std::string> match_index(const std::string& answer, const IndexSchema& schema) {
    std::string s = trim(answer);
    auto nl = s.find('\n');
    if (nl != std::string::npos) s = trim(s.substr(0, nl));
    const std::string quotes = "\"'`";
    while (!s.empty() && quotes.find(s.front()) != std::string::npos) s.erase(0, 1);
    while (!s.empty() && quotes.find(s.back()) != std::string::npos) s.pop_back();
    s = to_lower(trim(s));
    if (s.empty() || s == "none") return std::nullopt;
    if (const auto* idx = schema.find(s)) return idx->name;
    return std::nullopt;
}
