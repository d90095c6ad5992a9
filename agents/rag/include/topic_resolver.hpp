#pragma once
#include "llm.hpp"
#include "prompt_config.hpp"
#include <optional>
#include <string>

enum class ResolveStage {
    Primary,  // rag_topic_inference
    Fallback, // fallback_topic_resolver, maps implied attributes to indexes
};

const char* to_string(ResolveStage stage);

// Maps a question to one index of the schema with at most two model calls.
// The stages are separate prompts, not retries of one prompt.
class TopicResolver {
public:
    explicit TopicResolver(LanguageModel& model) : model_(model) {}

    std::string build_prompt(ResolveStage stage, const std::string& question,
                             const PromptConfig& prompts, const IndexSchema& schema) const;

    // One model call. nullopt when the answer is "None", names no known
    // index, or the model failed.
    std::optional<std::string> infer(ResolveStage stage, const std::string& question,
                                     const PromptConfig& prompts, const IndexSchema& schema);

    // Primary stage, then the fallback stage only if the primary gave nothing.
    std::optional<std::string> resolve(const std::string& question,
                                       const PromptConfig& prompts, const IndexSchema& schema);

private:
    LanguageModel& model_;
};

// Reduces a raw model answer to a schema index name.
std::optional<std::string> match_index(const std::string& answer, const IndexSchema& schema);
