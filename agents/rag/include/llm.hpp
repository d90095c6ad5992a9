#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Text generation and embedding. Implementations throw GenerationError.
class LanguageModel {
public:
    virtual ~LanguageModel() = default;
    virtual std::string complete(const std::string& system_prompt, const std::string& user_prompt) = 0;
    virtual std::vector<float> embed(const std::string& text) = 0;
};

enum class LlmKind { Ollama, OpenAi };

struct LlmConfig {
    LlmKind kind{LlmKind::Ollama};
    std::string base_url;
    std::string model;
    std::string api_key;
    long timeout_ms{60000};
};

class OllamaClient : public LanguageModel {
public:
    explicit OllamaClient(LlmConfig cfg);
    std::string complete(const std::string& system_prompt, const std::string& user_prompt) override;
    std::vector<float> embed(const std::string& text) override;

private:
    LlmConfig cfg_;
};

// OpenAI-compatible /chat/completions and /embeddings.
class OpenAiClient : public LanguageModel {
public:
    explicit OpenAiClient(LlmConfig cfg);
    std::string complete(const std::string& system_prompt, const std::string& user_prompt) override;
    std::vector<float> embed(const std::string& text) override;

private:
    LlmConfig cfg_;
};

std::optional<LlmKind> parse_llm_kind(const std::string& s);
std::unique_ptr<LanguageModel> make_language_model(const LlmConfig& cfg);
