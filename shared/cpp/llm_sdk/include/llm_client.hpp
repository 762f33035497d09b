#pragma once
#include <string>

// Opaque text-producing service ("global overview", "metrics", document Q&A...).
class TextService {
public:
    virtual ~TextService() = default;
    virtual std::string generate(const std::string& system_prompt, const std::string& user_prompt) = 0;
};

struct LlmConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string llm_model{"mistral"};
    int timeout_ms{240000};
};

class OllamaTextService : public TextService {
public:
    explicit OllamaTextService(LlmConfig cfg);
    std::string generate(const std::string& system_prompt, const std::string& user_prompt) override;

private:
    LlmConfig cfg_;
};
