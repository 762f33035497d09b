#include "../include/llm_client.hpp"
#include "../include/http.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

OllamaTextService::OllamaTextService(LlmConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.ollama_url.empty() && cfg_.ollama_url.back() == '/') cfg_.ollama_url.pop_back();
}

std::string OllamaTextService::generate(const std::string& system_prompt, const std::string& user_prompt) {
    json body = {
        {"model", cfg_.llm_model},
        {"stream", false},
        {"messages", json::array({
            json{{"role","system"},{"content",system_prompt}},
            json{{"role","user"},{"content",user_prompt}}
        })}
    };
    auto r = http_post_json(cfg_.ollama_url + "/api/chat", body.dump(), cfg_.timeout_ms);
    if (r.status < 200 || r.status >= 300) {
        throw std::runtime_error("chat failed: status " + std::to_string(r.status));
    }
    auto data = json::parse(r.body);
    if (data.contains("message")) return data["message"]["content"].get<std::string>();
    return {};
}
