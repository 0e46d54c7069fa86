#include "ollama.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

static rumormill::ProviderRegistrar reg_ollama("ollama",
    [](const std::string&, rumormill::HttpClient& http, const std::string& base_url) {
        std::string url = base_url.empty() ? "http://localhost:11434" : base_url;
        return std::make_unique<rumormill::OllamaProvider>(http, url);
    });

using json = nlohmann::json;

namespace rumormill {

OllamaProvider::OllamaProvider(HttpClient& http, const std::string& base_url)
    : http_(http), base_url_(base_url) {}

ChatResponse OllamaProvider::chat(const std::vector<ChatMessage>& messages,
                                  const std::string& model,
                                  double temperature) {
    json request;
    request["model"] = model;
    request["stream"] = false;
    request["format"] = "json";
    request["options"] = {{"temperature", temperature}};

    json msgs = json::array();
    for (const auto& msg : messages) {
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    request["messages"] = msgs;

    std::string url = base_url_ + "/api/chat";
    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };

    auto response = http_.post(url, request.dump(), headers, timeout_seconds_);

    if (response.status_code < 200 || response.status_code >= 300) {
        throw std::runtime_error("Ollama API error (HTTP " +
            std::to_string(response.status_code) + "): " + response.body);
    }

    json resp;
    try {
        resp = json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Ollama returned malformed JSON: ") + e.what());
    }

    ChatResponse result;
    result.model = resp.value("model", model);

    if (resp.contains("message") && resp["message"].contains("content") &&
        resp["message"]["content"].is_string()) {
        result.content = resp["message"]["content"].get<std::string>();
    }

    result.usage.prompt_tokens = resp.value("prompt_eval_count", 0u);
    result.usage.completion_tokens = resp.value("eval_count", 0u);
    result.usage.total_tokens = result.usage.prompt_tokens + result.usage.completion_tokens;

    return result;
}

} // namespace rumormill
