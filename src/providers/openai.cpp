#include "openai.hpp"
#include "../plugin.hpp"
#include <stdexcept>

static rumormill::ProviderRegistrar reg_openai("openai",
    [](const std::string& key, rumormill::HttpClient& http, const std::string& base_url) {
        return std::make_unique<rumormill::OpenAIProvider>(key, http, base_url);
    });

using json = nlohmann::json;

namespace rumormill {

OpenAIProvider::OpenAIProvider(const std::string& api_key, HttpClient& http,
                               const std::string& base_url)
    : api_key_(api_key), http_(http),
      base_url_(base_url.empty() ? "https://api.openai.com/v1" : base_url) {}

json OpenAIProvider::build_request(const std::vector<ChatMessage>& messages,
                                   const std::string& model,
                                   double temperature) const {
    json request;
    request["model"] = model;
    request["temperature"] = temperature;

    json msgs = json::array();
    for (const auto& msg : messages) {
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    request["messages"] = msgs;
    return request;
}

std::vector<Header> OpenAIProvider::build_headers() const {
    std::vector<Header> headers = {{"Content-Type", "application/json"}};
    if (!api_key_.empty()) {
        headers.emplace_back("Authorization", "Bearer " + api_key_);
    }
    return headers;
}

ChatResponse OpenAIProvider::chat(const std::vector<ChatMessage>& messages,
                                  const std::string& model,
                                  double temperature) {
    json request = build_request(messages, model, temperature);

    std::string url = base_url_ + "/chat/completions";
    auto response = http_.post(url, request.dump(), build_headers(), timeout_seconds_);

    if (response.status_code < 200 || response.status_code >= 300) {
        throw std::runtime_error(provider_name() + " API error (HTTP " +
            std::to_string(response.status_code) + "): " + response.body);
    }

    json resp;
    try {
        resp = json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(provider_name() + " returned malformed JSON: " + e.what());
    }

    ChatResponse result;
    result.model = resp.value("model", model);

    if (resp.contains("choices") && resp["choices"].is_array() && !resp["choices"].empty()) {
        const auto& choice = resp["choices"][0];
        if (choice.contains("message") && choice["message"].contains("content") &&
            choice["message"]["content"].is_string()) {
            result.content = choice["message"]["content"].get<std::string>();
        }
    }

    if (resp.contains("usage") && resp["usage"].is_object()) {
        const auto& usage = resp["usage"];
        result.usage.prompt_tokens = usage.value("prompt_tokens", 0u);
        result.usage.completion_tokens = usage.value("completion_tokens", 0u);
        result.usage.total_tokens = usage.value("total_tokens", 0u);
    }

    return result;
}

} // namespace rumormill
