#include <catch2/catch_test_macros.hpp>
#include "mock_http_client.hpp"
#include "config.hpp"
#include "plugin.hpp"
#include "provider.hpp"
#include "providers/openai.hpp"
#include "providers/ollama.hpp"
#include "providers/openrouter.hpp"
#include "providers/compatible.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;
using namespace rumormill;

// ── Helper: find header value ───────────────────────────────────

static std::string find_header(const std::vector<Header>& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (h.first == name) return h.second;
    }
    return "";
}

// ════════════════════════════════════════════════════════════════
// OpenAI Provider
// ════════════════════════════════════════════════════════════════

TEST_CASE("OpenAIProvider: chat sends correct request", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({
        "model": "gpt-4o-mini",
        "choices": [{"message": {"content": "Hello!"}}],
        "usage": {"prompt_tokens": 10, "completion_tokens": 5, "total_tokens": 15}
    })"};

    OpenAIProvider provider("test-key", mock, "");

    std::vector<ChatMessage> messages = {
        {Role::System, "Stay in character"},
        {Role::User, "Speak"}
    };
    auto result = provider.chat(messages, "gpt-4o-mini", 0.8);

    REQUIRE(mock.last_url == "https://api.openai.com/v1/chat/completions");
    REQUIRE(find_header(mock.last_headers, "Authorization") == "Bearer test-key");
    REQUIRE(find_header(mock.last_headers, "Content-Type") == "application/json");

    auto body = json::parse(mock.last_body);
    REQUIRE(body["model"] == "gpt-4o-mini");
    REQUIRE(body["temperature"] == 0.8);
    REQUIRE(body["messages"].size() == 2);
    REQUIRE(body["messages"][0]["role"] == "system");
    REQUIRE(body["messages"][1]["role"] == "user");

    REQUIRE(result.content.value_or("") == "Hello!");
    REQUIRE(result.usage.prompt_tokens == 10);
    REQUIRE(result.usage.completion_tokens == 5);
    REQUIRE(result.usage.total_tokens == 15);
}

TEST_CASE("OpenAIProvider: chat throws on HTTP error", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {401, R"({"error": "unauthorized"})"};

    OpenAIProvider provider("bad", mock, "");
    REQUIRE_THROWS_AS(provider.chat({{Role::User, "hi"}}, "gpt-4o-mini", 0.8),
                      std::runtime_error);
}

TEST_CASE("OpenAIProvider: chat throws on malformed body", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, "<html>gateway</html>"};

    OpenAIProvider provider("key", mock, "");
    REQUIRE_THROWS_AS(provider.chat({{Role::User, "hi"}}, "gpt-4o-mini", 0.8),
                      std::runtime_error);
}

TEST_CASE("OpenAIProvider: empty choices returns no content", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"choices": []})"};

    OpenAIProvider provider("key", mock, "");
    auto result = provider.chat({{Role::User, "hi"}}, "gpt-4o-mini", 0.8);
    REQUIRE_FALSE(result.content.has_value());
}

TEST_CASE("OpenAIProvider: custom base_url and timeout", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"choices": [{"message": {"content": "ok"}}]})"};

    OpenAIProvider provider("key", mock, "http://localhost:8080/v1");
    provider.set_timeout(7);
    provider.chat({{Role::User, "hi"}}, "m", 0.5);

    REQUIRE(mock.last_url == "http://localhost:8080/v1/chat/completions");
    REQUIRE(mock.last_timeout == 7);
}

TEST_CASE("OpenAIProvider: chat_simple returns text", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"choices": [{"message": {"content": "{\"utterance\": \"x\"}"}}]})"};

    OpenAIProvider provider("key", mock, "");
    auto text = provider.chat_simple("system", "user", "gpt-4o-mini", 0.8);
    REQUIRE(text == R"({"utterance": "x"})");

    auto body = json::parse(mock.last_body);
    REQUIRE(body["messages"][0]["content"] == "system");
    REQUIRE(body["messages"][1]["content"] == "user");
}

// ════════════════════════════════════════════════════════════════
// OpenRouter / Compatible
// ════════════════════════════════════════════════════════════════

TEST_CASE("OpenRouterProvider: default URL and extra headers", "[providers][openrouter]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"choices": [{"message": {"content": "ok"}}]})"};

    OpenRouterProvider provider("or-key", mock, "");
    provider.chat({{Role::User, "hi"}}, "openai/gpt-4o-mini", 0.8);

    REQUIRE(mock.last_url == "https://openrouter.ai/api/v1/chat/completions");
    REQUIRE(find_header(mock.last_headers, "Authorization") == "Bearer or-key");
    REQUIRE(find_header(mock.last_headers, "X-Title") == "rumormill");
    REQUIRE_FALSE(find_header(mock.last_headers, "HTTP-Referer").empty());
}

TEST_CASE("CompatibleProvider: uses custom base URL", "[providers][compatible]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"choices": [{"message": {"content": "ok"}}]})"};

    CompatibleProvider provider("", mock, "http://llm.lan:8000/v1");
    provider.chat({{Role::User, "hi"}}, "local", 0.8);

    REQUIRE(mock.last_url == "http://llm.lan:8000/v1/chat/completions");
    REQUIRE(find_header(mock.last_headers, "Authorization").empty());
}

TEST_CASE("CompatibleProvider: requires a base URL", "[providers][compatible]") {
    MockHttpClient mock;
    REQUIRE_THROWS_AS(CompatibleProvider("", mock, ""), std::invalid_argument);
}

// ════════════════════════════════════════════════════════════════
// Ollama Provider
// ════════════════════════════════════════════════════════════════

TEST_CASE("OllamaProvider: chat sends JSON-mode request", "[providers][ollama]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({
        "model": "llama3",
        "message": {"role": "assistant", "content": "Hi there"},
        "prompt_eval_count": 8,
        "eval_count": 4
    })"};

    OllamaProvider provider(mock, "http://localhost:11434");
    auto result = provider.chat({{Role::User, "hi"}}, "llama3", 0.3);

    REQUIRE(mock.last_url == "http://localhost:11434/api/chat");
    auto body = json::parse(mock.last_body);
    REQUIRE(body["model"] == "llama3");
    REQUIRE(body["stream"] == false);
    REQUIRE(body["format"] == "json");
    REQUIRE(body["options"]["temperature"] == 0.3);

    REQUIRE(result.content.value_or("") == "Hi there");
    REQUIRE(result.usage.total_tokens == 12);
}

TEST_CASE("OllamaProvider: chat throws on HTTP error", "[providers][ollama]") {
    MockHttpClient mock;
    mock.next_response = {500, "boom"};

    OllamaProvider provider(mock);
    REQUIRE_THROWS_AS(provider.chat({{Role::User, "hi"}}, "llama3", 0.3), std::runtime_error);
}

// ════════════════════════════════════════════════════════════════
// Registry
// ════════════════════════════════════════════════════════════════

TEST_CASE("PluginRegistry: built-in providers self-register", "[providers][plugin]") {
    auto& reg = PluginRegistry::instance();
    REQUIRE(reg.has_provider("openai"));
    REQUIRE(reg.has_provider("openrouter"));
    REQUIRE(reg.has_provider("ollama"));
    REQUIRE(reg.has_provider("compatible"));

    auto names = reg.provider_names();
    REQUIRE(std::is_sorted(names.begin(), names.end()));
}

TEST_CASE("create_provider: unknown name throws invalid_argument", "[providers][plugin]") {
    MockHttpClient mock;
    REQUIRE_THROWS_AS(create_provider("nonexistent", "", mock), std::invalid_argument);
}

TEST_CASE("create_provider: ollama ignores the key", "[providers][plugin]") {
    MockHttpClient mock;
    auto provider = create_provider("ollama", "", mock);
    REQUIRE(provider->provider_name() == "ollama");
}

TEST_CASE("list_providers: template always listed, keyless remotes hidden", "[providers]") {
    Config cfg;
    cfg.providers["openai"].api_key = "sk";
    auto infos = list_providers(cfg);

    auto has = [&](const std::string& name) {
        return std::any_of(infos.begin(), infos.end(),
                           [&](const ProviderInfo& i) { return i.name == name; });
    };
    REQUIRE(infos.front().name == "template");
    REQUIRE(infos.front().active);
    REQUIRE(has("openai"));
    REQUIRE(has("ollama"));
    REQUIRE_FALSE(has("openrouter"));
}
