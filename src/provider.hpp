#pragma once
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <cstdint>

namespace rumormill {

enum class Role { System, User, Assistant };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

struct ChatMessage {
    Role role;
    std::string content;
};

struct TokenUsage {
    uint32_t prompt_tokens = 0;
    uint32_t completion_tokens = 0;
    uint32_t total_tokens = 0;
};

struct ChatResponse {
    std::optional<std::string> content;
    TokenUsage usage;
    std::string model;
};

// Abstract base class for LLM providers. Implementations throw
// std::runtime_error on transport or API errors.
class Provider {
public:
    virtual ~Provider() = default;

    virtual ChatResponse chat(const std::vector<ChatMessage>& messages,
                              const std::string& model,
                              double temperature) = 0;

    std::string chat_simple(const std::string& system_prompt,
                            const std::string& message,
                            const std::string& model,
                            double temperature);

    virtual std::string provider_name() const = 0;

    // Per-request HTTP timeout
    void set_timeout(long seconds) { timeout_seconds_ = seconds; }

protected:
    long timeout_seconds_ = 120;
};

class HttpClient; // forward declaration
struct Config;

// Factory: create provider by name. Throws std::invalid_argument for
// unknown names.
std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const std::string& api_key,
                                          HttpClient& http,
                                          const std::string& base_url = "");

// ── Provider listing ────────────────────────────────────────────
struct ProviderInfo {
    std::string name;
    std::string auth;   // "API key", "local" or "offline"
    bool active = false;
};

// Providers usable with the current config, plus the offline template.
std::vector<ProviderInfo> list_providers(const Config& config);

} // namespace rumormill
