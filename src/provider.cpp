#include "provider.hpp"
#include "plugin.hpp"
#include "config.hpp"

namespace rumormill {

std::string Provider::chat_simple(const std::string& system_prompt,
                                  const std::string& message,
                                  const std::string& model,
                                  double temperature) {
    std::vector<ChatMessage> messages;
    if (!system_prompt.empty()) {
        messages.push_back({Role::System, system_prompt});
    }
    messages.push_back({Role::User, message});

    auto result = chat(messages, model, temperature);
    return result.content.value_or("");
}

std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const std::string& api_key,
                                          HttpClient& http,
                                          const std::string& base_url) {
    return PluginRegistry::instance().create_provider(name, api_key, http, base_url);
}

std::vector<ProviderInfo> list_providers(const Config& config) {
    std::vector<ProviderInfo> result;
    result.push_back({"template", "offline", config.provider == "template"});

    for (const auto& name : PluginRegistry::instance().provider_names()) {
        bool active = name == config.provider;
        std::string key = config.api_key_for(name);
        std::string url = config.base_url_for(name);
        if (!key.empty()) {
            result.push_back({name, "API key", active});
        } else if (name == "ollama" || (!url.empty() && name == "compatible")) {
            result.push_back({name, "local", active});
        }
    }
    return result;
}

} // namespace rumormill
