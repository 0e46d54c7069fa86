#include "plugin.hpp"
#include <stdexcept>
#include <algorithm>

namespace rumormill {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_provider(const std::string& name, ProviderFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_[name] = std::move(factory);
}

std::unique_ptr<Provider> PluginRegistry::create_provider(const std::string& name,
                                                          const std::string& api_key,
                                                          HttpClient& http,
                                                          const std::string& base_url) const {
    ProviderFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = providers_.find(name);
        if (it == providers_.end()) {
            throw std::invalid_argument("Unknown provider: " + name);
        }
        factory = it->second;
    }
    return factory(api_key, http, base_url);
}

std::vector<std::string> PluginRegistry::provider_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(providers_.size());
    for (const auto& [name, _] : providers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool PluginRegistry::has_provider(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.count(name) > 0;
}

} // namespace rumormill
