#pragma once
#include "provider.hpp"
#include "http.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace rumormill {

using ProviderFactory = std::function<std::unique_ptr<Provider>(
    const std::string& api_key, HttpClient& http, const std::string& base_url)>;

// Registry for self-registering providers. Thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    void register_provider(const std::string& name, ProviderFactory factory);

    // Throws std::invalid_argument for unknown names.
    std::unique_ptr<Provider> create_provider(const std::string& name,
                                              const std::string& api_key,
                                              HttpClient& http,
                                              const std::string& base_url) const;

    std::vector<std::string> provider_names() const; // sorted
    bool has_provider(const std::string& name) const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProviderFactory> providers_;
};

// File-scope helper used by each provider .cpp
struct ProviderRegistrar {
    ProviderRegistrar(const std::string& name, ProviderFactory factory) {
        PluginRegistry::instance().register_provider(name, std::move(factory));
    }
};

} // namespace rumormill
