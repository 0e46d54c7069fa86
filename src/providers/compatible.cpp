#include "compatible.hpp"
#include "../plugin.hpp"
#include <stdexcept>

static rumormill::ProviderRegistrar reg_compatible("compatible",
    [](const std::string& key, rumormill::HttpClient& http, const std::string& base_url) {
        return std::make_unique<rumormill::CompatibleProvider>(key, http, base_url);
    });

namespace rumormill {

static const std::string& require_url(const std::string& base_url) {
    if (base_url.empty()) {
        throw std::invalid_argument("compatible provider needs a base_url");
    }
    return base_url;
}

CompatibleProvider::CompatibleProvider(const std::string& api_key, HttpClient& http,
                                       const std::string& base_url)
    : OpenAIProvider(api_key, http, require_url(base_url)) {}

} // namespace rumormill
