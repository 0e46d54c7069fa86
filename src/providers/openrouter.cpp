#include "openrouter.hpp"
#include "../plugin.hpp"

static rumormill::ProviderRegistrar reg_openrouter("openrouter",
    [](const std::string& key, rumormill::HttpClient& http, const std::string& base_url) {
        return std::make_unique<rumormill::OpenRouterProvider>(key, http, base_url);
    });

namespace rumormill {

OpenRouterProvider::OpenRouterProvider(const std::string& api_key, HttpClient& http,
                                       const std::string& base_url)
    : OpenAIProvider(api_key, http,
                     base_url.empty() ? "https://openrouter.ai/api/v1" : base_url) {}

std::vector<Header> OpenRouterProvider::build_headers() const {
    auto headers = OpenAIProvider::build_headers();
    headers.emplace_back("HTTP-Referer", "https://github.com/rumormill/rumormill");
    headers.emplace_back("X-Title", "rumormill");
    return headers;
}

} // namespace rumormill
