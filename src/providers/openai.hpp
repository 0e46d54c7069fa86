#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace rumormill {

// OpenAI chat-completions API. Subclasses reuse it for any endpoint that
// speaks the same protocol.
class OpenAIProvider : public Provider {
public:
    OpenAIProvider(const std::string& api_key, HttpClient& http,
                   const std::string& base_url);

    ChatResponse chat(const std::vector<ChatMessage>& messages,
                      const std::string& model,
                      double temperature) override;

    std::string provider_name() const override { return "openai"; }

    const std::string& base_url() const { return base_url_; }

protected:
    nlohmann::json build_request(const std::vector<ChatMessage>& messages,
                                 const std::string& model,
                                 double temperature) const;
    virtual std::vector<Header> build_headers() const;

    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
};

} // namespace rumormill
