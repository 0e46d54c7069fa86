#pragma once
#include "openai.hpp"
#include <string>

namespace rumormill {

// Any OpenAI-compatible server (llama.cpp, vLLM, LM Studio...). The base
// URL is mandatory.
class CompatibleProvider : public OpenAIProvider {
public:
    CompatibleProvider(const std::string& api_key, HttpClient& http,
                       const std::string& base_url);

    std::string provider_name() const override { return "compatible"; }
};

} // namespace rumormill
