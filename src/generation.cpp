#include "generation.hpp"
#include "config.hpp"
#include "http.hpp"
#include "plugin.hpp"
#include "prompt.hpp"
#include "template_generator.hpp"
#include "util.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace rumormill {

const char* generation_error_kind_to_string(GenerationErrorKind kind) {
    switch (kind) {
        case GenerationErrorKind::InvalidResponse: return "invalid_response";
        case GenerationErrorKind::Timeout: return "timeout";
    }
    return "invalid_response";
}

static std::string strip_code_fence(const std::string& raw) {
    std::string text = trim(raw);
    if (text.rfind("```", 0) != 0) return text;

    // Drop the opening fence line (``` or ```json) and a closing fence.
    size_t nl = text.find('\n');
    if (nl == std::string::npos) return {};
    text = text.substr(nl + 1);
    size_t close = text.rfind("```");
    if (close != std::string::npos) text = text.substr(0, close);
    return trim(text);
}

static GenerationError invalid(const std::string& message) {
    return GenerationError{GenerationErrorKind::InvalidResponse, message};
}

// Absent or null -> nullopt; blank string -> nullopt; non-string -> error.
static bool read_optional_string(const json& obj, const char* key,
                                 std::optional<std::string>& out) {
    if (!obj.contains(key) || obj[key].is_null()) return true;
    if (!obj[key].is_string()) return false;
    std::string value = trim(obj[key].get<std::string>());
    if (!value.empty()) out = std::move(value);
    return true;
}

GenerationOutcome parse_generation(const std::string& raw) {
    std::string text = strip_code_fence(raw);
    if (text.empty()) return invalid("empty response");

    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        return invalid(std::string("not JSON: ") + e.what());
    }
    if (!j.is_object()) return invalid("response is not a JSON object");

    GenerationResult result;

    if (!j.contains("utterance") || !j["utterance"].is_string())
        return invalid("missing string field 'utterance'");
    result.utterance = trim(j["utterance"].get<std::string>());
    if (result.utterance.empty()) return invalid("'utterance' is empty");

    if (!j.contains("rumor_delta") || !j["rumor_delta"].is_number())
        return invalid("missing numeric field 'rumor_delta'");
    result.rumor_delta = j["rumor_delta"].get<double>();
    if (!(result.rumor_delta >= 0.0 && result.rumor_delta <= 1.0))
        return invalid("'rumor_delta' outside [0, 1]");

    if (!read_optional_string(j, "internal_monologue", result.internal_monologue))
        return invalid("'internal_monologue' must be a string");
    if (!read_optional_string(j, "new_memory", result.new_memory))
        return invalid("'new_memory' must be a string");

    std::optional<std::string> sentiment;
    if (!read_optional_string(j, "sentiment", sentiment))
        return invalid("'sentiment' must be a string");
    if (sentiment) result.sentiment = to_lower(*sentiment);

    return result;
}

// ── ProviderGenerator ───────────────────────────────────────────

ProviderGenerator::ProviderGenerator(std::unique_ptr<Provider> provider,
                                     std::string model, double temperature)
    : provider_(std::move(provider)), model_(std::move(model)),
      temperature_(temperature) {}

std::string ProviderGenerator::generate(const GenerationRequest& request,
                                        std::chrono::milliseconds timeout) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
    provider_->set_timeout(seconds < 1 ? 1 : static_cast<long>(seconds));
    return provider_->chat_simple(build_dialogue_system_prompt(request.strict),
                                  build_dialogue_prompt(request),
                                  model_, temperature_);
}

std::string ProviderGenerator::name() const {
    return provider_->provider_name() + ":" + model_;
}

std::unique_ptr<Generator> create_generator(const Config& config, HttpClient& http) {
    const std::string& name = config.provider;
    if (name.empty() || name == "template") {
        return std::make_unique<TemplateGenerator>(config.simulation.seed);
    }

    std::string api_key = config.api_key_for(name);
    bool needs_key = name == "openai" || name == "openrouter";
    if (needs_key && api_key.empty()) {
        std::cerr << "[generation] No API key for " << name
                  << "; falling back to template dialogue\n";
        return std::make_unique<TemplateGenerator>(config.simulation.seed);
    }

    try {
        auto provider = create_provider(name, api_key, http, config.base_url_for(name));
        return std::make_unique<ProviderGenerator>(std::move(provider), config.model,
                                                   config.temperature);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[generation] " << e.what() << "; falling back to template dialogue\n";
        return std::make_unique<TemplateGenerator>(config.simulation.seed);
    }
}

} // namespace rumormill
