#pragma once
#include "persona.hpp"
#include "provider.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rumormill {

class HttpClient;
struct Config;

// Everything the generator may see for one line of dialogue.
struct GenerationRequest {
    uint64_t turn = 0;
    Persona speaker;
    Persona listener;
    std::string speaker_mood;
    std::string listener_mood;
    double speaker_tension = 0.0;
    std::string topic;
    std::string last_event;
    double rumor_heat = 0.0;
    std::vector<std::string> history;          // "Mara: ..." lines, oldest first
    std::vector<std::string> speaker_context;  // provenance-tagged memories
    std::vector<std::string> listener_context;
    bool strict = false;                       // retry after a rejected reply
};

struct GenerationResult {
    std::string utterance;
    std::optional<std::string> internal_monologue;
    double rumor_delta = 0.0; // [0, 1]
    std::optional<std::string> new_memory;
    std::string sentiment = "neutral";
};

enum class GenerationErrorKind { InvalidResponse, Timeout };

struct GenerationError {
    GenerationErrorKind kind = GenerationErrorKind::InvalidResponse;
    std::string message;
};

const char* generation_error_kind_to_string(GenerationErrorKind kind);

using GenerationOutcome = std::variant<GenerationResult, GenerationError>;

// Validate a raw generator reply. A markdown code fence around the JSON
// object is tolerated; anything else that is not a JSON object with a
// non-empty string "utterance" and a numeric "rumor_delta" in [0, 1]
// is rejected. Optional string fields may be absent or null.
GenerationOutcome parse_generation(const std::string& raw);

// External text-generation boundary. Returns the raw reply text; throws
// std::runtime_error on transport failure.
//
// generate() must return or throw within `timeout`. The orchestrator holds
// its step lock for the whole call and only compares elapsed time once the
// call is back, so an implementation that ignores the deadline blocks every
// other step, the loop and reset.
class Generator {
public:
    virtual ~Generator() = default;

    virtual std::string generate(const GenerationRequest& request,
                                 std::chrono::milliseconds timeout) = 0;

    virtual std::string name() const = 0;
};

// Adapts an LLM Provider to the Generator contract.
class ProviderGenerator : public Generator {
public:
    ProviderGenerator(std::unique_ptr<Provider> provider,
                      std::string model, double temperature);

    std::string generate(const GenerationRequest& request,
                         std::chrono::milliseconds timeout) override;

    std::string name() const override;

private:
    std::unique_ptr<Provider> provider_;
    std::string model_;
    double temperature_;
};

// "template" or a provider missing its credentials yields the offline
// TemplateGenerator; anything else wraps the registered provider.
std::unique_ptr<Generator> create_generator(const Config& config, HttpClient& http);

} // namespace rumormill
