#pragma once
#include "generation.hpp"
#include <mutex>
#include <random>

namespace rumormill {

// Offline dialogue: fills voice-specific openers and mood reactions
// around the speaker's best memory. Deterministic for a given seed and
// call sequence. Replies in the same JSON shape an LLM is asked for.
class TemplateGenerator : public Generator {
public:
    explicit TemplateGenerator(uint64_t seed = 42) : rng_(static_cast<std::mt19937::result_type>(seed)) {}

    std::string generate(const GenerationRequest& request,
                         std::chrono::milliseconds timeout) override;

    std::string name() const override { return "template"; }

private:
    std::mutex mutex_;
    std::mt19937 rng_;
};

} // namespace rumormill
