#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace rumormill {

struct ProviderEntry {
    std::string api_key;
    std::string base_url;
};

struct SimulationConfig {
    std::vector<std::string> persona_pool;    // persona keys; empty = all builtins
    uint32_t party_size = 2;                  // minimum 2
    std::vector<std::string> rumor_seeds;     // reset draws one with the seeded rng
    uint32_t history_limit = 50;
    uint32_t prompt_history = 6;              // turns of shared history in the prompt
    uint32_t dialogue_delay_ms = 5000;        // loop interval
    uint32_t generation_timeout_seconds = 30;
    double pending_weight = 1.0;              // speaker bias per unshared memory
    uint64_t seed = 42;
};

struct RetrievalConfig {
    uint32_t max_hops = 2;
    uint32_t max_results = 4;
    uint32_t listener_results = 2;
    double overlap_weight = 1.0;   // W1
    double path_weight = 0.5;      // W2
    double recency_weight = 0.25;  // W3
    double recency_half_life = 5.0; // turns
};

struct WorldConfig {
    double heat_baseline = 0.0;
    double heat_decay = 0.05;
    double guard_baseline = 0.2;
    double alert_gain = 0.3;
    double alert_threshold = 0.15;
    double price_gain = 0.1;
    uint32_t rumor_log_limit = 10;
    uint32_t beats_limit = 10;
    double mood_gain = 0.3;
    double mood_decay = 0.15;
};

struct PropagationConfig {
    double trace_threshold = 0.15;
    double unchanged_threshold = 0.85;
    double paraphrased_threshold = 0.5;
    std::vector<std::string> gossip_traits = {"curious", "talkative", "dramatic", "theatrical"};
    std::vector<std::string> stoic_traits = {"reserved", "guarded", "careful", "quiet"};
};

struct Config {
    std::string provider = "template";
    std::string model = "gpt-4o-mini";
    double temperature = 0.8;
    std::string base_url;  // Global override, applies to the active provider

    std::unordered_map<std::string, ProviderEntry> providers;

    SimulationConfig simulation;
    RetrievalConfig retrieval;
    WorldConfig world;
    PropagationConfig propagation;

    // Load from ~/.rumormill/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply a parsed config object on top of this one. Unknown or
    // wrongly-typed keys are ignored.
    void apply_json(const nlohmann::json& j);

    // Environment variables override file values
    void apply_env();

    // Get API key for a provider name
    std::string api_key_for(const std::string& provider) const;

    // Get base URL for a provider name (empty = use provider default)
    std::string base_url_for(const std::string& provider) const;
};

// Default rumor hooks used when none are configured
const std::vector<std::string>& default_rumor_seeds();

} // namespace rumormill
