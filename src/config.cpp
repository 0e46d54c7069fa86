#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace rumormill {

const std::vector<std::string>& default_rumor_seeds() {
    static const std::vector<std::string> seeds = {
        "Vault door left ajar last night.",
        "Supply caravan spotted smoke near the marsh.",
        "Guard captain seen bribing the tax clerk.",
        "Somebody swapped the shop ledgers with counterfeits.",
        "A wyvern shadow skimmed over the market at dawn."
    };
    return seeds;
}

nlohmann::json Config::defaults_json() {
    return {
        {"provider", "template"},
        {"model", "gpt-4o-mini"},
        {"temperature", 0.8},
        {"base_url", ""},
        {"providers", {
            {"openai", {{"api_key", ""}}},
            {"openrouter", {{"api_key", ""}}},
            {"ollama", {{"base_url", "http://localhost:11434"}}},
            {"compatible", {{"base_url", ""}}}
        }},
        {"simulation", {
            {"persona_pool", nlohmann::json::array()},
            {"party_size", 2},
            {"rumor_seeds", default_rumor_seeds()},
            {"history_limit", 50},
            {"prompt_history", 6},
            {"dialogue_delay_ms", 5000},
            {"generation_timeout_seconds", 30},
            {"pending_weight", 1.0},
            {"seed", 42}
        }},
        {"retrieval", {
            {"max_hops", 2},
            {"max_results", 4},
            {"listener_results", 2},
            {"overlap_weight", 1.0},
            {"path_weight", 0.5},
            {"recency_weight", 0.25},
            {"recency_half_life", 5.0}
        }},
        {"world", {
            {"heat_baseline", 0.0},
            {"heat_decay", 0.05},
            {"guard_baseline", 0.2},
            {"alert_gain", 0.3},
            {"alert_threshold", 0.15},
            {"price_gain", 0.1},
            {"rumor_log_limit", 10},
            {"beats_limit", 10},
            {"mood_gain", 0.3},
            {"mood_decay", 0.15}
        }},
        {"propagation", {
            {"trace_threshold", 0.15},
            {"unchanged_threshold", 0.85},
            {"paraphrased_threshold", 0.5},
            {"gossip_traits", {"curious", "talkative", "dramatic", "theatrical"}},
            {"stoic_traits", {"reserved", "guarded", "careful", "quiet"}}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// ── Typed field readers (wrong types leave the target untouched) ──

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

static void read_double(const nlohmann::json& obj, const char* key, double& out) {
    if (obj.contains(key) && obj[key].is_number())
        out = obj[key].get<double>();
}

static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_integer() && obj[key].get<int64_t>() >= 0)
        out = obj[key].get<uint32_t>();
}

static void read_u64(const nlohmann::json& obj, const char* key, uint64_t& out) {
    if (obj.contains(key) && obj[key].is_number_integer() && obj[key].get<int64_t>() >= 0)
        out = obj[key].get<uint64_t>();
}

static void read_strings(const nlohmann::json& obj, const char* key,
                         std::vector<std::string>& out) {
    if (!obj.contains(key) || !obj[key].is_array()) return;
    std::vector<std::string> values;
    for (const auto& v : obj[key]) {
        if (v.is_string()) values.push_back(v.get<std::string>());
    }
    out = std::move(values);
}

static std::vector<std::string> split_list(const std::string& raw) {
    std::vector<std::string> out;
    for (const auto& part : split(raw, '|')) {
        std::string t = trim(part);
        if (!t.empty()) out.push_back(t);
    }
    return out;
}

void Config::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) return;

    read_string(j, "provider", provider);
    read_string(j, "model", model);
    read_double(j, "temperature", temperature);
    read_string(j, "base_url", base_url);

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderEntry entry;
            read_string(obj, "api_key", entry.api_key);
            read_string(obj, "base_url", entry.base_url);
            providers[name] = std::move(entry);
        }
    }

    if (j.contains("simulation") && j["simulation"].is_object()) {
        const auto& s = j["simulation"];
        read_strings(s, "persona_pool", simulation.persona_pool);
        read_u32(s, "party_size", simulation.party_size);
        read_strings(s, "rumor_seeds", simulation.rumor_seeds);
        read_u32(s, "history_limit", simulation.history_limit);
        read_u32(s, "prompt_history", simulation.prompt_history);
        read_u32(s, "dialogue_delay_ms", simulation.dialogue_delay_ms);
        read_u32(s, "generation_timeout_seconds", simulation.generation_timeout_seconds);
        read_double(s, "pending_weight", simulation.pending_weight);
        read_u64(s, "seed", simulation.seed);
    }

    if (j.contains("retrieval") && j["retrieval"].is_object()) {
        const auto& r = j["retrieval"];
        read_u32(r, "max_hops", retrieval.max_hops);
        read_u32(r, "max_results", retrieval.max_results);
        read_u32(r, "listener_results", retrieval.listener_results);
        read_double(r, "overlap_weight", retrieval.overlap_weight);
        read_double(r, "path_weight", retrieval.path_weight);
        read_double(r, "recency_weight", retrieval.recency_weight);
        read_double(r, "recency_half_life", retrieval.recency_half_life);
    }

    if (j.contains("world") && j["world"].is_object()) {
        const auto& w = j["world"];
        read_double(w, "heat_baseline", world.heat_baseline);
        read_double(w, "heat_decay", world.heat_decay);
        read_double(w, "guard_baseline", world.guard_baseline);
        read_double(w, "alert_gain", world.alert_gain);
        read_double(w, "alert_threshold", world.alert_threshold);
        read_double(w, "price_gain", world.price_gain);
        read_u32(w, "rumor_log_limit", world.rumor_log_limit);
        read_u32(w, "beats_limit", world.beats_limit);
        read_double(w, "mood_gain", world.mood_gain);
        read_double(w, "mood_decay", world.mood_decay);
    }

    if (j.contains("propagation") && j["propagation"].is_object()) {
        const auto& p = j["propagation"];
        read_double(p, "trace_threshold", propagation.trace_threshold);
        read_double(p, "unchanged_threshold", propagation.unchanged_threshold);
        read_double(p, "paraphrased_threshold", propagation.paraphrased_threshold);
        read_strings(p, "gossip_traits", propagation.gossip_traits);
        read_strings(p, "stoic_traits", propagation.stoic_traits);
    }
}

void Config::apply_env() {
    if (const char* v = std::getenv("OPENAI_API_KEY"))
        providers["openai"].api_key = v;
    if (const char* v = std::getenv("OPENROUTER_API_KEY"))
        providers["openrouter"].api_key = v;
    if (const char* v = std::getenv("OLLAMA_BASE_URL"))
        providers["ollama"].base_url = v;
    if (const char* v = std::getenv("COMPATIBLE_BASE_URL"))
        providers["compatible"].base_url = v;
    if (const char* v = std::getenv("RUMORMILL_PROVIDER"))
        provider = to_lower(trim(v));
    if (const char* v = std::getenv("RUMORMILL_MODEL"))
        model = v;

    if (const char* v = std::getenv("RUMORMILL_PERSONA_POOL")) {
        auto pool = split_list(v);
        if (!pool.empty()) simulation.persona_pool = std::move(pool);
    }
    if (const char* v = std::getenv("RUMORMILL_PARTY_SIZE")) {
        try {
            int size = std::stoi(v);
            simulation.party_size = static_cast<uint32_t>(size < 2 ? 2 : size);
        } catch (const std::exception&) {
            std::cerr << "[config] RUMORMILL_PARTY_SIZE='" << v
                      << "' invalid; keeping " << simulation.party_size << "\n";
        }
    }
    if (const char* v = std::getenv("RUMORMILL_RUMOR_SEEDS")) {
        auto seeds = split_list(v);
        if (!seeds.empty()) simulation.rumor_seeds = std::move(seeds);
    }
    if (const char* v = std::getenv("RUMORMILL_DIALOGUE_DELAY_MS")) {
        try {
            simulation.dialogue_delay_ms = static_cast<uint32_t>(std::stoul(v));
        } catch (const std::exception&) {
            std::cerr << "[config] RUMORMILL_DIALOGUE_DELAY_MS='" << v << "' invalid\n";
        }
    }
    if (const char* v = std::getenv("RUMORMILL_SEED")) {
        try {
            simulation.seed = std::stoull(v);
        } catch (const std::exception&) {
            std::cerr << "[config] RUMORMILL_SEED='" << v << "' invalid\n";
        }
    }
}

Config Config::load() {
    Config cfg;

    std::string config_path = expand_home("~/.rumormill/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " ("
                      << e.what() << "); using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    cfg.apply_json(j);
    cfg.apply_env();

    if (cfg.simulation.party_size < 2) cfg.simulation.party_size = 2;
    if (cfg.simulation.rumor_seeds.empty())
        cfg.simulation.rumor_seeds = default_rumor_seeds();

    return cfg;
}

std::string Config::api_key_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.api_key;
    return {};
}

std::string Config::base_url_for(const std::string& prov) const {
    if (!base_url.empty()) return base_url;
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

} // namespace rumormill
