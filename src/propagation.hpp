#pragma once
#include "config.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rumormill {

// Similarity contract: two strings in, a value in [0, 1] out.
using SimilarityFn = std::function<double(const std::string&, const std::string&)>;

// Jaccard overlap of lower-cased alphanumeric token sets. 0 when either
// side has no tokens.
double token_set_similarity(const std::string& a, const std::string& b);

enum class Mutation { Unchanged, Paraphrased, Mutated };
enum class PersonalityType { Gossip, Stoic, Neutral };

const char* mutation_to_string(Mutation m);
const char* personality_type_to_string(PersonalityType p);

PersonalityType classify_personality(const std::vector<std::string>& traits,
                                     const PropagationConfig& config);

Mutation classify_mutation(double similarity, const PropagationConfig& config);

struct ExperimentTrace {
    uint64_t turn = 0;
    std::string agent;     // speaker
    std::string listener;
    PersonalityType personality = PersonalityType::Neutral; // speaker's
    std::string content;
    double similarity = 0.0;
    Mutation mutation = Mutation::Mutated;
};

struct PropagationExperiment {
    std::string id;
    std::string secret;
    std::string seed_agent;
    uint64_t start_turn = 0;
    std::string start_time;
    uint64_t turns_elapsed = 0;
    std::vector<ExperimentTrace> traces;
    std::vector<std::string> agents_reached; // distinct listeners, first-reached order

    double propagation_rate() const;
};

struct PersonalityStats {
    size_t count = 0;
    double fidelity = 0.0;        // mean similarity
    double mutation_rate = 0.0;   // share of traces not unchanged
    size_t agents_reached = 0;    // distinct listeners of this type's traces
    double spread_velocity = 0.0; // agents_reached / turns elapsed
};

struct PropagationStats {
    bool active = false;
    std::string message; // set when inactive
    std::string experiment_id;
    std::string secret;
    std::string seed_agent;
    uint64_t turns_elapsed = 0;
    size_t total_traces = 0;
    size_t agents_reached = 0;
    double propagation_rate = 0.0;
    double information_fidelity = 0.0;
    std::map<std::string, PersonalityStats> by_personality; // gossip / neutral / stoic
    std::optional<double> gossip_to_stoic_ratio; // absent when stoic velocity is 0
    bool gossip_spreads_faster = false;
};

// Observes committed turns and measures how injected secrets travel.
// Never alters the simulation. Not synchronized: the orchestrator calls
// it under its own state lock.
class PropagationTracker {
public:
    explicit PropagationTracker(PropagationConfig config = {},
                                SimilarityFn similarity = token_set_similarity);

    // Opens a new experiment; returns its id.
    std::string inject(const std::string& secret, const std::string& seed_agent,
                       uint64_t turn);

    // Feed one committed turn to every open experiment.
    void observe(uint64_t turn, const std::string& speaker,
                 const std::string& listener, PersonalityType speaker_type,
                 const std::string& content);

    bool active() const { return !experiments_.empty(); }

    // Stats for the newest experiment, or an inactive result.
    PropagationStats stats() const;

    // Newest experiment, if any.
    const PropagationExperiment* current() const;
    const std::vector<PropagationExperiment>& experiments() const { return experiments_; }

    // Markdown summary of every experiment.
    std::string report() const;

    void clear() { experiments_.clear(); }

    double similarity(const std::string& a, const std::string& b) const;
    const PropagationConfig& config() const { return config_; }

private:
    PropagationConfig config_;
    SimilarityFn similarity_;
    std::vector<PropagationExperiment> experiments_;
};

} // namespace rumormill
