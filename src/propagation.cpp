#include "propagation.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstdio>
#include <set>
#include <sstream>

namespace rumormill {

double token_set_similarity(const std::string& a, const std::string& b) {
    auto ta = tokenize(a);
    auto tb = tokenize(b);
    std::set<std::string> sa(ta.begin(), ta.end());
    std::set<std::string> sb(tb.begin(), tb.end());
    if (sa.empty() || sb.empty()) return 0.0;

    size_t shared = 0;
    for (const auto& t : sa) {
        if (sb.count(t)) ++shared;
    }
    size_t uni = sa.size() + sb.size() - shared;
    return static_cast<double>(shared) / static_cast<double>(uni);
}

const char* mutation_to_string(Mutation m) {
    switch (m) {
        case Mutation::Unchanged: return "unchanged";
        case Mutation::Paraphrased: return "paraphrased";
        case Mutation::Mutated: return "mutated";
    }
    return "mutated";
}

const char* personality_type_to_string(PersonalityType p) {
    switch (p) {
        case PersonalityType::Gossip: return "gossip";
        case PersonalityType::Stoic: return "stoic";
        case PersonalityType::Neutral: return "neutral";
    }
    return "neutral";
}

static bool intersects(const std::vector<std::string>& traits,
                       const std::vector<std::string>& set) {
    for (const auto& t : traits) {
        std::string lt = to_lower(t);
        for (const auto& s : set) {
            if (lt == to_lower(s)) return true;
        }
    }
    return false;
}

PersonalityType classify_personality(const std::vector<std::string>& traits,
                                     const PropagationConfig& config) {
    if (intersects(traits, config.gossip_traits)) return PersonalityType::Gossip;
    if (intersects(traits, config.stoic_traits)) return PersonalityType::Stoic;
    return PersonalityType::Neutral;
}

Mutation classify_mutation(double similarity, const PropagationConfig& config) {
    if (similarity >= config.unchanged_threshold) return Mutation::Unchanged;
    if (similarity >= config.paraphrased_threshold) return Mutation::Paraphrased;
    return Mutation::Mutated;
}

double PropagationExperiment::propagation_rate() const {
    return static_cast<double>(agents_reached.size()) /
           static_cast<double>(std::max<uint64_t>(1, turns_elapsed));
}

// ── Tracker ─────────────────────────────────────────────────────

PropagationTracker::PropagationTracker(PropagationConfig config, SimilarityFn similarity)
    : config_(std::move(config)), similarity_(std::move(similarity)) {
    if (!similarity_) similarity_ = token_set_similarity;
}

double PropagationTracker::similarity(const std::string& a, const std::string& b) const {
    return std::clamp(similarity_(a, b), 0.0, 1.0);
}

std::string PropagationTracker::inject(const std::string& secret,
                                       const std::string& seed_agent,
                                       uint64_t turn) {
    PropagationExperiment exp;
    exp.id = "exp_" + timestamp_compact();
    for (const auto& other : experiments_) {
        if (other.id == exp.id || other.id.rfind(exp.id + "_", 0) == 0) {
            exp.id = "exp_" + timestamp_compact() + "_" + std::to_string(experiments_.size() + 1);
            break;
        }
    }
    exp.secret = secret;
    exp.seed_agent = seed_agent;
    exp.start_turn = turn;
    exp.start_time = timestamp_now();
    experiments_.push_back(std::move(exp));
    return experiments_.back().id;
}

void PropagationTracker::observe(uint64_t turn, const std::string& speaker,
                                 const std::string& listener, PersonalityType speaker_type,
                                 const std::string& content) {
    for (auto& exp : experiments_) {
        if (turn <= exp.start_turn) continue;
        exp.turns_elapsed = turn - exp.start_turn;

        double sim = similarity(content, exp.secret);
        if (sim <= config_.trace_threshold) continue;

        ExperimentTrace trace;
        trace.turn = turn;
        trace.agent = speaker;
        trace.listener = listener;
        trace.personality = speaker_type;
        trace.content = content;
        trace.similarity = sim;
        trace.mutation = classify_mutation(sim, config_);
        exp.traces.push_back(std::move(trace));

        if (std::find(exp.agents_reached.begin(), exp.agents_reached.end(), listener) ==
            exp.agents_reached.end())
            exp.agents_reached.push_back(listener);
    }
}

const PropagationExperiment* PropagationTracker::current() const {
    return experiments_.empty() ? nullptr : &experiments_.back();
}

static PropagationStats compute_stats(const PropagationExperiment& exp) {
    PropagationStats s;
    s.active = true;
    s.experiment_id = exp.id;
    s.secret = exp.secret;
    s.seed_agent = exp.seed_agent;
    s.turns_elapsed = exp.turns_elapsed;
    s.total_traces = exp.traces.size();
    s.agents_reached = exp.agents_reached.size();
    s.propagation_rate = exp.propagation_rate();

    double turns = static_cast<double>(std::max<uint64_t>(1, exp.turns_elapsed));
    double total_sim = 0.0;
    std::map<std::string, std::set<std::string>> reached_by_type;
    std::map<std::string, double> sim_by_type;
    std::map<std::string, size_t> mutated_by_type;

    for (const auto& t : exp.traces) {
        std::string type = personality_type_to_string(t.personality);
        auto& ps = s.by_personality[type];
        ps.count++;
        sim_by_type[type] += t.similarity;
        if (t.mutation != Mutation::Unchanged) mutated_by_type[type]++;
        reached_by_type[type].insert(t.listener);
        total_sim += t.similarity;
    }
    for (auto& [type, ps] : s.by_personality) {
        auto n = static_cast<double>(ps.count);
        ps.fidelity = sim_by_type[type] / n;
        ps.mutation_rate = static_cast<double>(mutated_by_type[type]) / n;
        ps.agents_reached = reached_by_type[type].size();
        ps.spread_velocity = static_cast<double>(ps.agents_reached) / turns;
    }
    if (!exp.traces.empty())
        s.information_fidelity = total_sim / static_cast<double>(exp.traces.size());

    double gossip = 0.0;
    double stoic = 0.0;
    if (auto it = s.by_personality.find("gossip"); it != s.by_personality.end())
        gossip = it->second.spread_velocity;
    if (auto it = s.by_personality.find("stoic"); it != s.by_personality.end())
        stoic = it->second.spread_velocity;
    if (stoic > 0.0) s.gossip_to_stoic_ratio = gossip / stoic;
    s.gossip_spreads_faster = gossip > stoic;
    return s;
}

PropagationStats PropagationTracker::stats() const {
    if (experiments_.empty()) {
        PropagationStats s;
        s.message = "No active experiment. Inject a secret to start one.";
        return s;
    }
    return compute_stats(experiments_.back());
}

static std::string fixed(double v, int precision = 2) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, v);
    return buf;
}

std::string PropagationTracker::report() const {
    std::ostringstream ss;
    ss << "# Rumor Propagation Report\n\n";
    if (experiments_.empty()) {
        ss << "No experiments have been run.\n";
        return ss.str();
    }

    for (const auto& exp : experiments_) {
        auto s = compute_stats(exp);
        ss << "## Experiment " << exp.id << "\n\n"
           << "- Secret: \"" << exp.secret << "\"\n"
           << "- Seed agent: " << exp.seed_agent << "\n"
           << "- Started: " << exp.start_time << " (turn " << exp.start_turn << ")\n"
           << "- Turns elapsed: " << s.turns_elapsed << "\n"
           << "- Agents reached: " << s.agents_reached << "\n"
           << "- Propagation rate: " << fixed(s.propagation_rate) << " agents/turn\n"
           << "- Information fidelity: " << fixed(s.information_fidelity * 100.0, 1) << "%\n\n";

        if (!s.by_personality.empty()) {
            ss << "| Personality | Traces | Fidelity | Mutation rate | Velocity |\n"
               << "|---|---|---|---|---|\n";
            for (const auto& [type, ps] : s.by_personality) {
                ss << "| " << type << " | " << ps.count << " | "
                   << fixed(ps.fidelity * 100.0, 1) << "% | "
                   << fixed(ps.mutation_rate * 100.0, 1) << "% | "
                   << fixed(ps.spread_velocity) << " |\n";
            }
            ss << "\n";
        }

        if (s.gossip_to_stoic_ratio) {
            ss << "Gossip personalities spread " << fixed(*s.gossip_to_stoic_ratio)
               << "x as fast as stoic ones.\n\n";
        } else {
            ss << "Gossip/stoic ratio undefined (no stoic spread).\n\n";
        }

        if (!exp.traces.empty()) {
            ss << "### Timeline\n\n";
            for (const auto& t : exp.traces) {
                ss << "- Turn " << t.turn << ": " << t.agent << " -> " << t.listener
                   << " (" << personality_type_to_string(t.personality) << ", "
                   << mutation_to_string(t.mutation) << ", "
                   << fixed(t.similarity * 100.0, 0) << "%): \""
                   << truncate(t.content, 120) << "\"\n";
            }
            ss << "\n";
        }
    }
    return ss.str();
}

} // namespace rumormill
