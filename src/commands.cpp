#include "commands.hpp"
#include "config.hpp"
#include "orchestrator.hpp"
#include "provider.hpp"
#include "serialize.hpp"
#include "util.hpp"

#include <cstdio>
#include <optional>

using json = nlohmann::json;

namespace rumormill {

static std::string fixed2(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}

// Positive count from args; fallback when blank, nullopt when invalid.
static std::optional<uint32_t> parse_count(const std::string& args, uint32_t fallback) {
    std::string s = trim(args);
    if (s.empty()) return fallback;
    try {
        size_t used = 0;
        unsigned long n = std::stoul(s, &used);
        if (used != s.size() || n == 0 || n > 10000) return std::nullopt;
        return static_cast<uint32_t>(n);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

static std::string format_outcomes(const std::vector<StepOutcome>& outcomes) {
    std::string out;
    size_t ok = 0;
    for (const auto& o : outcomes) {
        switch (o.status) {
            case StepStatus::Ok:
                out += format_turn(*o.turn) + "\n";
                ok++;
                break;
            case StepStatus::Busy:
                out += "Busy: a turn is already running.\n";
                break;
            case StepStatus::Failed:
                out += std::string("Turn failed (")
                    + generation_error_kind_to_string(o.error->kind) + "): "
                    + o.error->message + "\n";
                break;
        }
    }
    out += std::to_string(ok) + "/" + std::to_string(outcomes.size()) + " turns completed";
    return out;
}

std::string format_turn(const DialogueTurn& t) {
    return "[" + std::to_string(t.turn) + "] " + t.speaker_name + " -> " + t.listener_name
        + " (" + t.sentiment + ", +" + fixed2(t.rumor_delta) + "): " + t.content;
}

// ── Read-only commands ──────────────────────────────────────────

std::string cmd_status(const Orchestrator& orch) {
    auto snap = orch.snapshot();
    std::string agents;
    for (const auto& a : snap.agents) {
        if (!agents.empty()) agents += ", ";
        agents += a.persona.short_name + " (" + a.mood.label + ")";
    }
    return "Generator: " + snap.generator + "\n"
        + "State: " + run_state_to_string(snap.state) + "\n"
        + "Turn: " + std::to_string(snap.turn) + "\n"
        + "Agents: " + agents + "\n"
        + "Rumor heat: " + fixed2(snap.world.rumor_heat)
        + " | Guard alert: " + fixed2(snap.world.guard_alert_level)
        + " | Prices: x" + fixed2(snap.world.shop_price_modifier) + "\n"
        + "Topic: " + snap.world.topic() + "\n";
}

std::string cmd_state(const Orchestrator& orch) {
    return snapshot_to_json(orch.snapshot()).dump(2);
}

std::string cmd_history(const std::string& args, const Orchestrator& orch) {
    auto limit = parse_count(args, 20);
    if (!limit) return "Usage: /history [N]";
    auto turns = orch.history(*limit);
    if (turns.empty()) return "No dialogue yet.";
    std::string out;
    for (const auto& t : turns) out += format_turn(t) + "\n";
    return out;
}

// "location:vault" is taken as an id, "location Vault" as type and name,
// anything else as an npc name.
static std::string resolve_entity_id(const std::string& s) {
    auto colon = s.find(':');
    if (colon != std::string::npos && entity_type_from_string(to_lower(s.substr(0, colon)))) {
        return to_lower(s);
    }
    auto space = s.find(' ');
    auto type = entity_type_from_string(to_lower(s.substr(0, space)));
    if (type && space != std::string::npos) {
        return KnowledgeGraph::make_id(*type, s.substr(space + 1));
    }
    return KnowledgeGraph::make_id(EntityType::Npc, s);
}

std::string cmd_graph(const std::string& args, const Orchestrator& orch) {
    std::string s = trim(args);
    if (s == "json") return orch.graph_json().dump(2) + "\n";
    if (!s.empty()) return "Usage: /graph [json]\n";

    auto stats = orch.graph_stats();
    std::string out = "Entities: " + std::to_string(stats.entity_count) + "\n";
    for (const auto& [type, n] : stats.counts_by_type) {
        out += "  " + type + ": " + std::to_string(n) + "\n";
    }
    out += "Edges: " + std::to_string(stats.edge_count) + "\n";
    for (const auto& [type, n] : stats.edge_counts_by_type) {
        out += "  " + type + ": " + std::to_string(n) + "\n";
    }
    return out;
}

std::string cmd_entity(const std::string& args, const Orchestrator& orch) {
    std::string s = trim(args);
    if (s.empty()) return "Usage: /entity <type> <name> | /entity <id>";

    try {
        return orch.entity_context(resolve_entity_id(s)).dump(2);
    } catch (const UnknownEntity& e) {
        return e.what();
    }
}

std::string cmd_path(const std::string& args, const Orchestrator& orch) {
    static const char* kUsage = "Usage: /path <from> <to> | /path <from> to <to>";
    std::string s = trim(args);
    std::string from, to;
    auto sep = s.find(" to ");
    if (sep != std::string::npos) {
        from = trim(s.substr(0, sep));
        to = trim(s.substr(sep + 4));
    } else {
        auto space = s.find(' ');
        if (space == std::string::npos) return kUsage;
        from = s.substr(0, space);
        to = trim(s.substr(space + 1));
        if (to.find(' ') != std::string::npos) return kUsage;
    }
    if (from.empty() || to.empty()) return kUsage;

    std::string src = resolve_entity_id(from);
    std::string dst = resolve_entity_id(to);
    std::vector<Relationship> path;
    try {
        path = orch.relationship_path(src, dst);
    } catch (const UnknownEntity& e) {
        return e.what();
    }
    if (path.empty()) return "No path from " + src + " to " + dst + ".";

    std::string out;
    for (const auto& rel : path) {
        out += rel.src + " -[" + relation_type_to_string(rel.type) + "]-> " + rel.dst + "\n";
    }
    return out;
}

std::string cmd_stats(const Orchestrator& orch) {
    auto stats = orch.propagation_stats();
    if (!stats.active) return stats.message;
    return propagation_stats_to_json(stats).dump(2);
}

std::string cmd_timeline(const Orchestrator& orch) {
    json arr = json::array();
    for (const auto& exp : orch.timeline()) arr.push_back(experiment_to_json(exp));
    return arr.dump(2);
}

std::string cmd_report(const Orchestrator& orch) {
    return orch.report();
}

std::string cmd_providers(const Config& config) {
    std::string out = "Providers:\n";
    for (const auto& info : list_providers(config)) {
        out += "  " + info.name + " - " + info.auth;
        if (info.active) out += " (active)";
        out += "\n";
    }
    return out;
}

// ── Mutating commands ───────────────────────────────────────────

std::string cmd_step(Orchestrator& orch) {
    return format_outcomes({orch.step()});
}

std::string cmd_run(const std::string& args, Orchestrator& orch) {
    auto n = parse_count(args, 1);
    if (!n) return "Usage: /run <N>";
    return format_outcomes(orch.run_steps(*n));
}

std::string cmd_track(const std::string& args, Orchestrator& orch) {
    auto n = parse_count(args, 10);
    if (!n) return "Usage: /track [N]";
    auto run = orch.run_tracked_steps(*n);
    std::string out = format_outcomes(run.outcomes) + "\n";
    if (!run.stats.active) return out + run.stats.message;
    return out + "Agents reached: " + std::to_string(run.stats.agents_reached)
        + " | Fidelity: " + fixed2(run.stats.information_fidelity)
        + " | Rate: " + fixed2(run.stats.propagation_rate) + " agents/turn";
}

std::string cmd_loop(const std::string& args, Orchestrator& orch) {
    std::string s = trim(args);
    auto space = s.find(' ');
    std::string verb = space == std::string::npos ? s : s.substr(0, space);
    std::string rest = space == std::string::npos ? "" : s.substr(space + 1);

    if (verb == "start") {
        bool started;
        if (rest.empty()) {
            started = orch.start_loop();
        } else {
            auto ms = parse_count(rest, 0);
            if (!ms) return "Usage: /loop start [interval_ms]";
            started = orch.start_loop(std::chrono::milliseconds(*ms));
        }
        return started ? "Loop started." : "Loop already running.";
    }
    if (verb == "stop") {
        return orch.stop_loop() ? "Loop stopped." : "Loop is not running.";
    }
    if (verb.empty()) {
        return std::string("Loop state: ") + run_state_to_string(orch.state());
    }
    return "Usage: /loop start [interval_ms] | /loop stop";
}

std::string cmd_reset(const std::string& args, Orchestrator& orch) {
    std::string s = trim(args);
    std::vector<std::string> roster;
    if (s.rfind("--roster ", 0) == 0) {
        std::string rest = trim(s.substr(9));
        auto space = rest.find(' ');
        for (auto& key : split(rest.substr(0, space), ',')) {
            if (!trim(key).empty()) roster.push_back(trim(key));
        }
        s = space == std::string::npos ? "" : trim(rest.substr(space + 1));
    }

    try {
        orch.reset(s, roster);
    } catch (const std::invalid_argument& e) {
        return e.what();
    }

    auto snap = orch.snapshot();
    std::string names;
    for (const auto& a : snap.agents) {
        if (!names.empty()) names += ", ";
        names += a.persona.short_name;
    }
    return "Simulation reset with " + names + ".\nSeed: " + snap.seed_event;
}

std::string cmd_inject(const std::string& args, Orchestrator& orch) {
    std::string s = trim(args);
    auto space = s.find(' ');
    if (space == std::string::npos) return "Usage: /inject <agent> <secret>";

    try {
        std::string id = orch.inject_secret(s.substr(0, space), s.substr(space + 1));
        return "Secret injected. Experiment: " + id;
    } catch (const UnknownEntity& e) {
        return "Unknown agent: " + e.entity_id();
    } catch (const std::invalid_argument& e) {
        return e.what();
    }
}

std::string cmd_experiment(const std::string& args, Orchestrator& orch) {
    static const char* kDefaultSecret =
        "The mayor has been secretly meeting with the rebel faction.";

    std::string s = trim(args);
    uint32_t rounds = 10;
    auto space = s.find(' ');
    auto first = parse_count(s.substr(0, space), 0);
    if (first && *first > 0) {
        rounds = *first;
        s = space == std::string::npos ? "" : trim(s.substr(space + 1));
    }
    std::string secret = s.empty() ? kDefaultSecret : s;

    std::string out = cmd_reset("", orch) + "\n";
    auto agents = orch.agents();
    std::string id = orch.inject_secret(agents.front().id, secret);
    out += "Secret planted with " + agents.front().persona.short_name
        + ". Experiment: " + id + "\n\n";

    auto run = orch.run_tracked_steps(rounds);
    out += format_outcomes(run.outcomes) + "\n";
    return out + orch.report();
}

} // namespace rumormill
