#include "serialize.hpp"
#include "orchestrator.hpp"

#include <cmath>

using json = nlohmann::json;

namespace rumormill {

static constexpr size_t kLogView = 10;

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

json turn_to_json(const DialogueTurn& t) {
    return json{
        {"turn", t.turn},
        {"speaker_id", t.speaker_id},
        {"listener_id", t.listener_id},
        {"speaker", t.speaker_name},
        {"listener", t.listener_name},
        {"speaker_profession", t.speaker_profession},
        {"listener_profession", t.listener_profession},
        {"speaker_mood", t.speaker_mood},
        {"listener_mood", t.listener_mood},
        {"content", t.content},
        {"internal_monologue", t.internal_monologue},
        {"sentiment", t.sentiment},
        {"rumor_delta", round2(t.rumor_delta)},
        {"graph_context", t.graph_context},
        {"timestamp", t.timestamp},
    };
}

json world_to_json(const WorldState& w) {
    json log = json::array();
    size_t skip = w.rumor_log.size() > kLogView ? w.rumor_log.size() - kLogView : 0;
    for (size_t i = skip; i < w.rumor_log.size(); ++i) {
        const auto& entry = w.rumor_log[i];
        log.push_back({
            {"turn", entry.turn},
            {"speaker", entry.speaker},
            {"content", entry.content},
            {"delta", round2(entry.delta)},
        });
    }

    return json{
        {"rumor_heat", round2(w.rumor_heat)},
        {"guard_alert_level", round2(w.guard_alert_level)},
        {"shop_price_modifier", round2(w.shop_price_modifier)},
        {"last_event", w.last_event},
        {"current_thread", w.current_thread},
        {"rumor_log", log},
        {"conversation_beats", json(std::vector<std::string>(w.conversation_beats.begin(),
                                                            w.conversation_beats.end()))},
    };
}

json agent_to_json(const AgentState& a) {
    return json{
        {"id", a.id},
        {"persona", a.persona.key},
        {"name", a.persona.name},
        {"short_name", a.persona.short_name},
        {"profession", a.persona.profession},
        {"mood", a.mood.label},
        {"tension", round2(a.mood.tension)},
        {"personality", personality_type_to_string(a.personality)},
        {"unshared", a.unshared},
    };
}

json snapshot_to_json(const SimulationSnapshot& s) {
    json history = json::array();
    for (const auto& t : s.history) history.push_back(turn_to_json(t));
    json agents = json::array();
    for (const auto& a : s.agents) agents.push_back(agent_to_json(a));

    return json{
        {"turn", s.turn},
        {"state", run_state_to_string(s.state)},
        {"seed_event", s.seed_event},
        {"generator", s.generator},
        {"world", world_to_json(s.world)},
        {"agents", agents},
        {"history", history},
    };
}

json step_outcome_to_json(const StepOutcome& o) {
    json j = {{"status", step_status_to_string(o.status)}};
    if (o.turn) j["turn"] = turn_to_json(*o.turn);
    if (o.error) {
        j["error"] = {
            {"kind", generation_error_kind_to_string(o.error->kind)},
            {"message", o.error->message},
        };
    }
    return j;
}

// ── Graph ───────────────────────────────────────────────────────

json graph_stats_to_json(const GraphStats& s) {
    return json{
        {"entity_count", s.entity_count},
        {"edge_count", s.edge_count},
        {"counts_by_type", s.counts_by_type},
        {"edge_counts_by_type", s.edge_counts_by_type},
    };
}

json entity_to_json(const Entity& e) {
    return json{
        {"id", e.id},
        {"type", entity_type_to_string(e.type)},
        {"name", e.name},
        {"attributes", e.attributes},
        {"created_at", e.created_at},
    };
}

json relationship_to_json(const Relationship& r) {
    json j = {
        {"source", r.src},
        {"target", r.dst},
        {"type", relation_type_to_string(r.type)},
        {"created_at", r.created_at},
        {"weight", round2(r.weight)},
    };
    if (!r.attributes.empty()) j["attributes"] = r.attributes;
    return j;
}

json entity_context_to_json(const EntityContext& ctx) {
    json rels = json::array();
    for (const auto& n : ctx.relationships) {
        json r = relationship_to_json(*n.edge);
        r["direction"] = n.edge->src == ctx.entity->id ? "out" : "in";
        r["other"] = {{"id", n.entity->id}, {"name", n.entity->name},
                      {"type", entity_type_to_string(n.entity->type)}};
        rels.push_back(std::move(r));
    }

    json connected = json::array();
    for (const auto& [entity, distance] : ctx.connected) {
        connected.push_back({
            {"id", entity->id},
            {"name", entity->name},
            {"type", entity_type_to_string(entity->type)},
            {"distance", distance},
        });
    }

    return json{
        {"entity", entity_to_json(*ctx.entity)},
        {"relationships", rels},
        {"connected", connected},
    };
}

json graph_to_json(const KnowledgeGraph& graph) {
    json nodes = json::array();
    for (const auto& e : graph.entities()) nodes.push_back(entity_to_json(e));
    json edges = json::array();
    for (const auto& r : graph.edges()) edges.push_back(relationship_to_json(r));
    return json{{"nodes", nodes}, {"edges", edges}};
}

// ── Propagation ─────────────────────────────────────────────────

json propagation_stats_to_json(const PropagationStats& s) {
    if (!s.active) return json{{"active", false}, {"message", s.message}};

    json by_type = json::object();
    for (const auto& [type, ps] : s.by_personality) {
        by_type[type] = {
            {"count", ps.count},
            {"fidelity", round2(ps.fidelity)},
            {"mutation_rate", round2(ps.mutation_rate)},
            {"agents_reached", ps.agents_reached},
            {"spread_velocity", round2(ps.spread_velocity)},
        };
    }

    json j = {
        {"active", true},
        {"experiment_id", s.experiment_id},
        {"secret", s.secret},
        {"seed_agent", s.seed_agent},
        {"turns_elapsed", s.turns_elapsed},
        {"total_traces", s.total_traces},
        {"agents_reached", s.agents_reached},
        {"propagation_rate", round2(s.propagation_rate)},
        {"information_fidelity", round2(s.information_fidelity)},
        {"by_personality", by_type},
        {"gossip_spreads_faster", s.gossip_spreads_faster},
    };
    if (s.gossip_to_stoic_ratio) j["gossip_to_stoic_ratio"] = round2(*s.gossip_to_stoic_ratio);
    return j;
}

json experiment_to_json(const PropagationExperiment& exp) {
    json traces = json::array();
    for (const auto& t : exp.traces) {
        traces.push_back({
            {"turn", t.turn},
            {"agent", t.agent},
            {"listener", t.listener},
            {"personality", personality_type_to_string(t.personality)},
            {"content", t.content},
            {"similarity", round2(t.similarity)},
            {"mutation", mutation_to_string(t.mutation)},
        });
    }
    return json{
        {"id", exp.id},
        {"secret", exp.secret},
        {"seed_agent", exp.seed_agent},
        {"start_turn", exp.start_turn},
        {"start_time", exp.start_time},
        {"turns_elapsed", exp.turns_elapsed},
        {"agents_reached", exp.agents_reached},
        {"propagation_rate", round2(exp.propagation_rate())},
        {"traces", traces},
    };
}

} // namespace rumormill
