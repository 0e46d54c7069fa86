#pragma once
#include "dialogue.hpp"
#include "graph.hpp"
#include "propagation.hpp"
#include "world_state.hpp"
#include <nlohmann/json.hpp>

namespace rumormill {

struct SimulationSnapshot;
struct StepOutcome;
struct AgentState;

// JSON views for the presentation layer. Scalars are rounded to two
// decimals; the rumor log is cut to its newest ten entries.

nlohmann::json turn_to_json(const DialogueTurn& turn);
nlohmann::json world_to_json(const WorldState& world);
nlohmann::json agent_to_json(const AgentState& agent);
nlohmann::json snapshot_to_json(const SimulationSnapshot& snapshot);
nlohmann::json step_outcome_to_json(const StepOutcome& outcome);

nlohmann::json graph_stats_to_json(const GraphStats& stats);
nlohmann::json entity_to_json(const Entity& entity);
nlohmann::json relationship_to_json(const Relationship& rel);
nlohmann::json entity_context_to_json(const EntityContext& ctx);

// Every node and edge, for export.
nlohmann::json graph_to_json(const KnowledgeGraph& graph);

nlohmann::json propagation_stats_to_json(const PropagationStats& stats);
nlohmann::json experiment_to_json(const PropagationExperiment& exp);

double round2(double v);

} // namespace rumormill
