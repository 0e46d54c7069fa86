#pragma once
#include "config.hpp"
#include "dialogue.hpp"
#include "extractor.hpp"
#include "generation.hpp"
#include "graph.hpp"
#include "persona.hpp"
#include "propagation.hpp"
#include "retriever.hpp"
#include "world_state.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace rumormill {

class EventBus;

enum class RunState { Idle, RunningSingleStep, RunningLoop, Stopped };

const char* run_state_to_string(RunState state);

enum class StepStatus { Ok, Busy, Failed };

const char* step_status_to_string(StepStatus status);

struct StepOutcome {
    StepStatus status = StepStatus::Ok;
    std::optional<DialogueTurn> turn;     // set when Ok
    std::optional<GenerationError> error; // set when Failed

    bool ok() const { return status == StepStatus::Ok; }
};

// Per-NPC mutable state. The persona is copied at reset.
struct AgentState {
    std::string id; // graph id, "npc:mara"
    Persona persona;
    Mood mood;
    PersonalityType personality = PersonalityType::Neutral;
    uint32_t unshared = 0; // memories received since this agent last spoke
};

struct SimulationSnapshot {
    uint64_t turn = 0;
    RunState state = RunState::Idle;
    std::string seed_event;
    std::string generator;
    WorldState world;
    std::vector<DialogueTurn> history; // oldest first
    std::vector<AgentState> agents;
};

struct TrackedRun {
    std::vector<StepOutcome> outcomes;
    PropagationStats stats;
};

// Turn-taking scheduler and the only writer of simulation state.
//
// A turn holds step_mutex_ from pair selection to event publication, so
// at most one generation call is ever in flight. The commit itself runs
// under an exclusive state_mutex_; every read accessor takes it shared
// and returns copies, so observers see either the state before a turn or
// the state after it. A manual step while the loop runs, or while another
// step is in progress, is rejected with Busy.
class Orchestrator {
public:
    Orchestrator(const Config& config, std::unique_ptr<Generator> generator,
                 PersonaRegistry registry = PersonaRegistry::builtin(),
                 SimilarityFn similarity = token_set_similarity);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Optional event bus integration (nullptr = disabled)
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

    void set_generation_timeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

    // ── Stepping ────────────────────────────────────────────────

    StepOutcome step();

    // Runs up to n turns back to back (n = 0 runs one). Stops early when
    // Busy; failed turns are reported and do not stop the batch.
    std::vector<StepOutcome> run_steps(uint32_t n);

    // run_steps() followed by the propagation stats it produced.
    TrackedRun run_tracked_steps(uint32_t n);

    // Background loop, one turn per interval. Returns false if already running.
    bool start_loop();
    bool start_loop(std::chrono::milliseconds interval);

    // Cancels between turns and joins. Must not be called from a turn
    // handler running on the loop thread.
    bool stop_loop();

    RunState state() const { return state_.load(); }

    // Rebuilds the whole simulation. An empty seed_event picks one of the
    // configured rumor seeds; an empty roster picks from the persona pool.
    // Throws std::invalid_argument for an unknown persona key or a roster
    // of fewer than two.
    void reset(const std::string& seed_event = "",
               const std::vector<std::string>& roster = {});

    // Plants a secret in one agent's memory and opens a propagation
    // experiment. agent may be a graph id, persona key or short name.
    // Returns the experiment id. Throws UnknownEntity for an unknown agent
    // and std::invalid_argument for an empty secret.
    std::string inject_secret(const std::string& agent, const std::string& secret);

    // ── Read side (shared lock, copies out) ─────────────────────

    SimulationSnapshot snapshot() const;
    std::vector<DialogueTurn> history(size_t limit = 20) const;
    WorldState world() const;
    GraphStats graph_stats() const;
    nlohmann::json graph_json() const;
    // Shortest chain of out-edges from src to dst; empty when unreachable.
    // Throws UnknownEntity for an unknown id.
    std::vector<Relationship> relationship_path(const std::string& src,
                                                const std::string& dst) const;

    // Neighborhood of an entity, rendered by the serializer. Throws
    // UnknownEntity.
    nlohmann::json entity_context(const std::string& id, uint32_t depth = 2) const;

    PropagationStats propagation_stats() const;
    std::vector<PropagationExperiment> timeline() const;
    std::string report() const;

    uint64_t turn() const;
    std::vector<AgentState> agents() const;
    std::string generator_name() const { return generator_->name(); }
    const Config& config() const { return config_; }

private:
    struct PlannedTurn {
        size_t speaker = 0;
        size_t listener = 0;
        GenerationRequest request;
        std::vector<std::string> graph_context;
    };

    StepOutcome step_locked();
    PlannedTurn plan_turn();
    GenerationOutcome generate_once(const GenerationRequest& request);
    DialogueTurn commit(const PlannedTurn& plan, const GenerationResult& result);
    void fail(const PlannedTurn& plan, const GenerationError& error);

    size_t pick_speaker();
    size_t pick_listener(size_t speaker);
    std::vector<std::string> format_context(const RetrievalResult& result) const;
    std::vector<std::string> validate_roster(const std::vector<std::string>& roster) const;
    size_t find_agent(const std::string& name) const;

    void loop_main(std::chrono::milliseconds interval);
    void publish_loop_state(bool running);

    Config config_;
    PersonaRegistry registry_;
    std::unique_ptr<Generator> generator_;
    EventBus* event_bus_ = nullptr;
    std::chrono::milliseconds timeout_;

    KnowledgeGraph graph_;
    EntityExtractor extractor_;
    ContextRetriever retriever_;
    PropagationTracker tracker_;

    WorldState world_;
    std::deque<DialogueTurn> history_;
    std::vector<AgentState> agents_;
    std::map<std::string, std::map<std::string, uint32_t>> told_counts_;
    std::string seed_event_;
    uint64_t turn_ = 0;
    std::mt19937 rng_;

    mutable std::shared_mutex state_mutex_;
    std::mutex step_mutex_;
    std::atomic<RunState> state_{RunState::Idle};

    std::mutex control_mutex_; // start_loop / stop_loop
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    std::atomic<bool> stop_requested_{false};
    std::thread loop_thread_;
};

} // namespace rumormill
