#pragma once
#include "dialogue.hpp"
#include "generation.hpp"
#include "world_state.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace rumormill {

// Tag-based event dispatch, no RTTI.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* TurnCompleted  = "TurnCompleted";
    constexpr const char* StepFailed     = "StepFailed";
    constexpr const char* SimulationReset = "SimulationReset";
    constexpr const char* SecretInjected = "SecretInjected";
    constexpr const char* LoopState      = "LoopState";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

// Published once per committed turn, with the state right after it.
struct TurnCompletedEvent : Event {
    static constexpr const char* TAG = event_tags::TurnCompleted;
    DialogueTurn turn;
    WorldState world;

    TurnCompletedEvent() { type_tag = TAG; }
};

// A step was abandoned after its retry; nothing was committed.
struct StepFailedEvent : Event {
    static constexpr const char* TAG = event_tags::StepFailed;
    uint64_t turn = 0;
    std::string speaker_id;
    std::string listener_id;
    GenerationErrorKind kind = GenerationErrorKind::InvalidResponse;
    std::string message;

    StepFailedEvent() { type_tag = TAG; }
};

struct SimulationResetEvent : Event {
    static constexpr const char* TAG = event_tags::SimulationReset;
    std::string seed_event;
    std::vector<std::string> roster;

    SimulationResetEvent() { type_tag = TAG; }
};

struct SecretInjectedEvent : Event {
    static constexpr const char* TAG = event_tags::SecretInjected;
    std::string experiment_id;
    std::string seed_agent;
    std::string secret;

    SecretInjectedEvent() { type_tag = TAG; }
};

struct LoopStateEvent : Event {
    static constexpr const char* TAG = event_tags::LoopState;
    bool running = false;

    LoopStateEvent() { type_tag = TAG; }
};

} // namespace rumormill
