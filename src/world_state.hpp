#pragma once
#include "config.hpp"
#include <cstdint>
#include <deque>
#include <string>

namespace rumormill {

struct RumorLogEntry {
    uint64_t turn = 0;
    std::string speaker;
    std::string content;
    double delta = 0.0;
};

// Shared town state. Mutated once per completed turn by the orchestrator;
// observers only ever receive copies.
struct WorldState {
    double rumor_heat = 0.0;          // [0, 1]
    double guard_alert_level = 0.2;   // [0, 1]
    double shop_price_modifier = 1.0; // [0.5, 1.5]
    std::string last_event;
    std::string current_thread;       // opening of the latest utterance
    std::deque<RumorLogEntry> rumor_log;
    std::deque<std::string> conversation_beats;

    static WorldState initial(const std::string& seed_event, const WorldConfig& cfg);

    // Topic the next speaker should riff on.
    std::string topic() const;

    void apply_rumor(const std::string& speaker, const std::string& content,
                     double delta, uint64_t turn, const WorldConfig& cfg);
};

} // namespace rumormill
