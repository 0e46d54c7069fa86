#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace rumormill {

// One completed exchange, as it looked when it happened.
struct DialogueTurn {
    uint64_t turn = 0;
    std::string speaker_id;
    std::string listener_id;
    std::string speaker_name;
    std::string listener_name;
    std::string speaker_profession;
    std::string listener_profession;
    std::string speaker_mood;
    std::string listener_mood;
    std::string content;
    std::string internal_monologue;
    std::string sentiment;
    double rumor_delta = 0.0;
    std::vector<std::string> graph_context; // provenance lines behind the prompt
    std::string timestamp;
};

} // namespace rumormill
