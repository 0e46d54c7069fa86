#pragma once
#include <string>

namespace rumormill {

struct GenerationRequest;

// System prompt for the dialogue writer. The strict variant is used for
// the single retry after a rejected reply.
std::string build_dialogue_system_prompt(bool strict);

// Per-turn user prompt: scene, both characters, what the speaker
// remembers (with provenance), and the JSON reply contract.
std::string build_dialogue_prompt(const GenerationRequest& request);

// "low" / "moderate" / "high" for a rumor_heat value.
std::string tension_label(double rumor_heat);

} // namespace rumormill
