#include "prompt.hpp"
#include "generation.hpp"

#include <sstream>

namespace rumormill {

std::string tension_label(double rumor_heat) {
    if (rumor_heat > 0.6) return "high";
    if (rumor_heat > 0.3) return "moderate";
    return "low";
}

std::string build_dialogue_system_prompt(bool strict) {
    std::ostringstream ss;
    ss << "You write dialogue for the townsfolk of a small medieval fantasy harbor town.\n"
       << "Produce ONE line of in-character speech per request.\n\n"
       << "Rules:\n"
       << "- Spoken words only: no narration, no stage directions, no asterisks.\n"
       << "- Keep each character's voice: vocabulary, rhythm, verbal tics.\n"
       << "- Use contractions and natural hesitation; drop hints rather than explain.\n"
       << "- React to what was just said and add something new.\n"
       << "- Never open with the listener's name.\n\n"
       << "Reply with a single JSON object:\n"
       << "{\"utterance\": string, \"internal_monologue\": string, "
       << "\"rumor_delta\": number, \"sentiment\": string, \"new_memory\": string}\n";
    if (strict) {
        ss << "\nYour previous reply could not be used. Output ONLY the JSON object: "
           << "no markdown, no commentary, no trailing text. \"utterance\" must be a "
           << "non-empty string and \"rumor_delta\" a number between 0 and 1.\n";
    }
    return ss.str();
}

std::string build_dialogue_prompt(const GenerationRequest& request) {
    const Persona& speaker = request.speaker;
    const Persona& listener = request.listener;

    std::ostringstream ss;
    ss << "SCENE\n"
       << "Town tension: " << tension_label(request.rumor_heat) << "\n"
       << "Inciting incident: " << request.last_event << "\n"
       << "Current thread: " << request.topic << "\n";

    if (!request.history.empty()) {
        ss << "\nRECENT CONVERSATION (respond to it, do not repeat it):\n";
        int i = 1;
        for (const auto& line : request.history) {
            ss << i++ << ". \"" << line << "\"\n";
        }
    }

    ss << "\nSPEAKER\n" << speaker.describe(request.speaker_mood) << "\n"
       << "\nLISTENER\n" << listener.name << " (" << listener.profession
       << "), currently " << request.listener_mood << ".\n";

    ss << "\nWHAT " << speaker.short_name << " REMEMBERS:\n";
    if (request.speaker_context.empty()) {
        ss << "- Nothing relevant yet\n";
    } else {
        for (const auto& line : request.speaker_context) ss << "- " << line << "\n";
    }
    if (!request.listener_context.empty()) {
        ss << "\nWHAT " << listener.short_name << " ALREADY KNOWS:\n";
        for (const auto& line : request.listener_context) ss << "- " << line << "\n";
    }

    ss << "\nTASK\n"
       << "Write what " << speaker.short_name << " says to " << listener.short_name
       << " right now. Their " << request.speaker_mood << " mood colors how they say it; "
       << "their work as " << speaker.profession << " colors what they notice.\n\n"
       << "Return JSON with:\n"
       << "- \"utterance\": 1-3 spoken sentences\n"
       << "- \"internal_monologue\": what " << speaker.short_name << " privately thinks\n"
       << "- \"rumor_delta\": how much this intensifies the rumor "
       << "(0.05 idle chat, 0.35 explosive revelation)\n"
       << "- \"sentiment\": one word (curious, worried, tense, urgent, knowing, bitter...)\n"
       << "- \"new_memory\": a short note of the new information shared\n";
    return ss.str();
}

} // namespace rumormill
