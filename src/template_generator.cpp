#include "template_generator.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <nlohmann/json.hpp>

namespace rumormill {

namespace {

using Lines = std::vector<std::string>;

const std::map<std::string, Lines>& openers() {
    static const std::map<std::string, Lines> table = {
        {"anxious", {"Look, ", "Between you and me, ", "I shouldn't say this, but ",
                     "Don't repeat this, but "}},
        {"grumpy", {"Hmph. ", "Typical. ", "You won't believe it. Actually, you will. ",
                    "Silver says "}},
        {"smooth", {"Hypothetically speaking, ", "A little bird mentioned ",
                    "If one were curious, ", "Word at the docks is "}},
        {"theatrical", {"Picture this, my friend: ", "Ah, a tale unfolds! ",
                        "Dear heart, have you heard? ", "The whispers compose themselves: "}},
        {"scattered", {"No no no wait, ", "So here's the thing, three things actually: ",
                       "I was just calibrating when ", "Between explosions, I noticed "}},
        {"calm", {"Interesting... ", "I've been noticing ", "The symptoms suggest ",
                  "One hears things, tending to the unwell... "}},
    };
    return table;
}

const std::map<std::string, Lines>& reactions() {
    static const std::map<std::string, Lines> table = {
        {"worried", {"and it keeps gnawing at me", "and I can't shake it",
                     "and nobody's doing anything about it"}},
        {"suspicious", {"and I don't like what it implies", "and someone's covering tracks",
                        "and the timing is too convenient"}},
        {"excited", {"and this changes everything", "and we could turn this to our advantage",
                     "and imagine the possibilities"}},
        {"bitter", {"and of course nobody listens", "and here we are again",
                    "and they'll blame us when it goes wrong"}},
        {"knowing", {"and I've seen this pattern before", "and it connects to something bigger",
                     "and you're smart enough to see it too"}},
    };
    return table;
}

std::string voice_type(const Persona& p) {
    static const std::map<std::string, std::string> by_key = {
        {"guard", "anxious"}, {"shopkeeper", "grumpy"}, {"smuggler", "smooth"},
        {"bard", "theatrical"}, {"artificer", "scattered"}, {"herbalist", "calm"},
    };
    auto it = by_key.find(p.key);
    return it == by_key.end() ? "anxious" : it->second;
}

std::string reaction_type(const std::string& mood) {
    static const std::map<std::string, std::string> by_mood = {
        {"irritable", "bitter"}, {"calculating", "knowing"}, {"secretly thrilled", "excited"},
        {"suspicious", "suspicious"}, {"sleep-deprived", "worried"}, {"determined", "knowing"},
        {"paranoid", "suspicious"}, {"grimly focused", "worried"}, {"playful", "excited"},
        {"defiant", "bitter"}, {"dangerously amused", "knowing"}, {"melodramatic", "excited"},
        {"mischievous", "knowing"}, {"wistful", "worried"},
        {"gleefully conspiratorial", "excited"}, {"wired", "excited"}, {"hopeful", "excited"},
        {"frazzled", "worried"}, {"manically focused", "suspicious"}, {"serene", "knowing"},
        {"concerned", "worried"}, {"quietly furious", "bitter"}, {"knowingly patient", "knowing"},
    };
    auto it = by_mood.find(mood);
    return it == by_mood.end() ? "worried" : it->second;
}

double mood_boost(const std::string& mood) {
    if (mood == "wired" || mood == "melodramatic" || mood == "defiant" || mood == "paranoid")
        return 1.15;
    if (mood == "serene" || mood == "knowingly patient") return 0.9;
    return 1.0;
}

std::string strip_trailing_period(std::string s) {
    while (!s.empty() && (s.back() == '.' || s.back() == ' ')) s.pop_back();
    return s;
}

// Memory lines arrive as "content (provenance)"; keep the content.
std::string memory_text(const std::string& line) {
    auto cut = line.rfind(" (");
    return cut == std::string::npos ? line : line.substr(0, cut);
}

} // namespace

std::string TemplateGenerator::generate(const GenerationRequest& request,
                                        std::chrono::milliseconds /*timeout*/) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto pick = [this](const Lines& lines) -> const std::string& {
        std::uniform_int_distribution<size_t> dist(0, lines.size() - 1);
        return lines[dist(rng_)];
    };

    std::string snippet = request.speaker_context.empty()
        ? request.last_event : memory_text(request.speaker_context.front());
    snippet = strip_trailing_period(snippet);
    std::string topic = strip_trailing_period(
        request.topic.empty() ? request.last_event : request.topic);

    const std::string& opener = pick(openers().at(voice_type(request.speaker)));
    const std::string& reaction = pick(reactions().at(reaction_type(request.speaker_mood)));

    const Lines details = {
        "that business with " + snippet,
        "what happened with " + snippet,
        "the " + to_lower(snippet) + " situation",
    };
    const Lines connections = {
        "it ties back to " + topic,
        "same pattern as " + topic,
        "can't be coincidence with " + topic,
    };
    std::string detail = pick(details);
    std::string connection = pick(connections);
    connection[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(connection[0])));

    std::uniform_real_distribution<double> spread(0.05, 0.25);
    double delta = spread(rng_) * request.speaker.rumor_bias * mood_boost(request.speaker_mood);
    delta = std::round(delta * 100.0) / 100.0;
    delta = std::clamp(delta, 0.05, 0.35);

    std::string sentiment = delta > 0.28 ? "urgent" : delta > 0.18 ? "tense" : "worried";

    nlohmann::json reply = {
        {"utterance", opener + detail + ". " + connection + ", " + reaction + "."},
        {"internal_monologue", request.speaker.short_name + " wonders how much "
            + request.listener.short_name + " already knows."},
        {"rumor_delta", delta},
        {"sentiment", sentiment},
        {"new_memory", request.speaker.short_name + " (" + request.speaker.profession
            + ") confided while feeling " + request.speaker_mood + " that " + topic
            + " connects to " + snippet + "."},
    };
    return reply.dump();
}

} // namespace rumormill
