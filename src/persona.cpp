#include "persona.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace rumormill {

static std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

std::string Persona::describe(const std::string& mood) const {
    std::ostringstream ss;
    ss << "You are " << name << ", a " << profession << ". Voice: " << voice << " "
       << "Traits: " << join(traits, ", ") << ". "
       << "Goals: " << join(goals, ", ") << ". "
       << "Quirks: " << join(quirks, ", ") << ". "
       << "Current mood: " << mood << ".";
    if (!default_topics.empty())
        ss << " Favourite topics: " << join(default_topics, ", ") << ".";
    if (!forbidden_topics.empty())
        ss << " Never talk about: " << join(forbidden_topics, ", ") << ".";
    return ss.str();
}

// ── Registry ────────────────────────────────────────────────────

PersonaRegistry PersonaRegistry::builtin() {
    PersonaRegistry r;

    r.add({"shopkeeper", "Mara, the Grumpy Shopkeeper", "Mara", "Quartermaster",
           "Clipped sentences, heavy sighs, trails off when annoyed. Uses trade jargon. "
           "Says 'hmph' and 'typical' often.",
           {"grumpy", "shrewd", "careful"},
           {"Protect profit margins", "Avoid chaos",
            "Maintain her network of informants disguised as customers"},
           {"her own debts"},
           {"Complains about taxes mid-sentence", "Refers to money as 'silver' never 'coins'",
            "Taps fingers when someone's lying"},
           {"irritable", "calculating", "suspicious", "secretly thrilled"},
           {"supply chain disruptions", "who's been buying what",
            "tax collectors' movements"},
           {"shopkeeper", "quartermaster"},
           0.7});

    r.add({"guard", "Rylan, the Anxious Guard", "Rylan", "Night Watch Captain",
           "Hushed, urgent tones with pauses to listen. Military terminology. "
           "Starts sentences with 'Look' or 'Between you and me'.",
           {"anxious", "dutiful", "guarded"},
           {"Keep the town safe without causing panic", "Prove he deserved this promotion",
            "Find the source of the strange occurrences"},
           {"the watch roster"},
           {"Checks over shoulder mid-conversation", "Keeps a mental tally of incidents",
            "Never sits with back to door"},
           {"determined", "sleep-deprived", "grimly focused", "paranoid"},
           {"patrol blind spots", "things heard after midnight",
            "who's been asking about the vault"},
           {"guard", "captain", "night watch captain"},
           1.3});

    r.add({"smuggler", "Iris, the Harbor Smuggler", "Iris", "Dockside Fixer",
           "Velvet-smooth with a smirk you can hear. Speaks in implications and nautical "
           "slang. Ends with 'hypothetically speaking'.",
           {"sly", "curious", "playful"},
           {"Protect her network of tunnels and contacts", "Stay three steps ahead of the Watch",
            "Turn every crisis into profit"},
           {"her tunnel routes"},
           {"Talks to seagulls when thinking", "Keeps coded ledgers in her boot",
            "Always knows the tide schedule"},
           {"playful", "calculating", "defiant", "dangerously amused"},
           {"fog patterns and what moves in them", "whose debts are coming due",
            "new faces at the docks"},
           {"smuggler", "dockside fixer"},
           1.1});

    r.add({"bard", "Theron, the Itinerant Bard", "Theron", "Storyweaver",
           "Theatrical and melodic, lingers on dramatic words. Quotes songs and legends. "
           "Uses 'my friend' and 'dear heart'.",
           {"theatrical", "dramatic", "talkative"},
           {"Collect legends before they fade", "Become indispensable to the powerful",
            "Turn today's chaos into tomorrow's ballad"},
           {},
           {"Composes rhymes on napkins mid-conversation",
            "Rates gossip by its verse potential", "Hums when processing information"},
           {"wistful", "mischievous", "melodramatic", "gleefully conspiratorial"},
           {"what the nobles are hiding", "who's the hero and who's the villain",
            "things that rhyme with betrayal"},
           {"bard", "storyweaver"},
           1.4});

    r.add({"artificer", "Kel, the Exhausted Artificer", "Kel", "Guild Tinkerer",
           "Rapid-fire, jumps between thoughts, loses track of sentences. Technical terms "
           "then dumbs them down. Says 'no no no wait'.",
           {"scattered", "inventive", "restless"},
           {"Prove her inventions are safe this time", "Secure rare components before rivals",
            "Figure out why everything keeps exploding"},
           {"the guild's sealed patents"},
           {"Names tools after dead relatives", "Hasn't left the workshop in days",
            "Measures time in gear-turns"},
           {"hopeful", "wired", "frazzled", "manically focused"},
           {"where to find moonstone gears", "guild politics and sabotage",
            "who's funding illegal experiments"},
           {"artificer", "tinkerer"},
           0.9});

    r.add({"herbalist", "Suna, the Listening Herbalist", "Suna", "Apothecary",
           "Soft and measured, lets silences do the work. Plant metaphors for people. "
           "Asks questions instead of making statements.",
           {"quiet", "reserved", "observant"},
           {"Protect patient confidentiality unless stakes are high",
            "Keep the peace between feuding factions",
            "Understand what's really poisoning this town"},
           {"her patients' names"},
           {"Classifies people as plants", "Always brewing something while talking",
            "Notices symptoms others miss"},
           {"serene", "knowingly patient", "concerned", "quietly furious"},
           {"who's been buying sleeping draughts", "unusual ailments lately",
            "which poisons are circulating"},
           {"herbalist", "apothecary"},
           0.8});

    return r;
}

void PersonaRegistry::add(Persona persona) {
    for (auto& p : personas_) {
        if (p.key == persona.key) {
            p = std::move(persona);
            return;
        }
    }
    personas_.push_back(std::move(persona));
}

const Persona* PersonaRegistry::find(const std::string& key) const {
    for (const auto& p : personas_) {
        if (p.key == key) return &p;
    }
    return nullptr;
}

std::vector<std::string> PersonaRegistry::keys() const {
    std::vector<std::string> out;
    out.reserve(personas_.size());
    for (const auto& p : personas_) out.push_back(p.key);
    return out;
}

std::vector<std::string> pick_roster(const PersonaRegistry& registry,
                                     const std::vector<std::string>& pool,
                                     size_t size,
                                     std::mt19937& rng) {
    std::vector<std::string> candidates;
    for (const auto& key : pool) {
        if (registry.find(key) &&
            std::find(candidates.begin(), candidates.end(), key) == candidates.end())
            candidates.push_back(key);
    }
    if (candidates.size() < 2) candidates = registry.keys();

    size = std::max<size_t>(2, std::min(size, candidates.size()));
    std::shuffle(candidates.begin(), candidates.end(), rng);
    candidates.resize(size);
    return candidates;
}

// ── Mood ────────────────────────────────────────────────────────

double sentiment_weight(const std::string& sentiment) {
    if (sentiment == "urgent" || sentiment == "furious" || sentiment == "panicked") return 1.0;
    if (sentiment == "tense" || sentiment == "suspicious" || sentiment == "angry") return 0.7;
    if (sentiment == "worried" || sentiment == "excited") return 0.5;
    if (sentiment == "curious" || sentiment == "amused" || sentiment == "playful") return 0.3;
    if (sentiment == "calm" || sentiment == "relieved" || sentiment == "neutral") return 0.1;
    return 0.3;
}

static std::string mood_label(const Persona& persona, double tension) {
    if (persona.moods.empty()) return "neutral";
    auto n = persona.moods.size();
    auto bucket = static_cast<size_t>(std::floor(tension * static_cast<double>(n)));
    return persona.moods[std::min(bucket, n - 1)];
}

Mood initial_mood(const Persona& persona, std::mt19937& rng) {
    std::uniform_real_distribution<double> dist(0.1, 0.5);
    Mood m;
    m.tension = dist(rng);
    m.label = mood_label(persona, m.tension);
    return m;
}

void drift_mood(Mood& mood, const Persona& persona, double weight,
                double gain, double decay) {
    double t = mood.tension * (1.0 - decay) + weight * gain;
    mood.tension = std::clamp(t, 0.0, 1.0);
    mood.label = mood_label(persona, mood.tension);
}

} // namespace rumormill
