#pragma once
#include <random>
#include <string>
#include <vector>

namespace rumormill {

struct Persona {
    std::string key;            // "shopkeeper"
    std::string name;           // "Mara, the Grumpy Shopkeeper"
    std::string short_name;     // "Mara"
    std::string profession;
    std::string voice;
    std::vector<std::string> traits;
    std::vector<std::string> goals;
    std::vector<std::string> forbidden_topics;
    std::vector<std::string> quirks;
    std::vector<std::string> moods; // ordered calm -> agitated
    std::vector<std::string> default_topics;
    std::vector<std::string> aliases; // extra names the extractor should match
    double rumor_bias = 1.0;

    // Prompt-ready character sheet
    std::string describe(const std::string& mood) const;
};

class PersonaRegistry {
public:
    // Registry preloaded with the six town personas.
    static PersonaRegistry builtin();

    // Adds or replaces by key.
    void add(Persona persona);

    const Persona* find(const std::string& key) const;
    std::vector<std::string> keys() const; // insertion order
    size_t size() const { return personas_.size(); }

private:
    std::vector<Persona> personas_;
};

// Pick `size` distinct keys from `pool` (clamped to [2, pool size]).
// Keys not in the registry are dropped; an empty or too-small pool falls
// back to every registered persona.
std::vector<std::string> pick_roster(const PersonaRegistry& registry,
                                     const std::vector<std::string>& pool,
                                     size_t size,
                                     std::mt19937& rng);

// ── Mood ────────────────────────────────────────────────────────

struct Mood {
    std::string label;
    double tension = 0.0; // [0, 1]
};

// Emotional weight of a sentiment label in [0, 1]. Unknown labels are 0.3.
double sentiment_weight(const std::string& sentiment);

Mood initial_mood(const Persona& persona, std::mt19937& rng);

// tension' = clamp(tension * (1 - decay) + weight * gain); the label is
// the persona mood for that tension bucket.
void drift_mood(Mood& mood, const Persona& persona, double weight,
                double gain, double decay);

} // namespace rumormill
