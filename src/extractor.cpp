#include "extractor.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>

namespace rumormill {

const std::vector<VocabularyEntry>& default_vocabulary() {
    static const std::vector<VocabularyEntry> entries = {
        {EntityType::Location, "vault", {}},
        {EntityType::Location, "sewer", {"sewers"}},
        {EntityType::Location, "dock", {"docks"}},
        {EntityType::Location, "harbor", {"harbour"}},
        {EntityType::Location, "temple", {}},
        {EntityType::Location, "market", {"marketplace"}},
        {EntityType::Location, "alehouse", {"tavern"}},
        {EntityType::Location, "workshop", {}},
        {EntityType::Location, "cellar", {}},
        {EntityType::Location, "gate", {"gates"}},
        {EntityType::Location, "aqueduct", {}},
        {EntityType::Location, "tannery", {}},
        {EntityType::Location, "alley", {"alleys"}},
        {EntityType::Location, "marsh", {}},
        {EntityType::Object, "coin", {"coins"}},
        {EntityType::Object, "silver", {}},
        {EntityType::Object, "gold", {}},
        {EntityType::Object, "ledger", {"ledgers"}},
        {EntityType::Object, "key", {"keys"}},
        {EntityType::Object, "door", {"doors"}},
        {EntityType::Object, "bell", {"bells"}},
        {EntityType::Object, "shipment", {"shipments"}},
        {EntityType::Object, "crate", {"crates"}},
        {EntityType::Object, "iron", {}},
        {EntityType::Object, "steel", {}},
        {EntityType::Object, "ale", {}},
        {EntityType::Object, "poppy", {}},
        {EntityType::Object, "nightshade", {}},
        {EntityType::Object, "tea", {}},
        {EntityType::Object, "caravan", {"caravans"}},
        {EntityType::Event, "rang", {}},
        {EntityType::Event, "missing", {}},
        {EntityType::Event, "stolen", {}},
        {EntityType::Event, "spotted", {}},
        {EntityType::Event, "slipping", {}},
        {EntityType::Event, "vanished", {}},
        {EntityType::Event, "ajar", {}},
        {EntityType::Concept, "bribe", {"bribes", "bribing", "bribed"}},
        {EntityType::Concept, "counterfeit", {"counterfeits"}},
        {EntityType::Concept, "smoke", {}},
        {EntityType::Concept, "wyvern", {}},
        {EntityType::Concept, "tax clerk", {}},
    };
    return entries;
}

void seed_vocabulary(KnowledgeGraph& graph,
                     const std::vector<VocabularyEntry>& entries,
                     uint64_t turn) {
    for (const auto& entry : entries) {
        Attributes attrs;
        if (!entry.aliases.empty()) {
            std::string joined;
            for (const auto& alias : entry.aliases) {
                if (!joined.empty()) joined += '|';
                joined += alias;
            }
            attrs["aliases"] = joined;
        }
        graph.add_entity(entry.type, entry.name, attrs, turn);
    }
}

static bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

void EntityExtractor::invalidate() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cached_entity_count_ = static_cast<size_t>(-1);
}

void EntityExtractor::refresh_vocabulary() const {
    if (graph_.entity_count() == cached_entity_count_) return;

    terms_.clear();
    for (EntityType type : {EntityType::Npc, EntityType::Location, EntityType::Object,
                            EntityType::Event, EntityType::Concept}) {
        for (const Entity* e : graph_.entities_by_type(type)) {
            terms_.emplace_back(to_lower(e->name), e->id);
            for (const auto& alias : split(e->attr("aliases"), '|')) {
                std::string term = to_lower(trim(alias));
                if (!term.empty()) terms_.emplace_back(term, e->id);
            }
        }
    }
    // Longest first; ties alphabetical so matching never depends on
    // insertion order.
    std::sort(terms_.begin(), terms_.end(), [](const auto& a, const auto& b) {
        if (a.first.size() != b.first.size()) return a.first.size() > b.first.size();
        if (a.first != b.first) return a.first < b.first;
        return a.second < b.second;
    });
    cached_entity_count_ = graph_.entity_count();
}

std::vector<std::string> EntityExtractor::extract(const std::string& text) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    refresh_vocabulary();

    std::string lower = to_lower(text);
    std::vector<bool> consumed(lower.size(), false);
    std::vector<std::pair<size_t, std::string>> hits; // position, id

    for (const auto& [term, id] : terms_) {
        if (term.empty()) continue;
        size_t pos = 0;
        while ((pos = lower.find(term, pos)) != std::string::npos) {
            size_t end = pos + term.size();
            bool left_ok = pos == 0 || !is_word_char(lower[pos - 1]);
            bool right_ok = end == lower.size() || !is_word_char(lower[end]);
            bool free = std::none_of(consumed.begin() + static_cast<std::ptrdiff_t>(pos),
                                     consumed.begin() + static_cast<std::ptrdiff_t>(end),
                                     [](bool c) { return c; });
            if (left_ok && right_ok && free) {
                std::fill(consumed.begin() + static_cast<std::ptrdiff_t>(pos),
                          consumed.begin() + static_cast<std::ptrdiff_t>(end), true);
                hits.emplace_back(pos, id);
                pos = end;
            } else {
                // A rejected candidate may overlap the next real occurrence.
                pos++;
            }
        }
    }

    std::sort(hits.begin(), hits.end());
    std::vector<std::string> ids;
    for (const auto& hit : hits) {
        if (std::find(ids.begin(), ids.end(), hit.second) == ids.end())
            ids.push_back(hit.second);
    }
    return ids;
}

std::vector<std::string> EntityExtractor::link_mentions(const std::string& memory_id,
                                                        const std::string& text,
                                                        uint64_t turn) {
    auto ids = extract(text);
    for (const auto& id : ids) {
        if (id == memory_id) continue;
        graph_.add_relationship(memory_id, id, RelationType::Mentions, turn);
    }
    return ids;
}

} // namespace rumormill
