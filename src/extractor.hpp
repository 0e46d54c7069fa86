#pragma once
#include "graph.hpp"
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace rumormill {

struct VocabularyEntry {
    EntityType type;
    std::string name;
    std::vector<std::string> aliases;
};

// Town locations, objects and events known before any dialogue happens.
const std::vector<VocabularyEntry>& default_vocabulary();

// Adds every entry as an entity; aliases go to the "aliases" attribute.
void seed_vocabulary(KnowledgeGraph& graph,
                     const std::vector<VocabularyEntry>& entries,
                     uint64_t turn = 0);

// Keyword matcher over the names (and aliases) of every non-memory
// entity in the graph. Matching is case-insensitive, longest term first,
// and only on word boundaries, so "Mara" never matches in "Marathon".
// Tokens that name nothing in the graph are ignored.
class EntityExtractor {
public:
    explicit EntityExtractor(KnowledgeGraph& graph) : graph_(graph) {}

    // Referenced entity ids, deduplicated, in order of first occurrence.
    std::vector<std::string> extract(const std::string& text) const;

    // Adds memory -> entity mentions edges for everything extract() finds.
    // Returns the mentioned ids.
    std::vector<std::string> link_mentions(const std::string& memory_id,
                                           const std::string& text,
                                           uint64_t turn);

    // Force a vocabulary rebuild on the next call (after a graph reset).
    void invalidate();

private:
    void refresh_vocabulary() const;

    KnowledgeGraph& graph_;

    mutable std::mutex cache_mutex_;
    mutable std::vector<std::pair<std::string, std::string>> terms_; // term, id
    mutable size_t cached_entity_count_ = static_cast<size_t>(-1);
};

} // namespace rumormill
