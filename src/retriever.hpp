#pragma once
#include "config.hpp"
#include "extractor.hpp"
#include "graph.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace rumormill {

struct RetrievedMemory {
    std::string memory_id;
    std::string owner_id;
    std::string content;
    uint64_t turn = 0;
    uint32_t overlap = 0;      // topic entities the memory mentions
    uint32_t path_length = 1;  // edges from the agent; 1 = own memory
    double score = 0.0;
    std::vector<Relationship> path;
    std::string provenance;    // "Rylan told Mara about the vault two turns ago"
};

struct RetrievalResult {
    std::vector<std::string> topic_entities;
    std::vector<RetrievedMemory> memories; // best first
    size_t nodes_visited = 0;
};

// Assembles the scored, bounded context bundle for one agent's next line.
//
// Candidates are the agent's own memories that mention a topic entity,
// plus hearsay: memories held by agents reachable over told / witnessed /
// knows / suspects / related_to edges within max_hops. Each candidate is
// scored as
//     overlap * W1 + (1 / path_length) * W2 + recency * W3
// with recency = exp(-ln2 * age / half_life). Ordering is fully
// deterministic: score, then shorter path, then newer, then id.
class ContextRetriever {
public:
    ContextRetriever(const KnowledgeGraph& graph, const EntityExtractor& extractor,
                     RetrievalConfig config = {})
        : graph_(graph), extractor_(extractor), config_(config) {}

    RetrievalResult retrieve(const std::string& agent_id,
                             const std::string& topic,
                             uint64_t now_turn) const;

    RetrievalResult retrieve(const std::string& agent_id,
                             const std::string& topic,
                             uint64_t now_turn,
                             uint32_t max_hops,
                             uint32_t max_results) const;

    double recency(uint64_t memory_turn, uint64_t now_turn) const;

    const RetrievalConfig& config() const { return config_; }

private:
    std::string render_provenance(const std::string& agent_id,
                                  const RetrievedMemory& m,
                                  const std::vector<std::string>& topic_entities,
                                  uint64_t now_turn) const;

    const KnowledgeGraph& graph_;
    const EntityExtractor& extractor_;
    RetrievalConfig config_;
};

// "this turn", "one turn ago", "three turns ago"
std::string turns_ago(uint64_t age);

} // namespace rumormill
