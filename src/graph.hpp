#pragma once
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace rumormill {

enum class EntityType { Npc, Location, Object, Event, Concept, Memory };

enum class RelationType { Remembers, Mentions, Told, Witnessed, Suspects, Knows, RelatedTo };

const char* entity_type_to_string(EntityType type);
std::optional<EntityType> entity_type_from_string(const std::string& s);

const char* relation_type_to_string(RelationType type);
std::optional<RelationType> relation_type_from_string(const std::string& s);

using Attributes = std::map<std::string, std::string>;

struct Entity {
    std::string id;
    EntityType type = EntityType::Concept;
    std::string name;
    Attributes attributes;
    uint64_t created_at = 0; // turn index

    // Attribute value or empty string
    std::string attr(const std::string& key) const;
};

struct Relationship {
    std::string src;
    std::string dst;
    RelationType type = RelationType::RelatedTo;
    uint64_t created_at = 0;
    double weight = 1.0;
    Attributes attributes;
};

enum class Direction { Out, In, Both };

// Pointers stay valid until the graph is cleared.
struct Neighbor {
    const Relationship* edge = nullptr;
    const Entity* entity = nullptr;
};

struct GraphStats {
    size_t entity_count = 0;
    size_t edge_count = 0;
    std::map<std::string, size_t> counts_by_type;
    std::map<std::string, size_t> edge_counts_by_type;
};

// Neighborhood of one entity, memory nodes filtered out of the listing.
struct EntityContext {
    const Entity* entity = nullptr;
    std::vector<Neighbor> relationships;
    std::vector<std::pair<const Entity*, uint32_t>> connected; // entity, hop distance
};

class UnknownEntity : public std::runtime_error {
public:
    explicit UnknownEntity(const std::string& id)
        : std::runtime_error("Unknown entity: " + id), id_(id) {}

    const std::string& entity_id() const { return id_; }

private:
    std::string id_;
};

// Directed, typed multigraph of entities. Grows monotonically; clear()
// is the only way to drop nodes. Not internally synchronized: callers
// serialize writers and guard readers themselves.
class KnowledgeGraph {
public:
    // "<type>:<lower-cased trimmed name>"
    static std::string make_id(EntityType type, const std::string& name);

    // Idempotent by (type, name). Attributes of an existing entity are
    // left untouched.
    std::string add_entity(EntityType type, const std::string& name,
                           const Attributes& attributes = {},
                           uint64_t turn = 0);

    // Throws UnknownEntity if either endpoint is missing.
    const Relationship& add_relationship(const std::string& src,
                                         const std::string& dst,
                                         RelationType type,
                                         uint64_t turn = 0,
                                         double weight = 1.0,
                                         const Attributes& attributes = {});

    // New memory entity owned by owner_id, linked by one remembers edge.
    std::string add_memory(const std::string& owner_id,
                           const std::string& content,
                           uint64_t turn,
                           double importance = 0.5);

    // Empty types = all relation types.
    std::vector<Neighbor> neighbors(const std::string& id,
                                    const std::vector<RelationType>& types = {},
                                    Direction direction = Direction::Out) const;

    std::vector<const Entity*> entities_by_type(EntityType type) const;

    const Entity* get(const std::string& id) const;
    bool contains(const std::string& id) const { return index_.count(id) > 0; }

    size_t entity_count() const { return entities_.size(); }
    size_t edge_count() const { return edges_.size(); }

    // Insertion order
    const std::deque<Entity>& entities() const { return entities_; }
    const std::deque<Relationship>& edges() const { return edges_; }
    GraphStats stats() const;

    EntityContext entity_context(const std::string& id, uint32_t depth = 2) const;

    // Shortest chain of out-edges from src to dst; empty if unreachable
    // or src == dst.
    std::vector<const Relationship*> shortest_path(const std::string& src,
                                                   const std::string& dst) const;

    void clear();

private:
    size_t index_of(const std::string& id) const;

    std::deque<Entity> entities_;
    std::deque<Relationship> edges_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<std::vector<size_t>> out_; // entity index -> edge indices
    std::vector<std::vector<size_t>> in_;
    std::unordered_map<std::string, uint64_t> memory_counters_;
};

} // namespace rumormill
