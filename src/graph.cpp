#include "graph.hpp"
#include "util.hpp"

#include <algorithm>
#include <queue>
#include <unordered_set>

namespace rumormill {

const char* entity_type_to_string(EntityType type) {
    switch (type) {
        case EntityType::Npc: return "npc";
        case EntityType::Location: return "location";
        case EntityType::Object: return "object";
        case EntityType::Event: return "event";
        case EntityType::Concept: return "concept";
        case EntityType::Memory: return "memory";
    }
    return "concept";
}

std::optional<EntityType> entity_type_from_string(const std::string& s) {
    std::string t = to_lower(trim(s));
    if (t == "npc") return EntityType::Npc;
    if (t == "location") return EntityType::Location;
    if (t == "object") return EntityType::Object;
    if (t == "event") return EntityType::Event;
    if (t == "concept") return EntityType::Concept;
    if (t == "memory") return EntityType::Memory;
    return std::nullopt;
}

const char* relation_type_to_string(RelationType type) {
    switch (type) {
        case RelationType::Remembers: return "remembers";
        case RelationType::Mentions: return "mentions";
        case RelationType::Told: return "told";
        case RelationType::Witnessed: return "witnessed";
        case RelationType::Suspects: return "suspects";
        case RelationType::Knows: return "knows";
        case RelationType::RelatedTo: return "related_to";
    }
    return "related_to";
}

std::optional<RelationType> relation_type_from_string(const std::string& s) {
    std::string t = to_lower(trim(s));
    if (t == "remembers") return RelationType::Remembers;
    if (t == "mentions") return RelationType::Mentions;
    if (t == "told") return RelationType::Told;
    if (t == "witnessed") return RelationType::Witnessed;
    if (t == "suspects") return RelationType::Suspects;
    if (t == "knows") return RelationType::Knows;
    if (t == "related_to") return RelationType::RelatedTo;
    return std::nullopt;
}

std::string Entity::attr(const std::string& key) const {
    auto it = attributes.find(key);
    return it == attributes.end() ? std::string() : it->second;
}

// ── Mutation ────────────────────────────────────────────────────

std::string KnowledgeGraph::make_id(EntityType type, const std::string& name) {
    return std::string(entity_type_to_string(type)) + ":" + to_lower(trim(name));
}

std::string KnowledgeGraph::add_entity(EntityType type, const std::string& name,
                                       const Attributes& attributes,
                                       uint64_t turn) {
    std::string id = make_id(type, name);
    if (index_.count(id)) return id;

    Entity e;
    e.id = id;
    e.type = type;
    e.name = trim(name);
    e.attributes = attributes;
    e.created_at = turn;

    index_[id] = entities_.size();
    entities_.push_back(std::move(e));
    out_.emplace_back();
    in_.emplace_back();
    return id;
}

const Relationship& KnowledgeGraph::add_relationship(const std::string& src,
                                                     const std::string& dst,
                                                     RelationType type,
                                                     uint64_t turn,
                                                     double weight,
                                                     const Attributes& attributes) {
    size_t s = index_of(src);
    size_t d = index_of(dst);

    size_t edge_index = edges_.size();
    edges_.push_back(Relationship{src, dst, type, turn, weight, attributes});
    out_[s].push_back(edge_index);
    in_[d].push_back(edge_index);
    return edges_.back();
}

std::string KnowledgeGraph::add_memory(const std::string& owner_id,
                                       const std::string& content,
                                       uint64_t turn,
                                       double importance) {
    const Entity& owner = entities_[index_of(owner_id)];

    std::string owner_key = owner.id.substr(owner.id.find(':') + 1);
    uint64_t n = ++memory_counters_[owner.id];
    std::string name = owner_key + ":" + std::to_string(n);

    Attributes attrs{
        {"content", content},
        {"owner", owner.id},
        {"importance", std::to_string(importance)},
    };
    std::string id = add_entity(EntityType::Memory, name, attrs, turn);
    add_relationship(owner.id, id, RelationType::Remembers, turn);
    return id;
}

void KnowledgeGraph::clear() {
    entities_.clear();
    edges_.clear();
    index_.clear();
    out_.clear();
    in_.clear();
    memory_counters_.clear();
}

// ── Queries ─────────────────────────────────────────────────────

size_t KnowledgeGraph::index_of(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) throw UnknownEntity(id);
    return it->second;
}

const Entity* KnowledgeGraph::get(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &entities_[it->second];
}

std::vector<Neighbor> KnowledgeGraph::neighbors(const std::string& id,
                                                const std::vector<RelationType>& types,
                                                Direction direction) const {
    size_t i = index_of(id);
    auto wanted = [&types](RelationType t) {
        return types.empty() || std::find(types.begin(), types.end(), t) != types.end();
    };

    std::vector<Neighbor> result;
    if (direction == Direction::Out || direction == Direction::Both) {
        for (size_t e : out_[i]) {
            const Relationship& rel = edges_[e];
            if (!wanted(rel.type)) continue;
            result.push_back({&rel, &entities_[index_.at(rel.dst)]});
        }
    }
    if (direction == Direction::In || direction == Direction::Both) {
        for (size_t e : in_[i]) {
            const Relationship& rel = edges_[e];
            if (!wanted(rel.type)) continue;
            result.push_back({&rel, &entities_[index_.at(rel.src)]});
        }
    }
    return result;
}

std::vector<const Entity*> KnowledgeGraph::entities_by_type(EntityType type) const {
    std::vector<const Entity*> result;
    for (const auto& e : entities_) {
        if (e.type == type) result.push_back(&e);
    }
    return result;
}

GraphStats KnowledgeGraph::stats() const {
    GraphStats s;
    s.entity_count = entities_.size();
    s.edge_count = edges_.size();
    for (const auto& e : entities_) {
        s.counts_by_type[entity_type_to_string(e.type)]++;
    }
    for (const auto& r : edges_) {
        s.edge_counts_by_type[relation_type_to_string(r.type)]++;
    }
    return s;
}

EntityContext KnowledgeGraph::entity_context(const std::string& id, uint32_t depth) const {
    EntityContext ctx;
    ctx.entity = &entities_[index_of(id)];

    for (const auto& n : neighbors(id, {}, Direction::Both)) {
        if (n.entity->type != EntityType::Memory) ctx.relationships.push_back(n);
    }

    // Walk through memory nodes too; they connect most of the graph.
    std::unordered_set<std::string> visited{id};
    std::queue<std::pair<std::string, uint32_t>> frontier;
    frontier.push({id, 0});
    while (!frontier.empty()) {
        auto [current, dist] = frontier.front();
        frontier.pop();
        if (dist >= depth) continue;
        for (const auto& n : neighbors(current, {}, Direction::Both)) {
            if (!visited.insert(n.entity->id).second) continue;
            if (n.entity->type != EntityType::Memory) {
                ctx.connected.emplace_back(n.entity, dist + 1);
            }
            frontier.push({n.entity->id, dist + 1});
        }
    }
    return ctx;
}

std::vector<const Relationship*> KnowledgeGraph::shortest_path(const std::string& src,
                                                               const std::string& dst) const {
    size_t from = index_of(src);
    size_t to = index_of(dst);
    if (from == to) return {};

    // Predecessor edge per reached entity index.
    std::unordered_map<size_t, size_t> via;
    std::queue<size_t> frontier;
    frontier.push(from);
    via[from] = edges_.size();

    while (!frontier.empty()) {
        size_t current = frontier.front();
        frontier.pop();
        for (size_t e : out_[current]) {
            size_t next = index_.at(edges_[e].dst);
            if (via.count(next)) continue;
            via[next] = e;
            if (next == to) {
                std::vector<const Relationship*> path;
                for (size_t at = to; at != from;) {
                    const Relationship& rel = edges_[via[at]];
                    path.push_back(&rel);
                    at = index_.at(rel.src);
                }
                std::reverse(path.begin(), path.end());
                return path;
            }
            frontier.push(next);
        }
    }
    return {};
}

} // namespace rumormill
