#include "retriever.hpp"
#include "util.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <map>
#include <unordered_set>

namespace rumormill {

namespace {

const std::vector<RelationType> kSocialEdges = {
    RelationType::Told, RelationType::Witnessed, RelationType::Knows,
    RelationType::Suspects, RelationType::RelatedTo
};

struct FrontierNode {
    std::string id;
    uint32_t hops = 0;
    std::vector<Relationship> path;
};

std::string display_name(const Entity* e) {
    if (!e) return "someone";
    if (e->type == EntityType::Npc) return e->name;
    return "the " + e->name;
}

} // namespace

std::string turns_ago(uint64_t age) {
    if (age == 0) return "this turn";
    if (age == 1) return "one turn ago";
    return number_word(age) + " turns ago";
}

double ContextRetriever::recency(uint64_t memory_turn, uint64_t now_turn) const {
    double age = now_turn > memory_turn ? static_cast<double>(now_turn - memory_turn) : 0.0;
    if (config_.recency_half_life <= 0.0) return age == 0.0 ? 1.0 : 0.0;
    return std::exp(-std::log(2.0) * age / config_.recency_half_life);
}

RetrievalResult ContextRetriever::retrieve(const std::string& agent_id,
                                           const std::string& topic,
                                           uint64_t now_turn) const {
    return retrieve(agent_id, topic, now_turn, config_.max_hops, config_.max_results);
}

RetrievalResult ContextRetriever::retrieve(const std::string& agent_id,
                                           const std::string& topic,
                                           uint64_t now_turn,
                                           uint32_t max_hops,
                                           uint32_t max_results) const {
    RetrievalResult result;
    if (!graph_.contains(agent_id)) throw UnknownEntity(agent_id);

    result.topic_entities = extractor_.extract(topic);
    if (result.topic_entities.empty() || max_results == 0) return result;

    const auto& topic_ids = result.topic_entities;
    auto overlap_of = [&](const std::string& memory_id) {
        std::unordered_set<std::string> hit;
        for (const auto& n : graph_.neighbors(memory_id, {RelationType::Mentions})) {
            if (std::find(topic_ids.begin(), topic_ids.end(), n.entity->id) != topic_ids.end())
                hit.insert(n.entity->id);
        }
        return static_cast<uint32_t>(hit.size());
    };

    // Best (shortest) path per memory.
    std::map<std::string, RetrievedMemory> candidates;
    auto consider = [&](const Entity& memory, const std::vector<Relationship>& path) {
        uint32_t overlap = overlap_of(memory.id);
        if (overlap == 0) return false;
        auto length = static_cast<uint32_t>(path.size());
        auto it = candidates.find(memory.id);
        if (it != candidates.end() && it->second.path_length <= length) return true;

        RetrievedMemory m;
        m.memory_id = memory.id;
        m.owner_id = memory.attr("owner");
        m.content = memory.attr("content");
        m.turn = memory.created_at;
        m.overlap = overlap;
        m.path_length = length;
        m.path = path;
        candidates[memory.id] = std::move(m);
        return true;
    };

    std::unordered_set<std::string> visited{agent_id};
    std::deque<FrontierNode> queue;
    queue.push_back({agent_id, 0, {}});

    // Direct relevance set: own memories that mention the topic.
    for (const auto& n : graph_.neighbors(agent_id, {RelationType::Remembers})) {
        if (n.entity->type != EntityType::Memory) continue;
        std::vector<Relationship> path{*n.edge};
        if (consider(*n.entity, path) && visited.insert(n.entity->id).second)
            queue.push_back({n.entity->id, 0, path});
    }

    // Hearsay: breadth-first over social edges in both directions.
    while (!queue.empty()) {
        FrontierNode node = std::move(queue.front());
        queue.pop_front();
        if (node.hops >= max_hops) continue;

        for (const auto& n : graph_.neighbors(node.id, kSocialEdges, Direction::Both)) {
            if (!visited.insert(n.entity->id).second) continue;

            std::vector<Relationship> path = node.path;
            path.push_back(*n.edge);

            if (n.entity->type == EntityType::Npc) {
                for (const auto& held : graph_.neighbors(n.entity->id, {RelationType::Remembers})) {
                    if (held.entity->type != EntityType::Memory) continue;
                    std::vector<Relationship> via = path;
                    via.push_back(*held.edge);
                    consider(*held.entity, via);
                }
            } else if (n.entity->type == EntityType::Memory) {
                consider(*n.entity, path);
            }
            queue.push_back({n.entity->id, node.hops + 1, std::move(path)});
        }
    }
    result.nodes_visited = visited.size();

    std::vector<RetrievedMemory> ranked;
    ranked.reserve(candidates.size());
    for (auto& [id, m] : candidates) {
        m.score = m.overlap * config_.overlap_weight
                + (1.0 / m.path_length) * config_.path_weight
                + recency(m.turn, now_turn) * config_.recency_weight;
        ranked.push_back(std::move(m));
    }
    std::sort(ranked.begin(), ranked.end(), [](const RetrievedMemory& a, const RetrievedMemory& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.path_length != b.path_length) return a.path_length < b.path_length;
        if (a.turn != b.turn) return a.turn > b.turn;
        return a.memory_id < b.memory_id;
    });
    if (ranked.size() > max_results) ranked.resize(max_results);

    for (auto& m : ranked) {
        m.provenance = render_provenance(agent_id, m, topic_ids, now_turn);
    }
    result.memories = std::move(ranked);
    return result;
}

std::string ContextRetriever::render_provenance(const std::string& agent_id,
                                                const RetrievedMemory& m,
                                                const std::vector<std::string>& topic_entities,
                                                uint64_t now_turn) const {
    // First topic entity this memory mentions names the subject.
    std::string subject = "the rumor";
    for (const auto& n : graph_.neighbors(m.memory_id, {RelationType::Mentions})) {
        if (std::find(topic_entities.begin(), topic_entities.end(), n.entity->id) !=
            topic_entities.end()) {
            subject = display_name(n.entity);
            break;
        }
    }

    const Entity* agent = graph_.get(agent_id);
    const Entity* owner = graph_.get(m.owner_id);
    auto age_of = [now_turn](uint64_t t) { return now_turn > t ? now_turn - t : 0; };

    // Latest told edge on the path, or for an own memory, the telling it
    // was copied from.
    const Relationship* told = nullptr;
    for (const auto& rel : m.path) {
        if (rel.type == RelationType::Told) told = &rel;
    }
    if (told) {
        return display_name(graph_.get(told->src)) + " told " +
               display_name(graph_.get(told->dst)) + " about " + subject + " " +
               turns_ago(age_of(told->created_at));
    }

    if (m.path_length == 1) {
        for (const auto& n : graph_.neighbors(m.memory_id, {RelationType::RelatedTo})) {
            if (n.entity->type != EntityType::Memory) continue;
            const Entity* source = graph_.get(n.entity->attr("owner"));
            if (source && source->id != agent_id) {
                return display_name(source) + " told " + display_name(agent) + " about " +
                       subject + " " + turns_ago(age_of(m.turn));
            }
        }
        return display_name(agent) + " noted " + subject + " " + turns_ago(age_of(m.turn));
    }

    std::string link = m.path.empty() ? "social" : relation_type_to_string(m.path.front().type);
    return display_name(owner) + " noted " + subject + " " + turns_ago(age_of(m.turn)) +
           ", heard through " + display_name(agent) + "'s " + link + " link";
}

} // namespace rumormill
