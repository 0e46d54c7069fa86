#include "orchestrator.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "serialize.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace rumormill {

static constexpr double kSeedImportance = 0.8;
static constexpr double kSecretImportance = 1.0;
static constexpr size_t kToldContentChars = 200;
static constexpr const char* kOpeningRumor = "opening rumor";

const char* run_state_to_string(RunState state) {
    switch (state) {
        case RunState::Idle: return "idle";
        case RunState::RunningSingleStep: return "running_single_step";
        case RunState::RunningLoop: return "running_loop";
        case RunState::Stopped: return "stopped";
    }
    return "idle";
}

const char* step_status_to_string(StepStatus status) {
    switch (status) {
        case StepStatus::Ok: return "ok";
        case StepStatus::Busy: return "busy";
        case StepStatus::Failed: return "failed";
    }
    return "failed";
}

static StepOutcome busy_outcome() {
    StepOutcome out;
    out.status = StepStatus::Busy;
    return out;
}

static std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

Orchestrator::Orchestrator(const Config& config, std::unique_ptr<Generator> generator,
                           PersonaRegistry registry, SimilarityFn similarity)
    : config_(config),
      registry_(std::move(registry)),
      generator_(std::move(generator)),
      timeout_(std::chrono::seconds(config.simulation.generation_timeout_seconds)),
      extractor_(graph_),
      retriever_(graph_, extractor_, config.retrieval),
      tracker_(config.propagation, std::move(similarity)),
      rng_(static_cast<std::mt19937::result_type>(config.simulation.seed)) {
    if (!generator_) throw std::invalid_argument("Orchestrator needs a generator");
    reset();
}

Orchestrator::~Orchestrator() {
    stop_loop();
}

// ── Reset ───────────────────────────────────────────────────────

std::vector<std::string> Orchestrator::validate_roster(
        const std::vector<std::string>& roster) const {
    std::vector<std::string> keys;
    for (const auto& raw : roster) {
        std::string key = to_lower(trim(raw));
        if (key.empty()) continue;
        if (!registry_.find(key)) throw std::invalid_argument("Unknown persona: " + raw);
        if (std::find(keys.begin(), keys.end(), key) == keys.end()) keys.push_back(key);
    }
    if (!keys.empty() && keys.size() < 2) {
        throw std::invalid_argument("A roster needs at least two personas");
    }
    return keys;
}

void Orchestrator::reset(const std::string& seed_event,
                         const std::vector<std::string>& roster) {
    auto keys = validate_roster(roster);

    stop_loop();
    std::lock_guard<std::mutex> step_lock(step_mutex_);

    SimulationResetEvent ev;
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);

        rng_.seed(static_cast<std::mt19937::result_type>(config_.simulation.seed));
        graph_.clear();
        extractor_.invalidate();
        tracker_.clear();
        history_.clear();
        agents_.clear();
        told_counts_.clear();
        turn_ = 0;

        if (keys.empty()) {
            keys = pick_roster(registry_, config_.simulation.persona_pool,
                               config_.simulation.party_size, rng_);
        }

        std::string seed = trim(seed_event);
        if (seed.empty()) {
            const auto& seeds = config_.simulation.rumor_seeds.empty()
                ? default_rumor_seeds() : config_.simulation.rumor_seeds;
            std::uniform_int_distribution<size_t> pick(0, seeds.size() - 1);
            seed = seeds[pick(rng_)];
        }

        seed_vocabulary(graph_, default_vocabulary(), 0);

        for (const auto& key : keys) {
            const Persona* persona = registry_.find(key);
            Attributes attrs = {
                {"aliases", join(persona->aliases, "|")},
                {"profession", persona->profession},
                {"persona", persona->key},
            };
            AgentState agent;
            agent.id = graph_.add_entity(EntityType::Npc, persona->short_name, attrs, 0);
            agent.persona = *persona;
            agent.mood = initial_mood(*persona, rng_);
            agent.personality = classify_personality(persona->traits, config_.propagation);
            agents_.push_back(std::move(agent));
        }

        for (const auto& a : agents_) {
            for (const auto& b : agents_) {
                if (a.id != b.id) graph_.add_relationship(a.id, b.id, RelationType::Knows, 0);
            }
        }

        // The hook itself is an event entity; its words are matched
        // through the vocabulary, so it carries a fixed name.
        std::string event_id = graph_.add_entity(EntityType::Event, kOpeningRumor,
                                                 {{"description", seed}}, 0);
        for (const auto& a : agents_) {
            std::string mem = graph_.add_memory(a.id, seed, 0, kSeedImportance);
            extractor_.link_mentions(mem, seed, 0);
            graph_.add_relationship(mem, event_id, RelationType::Mentions, 0);
        }

        world_ = WorldState::initial(seed, config_.world);
        seed_event_ = seed;

        ev.seed_event = seed;
        for (const auto& a : agents_) ev.roster.push_back(a.persona.key);
    }
    state_ = RunState::Idle;

    if (event_bus_) event_bus_->publish(ev);
}

// ── Pair selection ──────────────────────────────────────────────

size_t Orchestrator::pick_speaker() {
    std::vector<double> weights;
    weights.reserve(agents_.size());
    for (const auto& a : agents_) {
        weights.push_back(1.0 + config_.simulation.pending_weight * a.unshared);
    }
    std::discrete_distribution<size_t> pick(weights.begin(), weights.end());
    return pick(rng_);
}

size_t Orchestrator::pick_listener(size_t speaker) {
    const auto& told = told_counts_[agents_[speaker].id];
    std::vector<double> weights;
    weights.reserve(agents_.size());
    for (size_t i = 0; i < agents_.size(); ++i) {
        if (i == speaker) {
            weights.push_back(0.0);
            continue;
        }
        auto it = told.find(agents_[i].id);
        uint32_t count = it == told.end() ? 0 : it->second;
        weights.push_back(1.0 / (1.0 + count));
    }
    std::discrete_distribution<size_t> pick(weights.begin(), weights.end());
    return pick(rng_);
}

// ── Turn ────────────────────────────────────────────────────────

std::vector<std::string> Orchestrator::format_context(const RetrievalResult& result) const {
    std::vector<std::string> lines;
    for (const auto& m : result.memories) {
        lines.push_back(m.content + " (" + m.provenance + ")");
    }
    return lines;
}

Orchestrator::PlannedTurn Orchestrator::plan_turn() {
    PlannedTurn plan;
    plan.speaker = pick_speaker();
    plan.listener = pick_listener(plan.speaker);

    const AgentState& speaker = agents_[plan.speaker];
    const AgentState& listener = agents_[plan.listener];
    uint64_t turn = turn_ + 1;
    std::string topic = world_.topic();

    auto speaker_ctx = retriever_.retrieve(speaker.id, topic, turn);
    auto listener_ctx = retriever_.retrieve(listener.id, topic, turn,
                                            config_.retrieval.max_hops,
                                            config_.retrieval.listener_results);

    GenerationRequest& req = plan.request;
    req.turn = turn;
    req.speaker = speaker.persona;
    req.listener = listener.persona;
    req.speaker_mood = speaker.mood.label;
    req.listener_mood = listener.mood.label;
    req.speaker_tension = speaker.mood.tension;
    req.topic = topic;
    req.last_event = world_.last_event;
    req.rumor_heat = world_.rumor_heat;

    size_t keep = std::min<size_t>(history_.size(), config_.simulation.prompt_history);
    for (auto it = history_.end() - static_cast<std::ptrdiff_t>(keep); it != history_.end(); ++it) {
        req.history.push_back(it->speaker_name + ": " + it->content);
    }

    req.speaker_context = format_context(speaker_ctx);
    req.listener_context = format_context(listener_ctx);
    plan.graph_context = req.speaker_context;
    return plan;
}

GenerationOutcome Orchestrator::generate_once(const GenerationRequest& request) {
    auto started = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
    };

    std::string raw;
    try {
        raw = generator_->generate(request, timeout_);
    } catch (const std::exception& e) {
        if (elapsed() >= timeout_) {
            return GenerationError{GenerationErrorKind::Timeout, e.what()};
        }
        return GenerationError{GenerationErrorKind::InvalidResponse, e.what()};
    }

    if (elapsed() > timeout_) {
        return GenerationError{GenerationErrorKind::Timeout,
            "generator replied after " + std::to_string(elapsed().count()) + "ms"};
    }
    return parse_generation(raw);
}

StepOutcome Orchestrator::step() {
    RunState prev = state_.load();
    if (prev == RunState::RunningLoop) return busy_outcome();

    std::unique_lock<std::mutex> lock(step_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) return busy_outcome();

    // The loop may have been started between the check and the lock.
    if (!state_.compare_exchange_strong(prev, RunState::RunningSingleStep)) {
        return busy_outcome();
    }

    StepOutcome outcome;
    try {
        outcome = step_locked();
    } catch (...) {
        RunState cur = RunState::RunningSingleStep;
        state_.compare_exchange_strong(cur, prev);
        throw;
    }
    RunState cur = RunState::RunningSingleStep;
    state_.compare_exchange_strong(cur, prev);
    return outcome;
}

StepOutcome Orchestrator::step_locked() {
    PlannedTurn plan = plan_turn();

    GenerationOutcome generated = generate_once(plan.request);
    if (auto* err = std::get_if<GenerationError>(&generated)) {
        std::cerr << "[orchestrator] Turn " << plan.request.turn << ": "
                  << generation_error_kind_to_string(err->kind) << " (" << err->message
                  << "), retrying with a strict prompt\n";
        plan.request.strict = true;
        generated = generate_once(plan.request);
    }

    StepOutcome outcome;
    if (auto* err = std::get_if<GenerationError>(&generated)) {
        fail(plan, *err);
        outcome.status = StepStatus::Failed;
        outcome.error = *err;
        return outcome;
    }

    TurnCompletedEvent ev;
    ev.turn = commit(plan, std::get<GenerationResult>(generated));
    {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        ev.world = world_;
    }
    if (event_bus_) event_bus_->publish(ev);

    outcome.turn = std::move(ev.turn);
    return outcome;
}

void Orchestrator::fail(const PlannedTurn& plan, const GenerationError& error) {
    std::cerr << "[orchestrator] Turn " << plan.request.turn << " abandoned: "
              << generation_error_kind_to_string(error.kind) << " (" << error.message << ")\n";
    if (!event_bus_) return;

    StepFailedEvent ev;
    ev.turn = plan.request.turn;
    ev.speaker_id = agents_[plan.speaker].id;
    ev.listener_id = agents_[plan.listener].id;
    ev.kind = error.kind;
    ev.message = error.message;
    event_bus_->publish(ev);
}

DialogueTurn Orchestrator::commit(const PlannedTurn& plan, const GenerationResult& result) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);

    AgentState& speaker = agents_[plan.speaker];
    AgentState& listener = agents_[plan.listener];
    uint64_t turn = plan.request.turn;

    DialogueTurn record;
    record.turn = turn;
    record.speaker_id = speaker.id;
    record.listener_id = listener.id;
    record.speaker_name = speaker.persona.short_name;
    record.listener_name = listener.persona.short_name;
    record.speaker_profession = speaker.persona.profession;
    record.listener_profession = listener.persona.profession;
    record.speaker_mood = speaker.mood.label;
    record.listener_mood = listener.mood.label;
    record.content = result.utterance;
    record.internal_monologue = result.internal_monologue.value_or("");
    record.sentiment = result.sentiment;
    record.rumor_delta = result.rumor_delta;
    record.graph_context = plan.graph_context;
    record.timestamp = timestamp_now();

    // Speaker keeps what they meant; the listener keeps what they heard.
    std::string memory_text = result.new_memory.value_or(result.utterance);
    double importance = std::min(1.0, 0.4 + result.rumor_delta);
    std::string spoken = graph_.add_memory(speaker.id, memory_text, turn, importance);
    extractor_.link_mentions(spoken,
        result.new_memory ? memory_text + " " + result.utterance : memory_text, turn);

    std::string heard = graph_.add_memory(
        listener.id, "Heard from " + speaker.persona.short_name + " that " + result.utterance,
        turn, importance);
    extractor_.link_mentions(heard, result.utterance, turn);
    graph_.add_relationship(heard, spoken, RelationType::RelatedTo, turn);

    graph_.add_relationship(speaker.id, listener.id, RelationType::Told, turn, 1.0,
                            {{"content", truncate(result.utterance, kToldContentChars)},
                             {"memory", spoken}});

    world_.apply_rumor(speaker.persona.short_name, result.utterance, result.rumor_delta,
                       turn, config_.world);

    double weight = sentiment_weight(result.sentiment);
    drift_mood(speaker.mood, speaker.persona, weight,
               config_.world.mood_gain, config_.world.mood_decay);
    drift_mood(listener.mood, listener.persona, weight * 0.5,
               config_.world.mood_gain, config_.world.mood_decay);

    history_.push_back(record);
    while (history_.size() > config_.simulation.history_limit) history_.pop_front();

    tracker_.observe(turn, speaker.id, listener.id, speaker.personality, result.utterance);

    speaker.unshared = 0;
    listener.unshared++;
    told_counts_[speaker.id][listener.id]++;
    turn_ = turn;
    return record;
}

std::vector<StepOutcome> Orchestrator::run_steps(uint32_t n) {
    std::vector<StepOutcome> outcomes;
    uint32_t count = std::max<uint32_t>(1, n);
    for (uint32_t i = 0; i < count; ++i) {
        outcomes.push_back(step());
        if (outcomes.back().status == StepStatus::Busy) break;
    }
    return outcomes;
}

TrackedRun Orchestrator::run_tracked_steps(uint32_t n) {
    TrackedRun run;
    run.outcomes = run_steps(n);
    run.stats = propagation_stats();
    return run;
}

// ── Loop ────────────────────────────────────────────────────────

bool Orchestrator::start_loop() {
    return start_loop(std::chrono::milliseconds(config_.simulation.dialogue_delay_ms));
}

bool Orchestrator::start_loop(std::chrono::milliseconds interval) {
    {
        std::lock_guard<std::mutex> control(control_mutex_);
        if (loop_thread_.joinable()) return false;
        stop_requested_ = false;
        state_ = RunState::RunningLoop;
        loop_thread_ = std::thread(&Orchestrator::loop_main, this, interval);
    }
    publish_loop_state(true);
    return true;
}

bool Orchestrator::stop_loop() {
    {
        std::lock_guard<std::mutex> control(control_mutex_);
        if (!loop_thread_.joinable()) return false;
        {
            std::lock_guard<std::mutex> lk(loop_mutex_);
            stop_requested_ = true;
        }
        loop_cv_.notify_all();
        loop_thread_.join();
        state_ = RunState::Stopped;
    }
    publish_loop_state(false);
    return true;
}

void Orchestrator::loop_main(std::chrono::milliseconds interval) {
    while (!stop_requested_.load()) {
        {
            std::lock_guard<std::mutex> lock(step_mutex_);
            if (stop_requested_.load()) break;
            try {
                step_locked();
            } catch (const std::exception& e) {
                std::cerr << "[orchestrator] Loop turn error: " << e.what() << "\n";
            }
        }
        std::unique_lock<std::mutex> lk(loop_mutex_);
        loop_cv_.wait_for(lk, interval, [this] { return stop_requested_.load(); });
    }
}

void Orchestrator::publish_loop_state(bool running) {
    if (!event_bus_) return;
    LoopStateEvent ev;
    ev.running = running;
    event_bus_->publish(ev);
}

// ── Secrets ─────────────────────────────────────────────────────

size_t Orchestrator::find_agent(const std::string& name) const {
    std::string needle = to_lower(trim(name));
    for (size_t i = 0; i < agents_.size(); ++i) {
        const auto& a = agents_[i];
        if (a.id == needle || a.persona.key == needle || to_lower(a.persona.short_name) == needle) {
            return i;
        }
    }
    throw UnknownEntity(name);
}

std::string Orchestrator::inject_secret(const std::string& agent, const std::string& secret) {
    std::string text = trim(secret);
    if (text.empty()) throw std::invalid_argument("Secret must not be empty");

    std::lock_guard<std::mutex> step_lock(step_mutex_);

    SecretInjectedEvent ev;
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        AgentState& seed = agents_[find_agent(agent)];

        std::string mem = graph_.add_memory(seed.id, "[SECRET] " + text, turn_, kSecretImportance);
        extractor_.link_mentions(mem, text, turn_);

        world_.last_event = text;
        world_.current_thread = text;
        seed.unshared++;

        ev.experiment_id = tracker_.inject(text, seed.id, turn_);
        ev.seed_agent = seed.id;
        ev.secret = text;
    }

    std::cerr << "[orchestrator] Secret planted with " << ev.seed_agent
              << " (" << ev.experiment_id << ")\n";
    if (event_bus_) event_bus_->publish(ev);
    return ev.experiment_id;
}

// ── Read side ───────────────────────────────────────────────────

SimulationSnapshot Orchestrator::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    SimulationSnapshot snap;
    snap.turn = turn_;
    snap.state = state_.load();
    snap.seed_event = seed_event_;
    snap.generator = generator_->name();
    snap.world = world_;
    snap.history.assign(history_.begin(), history_.end());
    snap.agents = agents_;
    return snap;
}

std::vector<DialogueTurn> Orchestrator::history(size_t limit) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    size_t keep = std::min(limit, history_.size());
    return std::vector<DialogueTurn>(history_.end() - static_cast<std::ptrdiff_t>(keep),
                                     history_.end());
}

WorldState Orchestrator::world() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return world_;
}

GraphStats Orchestrator::graph_stats() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return graph_.stats();
}

nlohmann::json Orchestrator::graph_json() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return graph_to_json(graph_);
}

std::vector<Relationship> Orchestrator::relationship_path(const std::string& src,
                                                         const std::string& dst) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    std::vector<Relationship> path;
    for (const Relationship* rel : graph_.shortest_path(src, dst)) path.push_back(*rel);
    return path;
}

nlohmann::json Orchestrator::entity_context(const std::string& id, uint32_t depth) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return entity_context_to_json(graph_.entity_context(id, depth));
}

PropagationStats Orchestrator::propagation_stats() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return tracker_.stats();
}

std::vector<PropagationExperiment> Orchestrator::timeline() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return tracker_.experiments();
}

std::string Orchestrator::report() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return tracker_.report();
}

uint64_t Orchestrator::turn() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return turn_;
}

std::vector<AgentState> Orchestrator::agents() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return agents_;
}

} // namespace rumormill
