#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "orchestrator.hpp"
#include "event_bus.hpp"
#include "serialize.hpp"
#include "template_generator.hpp"

#include <atomic>
#include <functional>
#include <set>
#include <thread>

using namespace rumormill;
using Catch::Approx;
using namespace std::chrono_literals;

namespace {

const std::string kSecret = "The vault door was left ajar";

// Replies through a callback, optionally after a delay. Counts calls.
class ScriptedGenerator : public Generator {
public:
    using Script = std::function<std::string(const GenerationRequest&, int call)>;

    explicit ScriptedGenerator(Script script, std::chrono::milliseconds delay = 0ms)
        : script_(std::move(script)), delay_(delay) {}

    std::string generate(const GenerationRequest& request,
                         std::chrono::milliseconds /*timeout*/) override {
        int call = ++calls;
        if (request.strict) ++strict_calls;
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
        return script_(request, call);
    }

    std::string name() const override { return "scripted"; }

    std::atomic<int> calls{0};
    std::atomic<int> strict_calls{0};

private:
    Script script_;
    std::chrono::milliseconds delay_;
};

std::string reply(const std::string& utterance, double delta = 0.2,
                  const std::string& sentiment = "tense") {
    nlohmann::json j = {
        {"utterance", utterance},
        {"internal_monologue", "Keep it quiet."},
        {"rumor_delta", delta},
        {"sentiment", sentiment},
    };
    return j.dump();
}

ScriptedGenerator::Script always(const std::string& utterance) {
    return [utterance](const GenerationRequest&, int) { return reply(utterance); };
}

const std::vector<std::string> kRoster = {"bard", "guard", "herbalist", "shopkeeper"};
const std::string kSeed = "Lights were spotted in the vault after midnight";

struct Sim {
    ScriptedGenerator* gen = nullptr;
    std::unique_ptr<Orchestrator> orch;

    explicit Sim(ScriptedGenerator::Script script, std::chrono::milliseconds delay = 0ms,
                 Config cfg = {}) {
        auto g = std::make_unique<ScriptedGenerator>(std::move(script), delay);
        gen = g.get();
        orch = std::make_unique<Orchestrator>(cfg, std::move(g));
        orch->reset(kSeed, kRoster);
    }
};

size_t count_of(const std::map<std::string, size_t>& m, const std::string& key) {
    auto it = m.find(key);
    return it == m.end() ? 0 : it->second;
}

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds limit = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

// ── Reset ───────────────────────────────────────────────────────

TEST_CASE("Orchestrator: reset builds roster, seed memories and knows edges", "[orchestrator]") {
    Sim sim(always("Hm."));
    auto snap = sim.orch->snapshot();

    REQUIRE(snap.turn == 0);
    REQUIRE(snap.state == RunState::Idle);
    REQUIRE(snap.seed_event == kSeed);
    REQUIRE(snap.world.last_event == kSeed);
    REQUIRE(snap.history.empty());
    REQUIRE(snap.agents.size() == 4);
    REQUIRE(snap.agents[0].id == "npc:theron");
    REQUIRE(snap.agents[0].personality == PersonalityType::Gossip);
    REQUIRE(snap.agents[2].personality == PersonalityType::Stoic);

    auto stats = sim.orch->graph_stats();
    REQUIRE(count_of(stats.counts_by_type, "npc") == 4);
    REQUIRE(count_of(stats.counts_by_type, "memory") == 4);
    REQUIRE(count_of(stats.counts_by_type, "event") >= 1);
    REQUIRE(count_of(stats.edge_counts_by_type, "knows") == 12);
    REQUIRE(count_of(stats.edge_counts_by_type, "remembers") == 4);
}

TEST_CASE("Orchestrator: reset rejects bad rosters", "[orchestrator]") {
    Sim sim(always("Hm."));
    REQUIRE_THROWS_AS(sim.orch->reset("", {"guard"}), std::invalid_argument);
    REQUIRE_THROWS_AS(sim.orch->reset("", {"guard", "dragon"}), std::invalid_argument);
    REQUIRE_THROWS_AS(sim.orch->reset("", {"guard", "GUARD"}), std::invalid_argument);

    // A rejected reset leaves the running simulation untouched.
    REQUIRE(sim.orch->agents().size() == 4);
}

TEST_CASE("Orchestrator: empty seed picks a configured rumor", "[orchestrator]") {
    Config cfg;
    cfg.simulation.rumor_seeds = {"The bell rang thirteen times"};
    Orchestrator orch(cfg, std::make_unique<ScriptedGenerator>(always("Hm.")));
    REQUIRE(orch.snapshot().seed_event == "The bell rang thirteen times");
    REQUIRE(orch.agents().size() == 2);
}

TEST_CASE("Orchestrator: reset restores the baseline graph", "[orchestrator]") {
    Sim sim(always(kSecret));
    auto baseline = sim.orch->graph_stats();

    sim.orch->inject_secret("guard", kSecret);
    sim.orch->run_steps(5);
    REQUIRE(sim.orch->graph_stats().entity_count > baseline.entity_count);

    sim.orch->reset(kSeed, kRoster);
    auto after = sim.orch->graph_stats();
    REQUIRE(after.entity_count == baseline.entity_count);
    REQUIRE(after.edge_count == baseline.edge_count);
    REQUIRE(sim.orch->turn() == 0);
    REQUIRE(sim.orch->history().empty());
    REQUIRE_FALSE(sim.orch->propagation_stats().active);
}

// ── Stepping ────────────────────────────────────────────────────

TEST_CASE("Orchestrator: a step commits one told edge and two memories", "[orchestrator]") {
    Sim sim(always(kSecret));
    auto before = sim.orch->graph_stats();

    auto out = sim.orch->step();
    REQUIRE(out.ok());
    REQUIRE(out.turn.has_value());
    const auto& turn = *out.turn;
    REQUIRE(turn.turn == 1);
    REQUIRE(turn.speaker_id != turn.listener_id);
    REQUIRE(turn.content == kSecret);
    REQUIRE(turn.sentiment == "tense");
    REQUIRE(turn.rumor_delta == Approx(0.2));

    auto after = sim.orch->graph_stats();
    REQUIRE(count_of(after.edge_counts_by_type, "told") == 1);
    REQUIRE(count_of(after.counts_by_type, "memory") ==
            count_of(before.counts_by_type, "memory") + 2);
    REQUIRE(count_of(after.edge_counts_by_type, "related_to") == 1);

    REQUIRE(sim.orch->turn() == 1);
    REQUIRE(sim.orch->state() == RunState::Idle);
    auto history = sim.orch->history();
    REQUIRE(history.size() == 1);
    REQUIRE(history[0].speaker_id == turn.speaker_id);

    auto world = sim.orch->world();
    REQUIRE(world.rumor_heat == Approx(0.2));
    REQUIRE(world.current_thread == kSecret);

    for (const auto& a : sim.orch->agents()) {
        if (a.id == turn.listener_id) REQUIRE(a.unshared == 1);
        if (a.id == turn.speaker_id) REQUIRE(a.unshared == 0);
    }
}

TEST_CASE("Orchestrator: prompts carry recent history and memories", "[orchestrator]") {
    std::vector<GenerationRequest> seen;
    Sim sim([&seen](const GenerationRequest& req, int) {
        seen.push_back(req);
        return reply(kSecret);
    });

    sim.orch->run_steps(2);
    REQUIRE(seen.size() == 2);
    REQUIRE(seen[0].history.empty());
    REQUIRE(seen[0].topic == kSeed);
    REQUIRE_FALSE(seen[0].speaker_context.empty());
    REQUIRE(seen[1].history.size() == 1);
    REQUIRE(seen[1].history[0].find(": " + kSecret) != std::string::npos);
    REQUIRE(seen[1].topic == kSecret);
}

TEST_CASE("Orchestrator: invalid reply is retried once with a strict prompt", "[orchestrator]") {
    Sim sim([](const GenerationRequest& req, int) {
        return req.strict ? reply("Fine, the vault.") : std::string("I'd rather not say.");
    });

    auto out = sim.orch->step();
    REQUIRE(out.ok());
    REQUIRE(sim.gen->calls == 2);
    REQUIRE(sim.gen->strict_calls == 1);
    REQUIRE(out.turn->content == "Fine, the vault.");
}

TEST_CASE("Orchestrator: two invalid replies fail the step without mutation", "[orchestrator]") {
    EventBus bus;
    int failures = 0;
    GenerationErrorKind kind = GenerationErrorKind::Timeout;
    subscribe<StepFailedEvent>(bus, [&](const StepFailedEvent& ev) {
        failures++;
        kind = ev.kind;
    });

    Sim sim([](const GenerationRequest&, int) { return std::string("{\"utterance\": \"\"}"); });
    sim.orch->set_event_bus(&bus);
    auto before = sim.orch->graph_stats();
    auto world_before = sim.orch->world();

    auto out = sim.orch->step();
    REQUIRE(out.status == StepStatus::Failed);
    REQUIRE(out.error.has_value());
    REQUIRE(out.error->kind == GenerationErrorKind::InvalidResponse);
    REQUIRE(sim.gen->calls == 2);
    REQUIRE(failures == 1);
    REQUIRE(kind == GenerationErrorKind::InvalidResponse);

    REQUIRE(sim.orch->turn() == 0);
    REQUIRE(sim.orch->history().empty());
    REQUIRE(sim.orch->graph_stats().entity_count == before.entity_count);
    REQUIRE(sim.orch->graph_stats().edge_count == before.edge_count);
    REQUIRE(sim.orch->world().rumor_heat == Approx(world_before.rumor_heat));
}

TEST_CASE("Orchestrator: generator exceptions count as invalid responses", "[orchestrator]") {
    Sim sim([](const GenerationRequest&, int) -> std::string {
        throw std::runtime_error("connection refused");
    });
    auto out = sim.orch->step();
    REQUIRE(out.status == StepStatus::Failed);
    REQUIRE(out.error->kind == GenerationErrorKind::InvalidResponse);
    REQUIRE(out.error->message == "connection refused");
}

TEST_CASE("Orchestrator: slow generation times out and commits nothing", "[orchestrator]") {
    EventBus bus;
    std::atomic<int> timeouts{0};
    subscribe<StepFailedEvent>(bus, [&](const StepFailedEvent& ev) {
        if (ev.kind == GenerationErrorKind::Timeout) timeouts++;
    });

    Sim sim(always(kSecret), 60ms);
    sim.orch->set_event_bus(&bus);
    sim.orch->set_generation_timeout(20ms);
    auto before = sim.orch->graph_stats();

    auto out = sim.orch->step();
    REQUIRE(out.status == StepStatus::Failed);
    REQUIRE(out.error->kind == GenerationErrorKind::Timeout);
    REQUIRE(timeouts == 1);
    REQUIRE(sim.orch->turn() == 0);
    REQUIRE(sim.orch->graph_stats().edge_count == before.edge_count);
    REQUIRE(sim.orch->state() == RunState::Idle);
}

TEST_CASE("Orchestrator: run_steps reports failures and keeps going", "[orchestrator]") {
    Sim sim([](const GenerationRequest&, int call) {
        // Calls 1 and 2 are the first turn and its retry.
        return call <= 2 ? std::string("nope") : reply("Back to the vault.");
    });

    auto outcomes = sim.orch->run_steps(3);
    REQUIRE(outcomes.size() == 3);
    REQUIRE(outcomes[0].status == StepStatus::Failed);
    REQUIRE(outcomes[1].ok());
    REQUIRE(outcomes[2].ok());
    REQUIRE(sim.orch->turn() == 2);
    REQUIRE(outcomes[1].turn->turn == 1);
}

TEST_CASE("Orchestrator: multi-byte text at the thread cut keeps later turns working",
          "[orchestrator]") {
    // Serializes the topic the way the HTTP providers build their bodies.
    Sim sim([](const GenerationRequest& req, int call) {
        nlohmann::json body = {{"topic", req.topic}};
        body.dump();
        return call == 1 ? reply(std::string(99, 'x') + "\xE2\x80\x94 the vault")
                         : reply("Back to the vault.");
    });

    REQUIRE(sim.orch->step().ok());
    REQUIRE(sim.orch->world().current_thread == std::string(99, 'x'));

    auto second = sim.orch->step();
    REQUIRE(second.ok());
    REQUIRE(sim.orch->turn() == 2);
    REQUIRE(sim.gen->calls == 2);
    REQUIRE_NOTHROW(snapshot_to_json(sim.orch->snapshot()).dump());
}

TEST_CASE("Orchestrator: run_steps(0) runs a single turn", "[orchestrator]") {
    Sim sim(always("Hm."));
    REQUIRE(sim.orch->run_steps(0).size() == 1);
    REQUIRE(sim.orch->turn() == 1);
}

// ── Concurrency ─────────────────────────────────────────────────

TEST_CASE("Orchestrator: a step during another step is Busy", "[orchestrator][concurrency]") {
    Sim sim(always(kSecret), 300ms);

    StepOutcome first;
    std::thread worker([&] { first = sim.orch->step(); });
    REQUIRE(wait_until([&] { return sim.gen->calls.load() >= 1; }));

    auto second = sim.orch->step();
    worker.join();

    REQUIRE(second.status == StepStatus::Busy);
    REQUIRE(first.ok());
    REQUIRE(sim.orch->turn() == 1);
    REQUIRE(sim.gen->calls == 1);
}

TEST_CASE("Orchestrator: manual step while the loop runs is Busy", "[orchestrator][concurrency]") {
    Sim sim(always(kSecret));
    REQUIRE(sim.orch->start_loop(10s));
    REQUIRE(sim.orch->state() == RunState::RunningLoop);
    REQUIRE_FALSE(sim.orch->start_loop(10s));

    auto out = sim.orch->step();
    REQUIRE(out.status == StepStatus::Busy);

    auto batch = sim.orch->run_steps(5);
    REQUIRE(batch.size() == 1);
    REQUIRE(batch[0].status == StepStatus::Busy);

    REQUIRE(sim.orch->stop_loop());
    REQUIRE(sim.orch->state() == RunState::Stopped);
    REQUIRE_FALSE(sim.orch->stop_loop());

    // Stepping is allowed again once the loop is stopped.
    REQUIRE(sim.orch->step().ok());
    REQUIRE(sim.orch->state() == RunState::Stopped);
}

TEST_CASE("Orchestrator: loop publishes turns until stopped", "[orchestrator][concurrency]") {
    EventBus bus;
    std::atomic<int> turns{0};
    std::atomic<int> loop_events{0};
    subscribe<TurnCompletedEvent>(bus, [&](const TurnCompletedEvent&) { turns++; });
    subscribe<LoopStateEvent>(bus, [&](const LoopStateEvent&) { loop_events++; });

    Sim sim(always(kSecret));
    sim.orch->set_event_bus(&bus);

    REQUIRE(sim.orch->start_loop(5ms));
    REQUIRE(wait_until([&] { return turns.load() >= 3; }));

    // Readers never block on the loop for long and see whole turns.
    auto snap = sim.orch->snapshot();
    REQUIRE(snap.history.size() == snap.turn);

    REQUIRE(sim.orch->stop_loop());
    int settled = turns.load();
    std::this_thread::sleep_for(30ms);
    REQUIRE(turns.load() == settled);
    REQUIRE(static_cast<uint64_t>(settled) == sim.orch->turn());
    REQUIRE(loop_events == 2);
}

TEST_CASE("Orchestrator: reset stops a running loop", "[orchestrator][concurrency]") {
    Sim sim(always(kSecret));
    REQUIRE(sim.orch->start_loop(5ms));
    REQUIRE(wait_until([&] { return sim.orch->turn() >= 1; }));

    sim.orch->reset(kSeed, kRoster);
    REQUIRE(sim.orch->state() == RunState::Idle);
    REQUIRE(sim.orch->turn() == 0);
}

// ── Secrets and propagation ─────────────────────────────────────

TEST_CASE("Orchestrator: inject_secret plants memory and opens an experiment", "[orchestrator]") {
    EventBus bus;
    std::string planted_with;
    subscribe<SecretInjectedEvent>(bus, [&](const SecretInjectedEvent& ev) {
        planted_with = ev.seed_agent;
    });

    Sim sim(always("Hm."));
    sim.orch->set_event_bus(&bus);
    auto id = sim.orch->inject_secret("Theron", kSecret);

    REQUIRE(id.rfind("exp_", 0) == 0);
    REQUIRE(planted_with == "npc:theron");
    REQUIRE(sim.orch->world().last_event == kSecret);

    auto stats = sim.orch->propagation_stats();
    REQUIRE(stats.active);
    REQUIRE(stats.seed_agent == "npc:theron");
    REQUIRE(stats.total_traces == 0);

    auto graph = sim.orch->graph_json();
    bool has_secret = false;
    for (const auto& node : graph["nodes"]) {
        if (node["type"] == "memory" &&
            node["attributes"].value("owner", "") == "npc:theron" &&
            node["attributes"].value("content", "") == "[SECRET] " + kSecret)
            has_secret = true;
    }
    REQUIRE(has_secret);

    auto ctx = sim.orch->entity_context("npc:theron", 1);
    REQUIRE(ctx["entity"]["id"] == "npc:theron");
    REQUIRE_THROWS_AS(sim.orch->entity_context("npc:nobody"), UnknownEntity);
}

TEST_CASE("Orchestrator: inject_secret validates input", "[orchestrator]") {
    Sim sim(always("Hm."));
    REQUIRE_THROWS_AS(sim.orch->inject_secret("smuggler", kSecret), UnknownEntity);
    REQUIRE_THROWS_AS(sim.orch->inject_secret("guard", "   "), std::invalid_argument);
    REQUIRE_FALSE(sim.orch->propagation_stats().active);
}

TEST_CASE("Orchestrator: verbatim secret reaches every listener intact", "[orchestrator][e2e]") {
    Sim sim(always(kSecret));
    sim.orch->inject_secret("bard", kSecret);

    auto run = sim.orch->run_tracked_steps(10);
    REQUIRE(run.outcomes.size() == 10);
    std::set<std::string> listeners;
    for (const auto& out : run.outcomes) {
        REQUIRE(out.ok());
        listeners.insert(out.turn->listener_id);
    }

    REQUIRE(run.stats.active);
    REQUIRE(run.stats.turns_elapsed == 10);
    REQUIRE(run.stats.total_traces == 10);
    REQUIRE(run.stats.agents_reached == listeners.size());
    REQUIRE(run.stats.information_fidelity == Approx(1.0));
    REQUIRE(run.stats.propagation_rate == Approx(listeners.size() / 10.0));

    auto timeline = sim.orch->timeline();
    REQUIRE(timeline.size() == 1);
    for (const auto& trace : timeline[0].traces) {
        REQUIRE(trace.mutation == Mutation::Unchanged);
        REQUIRE(trace.similarity == Approx(1.0));
    }

    auto report = sim.orch->report();
    REQUIRE(report.find("Information fidelity: 100.0%") != std::string::npos);
}

TEST_CASE("Orchestrator: unrelated chatter leaves the experiment without traces", "[orchestrator][e2e]") {
    Sim sim(always("Fish prices are up again, typical."));
    sim.orch->inject_secret("guard", kSecret);
    auto run = sim.orch->run_tracked_steps(4);

    REQUIRE(run.stats.active);
    REQUIRE(run.stats.total_traces == 0);
    REQUIRE(run.stats.agents_reached == 0);
    REQUIRE(run.stats.turns_elapsed == 4);
}

// ── Determinism ─────────────────────────────────────────────────

TEST_CASE("Orchestrator: same seed, same conversation", "[orchestrator][determinism]") {
    Config cfg;
    cfg.simulation.party_size = 4;
    Orchestrator a(cfg, std::make_unique<TemplateGenerator>(cfg.simulation.seed));
    Orchestrator b(cfg, std::make_unique<TemplateGenerator>(cfg.simulation.seed));

    REQUIRE(a.snapshot().seed_event == b.snapshot().seed_event);
    auto ra = a.run_steps(6);
    auto rb = b.run_steps(6);
    REQUIRE(ra.size() == rb.size());
    for (size_t i = 0; i < ra.size(); i++) {
        REQUIRE(ra[i].ok());
        REQUIRE(rb[i].ok());
        REQUIRE(ra[i].turn->speaker_id == rb[i].turn->speaker_id);
        REQUIRE(ra[i].turn->listener_id == rb[i].turn->listener_id);
        REQUIRE(ra[i].turn->content == rb[i].turn->content);
    }
}

TEST_CASE("Orchestrator: reset replays the speaking order", "[orchestrator][determinism]") {
    Sim sim(always(kSecret));
    auto pairs = [&] {
        std::vector<std::pair<std::string, std::string>> out;
        for (const auto& o : sim.orch->run_steps(8))
            out.emplace_back(o.turn->speaker_id, o.turn->listener_id);
        return out;
    };

    auto first = pairs();
    sim.orch->reset(kSeed, kRoster);
    REQUIRE(pairs() == first);
}

TEST_CASE("Orchestrator: listener selection favours fresh ears", "[orchestrator]") {
    Sim sim(always("Hm."));
    sim.orch->run_steps(40);

    // Every agent ends up hearing something over a long run.
    std::set<std::string> listeners;
    for (const auto& t : sim.orch->history(40)) listeners.insert(t.listener_id);
    REQUIRE(listeners.size() == 4);
}

TEST_CASE("run_state / step_status names", "[orchestrator]") {
    REQUIRE(std::string(run_state_to_string(RunState::RunningLoop)) == "running_loop");
    REQUIRE(std::string(step_status_to_string(StepStatus::Busy)) == "busy");
}
