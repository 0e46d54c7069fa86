#include "commands.hpp"
#include "config.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "generation.hpp"
#include "http.hpp"
#include "orchestrator.hpp"
#include "serialize.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: rumormill [options]\n"
              << "\n"
              << "Options:\n"
              << "  --steps N            Run N turns, print them and exit\n"
              << "  --follow             Print every turn as a JSON line; without --steps,\n"
              << "                       run the loop until interrupted\n"
              << "  --provider NAME      Dialogue provider (template, openai, openrouter, ollama, compatible)\n"
              << "  --model NAME         Model for LLM providers\n"
              << "  --seed N             Random seed for pair selection and template dialogue\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /status              Generator, run state, moods and world gauges\n"
              << "  /state               Full snapshot as JSON\n"
              << "  /step                Advance one turn\n"
              << "  /run N               Advance N turns\n"
              << "  /loop start [ms]     Run turns in the background\n"
              << "  /loop stop           Stop the background loop\n"
              << "  /reset [--roster a,b] [seed]  Rebuild the simulation\n"
              << "  /history [N]         Recent dialogue\n"
              << "  /graph [json]        Knowledge graph statistics, or every node and edge\n"
              << "  /entity TYPE NAME    Neighborhood of one entity\n"
              << "  /path FROM TO        Shortest chain of relationships between two entities\n"
              << "  /inject AGENT SECRET Plant a secret and start tracking it\n"
              << "  /track [N]           Advance N turns and show propagation\n"
              << "  /stats               Propagation statistics\n"
              << "  /timeline            Every experiment with its traces\n"
              << "  /report              Markdown propagation report\n"
              << "  /experiment [N] [SECRET]  Reset, plant a secret, track N turns, report\n"
              << "  /providers           Configured dialogue providers\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit the REPL\n"
              << "\n"
              << "Environment variables:\n"
              << "  OPENAI_API_KEY       API key for OpenAI\n"
              << "  OPENROUTER_API_KEY   API key for OpenRouter\n"
              << "  OLLAMA_BASE_URL      Base URL for Ollama (default: http://localhost:11434)\n"
              << "  RUMORMILL_PROVIDER, RUMORMILL_MODEL, RUMORMILL_SEED\n"
              << "  RUMORMILL_PERSONA_POOL, RUMORMILL_PARTY_SIZE, RUMORMILL_RUMOR_SEEDS\n"
              << "  RUMORMILL_DIALOGUE_DELAY_MS\n";
}

static void print_turn_json(const rumormill::TurnCompletedEvent& ev) {
    nlohmann::json line = {
        {"type", "turn"},
        {"turn", rumormill::turn_to_json(ev.turn)},
        {"world", rumormill::world_to_json(ev.world)},
    };
    std::cout << line.dump() << std::endl;
}

static int run_follow(rumormill::Orchestrator& orch, rumormill::EventBus& bus,
                      uint32_t steps) {
    rumormill::subscribe<rumormill::TurnCompletedEvent>(bus, print_turn_json);
    rumormill::subscribe<rumormill::StepFailedEvent>(bus,
        [](const rumormill::StepFailedEvent& ev) {
            nlohmann::json line = {
                {"type", "step_failed"},
                {"turn", ev.turn},
                {"kind", rumormill::generation_error_kind_to_string(ev.kind)},
                {"message", ev.message},
            };
            std::cout << line.dump() << std::endl;
        });

    if (steps > 0) {
        for (uint32_t i = 0; i < steps && !g_shutdown.load(); i++) orch.step();
        return 0;
    }

    orch.start_loop();
    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    orch.stop_loop();
    std::cerr << "[rumormill] Shutting down.\n";
    return 0;
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string provider_name;
    std::string model_name;
    std::string seed_arg;
    uint32_t steps = 0;
    bool follow = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--steps") == 0 && i + 1 < argc) {
            steps = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (std::strcmp(argv[i], "--follow") == 0) {
            follow = true;
        } else if (std::strcmp(argv[i], "--provider") == 0 && i + 1 < argc) {
            provider_name = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            seed_arg = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // Initialize
    rumormill::http_init();
    auto config = rumormill::Config::load();

    // Override config with CLI args
    if (!provider_name.empty()) config.provider = provider_name;
    if (!model_name.empty()) config.model = model_name;
    if (!seed_arg.empty()) config.simulation.seed = std::stoull(seed_arg);

    rumormill::CurlHttpClient http_client;
    rumormill::EventBus bus;
    rumormill::Orchestrator orch(config, rumormill::create_generator(config, http_client));
    orch.set_event_bus(&bus);

    if (follow) {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        rumormill::http_set_abort_flag(&g_shutdown);

        int rc = run_follow(orch, bus, steps);
        rumormill::http_cleanup();
        return rc;
    }

    if (steps > 0) {
        std::cout << rumormill::cmd_run(std::to_string(steps), orch) << '\n';
        rumormill::http_cleanup();
        return 0;
    }

    // Background loop turns print as they land; manual commands print
    // their own results.
    rumormill::subscribe<rumormill::TurnCompletedEvent>(bus,
        [&orch](const rumormill::TurnCompletedEvent& ev) {
            if (orch.state() == rumormill::RunState::RunningLoop) {
                std::cout << "\n" << rumormill::format_turn(ev.turn) << std::endl;
            }
        });

    // Interactive REPL
    std::cout << "rumormill town simulation\n"
              << "Generator: " << orch.generator_name() << "\n"
              << "Type /help for commands, /quit to exit.\n\n"
              << rumormill::cmd_status(orch) << "\n";

    std::string line;
    while (true) {
        std::cout << "rumormill> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        // Skip empty lines
        if (line.empty()) continue;

        if (line[0] != '/') {
            std::cout << "Commands start with '/'. Type /help.\n";
            continue;
        }

        auto space = line.find(' ');
        std::string cmd = line.substr(0, space);
        std::string args = space == std::string::npos ? "" : line.substr(space + 1);

        if (cmd == "/quit" || cmd == "/exit") {
            break;
        } else if (cmd == "/help") {
            print_usage();
        } else if (cmd == "/status") {
            std::cout << rumormill::cmd_status(orch);
        } else if (cmd == "/state") {
            std::cout << rumormill::cmd_state(orch) << "\n";
        } else if (cmd == "/step") {
            std::cout << rumormill::cmd_step(orch) << "\n";
        } else if (cmd == "/run") {
            std::cout << rumormill::cmd_run(args, orch) << "\n";
        } else if (cmd == "/loop") {
            std::cout << rumormill::cmd_loop(args, orch) << "\n";
        } else if (cmd == "/reset") {
            std::cout << rumormill::cmd_reset(args, orch) << "\n";
        } else if (cmd == "/history") {
            std::cout << rumormill::cmd_history(args, orch) << "\n";
        } else if (cmd == "/graph") {
            std::cout << rumormill::cmd_graph(args, orch);
        } else if (cmd == "/entity") {
            std::cout << rumormill::cmd_entity(args, orch) << "\n";
        } else if (cmd == "/path") {
            std::cout << rumormill::cmd_path(args, orch) << "\n";
        } else if (cmd == "/inject") {
            std::cout << rumormill::cmd_inject(args, orch) << "\n";
        } else if (cmd == "/track") {
            std::cout << rumormill::cmd_track(args, orch) << "\n";
        } else if (cmd == "/stats") {
            std::cout << rumormill::cmd_stats(orch) << "\n";
        } else if (cmd == "/timeline") {
            std::cout << rumormill::cmd_timeline(orch) << "\n";
        } else if (cmd == "/report") {
            std::cout << rumormill::cmd_report(orch);
        } else if (cmd == "/experiment") {
            std::cout << rumormill::cmd_experiment(args, orch) << "\n";
        } else if (cmd == "/providers") {
            std::cout << rumormill::cmd_providers(config);
        } else {
            std::cout << "Unknown command: " << cmd << "\n";
        }
    }

    orch.stop_loop();
    rumormill::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
