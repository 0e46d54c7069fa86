#pragma once
#include <string>

namespace rumormill {

class Orchestrator;
struct Config;
struct DialogueTurn;

// Command handlers shared by the REPL and the one-shot CLI mode. Each
// returns a string result for the caller to print.

// "[3] Mara -> Rylan (tense, +0.12): ..."
std::string format_turn(const DialogueTurn& turn);

std::string cmd_status(const Orchestrator& orch);
std::string cmd_state(const Orchestrator& orch);
std::string cmd_history(const std::string& args, const Orchestrator& orch);
std::string cmd_graph(const std::string& args, const Orchestrator& orch);
std::string cmd_entity(const std::string& args, const Orchestrator& orch);
std::string cmd_path(const std::string& args, const Orchestrator& orch);
std::string cmd_stats(const Orchestrator& orch);
std::string cmd_timeline(const Orchestrator& orch);
std::string cmd_report(const Orchestrator& orch);
std::string cmd_providers(const Config& config);

// These advance or rebuild the simulation.
std::string cmd_step(Orchestrator& orch);
std::string cmd_run(const std::string& args, Orchestrator& orch);
std::string cmd_track(const std::string& args, Orchestrator& orch);
std::string cmd_loop(const std::string& args, Orchestrator& orch);
std::string cmd_reset(const std::string& args, Orchestrator& orch);
std::string cmd_inject(const std::string& args, Orchestrator& orch);

// Fresh reset, secret planted with the first agent, N tracked turns, then
// the propagation report. Args: "[N] [secret]".
std::string cmd_experiment(const std::string& args, Orchestrator& orch);

} // namespace rumormill
