#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace rumormill;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.provider == "template");
    REQUIRE(cfg.temperature == 0.8);
    REQUIRE(cfg.simulation.party_size == 2);
    REQUIRE(cfg.simulation.history_limit == 50);
    REQUIRE(cfg.simulation.seed == 42);
    REQUIRE(cfg.retrieval.max_hops == 2);
    REQUIRE(cfg.retrieval.max_results == 4);
    REQUIRE(cfg.propagation.trace_threshold == 0.15);
    REQUIRE(cfg.api_key_for("openai").empty());
}

TEST_CASE("default_rumor_seeds: five hooks", "[config]") {
    REQUIRE(default_rumor_seeds().size() == 5);
    REQUIRE(default_rumor_seeds().front() == "Vault door left ajar last night.");
}

// ── api_key_for / base_url_for ───────────────────────────────────

TEST_CASE("Config::api_key_for: returns correct key per provider", "[config]") {
    Config cfg;
    cfg.providers["openai"].api_key = "sk-oai-456";
    cfg.providers["openrouter"].api_key = "sk-or-789";

    REQUIRE(cfg.api_key_for("openai") == "sk-oai-456");
    REQUIRE(cfg.api_key_for("openrouter") == "sk-or-789");
    REQUIRE(cfg.api_key_for("unknown").empty());
}

TEST_CASE("Config::base_url_for: global override wins", "[config]") {
    Config cfg;
    cfg.providers["ollama"].base_url = "http://ollama:11434";
    REQUIRE(cfg.base_url_for("ollama") == "http://ollama:11434");
    REQUIRE(cfg.base_url_for("openai").empty());

    cfg.base_url = "http://proxy:8080/v1";
    REQUIRE(cfg.base_url_for("ollama") == "http://proxy:8080/v1");
}

// ── apply_json ───────────────────────────────────────────────────

TEST_CASE("Config::apply_json: reads every section", "[config]") {
    Config cfg;
    cfg.apply_json(nlohmann::json::parse(R"({
        "provider": "ollama",
        "model": "llama3",
        "simulation": {"persona_pool": ["bard", "guard"], "party_size": 3, "seed": 7},
        "retrieval": {"max_hops": 3, "recency_half_life": 2.5},
        "world": {"heat_decay": 0.1, "beats_limit": 4},
        "propagation": {"stoic_traits": ["silent"]}
    })"));

    REQUIRE(cfg.provider == "ollama");
    REQUIRE(cfg.model == "llama3");
    REQUIRE(cfg.simulation.persona_pool == std::vector<std::string>{"bard", "guard"});
    REQUIRE(cfg.simulation.party_size == 3);
    REQUIRE(cfg.simulation.seed == 7);
    REQUIRE(cfg.retrieval.max_hops == 3);
    REQUIRE(cfg.retrieval.recency_half_life == 2.5);
    REQUIRE(cfg.world.heat_decay == 0.1);
    REQUIRE(cfg.world.beats_limit == 4);
    REQUIRE(cfg.propagation.stoic_traits == std::vector<std::string>{"silent"});
}

TEST_CASE("Config::apply_json: wrong types are ignored", "[config]") {
    Config cfg;
    cfg.apply_json(nlohmann::json::parse(R"({
        "provider": 12,
        "simulation": {"party_size": "many", "history_limit": -3}
    })"));
    REQUIRE(cfg.provider == "template");
    REQUIRE(cfg.simulation.party_size == 2);
    REQUIRE(cfg.simulation.history_limit == 50);
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "rumormill_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

static const char* const kEnvVars[] = {
    "OPENAI_API_KEY", "OPENROUTER_API_KEY", "OLLAMA_BASE_URL", "COMPATIBLE_BASE_URL",
    "RUMORMILL_PROVIDER", "RUMORMILL_MODEL", "RUMORMILL_PERSONA_POOL",
    "RUMORMILL_PARTY_SIZE", "RUMORMILL_RUMOR_SEEDS", "RUMORMILL_DIALOGUE_DELAY_MS",
    "RUMORMILL_SEED",
};

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        for (const char* name : kEnvVars) unsetenv(name);
    }

    ~ConfigTestGuard() {
        for (const char* name : kEnvVars) unsetenv(name);
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.rumormill/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.rumormill");
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "providers": {
            "openai": { "api_key": "sk-file-oai" },
            "ollama": { "base_url": "http://custom:9999" }
        },
        "provider": "openai",
        "model": "gpt-4o",
        "temperature": 0.5,
        "simulation": { "dialogue_delay_ms": 250 }
    })");

    Config cfg = Config::load();

    REQUIRE(cfg.api_key_for("openai") == "sk-file-oai");
    REQUIRE(cfg.base_url_for("ollama") == "http://custom:9999");
    REQUIRE(cfg.provider == "openai");
    REQUIRE(cfg.model == "gpt-4o");
    REQUIRE(cfg.temperature == 0.5);
    REQUIRE(cfg.simulation.dialogue_delay_ms == 250);
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"providers": {"openai": {"api_key": "from-file"}}})");
    setenv("OPENAI_API_KEY", "from-env", 1);
    setenv("RUMORMILL_PERSONA_POOL", "bard | guard|smuggler", 1);
    setenv("RUMORMILL_PARTY_SIZE", "3", 1);
    setenv("RUMORMILL_RUMOR_SEEDS", "A bell rang twice.|Smoke over the docks.", 1);
    setenv("RUMORMILL_SEED", "99", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.api_key_for("openai") == "from-env");
    REQUIRE(cfg.simulation.persona_pool == std::vector<std::string>{"bard", "guard", "smuggler"});
    REQUIRE(cfg.simulation.party_size == 3);
    REQUIRE(cfg.simulation.rumor_seeds.size() == 2);
    REQUIRE(cfg.simulation.rumor_seeds[1] == "Smoke over the docks.");
    REQUIRE(cfg.simulation.seed == 99);
}

TEST_CASE("Config::load: party size below two is raised", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"simulation": {"party_size": 1}})");
    Config cfg = Config::load();
    REQUIRE(cfg.simulation.party_size == 2);
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.provider == "template");
    REQUIRE(cfg.simulation.rumor_seeds == default_rumor_seeds());
}

TEST_CASE("Config::load: empty rumor seeds fall back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"simulation": {"rumor_seeds": []}})");
    Config cfg = Config::load();
    REQUIRE(cfg.simulation.rumor_seeds == default_rumor_seeds());
}

// ── Default config creation and migration ────────────────────────

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();

    REQUIRE(std::filesystem::exists(g.config_path()));

    std::ifstream f(g.config_path());
    nlohmann::json j = nlohmann::json::parse(f);

    REQUIRE(j["provider"] == "template");
    REQUIRE(j["providers"].contains("openai"));
    REQUIRE(j["simulation"]["party_size"] == 2);
    REQUIRE(j["retrieval"]["path_weight"] == 0.5);
    REQUIRE(j["world"].contains("alert_threshold"));
    REQUIRE(j["propagation"]["gossip_traits"].size() == 4);
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"model": "gpt-4o", "simulation": {"seed": 5}})");

    Config cfg = Config::load();
    REQUIRE(cfg.model == "gpt-4o");
    REQUIRE(cfg.simulation.seed == 5);

    std::ifstream f(g.config_path());
    nlohmann::json j = nlohmann::json::parse(f);
    REQUIRE(j["model"] == "gpt-4o");
    REQUIRE(j["simulation"]["seed"] == 5);
    REQUIRE(j["simulation"]["history_limit"] == 50);
    REQUIRE(j.contains("propagation"));
}

TEST_CASE("Config::load: defaults roundtrip without re-migration", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();
    std::string first;
    {
        std::ifstream f(g.config_path());
        first.assign(std::istreambuf_iterator<char>(f),
                     std::istreambuf_iterator<char>());
    }

    Config::load();
    std::string second;
    {
        std::ifstream f(g.config_path());
        second.assign(std::istreambuf_iterator<char>(f),
                      std::istreambuf_iterator<char>());
    }
    REQUIRE(first == second);
}
