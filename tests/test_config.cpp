#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace engram;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values match the documented deployment", "[config]") {
    Config cfg;
    REQUIRE(cfg.store.backend == "sqlite");
    REQUIRE(cfg.embedding.provider == "gemini");
    REQUIRE(cfg.embedding.dimensions == 768);
    REQUIRE(cfg.embedding.max_attempts == 3);
    REQUIRE(cfg.embedding.initial_backoff_ms == 100);
    REQUIRE(cfg.embedding.max_backoff_ms == 2000);
    REQUIRE(cfg.retention.intervention_ttl == 30u * 86400u);
    REQUIRE(cfg.retention.reflection_ttl == 90u * 86400u);
    REQUIRE(cfg.retention.sweep_interval == 300);
    REQUIRE(cfg.context.max_reflections == 3);
    REQUIRE(cfg.context.max_similar == 3);
    REQUIRE(cfg.context.similarity_threshold == 0.7);
    REQUIRE(cfg.context.load_timeout_ms == 2000);
    REQUIRE(cfg.reflection.max_turns == 20);
    REQUIRE(cfg.reflection.min_turns == 2);
    REQUIRE(cfg.reflection.summary_max_chars == 500);
    REQUIRE(cfg.reflection.grace_period_ms == 5000);
}

TEST_CASE("Config: defaults_json parses back to the defaults", "[config]") {
    Config cfg = Config::from_json(Config::defaults_json());
    Config plain;
    REQUIRE(cfg.embedding.dimensions == plain.embedding.dimensions);
    REQUIRE(cfg.embedding.model == "text-embedding-004");
    REQUIRE(cfg.generator.model == "gemini-2.0-flash");
    REQUIRE(cfg.retention.intervention_ttl == plain.retention.intervention_ttl);
    REQUIRE(cfg.base_url_for("ollama") == "http://localhost:11434");
}

// ── api_key_for / base_url_for ───────────────────────────────────

TEST_CASE("Config::api_key_for: returns correct key per provider", "[config]") {
    Config cfg;
    cfg.providers["gemini"].api_key = "g-123";
    cfg.providers["openai"].api_key = "sk-oai-456";

    REQUIRE(cfg.api_key_for("gemini") == "g-123");
    REQUIRE(cfg.api_key_for("openai") == "sk-oai-456");
    REQUIRE(cfg.api_key_for("unknown").empty());
    REQUIRE(cfg.base_url_for("unknown").empty());
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: partial document keeps other defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "store": { "backend": "memory" },
        "context": { "similarity_threshold": 0.5 }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.store.backend == "memory");
    REQUIRE(cfg.context.similarity_threshold == 0.5);
    REQUIRE(cfg.context.max_similar == 3);
    REQUIRE(cfg.embedding.dimensions == 768);
}

TEST_CASE("Config::from_json: wrongly typed values keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "embedding": { "dimensions": "lots", "model": 12 },
        "retention": { "intervention_ttl": -5 },
        "reflection": "not an object"
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.embedding.dimensions == 768);
    REQUIRE(cfg.embedding.model.empty());
    REQUIRE(cfg.retention.intervention_ttl == 30u * 86400u);
    REQUIRE(cfg.reflection.max_turns == 20);
}

TEST_CASE("Config::from_json: values beyond 32 bits keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "embedding": { "dimensions": 4294967297 },
        "retention": { "reflection_ttl": 5000000000, "intervention_ttl": 4294967295 }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.embedding.dimensions == 768);
    REQUIRE(cfg.retention.reflection_ttl == 90u * 86400u);
    REQUIRE(cfg.retention.intervention_ttl == 4294967295u);
}

TEST_CASE("Config::from_json: non-object yields defaults", "[config]") {
    Config cfg = Config::from_json(nlohmann::json::array());
    REQUIRE(cfg.store.backend == "sqlite");
}

// ── store_path ───────────────────────────────────────────────────

TEST_CASE("Config::store_path: default and explicit", "[config]") {
    Config cfg;
    const char* home = std::getenv("HOME");
    if (home) {
        REQUIRE(cfg.store_path() == std::string(home) + "/.engram/memory.db");
    }
    cfg.store.path = "/var/lib/engram/db.sqlite";
    REQUIRE(cfg.store_path() == "/var/lib/engram/db.sqlite");
}

// ── load ─────────────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "engram_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("GOOGLE_API_KEY");
        unsetenv("OPENAI_API_KEY");
        unsetenv("OLLAMA_BASE_URL");
        unsetenv("ENGRAM_STORE_BACKEND");
        unsetenv("ENGRAM_STORE_PATH");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.engram/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.engram");
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "providers": { "gemini": { "api_key": "g-file" } },
        "store": { "backend": "memory" },
        "embedding": { "dimensions": 4, "max_attempts": 5 },
        "retention": { "intervention_ttl": 60, "sweep_interval": 0 },
        "reflection": { "min_turns": 4 }
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.api_key_for("gemini") == "g-file");
    REQUIRE(cfg.store.backend == "memory");
    REQUIRE(cfg.embedding.dimensions == 4);
    REQUIRE(cfg.embedding.max_attempts == 5);
    REQUIRE(cfg.retention.intervention_ttl == 60);
    REQUIRE(cfg.retention.sweep_interval == 0);
    REQUIRE(cfg.retention.reflection_ttl == 90u * 86400u);
    REQUIRE(cfg.reflection.min_turns == 4);
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({ "providers": { "gemini": { "api_key": "from-file" } },
                        "store": { "backend": "sqlite", "path": "/from/file.db" } })");

    setenv("GOOGLE_API_KEY", "from-env", 1);
    setenv("ENGRAM_STORE_BACKEND", "memory", 1);
    setenv("ENGRAM_STORE_PATH", "/from/env.db", 1);
    Config cfg = Config::load();
    REQUIRE(cfg.api_key_for("gemini") == "from-env");
    REQUIRE(cfg.store.backend == "memory");
    REQUIRE(cfg.store_path() == "/from/env.db");
    unsetenv("GOOGLE_API_KEY");
    unsetenv("ENGRAM_STORE_BACKEND");
    unsetenv("ENGRAM_STORE_PATH");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config("{ not json");

    Config cfg = Config::load();
    REQUIRE(cfg.store.backend == "sqlite");
    REQUIRE(cfg.embedding.dimensions == 768);
}

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));

    Config cfg = Config::load();
    REQUIRE(cfg.store.backend == "sqlite");
    REQUIRE(std::filesystem::exists(g.config_path()));

    std::ifstream f(g.config_path());
    auto j = nlohmann::json::parse(f);
    REQUIRE(j.contains("retention"));
    REQUIRE(j["embedding"]["dimensions"] == 768);
}

TEST_CASE("Config::load_from: missing file uses defaults without creating it", "[config]") {
    ConfigTestGuard g;
    std::string path = g.dir + "/nope.json";
    Config cfg = Config::load_from(path);
    REQUIRE(cfg.context.max_reflections == 3);
    REQUIRE_FALSE(std::filesystem::exists(path));
}

TEST_CASE("Config::load_from: reads explicit path", "[config]") {
    ConfigTestGuard g;
    std::string path = g.dir + "/custom.json";
    {
        std::ofstream f(path);
        f << R"({ "context": { "max_similar": 5 } })";
    }
    Config cfg = Config::load_from(path);
    REQUIRE(cfg.context.max_similar == 5);
    REQUIRE(cfg.context.max_reflections == 3);
}
