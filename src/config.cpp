#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

namespace engram {

nlohmann::json Config::defaults_json() {
    return {
        {"providers", {
            {"gemini", {{"api_key", ""}}},
            {"openai", {{"api_key", ""}}},
            {"ollama", {{"base_url", "http://localhost:11434"}}}
        }},
        {"store", {
            {"backend", "sqlite"},
            {"path", ""}
        }},
        {"embedding", {
            {"provider", "gemini"},
            {"model", "text-embedding-004"},
            {"dimensions", 768},
            {"max_attempts", 3},
            {"initial_backoff_ms", 100},
            {"max_backoff_ms", 2000},
            {"timeout_ms", 5000}
        }},
        {"generator", {
            {"provider", "gemini"},
            {"model", "gemini-2.0-flash"},
            {"temperature", 0.3},
            {"timeout_ms", 15000}
        }},
        {"retention", {
            {"intervention_ttl", 2592000},
            {"reflection_ttl", 7776000},
            {"sweep_interval", 300}
        }},
        {"context", {
            {"max_reflections", 3},
            {"max_similar", 3},
            {"similarity_threshold", 0.7},
            {"load_timeout_ms", 2000}
        }},
        {"reflection", {
            {"max_turns", 20},
            {"min_turns", 2},
            {"summary_max_chars", 500},
            {"grace_period_ms", 5000}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string()) out = obj[key].get<std::string>();
}

static void read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_unsigned()) return;
    uint64_t v = obj[key].get<uint64_t>();
    if (v > std::numeric_limits<uint32_t>::max()) {
        std::cerr << "[config] Ignoring out-of-range value for '" << key << "': " << v << "\n";
        return;
    }
    out = static_cast<uint32_t>(v);
}

static void read_double(const nlohmann::json& obj, const char* key, double& out) {
    if (obj.contains(key) && obj[key].is_number()) out = obj[key].get<double>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderEntry entry;
            read_string(obj, "api_key", entry.api_key);
            read_string(obj, "base_url", entry.base_url);
            cfg.providers[name] = std::move(entry);
        }
    }

    if (j.contains("store") && j["store"].is_object()) {
        auto& s = j["store"];
        read_string(s, "backend", cfg.store.backend);
        read_string(s, "path", cfg.store.path);
    }

    if (j.contains("embedding") && j["embedding"].is_object()) {
        auto& e = j["embedding"];
        read_string(e, "provider", cfg.embedding.provider);
        read_string(e, "api_key", cfg.embedding.api_key);
        read_string(e, "base_url", cfg.embedding.base_url);
        read_string(e, "model", cfg.embedding.model);
        read_uint(e, "dimensions", cfg.embedding.dimensions);
        read_uint(e, "max_attempts", cfg.embedding.max_attempts);
        read_uint(e, "initial_backoff_ms", cfg.embedding.initial_backoff_ms);
        read_uint(e, "max_backoff_ms", cfg.embedding.max_backoff_ms);
        read_uint(e, "timeout_ms", cfg.embedding.timeout_ms);
    }

    if (j.contains("generator") && j["generator"].is_object()) {
        auto& g = j["generator"];
        read_string(g, "provider", cfg.generator.provider);
        read_string(g, "api_key", cfg.generator.api_key);
        read_string(g, "base_url", cfg.generator.base_url);
        read_string(g, "model", cfg.generator.model);
        read_double(g, "temperature", cfg.generator.temperature);
        read_uint(g, "timeout_ms", cfg.generator.timeout_ms);
    }

    if (j.contains("retention") && j["retention"].is_object()) {
        auto& r = j["retention"];
        read_uint(r, "intervention_ttl", cfg.retention.intervention_ttl);
        read_uint(r, "reflection_ttl", cfg.retention.reflection_ttl);
        read_uint(r, "sweep_interval", cfg.retention.sweep_interval);
    }

    if (j.contains("context") && j["context"].is_object()) {
        auto& c = j["context"];
        read_uint(c, "max_reflections", cfg.context.max_reflections);
        read_uint(c, "max_similar", cfg.context.max_similar);
        read_double(c, "similarity_threshold", cfg.context.similarity_threshold);
        read_uint(c, "load_timeout_ms", cfg.context.load_timeout_ms);
    }

    if (j.contains("reflection") && j["reflection"].is_object()) {
        auto& r = j["reflection"];
        read_uint(r, "max_turns", cfg.reflection.max_turns);
        read_uint(r, "min_turns", cfg.reflection.min_turns);
        read_uint(r, "summary_max_chars", cfg.reflection.summary_max_chars);
        read_uint(r, "grace_period_ms", cfg.reflection.grace_period_ms);
    }

    return cfg;
}

// Environment variables always override the config file
static void apply_env_overrides(Config& cfg) {
    if (const char* v = std::getenv("GOOGLE_API_KEY"))
        cfg.providers["gemini"].api_key = v;
    if (const char* v = std::getenv("OPENAI_API_KEY"))
        cfg.providers["openai"].api_key = v;
    if (const char* v = std::getenv("OLLAMA_BASE_URL"))
        cfg.providers["ollama"].base_url = v;
    if (const char* v = std::getenv("ENGRAM_STORE_BACKEND"))
        cfg.store.backend = v;
    if (const char* v = std::getenv("ENGRAM_STORE_PATH"))
        cfg.store.path = v;
}

static nlohmann::json read_config_file(const std::string& path, bool& found) {
    found = false;
    std::ifstream file(path);
    if (!file.is_open()) return Config::defaults_json();
    found = true;
    try {
        nlohmann::json original = nlohmann::json::parse(file);
        return merge_defaults(original, Config::defaults_json());
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[config] Ignoring malformed config " << path << ": " << e.what() << "\n";
        return Config::defaults_json();
    }
}

Config Config::load() {
    std::string config_path = expand_home("~/.engram/config.json");
    bool found = false;
    nlohmann::json j = read_config_file(config_path, found);
    if (!found) {
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    apply_env_overrides(cfg);
    return cfg;
}

Config Config::load_from(const std::string& path) {
    bool found = false;
    nlohmann::json j = read_config_file(path, found);
    if (!found) {
        std::cerr << "[config] " << path << " not found, using defaults\n";
    }
    Config cfg = from_json(j);
    apply_env_overrides(cfg);
    return cfg;
}

std::string Config::api_key_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.api_key;
    return {};
}

std::string Config::base_url_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

std::string Config::store_path() const {
    if (store.path.empty()) return expand_home("~/.engram/memory.db");
    return expand_home(store.path);
}

} // namespace engram
