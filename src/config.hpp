#pragma once
#include <string>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace engram {

struct ProviderEntry {
    std::string api_key;
    std::string base_url;
};

struct StoreConfig {
    std::string backend = "sqlite"; // "sqlite", "memory" or "none"
    std::string path;               // empty = ~/.engram/memory.db
};

struct EmbeddingConfig {
    std::string provider = "gemini"; // "gemini", "openai", "ollama"; empty = auto-detect
    std::string api_key;             // empty = providers[provider].api_key
    std::string base_url;
    std::string model;
    uint32_t dimensions = 768;       // text-embedding-004
    uint32_t max_attempts = 3;
    uint32_t initial_backoff_ms = 100;
    uint32_t max_backoff_ms = 2000;
    uint32_t timeout_ms = 5000;
};

struct GeneratorConfig {
    std::string provider = "gemini"; // "gemini" or "openai"; empty = auto-detect
    std::string api_key;
    std::string base_url;
    std::string model;
    double temperature = 0.3;
    uint32_t timeout_ms = 15000;
};

struct RetentionConfig {
    uint32_t intervention_ttl = 2592000; // 30 days, seconds
    uint32_t reflection_ttl = 7776000;   // 90 days, seconds
    uint32_t sweep_interval = 300;       // seconds, 0 = no background sweep
};

struct ContextConfig {
    uint32_t max_reflections = 3;
    uint32_t max_similar = 3;
    double similarity_threshold = 0.7;
    uint32_t load_timeout_ms = 2000;
};

struct ReflectionConfig {
    uint32_t max_turns = 20;
    uint32_t min_turns = 2;
    uint32_t summary_max_chars = 500;
    uint32_t grace_period_ms = 5000;
};

struct Config {
    std::unordered_map<std::string, ProviderEntry> providers;

    StoreConfig store;
    EmbeddingConfig embedding;
    GeneratorConfig generator;
    RetentionConfig retention;
    ContextConfig context;
    ReflectionConfig reflection;

    // Load from ~/.engram/config.json + env vars. Creates the file with
    // defaults when it does not exist yet.
    static Config load();

    // Load from an explicit path + env vars. A missing or malformed file
    // yields defaults.
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a JSON document (already merged with defaults or partial).
    // Unknown keys are ignored, wrongly typed values keep the default.
    static Config from_json(const nlohmann::json& j);

    // Get API key for a provider name
    std::string api_key_for(const std::string& provider) const;

    // Get base URL for a provider name (empty = use provider default)
    std::string base_url_for(const std::string& provider) const;

    // Store path with ~ expanded and the default applied
    std::string store_path() const;
};

} // namespace engram
