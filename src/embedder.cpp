#include "embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "embedders/reliable_embedder.hpp"
#include "config.hpp"
#include "http.hpp"
#include <iostream>

namespace engram {

static std::unique_ptr<Embedder> create_base_embedder(const Config& config, HttpClient& http) {
    const auto& emb = config.embedding;

    std::string gemini_key = emb.api_key;
    if (gemini_key.empty()) gemini_key = config.api_key_for("gemini");
    std::string openai_key = emb.api_key;
    if (openai_key.empty()) openai_key = config.api_key_for("openai");

    // Resolve provider: explicit config, or auto-detect from available API keys
    std::string provider = emb.provider;
    if (provider.empty()) {
        if (!gemini_key.empty()) {
            provider = "gemini";
            std::cerr << "[embedder] Auto-detected Gemini API key, enabling embeddings\n";
        } else if (!openai_key.empty()) {
            provider = "openai";
            std::cerr << "[embedder] Auto-detected OpenAI API key, enabling embeddings\n";
        }
    }
    if (provider.empty() || provider == "none") return nullptr;

    if (provider == "gemini") {
        if (gemini_key.empty()) {
            std::cerr << "[embedder] Gemini embeddings configured but no API key found\n";
            return nullptr;
        }
        std::string base_url = emb.base_url.empty() ? config.base_url_for("gemini") : emb.base_url;
        return create_gemini_embedder(gemini_key, http, base_url, emb.model, emb.dimensions);
    }

    if (provider == "openai") {
        if (openai_key.empty()) {
            std::cerr << "[embedder] OpenAI embeddings configured but no API key found\n";
            return nullptr;
        }
        std::string base_url = emb.base_url.empty() ? config.base_url_for("openai") : emb.base_url;
        return create_openai_embedder(openai_key, http, base_url, emb.model, emb.dimensions);
    }

    if (provider == "ollama") {
        std::string base_url = emb.base_url.empty() ? config.base_url_for("ollama") : emb.base_url;
        return create_ollama_embedder(http, base_url, emb.model, emb.dimensions);
    }

    std::cerr << "[embedder] Unknown embedding provider: " << provider << "\n";
    return nullptr;
}

std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http) {
    auto base = create_base_embedder(config, http);
    if (!base) return nullptr;

    BackoffPolicy policy;
    policy.max_attempts = config.embedding.max_attempts;
    policy.initial_delay = std::chrono::milliseconds(config.embedding.initial_backoff_ms);
    policy.max_delay = std::chrono::milliseconds(config.embedding.max_backoff_ms);
    return std::make_unique<ReliableEmbedder>(std::move(base), policy);
}

} // namespace engram
