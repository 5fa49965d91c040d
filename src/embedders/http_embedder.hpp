#pragma once
#include "../embedder.hpp"
#include "../http.hpp"
#include <string>

namespace engram {

// Unified HTTP-based embedder. Supports OpenAI-compatible, Ollama and Gemini
// APIs by parameterizing the endpoint, auth, request shape and response path.
class HttpEmbedder : public Embedder {
public:
    enum class Wire { OpenAI, Gemini };

    struct Config {
        std::string name;           // e.g. "openai", "ollama", "gemini"
        Wire wire = Wire::OpenAI;
        std::string api_key;        // empty = no auth header
        std::string auth_header;    // "Authorization" (Bearer) or "x-goog-api-key"
        std::string base_url;       // e.g. "https://api.openai.com/v1"
        std::string model;          // e.g. "text-embedding-3-small"
        std::string endpoint;       // URL path, e.g. "/embeddings"
        std::string response_path;  // JSON pointer to float array, e.g. "/data/0/embedding"
        uint32_t dims = 0;          // deployment dimension D; responses must match
    };

    HttpEmbedder(Config config, HttpClient& http);

    Embedding embed(const std::string& text, Deadline deadline) override;
    uint32_t dimensions() const override { return config_.dims; }
    std::string embedder_name() const override { return config_.name; }

private:
    Config config_;
    HttpClient& http_;
};

std::unique_ptr<Embedder> create_openai_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model, uint32_t dims);

std::unique_ptr<Embedder> create_ollama_embedder(
    HttpClient& http, const std::string& base_url, const std::string& model,
    uint32_t dims);

std::unique_ptr<Embedder> create_gemini_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model, uint32_t dims);

} // namespace engram
