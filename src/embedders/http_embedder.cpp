#include "http_embedder.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>

namespace engram {

HttpEmbedder::HttpEmbedder(Config config, HttpClient& http)
    : config_(std::move(config))
    , http_(http)
{}

Embedding HttpEmbedder::embed(const std::string& text, Deadline deadline) {
    check_deadline(deadline, config_.name + " embed");

    nlohmann::json body;
    if (config_.wire == Wire::Gemini) {
        body = {
            {"model", "models/" + config_.model},
            {"content", {{"parts", {{{"text", text}}}}}}
        };
    } else {
        body = {
            {"model", config_.model},
            {"input", text}
        };
    }

    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };
    if (!config_.api_key.empty()) {
        if (config_.auth_header == "Authorization") {
            headers.push_back({"Authorization", "Bearer " + config_.api_key});
        } else {
            headers.push_back({config_.auth_header, config_.api_key});
        }
    }

    auto response = http_.post(config_.base_url + config_.endpoint, body.dump(),
                               headers, timeout_millis_for(deadline));
    // A late answer counts as a timeout even when it succeeded
    check_deadline(deadline, config_.name + " embed");
    if (response.status_code == 0) {
        throw EmbeddingError(config_.name + " embed transport failure: " + response.error);
    }
    if (response.status_code != 200) {
        throw EmbeddingError(config_.name + " embed returned HTTP " +
                             std::to_string(response.status_code));
    }

    Embedding result;
    try {
        auto j = nlohmann::json::parse(response.body);
        auto& arr = j.at(nlohmann::json::json_pointer(config_.response_path));
        result.reserve(arr.size());
        for (const auto& val : arr) {
            result.push_back(val.get<float>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw EmbeddingError(config_.name + " embed response malformed: " + e.what());
    }

    if (result.empty()) {
        throw EmbeddingError(config_.name + " embed returned an empty vector");
    }
    if (config_.dims != 0 && result.size() != config_.dims) {
        throw EmbeddingError(config_.name + " embed returned " + std::to_string(result.size()) +
                             " dimensions, expected " + std::to_string(config_.dims));
    }
    return result;
}

std::unique_ptr<Embedder> create_openai_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model, uint32_t dims) {
    HttpEmbedder::Config cfg;
    cfg.name = "openai";
    cfg.api_key = api_key;
    cfg.auth_header = "Authorization";
    cfg.base_url = base_url.empty() ? "https://api.openai.com/v1" : base_url;
    cfg.model = model.empty() ? "text-embedding-3-small" : model;
    cfg.endpoint = "/embeddings";
    cfg.response_path = "/data/0/embedding";
    cfg.dims = dims;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

std::unique_ptr<Embedder> create_ollama_embedder(
    HttpClient& http, const std::string& base_url, const std::string& model,
    uint32_t dims) {
    HttpEmbedder::Config cfg;
    cfg.name = "ollama";
    cfg.base_url = base_url.empty() ? "http://localhost:11434" : base_url;
    cfg.model = model.empty() ? "nomic-embed-text" : model;
    cfg.endpoint = "/api/embed";
    cfg.response_path = "/embeddings/0";
    cfg.dims = dims;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

std::unique_ptr<Embedder> create_gemini_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model, uint32_t dims) {
    HttpEmbedder::Config cfg;
    cfg.name = "gemini";
    cfg.wire = HttpEmbedder::Wire::Gemini;
    cfg.api_key = api_key;
    cfg.auth_header = "x-goog-api-key";
    cfg.base_url = base_url.empty()
        ? "https://generativelanguage.googleapis.com/v1beta" : base_url;
    cfg.model = model.empty() ? "text-embedding-004" : model;
    cfg.endpoint = "/models/" + cfg.model + ":embedContent";
    cfg.response_path = "/embedding/values";
    cfg.dims = dims;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

} // namespace engram
