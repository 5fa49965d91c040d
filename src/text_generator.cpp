#include "text_generator.hpp"
#include "generators/http_generator.hpp"
#include "config.hpp"
#include <iostream>

namespace engram {

std::unique_ptr<TextGenerator> create_text_generator(const Config& config, HttpClient& http) {
    const auto& gen = config.generator;

    std::string provider = gen.provider;
    if (provider.empty()) {
        if (!config.api_key_for("gemini").empty()) provider = "gemini";
        else if (!config.api_key_for("openai").empty()) provider = "openai";
    }
    if (provider.empty() || provider == "none") return nullptr;

    std::string api_key = gen.api_key.empty() ? config.api_key_for(provider) : gen.api_key;
    std::string base_url = gen.base_url.empty() ? config.base_url_for(provider) : gen.base_url;

    if (provider != "gemini" && provider != "openai") {
        std::cerr << "[generator] Unknown generator provider: " << provider << "\n";
        return nullptr;
    }
    if (api_key.empty()) {
        std::cerr << "[generator] " << provider
                  << " generator configured but no API key found; reflections disabled\n";
        return nullptr;
    }

    if (provider == "gemini") {
        return std::make_unique<GeminiGenerator>(api_key, http, base_url, gen.model,
                                                 gen.temperature);
    }
    return std::make_unique<OpenAIGenerator>(api_key, http, base_url, gen.model,
                                             gen.temperature);
}

} // namespace engram
