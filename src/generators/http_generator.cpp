#include "http_generator.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace engram {

// Shared response handling: transport failures, HTTP errors, JSON extraction.
static std::string extract_text(const HttpResponse& response, const std::string& name,
                                const char* pointer, Deadline deadline) {
    check_deadline(deadline, name + " generate");
    if (response.status_code == 0) {
        throw GenerationError(name + " transport failure: " + response.error);
    }
    if (response.status_code != 200) {
        throw GenerationError(name + " API error (HTTP " +
                              std::to_string(response.status_code) + "): " + response.body);
    }
    try {
        auto j = json::parse(response.body);
        auto& text = j.at(json::json_pointer(pointer));
        if (!text.is_string()) {
            throw GenerationError(name + " response carries no text");
        }
        return text.get<std::string>();
    } catch (const json::exception& e) {
        throw GenerationError(name + " response malformed: " + e.what());
    }
}

// ── OpenAI ──────────────────────────────────────────────────────

OpenAIGenerator::OpenAIGenerator(const std::string& api_key, HttpClient& http,
                                 const std::string& base_url,
                                 const std::string& model,
                                 double temperature)
    : api_key_(api_key)
    , http_(http)
    , base_url_(base_url.empty() ? "https://api.openai.com/v1" : base_url)
    , model_(model.empty() ? "gpt-4o-mini" : model)
    , temperature_(temperature)
{}

std::string OpenAIGenerator::generate(const std::string& prompt, Deadline deadline) {
    check_deadline(deadline, "openai generate");

    json body = {
        {"model", model_},
        {"temperature", temperature_},
        {"messages", json::array({
            {{"role", "user"}, {"content", prompt}}
        })}
    };

    std::vector<Header> headers = {
        {"Authorization", "Bearer " + api_key_},
        {"Content-Type", "application/json"}
    };

    auto response = http_.post(base_url_ + "/chat/completions", body.dump(), headers,
                               timeout_millis_for(deadline));
    return extract_text(response, "openai", "/choices/0/message/content", deadline);
}

// ── Gemini ──────────────────────────────────────────────────────

GeminiGenerator::GeminiGenerator(const std::string& api_key, HttpClient& http,
                                 const std::string& base_url,
                                 const std::string& model,
                                 double temperature)
    : api_key_(api_key)
    , http_(http)
    , base_url_(base_url.empty() ? "https://generativelanguage.googleapis.com/v1beta" : base_url)
    , model_(model.empty() ? "gemini-2.0-flash" : model)
    , temperature_(temperature)
{}

std::string GeminiGenerator::generate(const std::string& prompt, Deadline deadline) {
    check_deadline(deadline, "gemini generate");

    json body = {
        {"contents", json::array({
            {{"role", "user"}, {"parts", json::array({{{"text", prompt}}})}}
        })},
        {"generationConfig", {{"temperature", temperature_}}}
    };

    std::vector<Header> headers = {
        {"x-goog-api-key", api_key_},
        {"Content-Type", "application/json"}
    };

    auto response = http_.post(base_url_ + "/models/" + model_ + ":generateContent",
                               body.dump(), headers, timeout_millis_for(deadline));
    return extract_text(response, "gemini", "/candidates/0/content/parts/0/text", deadline);
}

} // namespace engram
