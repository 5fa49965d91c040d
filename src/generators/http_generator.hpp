#pragma once
#include "../text_generator.hpp"
#include "../http.hpp"
#include <string>

namespace engram {

// OpenAI-compatible chat completions
class OpenAIGenerator : public TextGenerator {
public:
    OpenAIGenerator(const std::string& api_key, HttpClient& http,
                    const std::string& base_url = "",
                    const std::string& model = "",
                    double temperature = 0.3);

    std::string generate(const std::string& prompt, Deadline deadline) override;
    std::string generator_name() const override { return "openai"; }

private:
    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    std::string model_;
    double temperature_;
};

// Gemini generateContent
class GeminiGenerator : public TextGenerator {
public:
    GeminiGenerator(const std::string& api_key, HttpClient& http,
                    const std::string& base_url = "",
                    const std::string& model = "",
                    double temperature = 0.3);

    std::string generate(const std::string& prompt, Deadline deadline) override;
    std::string generator_name() const override { return "gemini"; }

private:
    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    std::string model_;
    double temperature_;
};

} // namespace engram
