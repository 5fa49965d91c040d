#include <catch2/catch_test_macros.hpp>
#include "text_generator.hpp"
#include "generators/http_generator.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "mock_http_client.hpp"
#include <nlohmann/json.hpp>

using namespace engram;
using json = nlohmann::json;

static Deadline soon() { return deadline_after(std::chrono::seconds(10)); }

// ── OpenAI ───────────────────────────────────────────────────

TEST_CASE("OpenAIGenerator: posts chat completion and returns content", "[generator][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"choices":[{"message":{"role":"assistant","content":"Break tasks into 5 minute steps."}}]})"};

    OpenAIGenerator gen("sk-test", mock);
    auto text = gen.generate("summarize", soon());

    REQUIRE(text == "Break tasks into 5 minute steps.");
    REQUIRE(mock.last_url == "https://api.openai.com/v1/chat/completions");
    REQUIRE(find_header(mock.last_headers, "Authorization") == "Bearer sk-test");

    auto body = json::parse(mock.last_body);
    REQUIRE(body["model"] == "gpt-4o-mini");
    REQUIRE(body["messages"].size() == 1);
    REQUIRE(body["messages"][0]["role"] == "user");
    REQUIRE(body["messages"][0]["content"] == "summarize");
}

TEST_CASE("OpenAIGenerator: custom base url and model", "[generator][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"choices":[{"message":{"content":"ok"}}]})"};

    OpenAIGenerator gen("k", mock, "http://localhost:8080/v1", "local-model", 0.0);
    gen.generate("p", soon());

    REQUIRE(mock.last_url == "http://localhost:8080/v1/chat/completions");
    auto body = json::parse(mock.last_body);
    REQUIRE(body["model"] == "local-model");
    REQUIRE(body["temperature"] == 0.0);
}

TEST_CASE("OpenAIGenerator: HTTP error throws GenerationError", "[generator][openai]") {
    MockHttpClient mock;
    mock.next_response = {429, R"({"error":"rate limited"})"};
    OpenAIGenerator gen("k", mock);
    REQUIRE_THROWS_AS(gen.generate("p", soon()), GenerationError);
}

TEST_CASE("OpenAIGenerator: missing content throws GenerationError", "[generator][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"choices":[]})"};
    OpenAIGenerator gen("k", mock);
    REQUIRE_THROWS_AS(gen.generate("p", soon()), GenerationError);

    mock.next_response = {200, "not json"};
    REQUIRE_THROWS_AS(gen.generate("p", soon()), GenerationError);

    mock.next_response = {200, R"({"choices":[{"message":{"content":null}}]})"};
    REQUIRE_THROWS_AS(gen.generate("p", soon()), GenerationError);
}

// ── Gemini ───────────────────────────────────────────────────

TEST_CASE("GeminiGenerator: posts generateContent and returns first part", "[generator][gemini]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"candidates":[{"content":{"role":"model","parts":[{"text":"Mornings work best."}]}}]})"};

    GeminiGenerator gen("g-key", mock);
    auto text = gen.generate("summarize", soon());

    REQUIRE(text == "Mornings work best.");
    REQUIRE(mock.last_url ==
            "https://generativelanguage.googleapis.com/v1beta/models/gemini-2.0-flash:generateContent");
    REQUIRE(find_header(mock.last_headers, "x-goog-api-key") == "g-key");
    REQUIRE(find_header(mock.last_headers, "Authorization").empty());

    auto body = json::parse(mock.last_body);
    REQUIRE(body["contents"][0]["parts"][0]["text"] == "summarize");
    REQUIRE(body["generationConfig"]["temperature"] == 0.3);
}

TEST_CASE("GeminiGenerator: transport failure throws GenerationError", "[generator][gemini]") {
    MockHttpClient mock;
    mock.next_response = {0, "", "Could not resolve host"};
    GeminiGenerator gen("k", mock);
    REQUIRE_THROWS_AS(gen.generate("p", soon()), GenerationError);
}

TEST_CASE("GeminiGenerator: expired deadline makes no request", "[generator][gemini]") {
    MockHttpClient mock;
    GeminiGenerator gen("k", mock);
    REQUIRE_THROWS_AS(gen.generate("p", std::chrono::steady_clock::now() - std::chrono::milliseconds(1)),
                      DeadlineExceededError);
    REQUIRE(mock.call_count == 0);
}

TEST_CASE("OpenAIGenerator: late reply past the deadline is a timeout", "[generator][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"choices":[{"message":{"content":"ok"}}]})"};
    mock.delay = std::chrono::milliseconds(80);
    OpenAIGenerator gen("k", mock);
    REQUIRE_THROWS_AS(gen.generate("p", deadline_after(std::chrono::milliseconds(20))),
                      DeadlineExceededError);
    REQUIRE(mock.last_timeout <= 20);
}

// ── Factory ──────────────────────────────────────────────────

TEST_CASE("create_text_generator: configured provider with key", "[generator][factory]") {
    MockHttpClient mock;
    Config cfg;
    cfg.generator.provider = "openai";
    cfg.providers["openai"].api_key = "sk";

    auto gen = create_text_generator(cfg, mock);
    REQUIRE(gen);
    REQUIRE(gen->generator_name() == "openai");
}

TEST_CASE("create_text_generator: missing key disables reflections", "[generator][factory]") {
    MockHttpClient mock;
    Config cfg;
    cfg.generator.provider = "gemini";
    REQUIRE_FALSE(create_text_generator(cfg, mock));
}

TEST_CASE("create_text_generator: auto-detects from available keys", "[generator][factory]") {
    MockHttpClient mock;
    Config cfg;
    cfg.generator.provider = "";
    cfg.providers["openai"].api_key = "sk";

    auto gen = create_text_generator(cfg, mock);
    REQUIRE(gen);
    REQUIRE(gen->generator_name() == "openai");

    cfg.providers["gemini"].api_key = "g";
    gen = create_text_generator(cfg, mock);
    REQUIRE(gen->generator_name() == "gemini");
}

TEST_CASE("create_text_generator: none and unknown providers", "[generator][factory]") {
    MockHttpClient mock;
    Config cfg;
    cfg.providers["gemini"].api_key = "g";

    cfg.generator.provider = "none";
    REQUIRE_FALSE(create_text_generator(cfg, mock));

    cfg.generator.provider = "anthropic";
    REQUIRE_FALSE(create_text_generator(cfg, mock));
}
