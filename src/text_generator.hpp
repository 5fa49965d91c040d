#pragma once
#include "clock.hpp"
#include <memory>
#include <string>

namespace engram {

class HttpClient; // forward declare
struct Config;    // forward declare

// Abstract text generation interface used for reflection synthesis
class TextGenerator {
public:
    virtual ~TextGenerator() = default;

    // Generate a completion for a single prompt.
    // Throws GenerationError on failure, DeadlineExceededError once the
    // deadline has passed.
    virtual std::string generate(const std::string& prompt, Deadline deadline) = 0;

    virtual std::string generator_name() const = 0;
};

// Create a generator from config. Returns nullptr when no provider is
// configured or its API key is missing.
std::unique_ptr<TextGenerator> create_text_generator(const Config& config, HttpClient& http);

} // namespace engram
