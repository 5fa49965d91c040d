#pragma once
#include "record.hpp"
#include "clock.hpp"
#include <optional>
#include <string>
#include <vector>

namespace engram {

class MemoryStore;
class ContextAssembler;
class TextGenerator;
struct ReflectionConfig;

struct ReflectionOptions {
    uint32_t max_turns = 20;
    uint32_t min_turns = 2;
    uint32_t summary_max_chars = 500;

    static ReflectionOptions from_config(const ReflectionConfig& config);
};

// Number of turns whose content is non-empty after trimming.
uint32_t count_substantive_turns(const Transcript& transcript);

// "ROLE: content" lines for the last `max_turns` substantive turns.
std::string format_transcript(const Transcript& transcript, uint32_t max_turns);

std::string build_reflection_prompt(const std::string& formatted_transcript,
                                    const std::vector<std::string>& prior_insights);

// End-of-session summarization. Calls the generator exactly once and writes
// the resulting insight back through the store.
class ReflectionSynthesizer {
public:
    ReflectionSynthesizer(MemoryStore& store, ContextAssembler& assembler,
                          ReflectionOptions options = {});

    // Returns the stored reflection, or nullopt when the transcript is too
    // short, generation fails or yields nothing, or the write is dropped.
    // Never throws for external failures; they are logged.
    std::optional<Reflection> synthesize(const std::string& user_id,
                                         const Transcript& transcript,
                                         TextGenerator& generator,
                                         Deadline deadline);

    const ReflectionOptions& options() const { return options_; }

private:
    MemoryStore& store_;
    ContextAssembler& assembler_;
    ReflectionOptions options_;
};

} // namespace engram
