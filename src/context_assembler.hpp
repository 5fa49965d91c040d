#pragma once
#include "memory_store.hpp"
#include "embedder.hpp"
#include "clock.hpp"
#include <string>

namespace engram {

struct ContextConfig; // forward declare

struct ContextOptions {
    uint32_t max_reflections = 3;
    uint32_t max_similar = 3;
    double similarity_threshold = 0.7;

    static ContextOptions from_config(const ContextConfig& config);
};

// Builds the PersonalizationBundle a session starts from: recent insights,
// the live intervention count and, when a message is given, the past
// successful interventions most similar to it.
class ContextAssembler {
public:
    // `embedder` may be null; similarity lookup is then skipped.
    ContextAssembler(MemoryStore& store, Embedder* embedder, ContextOptions options = {});

    // Recent reflections + intervention count.
    // Throws StoreUnavailableError when the store cannot be read.
    PersonalizationBundle assemble(const std::string& user_id);

    // Adds similar past successes for `current_message`. Embedding failures
    // leave similar_successes empty and are logged, never thrown.
    PersonalizationBundle assemble(const std::string& user_id,
                                   const std::string& current_message,
                                   Deadline deadline);

    const ContextOptions& options() const { return options_; }

private:
    std::vector<SimilarSuccess> similar_successes(const std::string& user_id,
                                                  const std::string& message,
                                                  Deadline deadline);

    MemoryStore& store_;
    Embedder* embedder_;
    ContextOptions options_;
};

// Plain-text rendering of a bundle for injection into an agent prompt.
std::string render_bundle(const PersonalizationBundle& bundle);

} // namespace engram
