#pragma once
#include "embedder.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace engram {

// How an intervention resolved. Closed set: anything else is rejected at
// the write boundary.
enum class Outcome {
    TaskStarted,
    TaskProgress,
    TaskCompleted,
    ReEngaged,
    Distracted,
    Abandoned,
    Unknown
};

constexpr uint64_t kMillisPerDay = 86400ULL * 1000ULL;

struct Intervention {
    std::string id;
    std::string user_id;
    std::string intervention_text;
    std::string context_text;
    std::string task_label;
    Outcome outcome = Outcome::Unknown;
    Embedding embedding;
    uint64_t created_at = 0; // epoch millis
    uint64_t ttl = 0;        // millis; 0 = use the configured default
};

struct Reflection {
    std::string id;
    std::string user_id;
    std::string insight_text;
    std::string session_summary;
    uint64_t created_at = 0; // epoch millis
    uint64_t ttl = 0;        // millis; 0 = use the configured default
};

// Query hit: the stored intervention plus its cosine similarity to the query.
struct ScoredIntervention {
    Intervention record;
    double similarity = 0.0;
};

struct SimilarSuccess {
    std::string intervention_text;
    std::string context_text;
    std::string task_label;
    Outcome outcome = Outcome::Unknown;
    double similarity = 0.0;
};

// Derived per-request view of a user's history. Never persisted.
struct PersonalizationBundle {
    std::vector<std::string> recent_reflections;  // most recent first
    uint32_t intervention_count = 0;
    std::vector<SimilarSuccess> similar_successes; // highest similarity first

    bool empty() const {
        return recent_reflections.empty() && intervention_count == 0 &&
               similar_successes.empty();
    }
};

// One conversation turn. Role is free-form ("user", "assistant", ...).
struct Turn {
    std::string role;
    std::string content;
};

using Transcript = std::vector<Turn>;

struct MemoryStats {
    std::string user_id;
    uint32_t interventions = 0;
    uint32_t reflections = 0;
};

// Outcome string conversions ("task_completed", "re_engaged", ...)
std::string outcome_to_string(Outcome outcome);

// Parse an outcome tag. Returns nullopt for anything outside the closed set.
std::optional<Outcome> outcome_from_string(const std::string& s);

// Same as outcome_from_string but throws ValidationError on unknown tags.
Outcome parse_outcome(const std::string& s);

// task_completed and re_engaged
bool is_successful(Outcome outcome);
const std::vector<Outcome>& successful_outcomes();

// Expiry instant and visibility. A record is invisible once now >= created_at + ttl.
// Saturates at UINT64_MAX, so an oversized ttl means "never expires".
inline uint64_t expires_at(uint64_t created_at, uint64_t ttl) {
    return ttl > UINT64_MAX - created_at ? UINT64_MAX : created_at + ttl;
}

template <typename Record>
bool is_expired(const Record& record, uint64_t now_millis) {
    return now_millis >= expires_at(record.created_at, record.ttl);
}

// Field validation. Each throws ValidationError naming the offending field.
void validate_user_id(const std::string& user_id);
void validate_embedding(const Embedding& embedding, uint32_t expected_dims);
// Every intervention field except the embedding.
void validate_intervention_fields(const Intervention& record);
void validate_intervention(const Intervention& record, uint32_t expected_dims);
void validate_reflection(const Reflection& record);

} // namespace engram
