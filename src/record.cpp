#include "record.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cmath>

namespace engram {

std::string outcome_to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::TaskStarted:   return "task_started";
        case Outcome::TaskProgress:  return "task_progress";
        case Outcome::TaskCompleted: return "task_completed";
        case Outcome::ReEngaged:     return "re_engaged";
        case Outcome::Distracted:    return "distracted";
        case Outcome::Abandoned:     return "abandoned";
        case Outcome::Unknown:       return "unknown";
    }
    return "unknown";
}

std::optional<Outcome> outcome_from_string(const std::string& s) {
    if (s == "task_started")   return Outcome::TaskStarted;
    if (s == "task_progress")  return Outcome::TaskProgress;
    if (s == "task_completed") return Outcome::TaskCompleted;
    if (s == "re_engaged")     return Outcome::ReEngaged;
    if (s == "distracted")     return Outcome::Distracted;
    if (s == "abandoned")      return Outcome::Abandoned;
    if (s == "unknown")        return Outcome::Unknown;
    return std::nullopt;
}

Outcome parse_outcome(const std::string& s) {
    auto outcome = outcome_from_string(s);
    if (!outcome) {
        throw ValidationError("unknown outcome tag: '" + s + "'", "outcome");
    }
    return *outcome;
}

bool is_successful(Outcome outcome) {
    return outcome == Outcome::TaskCompleted || outcome == Outcome::ReEngaged;
}

const std::vector<Outcome>& successful_outcomes() {
    static const std::vector<Outcome> outcomes = {
        Outcome::TaskCompleted, Outcome::ReEngaged
    };
    return outcomes;
}

void validate_user_id(const std::string& user_id) {
    if (trim(user_id).empty()) {
        throw ValidationError("user_id cannot be empty", "user_id");
    }
    if (user_id.size() > 100) {
        throw ValidationError("user_id too long: " + std::to_string(user_id.size()) +
                              " chars (max 100)", "user_id");
    }
    // These characters would break key prefixes in key/value backends
    static const std::string invalid = "*?[]: \n\r\t";
    auto pos = user_id.find_first_of(invalid);
    if (pos != std::string::npos) {
        throw ValidationError("user_id contains invalid character at position " +
                              std::to_string(pos), "user_id");
    }
}

void validate_embedding(const Embedding& embedding, uint32_t expected_dims) {
    if (embedding.empty()) {
        throw ValidationError("embedding cannot be empty", "embedding");
    }
    if (embedding.size() != expected_dims) {
        throw ValidationError("embedding dimension mismatch: expected " +
                              std::to_string(expected_dims) + ", got " +
                              std::to_string(embedding.size()), "embedding");
    }
    for (size_t i = 0; i < embedding.size(); ++i) {
        if (!std::isfinite(embedding[i])) {
            throw ValidationError("embedding value at index " + std::to_string(i) +
                                  " is NaN or Inf", "embedding");
        }
    }
}

static void validate_length(const std::string& value, size_t max_chars,
                            const char* field) {
    size_t len = utf8_length(value);
    if (len > max_chars) {
        throw ValidationError(std::string(field) + " too long: " + std::to_string(len) +
                              " chars (max " + std::to_string(max_chars) + ")", field);
    }
}

void validate_intervention_fields(const Intervention& record) {
    validate_user_id(record.user_id);
    if (trim(record.intervention_text).empty()) {
        throw ValidationError("intervention_text cannot be empty", "intervention_text");
    }
    validate_length(record.intervention_text, 1000, "intervention_text");
    validate_length(record.context_text, 2000, "context_text");
    validate_length(record.task_label, 200, "task_label");
    // Guards against values cast into the enum from outside the closed set
    if (outcome_to_string(record.outcome) == "unknown" && record.outcome != Outcome::Unknown) {
        throw ValidationError("outcome outside the known set", "outcome");
    }
}

void validate_intervention(const Intervention& record, uint32_t expected_dims) {
    validate_intervention_fields(record);
    validate_embedding(record.embedding, expected_dims);
}

void validate_reflection(const Reflection& record) {
    validate_user_id(record.user_id);
    if (trim(record.insight_text).empty()) {
        throw ValidationError("insight_text cannot be empty", "insight_text");
    }
}

} // namespace engram
