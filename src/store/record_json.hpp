#pragma once
#include "../record.hpp"
#include <nlohmann/json.hpp>

namespace engram {

// JSON views of stored records, used by the export command.

inline nlohmann::json intervention_to_json(const Intervention& record) {
    return {
        {"id", record.id},
        {"user_id", record.user_id},
        {"intervention_text", record.intervention_text},
        {"context_text", record.context_text},
        {"task_label", record.task_label},
        {"outcome", outcome_to_string(record.outcome)},
        {"dimensions", record.embedding.size()},
        {"created_at", record.created_at},
        {"ttl", record.ttl},
        {"expires_at", expires_at(record.created_at, record.ttl)}
    };
}

inline nlohmann::json reflection_to_json(const Reflection& record) {
    return {
        {"id", record.id},
        {"user_id", record.user_id},
        {"insight_text", record.insight_text},
        {"session_summary", record.session_summary},
        {"created_at", record.created_at},
        {"ttl", record.ttl},
        {"expires_at", expires_at(record.created_at, record.ttl)}
    };
}

inline nlohmann::json stats_to_json(const MemoryStats& stats) {
    return {
        {"user_id", stats.user_id},
        {"interventions", stats.interventions},
        {"reflections", stats.reflections}
    };
}

} // namespace engram
