#pragma once
#include "record.hpp"
#include <string>
#include <cstdint>

namespace engram {

// Tag-based event dispatch, no RTTI.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* InterventionRecorded = "InterventionRecorded";
    constexpr const char* ContextAssembled     = "ContextAssembled";
    constexpr const char* ReflectionStored     = "ReflectionStored";
    constexpr const char* MemoryDegraded       = "MemoryDegraded";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct InterventionRecordedEvent : Event {
    static constexpr const char* TAG = event_tags::InterventionRecorded;
    std::string user_id;
    std::string record_id;
    Outcome outcome = Outcome::Unknown;
    bool background = false; // written by record_intervention_async

    InterventionRecordedEvent() { type_tag = TAG; }
};

struct ContextAssembledEvent : Event {
    static constexpr const char* TAG = event_tags::ContextAssembled;
    std::string user_id;
    size_t reflection_count = 0;
    uint32_t intervention_count = 0;
    size_t similar_count = 0;
    uint64_t elapsed_ms = 0;

    ContextAssembledEvent() { type_tag = TAG; }
};

struct ReflectionStoredEvent : Event {
    static constexpr const char* TAG = event_tags::ReflectionStored;
    std::string user_id;
    std::string record_id;
    std::string insight_text;

    ReflectionStoredEvent() { type_tag = TAG; }
};

// An engine operation fell back to a degraded result.
struct MemoryDegradedEvent : Event {
    static constexpr const char* TAG = event_tags::MemoryDegraded;
    std::string user_id;
    std::string operation; // "get_context", "record_intervention", ...
    std::string reason;

    MemoryDegradedEvent() { type_tag = TAG; }
};

} // namespace engram
