#pragma once
#include "../record.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace engram {

// Durable-store primitive behind MemoryStore.
//
// Backends hold raw records and apply only the visibility filter
// (`expires_at > now`); validation, defaults and ranking live in MemoryStore.
// Every method may throw StoreUnavailableError when the durable store cannot
// be reached. Implementations must be safe to share across threads.
class StoreBackend {
public:
    virtual ~StoreBackend() = default;

    virtual std::string backend_name() const = 0;

    virtual void put_intervention(const Intervention& record) = 0;
    virtual void put_reflection(const Reflection& record) = 0;

    // Non-expired interventions for one user whose outcome is in `outcomes`
    // (all outcomes when empty). Order is unspecified.
    virtual std::vector<Intervention> scan_interventions(
        const std::string& user_id, uint64_t now,
        const std::vector<Outcome>& outcomes) = 0;

    virtual uint32_t count_interventions(const std::string& user_id, uint64_t now) = 0;

    // Non-expired reflections, most recent first. Records written in the
    // same millisecond come back newest-write first.
    virtual std::vector<Reflection> recent_reflections(
        const std::string& user_id, uint64_t now, uint32_t limit) = 0;

    virtual uint32_t count_reflections(const std::string& user_id, uint64_t now) = 0;

    // Physically delete every record with expires_at <= now. Returns count removed.
    virtual uint32_t purge_expired(uint64_t now) = 0;

    // Physically delete every record of one user, expired or not. Returns
    // count removed.
    virtual uint32_t delete_user(const std::string& user_id) = 0;

    // Round-trip to the durable store. Throws StoreUnavailableError on failure.
    virtual void ping() = 0;
};

} // namespace engram
