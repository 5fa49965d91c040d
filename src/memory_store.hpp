#pragma once
#include "record.hpp"
#include "retention.hpp"
#include "store/backend.hpp"
#include "clock.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace engram {

struct StoreOptions {
    uint32_t dimensions = 768;          // deployment embedding dimension D
    RetentionPolicy retention;
    uint32_t summary_max_chars = 500;   // session_summary cap, in code points
};

// Per-user append-only record store with exact cosine-similarity search.
//
// Validates every write, fills in id/created_at/ttl defaults, and ranks query
// results. Durability is delegated to a StoreBackend; expired records are
// filtered on every read, whether or not a sweep has run. No operation reads
// or ranks across users.
class MemoryStore {
public:
    MemoryStore(std::shared_ptr<StoreBackend> backend, StoreOptions options,
                const Clock& clock = system_clock());

    // Write an intervention. Throws ValidationError (nothing written) on an
    // invalid field, StoreUnavailableError when the backend is unreachable.
    // Returns the record id.
    std::string put(Intervention record);

    // Write a reflection. session_summary is truncated to the cap.
    std::string put(Reflection record);

    // Top-k non-expired interventions for `user_id` by cosine similarity to
    // `embedding`, restricted to `outcome_filter` when given. Ties are broken
    // by created_at (newest first), then id.
    std::vector<ScoredIntervention> query(
        const std::string& user_id, const Embedding& embedding, uint32_t k,
        const std::optional<std::vector<Outcome>>& outcome_filter = std::nullopt);

    // Non-expired intervention count.
    uint32_t count(const std::string& user_id);

    // Non-expired reflections, most recent first.
    std::vector<Reflection> recent_reflections(const std::string& user_id, uint32_t limit);

    // Non-expired interventions, newest first.
    std::vector<Intervention> interventions(const std::string& user_id);

    MemoryStats stats(const std::string& user_id);

    // Physically purge expired records. Returns count removed.
    uint32_t sweep();

    // Erase every record of one user, live or expired. Returns count removed.
    uint32_t clear(const std::string& user_id);

    uint32_t dimensions() const { return options_.dimensions; }
    const StoreOptions& options() const { return options_; }
    const Clock& clock() const { return clock_; }
    StoreBackend& backend() { return *backend_; }

private:
    std::shared_ptr<StoreBackend> backend_;
    StoreOptions options_;
    const Clock& clock_;
};

} // namespace engram
