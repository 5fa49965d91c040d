#pragma once
#include "backend.hpp"
#include <mutex>
#include <unordered_map>

namespace engram {

// In-process backend: per-user record lists behind a mutex.
// Nothing survives the process.
class InMemoryStore : public StoreBackend {
public:
    std::string backend_name() const override { return "memory"; }

    void put_intervention(const Intervention& record) override;
    void put_reflection(const Reflection& record) override;

    std::vector<Intervention> scan_interventions(
        const std::string& user_id, uint64_t now,
        const std::vector<Outcome>& outcomes) override;

    uint32_t count_interventions(const std::string& user_id, uint64_t now) override;

    std::vector<Reflection> recent_reflections(
        const std::string& user_id, uint64_t now, uint32_t limit) override;

    uint32_t count_reflections(const std::string& user_id, uint64_t now) override;

    uint32_t purge_expired(uint64_t now) override;
    uint32_t delete_user(const std::string& user_id) override;

    void ping() override {}

private:
    struct UserRecords {
        std::vector<Intervention> interventions; // insertion order
        std::vector<Reflection> reflections;     // insertion order
    };

    std::unordered_map<std::string, UserRecords> users_;
    mutable std::mutex mutex_;
};

} // namespace engram
