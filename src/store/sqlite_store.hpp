#pragma once
#include "backend.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace engram {

// SQLite-backed durable store. One file per deployment; interventions and
// reflections live in separate tables indexed by (user_id, expires_at).
// Embeddings are stored as raw float32 BLOBs next to their dimension.
class SqliteStore : public StoreBackend {
public:
    // Opens (or creates) the database at `path`. ":memory:" is accepted.
    // Throws StoreUnavailableError when the file cannot be opened.
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

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

    void ping() override;

    const std::string& path() const { return path_; }

private:
    void init_schema();
    uint32_t count_visible(const char* sql, const std::string& user_id, uint64_t now);

    std::string path_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

} // namespace engram
