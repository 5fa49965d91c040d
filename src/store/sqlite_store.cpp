#include "sqlite_store.hpp"
#include "../errors.hpp"
#include <sqlite3.h>
#include <cstring>
#include <filesystem>
#include <limits>

namespace engram {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static void prepare(sqlite3* db, const char* sql, StmtGuard& g) {
    if (sqlite3_prepare_v2(db, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw StoreUnavailableError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
    }
}

static void step_done(sqlite3* db, StmtGuard& g) {
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw StoreUnavailableError(std::string("sqlite write failed: ") + sqlite3_errmsg(db));
    }
}

static void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreUnavailableError("sqlite schema setup failed: " + msg);
    }
}

// SQLite integers are signed; clamp far-future expiry instead of wrapping
static sqlite3_int64 to_db_int(uint64_t v) {
    constexpr auto max = static_cast<uint64_t>(std::numeric_limits<sqlite3_int64>::max());
    return static_cast<sqlite3_int64>(v > max ? max : v);
}

static std::string column_text(sqlite3_stmt* stmt, int col) {
    if (auto* v = sqlite3_column_text(stmt, col)) return reinterpret_cast<const char*>(v);
    return {};
}

// Read an embedding BLOB, trusting the stored dimension over the byte count
static Embedding read_embedding_blob(sqlite3_stmt* stmt, int col, int dims_col) {
    const void* blob = sqlite3_column_blob(stmt, col);
    int bytes = sqlite3_column_bytes(stmt, col);
    if (!blob || bytes <= 0) return {};

    size_t count = static_cast<size_t>(bytes) / sizeof(float);
    auto dims = static_cast<size_t>(sqlite3_column_int64(stmt, dims_col));
    if (dims != count) return {};
    Embedding emb(count);
    std::memcpy(emb.data(), blob, count * sizeof(float));
    return emb;
}

SqliteStore::SqliteStore(const std::string& path) : path_(path) {
    if (path_ != ":memory:") {
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
        }
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StoreUnavailableError("SqliteStore: failed to open database: " + err);
    }

    sqlite3_busy_timeout(db_, 2000);

    // Performance pragmas
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA temp_store=MEMORY;", nullptr, nullptr, nullptr);

    try {
        init_schema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteStore::init_schema() {
    exec(db_,
        "CREATE TABLE IF NOT EXISTS interventions ("
        "  id                TEXT PRIMARY KEY,"
        "  user_id           TEXT NOT NULL,"
        "  intervention_text TEXT NOT NULL,"
        "  context_text      TEXT NOT NULL,"
        "  task_label        TEXT NOT NULL,"
        "  outcome           TEXT NOT NULL,"
        "  embedding         BLOB NOT NULL,"
        "  dims              INTEGER NOT NULL,"
        "  created_at        INTEGER NOT NULL,"
        "  ttl               INTEGER NOT NULL,"
        "  expires_at        INTEGER NOT NULL"
        ");");
    exec(db_,
        "CREATE INDEX IF NOT EXISTS interventions_user_expiry"
        " ON interventions(user_id, expires_at);");

    exec(db_,
        "CREATE TABLE IF NOT EXISTS reflections ("
        "  id              TEXT PRIMARY KEY,"
        "  user_id         TEXT NOT NULL,"
        "  insight_text    TEXT NOT NULL,"
        "  session_summary TEXT NOT NULL,"
        "  created_at      INTEGER NOT NULL,"
        "  ttl             INTEGER NOT NULL,"
        "  expires_at      INTEGER NOT NULL"
        ");");
    exec(db_,
        "CREATE INDEX IF NOT EXISTS reflections_user_expiry"
        " ON reflections(user_id, expires_at);");
}

void SqliteStore::put_intervention(const Intervention& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_,
        "INSERT INTO interventions (id, user_id, intervention_text, context_text,"
        " task_label, outcome, embedding, dims, created_at, ttl, expires_at)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);", g);

    std::string outcome = outcome_to_string(record.outcome);
    sqlite3_bind_text(g.stmt, 1, record.id.c_str(),                -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, record.user_id.c_str(),           -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, record.intervention_text.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 4, record.context_text.c_str(),      -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 5, record.task_label.c_str(),        -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 6, outcome.c_str(),                  -1, SQLITE_STATIC);
    sqlite3_bind_blob(g.stmt, 7, record.embedding.data(),
                      static_cast<int>(record.embedding.size() * sizeof(float)),
                      SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 8, static_cast<sqlite3_int64>(record.embedding.size()));
    sqlite3_bind_int64(g.stmt, 9, to_db_int(record.created_at));
    sqlite3_bind_int64(g.stmt, 10, to_db_int(record.ttl));
    sqlite3_bind_int64(g.stmt, 11, to_db_int(expires_at(record.created_at, record.ttl)));
    step_done(db_, g);
}

void SqliteStore::put_reflection(const Reflection& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_,
        "INSERT INTO reflections (id, user_id, insight_text, session_summary,"
        " created_at, ttl, expires_at) VALUES (?, ?, ?, ?, ?, ?, ?);", g);

    sqlite3_bind_text(g.stmt, 1, record.id.c_str(),              -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, record.user_id.c_str(),         -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, record.insight_text.c_str(),    -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 4, record.session_summary.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 5, to_db_int(record.created_at));
    sqlite3_bind_int64(g.stmt, 6, to_db_int(record.ttl));
    sqlite3_bind_int64(g.stmt, 7, to_db_int(expires_at(record.created_at, record.ttl)));
    step_done(db_, g);
}

std::vector<Intervention> SqliteStore::scan_interventions(
    const std::string& user_id, uint64_t now, const std::vector<Outcome>& outcomes) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql =
        "SELECT id, user_id, intervention_text, context_text, task_label, outcome,"
        " embedding, dims, created_at, ttl"
        " FROM interventions WHERE user_id = ? AND expires_at > ?";
    if (!outcomes.empty()) {
        sql += " AND outcome IN (";
        for (size_t i = 0; i < outcomes.size(); i++) {
            if (i > 0) sql += ',';
            sql += '?';
        }
        sql += ')';
    }
    sql += ';';

    StmtGuard g;
    prepare(db_, sql.c_str(), g);
    sqlite3_bind_text(g.stmt, 1, user_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 2, to_db_int(now));
    std::vector<std::string> tags;
    tags.reserve(outcomes.size());
    for (auto o : outcomes) tags.push_back(outcome_to_string(o));
    for (size_t i = 0; i < tags.size(); i++) {
        sqlite3_bind_text(g.stmt, static_cast<int>(i + 3), tags[i].c_str(), -1, SQLITE_STATIC);
    }

    std::vector<Intervention> results;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        Intervention r;
        r.id                = column_text(g.stmt, 0);
        r.user_id           = column_text(g.stmt, 1);
        r.intervention_text = column_text(g.stmt, 2);
        r.context_text      = column_text(g.stmt, 3);
        r.task_label        = column_text(g.stmt, 4);
        r.outcome           = outcome_from_string(column_text(g.stmt, 5)).value_or(Outcome::Unknown);
        r.embedding         = read_embedding_blob(g.stmt, 6, 7);
        r.created_at        = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 8));
        r.ttl               = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 9));
        results.push_back(std::move(r));
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        throw StoreUnavailableError(std::string("sqlite read failed: ") + sqlite3_errmsg(db_));
    }
    return results;
}

uint32_t SqliteStore::count_visible(const char* sql, const std::string& user_id, uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, sql, g);
    sqlite3_bind_text(g.stmt, 1, user_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 2, to_db_int(now));
    if (sqlite3_step(g.stmt) != SQLITE_ROW) {
        throw StoreUnavailableError(std::string("sqlite read failed: ") + sqlite3_errmsg(db_));
    }
    return static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
}

uint32_t SqliteStore::count_interventions(const std::string& user_id, uint64_t now) {
    return count_visible(
        "SELECT COUNT(*) FROM interventions WHERE user_id = ? AND expires_at > ?;",
        user_id, now);
}

uint32_t SqliteStore::count_reflections(const std::string& user_id, uint64_t now) {
    return count_visible(
        "SELECT COUNT(*) FROM reflections WHERE user_id = ? AND expires_at > ?;",
        user_id, now);
}

std::vector<Reflection> SqliteStore::recent_reflections(
    const std::string& user_id, uint64_t now, uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (limit == 0) return {};

    StmtGuard g;
    prepare(db_,
        "SELECT id, user_id, insight_text, session_summary, created_at, ttl"
        " FROM reflections WHERE user_id = ? AND expires_at > ?"
        " ORDER BY created_at DESC, rowid DESC LIMIT ?;", g);
    sqlite3_bind_text(g.stmt, 1, user_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 2, to_db_int(now));
    sqlite3_bind_int64(g.stmt, 3, static_cast<sqlite3_int64>(limit));

    std::vector<Reflection> results;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        Reflection r;
        r.id              = column_text(g.stmt, 0);
        r.user_id         = column_text(g.stmt, 1);
        r.insight_text    = column_text(g.stmt, 2);
        r.session_summary = column_text(g.stmt, 3);
        r.created_at      = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 4));
        r.ttl             = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 5));
        results.push_back(std::move(r));
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        throw StoreUnavailableError(std::string("sqlite read failed: ") + sqlite3_errmsg(db_));
    }
    return results;
}

uint32_t SqliteStore::purge_expired(uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t removed = 0;

    for (const char* sql : {"DELETE FROM interventions WHERE expires_at <= ?;",
                            "DELETE FROM reflections WHERE expires_at <= ?;"}) {
        StmtGuard g;
        prepare(db_, sql, g);
        sqlite3_bind_int64(g.stmt, 1, to_db_int(now));
        step_done(db_, g);
        removed += static_cast<uint32_t>(sqlite3_changes(db_));
    }
    return removed;
}

uint32_t SqliteStore::delete_user(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t removed = 0;

    for (const char* sql : {"DELETE FROM interventions WHERE user_id = ?;",
                            "DELETE FROM reflections WHERE user_id = ?;"}) {
        StmtGuard g;
        prepare(db_, sql, g);
        sqlite3_bind_text(g.stmt, 1, user_id.c_str(), -1, SQLITE_STATIC);
        step_done(db_, g);
        removed += static_cast<uint32_t>(sqlite3_changes(db_));
    }
    return removed;
}

void SqliteStore::ping() {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, "SELECT 1;", g);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) {
        throw StoreUnavailableError(std::string("sqlite ping failed: ") + sqlite3_errmsg(db_));
    }
}

} // namespace engram
