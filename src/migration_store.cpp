#include "trovi/migration/migration_store.hpp"
#include "trovi/core/errors.hpp"
#include "trovi/core/log.hpp"

#include <sqlite3.h>

#include <chrono>
#include <stdexcept>
#include <thread>

namespace trovi {

namespace {

constexpr const char* MIGRATION_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS migrations (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    artifact_uuid TEXT NOT NULL,
    version_slug TEXT NOT NULL,
    source_urn TEXT NOT NULL,
    backend TEXT NOT NULL,
    destination_urn TEXT,
    status TEXT NOT NULL DEFAULT 'QUEUED',
    message TEXT NOT NULL DEFAULT '',
    message_ratio REAL NOT NULL DEFAULT 0.0,
    created_at INTEGER NOT NULL,
    started_at INTEGER,
    finished_at INTEGER
);

CREATE INDEX IF NOT EXISTS idx_version
    ON migrations(artifact_uuid, version_slug, created_at);

CREATE INDEX IF NOT EXISTS idx_status
    ON migrations(status, created_at);
)";

constexpr const char* RECORD_COLUMNS =
    "id, artifact_uuid, version_slug, source_urn, backend, destination_urn, "
    "status, message, message_ratio, created_at, started_at, finished_at";

int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

void require_exec(sqlite3* db, const char* sql) {
    if (!sql_exec(db, sql)) {
        throw std::runtime_error(std::string("SQL failed: ") + sql);
    }
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return column_text(stmt, col);
}

std::optional<int64_t> column_optional_int64(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int64(stmt, col);
}

// Reads a row laid out as RECORD_COLUMNS
MigrationRecord read_record(sqlite3_stmt* stmt) {
    MigrationRecord record;
    record.id = sqlite3_column_int64(stmt, 0);
    record.artifact_uuid = column_text(stmt, 1);
    record.version_slug = column_text(stmt, 2);
    record.source_urn = column_text(stmt, 3);
    record.backend = column_text(stmt, 4);
    record.destination_urn = column_optional_text(stmt, 5);
    record.status = parse_migration_status(column_text(stmt, 6)).value_or(MigrationStatus::Error);
    record.message = column_text(stmt, 7);
    record.message_ratio = sqlite3_column_double(stmt, 8);
    record.created_at = sqlite3_column_int64(stmt, 9);
    record.started_at = column_optional_int64(stmt, 10);
    record.finished_at = column_optional_int64(stmt, 11);
    return record;
}

void bind_optional_text(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void bind_optional_int64(sqlite3_stmt* stmt, int index, const std::optional<int64_t>& value) {
    if (value) {
        sqlite3_bind_int64(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

// Rolls back unless committed
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        require_exec(db_, "BEGIN IMMEDIATE");
    }

    ~Transaction() {
        if (!committed_) {
            sql_exec(db_, "ROLLBACK");
        }
    }

    void commit() {
        require_exec(db_, "COMMIT");
        committed_ = true;
    }

private:
    sqlite3* db_;
    bool committed_ = false;
};

}  // namespace

MigrationStore::MigrationStore(const std::string& db_path) {
    int rc = sqlite3_open_v2(db_path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open migration database " + db_path + ": " + err);
    }

    // WAL mode for concurrent readers (in-memory databases stay in memory mode)
    sql_exec(db_, "PRAGMA journal_mode=WAL");
    sql_exec(db_, "PRAGMA synchronous=NORMAL");
    sql_exec(db_, "PRAGMA busy_timeout=5000");
    require_exec(db_, MIGRATION_SCHEMA);

    prepare_statements();
}

MigrationStore::~MigrationStore() {
    for (auto* stmt : {stmt_insert_, stmt_get_, stmt_update_, stmt_claim_, stmt_in_progress_for_version_,
                       stmt_latest_for_version_, stmt_list_for_version_, stmt_list_by_status_}) {
        if (stmt) sqlite3_finalize(stmt);
    }
    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
    }
}

void MigrationStore::prepare_statements() {
    const std::string columns = RECORD_COLUMNS;
    auto prepare = [this](const std::string& sql, sqlite3_stmt** stmt) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error("Cannot prepare statement: " + std::string(sqlite3_errmsg(db_)));
        }
    };

    prepare("INSERT INTO migrations (artifact_uuid, version_slug, source_urn, backend, "
            "status, message, message_ratio, created_at) "
            "VALUES (?1, ?2, ?3, ?4, 'QUEUED', '', 0.0, ?5)",
            &stmt_insert_);

    prepare("SELECT " + columns + " FROM migrations WHERE id = ?1", &stmt_get_);

    prepare("UPDATE migrations SET status = ?2, message = ?3, message_ratio = ?4, "
            "destination_urn = ?5, started_at = ?6, finished_at = ?7 WHERE id = ?1",
            &stmt_update_);

    prepare("UPDATE migrations SET status = 'IN_PROGRESS', message = ?2 "
            "WHERE id = ?1 AND status = 'QUEUED'",
            &stmt_claim_);

    prepare("SELECT COUNT(*) FROM migrations "
            "WHERE artifact_uuid = ?1 AND version_slug = ?2 AND status = 'IN_PROGRESS'",
            &stmt_in_progress_for_version_);

    prepare("SELECT " + columns + " FROM migrations "
            "WHERE artifact_uuid = ?1 AND version_slug = ?2 "
            "ORDER BY created_at DESC, id DESC LIMIT 1",
            &stmt_latest_for_version_);

    prepare("SELECT " + columns + " FROM migrations "
            "WHERE artifact_uuid = ?1 AND version_slug = ?2 ORDER BY created_at ASC, id ASC",
            &stmt_list_for_version_);

    prepare("SELECT " + columns + " FROM migrations WHERE status = ?1 "
            "ORDER BY created_at ASC, id ASC",
            &stmt_list_by_status_);
}

MigrationRecord MigrationStore::create(const std::string& artifact_uuid,
                                       const std::string& version_slug,
                                       const std::string& source_urn,
                                       const std::string& backend) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_);

    sqlite3_reset(stmt_in_progress_for_version_);
    sqlite3_bind_text(stmt_in_progress_for_version_, 1, artifact_uuid.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_in_progress_for_version_, 2, version_slug.c_str(), -1, SQLITE_TRANSIENT);
    int64_t in_progress = 0;
    if (sql_step_retry(stmt_in_progress_for_version_) == SQLITE_ROW) {
        in_progress = sqlite3_column_int64(stmt_in_progress_for_version_, 0);
    }
    sqlite3_reset(stmt_in_progress_for_version_);
    if (in_progress > 0) {
        throw Conflict("Version " + artifact_uuid + "/" + version_slug +
                       " is currently being migrated");
    }

    sqlite3_reset(stmt_insert_);
    sqlite3_bind_text(stmt_insert_, 1, artifact_uuid.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_, 2, version_slug.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_, 3, source_urn.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_, 4, backend.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_insert_, 5, now_epoch());
    int rc = sql_step_retry(stmt_insert_);
    sqlite3_reset(stmt_insert_);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Cannot insert migration: " + std::string(sqlite3_errmsg(db_)));
    }
    int64_t id = sqlite3_last_insert_rowid(db_);
    txn.commit();

    auto record = get_locked(id);
    if (!record) {
        throw std::runtime_error("Migration " + std::to_string(id) + " vanished after insert");
    }
    return *record;
}

MigrationRecord MigrationStore::update(int64_t id, const MigrationUpdate& update) {
    MigrationRecord stored;
    UpdateListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Transaction txn(db_);

        auto current = get_locked(id);
        if (!current) {
            throw std::out_of_range("No migration with id " + std::to_string(id));
        }
        if (is_terminal(current->status)) {
            throw std::logic_error("Migration " + std::to_string(id) + " is already " +
                                   migration_status_name(current->status));
        }
        // Enum order is the state machine order
        if (update.status && *update.status < current->status) {
            throw std::logic_error("Migration " + std::to_string(id) + " cannot move from " +
                                   migration_status_name(current->status) + " back to " +
                                   migration_status_name(*update.status));
        }

        MigrationRecord next = *current;
        if (update.status) next.status = *update.status;
        if (update.message) next.message = *update.message;
        if (update.message_ratio) next.message_ratio = *update.message_ratio;
        if (update.destination_urn) next.destination_urn = *update.destination_urn;
        if (update.started_at) next.started_at = *update.started_at;
        if (update.finished_at) next.finished_at = *update.finished_at;

        if ((next.status == MigrationStatus::Success) != next.destination_urn.has_value()) {
            throw std::logic_error("Migration " + std::to_string(id) +
                                   ": destination is recorded exactly when it succeeds");
        }

        sqlite3_reset(stmt_update_);
        sqlite3_bind_int64(stmt_update_, 1, id);
        sqlite3_bind_text(stmt_update_, 2, migration_status_name(next.status), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt_update_, 3, next.message.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(stmt_update_, 4, next.message_ratio);
        bind_optional_text(stmt_update_, 5, next.destination_urn);
        bind_optional_int64(stmt_update_, 6, next.started_at);
        bind_optional_int64(stmt_update_, 7, next.finished_at);
        int rc = sql_step_retry(stmt_update_);
        sqlite3_reset(stmt_update_);
        if (rc != SQLITE_DONE) {
            throw std::runtime_error("Cannot update migration " + std::to_string(id) + ": " +
                                     sqlite3_errmsg(db_));
        }
        txn.commit();

        stored = next;
        listener = listener_;
    }

    if (listener) {
        listener(stored);
    }
    return stored;
}

std::optional<MigrationRecord> MigrationStore::claim(int64_t id, const std::string& message) {
    MigrationRecord stored;
    UpdateListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Transaction txn(db_);

        sqlite3_reset(stmt_claim_);
        sqlite3_bind_int64(stmt_claim_, 1, id);
        sqlite3_bind_text(stmt_claim_, 2, message.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sql_step_retry(stmt_claim_);
        sqlite3_reset(stmt_claim_);
        if (rc != SQLITE_DONE) {
            throw std::runtime_error("Cannot claim migration " + std::to_string(id) + ": " +
                                     sqlite3_errmsg(db_));
        }
        if (sqlite3_changes(db_) == 0) {
            return std::nullopt;
        }

        auto record = get_locked(id);
        txn.commit();
        if (!record) {
            throw std::runtime_error("Migration " + std::to_string(id) + " vanished after claim");
        }
        stored = *record;
        listener = listener_;
    }

    if (listener) {
        listener(stored);
    }
    return stored;
}

std::optional<MigrationRecord> MigrationStore::get(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return get_locked(id);
}

std::optional<MigrationRecord> MigrationStore::get_locked(int64_t id) {
    sqlite3_reset(stmt_get_);
    sqlite3_bind_int64(stmt_get_, 1, id);
    auto records = collect(stmt_get_);
    if (records.empty()) return std::nullopt;
    return records.front();
}

std::optional<MigrationRecord> MigrationStore::latest_for_version(const std::string& artifact_uuid,
                                                                  const std::string& version_slug) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_reset(stmt_latest_for_version_);
    sqlite3_bind_text(stmt_latest_for_version_, 1, artifact_uuid.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_latest_for_version_, 2, version_slug.c_str(), -1, SQLITE_TRANSIENT);
    auto records = collect(stmt_latest_for_version_);
    if (records.empty()) return std::nullopt;
    return records.front();
}

std::vector<MigrationRecord> MigrationStore::list_for_version(const std::string& artifact_uuid,
                                                              const std::string& version_slug) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_reset(stmt_list_for_version_);
    sqlite3_bind_text(stmt_list_for_version_, 1, artifact_uuid.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_list_for_version_, 2, version_slug.c_str(), -1, SQLITE_TRANSIENT);
    return collect(stmt_list_for_version_);
}

std::vector<MigrationRecord> MigrationStore::list_by_status(MigrationStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_reset(stmt_list_by_status_);
    sqlite3_bind_text(stmt_list_by_status_, 1, migration_status_name(status), -1, SQLITE_STATIC);
    return collect(stmt_list_by_status_);
}

std::vector<MigrationRecord> MigrationStore::collect(sqlite3_stmt* stmt) {
    std::vector<MigrationRecord> records;
    int rc;
    while ((rc = sql_step_retry(stmt)) == SQLITE_ROW) {
        records.push_back(read_record(stmt));
    }
    sqlite3_reset(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Cannot read migrations: " + std::string(sqlite3_errmsg(db_)));
    }
    return records;
}

size_t MigrationStore::mark_interrupted(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_,
            "UPDATE migrations SET status = 'ERROR', message = ?1, finished_at = ?2 "
            "WHERE status = 'IN_PROGRESS'",
            -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Cannot prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, message.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, now_epoch());
    int rc = sql_step_retry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Cannot reap migrations: " + std::string(sqlite3_errmsg(db_)));
    }
    return static_cast<size_t>(sqlite3_changes(db_));
}

void MigrationStore::set_update_listener(UpdateListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

}  // namespace trovi
