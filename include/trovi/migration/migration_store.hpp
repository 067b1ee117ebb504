#pragma once

#include "trovi/migration/migration_record.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward declarations
struct sqlite3;
struct sqlite3_stmt;

namespace trovi {

/// SQLite table of MigrationRecords.
///
/// Every write is its own short transaction, visible to other connections as
/// soon as it commits. Records are never deleted.
class MigrationStore {
public:
    /// Opens (creating if needed) the database at db_path.
    /// ":memory:" gives a private in-memory database.
    /// Throws std::runtime_error if the database cannot be opened.
    explicit MigrationStore(const std::string& db_path);
    ~MigrationStore();

    MigrationStore(const MigrationStore&) = delete;
    MigrationStore& operator=(const MigrationStore&) = delete;

    /// Inserts a QUEUED record. Throws Conflict, without inserting, when the
    /// version already has an IN_PROGRESS record.
    MigrationRecord create(const std::string& artifact_uuid,
                           const std::string& version_slug,
                           const std::string& source_urn,
                           const std::string& backend);

    /// Applies the set fields of update and returns the stored record.
    /// Throws std::logic_error when the record is already terminal, when the
    /// status would move backwards, or when the update would break
    /// "destination_urn iff SUCCESS"; std::out_of_range for unknown ids.
    MigrationRecord update(int64_t id, const MigrationUpdate& update);

    /// Moves a QUEUED record to IN_PROGRESS with message, in one conditional
    /// UPDATE. Returns std::nullopt when the record is missing or no longer
    /// QUEUED, so two workers sharing the database never both run it.
    std::optional<MigrationRecord> claim(int64_t id, const std::string& message);

    std::optional<MigrationRecord> get(int64_t id);
    std::optional<MigrationRecord> latest_for_version(const std::string& artifact_uuid,
                                                      const std::string& version_slug);
    std::vector<MigrationRecord> list_for_version(const std::string& artifact_uuid,
                                                  const std::string& version_slug);

    /// Oldest first
    std::vector<MigrationRecord> list_by_status(MigrationStatus status);

    /// Moves every IN_PROGRESS record to ERROR with message. Returns the count.
    size_t mark_interrupted(const std::string& message);

    /// Called with the stored record after every successful update()
    using UpdateListener = std::function<void(const MigrationRecord&)>;
    void set_update_listener(UpdateListener listener);

private:
    void prepare_statements();
    std::optional<MigrationRecord> get_locked(int64_t id);
    std::vector<MigrationRecord> collect(sqlite3_stmt* stmt);

    std::mutex mutex_;
    sqlite3* db_ = nullptr;

    sqlite3_stmt* stmt_insert_ = nullptr;
    sqlite3_stmt* stmt_get_ = nullptr;
    sqlite3_stmt* stmt_update_ = nullptr;
    sqlite3_stmt* stmt_claim_ = nullptr;
    sqlite3_stmt* stmt_in_progress_for_version_ = nullptr;
    sqlite3_stmt* stmt_latest_for_version_ = nullptr;
    sqlite3_stmt* stmt_list_for_version_ = nullptr;
    sqlite3_stmt* stmt_list_by_status_ = nullptr;

    UpdateListener listener_;
};

}  // namespace trovi
