#pragma once

#include "trovi/core/constants.hpp"
#include "trovi/migration/migration_record.hpp"
#include "trovi/migration/migration_store.hpp"
#include "trovi/storage/factory.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace trovi {

class MigrationMetrics;

struct EngineConfig {
    // Largest chunk held in memory between a source read and a destination write
    size_t max_chunk_bytes = constants::DEFAULT_MAX_CHUNK_BYTES;
};

/// Copies artifact version content between storage backends.
///
/// One dedicated worker thread drains an unbounded queue of migration ids, so
/// at most one migration runs at a time. Each job moves its record through
/// QUEUED -> IN_PROGRESS -> SUCCESS or ERROR; a job never stays IN_PROGRESS
/// after an exception.
///
/// stop() waits for the in-flight job. Jobs still queued stay QUEUED in the
/// store and are resubmitted by recover_migrations() at the next startup.
class MigrationEngine {
public:
    /// Deposition metadata for archive destinations
    using MetadataProvider = std::function<std::optional<DepositionMetadata>(const MigrationRecord&)>;

    /// Called with the finished record after every successful migration
    using SuccessCallback = std::function<void(const MigrationRecord&)>;

    MigrationEngine(MigrationStore& store,
                    const BackendFactory& factory,
                    const EngineConfig& config = {},
                    MigrationMetrics* metrics = nullptr);
    ~MigrationEngine();

    MigrationEngine(const MigrationEngine&) = delete;
    MigrationEngine& operator=(const MigrationEngine&) = delete;

    void set_metadata_provider(MetadataProvider provider);
    void set_success_callback(SuccessCallback callback);

    /// Start the worker thread
    void start();

    /// Stop the worker after its current job. Queued ids are dropped.
    void stop();

    bool running() const;

    /// Validates and records a new migration, then queues it.
    /// Throws UnknownBackend or InvalidUrn before anything is stored, and
    /// Conflict when the version already has a migration in progress.
    MigrationRecord submit(const std::string& artifact_uuid,
                           const std::string& version_slug,
                           const std::string& source_urn,
                           const std::string& backend);

    /// Queue an existing QUEUED record
    void enqueue(int64_t migration_id);

    /// Block until the queue is empty and no job is running
    void wait_idle();

    size_t queue_depth() const;

    /// Most recent record for the version, with live progress
    std::optional<MigrationRecord> status(const std::string& artifact_uuid,
                                          const std::string& version_slug);

    /// Run one migration on the calling thread. Errors other than the
    /// expected migration failures are rethrown after the record is marked
    /// ERROR.
    void run(int64_t migration_id);

private:
    void worker_loop();
    void transfer(const MigrationRecord& record);
    void fail(int64_t migration_id, const std::string& message);

    MigrationStore& store_;
    const BackendFactory& factory_;
    EngineConfig config_;
    MigrationMetrics* metrics_;

    MetadataProvider metadata_provider_;
    SuccessCallback success_callback_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<int64_t> queue_;
    bool busy_ = false;
    bool running_ = false;
    bool stopping_ = false;

    std::thread worker_;
};

}  // namespace trovi
