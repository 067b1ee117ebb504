#include "trovi/migration/migration_engine.hpp"
#include "trovi/service/metrics.hpp"
#include "trovi/storage/backend.hpp"
#include "trovi/core/errors.hpp"
#include "trovi/core/log.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace trovi {

namespace {

int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

MigrationEngine::MigrationEngine(MigrationStore& store,
                                 const BackendFactory& factory,
                                 const EngineConfig& config,
                                 MigrationMetrics* metrics)
    : store_(store)
    , factory_(factory)
    , config_(config)
    , metrics_(metrics) {
    if (config_.max_chunk_bytes == 0) {
        config_.max_chunk_bytes = constants::DEFAULT_MAX_CHUNK_BYTES;
    }
    if (metrics_) {
        metrics_->set_queue_depth_source([this] { return queue_depth(); });
    }
}

MigrationEngine::~MigrationEngine() {
    stop();
    if (metrics_) {
        metrics_->set_queue_depth_source(nullptr);
    }
}

void MigrationEngine::set_metadata_provider(MetadataProvider provider) {
    metadata_provider_ = std::move(provider);
}

void MigrationEngine::set_success_callback(SuccessCallback callback) {
    success_callback_ = std::move(callback);
}

void MigrationEngine::start() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (running_) return;
    running_ = true;
    stopping_ = false;
    worker_ = std::thread(&MigrationEngine::worker_loop, this);
    log_info("Migration worker started");
}

void MigrationEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) return;
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }

    size_t left;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
        left = queue_.size();
        queue_.clear();
    }
    idle_cv_.notify_all();
    if (left > 0) {
        log_info("Migration worker stopped with %zu queued migrations left for recovery", left);
    } else {
        log_info("Migration worker stopped");
    }
}

bool MigrationEngine::running() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return running_;
}

MigrationRecord MigrationEngine::submit(const std::string& artifact_uuid,
                                        const std::string& version_slug,
                                        const std::string& source_urn,
                                        const std::string& backend) {
    MigrationRecord record;
    try {
        if (!factory_.has_backend(backend)) {
            throw UnknownBackend("Unknown storage backend: " + backend);
        }
        ContentUrn::parse(source_urn);
        record = store_.create(artifact_uuid, version_slug, source_urn, backend);
    } catch (const TroviError&) {
        if (metrics_) metrics_->migrations_rejected().Increment();
        throw;
    }

    if (metrics_) metrics_->migrations_submitted().Increment();
    log_info("Queued migration %lld of %s/%s to %s",
             static_cast<long long>(record.id), artifact_uuid.c_str(),
             version_slug.c_str(), backend.c_str());
    enqueue(record.id);
    return record;
}

void MigrationEngine::enqueue(int64_t migration_id) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(migration_id);
    }
    queue_cv_.notify_one();
}

void MigrationEngine::wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return (queue_.empty() || !running_) && !busy_; });
}

size_t MigrationEngine::queue_depth() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

std::optional<MigrationRecord> MigrationEngine::status(const std::string& artifact_uuid,
                                                       const std::string& version_slug) {
    return store_.latest_for_version(artifact_uuid, version_slug);
}

void MigrationEngine::worker_loop() {
    while (true) {
        int64_t id;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) break;
            id = queue_.front();
            queue_.pop_front();
            busy_ = true;
        }

        try {
            run(id);
        } catch (const std::exception& e) {
            log_error("Migration %lld failed: %s", static_cast<long long>(id), e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
}

void MigrationEngine::fail(int64_t migration_id, const std::string& message) {
    MigrationUpdate update;
    update.status = MigrationStatus::Error;
    update.message = message;
    update.finished_at = now_epoch();
    store_.update(migration_id, update);
    if (metrics_) metrics_->migrations_error().Increment();
}

void MigrationEngine::run(int64_t migration_id) {
    auto record = store_.claim(migration_id, constants::MSG_SELECTED);
    if (!record) {
        auto current = store_.get(migration_id);
        if (!current) {
            log_error("Migration %lld does not exist", static_cast<long long>(migration_id));
        } else {
            log_warn("Skipping migration %lld: status is %s",
                     static_cast<long long>(migration_id), migration_status_name(current->status));
        }
        return;
    }

    if (metrics_) metrics_->migrations_in_progress().Increment();
    auto started = std::chrono::steady_clock::now();
    std::exception_ptr unexpected;

    try {
        transfer(*record);
    } catch (const EmptySource& e) {
        log_warn("Migration %lld: %s", static_cast<long long>(migration_id), e.what());
        fail(migration_id, constants::MSG_EMPTY_SOURCE);
    } catch (const SourceReadError& e) {
        log_error("Migration %lld: %s", static_cast<long long>(migration_id), e.what());
        fail(migration_id, constants::MSG_READ_ERROR);
    } catch (const DestinationWriteError& e) {
        log_error("Migration %lld: %s", static_cast<long long>(migration_id), e.what());
        fail(migration_id, constants::MSG_WRITE_ERROR);
    } catch (const std::exception& e) {
        log_error("Uncaught error migrating artifact version %s/%s: %s",
                  record->artifact_uuid.c_str(), record->version_slug.c_str(), e.what());
        unexpected = std::current_exception();
        auto current = store_.get(migration_id);
        if (current && !is_terminal(current->status)) {
            fail(migration_id, constants::MSG_UNKNOWN_ERROR);
        }
    }

    if (metrics_) {
        metrics_->migrations_in_progress().Decrement();
        metrics_->migration_duration().Observe(
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());
    }

    if (unexpected) {
        std::rethrow_exception(unexpected);
    }
}

void MigrationEngine::transfer(const MigrationRecord& record) {
    auto source_urn = ContentUrn::parse(record.source_urn);

    BackendRequest source_request;
    source_request.name = source_urn.backend;
    source_request.content_id = source_urn.content_id;
    source_request.mode = AccessMode::ReadOnly;

    BackendRequest dest_request;
    dest_request.name = record.backend;
    dest_request.mode = AccessMode::ReadWrite;
    if (metadata_provider_) {
        dest_request.metadata = metadata_provider_(record);
    }

    // The source is opened first so that unreadable content fails before
    // anything is created at the destination
    ScopedBackend source(factory_.create(source_request));
    uint64_t total = source->size();
    if (total < 1) {
        throw EmptySource("source " + record.source_urn + " is empty");
    }

    MigrationUpdate uploading;
    uploading.message = "Uploading to " + record.backend;
    uploading.started_at = now_epoch();
    store_.update(record.id, uploading);

    ScopedBackend dest(factory_.create(dest_request));

    uint64_t bytes_written = 0;
    double last_ratio = 0.0;
    while (source->readable()) {
        std::unique_ptr<ScopedTimer> timer;
        if (metrics_) timer = std::make_unique<ScopedTimer>(metrics_->chunk_duration());

        std::vector<uint8_t> chunk;
        try {
            chunk = source->read(config_.max_chunk_bytes);
        } catch (const std::exception& e) {
            throw SourceReadError(std::string("reading ") + record.source_urn + ": " + e.what());
        }
        if (chunk.empty()) {
            break;
        }

        size_t written;
        try {
            written = dest->write(chunk);
        } catch (const std::exception& e) {
            throw DestinationWriteError(std::string("writing to ") + record.backend + ": " + e.what());
        }

        bytes_written += written;
        if (metrics_) metrics_->transfer_bytes_total().Increment(static_cast<double>(written));

        // Progress never moves backwards, even if the source grew under us
        double ratio = std::min(1.0, static_cast<double>(bytes_written) / static_cast<double>(total));
        last_ratio = std::max(last_ratio, ratio);
        MigrationUpdate progress;
        progress.message_ratio = last_ratio;
        store_.update(record.id, progress);
    }

    MigrationUpdate finalizing;
    finalizing.message = constants::MSG_FINALIZING;
    store_.update(record.id, finalizing);

    try {
        dest.close();
    } catch (const std::exception& e) {
        throw DestinationWriteError(std::string("finalizing ") + record.backend + ": " + e.what());
    }

    if (source->seekable()) {
        source->seek(0, SeekWhence::Set);
    }
    source.close();

    auto destination = dest->to_urn();
    MigrationUpdate done;
    done.status = MigrationStatus::Success;
    done.message = "Uploaded to " + destination;
    done.message_ratio = 1.0;
    done.destination_urn = destination;
    done.finished_at = now_epoch();
    auto finished = store_.update(record.id, done);

    if (metrics_) metrics_->migrations_success().Increment();
    log_info("Migration %lld of %s/%s finished: %s (%llu bytes)",
             static_cast<long long>(record.id), record.artifact_uuid.c_str(),
             record.version_slug.c_str(), destination.c_str(),
             static_cast<unsigned long long>(bytes_written));

    if (success_callback_) {
        success_callback_(finished);
    }
}

}  // namespace trovi
