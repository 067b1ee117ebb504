// Test suite for trovi migrations.
//
// Tests:
//   1. MigrationStore: creation, transition rules, conflicts
//   2. MigrationEngine: successful transfer, progress, failure messages
//   3. Destinations over HTTP: object store and archive
//   4. Startup recovery and the worker lock
//   5. Metrics export

#include "test_support.hpp"

#include "trovi/core/constants.hpp"
#include "trovi/migration/migration_engine.hpp"
#include "trovi/migration/migration_store.hpp"
#include "trovi/migration/recovery.hpp"
#include "trovi/migration/worker_lock.hpp"
#include "trovi/service/metrics.hpp"

#include <atomic>
#include <thread>

using namespace trovi;

static const std::string ARTIFACT = "6f0a1f3e-4b3c-4a8e-9d57-0c1b2a3d4e5f";

static std::string memory_urn(const std::string& id) {
    return std::string(constants::CONTENT_URN_PREFIX) + "memory:" + id;
}

// Everything a migration test needs, torn down with the scope
struct MigrationFixture {
    fs::path tmpdir = make_temp_dir("trovi-migration");
    MigrationStore store{(tmpdir / "migrations.db").string()};
    std::shared_ptr<FakeSwift> swift = std::make_shared<FakeSwift>();
    std::shared_ptr<FakeZenodo> zenodo = std::make_shared<FakeZenodo>();
    MemoryStore memory;
    std::unique_ptr<BackendFactory> factory;

    MigrationFixture() {
        StorageSettings settings;
        settings.object_store = fake_swift_config();
        factory = std::make_unique<BackendFactory>(settings, swift);
        // Archive destinations talk to their own fake
        auto archive = fake_zenodo_config();
        auto zenodo_transport = zenodo;
        factory->register_backend(constants::BACKEND_ARCHIVE,
                                  [archive, zenodo_transport](const BackendRequest& request) {
            return create_archive_backend(archive, zenodo_transport, request.content_id,
                                          request.content_type, request.mode,
                                          request.metadata.value_or(DepositionMetadata{}));
        });
        register_memory_backend(*factory, memory);
    }

    ~MigrationFixture() {
        std::error_code ec;
        fs::remove_all(tmpdir, ec);
    }

    EngineConfig small_chunks() const {
        EngineConfig config;
        config.max_chunk_bytes = 16;
        return config;
    }
};

// ---------------------------------------------------------------------------
// 1. MigrationStore
// ---------------------------------------------------------------------------

static void test_migration_store() {
    std::cout << "\n=== MigrationStore ===" << std::endl;

    {
        TEST(status_names);
        ASSERT_EQ(std::string(migration_status_name(MigrationStatus::InProgress)), "IN_PROGRESS", "name");
        ASSERT_TRUE(parse_migration_status("SUCCESS") == MigrationStatus::Success, "parse");
        ASSERT_TRUE(!parse_migration_status("DONE").has_value(), "unknown name");
        ASSERT_TRUE(is_terminal(MigrationStatus::Error), "error is terminal");
        ASSERT_TRUE(!is_terminal(MigrationStatus::Queued), "queued is not");
        PASS();
    }
    {
        TEST(create_starts_queued);
        MigrationFixture f;
        auto record = f.store.create(ARTIFACT, "v1", memory_urn("src"), "objectstore");
        ASSERT_TRUE(record.id > 0, "id assigned");
        ASSERT_TRUE(record.status == MigrationStatus::Queued, "queued");
        ASSERT_TRUE(record.created_at > 0, "created_at");
        ASSERT_TRUE(!record.destination_urn.has_value(), "no destination");
        ASSERT_TRUE(!record.started_at.has_value(), "not started");

        auto loaded = f.store.get(record.id);
        ASSERT_TRUE(loaded.has_value(), "persisted");
        ASSERT_EQ(loaded->source_urn, memory_urn("src"), "source urn");
        ASSERT_EQ(loaded->backend, "objectstore", "backend");
        PASS();
    }
    {
        TEST(terminal_records_do_not_change);
        MigrationFixture f;
        auto record = f.store.create(ARTIFACT, "v1", memory_urn("src"), "memory");
        MigrationUpdate error;
        error.status = MigrationStatus::Error;
        error.message = "failed";
        f.store.update(record.id, error);

        MigrationUpdate again;
        again.status = MigrationStatus::InProgress;
        ASSERT_THROWS(f.store.update(record.id, again), std::logic_error, "no regression");
        MigrationUpdate message_only;
        message_only.message = "late progress";
        ASSERT_THROWS(f.store.update(record.id, message_only), std::logic_error, "frozen");
        ASSERT_EQ(f.store.get(record.id)->message, "failed", "message kept");
        PASS();
    }
    {
        TEST(destination_iff_success);
        MigrationFixture f;
        auto record = f.store.create(ARTIFACT, "v1", memory_urn("src"), "memory");
        MigrationUpdate early;
        early.destination_urn = memory_urn("dst");
        ASSERT_THROWS(f.store.update(record.id, early), std::logic_error, "destination before success");
        MigrationUpdate bare;
        bare.status = MigrationStatus::Success;
        ASSERT_THROWS(f.store.update(record.id, bare), std::logic_error, "success needs destination");
        PASS();
    }
    {
        TEST(status_never_moves_backwards);
        MigrationFixture f;
        auto record = f.store.create(ARTIFACT, "v1", memory_urn("src"), "memory");
        MigrationUpdate running;
        running.status = MigrationStatus::InProgress;
        f.store.update(record.id, running);

        MigrationUpdate requeue;
        requeue.status = MigrationStatus::Queued;
        ASSERT_THROWS(f.store.update(record.id, requeue), std::logic_error, "in progress to queued");
        ASSERT_TRUE(f.store.get(record.id)->status == MigrationStatus::InProgress, "status kept");

        MigrationUpdate same;
        same.status = MigrationStatus::InProgress;
        same.message = "still running";
        ASSERT_EQ(f.store.update(record.id, same).message, "still running", "same status allowed");
        PASS();
    }
    {
        TEST(claim_moves_queued_record_once);
        MigrationFixture f;
        auto record = f.store.create(ARTIFACT, "v1", memory_urn("src"), "memory");
        MigrationStore other((f.tmpdir / "migrations.db").string());

        auto claimed = f.store.claim(record.id, constants::MSG_SELECTED);
        ASSERT_TRUE(claimed.has_value(), "first claim wins");
        ASSERT_TRUE(claimed->status == MigrationStatus::InProgress, "in progress");
        ASSERT_EQ(claimed->message, std::string(constants::MSG_SELECTED), "message");
        ASSERT_TRUE(!other.claim(record.id, constants::MSG_SELECTED).has_value(),
                    "second connection cannot claim");
        ASSERT_TRUE(!f.store.claim(4242, constants::MSG_SELECTED).has_value(), "unknown id");
        PASS();
    }
    {
        TEST(unknown_id_is_out_of_range);
        MigrationFixture f;
        MigrationUpdate update;
        update.message = "x";
        ASSERT_THROWS(f.store.update(4242, update), std::out_of_range, "unknown id");
        ASSERT_TRUE(!f.store.get(4242).has_value(), "no record");
        PASS();
    }
    {
        TEST(second_migration_in_progress_conflicts);
        MigrationFixture f;
        auto first = f.store.create(ARTIFACT, "v1", memory_urn("src"), "memory");
        MigrationUpdate running;
        running.status = MigrationStatus::InProgress;
        f.store.update(first.id, running);

        ASSERT_THROWS(f.store.create(ARTIFACT, "v1", memory_urn("src"), "objectstore"), Conflict,
                      "in progress conflicts");
        ASSERT_EQ(f.store.list_for_version(ARTIFACT, "v1").size(), (size_t)1, "no new record");

        auto other = f.store.create(ARTIFACT, "v2", memory_urn("src"), "memory");
        ASSERT_TRUE(other.status == MigrationStatus::Queued, "other versions unaffected");
        PASS();
    }
    {
        TEST(finished_migrations_allow_a_new_one);
        MigrationFixture f;
        auto first = f.store.create(ARTIFACT, "v1", memory_urn("src"), "memory");
        MigrationUpdate done;
        done.status = MigrationStatus::Success;
        done.destination_urn = memory_urn("dst");
        f.store.update(first.id, done);
        auto second = f.store.create(ARTIFACT, "v1", memory_urn("src"), "objectstore");
        ASSERT_EQ(f.store.latest_for_version(ARTIFACT, "v1")->id, second.id, "latest record");
        ASSERT_EQ(f.store.list_for_version(ARTIFACT, "v1").size(), (size_t)2, "audit trail kept");
        PASS();
    }
    {
        TEST(record_json);
        MigrationFixture f;
        auto record = f.store.create(ARTIFACT, "v1", memory_urn("src"), "memory");
        nlohmann::json j = record;
        ASSERT_EQ(j["status"].get<std::string>(), "QUEUED", "status name");
        ASSERT_TRUE(j["destination_urn"].is_null(), "null destination");
        ASSERT_EQ(j["artifact_uuid"].get<std::string>(), ARTIFACT, "artifact");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. MigrationEngine
// ---------------------------------------------------------------------------

static void test_engine_success() {
    std::cout << "\n=== MigrationEngine transfers ===" << std::endl;

    {
        TEST(successful_migration_reports_monotonic_progress);
        MigrationFixture f;
        auto data = pattern_bytes(100);
        f.memory.put("src", data);

        std::mutex seen_mutex;
        std::vector<double> ratios;
        std::vector<std::string> messages;
        f.store.set_update_listener([&](const MigrationRecord& record) {
            std::lock_guard<std::mutex> lock(seen_mutex);
            ratios.push_back(record.message_ratio);
            messages.push_back(record.message);
        });

        MigrationEngine engine(f.store, *f.factory, f.small_chunks());
        std::atomic<int> callbacks{0};
        engine.set_success_callback([&](const MigrationRecord& record) {
            if (record.status == MigrationStatus::Success) ++callbacks;
        });
        engine.start();
        auto submitted = engine.submit(ARTIFACT, "v1", memory_urn("src"), "memory");
        ASSERT_TRUE(submitted.status == MigrationStatus::Queued, "submit returns queued record");
        engine.wait_idle();
        engine.stop();

        auto record = engine.status(ARTIFACT, "v1");
        ASSERT_TRUE(record.has_value(), "record exists");
        ASSERT_EQ(migration_status_name(record->status), std::string("SUCCESS"), "status");
        ASSERT_TRUE(record->destination_urn.has_value(), "destination set");
        ASSERT_EQ(record->message, "Uploaded to " + *record->destination_urn, "message");
        ASSERT_EQ(record->message_ratio, 1.0, "complete");
        ASSERT_TRUE(record->started_at.has_value() && record->finished_at.has_value(), "timestamps");
        ASSERT_EQ(callbacks.load(), 1, "success callback");

        auto dest_id = ContentUrn::parse(*record->destination_urn).content_id;
        ASSERT_TRUE(f.memory.get(dest_id) == data, "bytes copied");
        ASSERT_EQ(f.memory.writes, (size_t)7, "one write per chunk");

        std::lock_guard<std::mutex> lock(seen_mutex);
        for (size_t i = 1; i < ratios.size(); ++i) {
            ASSERT_TRUE(ratios[i] >= ratios[i - 1], "progress never decreases");
        }
        ASSERT_EQ(ratios.back(), 1.0, "ends at 1.0");
        ASSERT_EQ(messages.front(), std::string(constants::MSG_SELECTED), "selected first");
        ASSERT_TRUE(std::find(messages.begin(), messages.end(), "Uploading to memory") != messages.end(),
                    "uploading message");
        ASSERT_TRUE(std::find(messages.begin(), messages.end(), constants::MSG_FINALIZING) != messages.end(),
                    "finalizing message");
        PASS();
    }
    {
        TEST(submitted_before_start_runs_once_started);
        MigrationFixture f;
        f.memory.put("src", bytes_of("queued content"));
        MigrationEngine engine(f.store, *f.factory, f.small_chunks());
        engine.submit(ARTIFACT, "v1", memory_urn("src"), "memory");
        ASSERT_EQ(engine.queue_depth(), (size_t)1, "waiting in queue");
        ASSERT_TRUE(engine.status(ARTIFACT, "v1")->status == MigrationStatus::Queued, "still queued");
        engine.start();
        engine.wait_idle();
        ASSERT_TRUE(engine.status(ARTIFACT, "v1")->status == MigrationStatus::Success, "ran");
        PASS();
    }
    {
        TEST(run_skips_records_that_are_not_queued);
        MigrationFixture f;
        f.memory.put("src", bytes_of("content"));
        MigrationEngine engine(f.store, *f.factory, f.small_chunks());
        auto record = f.store.create(ARTIFACT, "v1", memory_urn("src"), "memory");
        MigrationUpdate running;
        running.status = MigrationStatus::InProgress;
        f.store.update(record.id, running);
        engine.run(record.id);
        ASSERT_EQ(f.memory.opens, (size_t)0, "nothing opened");
        ASSERT_TRUE(f.store.get(record.id)->status == MigrationStatus::InProgress, "untouched");
        PASS();
    }
    {
        TEST(engines_sharing_a_database_run_a_record_once);
        MigrationFixture f;
        f.memory.put("src", pattern_bytes(100));
        MigrationStore other_store((f.tmpdir / "migrations.db").string());
        MigrationEngine engine(f.store, *f.factory, f.small_chunks());
        MigrationEngine other(other_store, *f.factory, f.small_chunks());
        auto record = f.store.create(ARTIFACT, "v1", memory_urn("src"), "memory");

        std::thread a([&] { engine.run(record.id); });
        std::thread b([&] { other.run(record.id); });
        a.join();
        b.join();

        auto stored = f.store.get(record.id);
        ASSERT_TRUE(stored->status == MigrationStatus::Success, "migrated");
        ASSERT_EQ(f.memory.writes, (size_t)7, "content copied once");
        ASSERT_EQ(f.memory.opens, (size_t)2, "one source and one destination");
        PASS();
    }
}

static void test_engine_failures() {
    std::cout << "\n=== MigrationEngine failures ===" << std::endl;

    {
        TEST(conflict_when_version_is_in_progress);
        MigrationFixture f;
        MigrationEngine engine(f.store, *f.factory, f.small_chunks());
        auto record = f.store.create(ARTIFACT, "v1", memory_urn("src"), "memory");
        MigrationUpdate running;
        running.status = MigrationStatus::InProgress;
        f.store.update(record.id, running);

        ASSERT_THROWS(engine.submit(ARTIFACT, "v1", memory_urn("src"), "memory"), Conflict, "conflict");
        ASSERT_EQ(f.store.list_for_version(ARTIFACT, "v1").size(), (size_t)1, "no record created");
        ASSERT_EQ(engine.queue_depth(), (size_t)0, "nothing queued");
        PASS();
    }
    {
        TEST(unknown_destination_backend);
        MigrationFixture f;
        MigrationEngine engine(f.store, *f.factory, f.small_chunks());
        try {
            engine.submit(ARTIFACT, "v1", memory_urn("src"), "tape");
            FAIL("should throw");
            return;
        } catch (const UnknownBackend& e) {
            ASSERT_EQ(std::string(e.what()), "Unknown storage backend: tape", "message");
        }
        ASSERT_TRUE(!f.store.latest_for_version(ARTIFACT, "v1").has_value(), "nothing stored");
        PASS();
    }
    {
        TEST(malformed_source_urn);
        MigrationFixture f;
        MigrationEngine engine(f.store, *f.factory, f.small_chunks());
        ASSERT_THROWS(engine.submit(ARTIFACT, "v1", "not-a-urn", "memory"), InvalidUrn, "invalid urn");
        ASSERT_TRUE(!f.store.latest_for_version(ARTIFACT, "v1").has_value(), "nothing stored");
        PASS();
    }
    {
        TEST(empty_source_fails_without_writing);
        MigrationFixture f;
        f.memory.put("empty", {});
        MigrationEngine engine(f.store, *f.factory, f.small_chunks());
        auto record = engine.submit(ARTIFACT, "v1", memory_urn("empty"), "memory");
        engine.run(record.id);

        auto stored = f.store.get(record.id);
        ASSERT_TRUE(stored->status == MigrationStatus::Error, "error");
        ASSERT_EQ(stored->message, std::string(constants::MSG_EMPTY_SOURCE), "message");
        ASSERT_TRUE(!stored->destination_urn.has_value(), "no destination");
        ASSERT_TRUE(stored->finished_at.has_value(), "finished");
        ASSERT_EQ(f.memory.writes, (size_t)0, "no destination writes");
        ASSERT_EQ(f.memory.opens, (size_t)1, "destination never opened");
        ASSERT_TRUE(!ContentLockRegistry::instance().is_held("empty"), "source lock released");
        PASS();
    }
    {
        TEST(source_read_error);
        MigrationFixture f;
        f.memory.put("flaky", pattern_bytes(64));
        f.memory.reads_before_failure = 2;
        MigrationEngine engine(f.store, *f.factory, f.small_chunks());
        auto record = engine.submit(ARTIFACT, "v1", memory_urn("flaky"), "memory");
        engine.run(record.id);

        auto stored = f.store.get(record.id);
        ASSERT_TRUE(stored->status == MigrationStatus::Error, "error");
        ASSERT_EQ(stored->message, std::string(constants::MSG_READ_ERROR), "message");
        ASSERT_TRUE(stored->message_ratio > 0.0 && stored->message_ratio < 1.0, "partial progress kept");
        ASSERT_TRUE(!ContentLockRegistry::instance().is_held("flaky"), "source lock released");
        PASS();
    }
    {
        TEST(destination_write_error);
        MigrationFixture f;
        f.memory.put("src", pattern_bytes(40));
        f.memory.fail_writes = true;
        MigrationEngine engine(f.store, *f.factory, f.small_chunks());
        auto record = engine.submit(ARTIFACT, "v1", memory_urn("src"), "memory");
        engine.run(record.id);

        auto stored = f.store.get(record.id);
        ASSERT_TRUE(stored->status == MigrationStatus::Error, "error");
        ASSERT_EQ(stored->message, std::string(constants::MSG_WRITE_ERROR), "message");
        PASS();
    }
    {
        TEST(destination_finalize_error);
        MigrationFixture f;
        f.memory.put("src", pattern_bytes(40));
        f.memory.fail_close = true;
        MigrationEngine engine(f.store, *f.factory, f.small_chunks());
        auto record = engine.submit(ARTIFACT, "v1", memory_urn("src"), "memory");
        engine.run(record.id);
        ASSERT_EQ(f.store.get(record.id)->message, std::string(constants::MSG_WRITE_ERROR), "message");
        PASS();
    }
    {
        TEST(unexpected_error_is_recorded_and_rethrown);
        MigrationFixture f;
        MigrationEngine engine(f.store, *f.factory, f.small_chunks());
        // Valid URN whose backend does not exist: only detected when the job runs
        auto record = f.store.create(ARTIFACT, "v1",
                                     std::string(constants::CONTENT_URN_PREFIX) + "tape:reel-7",
                                     "memory");
        ASSERT_THROWS(engine.run(record.id), UnknownBackend, "rethrown");
        auto stored = f.store.get(record.id);
        ASSERT_TRUE(stored->status == MigrationStatus::Error, "never left in progress");
        ASSERT_EQ(stored->message, std::string(constants::MSG_UNKNOWN_ERROR), "message");
        PASS();
    }
    {
        TEST(worker_survives_failed_jobs);
        MigrationFixture f;
        f.memory.put("good", bytes_of("fine content"));
        MigrationEngine engine(f.store, *f.factory, f.small_chunks());
        engine.start();
        engine.submit(ARTIFACT, "bad", std::string(constants::CONTENT_URN_PREFIX) + "tape:x", "memory");
        engine.submit(ARTIFACT, "good", memory_urn("good"), "memory");
        engine.wait_idle();
        ASSERT_TRUE(engine.status(ARTIFACT, "bad")->status == MigrationStatus::Error, "bad failed");
        ASSERT_TRUE(engine.status(ARTIFACT, "good")->status == MigrationStatus::Success, "good ran");
        ASSERT_TRUE(engine.running(), "worker still running");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 3. Destinations over HTTP
// ---------------------------------------------------------------------------

static void test_remote_destinations() {
    std::cout << "\n=== Remote destinations ===" << std::endl;

    {
        TEST(migrate_into_object_store);
        MigrationFixture f;
        auto data = pattern_bytes(100);
        f.memory.put("src", data);
        MigrationEngine engine(f.store, *f.factory, f.small_chunks());
        auto record = engine.submit(ARTIFACT, "v1", memory_urn("src"), "objectstore");
        engine.run(record.id);

        auto stored = f.store.get(record.id);
        ASSERT_TRUE(stored->status == MigrationStatus::Success, "success: " + stored->message);
        auto urn = ContentUrn::parse(*stored->destination_urn);
        ASSERT_EQ(urn.backend, "objectstore", "destination backend");
        ASSERT_EQ(f.swift->object_count(urn.content_id + "/"), (size_t)7, "one segment per chunk");
        ASSERT_TRUE(f.swift->has_manifest(urn.content_id), "sealed");

        auto reader = f.factory->create_for_urn(*stored->destination_urn);
        reader->open();
        ASSERT_EQ(reader->size(), (uint64_t)100, "size");
        reader->close();
        PASS();
    }
    {
        TEST(migrate_into_archive_with_metadata);
        MigrationFixture f;
        f.memory.put("src", pattern_bytes(300));
        MigrationEngine engine(f.store, *f.factory, f.small_chunks());
        engine.set_metadata_provider([](const MigrationRecord& record) {
            DepositionMetadata metadata;
            metadata.title = "Artifact " + record.version_slug;
            return std::optional<DepositionMetadata>(metadata);
        });
        auto record = engine.submit(ARTIFACT, "v3", memory_urn("src"), "archive");
        engine.run(record.id);

        auto stored = f.store.get(record.id);
        ASSERT_TRUE(stored->status == MigrationStatus::Success, "success: " + stored->message);
        auto doi = ContentUrn::parse(*stored->destination_urn).content_id;
        ASSERT_TRUE(is_archive_doi(doi), "doi: " + doi);
        ASSERT_TRUE(f.zenodo->published(doi), "published");
        ASSERT_EQ(f.zenodo->title_of(doi), "Artifact v3", "title from provider");
        ASSERT_TRUE(f.zenodo->file_data(doi, constants::ARCHIVE_FILE_NAME) == string_of(pattern_bytes(300)),
                    "bytes uploaded");
        PASS();
    }
    {
        TEST(object_store_write_failure);
        MigrationFixture f;
        f.memory.put("src", pattern_bytes(50));
        f.swift->fail_put_status = 403;
        MigrationEngine engine(f.store, *f.factory, f.small_chunks());
        auto record = engine.submit(ARTIFACT, "v1", memory_urn("src"), "objectstore");
        engine.run(record.id);
        auto stored = f.store.get(record.id);
        ASSERT_TRUE(stored->status == MigrationStatus::Error, "error");
        ASSERT_EQ(stored->message, std::string(constants::MSG_WRITE_ERROR), "message");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. Recovery
// ---------------------------------------------------------------------------

static void test_recovery() {
    std::cout << "\n=== Recovery ===" << std::endl;

    {
        TEST(interrupted_reaped_and_queued_requeued);
        MigrationFixture f;
        f.memory.put("src", bytes_of("recovered content"));

        auto interrupted = f.store.create(ARTIFACT, "v1", memory_urn("src"), "memory");
        MigrationUpdate running;
        running.status = MigrationStatus::InProgress;
        running.message = "Uploading to memory";
        f.store.update(interrupted.id, running);
        auto pending = f.store.create(ARTIFACT, "v2", memory_urn("src"), "memory");

        MigrationEngine engine(f.store, *f.factory, f.small_chunks());
        auto report = recover_migrations(f.store, engine);
        ASSERT_EQ(report.reaped, (size_t)1, "reaped");
        ASSERT_EQ(report.requeued, (size_t)1, "requeued");

        auto reaped = f.store.get(interrupted.id);
        ASSERT_TRUE(reaped->status == MigrationStatus::Error, "reaped to error");
        ASSERT_EQ(reaped->message, std::string(constants::MSG_INTERRUPTED), "interrupted message");
        ASSERT_TRUE(reaped->finished_at.has_value(), "finished_at");
        ASSERT_EQ(engine.queue_depth(), (size_t)1, "pending queued");

        engine.start();
        engine.wait_idle();
        ASSERT_TRUE(f.store.get(pending.id)->status == MigrationStatus::Success, "pending ran");
        PASS();
    }
    {
        TEST(records_survive_reopening_the_store);
        auto tmpdir = make_temp_dir("trovi-reopen");
        auto db = (tmpdir / "migrations.db").string();
        int64_t id;
        {
            MigrationStore store(db);
            id = store.create(ARTIFACT, "v1", memory_urn("src"), "memory").id;
            MigrationUpdate running;
            running.status = MigrationStatus::InProgress;
            store.update(id, running);
        }
        {
            MigrationStore store(db);
            ASSERT_EQ(reap_unfinished_migrations(store), (size_t)1, "reaped after restart");
            ASSERT_TRUE(store.get(id)->status == MigrationStatus::Error, "error");
        }
        fs::remove_all(tmpdir);
        PASS();
    }
    {
        TEST(worker_lock_admits_one_holder);
        MigrationFixture f;
        auto path = (f.tmpdir / "migrations.db.lock").string();
        WorkerLock first(path);
        WorkerLock second(path);
        ASSERT_TRUE(first.try_lock(), "first holder");
        ASSERT_TRUE(first.try_lock(), "relock by holder");
        ASSERT_TRUE(!second.try_lock(), "second holder refused");
        ASSERT_TRUE(!second.held(), "not held");
        first.unlock();
        ASSERT_TRUE(second.try_lock(), "free after unlock");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 5. Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== Metrics ===" << std::endl;

    {
        TEST(migration_outcomes_are_exported);
        MigrationFixture f;
        auto prom_path = f.tmpdir / "trovi.prom";
        MigrationMetrics metrics(prom_path, std::chrono::seconds(60), {{"host", "test"}});
        f.memory.put("src", pattern_bytes(32));
        f.memory.put("empty", {});

        {
            MigrationEngine engine(f.store, *f.factory, f.small_chunks(), &metrics);
            auto ok = engine.submit(ARTIFACT, "v1", memory_urn("src"), "memory");
            auto bad = engine.submit(ARTIFACT, "v2", memory_urn("empty"), "memory");
            engine.run(ok.id);
            engine.run(bad.id);
            ASSERT_THROWS(engine.submit(ARTIFACT, "v3", memory_urn("src"), "tape"), UnknownBackend,
                          "rejected");
            metrics.write_file();
        }

        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("trovi_migrations_total{host=\"test\",result=\"success\"} 1") !=
                        std::string::npos, "success counter:\n" + content);
        ASSERT_TRUE(content.find("trovi_migrations_total{host=\"test\",result=\"error\"} 1") !=
                        std::string::npos, "error counter");
        ASSERT_TRUE(content.find("trovi_migration_submissions_total{host=\"test\",result=\"rejected\"} 1") !=
                        std::string::npos, "rejected counter");
        ASSERT_TRUE(content.find("trovi_migration_bytes_total{host=\"test\"} 32") != std::string::npos,
                    "bytes counter");
        ASSERT_TRUE(content.find("trovi_migration_duration_seconds_count{host=\"test\"} 2") !=
                        std::string::npos, "duration histogram");
        ASSERT_TRUE(!fs::exists(prom_path.string() + ".tmp"), "temp file renamed away");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "trovi migration test suite" << std::endl;
    std::cout << "==========================" << std::endl;

    test_migration_store();
    test_engine_success();
    test_engine_failures();
    test_remote_destinations();
    test_recovery();
    test_metrics();

    std::cout << "\n==========================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
