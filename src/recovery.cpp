#include "trovi/migration/recovery.hpp"
#include "trovi/migration/migration_engine.hpp"
#include "trovi/migration/migration_store.hpp"
#include "trovi/service/metrics.hpp"
#include "trovi/core/constants.hpp"
#include "trovi/core/log.hpp"

namespace trovi {

size_t reap_unfinished_migrations(MigrationStore& store) {
    size_t reaped = store.mark_interrupted(constants::MSG_INTERRUPTED);
    if (reaped > 0) {
        log_warn("Marked %zu interrupted migrations as failed", reaped);
    }
    return reaped;
}

size_t requeue_queued_migrations(MigrationStore& store, MigrationEngine& engine) {
    auto queued = store.list_by_status(MigrationStatus::Queued);
    for (const auto& record : queued) {
        log_debug("Requeueing migration %lld of %s/%s", static_cast<long long>(record.id),
                  record.artifact_uuid.c_str(), record.version_slug.c_str());
        engine.enqueue(record.id);
    }
    if (!queued.empty()) {
        log_info("Requeued %zu pending migrations", queued.size());
    }
    return queued.size();
}

RecoveryReport recover_migrations(MigrationStore& store,
                                  MigrationEngine& engine,
                                  MigrationMetrics* metrics) {
    RecoveryReport report;
    report.reaped = reap_unfinished_migrations(store);
    report.requeued = requeue_queued_migrations(store, engine);
    if (metrics && report.reaped > 0) {
        metrics->migrations_reaped().Increment(static_cast<double>(report.reaped));
    }
    return report;
}

}  // namespace trovi
