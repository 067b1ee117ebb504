#pragma once

#include <cstddef>

namespace trovi {

class MigrationEngine;
class MigrationStore;
class MigrationMetrics;

struct RecoveryReport {
    size_t reaped = 0;    // IN_PROGRESS records marked ERROR
    size_t requeued = 0;  // QUEUED records handed back to the engine
};

/// Marks every IN_PROGRESS migration as failed. Nothing can be running when
/// the process starts, so those jobs died with a previous process.
size_t reap_unfinished_migrations(MigrationStore& store);

/// Hands every QUEUED migration to the engine, oldest first
size_t requeue_queued_migrations(MigrationStore& store, MigrationEngine& engine);

/// Startup reconciliation: reap, then requeue. Call once, before submissions
/// are accepted.
RecoveryReport recover_migrations(MigrationStore& store,
                                  MigrationEngine& engine,
                                  MigrationMetrics* metrics = nullptr);

}  // namespace trovi
