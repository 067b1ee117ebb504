#pragma once

#include <string>

namespace trovi {

/// Exclusive flock on a file beside the migration database.
///
/// Only the process holding it may run a MigrationEngine against that
/// database, or reap its IN_PROGRESS records. The kernel drops the lock
/// when the process exits, however it exits.
class WorkerLock {
public:
    explicit WorkerLock(std::string path);
    ~WorkerLock();

    WorkerLock(const WorkerLock&) = delete;
    WorkerLock& operator=(const WorkerLock&) = delete;

    /// Non-blocking. Returns false when another holder has it.
    /// Throws std::runtime_error if the lock file cannot be opened.
    bool try_lock();
    void unlock();

    bool held() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_ = -1;
};

}  // namespace trovi
