#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace trovi {

/// Process-wide mutual exclusion keyed by content identifier.
///
/// A backend acquires the lock for its content id in open() and releases it
/// in close() (or abort()). Acquisition is not re-entrant: acquiring an id the
/// calling thread already holds deadlocks.
///
/// Entries are created on first use and never evicted, so the registry grows
/// by one entry per distinct content id seen during the process lifetime.
class ContentLockRegistry {
public:
    ContentLockRegistry() = default;

    ContentLockRegistry(const ContentLockRegistry&) = delete;
    ContentLockRegistry& operator=(const ContentLockRegistry&) = delete;

    /// The registry shared by every backend in the process
    static ContentLockRegistry& instance();

    /// Block until no other holder exists for content_id, then hold it
    void acquire(const std::string& content_id);

    /// Hold content_id if it is free. Returns false without blocking otherwise.
    bool try_acquire(const std::string& content_id);

    /// Release content_id and wake one waiter.
    /// Throws std::logic_error if content_id is not held.
    void release(const std::string& content_id);

    bool is_held(const std::string& content_id) const;

    /// Number of entries ever created
    size_t size() const;

private:
    struct Entry {
        std::mutex mutex;
        std::condition_variable released;
        bool held = false;
    };

    std::shared_ptr<Entry> get_or_create(const std::string& content_id);
    std::shared_ptr<Entry> find(const std::string& content_id) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

}  // namespace trovi
