#pragma once

#include "trovi/storage/content_lock.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace trovi {

/// Bookkeeping shared by every StorageBackend variant: identity, cached
/// size and sealed flags, the segment cursor and ownership of the content lock.
/// Variants hold one of these and delegate to it.
class BackendCore {
public:
    BackendCore(std::string name,
                std::optional<std::string> content_id,
                std::string content_type,
                ContentLockRegistry& locks = ContentLockRegistry::instance());
    ~BackendCore();

    BackendCore(const BackendCore&) = delete;
    BackendCore& operator=(const BackendCore&) = delete;

    const std::string& name() const { return name_; }
    const std::string& content_type() const { return content_type_; }

    const std::optional<std::string>& content_id() const { return content_id_; }
    void set_content_id(std::string content_id) { content_id_ = std::move(content_id); }

    // Throws ContentNotFound when no content id is assigned
    const std::string& require_content_id() const;

    std::string to_urn() const;

    std::optional<uint64_t> cached_size() const { return cached_size_; }
    void cache_size(uint64_t size) { cached_size_ = size; }
    void invalidate_size() { cached_size_.reset(); }

    bool opened() const { return opened_; }
    void mark_opened() { opened_ = true; }

    bool sealed() const { return sealed_; }

    // Throws NotWritable unless variant_writable and not sealed
    void require_writable(bool variant_writable) const;

    uint64_t segment_cursor() const { return segment_cursor_; }
    void set_segment_cursor(uint64_t cursor) { segment_cursor_ = cursor; }
    uint64_t segments_written() const { return segments_written_; }

    // Claims the segment at the cursor and moves the cursor past it.
    // Throws TooManySegments when the cursor sits at the ceiling.
    uint64_t advance_segment();

    // Takes the content lock for the current content id
    void lock_content();

    // Releases the content lock if this core holds it
    void unlock_content();

    bool holds_lock() const { return locked_id_.has_value(); }

    // Runs finalize, then seals and releases the lock whatever finalize did,
    // then rethrows finalize's error. Throws AlreadyClosed on the second call.
    void close_with(const std::function<void()>& finalize);

    // Seals without finalizing and releases the lock. Idempotent.
    void abort();

private:
    std::string name_;
    std::optional<std::string> content_id_;
    std::string content_type_;
    ContentLockRegistry& locks_;

    std::optional<uint64_t> cached_size_;
    bool opened_ = false;
    bool sealed_ = false;
    uint64_t segment_cursor_ = 0;
    uint64_t segments_written_ = 0;
    std::optional<std::string> locked_id_;
};

}  // namespace trovi
