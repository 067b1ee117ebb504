#pragma once

#include "trovi/storage/download_link.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace trovi {

enum class SeekWhence {
    Set,
    Current,
    End
};

// Migration sources are opened read-only: they never create new content
enum class AccessMode {
    ReadWrite,
    ReadOnly
};

// urn:trovi:contents:<backend>:<content-id>
struct ContentUrn {
    std::string backend;
    std::string content_id;

    // Throws InvalidUrn on anything that is not a content URN with a
    // non-empty backend and content id. The content id may contain ':'.
    static ContentUrn parse(const std::string& urn);

    std::string str() const;
};

/// Uniform streaming interface over one piece of content held by a remote
/// storage system.
///
/// Lifecycle: open() assigns a content id if there is none and takes the
/// content lock; close() finalizes, seals and releases the lock; abort()
/// releases the lock without finalizing. Use ScopedBackend so that the lock is
/// released when a transfer throws.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    /// Backend name as it appears in content URNs
    virtual const std::string& name() const = 0;

    /// Absent until open() creates new content
    virtual std::optional<std::string> content_id() const = 0;

    virtual const std::string& content_type() const = 0;

    /// Whether this variant accepts writes at all, ignoring the sealed state
    virtual bool writable() const = 0;

    /// False once sealed, or once the read cursor has reached the end
    virtual bool readable() const = 0;

    virtual bool seekable() const = 0;

    /// True after close() or abort()
    virtual bool closed() const = 0;

    virtual void open() = 0;

    /// Next chunk of at most max_bytes from the read cursor.
    /// An empty result means end of content.
    virtual std::vector<uint8_t> read(size_t max_bytes) = 0;

    /// Throws NotWritable if the variant is not writable or is sealed,
    /// TooManySegments at the segment ceiling.
    virtual size_t write(std::span<const uint8_t> data) = 0;

    /// Throws AlreadyClosed on the second call. The lock is released even when
    /// finalization throws.
    virtual void close() = 0;

    virtual void abort() = 0;

    /// Throws NotSeekable for variants that are not seekable
    virtual uint64_t seek(int64_t offset, SeekWhence whence) = 0;
    virtual uint64_t tell() const = 0;

    /// Size in bytes of the stored content, 0 if nothing is stored yet.
    /// Fetched once and cached.
    virtual uint64_t size() = 0;

    /// Throws ContentNotFound if no content id has been assigned
    virtual std::string to_urn() const = 0;

    /// Throws NoAccessMethod if no link can be produced
    virtual std::vector<DownloadLink> get_links() = 0;
};

/// Owns a backend for the duration of a scope. Opens it on construction and
/// aborts it on destruction unless it was closed explicitly.
class ScopedBackend {
public:
    explicit ScopedBackend(std::unique_ptr<StorageBackend> backend);
    ~ScopedBackend();

    ScopedBackend(const ScopedBackend&) = delete;
    ScopedBackend& operator=(const ScopedBackend&) = delete;

    StorageBackend* operator->() { return backend_.get(); }
    StorageBackend& operator*() { return *backend_; }
    StorageBackend* get() { return backend_.get(); }

    void close();

private:
    std::unique_ptr<StorageBackend> backend_;
};

}  // namespace trovi
