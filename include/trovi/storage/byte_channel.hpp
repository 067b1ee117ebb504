#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <span>
#include <string>

namespace trovi {

/// Bounded single-producer single-consumer byte pipe between a writer thread
/// and an upload task.
///
/// write() blocks only while the buffer is full. read() blocks until bytes are
/// available or the writer closed the channel. abort() fails both ends.
class ByteChannel {
public:
    explicit ByteChannel(size_t capacity);

    ByteChannel(const ByteChannel&) = delete;
    ByteChannel& operator=(const ByteChannel&) = delete;

    // Throws std::runtime_error after abort() or close()
    void write(std::span<const uint8_t> data);

    // End of stream for the reader
    void close();

    // Up to max bytes; 0 once closed and drained. Throws std::runtime_error
    // after abort().
    size_t read(char* buffer, size_t max);

    void abort(const std::string& reason);

    bool aborted() const;
    uint64_t bytes_written() const;

private:
    const size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable readable_;
    std::condition_variable writable_;
    std::deque<uint8_t> buffer_;
    bool closed_ = false;
    bool aborted_ = false;
    std::string abort_reason_;
    uint64_t bytes_written_ = 0;
};

}  // namespace trovi
