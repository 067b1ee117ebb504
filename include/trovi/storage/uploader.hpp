#pragma once

#include "trovi/storage/backend.hpp"
#include "trovi/storage/factory.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace trovi {

/// Accepts an upload of unknown length piece by piece.
///
/// Content up to max_memory_bytes is buffered and written in one shot by
/// finish(). Once the buffer would exceed the threshold the backend is opened,
/// the buffer flushed, and every further piece is written straight through.
class ContentUploader {
public:
    ContentUploader(const BackendFactory& factory,
                    BackendRequest request,
                    size_t max_memory_bytes);
    ~ContentUploader();

    ContentUploader(const ContentUploader&) = delete;
    ContentUploader& operator=(const ContentUploader&) = delete;

    void append(std::span<const uint8_t> data);

    // Closes the backend and returns the content URN
    std::string finish();

    uint64_t bytes_received() const { return bytes_received_; }
    bool streaming() const { return backend_ != nullptr; }

private:
    void start_streaming();

    const BackendFactory& factory_;
    BackendRequest request_;
    size_t max_memory_bytes_;

    std::vector<uint8_t> buffer_;
    std::unique_ptr<ScopedBackend> backend_;
    uint64_t bytes_received_ = 0;
    bool finished_ = false;
};

// Reads the stream in chunks of chunk_bytes through a ContentUploader.
// Returns the content URN.
std::string upload_stream(const BackendFactory& factory,
                          const BackendRequest& request,
                          std::istream& in,
                          size_t chunk_bytes);

}  // namespace trovi
