#include "trovi/storage/uploader.hpp"
#include "trovi/core/errors.hpp"
#include "trovi/core/log.hpp"

#include <stdexcept>

namespace trovi {

ContentUploader::ContentUploader(const BackendFactory& factory,
                                 BackendRequest request,
                                 size_t max_memory_bytes)
    : factory_(factory)
    , request_(std::move(request))
    , max_memory_bytes_(max_memory_bytes) {
    if (!factory_.has_backend(request_.name)) {
        throw UnknownBackend("Unknown storage backend: " + request_.name);
    }
}

ContentUploader::~ContentUploader() = default;

void ContentUploader::start_streaming() {
    backend_ = std::make_unique<ScopedBackend>(factory_.create(request_));
    log_debug("Upload exceeded %zu bytes, streaming to %s",
              max_memory_bytes_, request_.name.c_str());
    if (!buffer_.empty()) {
        (*backend_)->write(buffer_);
        buffer_.clear();
        buffer_.shrink_to_fit();
    }
}

void ContentUploader::append(std::span<const uint8_t> data) {
    if (finished_) {
        throw std::logic_error("append after finish");
    }
    bytes_received_ += data.size();

    if (!backend_ && buffer_.size() + data.size() <= max_memory_bytes_) {
        buffer_.insert(buffer_.end(), data.begin(), data.end());
        return;
    }
    if (!backend_) {
        start_streaming();
    }
    (*backend_)->write(data);
}

std::string ContentUploader::finish() {
    if (finished_) {
        throw std::logic_error("upload already finished");
    }
    finished_ = true;

    if (!backend_) {
        backend_ = std::make_unique<ScopedBackend>(factory_.create(request_));
        if (!buffer_.empty()) {
            (*backend_)->write(buffer_);
        }
        buffer_.clear();
    }
    backend_->close();

    auto urn = (*backend_)->to_urn();
    log_info("Stored %llu bytes as %s", static_cast<unsigned long long>(bytes_received_), urn.c_str());
    return urn;
}

std::string upload_stream(const BackendFactory& factory,
                          const BackendRequest& request,
                          std::istream& in,
                          size_t chunk_bytes) {
    ContentUploader uploader(factory, request, chunk_bytes);
    std::vector<uint8_t> chunk(chunk_bytes);
    while (in) {
        in.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        auto got = static_cast<size_t>(in.gcount());
        if (got == 0) break;
        uploader.append(std::span<const uint8_t>(chunk.data(), got));
    }
    if (in.bad()) {
        throw std::runtime_error("failed to read upload input");
    }
    return uploader.finish();
}

}  // namespace trovi
