#include "trovi/storage/byte_channel.hpp"

#include <algorithm>
#include <stdexcept>

namespace trovi {

ByteChannel::ByteChannel(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

void ByteChannel::write(std::span<const uint8_t> data) {
    size_t pos = 0;
    std::unique_lock<std::mutex> lock(mutex_);
    while (pos < data.size()) {
        writable_.wait(lock, [this] { return aborted_ || buffer_.size() < capacity_; });
        if (aborted_) {
            throw std::runtime_error("upload stream aborted: " + abort_reason_);
        }
        if (closed_) {
            throw std::runtime_error("write to closed upload stream");
        }

        size_t n = std::min(capacity_ - buffer_.size(), data.size() - pos);
        buffer_.insert(buffer_.end(), data.begin() + pos, data.begin() + pos + n);
        pos += n;
        bytes_written_ += n;
        readable_.notify_one();
    }
}

void ByteChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    readable_.notify_all();
}

size_t ByteChannel::read(char* buffer, size_t max) {
    std::unique_lock<std::mutex> lock(mutex_);
    readable_.wait(lock, [this] { return aborted_ || closed_ || !buffer_.empty(); });
    if (aborted_) {
        throw std::runtime_error("upload stream aborted: " + abort_reason_);
    }

    size_t n = std::min(max, buffer_.size());
    std::copy_n(buffer_.begin(), n, buffer);
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<ptrdiff_t>(n));
    writable_.notify_one();
    return n;
}

void ByteChannel::abort(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (aborted_) return;
        aborted_ = true;
        abort_reason_ = reason;
    }
    readable_.notify_all();
    writable_.notify_all();
}

bool ByteChannel::aborted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aborted_;
}

uint64_t ByteChannel::bytes_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_written_;
}

}  // namespace trovi
