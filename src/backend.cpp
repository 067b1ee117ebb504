#include "trovi/storage/backend.hpp"
#include "trovi/storage/backend_core.hpp"
#include "trovi/core/constants.hpp"
#include "trovi/core/errors.hpp"
#include "trovi/core/log.hpp"

#include <cstring>
#include <exception>

namespace trovi {

// ============================================================================
// ContentUrn
// ============================================================================

ContentUrn ContentUrn::parse(const std::string& urn) {
    const std::string prefix = constants::CONTENT_URN_PREFIX;
    if (!urn.starts_with(prefix)) {
        throw InvalidUrn("not a content URN: " + urn);
    }
    auto rest = urn.substr(prefix.size());
    auto colon = rest.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= rest.size()) {
        throw InvalidUrn("content URN needs a backend and a content id: " + urn);
    }
    return ContentUrn{rest.substr(0, colon), rest.substr(colon + 1)};
}

std::string ContentUrn::str() const {
    return constants::CONTENT_URN_PREFIX + backend + ":" + content_id;
}

// ============================================================================
// ScopedBackend
// ============================================================================

ScopedBackend::ScopedBackend(std::unique_ptr<StorageBackend> backend)
    : backend_(std::move(backend)) {
    backend_->open();
}

ScopedBackend::~ScopedBackend() {
    if (!backend_ || backend_->closed()) {
        return;
    }
    try {
        backend_->abort();
    } catch (const std::exception& e) {
        log_error("Failed to abort %s backend: %s", backend_->name().c_str(), e.what());
    }
}

void ScopedBackend::close() {
    backend_->close();
}

// ============================================================================
// BackendCore
// ============================================================================

BackendCore::BackendCore(std::string name,
                         std::optional<std::string> content_id,
                         std::string content_type,
                         ContentLockRegistry& locks)
    : name_(std::move(name))
    , content_id_(std::move(content_id))
    , content_type_(std::move(content_type))
    , locks_(locks) {}

BackendCore::~BackendCore() {
    if (locked_id_) {
        log_warn("%s backend destroyed while holding the lock for %s",
                 name_.c_str(), locked_id_->c_str());
        locks_.release(*locked_id_);
    }
}

const std::string& BackendCore::require_content_id() const {
    if (!content_id_ || content_id_->empty()) {
        throw ContentNotFound(name_ + " content has not been stored yet");
    }
    return *content_id_;
}

std::string BackendCore::to_urn() const {
    return ContentUrn{name_, require_content_id()}.str();
}

void BackendCore::require_writable(bool variant_writable) const {
    if (!variant_writable) {
        throw NotWritable(name_ + " backend does not accept writes");
    }
    if (sealed_) {
        throw NotWritable("attempted write to closed content: " +
                          content_id_.value_or("<new>"));
    }
}

uint64_t BackendCore::advance_segment() {
    if (segment_cursor_ == constants::MAX_SEGMENTS) {
        throw TooManySegments("segment limit reached for " + content_id_.value_or("<new>"));
    }
    segments_written_++;
    return segment_cursor_++;
}

void BackendCore::lock_content() {
    const auto& id = require_content_id();
    locks_.acquire(id);
    locked_id_ = id;
}

void BackendCore::unlock_content() {
    if (!locked_id_) {
        return;
    }
    auto id = std::move(*locked_id_);
    locked_id_.reset();
    locks_.release(id);
}

void BackendCore::close_with(const std::function<void()>& finalize) {
    if (sealed_) {
        throw AlreadyClosed("tried to close " + name_ + " content that is already closed");
    }

    std::exception_ptr error;
    try {
        finalize();
    } catch (const std::exception& e) {
        log_error("%s backend failed to finalize: %s", name_.c_str(), e.what());
        error = std::current_exception();
    }

    sealed_ = true;
    unlock_content();

    if (error) {
        std::rethrow_exception(error);
    }
}

void BackendCore::abort() {
    sealed_ = true;
    unlock_content();
}

}  // namespace trovi
