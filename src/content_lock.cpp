#include "trovi/storage/content_lock.hpp"

#include <stdexcept>

namespace trovi {

ContentLockRegistry& ContentLockRegistry::instance() {
    static ContentLockRegistry registry;
    return registry;
}

std::shared_ptr<ContentLockRegistry::Entry>
ContentLockRegistry::get_or_create(const std::string& content_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entries_[content_id];
    if (!entry) {
        entry = std::make_shared<Entry>();
    }
    return entry;
}

std::shared_ptr<ContentLockRegistry::Entry>
ContentLockRegistry::find(const std::string& content_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(content_id);
    return it == entries_.end() ? nullptr : it->second;
}

void ContentLockRegistry::acquire(const std::string& content_id) {
    auto entry = get_or_create(content_id);
    std::unique_lock<std::mutex> lock(entry->mutex);
    entry->released.wait(lock, [&entry] { return !entry->held; });
    entry->held = true;
}

bool ContentLockRegistry::try_acquire(const std::string& content_id) {
    auto entry = get_or_create(content_id);
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->held) {
        return false;
    }
    entry->held = true;
    return true;
}

void ContentLockRegistry::release(const std::string& content_id) {
    auto entry = find(content_id);
    if (!entry) {
        throw std::logic_error("release of unknown content lock: " + content_id);
    }
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (!entry->held) {
            throw std::logic_error("release of content lock that is not held: " + content_id);
        }
        entry->held = false;
    }
    entry->released.notify_one();
}

bool ContentLockRegistry::is_held(const std::string& content_id) const {
    auto entry = find(content_id);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->held;
}

size_t ContentLockRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace trovi
