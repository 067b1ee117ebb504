#include "trovi/storage/git_backend.hpp"
#include "trovi/storage/backend_core.hpp"
#include "trovi/core/errors.hpp"

#include <chrono>

namespace trovi {

GitLocation GitLocation::parse(const std::string& content_id) {
    // Skip "scheme://" and any "user@" in front of the host
    size_t search_from = 0;
    auto scheme = content_id.find("://");
    if (scheme != std::string::npos) {
        search_from = content_id.find('/', scheme + 3);
    } else {
        search_from = content_id.find(':');
    }
    if (search_from == std::string::npos) {
        search_from = 0;
    }

    GitLocation location;
    auto at = content_id.find('@', search_from);
    if (at == std::string::npos) {
        location.remote = content_id;
    } else {
        location.remote = content_id.substr(0, at);
        auto ref = content_id.substr(at + 1);
        if (!ref.empty()) {
            location.ref = ref;
        }
    }
    return location;
}

std::string git_archive_url(const GitLocation& location) {
    const auto& remote = location.remote;
    if (!remote.starts_with("http://") && !remote.starts_with("https://")) {
        return "";
    }

    auto host_start = remote.find("://") + 3;
    auto host_end = remote.find('/', host_start);
    if (host_end == std::string::npos) {
        return "";
    }
    std::string host = remote.substr(host_start, host_end - host_start);

    std::string base = remote;
    if (base.ends_with(".git")) {
        base.resize(base.size() - 4);
    }
    while (base.ends_with("/")) {
        base.pop_back();
    }

    if (host == "github.com" || host == "www.github.com") {
        return base + "/archive/" + location.ref + ".zip";
    }
    if (host == "gitlab.com") {
        std::string project = base.substr(base.find_last_of('/') + 1);
        return base + "/-/archive/" + location.ref + "/" + project + "-" + location.ref + ".zip";
    }
    return "";
}

namespace {

// ============================================================================
// GitBackend - links to a git remote, no byte transfer
// ============================================================================

class GitBackend : public StorageBackend {
public:
    GitBackend(const std::string& content_id, const std::string& content_type,
               int64_t link_lifespan_seconds)
        : core_(constants::BACKEND_GIT, content_id, content_type)
        , location_(GitLocation::parse(content_id))
        , link_lifespan_seconds_(link_lifespan_seconds) {}

    const std::string& name() const override { return core_.name(); }
    std::optional<std::string> content_id() const override { return core_.content_id(); }
    const std::string& content_type() const override { return core_.content_type(); }

    bool writable() const override { return false; }
    bool readable() const override { return false; }
    bool seekable() const override { return false; }
    bool closed() const override { return core_.sealed(); }

    void open() override {
        core_.lock_content();
        core_.mark_opened();
    }

    std::vector<uint8_t> read(size_t) override { return {}; }

    size_t write(std::span<const uint8_t>) override {
        core_.require_writable(false);
        return 0;
    }

    void close() override {
        core_.close_with([] {});
    }

    void abort() override { core_.abort(); }

    uint64_t seek(int64_t, SeekWhence) override {
        throw NotSeekable("git content is not seekable");
    }

    uint64_t tell() const override {
        throw NotSeekable("git content is not seekable");
    }

    uint64_t size() override { return 0; }

    std::string to_urn() const override { return core_.to_urn(); }

    std::vector<DownloadLink> get_links() override {
        int64_t exp = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count() + link_lifespan_seconds_;

        std::vector<DownloadLink> links;
        auto archive = git_archive_url(location_);
        if (!archive.empty()) {
            links.push_back(HttpDownloadLink{archive, exp, {}, "GET"});
        }
        links.push_back(GitDownloadLink{location_.remote, location_.ref, exp, {}});
        return links;
    }

private:
    BackendCore core_;
    GitLocation location_;
    int64_t link_lifespan_seconds_;
};

}  // namespace

std::unique_ptr<StorageBackend> create_git_backend(
    const std::string& content_id,
    const std::string& content_type,
    int64_t link_lifespan_seconds) {
    return std::make_unique<GitBackend>(content_id, content_type, link_lifespan_seconds);
}

}  // namespace trovi
