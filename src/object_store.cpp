#include "trovi/storage/object_store.hpp"
#include "trovi/storage/backend_core.hpp"
#include "trovi/core/crypto.hpp"
#include "trovi/core/errors.hpp"
#include "trovi/core/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace trovi {

using json = nlohmann::json;

std::string ObjectStoreConfig::validate() const {
    if (uses_keystone()) {
        if (auth_url.empty()) return "objectstore: auth_url or storage_url is required";
        if (username.empty()) return "objectstore: username is required for Keystone auth";
        if (password.empty()) return "objectstore: password is required for Keystone auth";
        if (project_name.empty()) return "objectstore: project_name is required for Keystone auth";
    } else if (auth_token.empty()) {
        return "objectstore: auth_token is required with storage_url";
    }
    if (container.empty()) return "objectstore: container must not be empty";
    if (temp_url_digest != "sha1" && temp_url_digest != "sha256") {
        return "objectstore: temp_url_digest must be sha1 or sha256";
    }
    if (link_lifespan_seconds <= 0) return "objectstore: link_lifespan_seconds must be positive";
    return "";
}

std::string segment_name(uint64_t index) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%0*llu", constants::SEGMENT_NAME_WIDTH,
                  static_cast<unsigned long long>(index));
    return buf;
}

namespace {

int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

[[noreturn]] void throw_remote(const std::string& what, const net::HttpResponse& response) {
    std::string detail = response.error.empty()
        ? "HTTP " + std::to_string(response.status_code)
        : response.error;
    throw RemoteError(what + ": " + detail, response.status_code);
}

// ============================================================================
// ObjectStoreBackend - OpenStack Swift segmented objects
// ============================================================================

class ObjectStoreBackend : public StorageBackend {
public:
    ObjectStoreBackend(const ObjectStoreConfig& config,
                       std::shared_ptr<net::HttpTransport> transport,
                       std::optional<std::string> content_id,
                       const std::string& content_type,
                       AccessMode mode)
        : core_(constants::BACKEND_OBJECT_STORE, std::move(content_id), content_type)
        , config_(config)
        , transport_(std::move(transport))
        , mode_(mode) {
        if (!config_.uses_keystone()) {
            storage_url_ = config_.storage_url;
            token_ = config_.auth_token;
        }
        while (!storage_url_.empty() && storage_url_.back() == '/') {
            storage_url_.pop_back();
        }
    }

    const std::string& name() const override { return core_.name(); }
    std::optional<std::string> content_id() const override { return core_.content_id(); }
    const std::string& content_type() const override { return core_.content_type(); }

    bool writable() const override {
        return mode_ == AccessMode::ReadWrite && !remote_sealed_ && !core_.sealed();
    }

    bool readable() const override {
        return !core_.sealed() && segments_loaded_ && core_.segment_cursor() < segments_.size();
    }

    bool seekable() const override { return true; }
    bool closed() const override { return core_.sealed(); }

    void open() override {
        if (!core_.content_id()) {
            if (mode_ == AccessMode::ReadOnly) {
                throw ContentNotFound("cannot open object store content without an id for reading");
            }
            core_.set_content_id(generate_content_id());
            core_.lock_content();
            core_.mark_opened();
            return;
        }

        // Remote state is only read under the lock; a previous holder may have sealed it
        core_.lock_content();
        try {
            load_segments();
        } catch (const std::exception&) {
            core_.unlock_content();
            throw;
        }
        if (mode_ == AccessMode::ReadWrite && !remote_sealed_) {
            // Resume an unsealed upload after its last segment
            core_.set_segment_cursor(segments_.size());
        }
        core_.mark_opened();
    }

    std::vector<uint8_t> read(size_t max_bytes) override {
        std::vector<uint8_t> out;
        if (max_bytes == 0) return out;
        if (!segments_loaded_) load_segments();

        while (readable() && out.empty()) {
            const auto& segment = segments_[core_.segment_cursor()];
            uint64_t remaining = segment.bytes - segment_offset_;
            if (remaining == 0) {
                next_segment();
                continue;
            }
            uint64_t length = std::min<uint64_t>(max_bytes, remaining);

            auto request = net::HttpRequest::get(object_url(segment.name));
            request.byte_range = std::make_pair(segment_offset_, segment_offset_ + length - 1);
            request.headers.set("Accept", "application/octet-stream");
            auto response = send(request);
            if (!response.ok()) {
                throw_remote("failed to read " + segment.name, response);
            }

            out = std::move(response.body);
            if (response.status_code == 200 && segment_offset_ > 0) {
                // Range ignored by the server: whole object returned
                if (out.size() <= segment_offset_) {
                    out.clear();
                } else {
                    out.erase(out.begin(), out.begin() + static_cast<ptrdiff_t>(segment_offset_));
                }
            }
            if (out.size() > length) {
                out.resize(length);
            }
            if (out.empty()) {
                throw RemoteError("short read from " + segment.name, response.status_code);
            }

            segment_offset_ += out.size();
            if (segment_offset_ >= segment.bytes) {
                next_segment();
            }
        }
        return out;
    }

    size_t write(std::span<const uint8_t> data) override {
        core_.require_writable(mode_ == AccessMode::ReadWrite && !remote_sealed_);
        const auto& id = core_.require_content_id();
        if (data.empty()) {
            return 0;
        }

        uint64_t index = core_.advance_segment();
        std::string segment_path = id + "/" + segment_name(index);

        auto request = net::HttpRequest::put(object_url(segment_path),
                                             std::vector<uint8_t>(data.begin(), data.end()));
        request.headers.set_content_type("application/octet-stream");
        auto response = send(request);
        if (!response.ok()) {
            throw_remote("failed to upload segment " + segment_path, response);
        }

        core_.invalidate_size();
        log_debug("Uploaded segment %s (%zu bytes)", segment_path.c_str(), data.size());
        return data.size();
    }

    void close() override {
        core_.close_with([this]() {
            if (core_.segments_written() == 0) {
                return;
            }
            const auto& id = core_.require_content_id();
            auto request = net::HttpRequest::put(object_url(id), {});
            request.headers.set("X-Object-Manifest", config_.container + "/" + id + "/");
            request.headers.set_content_type(core_.content_type());
            auto response = send(request);
            if (!response.ok()) {
                throw_remote("failed to upload manifest for " + id, response);
            }
            remote_sealed_ = true;
            log_info("Sealed object %s/%s (%llu segments)", config_.container.c_str(), id.c_str(),
                     static_cast<unsigned long long>(core_.segments_written()));
        });
    }

    void abort() override {
        if (core_.segments_written() > 0 && !core_.sealed()) {
            log_warn("Abandoning unsealed upload %s (%llu segments)",
                     core_.content_id().value_or("").c_str(),
                     static_cast<unsigned long long>(core_.segments_written()));
        }
        core_.abort();
    }

    uint64_t seek(int64_t offset, SeekWhence whence) override {
        uint64_t base = 0;
        switch (whence) {
            case SeekWhence::Set: base = 0; break;
            case SeekWhence::Current: base = core_.segment_cursor(); break;
            case SeekWhence::End: base = segment_count(); break;
        }

        uint64_t position;
        if (offset >= 0) {
            uint64_t delta = static_cast<uint64_t>(offset);
            if (delta > constants::MAX_SEGMENTS - base) {
                throw TooManySegments("seek beyond the segment limit");
            }
            position = base + delta;
        } else {
            // -(offset + 1) + 1 avoids overflow on INT64_MIN
            uint64_t delta = static_cast<uint64_t>(-(offset + 1)) + 1;
            if (delta > base) {
                throw std::invalid_argument("seek to a negative segment index");
            }
            position = base - delta;
        }

        core_.set_segment_cursor(position);
        segment_offset_ = 0;
        return position;
    }

    uint64_t tell() const override { return core_.segment_cursor(); }

    uint64_t size() override {
        if (auto cached = core_.cached_size()) {
            return *cached;
        }
        if (!core_.content_id()) {
            return 0;
        }

        auto response = send(net::HttpRequest::head(object_url(*core_.content_id())));
        uint64_t size = 0;
        if (response.status_code == 404) {
            size = 0;
        } else if (!response.ok()) {
            throw_remote("failed to stat " + *core_.content_id(), response);
        } else {
            size = response.headers.content_length().value_or(0);
        }
        core_.cache_size(size);
        return size;
    }

    std::string to_urn() const override { return core_.to_urn(); }

    std::vector<DownloadLink> get_links() override {
        std::vector<DownloadLink> links;
        if (auto link = temporary_url()) {
            links.push_back(*link);
        }
        if (links.empty()) {
            throw NoAccessMethod("object store cannot produce a link for " +
                                 core_.content_id().value_or("<new>"));
        }
        return links;
    }

private:
    struct Segment {
        std::string name;  // Object path relative to the container
        uint64_t bytes = 0;
    };

    std::optional<HttpDownloadLink> temporary_url() {
        const auto& id = core_.require_content_id();
        if (config_.temp_url_key.empty()) {
            return std::nullopt;
        }
        ensure_authenticated();

        auto version_pos = storage_url_.find("/v1/");
        if (version_pos == std::string::npos) {
            throw RemoteError("storage URL has no /v1/ account path: " + storage_url_, 0);
        }
        std::string account = storage_url_.substr(version_pos);
        std::string path = "/" + config_.container + "/" + id;

        int64_t exp = now_seconds() + config_.link_lifespan_seconds;
        std::string body = "GET\n" + std::to_string(exp) + "\n" + account + path;
        std::string signature = crypto::hmac_hex(config_.temp_url_digest, config_.temp_url_key, body);

        HttpDownloadLink link;
        link.url = storage_url_ + path + "?temp_url_sig=" + signature +
                   "&temp_url_expires=" + std::to_string(exp);
        link.exp = exp;
        link.method = "GET";
        return link;
    }

    std::string generate_content_id() {
        for (int attempt = 0; attempt < constants::MAX_CONTENT_ID_ATTEMPTS; ++attempt) {
            std::string candidate = crypto::random_uuid();
            auto response = send(net::HttpRequest::head(object_url(candidate)));
            if (response.status_code == 404) {
                return candidate;
            }
            if (!response.ok()) {
                throw_remote("failed to probe content id " + candidate, response);
            }
            log_warn("Content id collision on %s, retrying", candidate.c_str());
        }
        throw RemoteError("no free content id after " +
                          std::to_string(constants::MAX_CONTENT_ID_ATTEMPTS) + " attempts", 409);
    }

    void load_segments() {
        const auto& id = core_.require_content_id();
        segments_.clear();

        std::string marker;
        while (true) {
            std::string url = container_url() + "?format=json&prefix=" +
                              net::url_encode(id + "/");
            if (!marker.empty()) {
                url += "&marker=" + net::url_encode(marker);
            }
            auto response = send(net::HttpRequest::get(url));
            if (response.status_code == 404 || response.status_code == 204) {
                break;
            }
            if (!response.ok()) {
                throw_remote("failed to list segments of " + id, response);
            }

            json listing;
            try {
                listing = json::parse(response.body_string());
            } catch (const json::exception& e) {
                throw RemoteError("malformed segment listing for " + id + ": " + e.what(),
                                  response.status_code);
            }
            if (!listing.is_array() || listing.empty()) {
                break;
            }
            for (const auto& entry : listing) {
                segments_.push_back({entry.value("name", ""), entry.value("bytes", uint64_t{0})});
            }
            marker = segments_.back().name;
        }

        std::sort(segments_.begin(), segments_.end(),
                  [](const Segment& a, const Segment& b) { return a.name < b.name; });

        auto head = send(net::HttpRequest::head(object_url(id)));
        if (head.ok()) {
            remote_sealed_ = true;
            if (segments_.empty()) {
                // Plain object uploaded in one piece
                segments_.push_back({id, head.headers.content_length().value_or(0)});
            }
        } else if (head.status_code != 404) {
            throw_remote("failed to stat " + id, head);
        }

        segments_loaded_ = true;
        segment_offset_ = 0;
    }

    uint64_t segment_count() {
        if (!segments_loaded_ && core_.content_id() && core_.segments_written() == 0) {
            load_segments();
        }
        return std::max<uint64_t>(segments_.size(), core_.segments_written());
    }

    void next_segment() {
        core_.set_segment_cursor(core_.segment_cursor() + 1);
        segment_offset_ = 0;
    }

    void ensure_authenticated() {
        if (!storage_url_.empty() && !token_.empty()) {
            return;
        }
        authenticate();
    }

    // Keystone v3 password auth: token from X-Subject-Token, endpoint from the catalog
    void authenticate() {
        json body = {
            {"auth", {
                {"identity", {
                    {"methods", {"password"}},
                    {"password", {{"user", {
                        {"name", config_.username},
                        {"domain", {{"name", config_.user_domain_name}}},
                        {"password", config_.password},
                    }}}},
                }},
                {"scope", {{"project", {
                    {"name", config_.project_name},
                    {"domain", {{"name", config_.project_domain_name}}},
                }}}},
            }},
        };

        std::string auth_url = config_.auth_url;
        while (!auth_url.empty() && auth_url.back() == '/') auth_url.pop_back();

        auto request = net::HttpRequest::post(auth_url + "/auth/tokens", "");
        request.set_json_body(body.dump());
        request.max_retries = config_.auth_retry_attempts;
        auto response = transport_->execute_with_retry(request);
        if (!response.ok()) {
            throw_remote("Keystone authentication failed", response);
        }

        auto token = response.headers.get("X-Subject-Token");
        if (!token) {
            throw RemoteError("Keystone response carries no X-Subject-Token", response.status_code);
        }

        std::string endpoint;
        try {
            auto parsed = json::parse(response.body_string());
            for (const auto& service : parsed.at("token").at("catalog")) {
                if (service.value("type", "") != "object-store") continue;
                for (const auto& ep : service.at("endpoints")) {
                    if (ep.value("interface", "") != config_.interface) continue;
                    if (!config_.region.empty() &&
                        ep.value("region_id", "") != config_.region &&
                        ep.value("region", "") != config_.region) {
                        continue;
                    }
                    endpoint = ep.value("url", "");
                    break;
                }
                if (!endpoint.empty()) break;
            }
        } catch (const json::exception& e) {
            throw RemoteError(std::string("malformed Keystone token response: ") + e.what(),
                              response.status_code);
        }
        if (endpoint.empty()) {
            throw RemoteError("no " + config_.interface + " object-store endpoint in the catalog", 0);
        }

        while (endpoint.back() == '/') endpoint.pop_back();
        storage_url_ = endpoint;
        token_ = *token;
        log_debug("Authenticated to object store at %s", storage_url_.c_str());
    }

    net::HttpResponse send(net::HttpRequest request) {
        ensure_authenticated();
        request.headers.set("X-Auth-Token", token_);
        auto response = transport_->execute_with_retry(request);

        if (response.status_code == 401 && config_.uses_keystone()) {
            // Token expired: authenticate once more
            token_.clear();
            authenticate();
            request.headers.set("X-Auth-Token", token_);
            response = transport_->execute_with_retry(request);
        }
        return response;
    }

    std::string container_url() {
        ensure_authenticated();
        return storage_url_ + "/" + net::url_encode(config_.container);
    }

    std::string object_url(const std::string& object) {
        return container_url() + "/" + net::url_encode_path(object);
    }

    BackendCore core_;
    ObjectStoreConfig config_;
    std::shared_ptr<net::HttpTransport> transport_;
    AccessMode mode_;

    std::string storage_url_;
    std::string token_;

    // Remote object already has a manifest (or is a plain object)
    bool remote_sealed_ = false;

    std::vector<Segment> segments_;
    bool segments_loaded_ = false;
    uint64_t segment_offset_ = 0;
};

}  // namespace

std::unique_ptr<StorageBackend> create_object_store(
    const ObjectStoreConfig& config,
    std::shared_ptr<net::HttpTransport> transport,
    std::optional<std::string> content_id,
    const std::string& content_type,
    AccessMode mode) {
    return std::make_unique<ObjectStoreBackend>(config, std::move(transport),
                                                std::move(content_id), content_type, mode);
}

}  // namespace trovi
