#include "trovi/storage/archive_backend.hpp"
#include "trovi/storage/backend_core.hpp"
#include "trovi/storage/byte_channel.hpp"
#include "trovi/core/errors.hpp"
#include "trovi/core/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <future>

namespace trovi {

using json = nlohmann::json;

std::string ArchiveConfig::validate() const {
    if (base_url.empty()) return "archive: base_url must not be empty";
    if (!base_url.starts_with("http://") && !base_url.starts_with("https://")) {
        return "archive: base_url must be an http(s) URL";
    }
    if (pipe_capacity_bytes == 0) return "archive: pipe_capacity_bytes must be positive";
    return "";
}

json DepositionMetadata::to_payload() const {
    std::string date = publication_date;
    if (date.empty()) {
        std::time_t now = std::time(nullptr);
        std::tm tm_buf{};
        gmtime_r(&now, &tm_buf);
        char buf[16];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm_buf);
        date = buf;
    }

    json creator_list = json::array();
    for (const auto& creator : creators) {
        creator_list.push_back({{"name", creator.name}, {"affiliation", creator.affiliation}});
    }
    json community_list = json::array();
    for (const auto& community : communities) {
        community_list.push_back({{"identifier", community}});
    }

    return {
        {"metadata", {
            {"title", title},
            {"description", description},
            {"creators", creator_list},
            {"upload_type", upload_type},
            {"publication_type", publication_type},
            {"publication_date", date},
            {"communities", community_list},
            {"keywords", keywords},
        }},
    };
}

namespace {

bool all_digits(const std::string& s, size_t from, size_t to) {
    if (from >= to) return false;
    for (size_t i = from; i < to; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

}  // namespace

bool is_archive_doi(const std::string& doi) {
    if (!doi.starts_with("10.")) return false;
    auto slash = doi.find('/');
    if (slash == std::string::npos || !all_digits(doi, 3, slash)) return false;
    const std::string marker = "/zenodo.";
    if (doi.compare(slash, marker.size(), marker) != 0) return false;
    return all_digits(doi, slash + marker.size(), doi.size());
}

std::string archive_record_id(const std::string& doi) {
    if (!is_archive_doi(doi)) {
        throw ContentNotFound("not an archive DOI: " + doi);
    }
    return doi.substr(doi.find_last_of('.') + 1);
}

namespace {

// Last path component of a URL: ".../deposit/depositions/123" -> "123"
std::string last_path_component(const std::string& url) {
    auto end = url.find_first_of("?#");
    std::string path = url.substr(0, end);
    while (path.ends_with("/")) path.pop_back();
    return path.substr(path.find_last_of('/') + 1);
}

// JSON numbers and strings both show up as ids
std::string id_string(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<int64_t>());
    return "";
}

// ============================================================================
// ArchiveBackend - Zenodo depositions
// ============================================================================

class ArchiveBackend : public StorageBackend {
public:
    ArchiveBackend(const ArchiveConfig& config,
                   std::shared_ptr<net::HttpTransport> transport,
                   std::optional<std::string> content_id,
                   const std::string& content_type,
                   AccessMode mode,
                   const DepositionMetadata& metadata)
        : core_(constants::BACKEND_ARCHIVE, std::move(content_id), content_type)
        , config_(config)
        , transport_(std::move(transport))
        , mode_(mode)
        , metadata_(metadata) {
        while (config_.base_url.ends_with("/")) config_.base_url.pop_back();
    }

    ~ArchiveBackend() override {
        stop_upload("backend destroyed");
    }

    const std::string& name() const override { return core_.name(); }
    std::optional<std::string> content_id() const override { return core_.content_id(); }
    const std::string& content_type() const override { return core_.content_type(); }

    bool writable() const override {
        return mode_ == AccessMode::ReadWrite && !core_.sealed();
    }

    bool readable() const override {
        return !core_.sealed() && file_loaded_ && read_offset_ < file_size_;
    }

    bool seekable() const override { return false; }
    bool closed() const override { return core_.sealed(); }

    void open() override {
        if (mode_ == AccessMode::ReadOnly) {
            archive_record_id(core_.require_content_id());
            core_.lock_content();
            core_.mark_opened();
            load_file();
            return;
        }

        if (!core_.content_id()) {
            create_deposition();
        } else {
            // Serialize on the DOI being versioned before touching the remote
            core_.lock_content();
            try {
                new_version(*core_.content_id());
            } catch (const std::exception&) {
                core_.unlock_content();
                throw;
            }
            core_.mark_opened();
            return;
        }
        core_.lock_content();
        core_.mark_opened();
    }

    std::vector<uint8_t> read(size_t max_bytes) override {
        std::vector<uint8_t> out;
        if (!file_loaded_) load_file();
        if (!readable() || max_bytes == 0) return out;

        uint64_t length = std::min<uint64_t>(max_bytes, file_size_ - read_offset_);
        auto request = net::HttpRequest::get(download_url_);
        request.byte_range = std::make_pair(read_offset_, read_offset_ + length - 1);
        authorize(request);
        auto response = transport_->execute_with_retry(request);
        if (!response.ok()) {
            throw RemoteError("failed to read " + download_url_ + ": " + describe(response),
                              response.status_code);
        }

        out = std::move(response.body);
        if (response.status_code == 200 && read_offset_ > 0) {
            // Server ignored the range
            if (out.size() <= read_offset_) {
                out.clear();
            } else {
                out.erase(out.begin(), out.begin() + static_cast<ptrdiff_t>(read_offset_));
            }
        }
        if (out.size() > length) out.resize(length);
        if (out.empty()) {
            throw RemoteError("short read from " + download_url_, response.status_code);
        }
        read_offset_ += out.size();
        return out;
    }

    size_t write(std::span<const uint8_t> data) override {
        core_.require_writable(mode_ == AccessMode::ReadWrite);
        if (!core_.opened() || deposition_id_.empty()) {
            throw NotWritable("archive content must be opened before writing");
        }
        if (data.empty()) {
            return 0;
        }
        if (!upload_.valid()) {
            start_upload();
        }
        try {
            channel_->write(data);
        } catch (const std::runtime_error& e) {
            throw RemoteError(std::string("archive upload failed: ") + e.what(), 0);
        }
        core_.invalidate_size();
        return data.size();
    }

    void close() override {
        core_.close_with([this]() {
            if (mode_ == AccessMode::ReadOnly) {
                return;
            }
            if (!upload_.valid()) {
                if (!deposition_id_.empty()) {
                    log_warn("Deposition %s left as an unpublished draft: nothing was written",
                             deposition_id_.c_str());
                }
                return;
            }

            channel_->close();
            upload_.get();

            auto published = api(net::HttpMethod::POST,
                                 "deposit/depositions/" + deposition_id_ + "/actions/publish");
            std::string doi = published.value("doi", "");
            if (doi.empty()) {
                throw RemoteError("publish response for deposition " + deposition_id_ +
                                  " carries no DOI", 0);
            }
            core_.set_content_id(doi);
            core_.invalidate_size();
            log_info("Published deposition %s as %s", deposition_id_.c_str(), doi.c_str());
        });
    }

    void abort() override {
        stop_upload("upload aborted");
        if (mode_ == AccessMode::ReadWrite && !deposition_id_.empty() && !core_.sealed()) {
            log_warn("Deposition %s left as an unpublished draft", deposition_id_.c_str());
        }
        core_.abort();
    }

    uint64_t seek(int64_t, SeekWhence) override {
        throw NotSeekable("archive content is not seekable");
    }

    uint64_t tell() const override {
        throw NotSeekable("archive content is not seekable");
    }

    uint64_t size() override {
        if (auto cached = core_.cached_size()) {
            return *cached;
        }
        if (!core_.content_id()) {
            return 0;
        }
        auto record = archive_record_id(*core_.content_id());
        auto files = api(net::HttpMethod::GET, "deposit/depositions/" + record + "/files");
        if (!files.is_array()) {
            throw RemoteError("invalid file listing for " + *core_.content_id(), 0);
        }
        uint64_t total = 0;
        for (const auto& file : files) {
            total += file.value("filesize", uint64_t{0});
        }
        core_.cache_size(total);
        return total;
    }

    std::string to_urn() const override { return core_.to_urn(); }

    std::vector<DownloadLink> get_links() override {
        const auto& doi = core_.require_content_id();
        std::string record_url = config_.base_url + "/records/" + archive_record_id(doi);
        std::string tar_url = record_url + "/files/" + constants::ARCHIVE_FILE_NAME + "?download=1";
        std::string zip_url = record_url + "/files/" + constants::ARCHIVE_LEGACY_FILE_NAME + "?download=1";

        // Legacy records hold archive.zip
        auto response = transport_->execute_with_retry(net::HttpRequest::head(tar_url));
        HttpDownloadLink link;
        link.url = response.ok() ? tar_url : zip_url;
        link.exp = constants::NEVER_EXPIRES;
        link.method = "GET";
        return {link};
    }

private:
    static std::string describe(const net::HttpResponse& response) {
        if (!response.error.empty()) return response.error;
        std::string text = "HTTP " + std::to_string(response.status_code);
        auto body = response.body_string();
        if (!body.empty()) text += ": " + body.substr(0, 512);
        return text;
    }

    void authorize(net::HttpRequest& request) const {
        if (!config_.access_token.empty()) {
            request.headers.set_bearer_token(config_.access_token);
        }
    }

    // JSON API call under {base_url}/api/. Returns null for 204.
    json api(net::HttpMethod method, const std::string& path, const json* body = nullptr) {
        net::HttpRequest request;
        request.method = method;
        request.url = config_.base_url + "/api/" + path;
        request.headers.set("Accept", "application/json");
        if (body) {
            request.set_json_body(body->dump());
        }
        authorize(request);

        auto response = transport_->execute_with_retry(request);
        if (!response.ok()) {
            log_error("%s %s: %s", net::http_method_to_string(method), path.c_str(),
                      describe(response).c_str());
            throw RemoteError(std::string(net::http_method_to_string(method)) + " " + path +
                              " failed: " + describe(response), response.status_code);
        }
        if (response.status_code == 204 || response.body.empty()) {
            return nullptr;
        }
        try {
            return json::parse(response.body_string());
        } catch (const json::exception& e) {
            throw RemoteError("malformed response from " + path + ": " + e.what(),
                              response.status_code);
        }
    }

    void adopt_draft(const json& deposition) {
        deposition_id_ = id_string(deposition.value("id", json()));
        if (deposition.contains("links") && deposition["links"].is_object()) {
            bucket_url_ = deposition["links"].value("bucket", "");
        }
        if (deposition_id_.empty()) {
            throw RemoteError("malformed deposition: no id", 0);
        }
    }

    void create_deposition() {
        auto payload = metadata_.to_payload();
        auto deposition = api(net::HttpMethod::POST, "deposit/depositions", &payload);
        adopt_draft(deposition);

        std::string doi;
        try {
            doi = deposition.at("metadata").at("prereserve_doi").at("doi").get<std::string>();
        } catch (const json::exception&) {
            throw RemoteError("deposition " + deposition_id_ + " has no pre-reserved DOI", 0);
        }
        core_.set_content_id(doi);
        log_info("Created deposition %s (%s)", deposition_id_.c_str(), doi.c_str());
    }

    void new_version(const std::string& doi) {
        auto record = archive_record_id(doi);

        auto lookup = api(net::HttpMethod::GET, "records/" + record);
        std::string latest_url;
        if (lookup.contains("links") && lookup["links"].is_object()) {
            latest_url = lookup["links"].value("latest", "");
        }
        if (latest_url.empty()) {
            throw RemoteError("could not discover latest version of " + doi, 0);
        }
        auto latest = last_path_component(latest_url);

        auto versioned = api(net::HttpMethod::POST,
                             "deposit/depositions/" + latest + "/actions/newversion");
        std::string draft_url;
        if (versioned.contains("links") && versioned["links"].is_object()) {
            draft_url = versioned["links"].value("latest_draft", "");
        }
        if (draft_url.empty()) {
            throw RemoteError("no draft created for record " + latest, 0);
        }
        auto draft = last_path_component(draft_url);

        auto payload = metadata_.to_payload();
        auto updated = api(net::HttpMethod::PUT, "deposit/depositions/" + draft, &payload);
        adopt_draft(updated);

        // Files carried over from the previous version cannot be replaced in place
        if (updated.contains("files") && updated["files"].is_array()) {
            for (const auto& file : updated["files"]) {
                auto file_id = id_string(file.value("id", json()));
                api(net::HttpMethod::DELETE,
                    "deposit/depositions/" + deposition_id_ + "/files/" + file_id);
                log_debug("Deleted file %s from draft %s", file_id.c_str(), deposition_id_.c_str());
            }
        }

        if (bucket_url_.empty()) {
            auto fetched = api(net::HttpMethod::GET, "deposit/depositions/" + deposition_id_);
            adopt_draft(fetched);
        }
        log_info("Started new version draft %s of %s", deposition_id_.c_str(), doi.c_str());
    }

    void start_upload() {
        if (bucket_url_.empty()) {
            throw RemoteError("deposition " + deposition_id_ + " has no file bucket", 0);
        }
        channel_ = std::make_unique<ByteChannel>(config_.pipe_capacity_bytes);

        net::HttpRequest request;
        request.method = net::HttpMethod::PUT;
        request.url = bucket_url_ + "/" + constants::ARCHIVE_FILE_NAME;
        request.headers.set_content_type("application/octet-stream");
        authorize(request);
        ByteChannel* channel = channel_.get();
        request.body_reader = [channel](char* buffer, size_t max) {
            return channel->read(buffer, max);
        };

        auto transport = transport_;
        upload_ = std::async(std::launch::async, [transport, channel, request]() {
            auto response = transport->execute(request);
            if (!response.ok()) {
                std::string detail = describe(response);
                channel->abort(detail);
                throw RemoteError("archive file upload failed: " + detail, response.status_code);
            }
            // Nothing more will be read
            channel->abort("upload finished");
        });
    }

    void stop_upload(const std::string& reason) {
        if (!upload_.valid()) {
            return;
        }
        channel_->abort(reason);
        try {
            upload_.get();
        } catch (const std::exception& e) {
            log_debug("Archive upload stopped: %s", e.what());
        }
    }

    void load_file() {
        auto record = archive_record_id(core_.require_content_id());
        auto files = api(net::HttpMethod::GET, "deposit/depositions/" + record + "/files");
        if (!files.is_array() || files.empty()) {
            file_loaded_ = true;
            file_size_ = 0;
            return;
        }

        const json* chosen = &files[0];
        for (const auto& name : {constants::ARCHIVE_FILE_NAME, constants::ARCHIVE_LEGACY_FILE_NAME}) {
            auto it = std::find_if(files.begin(), files.end(), [name](const json& f) {
                return f.value("filename", "") == name;
            });
            if (it != files.end()) {
                chosen = &*it;
                break;
            }
        }

        file_size_ = chosen->value("filesize", uint64_t{0});
        if (chosen->contains("links") && (*chosen)["links"].is_object()) {
            download_url_ = (*chosen)["links"].value("download", "");
        }
        if (download_url_.empty()) {
            throw RemoteError("no download link for " + *core_.content_id(), 0);
        }
        read_offset_ = 0;
        file_loaded_ = true;
    }

    BackendCore core_;
    ArchiveConfig config_;
    std::shared_ptr<net::HttpTransport> transport_;
    AccessMode mode_;
    DepositionMetadata metadata_;

    std::string deposition_id_;  // Draft being written
    std::string bucket_url_;

    std::unique_ptr<ByteChannel> channel_;
    std::future<void> upload_;

    bool file_loaded_ = false;
    uint64_t file_size_ = 0;
    uint64_t read_offset_ = 0;
    std::string download_url_;
};

}  // namespace

std::unique_ptr<StorageBackend> create_archive_backend(
    const ArchiveConfig& config,
    std::shared_ptr<net::HttpTransport> transport,
    std::optional<std::string> content_id,
    const std::string& content_type,
    AccessMode mode,
    const DepositionMetadata& metadata) {
    return std::make_unique<ArchiveBackend>(config, std::move(transport),
                                            std::move(content_id), content_type, mode, metadata);
}

}  // namespace trovi
