#include "trovi/net/http.hpp"
#include "trovi/core/log.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

namespace trovi::net {

// ============================================================================
// Utility functions
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_retryable_status(int status) {
    // Retry on server errors and rate limiting
    return status == 429 || status == 502 || status == 503 || status == 504;
}

std::string url_encode(const std::string& str) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

std::string url_encode_path(const std::string& path) {
    std::string out;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        out += url_encode(path.substr(start, slash - start));
        if (slash < path.size()) out += '/';
        start = slash + 1;
    }
    return out;
}

std::optional<std::pair<std::string, std::string>> split_origin(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;
    auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        return std::make_pair(url, std::string("/"));
    }
    return std::make_pair(url.substr(0, path_start), url.substr(path_start));
}

// ============================================================================
// HttpHeaders
// ============================================================================

HttpHeaders::HttpHeaders(std::initializer_list<std::pair<std::string, std::string>> init) {
    for (const auto& [name, value] : init) {
        set(name, value);
    }
}

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(normalize_name(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it == headers_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.front();
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.count(normalize_name(name)) > 0;
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

void HttpHeaders::set_bearer_token(const std::string& token) {
    set("Authorization", "Bearer " + token);
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("Content-Type");
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto value = get("Content-Length");
    if (!value) return std::nullopt;
    try {
        return std::stoull(*value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = url;
    return request;
}

HttpRequest HttpRequest::head(const std::string& url) {
    HttpRequest request;
    request.method = HttpMethod::HEAD;
    request.url = url;
    return request;
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = url;
    request.body.assign(body.begin(), body.end());
    return request;
}

HttpRequest HttpRequest::put(const std::string& url, const std::vector<uint8_t>& body) {
    HttpRequest request;
    request.method = HttpMethod::PUT;
    request.url = url;
    request.body = body;
    return request;
}

HttpRequest HttpRequest::del(const std::string& url) {
    HttpRequest request;
    request.method = HttpMethod::DELETE;
    request.url = url;
    return request;
}

void HttpRequest::set_json_body(const std::string& json) {
    body.assign(json.begin(), json.end());
    headers.set_content_type("application/json");
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// HttpTransport
// ============================================================================

HttpResponse HttpTransport::execute_with_retry(const HttpRequest& request) {
    int retries = 0;
    auto delay = request.initial_retry_delay;

    while (true) {
        HttpResponse response = execute(request);

        if (!response.is_network_error && !is_retryable_status(response.status_code)) {
            return response;
        }
        if (request.body_reader || retries >= request.max_retries) {
            return response;
        }

        log_debug("%s %s failed (%s), retrying in %lld ms",
                  http_method_to_string(request.method), request.url.c_str(),
                  response.error.empty() ? std::to_string(response.status_code).c_str()
                                         : response.error.c_str(),
                  static_cast<long long>(delay.count()));
        std::this_thread::sleep_for(delay);

        // Exponential backoff
        delay = std::chrono::milliseconds(
            static_cast<long>(delay.count() * request.retry_backoff_multiplier));
        retries++;
    }
}

// ============================================================================
// curl callbacks
// ============================================================================

namespace {

// Context for bounded response accumulation
struct WriteCallbackContext {
    std::vector<uint8_t>* response;
    size_t max_size;
    size_t current_size;
    bool size_exceeded;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    if (ctx->max_size > 0 && ctx->current_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // Abort transfer
    }

    ctx->response->insert(ctx->response->end(), ptr, ptr + bytes);
    ctx->current_size += bytes;
    return bytes;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);

    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    if (line.empty() || line.starts_with("HTTP/")) {
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        size_t start = value.find_first_not_of(" \t");
        value = (start == std::string::npos) ? std::string() : value.substr(start);

        headers->add(name, value);
    }

    return bytes;
}

struct BufferReadData {
    const uint8_t* data;
    size_t size;
    size_t pos;
};

size_t buffer_read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* rd = static_cast<BufferReadData*>(userdata);
    size_t max_bytes = size * nitems;
    size_t remaining = rd->size - rd->pos;
    size_t to_copy = std::min(max_bytes, remaining);

    if (to_copy > 0) {
        std::memcpy(buffer, rd->data + rd->pos, to_copy);
        rd->pos += to_copy;
    }

    return to_copy;
}

struct StreamReadData {
    const HttpBodyReader* reader;
    std::string error;
};

size_t stream_read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* rd = static_cast<StreamReadData*>(userdata);
    try {
        return (*rd->reader)(buffer, size * nitems);
    } catch (const std::exception& e) {
        // Exceptions must not cross the C boundary
        rd->error = e.what();
        return CURL_READFUNC_ABORT;
    }
}

}  // namespace

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "Failed to initialize curl handle";
            response.is_network_error = true;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
        }

        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }

        BufferReadData buffer_data{request.body.data(), request.body.size(), 0};
        StreamReadData stream_data{&request.body_reader, {}};

        if (request.body_reader) {
            // Unknown length: chunked transfer encoding
            headers_list = curl_slist_append(headers_list, "Transfer-Encoding: chunked");
            if (request.method != HttpMethod::PUT) {
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
            }
            curl_easy_setopt(curl, CURLOPT_UPLOAD, request.method == HttpMethod::PUT ? 1L : 0L);
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, stream_read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &stream_data);
        } else if (!request.body.empty()) {
            if (request.method == HttpMethod::PUT) {
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, buffer_read_callback);
                curl_easy_setopt(curl, CURLOPT_READDATA, &buffer_data);
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
            } else {
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
            }
        } else if (request.method == HttpMethod::PUT) {
            // Empty-body PUT (object store manifests) still needs Content-Length: 0
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(0));
        } else if (request.method == HttpMethod::POST) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, 0L);
        }

        if (headers_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);
        }
        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        std::vector<uint8_t> response_body;
        WriteCallbackContext write_ctx{&response_body, config_.max_response_size, 0, false};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(std::min(request.connect_timeout,
                                                    config_.default_connect_timeout).count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(std::min(request.total_timeout,
                                                    config_.default_total_timeout).count()));

        if (config_.verify_ssl) {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        } else {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
        }
        if (!config_.ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle.c_str());
        }

        std::string range;
        if (request.byte_range) {
            range = std::to_string(request.byte_range->first) + "-" +
                    std::to_string(request.byte_range->second);
            curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
        }

        if (!config_.proxy_url.empty()) {
            curl_easy_setopt(curl, CURLOPT_PROXY, config_.proxy_url.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }

        auto start_time = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl);
        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (res == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
            response.body = std::move(response_body);
        } else if (res == CURLE_WRITE_ERROR && write_ctx.size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.status_code = 413;
        } else if (res == CURLE_ABORTED_BY_CALLBACK && !stream_data.error.empty()) {
            response.error = "Request body stream failed: " + stream_data.error;
            response.is_network_error = false;
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
        }

        if (headers_list) {
            curl_slist_free_all(headers_list);
        }
        release_handle(curl);

        return response;
    }

    const HttpClientConfig& config() const { return config_; }

private:
    CURL* acquire_handle() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (!idle_handles_.empty()) {
            CURL* handle = idle_handles_.back();
            idle_handles_.pop_back();
            return handle;
        }
        return curl_easy_init();
    }

    void release_handle(CURL* handle) {
        curl_easy_reset(handle);
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (idle_handles_.size() < kMaxIdleHandles) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    static constexpr size_t kMaxIdleHandles = 8;

    HttpClientConfig config_;
    std::mutex pool_mutex_;
    std::vector<CURL*> idle_handles_;
};

// ============================================================================
// HttpClient public interface
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

}  // namespace trovi::net
