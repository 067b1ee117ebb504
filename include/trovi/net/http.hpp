#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace trovi::net {

// HTTP methods
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);
bool is_retryable_status(int status);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    HttpHeaders() = default;
    HttpHeaders(std::initializer_list<std::pair<std::string, std::string>> init);

    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;
    bool empty() const { return headers_.empty(); }

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);
    void set_bearer_token(const std::string& token);

    std::optional<std::string> content_type() const;
    std::optional<uint64_t> content_length() const;

private:
    // Headers stored as lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

// Pull-style request body: fill up to max bytes, return the count, 0 at end of
// stream. May block. An exception aborts the transfer.
using HttpBodyReader = std::function<size_t(char* buffer, size_t max)>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Streaming body of unknown length, sent with chunked transfer encoding.
    // Takes precedence over body when set.
    HttpBodyReader body_reader;

    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds total_timeout{300000};

    // Retry options (handled by execute_with_retry)
    int max_retries = 3;
    std::chrono::milliseconds initial_retry_delay{1000};
    double retry_backoff_multiplier = 2.0;

    // Inclusive byte range for partial reads
    std::optional<std::pair<uint64_t, uint64_t>> byte_range;

    static HttpRequest get(const std::string& url);
    static HttpRequest head(const std::string& url);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest put(const std::string& url, const std::vector<uint8_t>& body);
    static HttpRequest del(const std::string& url);

    void set_json_body(const std::string& json);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds total_time{0};

    bool ok() const { return error.empty() && is_success_status(status_code); }
    std::string body_string() const;

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if error was network-level, not HTTP status
};

// Anything that can carry an HttpRequest to a server. HttpClient is the real
// one; tests plug in in-memory fakes of the remote services.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse execute(const HttpRequest& request) = 0;

    // Retries network errors and retryable statuses with exponential backoff.
    // Requests with a streaming body are never retried (the stream is consumed).
    HttpResponse execute_with_retry(const HttpRequest& request);
};

struct HttpClientConfig {
    std::chrono::milliseconds default_connect_timeout{30000};
    std::chrono::milliseconds default_total_timeout{300000};

    // Response size limit (0 = unlimited)
    size_t max_response_size = 64 * 1024 * 1024;

    bool verify_ssl = true;
    std::string ca_bundle;  // Empty = system default

    std::string user_agent = "trovi-storage/1.0";

    std::string proxy_url;  // Empty = no proxy

    bool verbose = false;
};

// libcurl client with a small pool of reusable easy handles
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request) override;

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Percent-encoding (RFC 3986 unreserved characters pass through)
std::string url_encode(const std::string& str);

// Encode every path segment but keep the '/' separators
std::string url_encode_path(const std::string& path);

// Split "scheme://host[:port]/path?query" into origin ("scheme://host[:port]")
// and the remainder starting at the path. Returns nullopt if there is no scheme.
std::optional<std::pair<std::string, std::string>> split_origin(const std::string& url);

}  // namespace trovi::net
