#pragma once

#include <cstddef>
#include <cstdint>

namespace trovi::constants {

// Content URNs: urn:trovi:contents:<backend>:<content-id>
constexpr const char* CONTENT_URN_PREFIX = "urn:trovi:contents:";

// Backend names
constexpr const char* BACKEND_OBJECT_STORE = "objectstore";
constexpr const char* BACKEND_GIT = "git";
constexpr const char* BACKEND_ARCHIVE = "archive";

// Upload / transfer defaults
constexpr size_t DEFAULT_MAX_CHUNK_BYTES = 2621440;                    // 2.5MB
constexpr size_t DEFAULT_PIPE_CAPACITY_BYTES = 16 * 1024 * 1024;       // 16MB
constexpr uint64_t MAX_SEGMENTS = UINT64_MAX;
constexpr int SEGMENT_NAME_WIDTH = 20;                                 // digits in UINT64_MAX
constexpr int MAX_CONTENT_ID_ATTEMPTS = 16;

// Link defaults
constexpr int64_t DEFAULT_LINK_LIFESPAN_SECONDS = 86400;               // 24 hours
constexpr int64_t NEVER_EXPIRES = 253402300799;                        // 9999-12-31T23:59:59Z

// Object store defaults
constexpr const char* DEFAULT_CONTAINER = "trovi";
constexpr const char* DEFAULT_SERVICE_INTERFACE = "public";
constexpr const char* DEFAULT_TEMP_URL_DIGEST = "sha1";
constexpr int DEFAULT_AUTH_RETRY_ATTEMPTS = 3;

// Archive defaults
constexpr const char* DEFAULT_ARCHIVE_URL = "https://zenodo.org";
constexpr const char* ARCHIVE_FILE_NAME = "archive.tar.gz";
constexpr const char* ARCHIVE_LEGACY_FILE_NAME = "archive.zip";
constexpr const char* ARCHIVE_CONTENT_TYPE = "application/tar+gz";

// HTTP request defaults
constexpr int DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS = 30;
constexpr int DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS = 300;
constexpr int DEFAULT_HTTP_MAX_RETRIES = 3;

// Migration messages
constexpr const char* MSG_SELECTED = "Selected for migration";
constexpr const char* MSG_EMPTY_SOURCE = "Source content is empty";
constexpr const char* MSG_READ_ERROR = "Error reading from source";
constexpr const char* MSG_WRITE_ERROR = "Error writing to destination";
constexpr const char* MSG_FINALIZING = "Finalizing migration";
constexpr const char* MSG_UNKNOWN_ERROR = "Unknown error occurred";
constexpr const char* MSG_INTERRUPTED = "Migration was interrupted by an internal server error";

}  // namespace trovi::constants
