#pragma once

#include "trovi/core/constants.hpp"
#include "trovi/net/http.hpp"
#include "trovi/storage/backend.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace trovi {

/// OpenStack Swift connection settings.
///
/// Either Keystone v3 password credentials (auth_url and friends) or a
/// pre-issued storage_url + auth_token pair must be set. The storage URL is the
/// account endpoint, e.g. https://swift.example.org/v1/AUTH_abc.
struct ObjectStoreConfig {
    // Keystone v3 password auth
    std::string auth_url;
    std::string username;
    std::string user_domain_name = "Default";
    std::string password;
    std::string project_name;
    std::string project_domain_name = "Default";
    std::string region;                                   // Empty = first match
    std::string interface = constants::DEFAULT_SERVICE_INTERFACE;
    int auth_retry_attempts = constants::DEFAULT_AUTH_RETRY_ATTEMPTS;

    // Direct access, skips Keystone
    std::string storage_url;
    std::string auth_token;

    std::string container = constants::DEFAULT_CONTAINER;

    // Temp URL signing. No http link is produced without a key.
    std::string temp_url_key;
    std::string temp_url_digest = constants::DEFAULT_TEMP_URL_DIGEST;  // sha1 or sha256
    int64_t link_lifespan_seconds = constants::DEFAULT_LINK_LIFESPAN_SECONDS;

    bool uses_keystone() const { return storage_url.empty(); }

    // Returns an error message, empty if the config is usable
    std::string validate() const;
};

/// Segmented large-object backend.
///
/// Writes become numbered segments under <container>/<id>/; close() uploads
/// the manifest that seals the object. Seek and tell work on the segment index.
std::unique_ptr<StorageBackend> create_object_store(
    const ObjectStoreConfig& config,
    std::shared_ptr<net::HttpTransport> transport,
    std::optional<std::string> content_id,
    const std::string& content_type,
    AccessMode mode = AccessMode::ReadWrite);

// Zero-padded segment object name: 00000000000000000042
std::string segment_name(uint64_t index);

}  // namespace trovi
