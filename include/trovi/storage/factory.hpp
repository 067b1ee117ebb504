#pragma once

#include "trovi/core/constants.hpp"
#include "trovi/net/http.hpp"
#include "trovi/storage/archive_backend.hpp"
#include "trovi/storage/backend.hpp"
#include "trovi/storage/object_store.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trovi {

// What a caller wants a backend for
struct BackendRequest {
    std::string name;
    std::optional<std::string> content_id;
    std::string content_type = constants::ARCHIVE_CONTENT_TYPE;
    AccessMode mode = AccessMode::ReadWrite;
    std::optional<DepositionMetadata> metadata;  // archive only
};

// Remote backends that are not configured are not offered
struct StorageSettings {
    std::optional<ObjectStoreConfig> object_store;
    std::optional<ArchiveConfig> archive;
    int64_t link_lifespan_seconds = constants::DEFAULT_LINK_LIFESPAN_SECONDS;
};

/// Resolves backend names to StorageBackend instances.
class BackendFactory {
public:
    using Creator = std::function<std::unique_ptr<StorageBackend>(const BackendRequest&)>;

    // Registers git plus every configured remote backend. All remote
    // backends share transport.
    BackendFactory(const StorageSettings& settings,
                   std::shared_ptr<net::HttpTransport> transport);

    // Adds or replaces the creator for name
    void register_backend(const std::string& name, Creator creator);

    bool has_backend(const std::string& name) const;
    std::vector<std::string> backend_names() const;

    // Throws UnknownBackend for names with no creator
    std::unique_ptr<StorageBackend> create(const BackendRequest& request) const;

    // Backend for existing content named by a content URN
    std::unique_ptr<StorageBackend> create_for_urn(const std::string& urn,
                                                   AccessMode mode = AccessMode::ReadOnly) const;

private:
    std::map<std::string, Creator> creators_;
};

}  // namespace trovi
