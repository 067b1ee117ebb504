#include "trovi/storage/factory.hpp"
#include "trovi/storage/git_backend.hpp"
#include "trovi/core/errors.hpp"

namespace trovi {

BackendFactory::BackendFactory(const StorageSettings& settings,
                               std::shared_ptr<net::HttpTransport> transport) {
    int64_t lifespan = settings.link_lifespan_seconds;

    register_backend(constants::BACKEND_GIT, [lifespan](const BackendRequest& request) {
        if (!request.content_id || request.content_id->empty()) {
            throw ContentNotFound("git content needs a remote@ref content id");
        }
        return create_git_backend(*request.content_id, request.content_type, lifespan);
    });

    if (settings.object_store) {
        auto config = *settings.object_store;
        config.link_lifespan_seconds = lifespan;
        register_backend(constants::BACKEND_OBJECT_STORE,
                         [config, transport](const BackendRequest& request) {
            return create_object_store(config, transport, request.content_id,
                                       request.content_type, request.mode);
        });
    }

    if (settings.archive) {
        auto config = *settings.archive;
        register_backend(constants::BACKEND_ARCHIVE,
                         [config, transport](const BackendRequest& request) {
            return create_archive_backend(config, transport, request.content_id,
                                          request.content_type, request.mode,
                                          request.metadata.value_or(DepositionMetadata{}));
        });
    }
}

void BackendFactory::register_backend(const std::string& name, Creator creator) {
    creators_[name] = std::move(creator);
}

bool BackendFactory::has_backend(const std::string& name) const {
    return creators_.count(name) > 0;
}

std::vector<std::string> BackendFactory::backend_names() const {
    std::vector<std::string> names;
    for (const auto& [name, creator] : creators_) {
        names.push_back(name);
    }
    return names;
}

std::unique_ptr<StorageBackend> BackendFactory::create(const BackendRequest& request) const {
    auto it = creators_.find(request.name);
    if (it == creators_.end()) {
        throw UnknownBackend("Unknown storage backend: " + request.name);
    }
    return it->second(request);
}

std::unique_ptr<StorageBackend> BackendFactory::create_for_urn(const std::string& urn,
                                                               AccessMode mode) const {
    auto parsed = ContentUrn::parse(urn);
    BackendRequest request;
    request.name = parsed.backend;
    request.content_id = parsed.content_id;
    request.mode = mode;
    return create(request);
}

}  // namespace trovi
