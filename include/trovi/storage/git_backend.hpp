#pragma once

#include "trovi/core/constants.hpp"
#include "trovi/storage/backend.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace trovi {

// remote@ref split of a git content id
struct GitLocation {
    std::string remote;
    std::string ref = "HEAD";

    // The '@' separating the ref is searched for after the host part, so
    // scp-style remotes such as git@github.com:org/repo parse correctly.
    static GitLocation parse(const std::string& content_id);
};

/// Zip download URL for recognized http(s) hosts (github.com, gitlab.com),
/// empty otherwise
std::string git_archive_url(const GitLocation& location);

/// Read-only backend for content that lives in a git repository. It never
/// moves bytes; get_links() points clients at the remote.
std::unique_ptr<StorageBackend> create_git_backend(
    const std::string& content_id,
    const std::string& content_type,
    int64_t link_lifespan_seconds = constants::DEFAULT_LINK_LIFESPAN_SECONDS);

}  // namespace trovi
