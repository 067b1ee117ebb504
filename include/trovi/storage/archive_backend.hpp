#pragma once

#include "trovi/core/constants.hpp"
#include "trovi/net/http.hpp"
#include "trovi/storage/backend.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trovi {

// Zenodo connection settings
struct ArchiveConfig {
    std::string base_url = constants::DEFAULT_ARCHIVE_URL;
    std::string access_token;
    size_t pipe_capacity_bytes = constants::DEFAULT_PIPE_CAPACITY_BYTES;

    std::string validate() const;
};

struct DepositionCreator {
    std::string name;
    std::string affiliation;
};

/// Descriptive metadata attached to each published deposition version
struct DepositionMetadata {
    std::string title;
    std::string description;
    std::vector<DepositionCreator> creators;
    std::string upload_type = "publication";
    std::string publication_type = "workingpaper";
    std::string publication_date;  // YYYY-MM-DD, empty = today (UTC)
    std::vector<std::string> communities;
    std::vector<std::string> keywords;

    // {"metadata": {...}} as the deposition API expects it
    nlohmann::json to_payload() const;
};

/// True for DOIs minted by the archive: 10.<n>/zenodo.<n>
bool is_archive_doi(const std::string& doi);

/// Record id of an archive DOI (the digits after the last '.').
/// Throws ContentNotFound for anything is_archive_doi rejects.
std::string archive_record_id(const std::string& doi);

/// DOI-minting archive backend (Zenodo).
///
/// Opening without a content id starts a new deposition; opening with a DOI
/// starts a new version of it. Writes stream into an upload task through an
/// in-process pipe; close() joins the task, publishes and adopts the minted
/// DOI as the content id. Backends opened ReadOnly never create drafts.
std::unique_ptr<StorageBackend> create_archive_backend(
    const ArchiveConfig& config,
    std::shared_ptr<net::HttpTransport> transport,
    std::optional<std::string> content_id,
    const std::string& content_type,
    AccessMode mode = AccessMode::ReadWrite,
    const DepositionMetadata& metadata = {});

}  // namespace trovi
