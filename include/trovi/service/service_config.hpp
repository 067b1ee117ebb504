#pragma once

#include "trovi/storage/factory.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace trovi {

/// Settings block for one remote backend ("objectstore" or "archive").
struct BackendConfig {
    std::string type;
    std::map<std::string, std::string> params;

    bool empty() const { return params.empty(); }

    /// Rejects unknown keys and malformed numbers.
    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Configuration for the trovi-storage tool.
struct ServiceConfig {
    // Subcommand and its positional arguments
    std::string command;
    std::vector<std::string> args;

    // Remote backends. Unconfigured ones are not offered by the factory.
    BackendConfig objectstore{constants::BACKEND_OBJECT_STORE, {}};
    BackendConfig archive{constants::BACKEND_ARCHIVE, {}};

    // Transfer
    size_t max_chunk_bytes = constants::DEFAULT_MAX_CHUNK_BYTES;
    int64_t link_lifespan_seconds = constants::DEFAULT_LINK_LIFESPAN_SECONDS;

    // HTTP
    bool verify_ssl = true;
    std::string ca_bundle;

    // State
    std::filesystem::path state_dir;  // Default: ./.trovi
    std::filesystem::path db_path;    // Default: <state_dir>/migrations.db

    // Command options
    std::string backend;       // upload / migrate destination
    std::optional<std::string> content_id;
    std::string content_type = constants::ARCHIVE_CONTENT_TYPE;
    bool wait = false;         // migrate: run the migration before returning

    // Deposition metadata for archive destinations
    DepositionMetadata deposition;

    // Daemon
    bool verbose = false;
    std::filesystem::path pid_file;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<ServiceConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in state paths and environment fallbacks
    /// (OS_PASSWORD, SWIFT_TEMP_URL_KEY, ZENODO_ACCESS_TOKEN).
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    /// Backend settings for BackendFactory
    StorageSettings storage_settings() const;

    net::HttpClientConfig http_settings() const;
};

}  // namespace trovi
