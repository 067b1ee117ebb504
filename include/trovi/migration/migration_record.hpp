#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace trovi {

enum class MigrationStatus {
    Queued,
    InProgress,
    Success,
    Error
};

// QUEUED, IN_PROGRESS, SUCCESS, ERROR
const char* migration_status_name(MigrationStatus status);
std::optional<MigrationStatus> parse_migration_status(const std::string& name);

inline bool is_terminal(MigrationStatus status) {
    return status == MigrationStatus::Success || status == MigrationStatus::Error;
}

/// Persisted state of one content transfer of an artifact version.
/// Timestamps are Unix seconds.
struct MigrationRecord {
    int64_t id = 0;
    std::string artifact_uuid;
    std::string version_slug;

    std::string source_urn;
    std::string backend;                         // Destination backend name
    std::optional<std::string> destination_urn;  // Set iff status is Success

    MigrationStatus status = MigrationStatus::Queued;
    std::string message;
    double message_ratio = 0.0;                  // Progress in [0, 1]

    int64_t created_at = 0;
    std::optional<int64_t> started_at;
    std::optional<int64_t> finished_at;
};

/// Partial update of a record. Unset fields are left alone.
struct MigrationUpdate {
    std::optional<MigrationStatus> status;
    std::optional<std::string> message;
    std::optional<double> message_ratio;
    std::optional<std::string> destination_urn;
    std::optional<int64_t> started_at;
    std::optional<int64_t> finished_at;
};

// Status as its name, unset optionals as null
void to_json(nlohmann::json& j, const MigrationRecord& record);

}  // namespace trovi
