#include "trovi/migration/migration_record.hpp"

namespace trovi {

const char* migration_status_name(MigrationStatus status) {
    switch (status) {
        case MigrationStatus::Queued: return "QUEUED";
        case MigrationStatus::InProgress: return "IN_PROGRESS";
        case MigrationStatus::Success: return "SUCCESS";
        case MigrationStatus::Error: return "ERROR";
    }
    return "QUEUED";
}

std::optional<MigrationStatus> parse_migration_status(const std::string& name) {
    if (name == "QUEUED") return MigrationStatus::Queued;
    if (name == "IN_PROGRESS") return MigrationStatus::InProgress;
    if (name == "SUCCESS") return MigrationStatus::Success;
    if (name == "ERROR") return MigrationStatus::Error;
    return std::nullopt;
}

namespace {

template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

void to_json(nlohmann::json& j, const MigrationRecord& record) {
    j = nlohmann::json{
        {"id", record.id},
        {"artifact_uuid", record.artifact_uuid},
        {"version_slug", record.version_slug},
        {"source_urn", record.source_urn},
        {"backend", record.backend},
        {"destination_urn", optional_json(record.destination_urn)},
        {"status", migration_status_name(record.status)},
        {"message", record.message},
        {"message_ratio", record.message_ratio},
        {"created_at", record.created_at},
        {"started_at", optional_json(record.started_at)},
        {"finished_at", optional_json(record.finished_at)},
    };
}

}  // namespace trovi
