#include "trovi/service/service_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <set>

namespace trovi {

namespace {

const std::set<std::string>& known_params(const std::string& type) {
    static const std::set<std::string> objectstore_keys = {
        "auth_url", "username", "user_domain_name", "password", "project_name",
        "project_domain_name", "region", "interface", "auth_retry_attempts",
        "storage_url", "auth_token", "container", "temp_url_key", "temp_url_digest",
    };
    static const std::set<std::string> archive_keys = {
        "base_url", "access_token", "pipe_capacity_bytes",
    };
    static const std::set<std::string> none;
    if (type == constants::BACKEND_OBJECT_STORE) return objectstore_keys;
    if (type == constants::BACKEND_ARCHIVE) return archive_keys;
    return none;
}

bool is_number(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::string param(const BackendConfig& bc, const std::string& key, const std::string& fallback = "") {
    auto it = bc.params.find(key);
    return it == bc.params.end() || it->second.empty() ? fallback : it->second;
}

// Fill a missing param from the environment
void param_from_env(BackendConfig& bc, const std::string& key, const char* env) {
    if (!param(bc, key).empty()) return;
    if (const char* v = std::getenv(env)) {
        if (*v) bc.params[key] = v;
    }
}

// Parse a --objectstore-X or --archive-X flag. "--objectstore-auth-url" sets
// params["auth_url"]. Returns false if the flag is not a backend flag.
bool parse_backend_flag(const std::string& arg, const char* value,
                        BackendConfig& objectstore, BackendConfig& archive) {
    BackendConfig* target = nullptr;
    std::string suffix;

    if (arg.starts_with("--objectstore-")) {
        target = &objectstore;
        suffix = arg.substr(14);
    } else if (arg.starts_with("--archive-")) {
        target = &archive;
        suffix = arg.substr(10);
    } else {
        return false;
    }

    std::replace(suffix.begin(), suffix.end(), '-', '_');
    if (known_params(target->type).count(suffix) == 0) {
        return false;
    }
    target->params[suffix] = value;
    return true;
}

void load_backend_block(const nlohmann::json& j, BackendConfig& target) {
    for (auto& [key, val] : j.items()) {
        if (val.is_string()) {
            target.params[key] = val.get<std::string>();
        } else {
            target.params[key] = val.dump();
        }
    }
}

void print_usage() {
    std::cerr <<
        "Usage: trovi-storage <command> [args] [options]\n"
        "\n"
        "Commands:\n"
        "  upload <file|->                  Store content, print its URN\n"
        "  links <urn>                      Print download links as JSON\n"
        "  size <urn>                       Print the stored size in bytes\n"
        "  migrate <artifact> <version> <source-urn>\n"
        "                                   Queue a migration to --backend\n"
        "  status <artifact> <version>      Print the latest migration record\n"
        "  worker                           Run queued migrations until signalled\n"
        "\n"
        "Command options:\n"
        "  --backend <name>                 objectstore, archive (upload/migrate)\n"
        "  --content-id <id>                Existing content to write a new version of\n"
        "  --content-type <type>            Content type (default: application/tar+gz)\n"
        "  --wait                           migrate: run the migration before exiting\n"
        "  --title <text>                   Deposition title (archive)\n"
        "  --description <text>             Deposition description (archive)\n"
        "  --creator <name[:affiliation]>   Deposition creator, repeatable (archive)\n"
        "  --keyword <word>                 Deposition keyword, repeatable (archive)\n"
        "  --community <id>                 Deposition community, repeatable (archive)\n"
        "\n"
        "Object store (--objectstore-*):\n"
        "  --objectstore-auth-url <url>     Keystone v3 URL\n"
        "  --objectstore-username <name>    Keystone user\n"
        "  --objectstore-password <pw>      Keystone password (or OS_PASSWORD env)\n"
        "  --objectstore-project-name <p>   Keystone project\n"
        "  --objectstore-region <region>    Catalog region\n"
        "  --objectstore-storage-url <url>  Pre-authenticated account URL (skips Keystone)\n"
        "  --objectstore-auth-token <tok>   Token for --objectstore-storage-url\n"
        "  --objectstore-container <name>   Container (default: trovi)\n"
        "  --objectstore-temp-url-key <k>   Temp URL key (or SWIFT_TEMP_URL_KEY env)\n"
        "  --objectstore-temp-url-digest <d> sha1 or sha256 (default: sha1)\n"
        "\n"
        "Archive (--archive-*):\n"
        "  --archive-base-url <url>         Archive URL (default: https://zenodo.org)\n"
        "  --archive-access-token <tok>     API token (or ZENODO_ACCESS_TOKEN env)\n"
        "\n"
        "General options:\n"
        "  --config <path>                  JSON config file\n"
        "  --state-dir <path>               State directory (default: ./.trovi)\n"
        "  --db <path>                      Migration database (default: <state-dir>/migrations.db)\n"
        "  --max-chunk-bytes <N>            Transfer chunk size (default: 2621440)\n"
        "  --link-lifespan <secs>           Temporary link lifetime (default: 86400)\n"
        "  --no-verify-ssl                  Skip SSL verification\n"
        "  --ca-bundle <path>               CA bundle for SSL\n"
        "  --verbose                        Verbose output\n"
        "  --pid-file <path>                PID file path (worker)\n"
        "  --log-file <path>                Log file path\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n";
}

}  // namespace

// --- BackendConfig ---

std::string BackendConfig::validate() const {
    const auto& keys = known_params(type);
    if (keys.empty()) return "unknown backend type: " + type;
    for (const auto& [key, value] : params) {
        if (keys.count(key) == 0) {
            return type + " backend has no setting '" + key + "'";
        }
    }
    for (const char* numeric : {"auth_retry_attempts", "pipe_capacity_bytes"}) {
        auto it = params.find(numeric);
        if (it != params.end() && !is_number(it->second)) {
            return type + " setting '" + std::string(numeric) + "' must be a number";
        }
    }
    return {};
}

// --- ServiceConfig ---

std::optional<ServiceConfig> ServiceConfig::from_args(int argc, char* argv[]) {
    ServiceConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg.starts_with("--objectstore-") || arg.starts_with("--archive-")) {
                auto* v = next_arg(i, arg.c_str());
                if (!v) return std::nullopt;
                if (!parse_backend_flag(arg, v, config.objectstore, config.archive)) {
                    std::cerr << "Error: unknown option: " << arg << "\n";
                    return std::nullopt;
                }
                continue;
            }

            if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--backend") {
                auto* v = next_arg(i, "--backend");
                if (!v) return std::nullopt;
                config.backend = v;
            } else if (arg == "--content-id") {
                auto* v = next_arg(i, "--content-id");
                if (!v) return std::nullopt;
                config.content_id = v;
            } else if (arg == "--content-type") {
                auto* v = next_arg(i, "--content-type");
                if (!v) return std::nullopt;
                config.content_type = v;
            } else if (arg == "--wait") {
                config.wait = true;
            } else if (arg == "--title") {
                auto* v = next_arg(i, "--title");
                if (!v) return std::nullopt;
                config.deposition.title = v;
            } else if (arg == "--description") {
                auto* v = next_arg(i, "--description");
                if (!v) return std::nullopt;
                config.deposition.description = v;
            } else if (arg == "--creator") {
                auto* v = next_arg(i, "--creator");
                if (!v) return std::nullopt;
                std::string creator = v;
                auto colon = creator.find(':');
                if (colon == std::string::npos) {
                    config.deposition.creators.push_back({creator, ""});
                } else {
                    config.deposition.creators.push_back(
                        {creator.substr(0, colon), creator.substr(colon + 1)});
                }
            } else if (arg == "--keyword") {
                auto* v = next_arg(i, "--keyword");
                if (!v) return std::nullopt;
                config.deposition.keywords.push_back(v);
            } else if (arg == "--community") {
                auto* v = next_arg(i, "--community");
                if (!v) return std::nullopt;
                config.deposition.communities.push_back(v);
            } else if (arg == "--state-dir") {
                auto* v = next_arg(i, "--state-dir");
                if (!v) return std::nullopt;
                config.state_dir = v;
            } else if (arg == "--db") {
                auto* v = next_arg(i, "--db");
                if (!v) return std::nullopt;
                config.db_path = v;
            } else if (arg == "--max-chunk-bytes") {
                auto* v = next_arg(i, "--max-chunk-bytes");
                if (!v) return std::nullopt;
                config.max_chunk_bytes = std::stoull(v);
            } else if (arg == "--link-lifespan") {
                auto* v = next_arg(i, "--link-lifespan");
                if (!v) return std::nullopt;
                config.link_lifespan_seconds = std::stoll(v);
            } else if (arg == "--no-verify-ssl") {
                config.verify_ssl = false;
            } else if (arg == "--ca-bundle") {
                auto* v = next_arg(i, "--ca-bundle");
                if (!v) return std::nullopt;
                config.ca_bundle = v;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--pid-file") {
                auto* v = next_arg(i, "--pid-file");
                if (!v) return std::nullopt;
                config.pid_file = v;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else if (arg.starts_with("--")) {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            } else if (config.command.empty()) {
                config.command = arg;
            } else {
                config.args.push_back(arg);
            }
        }
    } catch (const std::logic_error& e) {
        // std::stoull and friends
        std::cerr << "Error: invalid number: " << e.what() << "\n";
        return std::nullopt;
    }

    if (config.command.empty()) {
        print_usage();
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool ServiceConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("max_chunk_bytes")) max_chunk_bytes = j["max_chunk_bytes"].get<size_t>();
        if (j.contains("link_lifespan_seconds"))
            link_lifespan_seconds = j["link_lifespan_seconds"].get<int64_t>();
        if (j.contains("verify_ssl")) verify_ssl = j["verify_ssl"].get<bool>();
        if (j.contains("ca_bundle")) ca_bundle = j["ca_bundle"].get<std::string>();
        if (j.contains("state_dir")) state_dir = j["state_dir"].get<std::string>();
        if (j.contains("db_path")) db_path = j["db_path"].get<std::string>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("pid_file")) pid_file = j["pid_file"].get<std::string>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("objectstore") && j["objectstore"].is_object()) {
            load_backend_block(j["objectstore"], objectstore);
        }
        if (j.contains("archive") && j["archive"].is_object()) {
            load_backend_block(j["archive"], archive);
        }

        if (j.contains("deposition") && j["deposition"].is_object()) {
            auto& jd = j["deposition"];
            if (jd.contains("title")) deposition.title = jd["title"].get<std::string>();
            if (jd.contains("description")) deposition.description = jd["description"].get<std::string>();
            if (jd.contains("upload_type")) deposition.upload_type = jd["upload_type"].get<std::string>();
            if (jd.contains("publication_type"))
                deposition.publication_type = jd["publication_type"].get<std::string>();
            if (jd.contains("keywords")) deposition.keywords = jd["keywords"].get<std::vector<std::string>>();
            if (jd.contains("communities"))
                deposition.communities = jd["communities"].get<std::vector<std::string>>();
            if (jd.contains("creators")) {
                for (const auto& c : jd["creators"]) {
                    deposition.creators.push_back({c.value("name", ""), c.value("affiliation", "")});
                }
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void ServiceConfig::apply_defaults() {
    if (state_dir.empty()) {
        state_dir = ".trovi";
    }
    if (db_path.empty()) {
        db_path = state_dir / "migrations.db";
    }

    if (!objectstore.empty()) {
        param_from_env(objectstore, "password", "OS_PASSWORD");
        param_from_env(objectstore, "temp_url_key", "SWIFT_TEMP_URL_KEY");
    }
    // A token alone is enough to enable the archive with its default URL
    param_from_env(archive, "access_token", "ZENODO_ACCESS_TOKEN");
}

std::string ServiceConfig::validate() const {
    static const std::set<std::string> commands = {
        "upload", "links", "size", "migrate", "status", "worker",
    };
    if (commands.count(command) == 0) return "unknown command: " + command;

    if (!objectstore.empty()) {
        auto err = objectstore.validate();
        if (!err.empty()) return err;
    }
    if (!archive.empty()) {
        auto err = archive.validate();
        if (!err.empty()) return err;
    }

    auto settings = storage_settings();
    if (settings.object_store) {
        auto err = settings.object_store->validate();
        if (!err.empty()) return err;
    }
    if (settings.archive) {
        auto err = settings.archive->validate();
        if (!err.empty()) return err;
    }

    if (max_chunk_bytes == 0) return "max_chunk_bytes must be > 0";
    if (link_lifespan_seconds <= 0) return "link_lifespan_seconds must be > 0";

    if (command == "upload") {
        if (args.size() != 1) return "upload takes exactly one file argument";
        if (backend.empty()) return "upload requires --backend";
    } else if (command == "links" || command == "size") {
        if (args.size() != 1) return command + " takes exactly one content URN";
    } else if (command == "migrate") {
        if (args.size() != 3) return "migrate takes <artifact> <version> <source-urn>";
        if (backend.empty()) return "migrate requires --backend";
    } else if (command == "status") {
        if (args.size() != 2) return "status takes <artifact> <version>";
    } else if (command == "worker") {
        if (!args.empty()) return "worker takes no arguments";
    }
    return {};
}

StorageSettings ServiceConfig::storage_settings() const {
    StorageSettings settings;
    settings.link_lifespan_seconds = link_lifespan_seconds;

    if (!objectstore.empty()) {
        ObjectStoreConfig os;
        os.auth_url = param(objectstore, "auth_url");
        os.username = param(objectstore, "username");
        os.user_domain_name = param(objectstore, "user_domain_name", os.user_domain_name);
        os.password = param(objectstore, "password");
        os.project_name = param(objectstore, "project_name");
        os.project_domain_name = param(objectstore, "project_domain_name", os.project_domain_name);
        os.region = param(objectstore, "region");
        os.interface = param(objectstore, "interface", os.interface);
        os.storage_url = param(objectstore, "storage_url");
        os.auth_token = param(objectstore, "auth_token");
        os.container = param(objectstore, "container", os.container);
        os.temp_url_key = param(objectstore, "temp_url_key");
        os.temp_url_digest = param(objectstore, "temp_url_digest", os.temp_url_digest);
        auto retries = param(objectstore, "auth_retry_attempts");
        if (is_number(retries)) os.auth_retry_attempts = std::stoi(retries);
        os.link_lifespan_seconds = link_lifespan_seconds;
        settings.object_store = os;
    }

    if (!archive.empty()) {
        ArchiveConfig ar;
        ar.base_url = param(archive, "base_url", ar.base_url);
        ar.access_token = param(archive, "access_token");
        auto capacity = param(archive, "pipe_capacity_bytes");
        if (is_number(capacity)) ar.pipe_capacity_bytes = std::stoull(capacity);
        settings.archive = ar;
    }

    return settings;
}

net::HttpClientConfig ServiceConfig::http_settings() const {
    net::HttpClientConfig http;
    http.verify_ssl = verify_ssl;
    http.ca_bundle = ca_bundle;
    http.default_connect_timeout = std::chrono::seconds(constants::DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS);
    http.default_total_timeout = std::chrono::seconds(constants::DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS);
    http.verbose = false;
    return http;
}

}  // namespace trovi
