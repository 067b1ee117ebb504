// trovi-storage: artifact content storage and migration tool.
//
// Usage: trovi-storage <command> [args] [options]
//
// Commands:
//   upload <file|->                    Store content in a backend, print its URN
//   links <urn>                        Print download links as JSON
//   size <urn>                         Print stored content size
//   migrate <artifact> <version> <urn> Queue (or with --wait, run) a migration
//   status <artifact> <version>        Print the latest migration record
//   worker                             Run queued migrations until SIGINT/SIGTERM

#include "trovi/core/errors.hpp"
#include "trovi/core/log.hpp"
#include "trovi/migration/migration_engine.hpp"
#include "trovi/migration/migration_store.hpp"
#include "trovi/migration/recovery.hpp"
#include "trovi/migration/worker_lock.hpp"
#include "trovi/service/metrics.hpp"
#include "trovi/service/service_config.hpp"
#include "trovi/storage/download_link.hpp"
#include "trovi/storage/uploader.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <thread>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

// Seconds between scans for migrations queued by other processes
constexpr int QUEUE_POLL_SECONDS = 5;

// Interval at which `migrate --wait` polls a record run by a worker
constexpr int STATUS_POLL_MS = 500;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

void write_pid_file(const std::filesystem::path& path) {
    std::ofstream ofs(path);
    if (ofs) {
        ofs << getpid() << "\n";
    }
}

bool is_secret(const std::string& key) {
    return key.find("key") != std::string::npos || key.find("secret") != std::string::npos ||
           key.find("token") != std::string::npos || key.find("credential") != std::string::npos ||
           key.find("password") != std::string::npos;
}

void print_backend(const trovi::BackendConfig& backend) {
    for (auto& [k, v] : backend.params) {
        // Mask secrets in log output
        std::cout << "  " << backend.type << "-" << k << ": " << (is_secret(k) ? "****" : v) << std::endl;
    }
}

std::optional<trovi::DepositionMetadata> deposition_for(const trovi::ServiceConfig& config) {
    if (config.deposition.title.empty()) return std::nullopt;
    return config.deposition;
}

std::string worker_lock_path(const trovi::ServiceConfig& config) {
    return config.db_path.string() + ".lock";
}

void ensure_state_dir(const trovi::ServiceConfig& config) {
    std::error_code ec;
    auto parent = config.db_path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
}

int cmd_upload(const trovi::ServiceConfig& config, const trovi::BackendFactory& factory) {
    trovi::BackendRequest request;
    request.name = config.backend;
    request.content_id = config.content_id;
    request.content_type = config.content_type;
    request.mode = trovi::AccessMode::ReadWrite;
    if (config.backend == trovi::constants::BACKEND_ARCHIVE) {
        request.metadata = deposition_for(config);
    }

    std::string urn;
    const auto& file = config.args[0];
    if (file == "-") {
        urn = trovi::upload_stream(factory, request, std::cin, config.max_chunk_bytes);
    } else {
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            std::cerr << "Error: cannot open " << file << std::endl;
            return 1;
        }
        urn = trovi::upload_stream(factory, request, in, config.max_chunk_bytes);
    }
    std::cout << urn << std::endl;
    return 0;
}

int cmd_links(const trovi::ServiceConfig& config, const trovi::BackendFactory& factory) {
    trovi::ScopedBackend backend(factory.create_for_urn(config.args[0]));
    auto links = backend->get_links();
    backend.close();
    std::cout << trovi::links_to_json(links).dump(2) << std::endl;
    return 0;
}

int cmd_size(const trovi::ServiceConfig& config, const trovi::BackendFactory& factory) {
    trovi::ScopedBackend backend(factory.create_for_urn(config.args[0]));
    auto size = backend->size();
    backend.close();
    std::cout << size << std::endl;
    return 0;
}

int cmd_migrate(const trovi::ServiceConfig& config, const trovi::BackendFactory& factory) {
    ensure_state_dir(config);
    trovi::MigrationStore store(config.db_path.string());

    trovi::EngineConfig engine_config;
    engine_config.max_chunk_bytes = config.max_chunk_bytes;
    trovi::MigrationEngine engine(store, factory, engine_config);
    auto deposition = deposition_for(config);
    engine.set_metadata_provider([deposition](const trovi::MigrationRecord&) { return deposition; });

    if (!config.wait) {
        auto record = engine.submit(config.args[0], config.args[1], config.args[2], config.backend);
        std::cout << nlohmann::json(record).dump(2) << std::endl;
        return 0;
    }

    // Run the job here only when no worker owns the database
    trovi::WorkerLock worker_lock(worker_lock_path(config));
    bool local = worker_lock.try_lock();
    if (local) {
        engine.start();
    }
    auto record = engine.submit(config.args[0], config.args[1], config.args[2], config.backend);
    if (local) {
        engine.wait_idle();
        engine.stop();
        record = store.get(record.id).value_or(record);
    } else {
        trovi::log_info("A worker holds %s; waiting for it to run migration %lld",
                        worker_lock.path().c_str(), static_cast<long long>(record.id));
        while (!trovi::is_terminal(record.status)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(STATUS_POLL_MS));
            record = store.get(record.id).value_or(record);
        }
    }

    std::cout << nlohmann::json(record).dump(2) << std::endl;
    return record.status == trovi::MigrationStatus::Error ? 1 : 0;
}

int cmd_status(const trovi::ServiceConfig& config) {
    ensure_state_dir(config);
    trovi::MigrationStore store(config.db_path.string());
    auto record = store.latest_for_version(config.args[0], config.args[1]);
    if (!record) {
        std::cerr << "No migration for " << config.args[0] << "/" << config.args[1] << std::endl;
        return 1;
    }
    std::cout << nlohmann::json(*record).dump(2) << std::endl;
    return 0;
}

int cmd_worker(const trovi::ServiceConfig& config, const trovi::BackendFactory& factory) {
    std::cout << "trovi-storage worker starting..." << std::endl;
    std::cout << "  db: " << config.db_path.string() << std::endl;
    std::cout << "  max-chunk-bytes: " << config.max_chunk_bytes << std::endl;
    std::cout << "  link-lifespan: " << config.link_lifespan_seconds << "s" << std::endl;
    std::cout << "  backends:";
    for (const auto& name : factory.backend_names()) {
        std::cout << " " << name;
    }
    std::cout << std::endl;
    print_backend(config.objectstore);
    print_backend(config.archive);

    ensure_state_dir(config);
    if (!config.pid_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.pid_file).parent_path(), ec);
        write_pid_file(config.pid_file);
    }

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    trovi::WorkerLock worker_lock(worker_lock_path(config));
    if (!worker_lock.try_lock()) {
        std::cerr << "Error: another worker holds " << worker_lock.path() << std::endl;
        if (!config.pid_file.empty()) {
            unlink(config.pid_file.c_str());
        }
        return 1;
    }

    trovi::MigrationStore store(config.db_path.string());

    std::unique_ptr<trovi::MigrationMetrics> metrics;
    if (!config.metrics_file.empty()) {
        char hostname[256] = {};
        gethostname(hostname, sizeof(hostname) - 1);
        metrics = std::make_unique<trovi::MigrationMetrics>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"host", hostname}});
    }

    trovi::EngineConfig engine_config;
    engine_config.max_chunk_bytes = config.max_chunk_bytes;
    trovi::MigrationEngine engine(store, factory, engine_config, metrics.get());
    auto deposition = deposition_for(config);
    engine.set_metadata_provider([deposition](const trovi::MigrationRecord&) { return deposition; });

    auto report = trovi::recover_migrations(store, engine, metrics.get());
    std::cout << "  recovered: " << report.reaped << " interrupted, "
              << report.requeued << " queued" << std::endl;

    engine.start();
    if (metrics) metrics->start();

    std::cout << "trovi-storage worker running (PID " << getpid() << ")" << std::endl;

    // Wait until shutdown signal, then stop outside signal context.
    // Migrations queued by `migrate` in other processes are picked up here.
    auto last_poll = std::chrono::steady_clock::now();
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        auto now = std::chrono::steady_clock::now();
        if (now - last_poll < std::chrono::seconds(QUEUE_POLL_SECONDS)) continue;
        last_poll = now;
        if (engine.queue_depth() == 0) {
            try {
                trovi::requeue_queued_migrations(store, engine);
            } catch (const std::exception& e) {
                trovi::log_error("Polling for queued migrations failed: %s", e.what());
            }
        }
    }
    engine.stop();
    if (metrics) metrics->stop();

    if (!config.pid_file.empty()) {
        unlink(config.pid_file.c_str());
    }

    std::cout << "trovi-storage worker exited cleanly" << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = trovi::ServiceConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Redirect log output if log file specified
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDERR_FILENO);
            if (config.command == "worker") {
                dup2(fileno(log), STDOUT_FILENO);
            }
            fclose(log);
        }
    }
    trovi::set_verbose_logging(config.verbose);

    try {
        auto transport = std::make_shared<trovi::net::HttpClient>(config.http_settings());
        trovi::BackendFactory factory(config.storage_settings(), transport);

        if (config.command == "upload") return cmd_upload(config, factory);
        if (config.command == "links") return cmd_links(config, factory);
        if (config.command == "size") return cmd_size(config, factory);
        if (config.command == "migrate") return cmd_migrate(config, factory);
        if (config.command == "status") return cmd_status(config);
        if (config.command == "worker") return cmd_worker(config, factory);
    } catch (const trovi::TroviError& e) {
        std::cerr << "Error (" << trovi::error_code_name(e.code()) << "): " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 1;
}
