#include "trovi/service/metrics.hpp"
#include "trovi/core/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace trovi {

MigrationMetrics::MigrationMetrics(const std::filesystem::path& prom_file_path,
                                   std::chrono::seconds write_interval,
                                   const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& migrations_family = prometheus::BuildCounter()
        .Name("trovi_migrations_total")
        .Help("Migrations that reached a terminal state")
        .Labels(labels)
        .Register(*registry_);
    migrations_success_ = &migrations_family.Add({{"result", "success"}});
    migrations_error_ = &migrations_family.Add({{"result", "error"}});

    auto& submissions_family = prometheus::BuildCounter()
        .Name("trovi_migration_submissions_total")
        .Help("Migration submissions")
        .Labels(labels)
        .Register(*registry_);
    migrations_submitted_ = &submissions_family.Add({{"result", "accepted"}});
    migrations_rejected_ = &submissions_family.Add({{"result", "rejected"}});

    migrations_reaped_ = &prometheus::BuildCounter()
        .Name("trovi_migrations_reaped_total")
        .Help("In-progress migrations marked failed at startup")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    transfer_bytes_total_ = &prometheus::BuildCounter()
        .Name("trovi_migration_bytes_total")
        .Help("Bytes written to migration destinations")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    migrations_queued_ = &gauge_reg("trovi_migrations_queued", "Migrations waiting for the worker");
    migrations_in_progress_ = &gauge_reg("trovi_migrations_in_progress", "Migrations being transferred");

    // --- Histograms ---

    migration_duration_ = &prometheus::BuildHistogram()
        .Name("trovi_migration_duration_seconds")
        .Help("Migration duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.1, 0.5, 1, 5, 10, 30, 60, 300, 900, 1800, 3600});

    chunk_duration_ = &prometheus::BuildHistogram()
        .Name("trovi_migration_chunk_duration_seconds")
        .Help("Time to read and write one transfer chunk")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30});
}

MigrationMetrics::~MigrationMetrics() {
    stop();
}

void MigrationMetrics::set_queue_depth_source(std::function<size_t()> source) {
    std::lock_guard lock(source_mutex_);
    queue_depth_source_ = std::move(source);
}

void MigrationMetrics::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MigrationMetrics::writer_loop, this);
}

void MigrationMetrics::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
        write_file();
    }
}

void MigrationMetrics::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

void MigrationMetrics::write_file() {
    {
        std::lock_guard lock(source_mutex_);
        if (queue_depth_source_) {
            migrations_queued_->Set(static_cast<double>(queue_depth_source_()));
        }
    }

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("Cannot write metrics to %s", tmp_path.c_str());
        return;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("Cannot publish metrics file %s: %s", prom_file_path_.c_str(), ec.message().c_str());
    }
}

}  // namespace trovi
