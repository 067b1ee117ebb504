#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace trovi {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports migration metrics to a Prometheus textfile for node_exporter pickup.
///
/// A background writer thread periodically serializes the registry to the
/// .prom file using atomic temp+rename.
class MigrationMetrics {
public:
    MigrationMetrics(const std::filesystem::path& prom_file_path,
                     std::chrono::seconds write_interval,
                     const std::map<std::string, std::string>& labels);
    ~MigrationMetrics();

    MigrationMetrics(const MigrationMetrics&) = delete;
    MigrationMetrics& operator=(const MigrationMetrics&) = delete;

    /// Sampled for the queue depth gauge before every write
    void set_queue_depth_source(std::function<size_t()> source);

    void start();

    /// Stops the writer thread and writes one final snapshot
    void stop();

    void write_file();

    prometheus::Counter& migrations_success() { return *migrations_success_; }
    prometheus::Counter& migrations_error() { return *migrations_error_; }
    prometheus::Counter& migrations_submitted() { return *migrations_submitted_; }
    prometheus::Counter& migrations_rejected() { return *migrations_rejected_; }
    prometheus::Counter& migrations_reaped() { return *migrations_reaped_; }
    prometheus::Counter& transfer_bytes_total() { return *transfer_bytes_total_; }
    prometheus::Gauge& migrations_in_progress() { return *migrations_in_progress_; }
    prometheus::Histogram& migration_duration() { return *migration_duration_; }
    prometheus::Histogram& chunk_duration() { return *chunk_duration_; }

private:
    void writer_loop();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    std::mutex source_mutex_;
    std::function<size_t()> queue_depth_source_;

    prometheus::Counter* migrations_success_;
    prometheus::Counter* migrations_error_;
    prometheus::Counter* migrations_submitted_;
    prometheus::Counter* migrations_rejected_;
    prometheus::Counter* migrations_reaped_;
    prometheus::Counter* transfer_bytes_total_;

    prometheus::Gauge* migrations_queued_;
    prometheus::Gauge* migrations_in_progress_;

    prometheus::Histogram* migration_duration_;
    prometheus::Histogram* chunk_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace trovi
