#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

#include "admedia/cache_service.hpp"

namespace admedia {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports media cache metrics to a Prometheus textfile for node_exporter pickup.
///
/// Cache counters are pulled from CacheService::counters() as deltas on every
/// snapshot; fetch and analysis metrics are recorded directly by the
/// MediaAnalyzer. The file is written with atomic temp+rename.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Cache to snapshot (not owned).
    void set_cache(CacheService* cache) { cache_ = cache; }

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    // --- Counter accessors ---
    prometheus::Counter& fetches_success() { return *fetches_success_; }
    prometheus::Counter& fetches_failure() { return *fetches_failure_; }
    prometheus::Counter& fetch_bytes_total() { return *fetch_bytes_total_; }
    prometheus::Counter& analyses_success() { return *analyses_success_; }
    prometheus::Counter& analyses_failure() { return *analyses_failure_; }

    // --- Histogram accessors ---
    prometheus::Histogram& fetch_duration() { return *fetch_duration_; }
    prometheus::Histogram& analysis_duration() { return *analysis_duration_; }

private:
    void writer_loop();
    void update_from_cache();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    CacheService* cache_ = nullptr;

    // Previous cache counters for delta computation
    std::mutex snapshot_mutex_;
    CacheService::Counters prev_;

    // --- Counters ---
    prometheus::Counter* lookups_hit_;
    prometheus::Counter* lookups_miss_;
    prometheus::Counter* lookups_stale_;
    prometheus::Counter* puts_total_;
    prometheus::Counter* put_bytes_total_;
    prometheus::Counter* analyses_attached_;
    prometheus::Counter* corrupt_analyses_;
    prometheus::Counter* evictions_total_;
    prometheus::Counter* eviction_bytes_total_;
    prometheus::Counter* fetches_success_;
    prometheus::Counter* fetches_failure_;
    prometheus::Counter* fetch_bytes_total_;
    prometheus::Counter* analyses_success_;
    prometheus::Counter* analyses_failure_;

    // --- Gauges ---
    prometheus::Gauge* entries_total_;
    prometheus::Gauge* entries_analyzed_;
    prometheus::Gauge* images_total_;
    prometheus::Gauge* videos_total_;
    prometheus::Gauge* cache_bytes_;
    prometheus::Gauge* cache_max_bytes_;

    // --- Histograms ---
    prometheus::Histogram* fetch_duration_;
    prometheus::Histogram* analysis_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace admedia
