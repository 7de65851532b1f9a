#include "admedia/metrics.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace admedia {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto counter_reg = [&](const std::string& name, const std::string& help) -> prometheus::Counter& {
        return prometheus::BuildCounter()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    auto& lookups_family = prometheus::BuildCounter()
        .Name("admedia_lookups_total")
        .Help("Cache lookups by result")
        .Labels(labels)
        .Register(*registry_);
    lookups_hit_ = &lookups_family.Add({{"result", "hit"}});
    lookups_miss_ = &lookups_family.Add({{"result", "miss"}});
    lookups_stale_ = &lookups_family.Add({{"result", "stale"}});

    puts_total_ = &counter_reg("admedia_puts_total", "Media entries stored");
    put_bytes_total_ = &counter_reg("admedia_put_bytes_total", "Media bytes stored");
    analyses_attached_ = &counter_reg("admedia_analyses_attached_total",
                                      "Analysis payloads attached to cached media");
    corrupt_analyses_ = &counter_reg("admedia_corrupt_analyses_total",
                                     "Stored analysis payloads that failed to decode");
    evictions_total_ = &counter_reg("admedia_evictions_total", "Entries evicted by age");
    eviction_bytes_total_ = &counter_reg("admedia_eviction_bytes_total", "Bytes evicted by age");

    auto& fetches_family = prometheus::BuildCounter()
        .Name("admedia_fetches_total")
        .Help("Media downloads by result")
        .Labels(labels)
        .Register(*registry_);
    fetches_success_ = &fetches_family.Add({{"result", "success"}});
    fetches_failure_ = &fetches_family.Add({{"result", "failure"}});

    fetch_bytes_total_ = &counter_reg("admedia_fetch_bytes_total", "Media bytes downloaded");

    auto& analyses_family = prometheus::BuildCounter()
        .Name("admedia_analysis_requests_total")
        .Help("Media analysis API calls by result")
        .Labels(labels)
        .Register(*registry_);
    analyses_success_ = &analyses_family.Add({{"result", "success"}});
    analyses_failure_ = &analyses_family.Add({{"result", "failure"}});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    entries_total_ = &gauge_reg("admedia_entries", "Cached media entries");
    entries_analyzed_ = &gauge_reg("admedia_entries_analyzed", "Cached entries with an analysis");
    images_total_ = &gauge_reg("admedia_images", "Cached images");
    videos_total_ = &gauge_reg("admedia_videos", "Cached videos");
    cache_bytes_ = &gauge_reg("admedia_cache_bytes", "Current cache size in bytes");
    cache_max_bytes_ = &gauge_reg("admedia_cache_max_bytes", "Configured cache size limit in bytes");

    // --- Histograms ---

    fetch_duration_ = &prometheus::BuildHistogram()
        .Name("admedia_fetch_duration_seconds")
        .Help("Media download duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60});

    analysis_duration_ = &prometheus::BuildHistogram()
        .Name("admedia_analysis_duration_seconds")
        .Help("Media analysis call duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
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
    }
    // Always write a final snapshot
    update_from_cache();
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        update_from_cache();
        write_file();
    }
}

void MetricsExporter::update_from_cache() {
    if (!cache_) return;

    std::lock_guard lock(snapshot_mutex_);

    try {
        auto s = cache_->stats();
        entries_total_->Set(static_cast<double>(s.total_count));
        entries_analyzed_->Set(static_cast<double>(s.analyzed_count));
        images_total_->Set(static_cast<double>(s.images.count));
        videos_total_->Set(static_cast<double>(s.videos.count));
        cache_bytes_->Set(static_cast<double>(s.total_bytes));
        cache_max_bytes_->Set(static_cast<double>(s.max_cache_bytes));
    } catch (const std::exception&) {
        // Cache not open yet; gauges keep their last values
    }

    // Increment counters by deltas since last snapshot
    auto c = cache_->counters();
    auto bump = [](prometheus::Counter* counter, uint64_t now, uint64_t& prev) {
        if (now > prev) {
            counter->Increment(static_cast<double>(now - prev));
            prev = now;
        }
    };
    bump(lookups_hit_, c.hits, prev_.hits);
    bump(lookups_miss_, c.misses, prev_.misses);
    bump(lookups_stale_, c.stale_purged, prev_.stale_purged);
    bump(puts_total_, c.puts, prev_.puts);
    bump(put_bytes_total_, c.put_bytes, prev_.put_bytes);
    bump(analyses_attached_, c.analyses_attached, prev_.analyses_attached);
    bump(corrupt_analyses_, c.corrupt_analyses, prev_.corrupt_analyses);
    bump(evictions_total_, c.evictions, prev_.evictions);
    bump(eviction_bytes_total_, c.eviction_bytes, prev_.eviction_bytes);
}

void MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return;
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
}

}  // namespace admedia
