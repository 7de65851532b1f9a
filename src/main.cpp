#include "admedia/cache_config.hpp"
#include "admedia/cache_service.hpp"
#include "admedia/log.hpp"
#include "admedia/metrics.hpp"

#include <cstdio>
#include <iomanip>
#include <iostream>
#include <memory>
#include <unistd.h>

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [config.json]\n"
              << "\n"
              << "Evicts cached ad media older than max_age_days and prints cache statistics.\n"
              << "Settings not in the config file come from GEMINI_API_KEY, ADMEDIA_CACHE_DIR\n"
              << "and the defaults ($HOME/.cache/facebook-ads-mcp, 30 days).\n";
}

void print_kind(const char* name, const admedia::KindStats& k) {
    std::cout << "  " << name << ": " << k.count << " (" << k.bytes << " bytes, "
              << k.analyzed << " analyzed)" << std::endl;
}

void print_stats(const admedia::CacheStats& s) {
    std::cout << "  entries: " << s.total_count << " (" << s.analyzed_count << " analyzed, "
              << s.distinct_brands << " brands)" << std::endl;
    print_kind("images", s.images);
    print_kind("videos", s.videos);
    if (s.avg_video_duration_seconds) {
        std::cout << "  avg-video-duration: " << std::fixed << std::setprecision(1)
                  << *s.avg_video_duration_seconds << " s" << std::endl;
    }
    std::cout << "  size: " << std::fixed << std::setprecision(2) << s.total_size_mb() << " MB ("
              << std::setprecision(3) << s.total_size_gb() << " of "
              << (s.max_cache_bytes / (1024ULL * 1024 * 1024)) << " GB)" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc > 2) {
        print_usage(argv[0]);
        return 1;
    }

    admedia::CacheConfig config;
    if (argc == 2) {
        std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (!config.load_json(arg)) {
            return 1;
        }
    }
    config.apply_env();
    config.apply_defaults();

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Redirect log output if log file specified
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.log_file.parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDOUT_FILENO);
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        }
    }
    admedia::set_verbose_logging(config.verbose);

    std::cout << "admedia-cache maintenance" << std::endl;
    std::cout << "  cache-root: " << config.cache_root.string() << std::endl;
    std::cout << "  db-path: " << config.db_path.string() << std::endl;
    std::cout << "  max-age: " << config.max_age_days << " days" << std::endl;

    admedia::CacheService cache(config);
    err = cache.open();
    if (!err.empty()) {
        std::cerr << "Failed to open cache: " << err << std::endl;
        return 1;
    }

    std::unique_ptr<admedia::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<admedia::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"cache_root", config.cache_root.string()}});
        metrics->set_cache(&cache);
    }

    try {
        std::cout << "Before cleanup:" << std::endl;
        print_stats(cache.stats());

        auto report = cache.evict_older_than(config.max_age_days);
        std::cout << "Removed " << report.images_removed << " images and "
                  << report.videos_removed << " videos (" << report.bytes_freed
                  << " bytes freed";
        if (report.blobs_missing > 0) {
            std::cout << ", " << report.blobs_missing << " files were already gone";
        }
        std::cout << ")" << std::endl;

        std::cout << "After cleanup:" << std::endl;
        print_stats(cache.stats());
    } catch (const std::exception& e) {
        admedia::log_error("Maintenance failed: %s", e.what());
        return 1;
    }

    if (metrics) {
        metrics->stop();
    }
    return 0;
}
