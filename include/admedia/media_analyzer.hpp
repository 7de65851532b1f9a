#pragma once

#include "admedia/ad_source.hpp"
#include "admedia/analysis_client.hpp"
#include "admedia/cache_service.hpp"
#include "admedia/fetcher.hpp"
#include "admedia/media_types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace admedia {

class MetricsExporter;

struct AnalysisRequest {
    std::string url;
    MediaKind media_kind = MediaKind::Image;
    std::optional<std::string> brand_name;
    std::optional<std::string> ad_id;
};

struct AnalysisOutcome {
    std::string url;
    bool success = false;
    bool media_from_cache = false;     // bytes were not downloaded
    bool analysis_from_cache = false;  // no analysis call was made
    AnalysisPayload analysis;
    std::filesystem::path storage_path;
    std::string error_message;
};

/// Analysis requests for the creatives of `ads`, in order. Records without a
/// media URL are skipped.
std::vector<AnalysisRequest> analysis_requests_for(const std::vector<AdRecord>& ads);

/// Cache-aware analysis: reuse cached analyses, then cached bytes, and only
/// download or call the analysis API for what is missing.
class MediaAnalyzer {
public:
    MediaAnalyzer(CacheService& cache, Fetcher& fetcher, AnalysisClient& analysis);

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    AnalysisOutcome analyze(const AnalysisRequest& request);

    /// One outcome per request, in request order. A failure only affects its
    /// own outcome. Repeated URLs are fetched and analyzed once. Downloads
    /// that could not be cached are reported as failures and not analyzed.
    std::vector<AnalysisOutcome> analyze_batch(const std::vector<AnalysisRequest>& requests);

private:
    FetchResult fetch(const std::string& url);
    void run_analysis(AnalysisOutcome& outcome, const std::vector<uint8_t>& data,
                      const std::string& content_type, MediaKind kind);
    void recover_stored(const std::vector<MediaPut>& puts, const std::vector<size_t>& put_index,
                        std::vector<AnalysisOutcome>& outcomes, std::vector<bool>& stored,
                        const std::string& error);

    CacheService& cache_;
    Fetcher& fetcher_;
    AnalysisClient& analysis_;
    MetricsExporter* metrics_ = nullptr;
};

}  // namespace admedia
