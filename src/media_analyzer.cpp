#include "admedia/media_analyzer.hpp"
#include "admedia/errors.hpp"
#include "admedia/log.hpp"
#include "admedia/metrics.hpp"

#include <optional>
#include <unordered_map>

namespace admedia {

namespace {

bool blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

MediaPut make_put(const AnalysisRequest& request, FetchResult&& fetched) {
    MediaPut item;
    item.url = request.url;
    item.data = std::move(fetched.data);
    item.content_type = std::move(fetched.content_type);
    item.media_kind = request.media_kind;
    item.brand_name = request.brand_name;
    item.ad_id = request.ad_id;
    return item;
}

}  // namespace

std::vector<AnalysisRequest> analysis_requests_for(const std::vector<AdRecord>& ads) {
    std::vector<AnalysisRequest> requests;
    requests.reserve(ads.size());
    for (const auto& ad : ads) {
        if (blank(ad.media_url)) continue;
        AnalysisRequest req;
        req.url = ad.media_url;
        req.media_kind = ad.media_kind;
        if (!ad.brand_name.empty()) req.brand_name = ad.brand_name;
        if (!ad.ad_id.empty()) req.ad_id = ad.ad_id;
        requests.push_back(std::move(req));
    }
    return requests;
}

MediaAnalyzer::MediaAnalyzer(CacheService& cache, Fetcher& fetcher, AnalysisClient& analysis)
    : cache_(cache)
    , fetcher_(fetcher)
    , analysis_(analysis) {}

FetchResult MediaAnalyzer::fetch(const std::string& url) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->fetch_duration());

    auto result = fetcher_.fetch(url);
    if (metrics_) {
        if (result.success) {
            metrics_->fetches_success().Increment();
            metrics_->fetch_bytes_total().Increment(static_cast<double>(result.data.size()));
        } else {
            metrics_->fetches_failure().Increment();
        }
    }
    if (!result.success) {
        log_error("Failed to download %s: %s", url.c_str(), result.error_message.c_str());
    }
    return result;
}

void MediaAnalyzer::run_analysis(AnalysisOutcome& outcome, const std::vector<uint8_t>& data,
                                 const std::string& content_type, MediaKind kind) {
    AnalysisResult result;
    {
        std::optional<ScopedTimer> timer;
        if (metrics_) timer.emplace(metrics_->analysis_duration());
        result = analysis_.analyze(std::span<const uint8_t>(data), content_type, kind);
    }
    if (metrics_) {
        (result.success ? metrics_->analyses_success() : metrics_->analyses_failure()).Increment();
    }

    if (!result.success) {
        outcome.error_message = "Analysis failed: " + result.error_message;
        log_error("Analysis of %s failed: %s", outcome.url.c_str(), result.error_message.c_str());
        return;
    }

    try {
        if (!cache_.attach_analysis(outcome.url, result.payload)) {
            log_warn("Analysis of %s was not cached: entry is gone", outcome.url.c_str());
        }
    } catch (const CacheError& e) {
        log_error("Failed to cache analysis for %s: %s", outcome.url.c_str(), e.what());
    }

    outcome.analysis = std::move(result.payload);
    outcome.success = true;
}

void MediaAnalyzer::recover_stored(const std::vector<MediaPut>& puts,
                                   const std::vector<size_t>& put_index,
                                   std::vector<AnalysisOutcome>& outcomes,
                                   std::vector<bool>& stored, const std::string& error) {
    // put_batch writes no row when a blob fails and commits the good rows when
    // only some rows fail, so the rows now present are the ones that were stored.
    std::vector<std::string> urls;
    urls.reserve(puts.size());
    for (const auto& item : puts) urls.push_back(item.url);

    std::unordered_map<std::string, std::optional<CacheEntry>> rows;
    try {
        rows = cache_.get_cached_batch(urls);
    } catch (const CacheError& e) {
        log_error("Cannot re-read cached downloads: %s", e.what());
    }

    size_t lost = 0;
    for (size_t k = 0; k < puts.size(); ++k) {
        auto& outcome = outcomes[put_index[k]];
        auto it = rows.find(puts[k].url);
        bool present = it != rows.end() && it->second &&
                       it->second->media_kind == puts[k].media_kind &&
                       it->second->size_bytes == puts[k].data.size();
        if (present) {
            outcome.storage_path = it->second->storage_path;
            continue;
        }
        stored[k] = false;
        outcome.error_message = "Caching failed: " + error;
        lost++;
    }
    log_warn("%zu of %zu downloads were not cached and will not be analyzed",
             lost, puts.size());
}

AnalysisOutcome MediaAnalyzer::analyze(const AnalysisRequest& request) {
    AnalysisOutcome outcome;
    outcome.url = request.url;

    if (blank(request.url)) {
        outcome.error_message = "media URL must not be empty";
        return outcome;
    }

    try {
        auto cached = cache_.get_cached(request.url, request.media_kind);
        if (cached && cached->analysis) {
            outcome.success = true;
            outcome.media_from_cache = true;
            outcome.analysis_from_cache = true;
            outcome.analysis = *cached->analysis;
            outcome.storage_path = cached->storage_path;
            log_info("Using cached analysis for %s", request.url.c_str());
            return outcome;
        }

        if (cached) {
            auto bytes = cache_.read_blob(*cached);
            if (bytes) {
                outcome.media_from_cache = true;
                outcome.storage_path = cached->storage_path;
                run_analysis(outcome, *bytes, cached->content_type, request.media_kind);
                return outcome;
            }
            log_warn("Cached file unreadable, downloading again: %s",
                     cached->storage_path.c_str());
        }

        auto fetched = fetch(request.url);
        if (!fetched.success) {
            outcome.error_message = "Download failed: " + fetched.error_message;
            return outcome;
        }

        auto item = make_put(request, std::move(fetched));
        outcome.storage_path = cache_.put(item);
        run_analysis(outcome, item.data, item.content_type, request.media_kind);
    } catch (const CacheError& e) {
        outcome.success = false;
        outcome.error_message = e.what();
        log_error("Analysis of %s failed: %s", request.url.c_str(), e.what());
    }
    return outcome;
}

std::vector<AnalysisOutcome> MediaAnalyzer::analyze_batch(
    const std::vector<AnalysisRequest>& requests) {
    std::vector<AnalysisOutcome> outcomes(requests.size());
    if (requests.empty()) return outcomes;

    // First request for each distinct URL drives the work for all duplicates
    std::unordered_map<std::string, size_t> first_index;
    std::vector<size_t> unique;
    std::vector<std::string> urls;
    for (size_t i = 0; i < requests.size(); ++i) {
        outcomes[i].url = requests[i].url;
        if (blank(requests[i].url)) {
            outcomes[i].error_message = "media URL must not be empty";
            continue;
        }
        if (first_index.emplace(requests[i].url, i).second) {
            unique.push_back(i);
            urls.push_back(requests[i].url);
        }
    }

    std::unordered_map<std::string, std::optional<CacheEntry>> cached;
    try {
        cached = cache_.get_cached_batch(urls);
    } catch (const CacheError& e) {
        for (size_t i : unique) outcomes[i].error_message = e.what();
        log_error("Batch cache lookup failed: %s", e.what());
        return outcomes;
    }

    struct Pending {
        size_t index;
        std::vector<uint8_t> data;
        std::string content_type;
    };
    std::vector<Pending> to_analyze;
    std::vector<size_t> to_fetch;

    size_t analyses_reused = 0;
    for (size_t i : unique) {
        const auto& request = requests[i];
        auto& outcome = outcomes[i];
        auto it = cached.find(request.url);
        const std::optional<CacheEntry>* entry = it == cached.end() ? nullptr : &it->second;

        // An entry stored as the other kind is refetched as the requested one
        if (!entry || !*entry || (*entry)->media_kind != request.media_kind) {
            to_fetch.push_back(i);
            continue;
        }

        const auto& hit = **entry;
        outcome.storage_path = hit.storage_path;
        if (hit.analysis) {
            outcome.success = true;
            outcome.media_from_cache = true;
            outcome.analysis_from_cache = true;
            outcome.analysis = *hit.analysis;
            analyses_reused++;
            continue;
        }

        auto bytes = cache_.read_blob(hit);
        if (!bytes) {
            log_warn("Cached file unreadable, downloading again: %s", hit.storage_path.c_str());
            to_fetch.push_back(i);
            continue;
        }
        outcome.media_from_cache = true;
        to_analyze.push_back({i, std::move(*bytes), hit.content_type});
    }

    std::vector<MediaPut> puts;
    std::vector<size_t> put_index;
    for (size_t i : to_fetch) {
        auto fetched = fetch(requests[i].url);
        if (!fetched.success) {
            outcomes[i].error_message = "Download failed: " + fetched.error_message;
            continue;
        }
        puts.push_back(make_put(requests[i], std::move(fetched)));
        put_index.push_back(i);
    }

    if (!puts.empty()) {
        std::vector<bool> stored(puts.size(), true);
        try {
            auto paths = cache_.put_batch(puts);
            for (size_t k = 0; k < paths.size(); ++k) {
                outcomes[put_index[k]].storage_path = paths[k];
            }
        } catch (const CacheError& e) {
            log_error("Batch caching of %zu downloads failed: %s", puts.size(), e.what());
            recover_stored(puts, put_index, outcomes, stored, e.what());
        }
        for (size_t k = 0; k < puts.size(); ++k) {
            if (!stored[k]) continue;
            to_analyze.push_back({put_index[k], std::move(puts[k].data),
                                  std::move(puts[k].content_type)});
        }
    }

    for (auto& pending : to_analyze) {
        try {
            run_analysis(outcomes[pending.index], pending.data, pending.content_type,
                         requests[pending.index].media_kind);
        } catch (const CacheError& e) {
            outcomes[pending.index].error_message = e.what();
        }
    }

    // Duplicates share the outcome of their first occurrence
    for (size_t i = 0; i < requests.size(); ++i) {
        auto it = first_index.find(requests[i].url);
        if (it != first_index.end() && it->second != i) {
            outcomes[i] = outcomes[it->second];
        }
    }

    size_t succeeded = 0;
    for (const auto& o : outcomes) {
        if (o.success) succeeded++;
    }
    log_info("Batch analysis: %zu/%zu succeeded (%zu cached analyses, %zu downloads)",
             succeeded, outcomes.size(), analyses_reused, puts.size());
    return outcomes;
}

}  // namespace admedia
