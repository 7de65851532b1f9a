#pragma once

#include "admedia/cache_config.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace admedia {

struct FetchResult {
    bool success = false;
    long status = 0;
    std::vector<uint8_t> data;
    std::string content_type;  // lowercased, parameters stripped
    std::string error_message;
};

/// Downloads media bytes for a URL.
class Fetcher {
public:
    virtual ~Fetcher() = default;
    virtual FetchResult fetch(const std::string& url) = 0;
};

/// libcurl GET with a single total timeout and a response size cap.
class CurlFetcher : public Fetcher {
public:
    explicit CurlFetcher(const CacheConfig& config);

    FetchResult fetch(const std::string& url) override;

private:
    long timeout_secs_;
    uint64_t max_bytes_;
    std::string user_agent_;
};

/// "Image/JPEG; charset=binary" -> "image/jpeg"
std::string normalize_content_type(const std::string& header_value);

/// curl_global_init exactly once per process.
void ensure_curl_initialized();

}  // namespace admedia
