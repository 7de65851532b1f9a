#include "admedia/fetcher.hpp"
#include "admedia/log.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace admedia {

namespace {

struct WriteCallbackContext {
    std::vector<uint8_t>* response;
    uint64_t max_size;
    uint64_t current_size;
    bool size_exceeded;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    if (ctx->max_size > 0 && ctx->current_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // aborts the transfer
    }

    ctx->response->insert(ctx->response->end(), ptr, ptr + bytes);
    ctx->current_size += bytes;
    return bytes;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* content_type = static_cast<std::string*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // A redirect starts a fresh header block
    if (line.starts_with("HTTP/")) {
        content_type->clear();
        return bytes;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) return bytes;

    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (name == "content-type") {
        auto value_start = line.find_first_not_of(" \t", colon + 1);
        *content_type = value_start == std::string::npos ? "" : line.substr(value_start);
    }
    return bytes;
}

}  // namespace

void ensure_curl_initialized() {
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_ALL);
    });
}

std::string normalize_content_type(const std::string& header_value) {
    std::string value = header_value.substr(0, header_value.find(';'));
    auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    auto last = value.find_last_not_of(" \t");
    value = value.substr(first, last - first + 1);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

CurlFetcher::CurlFetcher(const CacheConfig& config)
    : timeout_secs_(static_cast<long>(config.fetch_timeout_secs))
    , max_bytes_(config.fetch_max_bytes)
    , user_agent_(config.user_agent) {
    ensure_curl_initialized();
}

FetchResult CurlFetcher::fetch(const std::string& url) {
    FetchResult result;

    CURL* curl = curl_easy_init();
    if (!curl) {
        result.error_message = "Failed to create CURL handle";
        return result;
    }

    std::string raw_content_type;
    WriteCallbackContext write_ctx{&result.data, max_bytes_, 0, false};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_secs_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &raw_content_type);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status);
    curl_easy_cleanup(curl);

    if (write_ctx.size_exceeded) {
        result.data.clear();
        result.error_message = "Response exceeds " + std::to_string(max_bytes_) + " bytes";
        log_warn("Download of %s aborted: %s", url.c_str(), result.error_message.c_str());
        return result;
    }
    if (res != CURLE_OK) {
        result.data.clear();
        result.error_message = curl_easy_strerror(res);
        log_warn("Download of %s failed: %s", url.c_str(), result.error_message.c_str());
        return result;
    }
    if (result.status < 200 || result.status >= 300) {
        result.data.clear();
        result.error_message = "HTTP " + std::to_string(result.status);
        log_warn("Download of %s failed: %s", url.c_str(), result.error_message.c_str());
        return result;
    }

    result.content_type = normalize_content_type(raw_content_type);
    result.success = true;
    log_debug("Downloaded %zu bytes from %s (%s)", result.data.size(), url.c_str(),
              result.content_type.c_str());
    return result;
}

}  // namespace admedia
