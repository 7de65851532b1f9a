#include "admedia/analysis_client.hpp"
#include "admedia/fetcher.hpp"
#include "admedia/log.hpp"

#include <algorithm>
#include <cctype>
#include <curl/curl.h>
#include <openssl/evp.h>
#include <string_view>
#include <thread>

#include <nlohmann/json.hpp>

namespace admedia {

namespace {

std::string base64_encode(std::span<const uint8_t> data) {
    if (data.empty()) return {};
    // 4 output chars per 3 input bytes, plus the NUL EVP_EncodeBlock writes
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            data.data(), static_cast<int>(data.size()));
    out.resize(n < 0 ? 0 : static_cast<size_t>(n));
    return out;
}

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

size_t string_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t upload_header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* upload_url = static_cast<std::string*>(userdata);
    size_t total = size * nitems;
    std::string line(buffer, total);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "x-goog-upload-url") *upload_url = trim(line.substr(colon + 1));
    }
    return total;
}

// "HTTP 400: <message>" using the API's error object when there is one
std::string api_error(long status, const std::string& body) {
    std::string message = "HTTP " + std::to_string(status);
    auto response = nlohmann::json::parse(body, nullptr, false);
    if (!response.is_discarded() && response.is_object() && response.contains("error") &&
        response["error"].is_object() && response["error"].contains("message") &&
        response["error"]["message"].is_string()) {
        message += ": " + response["error"]["message"].get<std::string>();
    }
    return message;
}

std::string json_string(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

}  // namespace

AnalysisPayload parse_analysis_text(const std::string& text) {
    std::string body = trim(text);

    // ```json ... ``` or ``` ... ```
    if (body.starts_with("```")) {
        auto newline = body.find('\n');
        auto closing = body.rfind("```");
        if (newline != std::string::npos && closing != std::string::npos && closing > newline) {
            body = trim(body.substr(newline + 1, closing - newline - 1));
        }
    }

    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        return parsed;
    }
    return AnalysisPayload{{"raw_text", text}};
}

std::string upload_url_for(const std::string& endpoint) {
    auto scheme = endpoint.find("://");
    auto path = endpoint.find('/', scheme == std::string::npos ? 0 : scheme + 3);
    if (path == std::string::npos) return endpoint + "/upload/files";
    std::string base = endpoint;
    while (base.size() > path + 1 && base.back() == '/') base.pop_back();
    return base.substr(0, path) + "/upload" + base.substr(path) + "/files";
}

std::optional<UploadedFile> parse_uploaded_file(const nlohmann::json& response) {
    if (!response.is_object()) return std::nullopt;
    auto file_it = response.find("file");
    const auto& file = (file_it != response.end() && file_it->is_object()) ? *file_it : response;

    UploadedFile out;
    out.name = json_string(file, "name");
    out.uri = json_string(file, "uri");
    out.mime_type = json_string(file, "mimeType");
    out.state = json_string(file, "state");
    if (out.name.empty() || out.uri.empty()) return std::nullopt;
    return out;
}

std::string extract_candidate_text(const nlohmann::json& response) {
    if (!response.is_object()) return {};
    auto candidates = response.find("candidates");
    if (candidates == response.end() || !candidates->is_array() || candidates->empty()) {
        return {};
    }
    const auto& first = (*candidates)[0];
    auto content = first.find("content");
    if (content == first.end() || !content->is_object()) return {};
    auto parts = content->find("parts");
    if (parts == content->end() || !parts->is_array()) return {};

    std::string text;
    for (const auto& part : *parts) {
        auto t = part.find("text");
        if (t != part.end() && t->is_string()) text += t->get<std::string>();
    }
    return text;
}

struct GeminiAnalysisClient::HttpResponse {
    CURLcode curl_code = CURLE_OK;
    long status = 0;
    std::string body;
    std::string upload_url;

    bool ok() const { return curl_code == CURLE_OK && status >= 200 && status < 300; }

    std::string error() const {
        if (curl_code != CURLE_OK) return curl_easy_strerror(curl_code);
        return api_error(status, body);
    }
};

GeminiAnalysisClient::GeminiAnalysisClient(const CacheConfig& config)
    : api_key_(config.gemini_api_key)
    , model_(config.gemini_model)
    , endpoint_(config.gemini_endpoint)
    , timeout_secs_(static_cast<long>(config.analysis_timeout_secs))
    , prompt_(config.analysis_prompt)
    , inline_max_bytes_(config.analysis_inline_max_bytes)
    , poll_interval_(config.upload_poll_interval_ms)
    , processing_timeout_(config.upload_processing_timeout_secs) {
    ensure_curl_initialized();
}

bool GeminiAnalysisClient::uses_file_upload(size_t size, MediaKind kind) const {
    return kind == MediaKind::Video || size > inline_max_bytes_;
}

nlohmann::json GeminiAnalysisClient::build_request(std::span<const uint8_t> data,
                                                   const std::string& content_type) const {
    return {
        {"contents", nlohmann::json::array({
            {{"role", "user"},
             {"parts", nlohmann::json::array({
                 {{"inline_data", {{"mime_type", content_type},
                                   {"data", base64_encode(data)}}}},
                 {{"text", prompt_}},
             })}},
        })},
        {"generationConfig", {{"temperature", 0.2}}},
    };
}

nlohmann::json GeminiAnalysisClient::build_request(const UploadedFile& file) const {
    return {
        {"contents", nlohmann::json::array({
            {{"role", "user"},
             {"parts", nlohmann::json::array({
                 {{"file_data", {{"mime_type", file.mime_type},
                                 {"file_uri", file.uri}}}},
                 {{"text", prompt_}},
             })}},
        })},
        {"generationConfig", {{"temperature", 0.2}}},
    };
}

GeminiAnalysisClient::HttpResponse GeminiAnalysisClient::perform(
    const char* method, const std::string& url, const std::vector<std::string>& headers,
    const void* body, size_t body_size) const {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.curl_code = CURLE_FAILED_INIT;
        return response;
    }

    std::string key_header = "x-goog-api-key: " + api_key_;
    struct curl_slist* header_list = curl_slist_append(nullptr, key_header.c_str());
    for (const auto& h : headers) header_list = curl_slist_append(header_list, h.c_str());

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (std::string_view(method) == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body_size));
    } else if (std::string_view(method) == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method);
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_secs_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, string_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, upload_header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.upload_url);

    response.curl_code = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return response;
}

std::optional<UploadedFile> GeminiAnalysisClient::upload(std::span<const uint8_t> data,
                                                         const std::string& mime,
                                                         std::string& error) const {
    // Resumable protocol: a start request returns the session URL, then the
    // bytes go up in one upload+finalize request.
    std::string metadata = nlohmann::json{{"file", {{"display_name", "admedia-media"}}}}.dump();
    auto start = perform("POST", upload_url_for(endpoint_),
                         {"Content-Type: application/json",
                          "X-Goog-Upload-Protocol: resumable",
                          "X-Goog-Upload-Command: start",
                          "X-Goog-Upload-Header-Content-Length: " + std::to_string(data.size()),
                          "X-Goog-Upload-Header-Content-Type: " + mime},
                         metadata.data(), metadata.size());
    if (!start.ok()) {
        error = "upload start failed: " + start.error();
        return std::nullopt;
    }
    if (start.upload_url.empty()) {
        error = "upload start returned no session URL";
        return std::nullopt;
    }

    auto finish = perform("POST", start.upload_url,
                          {"X-Goog-Upload-Offset: 0",
                           "X-Goog-Upload-Command: upload, finalize"},
                          data.data(), data.size());
    if (!finish.ok()) {
        error = "upload failed: " + finish.error();
        return std::nullopt;
    }

    auto file = parse_uploaded_file(nlohmann::json::parse(finish.body, nullptr, false));
    if (!file) {
        error = "upload response did not describe a file";
        return std::nullopt;
    }
    if (file->mime_type.empty()) file->mime_type = mime;
    log_info("Uploaded %zu bytes to Gemini as %s", data.size(), file->name.c_str());
    return file;
}

bool GeminiAnalysisClient::wait_until_active(UploadedFile& file, std::string& error) const {
    auto deadline = std::chrono::steady_clock::now() + processing_timeout_;
    while (file.state == "PROCESSING") {
        if (std::chrono::steady_clock::now() >= deadline) {
            error = "File processing timed out for " + file.name;
            return false;
        }
        std::this_thread::sleep_for(poll_interval_);

        auto response = perform("GET", endpoint_ + "/" + file.name, {}, nullptr, 0);
        if (!response.ok()) {
            error = "File status check failed: " + response.error();
            return false;
        }
        auto updated = parse_uploaded_file(nlohmann::json::parse(response.body, nullptr, false));
        if (!updated) {
            error = "File status response did not describe a file";
            return false;
        }
        if (updated->mime_type.empty()) updated->mime_type = file.mime_type;
        file = std::move(*updated);
    }
    if (file.state == "FAILED") {
        error = "Video processing failed for " + file.name;
        return false;
    }
    return true;
}

void GeminiAnalysisClient::delete_file(const UploadedFile& file) const {
    auto response = perform("DELETE", endpoint_ + "/" + file.name, {}, nullptr, 0);
    if (!response.ok()) {
        log_warn("Failed to clean up Gemini file %s: %s", file.name.c_str(),
                 response.error().c_str());
        return;
    }
    log_info("Cleaned up Gemini file: %s", file.name.c_str());
}

AnalysisResult GeminiAnalysisClient::generate(const nlohmann::json& request) const {
    AnalysisResult result;

    std::string body = request.dump();
    auto response = perform("POST", endpoint_ + "/models/" + model_ + ":generateContent",
                            {"Content-Type: application/json"}, body.data(), body.size());
    if (!response.ok()) {
        result.error_message = "Analysis request failed: " + response.error();
        return result;
    }

    auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (parsed.is_discarded()) {
        result.error_message = "Analysis response is not valid JSON";
        return result;
    }

    std::string text = extract_candidate_text(parsed);
    if (trim(text).empty()) {
        result.error_message = "Analysis response contained no text";
        return result;
    }

    result.payload = parse_analysis_text(text);
    result.payload["model_used"] = model_;
    result.success = true;
    return result;
}

AnalysisResult GeminiAnalysisClient::analyze(std::span<const uint8_t> data,
                                             const std::string& content_type,
                                             MediaKind kind) {
    AnalysisResult result;

    if (api_key_.empty()) {
        result.error_message = "GEMINI_API_KEY is not configured";
        return result;
    }
    if (data.empty()) {
        result.error_message = "No media bytes to analyze";
        return result;
    }

    std::string mime = content_type;
    if (mime.empty()) mime = kind == MediaKind::Video ? "video/mp4" : "image/jpeg";

    if (!uses_file_upload(data.size(), kind)) {
        result = generate(build_request(data, mime));
    } else {
        std::string error;
        auto file = upload(data, mime, error);
        if (!file) {
            result.error_message = "Media upload failed: " + error;
            return result;
        }
        if (wait_until_active(*file, error)) {
            result = generate(build_request(*file));
        } else {
            result.error_message = error;
        }
        delete_file(*file);
    }

    if (result.success) {
        log_debug("Analyzed %zu bytes of %s with %s", data.size(), mime.c_str(), model_.c_str());
    }
    return result;
}

}  // namespace admedia
