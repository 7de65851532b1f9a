#pragma once

#include "admedia/cache_config.hpp"
#include "admedia/media_types.hpp"

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace admedia {

struct AnalysisResult {
    bool success = false;
    AnalysisPayload payload;
    std::string error_message;
};

/// AI media analysis of raw image or video bytes.
class AnalysisClient {
public:
    virtual ~AnalysisClient() = default;
    virtual AnalysisResult analyze(std::span<const uint8_t> data,
                                   const std::string& content_type,
                                   MediaKind kind) = 0;
};

/// A media file held by the Gemini File API.
struct UploadedFile {
    std::string name;  // "files/<id>"
    std::string uri;
    std::string mime_type;
    std::string state;  // PROCESSING, ACTIVE or FAILED
};

/// Gemini generateContent over REST.
///
/// Images up to analysis_inline_max_bytes are sent inline as base64. Videos
/// and larger payloads are uploaded to the File API with the resumable
/// protocol, referenced by URI once processing finishes, and deleted after
/// the call.
class GeminiAnalysisClient : public AnalysisClient {
public:
    explicit GeminiAnalysisClient(const CacheConfig& config);

    AnalysisResult analyze(std::span<const uint8_t> data,
                           const std::string& content_type,
                           MediaKind kind) override;

    bool uses_file_upload(size_t size, MediaKind kind) const;

    /// Request body for a generateContent call with the media inline.
    nlohmann::json build_request(std::span<const uint8_t> data,
                                 const std::string& content_type) const;

    /// Request body for a generateContent call referencing an uploaded file.
    nlohmann::json build_request(const UploadedFile& file) const;

private:
    struct HttpResponse;

    HttpResponse perform(const char* method, const std::string& url,
                         const std::vector<std::string>& headers,
                         const void* body, size_t body_size) const;

    std::optional<UploadedFile> upload(std::span<const uint8_t> data, const std::string& mime,
                                       std::string& error) const;
    bool wait_until_active(UploadedFile& file, std::string& error) const;
    void delete_file(const UploadedFile& file) const;
    AnalysisResult generate(const nlohmann::json& request) const;

    std::string api_key_;
    std::string model_;
    std::string endpoint_;
    long timeout_secs_;
    std::string prompt_;
    uint64_t inline_max_bytes_;
    std::chrono::milliseconds poll_interval_;
    std::chrono::seconds processing_timeout_;
};

/// File API upload URL for an API endpoint:
/// https://host/v1beta -> https://host/upload/v1beta/files
std::string upload_url_for(const std::string& endpoint);

/// The file described by an upload response ({"file": {...}}) or a files.get
/// response (the file object itself). nullopt without a name and URI.
std::optional<UploadedFile> parse_uploaded_file(const nlohmann::json& response);

/// Turn model output into a payload: a JSON object (optionally inside a
/// ```json fence) is used as-is, anything else becomes {"raw_text": text}.
AnalysisPayload parse_analysis_text(const std::string& text);

/// Concatenated text parts of the first candidate of a generateContent
/// response, or an empty string.
std::string extract_candidate_text(const nlohmann::json& response);

}  // namespace admedia
