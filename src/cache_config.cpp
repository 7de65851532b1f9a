#include "admedia/cache_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace admedia {

bool CacheConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("cache_root")) cache_root = j["cache_root"].get<std::string>();
        if (j.contains("db_path")) db_path = j["db_path"].get<std::string>();
        if (j.contains("images_dir")) images_dir = j["images_dir"].get<std::string>();
        if (j.contains("videos_dir")) videos_dir = j["videos_dir"].get<std::string>();
        if (j.contains("max_age_days")) max_age_days = j["max_age_days"].get<int>();
        if (j.contains("max_cache_size_gb")) max_cache_size_gb = j["max_cache_size_gb"].get<uint64_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("fetch") && j["fetch"].is_object()) {
            auto& jf = j["fetch"];
            if (jf.contains("timeout_secs")) fetch_timeout_secs = jf["timeout_secs"].get<size_t>();
            if (jf.contains("max_bytes")) fetch_max_bytes = jf["max_bytes"].get<uint64_t>();
            if (jf.contains("user_agent")) user_agent = jf["user_agent"].get<std::string>();
        }

        if (j.contains("gemini") && j["gemini"].is_object()) {
            auto& jg = j["gemini"];
            if (jg.contains("api_key")) gemini_api_key = jg["api_key"].get<std::string>();
            if (jg.contains("model")) gemini_model = jg["model"].get<std::string>();
            if (jg.contains("endpoint")) gemini_endpoint = jg["endpoint"].get<std::string>();
            if (jg.contains("timeout_secs")) analysis_timeout_secs = jg["timeout_secs"].get<size_t>();
            if (jg.contains("prompt")) analysis_prompt = jg["prompt"].get<std::string>();
            if (jg.contains("inline_max_bytes")) {
                analysis_inline_max_bytes = jg["inline_max_bytes"].get<uint64_t>();
            }
            if (jg.contains("upload_poll_interval_ms")) {
                upload_poll_interval_ms = jg["upload_poll_interval_ms"].get<size_t>();
            }
            if (jg.contains("upload_processing_timeout_secs")) {
                upload_processing_timeout_secs = jg["upload_processing_timeout_secs"].get<size_t>();
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void CacheConfig::apply_env() {
    if (gemini_api_key.empty()) {
        if (const char* v = std::getenv("GEMINI_API_KEY")) gemini_api_key = v;
    }
    if (cache_root.empty()) {
        if (const char* v = std::getenv("ADMEDIA_CACHE_DIR")) cache_root = v;
    }
}

void CacheConfig::apply_defaults() {
    if (cache_root.empty()) {
        const char* home = std::getenv("HOME");
        std::filesystem::path base = (home && *home) ? std::filesystem::path(home)
                                                     : std::filesystem::temp_directory_path();
        cache_root = base / ".cache" / "facebook-ads-mcp";
    }
    if (db_path.empty()) db_path = cache_root / "media_cache.db";
    if (images_dir.empty()) images_dir = cache_root / "images";
    if (videos_dir.empty()) videos_dir = cache_root / "videos";
}

std::string CacheConfig::validate() const {
    if (cache_root.empty()) return "cache_root is required";
    if (db_path.empty()) return "db_path is required";
    if (images_dir.empty() || videos_dir.empty()) return "images_dir and videos_dir are required";
    if (images_dir == videos_dir) return "images_dir and videos_dir must differ";
    if (max_age_days < 0) return "max_age_days must be >= 0";
    if (fetch_timeout_secs == 0) return "fetch timeout must be > 0";
    if (analysis_timeout_secs == 0) return "analysis timeout must be > 0";
    if (upload_poll_interval_ms == 0) return "upload poll interval must be > 0";
    return {};
}

}  // namespace admedia
