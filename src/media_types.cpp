#include "admedia/media_types.hpp"
#include "admedia/errors.hpp"

#include <chrono>

namespace admedia {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::InvalidInput: return "invalid_input";
        case ErrorKind::StorageWriteFailure: return "storage_write_failure";
        case ErrorKind::CorruptAnalysis: return "corrupt_analysis";
    }
    return "unknown";
}

const char* media_kind_name(MediaKind kind) {
    return kind == MediaKind::Video ? "video" : "image";
}

std::optional<MediaKind> parse_media_kind(std::string_view name) {
    if (name == "image") return MediaKind::Image;
    if (name == "video") return MediaKind::Video;
    return std::nullopt;
}

int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

QuickFilters derive_quick_filters(const AnalysisPayload& analysis) {
    QuickFilters filters;
    if (!analysis.is_object()) return filters;

    auto colors = analysis.find("colors");
    if (colors != analysis.end() && colors->is_object()) {
        auto dominant = colors->find("dominant_colors");
        if (dominant != colors->end() && dominant->is_array()) {
            for (const auto& c : *dominant) {
                if (c.is_string()) filters.dominant_colors.push_back(c.get<std::string>());
            }
        }
    }

    auto people = analysis.find("people_description");
    if (people != analysis.end() && people->is_string()) {
        const auto& desc = people->get_ref<const std::string&>();
        filters.has_people = desc.find_first_not_of(" \t\r\n") != std::string::npos;
    }

    auto text = analysis.find("text_elements");
    if (text != analysis.end() && text->is_object()) {
        for (const auto& value : *text) {
            if (value.is_string()) {
                filters.text_elements.push_back(value.get<std::string>());
            } else if (value.is_array()) {
                for (const auto& item : value) {
                    if (item.is_string()) filters.text_elements.push_back(item.get<std::string>());
                }
            }
        }
    }

    return filters;
}

}  // namespace admedia
