#pragma once

#include "admedia/media_types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace admedia {

/// One creative of an ad from the ad library. Carousel ads yield one record
/// per card, all sharing the ad's id.
struct AdRecord {
    std::string ad_id;
    std::string brand_name;
    std::string media_url;
    MediaKind media_kind = MediaKind::Image;
    std::string body;
    std::string title;
    std::optional<std::string> start_date;  // ISO 8601
    std::optional<std::string> end_date;
};

/// Ad-library search by brand or keyword. Provider protocol and pagination
/// live behind this interface.
class AdSource {
public:
    virtual ~AdSource() = default;
    virtual std::vector<AdRecord> search(const std::string& query, size_t limit) = 0;
};

}  // namespace admedia
