#pragma once

#include <string>
#include <string_view>

namespace admedia {

/// Cache key for a media URL: lowercase hex MD5 of the URL's bytes.
/// Stable across calls and process restarts.
std::string identify(std::string_view url);

}  // namespace admedia
