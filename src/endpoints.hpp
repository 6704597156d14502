#pragma once

#include <string>

namespace topsellers {
namespace endpoints {

/// Store search listing.  Query: filter, category1, start, count, json=1.
/// Response: {"desc": "...", "items": [{"name": ..., "logo": ...}, ...]}
inline const std::string kSearchResultsPath = "/search/results/";

/// Per-app store details.  Query: appids.
/// Response: {"<appid>": {"success": true, "data": {...}}}
inline const std::string kAppDetailsPath = "/api/appdetails/";

inline const std::string kDefaultEndpoint = "https://store.steampowered.com";
inline const std::string kDefaultFilter   = "globaltopsellers";
inline const std::string kDefaultCategory = "998";   // games

} // namespace endpoints
} // namespace topsellers
