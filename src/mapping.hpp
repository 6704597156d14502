#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace topsellers {

/// Store identifier decoded from an asset URL.
struct StoreId {
    std::string            id;      // "730", "sub/354231", "bundle/28"
    std::optional<int64_t> appId;   // set for "/apps/<n>/" only
};

/// Decode the identifier embedded in a store asset URL such as
/// ".../store_item_assets/steam/apps/1245620/capsule_sm_120.jpg".
/// Returns std::nullopt if no apps/subs/bundles segment is present.
std::optional<StoreId> extractStoreId(const std::string& assetUrl);

/// Map one upstream item object at @p rank (used when it has no "rank").
/// Throws SchemaError if the object has no name or no resolvable identifier.
Item parseItemNode(const nlohmann::json& node, int rank);

/// Validate a search-results body and map its items in listing order.
/// Ranks default to request.offset() + position + 1.
/// Throws SchemaError on malformed JSON or an unexpected shape.
std::vector<Item> parseSearchPage(const PageRequest& request,
                                  const std::string& body);

/// Extract the "data" object for @p appId from an appdetails body.
/// Returns std::nullopt when the store reports success=false.
/// Throws SchemaError on malformed JSON or an unexpected shape.
std::optional<nlohmann::json> parseAppDetails(int64_t appId,
                                              const std::string& body);

/// Output form of an item: upstream fields plus "id", "rank" and
/// "details" where the upstream object does not already carry them.
nlohmann::json itemToJson(const Item& item);

} // namespace topsellers
