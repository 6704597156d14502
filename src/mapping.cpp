#include "mapping.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <string>

namespace topsellers {

namespace {

/// Digits following @p marker in @p url, e.g. "/apps/" -> "1245620".
std::optional<std::string> digitsAfter(const std::string& url,
                                       const std::string& marker) {
    auto pos = url.find(marker);
    if (pos == std::string::npos) return std::nullopt;

    pos += marker.size();
    auto end = pos;
    while (end < url.size() &&
           std::isdigit(static_cast<unsigned char>(url[end]))) {
        ++end;
    }
    if (end == pos) return std::nullopt;
    return url.substr(pos, end - pos);
}

/// Accept "id"/"appid" as either a JSON number or a numeric string.
std::optional<StoreId> explicitId(const nlohmann::json& node) {
    for (const char* key : {"id", "appid"}) {
        if (!node.contains(key)) continue;
        const auto& v = node[key];
        if (v.is_number_integer()) {
            StoreId sid;
            sid.id    = std::to_string(v.get<int64_t>());
            sid.appId = v.get<int64_t>();
            return sid;
        }
        if (v.is_string()) {
            if (v.get<std::string>().empty()) continue;
            StoreId sid;
            sid.id = v.get<std::string>();
            if (std::all_of(sid.id.begin(), sid.id.end(),
                            [](unsigned char c) { return std::isdigit(c); }) &&
                sid.id.size() < 19) {
                sid.appId = std::stoll(sid.id);
            }
            return sid;
        }
        throw SchemaError(std::string("item field '") + key +
                          "' is neither an integer nor a string");
    }
    return std::nullopt;
}

nlohmann::json parseBody(const std::string& body) {
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw SchemaError(std::string("response is not valid JSON: ") + e.what());
    }
}

} // namespace

std::optional<StoreId> extractStoreId(const std::string& assetUrl) {
    if (auto digits = digitsAfter(assetUrl, "/apps/")) {
        StoreId sid;
        sid.id = *digits;
        if (digits->size() < 19) sid.appId = std::stoll(*digits);
        return sid;
    }
    if (auto digits = digitsAfter(assetUrl, "/subs/")) {
        return StoreId{"sub/" + *digits, std::nullopt};
    }
    if (auto digits = digitsAfter(assetUrl, "/bundles/")) {
        return StoreId{"bundle/" + *digits, std::nullopt};
    }
    return std::nullopt;
}

Item parseItemNode(const nlohmann::json& node, int rank) {
    if (!node.is_object()) {
        throw SchemaError("item is not a JSON object");
    }
    if (!node.contains("name") || !node["name"].is_string()) {
        throw SchemaError("item is missing a string 'name'");
    }

    Item item;
    item.name   = node["name"].get<std::string>();
    item.fields = node;
    item.rank   = rank;

    if (node.contains("rank")) {
        if (!node["rank"].is_number_integer()) {
            throw SchemaError("item '" + item.name + "' has a non-integer 'rank'");
        }
        const auto& value = node["rank"];
        const bool fits = value.is_number_unsigned()
            ? value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
            : value.get<int64_t>() >= std::numeric_limits<int>::min() &&
                  value.get<int64_t>() <= std::numeric_limits<int>::max();
        if (!fits) {
            throw SchemaError("item '" + item.name + "' has an out-of-range 'rank': " +
                              value.dump());
        }
        item.rank = value.get<int>();
    }

    auto sid = explicitId(node);
    if (!sid && node.contains("logo") && node["logo"].is_string()) {
        sid = extractStoreId(node["logo"].get<std::string>());
    }
    if (!sid) {
        throw SchemaError("item '" + item.name + "' has no resolvable identifier");
    }
    item.id    = sid->id;
    item.appId = sid->appId;
    return item;
}

std::vector<Item> parseSearchPage(const PageRequest& request,
                                  const std::string& body) {
    const auto root = parseBody(body);

    if (!root.is_object()) {
        throw SchemaError("response is not a JSON object");
    }
    if (!root.contains("items")) {
        throw SchemaError("response missing 'items' field");
    }
    const auto& items = root["items"];
    if (!items.is_array()) {
        throw SchemaError("response field 'items' is not an array");
    }

    std::vector<Item> result;
    result.reserve(items.size());
    int position = 0;
    for (const auto& node : items) {
        result.push_back(parseItemNode(node, request.offset() + position + 1));
        ++position;
    }
    return result;
}

std::optional<nlohmann::json> parseAppDetails(int64_t appId,
                                              const std::string& body) {
    const auto root = parseBody(body);
    const auto key  = std::to_string(appId);

    if (!root.is_object() || !root.contains(key) || !root[key].is_object()) {
        throw SchemaError("appdetails response has no entry for " + key);
    }
    const auto& entry = root[key];
    if (!entry.value("success", false)) {
        return std::nullopt;
    }
    if (!entry.contains("data") || !entry["data"].is_object()) {
        throw SchemaError("appdetails entry for " + key + " has no 'data' object");
    }
    return entry["data"];
}

nlohmann::json itemToJson(const Item& item) {
    nlohmann::json out = item.fields;
    if (!out.contains("id") && !out.contains("appid")) {
        out["id"] = item.id;
    }
    if (!out.contains("rank")) {
        out["rank"] = item.rank;
    }
    if (item.details && !out.contains("details")) {
        out["details"] = *item.details;
    }
    return out;
}

} // namespace topsellers
