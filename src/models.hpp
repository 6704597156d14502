#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace topsellers {

/// One page slot of the remote listing.
struct PageRequest {
    int index    = 0;
    int pageSize = 25;

    int offset() const { return index * pageSize; }
};

/// One listing entry. `fields` holds the upstream object verbatim.
struct Item {
    std::string             id;      // e.g. "1245620", "sub/354231", "bundle/28"
    std::optional<int64_t>  appId;   // set for apps only
    std::string             name;
    int                     rank = 0;
    nlohmann::json          fields = nlohmann::json::object();
    std::optional<nlohmann::json> details;
};

enum class ErrorKind {
    TransportError,   // network failure or timeout
    HttpError,        // non-2xx status
    SchemaError,      // payload does not match the listing schema
    Cancelled         // claimed after the pool was asked to stop
};

const char* toString(ErrorKind kind);

struct PageSuccess {
    int               index = 0;
    std::vector<Item> items;
};

struct PageFailure {
    int          index      = 0;
    ErrorKind    kind       = ErrorKind::TransportError;
    std::string  detail;
    unsigned int httpStatus = 0;
    int          attempts   = 1;
};

using PageResult = std::variant<PageSuccess, PageFailure>;

int  pageIndex(const PageResult& result);
bool isSuccess(const PageResult& result);

/// Final ordered listing handed to the serializer.
struct OutputDocument {
    std::vector<Item>        items;
    std::vector<PageFailure> failures;   // best-effort mode only
    bool                     partial = false;
};

} // namespace topsellers
