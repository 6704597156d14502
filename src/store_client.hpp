#pragma once

#include "details.hpp"
#include "http_client.hpp"
#include "models.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace topsellers {

/// Anything that can turn a PageRequest into exactly one PageResult.
/// Implementations must not throw for per-page failures; they report them
/// as PageFailure values.  Called concurrently from pool workers.
class PageSource {
public:
    virtual ~PageSource() = default;
    virtual PageResult fetchPage(const PageRequest& request) = 0;
};

/// Store search listing adapter: one HTTP exchange per page, no retries.
class StoreClient : public PageSource, public DetailsSource {
public:
    struct ListingOptions {
        std::string filter;     // e.g. "globaltopsellers"
        std::string category;   // e.g. "998"
    };

    StoreClient(const HttpClient& http, ListingOptions options);

    PageResult fetchPage(const PageRequest& request) override;

    /// Fetch the store details "data" object for one app.
    /// @throws TransportError, SchemaError, or std::runtime_error on non-2xx.
    std::optional<nlohmann::json> fetchAppDetails(int64_t appId) const override;

private:
    const HttpClient& mHttp;
    ListingOptions    mOptions;
};

} // namespace topsellers
