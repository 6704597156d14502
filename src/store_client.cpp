#include "store_client.hpp"
#include "endpoints.hpp"
#include "errors.hpp"
#include "mapping.hpp"

#include <stdexcept>
#include <utility>

namespace topsellers {

namespace {

bool isSuccessStatus(unsigned int status) {
    return status >= 200 && status < 300;
}

} // namespace

StoreClient::StoreClient(const HttpClient& http, ListingOptions options)
    : mHttp(http)
    , mOptions(std::move(options)) {}

PageResult StoreClient::fetchPage(const PageRequest& request) {
    const QueryParams params = {
        {"filter",    mOptions.filter},
        {"category1", mOptions.category},
        {"start",     std::to_string(request.offset())},
        {"count",     std::to_string(request.pageSize)},
        {"json",      "1"},
    };

    HttpClient::Response resp;
    try {
        resp = mHttp.get(endpoints::kSearchResultsPath, params);
    } catch (const TransportError& e) {
        return PageFailure{request.index, ErrorKind::TransportError, e.what()};
    }

    if (!isSuccessStatus(resp.httpStatus)) {
        PageFailure failure{request.index, ErrorKind::HttpError,
                            "HTTP " + std::to_string(resp.httpStatus)};
        failure.httpStatus = resp.httpStatus;
        return failure;
    }

    try {
        return PageSuccess{request.index, parseSearchPage(request, resp.body)};
    } catch (const SchemaError& e) {
        PageFailure failure{request.index, ErrorKind::SchemaError, e.what()};
        failure.httpStatus = resp.httpStatus;
        return failure;
    }
}

std::optional<nlohmann::json> StoreClient::fetchAppDetails(int64_t appId) const {
    const auto resp = mHttp.get(endpoints::kAppDetailsPath,
                                {{"appids", std::to_string(appId)}});
    if (!isSuccessStatus(resp.httpStatus)) {
        throw std::runtime_error("appdetails for " + std::to_string(appId) +
                                 " returned HTTP " +
                                 std::to_string(resp.httpStatus));
    }
    return parseAppDetails(appId, resp.body);
}

} // namespace topsellers
