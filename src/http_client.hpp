#pragma once

#include "util.hpp"

#include <string>

namespace topsellers {

/// Low-level HTTP(S) client built on Boost.Beast.
/// Each call opens a connection, sends one GET and returns the raw response.
/// Safe to share between threads: get() keeps no per-call state in the object.
class HttpClient {
public:
    struct Response {
        unsigned int httpStatus = 0;
        std::string  body;
    };

    /// @param baseUrl    Scheme, host and optional base path,
    ///                   e.g. "https://store.steampowered.com"
    /// @param timeoutMs  Deadline for connect, TLS handshake, write and read.
    ///                   Host name resolution runs before the deadline starts
    ///                   and is bounded only by the system resolver's own
    ///                   timeout; pass an IP literal to avoid the lookup.
    explicit HttpClient(const std::string& baseUrl, int timeoutMs = 10000);

    /// GET @p path (relative to the base path) with the given query.
    /// @throws TransportError on resolve / connect / TLS / timeout failures.
    Response get(const std::string& path, const QueryParams& params = {}) const;

    void setVerbose(bool v) { mVerbose = v; }
    int  timeoutMs() const { return mTimeoutMs; }

private:
    std::string mHost;
    std::string mPort;
    std::string mBasePath;
    int         mTimeoutMs;
    bool        mVerbose = false;
    bool        mUseSsl  = false;

    Response doHttpRequest(const std::string& target) const;
    Response doHttpsRequest(const std::string& target) const;
};

} // namespace topsellers
