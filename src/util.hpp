#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace topsellers {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "8080", etc.
    std::string target;   // path component (e.g. "/search/results/")
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Percent-encode everything outside the RFC 3986 unreserved set.
std::string urlEncode(const std::string& value);

/// "a=1&b=x%20y" in the given parameter order.
std::string buildQueryString(const QueryParams& params);

/// Join a base path and a relative path with exactly one '/' between them.
std::string joinPath(const std::string& base, const std::string& path);

/// Compute exponential-backoff delay with random jitter.
/// attempt is 0-based.  Clamped to [baseMs .. maxMs] before jitter.
std::chrono::milliseconds computeBackoffMs(int attempt,
                                           int64_t baseMs = 200,
                                           int64_t maxMs  = 5000);

} // namespace topsellers
