#pragma once

#include "models.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

namespace topsellers {

/// Source of per-app store details.
class DetailsSource {
public:
    virtual ~DetailsSource() = default;

    /// std::nullopt when the store has no details for @p appId.
    /// Throws on transport, status or schema failures.
    virtual std::optional<nlohmann::json> fetchAppDetails(int64_t appId) const = 0;
};

/// Attaches store details to every item that carries an app id.
/// Best-effort: a failed lookup is logged and leaves the item untouched.
class DetailsEnricher {
public:
    struct Stats {
        int requested = 0;
        int attached  = 0;
        int missing   = 0;   // store answered success=false
        int failed    = 0;
    };

    /// @throws std::invalid_argument if concurrency is below 1.
    DetailsEnricher(const DetailsSource& source, int concurrency, bool verbose = false);

    void enrich(std::vector<Item>& items);

    Stats getStats() const { return mStats; }

private:
    const DetailsSource& mSource;
    int                  mConcurrency;
    bool                 mVerbose;
    Stats                mStats{};
};

} // namespace topsellers
