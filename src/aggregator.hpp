#pragma once

#include "models.hpp"

#include <map>
#include <mutex>
#include <vector>

namespace topsellers {

enum class FailurePolicy {
    Strict,       // any failed page fails the whole run
    BestEffort    // keep the successful pages, report the rest
};

/// Collects PageResults in any order and flattens them by page index.
/// record() may be called concurrently from pool workers.
class ResultAggregator {
public:
    /// @throws std::invalid_argument if totalPages is negative.
    explicit ResultAggregator(int totalPages);

    /// @throws std::logic_error on an out-of-range or already recorded index.
    void record(PageResult result);

    bool isComplete() const;
    int  recordedCount() const;
    int  totalPages() const { return mTotalPages; }

    /// Failures recorded so far, ascending by index.
    std::vector<PageFailure> failures() const;

    /// Build the final document.
    /// @throws std::logic_error if not every page has been recorded.
    /// @throws AggregationError under FailurePolicy::Strict when any page failed.
    OutputDocument finalize(FailurePolicy policy = FailurePolicy::Strict) const;

private:
    const int                  mTotalPages;
    mutable std::mutex         mMutex;
    std::map<int, PageResult>  mResults;   // ordered by page index
};

} // namespace topsellers
