#pragma once

#include "models.hpp"
#include "store_client.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace topsellers {

/// Per-page retry policy applied by the pool around PageSource::fetchPage.
struct RetryPolicy {
    int     maxAttempts  = 3;     // 1 disables retries
    int64_t baseBackoffMs = 200;
    int64_t maxBackoffMs  = 5000;
};

struct PoolOptions {
    int         concurrency   = 2;
    int         pageSize      = 25;
    RetryPolicy retry;
    bool        stopOnFailure = false;   // cancel the rest after a permanent failure
};

/// Fixed-size pool of worker threads that claim page indices from a shared
/// queue and fetch them through a PageSource.
///
/// Every index in [0, totalPages) yields exactly one PageResult, delivered in
/// completion order.  After requestStop() the remaining indices are still
/// claimed but resolve immediately as ErrorKind::Cancelled failures.
class PageFetchPool {
public:
    struct Stats {
        int pagesSucceeded = 0;
        int pagesFailed    = 0;   // permanent failures, cancellations excluded
        int pagesCancelled = 0;
        int totalRequests  = 0;
        int totalRetries   = 0;
        int itemsFetched   = 0;
    };

    /// Called from worker threads, possibly concurrently.
    using ResultHandler = std::function<void(PageResult)>;

    /// @throws std::invalid_argument if concurrency, pageSize or
    ///         retry.maxAttempts is below 1.
    PageFetchPool(PageSource& source, PoolOptions options, bool verbose = false);

    /// Fetch pages [0, totalPages) and stream each result to @p onResult.
    /// Returns once every index has been resolved.  An exception thrown by
    /// @p onResult stops the pool and is rethrown here.
    void run(int totalPages, const ResultHandler& onResult);

    /// Convenience overload collecting the results in completion order.
    std::vector<PageResult> run(int totalPages);

    /// Ask in-flight workers to finish up.  Sticky for the pool's lifetime.
    void requestStop();
    bool stopRequested() const { return mStop.load(); }

    Stats getStats() const;

    /// Transport failures, 429 and 5xx responses are worth another attempt.
    static bool isRetryable(const PageFailure& failure);

private:
    PageSource& mSource;
    PoolOptions mOptions;
    bool        mVerbose;

    std::atomic<bool>       mStop{false};
    std::mutex              mStopMutex;
    std::condition_variable mStopCv;

    std::atomic<int> mSucceeded{0};
    std::atomic<int> mFailed{0};
    std::atomic<int> mCancelled{0};
    std::atomic<int> mRequests{0};
    std::atomic<int> mRetries{0};
    std::atomic<int> mItems{0};

    PageResult fetchWithRetry(const PageRequest& request);

    /// Sleep for the backoff of @p attempt.  Returns false if interrupted
    /// by requestStop().
    bool waitBackoff(int attempt);

    void resetStats();
};

} // namespace topsellers
