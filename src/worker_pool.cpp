#include "worker_pool.hpp"
#include "util.hpp"
#include "work_queue.hpp"

#include <algorithm>
#include <climits>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace topsellers {

PageFetchPool::PageFetchPool(PageSource& source, PoolOptions options, bool verbose)
    : mSource(source)
    , mOptions(std::move(options))
    , mVerbose(verbose)
{
    if (mOptions.concurrency < 1) {
        throw std::invalid_argument("concurrency must be at least 1, got " +
                                    std::to_string(mOptions.concurrency));
    }
    if (mOptions.pageSize < 1) {
        throw std::invalid_argument("page size must be at least 1, got " +
                                    std::to_string(mOptions.pageSize));
    }
    if (mOptions.retry.maxAttempts < 1) {
        throw std::invalid_argument("max attempts must be at least 1, got " +
                                    std::to_string(mOptions.retry.maxAttempts));
    }
}

// ---------------------------------------------------------------------------
// Public: run
// ---------------------------------------------------------------------------

void PageFetchPool::run(int totalPages, const ResultHandler& onResult)
{
    if (totalPages < 0) {
        throw std::invalid_argument("total pages must not be negative");
    }
    if (static_cast<int64_t>(totalPages) * mOptions.pageSize > INT_MAX) {
        throw std::invalid_argument("total pages x page size overflows the item offset");
    }
    resetStats();
    if (totalPages == 0) return;

    WorkQueue queue(totalPages);
    const int workers = std::min(mOptions.concurrency, totalPages);

    if (mVerbose) {
        std::cerr << "[Pool] Fetching " + std::to_string(totalPages) +
                         " page(s) with " + std::to_string(workers) +
                         " worker(s)\n";
    }

    runWorkers(
        workers,
        [&](int worker) {
            while (auto index = queue.claim()) {
                const PageRequest request{*index, mOptions.pageSize};

                PageResult result;
                if (mStop.load()) {
                    result = PageFailure{request.index, ErrorKind::Cancelled,
                                         "cancelled before dispatch", 0, 0};
                } else {
                    result = fetchWithRetry(request);
                }

                if (const auto* ok = std::get_if<PageSuccess>(&result)) {
                    ++mSucceeded;
                    mItems += static_cast<int>(ok->items.size());
                    if (mVerbose) {
                        std::cerr << "[Pool] worker " + std::to_string(worker) +
                                         ": page " + std::to_string(ok->index) +
                                         " ok, " + std::to_string(ok->items.size()) +
                                         " item(s)\n";
                    }
                } else {
                    const auto& failure = std::get<PageFailure>(result);
                    if (failure.kind == ErrorKind::Cancelled) {
                        ++mCancelled;
                    } else {
                        ++mFailed;
                        std::cerr << "[Pool] page " + std::to_string(failure.index) +
                                         " failed after " +
                                         std::to_string(failure.attempts) +
                                         " attempt(s): " + toString(failure.kind) +
                                         ": " + failure.detail + "\n";
                        if (mOptions.stopOnFailure) {
                            requestStop();
                        }
                    }
                }

                onResult(std::move(result));
            }
        },
        [this] { requestStop(); });
}

std::vector<PageResult> PageFetchPool::run(int totalPages)
{
    std::mutex              mutex;
    std::vector<PageResult> results;
    results.reserve(totalPages > 0 ? static_cast<std::size_t>(totalPages) : 0);

    run(totalPages, [&](PageResult result) {
        std::lock_guard<std::mutex> lock(mutex);
        results.push_back(std::move(result));
    });
    return results;
}

void PageFetchPool::requestStop()
{
    {
        std::lock_guard<std::mutex> lock(mStopMutex);
        mStop.store(true);
    }
    mStopCv.notify_all();
}

PageFetchPool::Stats PageFetchPool::getStats() const
{
    Stats stats;
    stats.pagesSucceeded = mSucceeded.load();
    stats.pagesFailed    = mFailed.load();
    stats.pagesCancelled = mCancelled.load();
    stats.totalRequests  = mRequests.load();
    stats.totalRetries   = mRetries.load();
    stats.itemsFetched   = mItems.load();
    return stats;
}

bool PageFetchPool::isRetryable(const PageFailure& failure)
{
    switch (failure.kind) {
    case ErrorKind::TransportError:
        return true;
    case ErrorKind::HttpError:
        return failure.httpStatus == 429 || failure.httpStatus >= 500;
    case ErrorKind::SchemaError:
    case ErrorKind::Cancelled:
        return false;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Private: retry wrapper
// ---------------------------------------------------------------------------

PageResult PageFetchPool::fetchWithRetry(const PageRequest& request)
{
    const int maxAttempts = mOptions.retry.maxAttempts;

    for (int attempt = 0;; ++attempt) {
        ++mRequests;

        PageResult result;
        try {
            result = mSource.fetchPage(request);
        } catch (const std::exception& e) {
            // PageSource implementations report failures as values; a throw
            // still has to resolve this index.
            result = PageFailure{request.index, ErrorKind::TransportError, e.what()};
        }

        auto* failure = std::get_if<PageFailure>(&result);
        if (failure == nullptr) {
            return result;
        }
        failure->attempts = attempt + 1;

        if (!isRetryable(*failure) || attempt + 1 >= maxAttempts || mStop.load()) {
            return result;
        }

        ++mRetries;
        if (mVerbose) {
            std::cerr << "[Retry] page " + std::to_string(request.index) + ": " +
                             toString(failure->kind) + ": " + failure->detail +
                             " - attempt " + std::to_string(attempt + 1) + "/" +
                             std::to_string(maxAttempts) + "\n";
        }

        if (!waitBackoff(attempt)) {
            return result;
        }
    }
}

bool PageFetchPool::waitBackoff(int attempt)
{
    const auto backoff = computeBackoffMs(attempt,
                                          mOptions.retry.baseBackoffMs,
                                          mOptions.retry.maxBackoffMs);

    std::unique_lock<std::mutex> lock(mStopMutex);
    return !mStopCv.wait_for(lock, backoff, [this] { return mStop.load(); });
}

void PageFetchPool::resetStats()
{
    mSucceeded = 0;
    mFailed    = 0;
    mCancelled = 0;
    mRequests  = 0;
    mRetries   = 0;
    mItems     = 0;
}

} // namespace topsellers
