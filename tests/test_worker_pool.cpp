/// @file test_worker_pool.cpp
/// Unit tests for worker_pool.hpp — claims, concurrency bound, retries and
/// cancellation, driven by a scripted PageSource.

#include "aggregator.hpp"
#include "errors.hpp"
#include "fake_page_source.hpp"
#include "worker_pool.hpp"

#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include <vector>

using namespace topsellers;
using topsellers::test_support::FakePageSource;
using topsellers::test_support::makePageItems;

namespace {

PoolOptions fastOptions(int concurrency, int pageSize = 25, int maxAttempts = 1) {
    PoolOptions options;
    options.concurrency        = concurrency;
    options.pageSize           = pageSize;
    options.retry.maxAttempts  = maxAttempts;
    options.retry.baseBackoffMs = 1;
    options.retry.maxBackoffMs  = 2;
    return options;
}

std::multiset<int> indicesOf(const std::vector<PageResult>& results) {
    std::multiset<int> out;
    for (const auto& r : results) out.insert(pageIndex(r));
    return out;
}

std::multiset<int> range(int n) {
    std::multiset<int> out;
    for (int i = 0; i < n; ++i) out.insert(i);
    return out;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST(PageFetchPool, ZeroConcurrencyIsRejected) {
    FakePageSource source;
    EXPECT_THROW(PageFetchPool(source, fastOptions(0)), std::invalid_argument);
}

TEST(PageFetchPool, NonPositivePageSizeIsRejected) {
    FakePageSource source;
    EXPECT_THROW(PageFetchPool(source, fastOptions(2, 0)), std::invalid_argument);
}

TEST(PageFetchPool, ZeroAttemptsIsRejected) {
    FakePageSource source;
    EXPECT_THROW(PageFetchPool(source, fastOptions(2, 25, 0)), std::invalid_argument);
}

TEST(PageFetchPool, NegativePageCountIsRejected) {
    FakePageSource source;
    PageFetchPool pool(source, fastOptions(2));
    EXPECT_THROW(pool.run(-1), std::invalid_argument);
}

// ============================================================================
// Exactly one result per index
// ============================================================================

TEST(PageFetchPool, OffsetOverflowIsRejectedBeforeAnyFetch) {
    FakePageSource source;
    PageFetchPool pool(source, fastOptions(2, 100000));
    EXPECT_THROW(pool.run(100000), std::invalid_argument);
    EXPECT_EQ(source.totalCalls(), 0);
}

TEST(PageFetchPool, ZeroPagesYieldsNothing) {
    FakePageSource source;
    PageFetchPool pool(source, fastOptions(4));

    auto results = pool.run(0);
    EXPECT_TRUE(results.empty());
    EXPECT_EQ(source.totalCalls(), 0);
}

TEST(PageFetchPool, EveryIndexExactlyOnceAcrossShapes) {
    const std::vector<std::pair<int, int>> shapes = {
        {1, 1}, {2, 2}, {7, 3}, {3, 8}, {16, 4}, {25, 1}, {10, 10}};

    for (const auto& [pages, workers] : shapes) {
        FakePageSource source;
        source.setMaxDelayMs(3);
        PageFetchPool pool(source, fastOptions(workers, 5));

        auto results = pool.run(pages);
        EXPECT_EQ(indicesOf(results), range(pages))
            << pages << " pages / " << workers << " workers";
        for (int i = 0; i < pages; ++i) {
            EXPECT_EQ(source.callsFor(i), 1) << "page " << i;
        }
        EXPECT_EQ(pool.getStats().pagesSucceeded, pages);
        EXPECT_EQ(pool.getStats().itemsFetched, pages * 5);
    }
}

TEST(PageFetchPool, ConcurrencyBoundIsRespectedAndReached) {
    FakePageSource source;
    source.setMaxDelayMs(20);
    PageFetchPool pool(source, fastOptions(3));

    auto results = pool.run(12);
    EXPECT_EQ(results.size(), 12u);
    EXPECT_LE(source.maxInFlight(), 3);
    EXPECT_GE(source.maxInFlight(), 2);
}

TEST(PageFetchPool, MoreWorkersThanPagesIsFine) {
    FakePageSource source;
    PageFetchPool pool(source, fastOptions(32));

    auto results = pool.run(3);
    EXPECT_EQ(indicesOf(results), range(3));
    EXPECT_LE(source.maxInFlight(), 3);
}

TEST(PageFetchPool, StreamsResultsToHandler) {
    FakePageSource source;
    source.setMaxDelayMs(5);
    PageFetchPool pool(source, fastOptions(4));

    std::mutex mutex;
    std::vector<int> seen;
    pool.run(9, [&](PageResult result) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(pageIndex(result));
    });

    std::multiset<int> got(seen.begin(), seen.end());
    EXPECT_EQ(got, range(9));
}

// ============================================================================
// Retry policy
// ============================================================================

TEST(PageFetchPool, TransportErrorIsRetriedUntilSuccess) {
    FakePageSource source([](const PageRequest& req, int attempt) -> PageResult {
        if (req.index == 1 && attempt < 3) {
            return PageFailure{req.index, ErrorKind::TransportError, "connection reset"};
        }
        return PageSuccess{req.index, makePageItems(req)};
    });
    PageFetchPool pool(source, fastOptions(2, 25, 3));

    auto results = pool.run(2);
    ASSERT_EQ(results.size(), 2u);
    for (const auto& r : results) EXPECT_TRUE(isSuccess(r));
    EXPECT_EQ(source.callsFor(1), 3);
    EXPECT_EQ(pool.getStats().totalRetries, 2);
    EXPECT_EQ(pool.getStats().totalRequests, 4);
}

TEST(PageFetchPool, GivesUpAfterMaxAttempts) {
    FakePageSource source([](const PageRequest& req, int) -> PageResult {
        PageFailure f{req.index, ErrorKind::HttpError, "HTTP 503"};
        f.httpStatus = 503;
        return f;
    });
    PageFetchPool pool(source, fastOptions(1, 25, 4));

    auto results = pool.run(1);
    ASSERT_EQ(results.size(), 1u);
    const auto& failure = std::get<PageFailure>(results[0]);
    EXPECT_EQ(failure.kind, ErrorKind::HttpError);
    EXPECT_EQ(failure.attempts, 4);
    EXPECT_EQ(source.callsFor(0), 4);
    EXPECT_EQ(pool.getStats().pagesFailed, 1);
}

TEST(PageFetchPool, PermanentFailuresAreNotRetried) {
    FakePageSource source([](const PageRequest& req, int) -> PageResult {
        if (req.index == 0) {
            return PageFailure{req.index, ErrorKind::SchemaError, "missing 'items'"};
        }
        PageFailure f{req.index, ErrorKind::HttpError, "HTTP 404"};
        f.httpStatus = 404;
        return f;
    });
    PageFetchPool pool(source, fastOptions(2, 25, 5));

    auto results = pool.run(2);
    EXPECT_EQ(source.callsFor(0), 1);
    EXPECT_EQ(source.callsFor(1), 1);
    EXPECT_EQ(pool.getStats().totalRetries, 0);
    EXPECT_EQ(pool.getStats().pagesFailed, 2);
}

TEST(PageFetchPool, IsRetryableClassification) {
    PageFailure f;
    f.kind = ErrorKind::TransportError;
    EXPECT_TRUE(PageFetchPool::isRetryable(f));

    f.kind = ErrorKind::HttpError;
    f.httpStatus = 429;
    EXPECT_TRUE(PageFetchPool::isRetryable(f));
    f.httpStatus = 502;
    EXPECT_TRUE(PageFetchPool::isRetryable(f));
    f.httpStatus = 403;
    EXPECT_FALSE(PageFetchPool::isRetryable(f));

    f.kind = ErrorKind::SchemaError;
    EXPECT_FALSE(PageFetchPool::isRetryable(f));
    f.kind = ErrorKind::Cancelled;
    EXPECT_FALSE(PageFetchPool::isRetryable(f));
}

TEST(PageFetchPool, ThrowingSourceBecomesTransportFailure) {
    FakePageSource source([](const PageRequest& req, int) -> PageResult {
        if (req.index == 2) throw std::runtime_error("socket exploded");
        return PageSuccess{req.index, makePageItems(req)};
    });
    PageFetchPool pool(source, fastOptions(2));

    auto results = pool.run(4);
    EXPECT_EQ(indicesOf(results), range(4));
    for (const auto& r : results) {
        if (pageIndex(r) != 2) continue;
        ASSERT_FALSE(isSuccess(r));
        EXPECT_EQ(std::get<PageFailure>(r).kind, ErrorKind::TransportError);
        EXPECT_EQ(std::get<PageFailure>(r).detail, "socket exploded");
    }
}

// ============================================================================
// Cancellation
// ============================================================================

TEST(PageFetchPool, StopOnFailureCancelsRemainingPages) {
    FakePageSource source([](const PageRequest& req, int) -> PageResult {
        if (req.index == 0) {
            return PageFailure{req.index, ErrorKind::SchemaError, "garbage"};
        }
        return PageSuccess{req.index, makePageItems(req)};
    });
    auto options = fastOptions(1);
    options.stopOnFailure = true;
    PageFetchPool pool(source, options);

    auto results = pool.run(5);
    EXPECT_EQ(indicesOf(results), range(5));
    EXPECT_TRUE(pool.stopRequested());

    // A single worker claims in order, so everything after page 0 is cancelled.
    for (const auto& r : results) {
        ASSERT_FALSE(isSuccess(r));
        const auto& f = std::get<PageFailure>(r);
        if (f.index == 0) {
            EXPECT_EQ(f.kind, ErrorKind::SchemaError);
        } else {
            EXPECT_EQ(f.kind, ErrorKind::Cancelled);
            EXPECT_EQ(source.callsFor(f.index), 0);
        }
    }
    EXPECT_EQ(pool.getStats().pagesFailed, 1);
    EXPECT_EQ(pool.getStats().pagesCancelled, 4);
}

TEST(PageFetchPool, RequestStopFromHandlerStillResolvesEveryIndex) {
    FakePageSource source;
    source.setMaxDelayMs(2);
    PageFetchPool pool(source, fastOptions(2));

    std::mutex mutex;
    std::vector<PageResult> results;
    pool.run(20, [&](PageResult result) {
        pool.requestStop();
        std::lock_guard<std::mutex> lock(mutex);
        results.push_back(std::move(result));
    });

    EXPECT_EQ(indicesOf(results), range(20));
    const auto stats = pool.getStats();
    EXPECT_EQ(stats.pagesSucceeded + stats.pagesCancelled, 20);
    EXPECT_GE(stats.pagesCancelled, 1);
    EXPECT_LE(stats.pagesSucceeded, 3);
}

TEST(PageFetchPool, HandlerExceptionIsRethrownAfterJoin) {
    FakePageSource source;
    PageFetchPool pool(source, fastOptions(3));

    std::atomic<int> delivered{0};
    EXPECT_THROW(pool.run(10, [&](PageResult result) {
                     ++delivered;
                     if (pageIndex(result) == 4) {
                         throw std::logic_error("handler rejected page 4");
                     }
                 }),
                 std::logic_error);
    EXPECT_TRUE(pool.stopRequested());
    EXPECT_EQ(delivered.load(), 10);
}

TEST(PageFetchPool, StopInterruptsBackoff) {
    FakePageSource source([](const PageRequest& req, int) -> PageResult {
        return PageFailure{req.index, ErrorKind::TransportError, "timed out"};
    });
    auto options = fastOptions(1, 25, 10);
    options.retry.baseBackoffMs = 60000;
    options.retry.maxBackoffMs  = 60000;
    PageFetchPool pool(source, options);

    std::thread stopper([&pool] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        pool.requestStop();
    });
    const auto start = std::chrono::steady_clock::now();
    auto results = pool.run(1);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    stopper.join();

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(std::get<PageFailure>(results[0]).kind, ErrorKind::TransportError);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

// ============================================================================
// Pool + aggregator scenarios
// ============================================================================

TEST(PoolScenario, TwoPagesOfTwentyFiveInRankOrder) {
    FakePageSource source;
    source.setMaxDelayMs(10);
    PageFetchPool pool(source, fastOptions(2, 25));
    ResultAggregator aggregator(2);

    pool.run(2, [&](PageResult r) { aggregator.record(std::move(r)); });

    ASSERT_TRUE(aggregator.isComplete());
    auto doc = aggregator.finalize();
    ASSERT_EQ(doc.items.size(), 50u);
    for (std::size_t i = 0; i < doc.items.size(); ++i) {
        EXPECT_EQ(doc.items[i].rank, static_cast<int>(i) + 1);
    }
    EXPECT_FALSE(doc.partial);
}

TEST(PoolScenario, MiddlePageTimesOut) {
    auto behaviour = [](const PageRequest& req, int) -> PageResult {
        if (req.index == 1) {
            return PageFailure{req.index, ErrorKind::TransportError, "timed out after 10000 ms"};
        }
        return PageSuccess{req.index, makePageItems(req)};
    };

    // Strict: finalize names exactly page 1.
    {
        FakePageSource source(behaviour);
        PageFetchPool pool(source, fastOptions(3, 25, 2));
        ResultAggregator aggregator(3);
        pool.run(3, [&](PageResult r) { aggregator.record(std::move(r)); });

        try {
            aggregator.finalize(FailurePolicy::Strict);
            FAIL() << "expected AggregationError";
        } catch (const AggregationError& e) {
            EXPECT_EQ(e.failedIndices(), std::vector<int>{1});
            EXPECT_EQ(e.failures()[0].kind, ErrorKind::TransportError);
        }
    }

    // Best effort: pages 0 and 2 only.
    {
        FakePageSource source(behaviour);
        PageFetchPool pool(source, fastOptions(3, 25, 2));
        ResultAggregator aggregator(3);
        pool.run(3, [&](PageResult r) { aggregator.record(std::move(r)); });

        auto doc = aggregator.finalize(FailurePolicy::BestEffort);
        EXPECT_TRUE(doc.partial);
        ASSERT_EQ(doc.items.size(), 50u);
        EXPECT_EQ(doc.items[24].rank, 25);
        EXPECT_EQ(doc.items[25].rank, 51);
        ASSERT_EQ(doc.failures.size(), 1u);
        EXPECT_EQ(doc.failures[0].index, 1);
    }
}
