#pragma once

#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

namespace topsellers {

/// Index queue pre-filled with [0, count).  Each index is handed out once.
class WorkQueue {
public:
    explicit WorkQueue(int count) : mCount(count < 0 ? 0 : count) {}

    /// Claim the next unclaimed index, or std::nullopt when exhausted.
    std::optional<int> claim() {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mNext >= mCount) return std::nullopt;
        return mNext++;
    }

    int claimed() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mNext;
    }

    int size() const { return mCount; }

private:
    mutable std::mutex mMutex;
    int                mNext = 0;
    const int          mCount;
};

/// Run @p body on @p workers threads and join them all.
/// @p body receives the worker number.  The first exception thrown by any
/// worker is rethrown here after every thread has been joined; the body is
/// expected to stop its own loop once @p onError has been called.
template <class Body, class OnError>
void runWorkers(int workers, Body body, OnError onError) {
    if (workers < 1) {
        throw std::invalid_argument("worker count must be at least 1");
    }

    std::mutex         errorMutex;
    std::exception_ptr firstError;

    std::vector<std::thread> threads;
    threads.reserve(static_cast<std::size_t>(workers));
    auto joinAll = [&threads] {
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    };

    try {
        for (int w = 0; w < workers; ++w) {
            threads.emplace_back([&, w] {
                try {
                    body(w);
                } catch (const std::exception&) {
                    {
                        std::lock_guard<std::mutex> lock(errorMutex);
                        if (!firstError) firstError = std::current_exception();
                    }
                    onError();
                }
            });
        }
    } catch (const std::system_error&) {
        // Could not start every thread: let the running ones drain and fail.
        onError();
        joinAll();
        throw;
    }
    joinAll();

    if (firstError) {
        std::rethrow_exception(firstError);
    }
}

} // namespace topsellers
