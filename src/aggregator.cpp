#include "aggregator.hpp"
#include "errors.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace topsellers {

ResultAggregator::ResultAggregator(int totalPages)
    : mTotalPages(totalPages)
{
    if (totalPages < 0) {
        throw std::invalid_argument("total pages must not be negative");
    }
}

void ResultAggregator::record(PageResult result)
{
    const int index = pageIndex(result);
    if (index < 0 || index >= mTotalPages) {
        throw std::logic_error("page index " + std::to_string(index) +
                               " outside [0, " + std::to_string(mTotalPages) + ")");
    }

    std::lock_guard<std::mutex> lock(mMutex);
    const bool inserted = mResults.emplace(index, std::move(result)).second;
    if (!inserted) {
        throw std::logic_error("page " + std::to_string(index) +
                               " recorded twice");
    }
}

bool ResultAggregator::isComplete() const
{
    std::lock_guard<std::mutex> lock(mMutex);
    // Indices are range-checked on insert, so size equality means no gaps.
    return static_cast<int>(mResults.size()) == mTotalPages;
}

int ResultAggregator::recordedCount() const
{
    std::lock_guard<std::mutex> lock(mMutex);
    return static_cast<int>(mResults.size());
}

std::vector<PageFailure> ResultAggregator::failures() const
{
    std::lock_guard<std::mutex> lock(mMutex);
    std::vector<PageFailure> out;
    for (const auto& [index, result] : mResults) {
        if (const auto* f = std::get_if<PageFailure>(&result)) {
            out.push_back(*f);
        }
    }
    return out;
}

OutputDocument ResultAggregator::finalize(FailurePolicy policy) const
{
    std::lock_guard<std::mutex> lock(mMutex);

    if (static_cast<int>(mResults.size()) != mTotalPages) {
        throw std::logic_error("finalize called with " +
                               std::to_string(mResults.size()) + " of " +
                               std::to_string(mTotalPages) + " pages recorded");
    }

    OutputDocument doc;
    for (const auto& [index, result] : mResults) {
        if (const auto* ok = std::get_if<PageSuccess>(&result)) {
            doc.items.insert(doc.items.end(), ok->items.begin(), ok->items.end());
        } else {
            doc.failures.push_back(std::get<PageFailure>(result));
        }
    }

    if (!doc.failures.empty()) {
        if (policy == FailurePolicy::Strict) {
            throw AggregationError(std::move(doc.failures));
        }
        doc.partial = true;
    }
    return doc;
}

} // namespace topsellers
