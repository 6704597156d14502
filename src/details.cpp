#include "details.hpp"
#include "work_queue.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

namespace topsellers {

DetailsEnricher::DetailsEnricher(const DetailsSource& source, int concurrency, bool verbose)
    : mSource(source)
    , mConcurrency(concurrency)
    , mVerbose(verbose)
{
    if (concurrency < 1) {
        throw std::invalid_argument("details concurrency must be at least 1");
    }
}

void DetailsEnricher::enrich(std::vector<Item>& items)
{
    std::vector<std::size_t> targets;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (items[i].appId) targets.push_back(i);
    }

    mStats = Stats{};
    mStats.requested = static_cast<int>(targets.size());
    if (targets.empty()) return;

    std::atomic<int> attached{0};
    std::atomic<int> missing{0};
    std::atomic<int> failed{0};

    WorkQueue queue(static_cast<int>(targets.size()));
    const int workers = std::min(mConcurrency, static_cast<int>(targets.size()));

    // Each claim owns a distinct element of items, so writes need no lock.
    runWorkers(
        workers,
        [&](int) {
            while (auto k = queue.claim()) {
                Item& item = items[targets[static_cast<std::size_t>(*k)]];
                try {
                    auto details = mSource.fetchAppDetails(*item.appId);
                    if (details) {
                        item.details = std::move(*details);
                        ++attached;
                        if (mVerbose) {
                            std::cerr << "[Details] Fetched " + item.name + "\n";
                        }
                    } else {
                        ++missing;
                        std::cerr << "[Details] No store details for " +
                                         item.name + " (" + item.id + ")\n";
                    }
                } catch (const std::exception& e) {
                    ++failed;
                    std::cerr << "[Details] Error fetching details for " +
                                     item.name + ": " + e.what() + "\n";
                }
            }
        },
        [] {});

    mStats.attached = attached.load();
    mStats.missing  = missing.load();
    mStats.failed   = failed.load();
}

} // namespace topsellers
