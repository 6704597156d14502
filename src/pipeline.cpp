#include "pipeline.hpp"
#include "aggregator.hpp"
#include "errors.hpp"
#include "output_writer.hpp"
#include "worker_pool.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace topsellers {

int runPipeline(const Config& cfg, PageSource& pages, DetailsSource& details)
{
    try {
        validate(cfg);

        PoolOptions options;
        options.concurrency       = cfg.concurrency;
        options.pageSize          = cfg.pageSize;
        options.retry.maxAttempts = cfg.maxAttempts;
        options.stopOnFailure     = cfg.failFast;
        PageFetchPool pool(pages, options, cfg.verbose);

        ResultAggregator aggregator(cfg.totalPages);

        std::cout << "Retrieving " << cfg.totalPages * cfg.pageSize
                  << " items from the store... " << std::flush;
        pool.run(cfg.totalPages,
                 [&aggregator](PageResult result) { aggregator.record(std::move(result)); });

        const auto stats = pool.getStats();
        std::cout << (stats.pagesFailed + stats.pagesCancelled == 0 ? "[OK]" : "[FAILED]")
                  << "\n";

        OutputDocument doc;
        try {
            doc = aggregator.finalize(cfg.bestEffort ? FailurePolicy::BestEffort
                                                     : FailurePolicy::Strict);
        } catch (const AggregationError& e) {
            std::cerr << "Fatal error: " << e.what() << "\n"
                      << "No output written to " << cfg.outputPath << "\n";
            return kExitFailure;
        }

        if (doc.partial) {
            std::cerr << "Warning: " << doc.failures.size()
                      << " page(s) failed, writing the remaining "
                      << doc.items.size() << " item(s): "
                      << describeFailures(doc.failures) << "\n";
        }

        DetailsEnricher::Stats enriched;
        if (cfg.fetchDetails) {
            std::cout << "Fetching store details for " << doc.items.size()
                      << " item(s)...\n";
            DetailsEnricher enricher(details, cfg.detailsConcurrency, cfg.verbose);
            enricher.enrich(doc.items);
            enriched = enricher.getStats();
        }

        OutputWriter writer(cfg.verbose);
        writer.write(doc, cfg.outputPath);

        std::cout
            << "\n=== Summary Report ===\n"
            << "Items written:       " << doc.items.size()      << "\n"
            << "Pages succeeded:     " << stats.pagesSucceeded  << "\n"
            << "Pages failed:        " << stats.pagesFailed     << "\n"
            << "Pages cancelled:     " << stats.pagesCancelled  << "\n"
            << "Total requests:      " << stats.totalRequests   << "\n"
            << "Total retries:       " << stats.totalRetries    << "\n";
        if (cfg.fetchDetails) {
            std::cout
                << "Details attached:    " << enriched.attached << "/"
                                           << enriched.requested << "\n";
        }
        std::cout
            << "Output:              " << cfg.outputPath << "\n"
            << "======================\n";

        return doc.partial ? kExitPartial : kExitOk;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return kExitFailure;
    }
}

} // namespace topsellers
