#include "config.hpp"
#include "http_client.hpp"
#include "pipeline.hpp"
#include "store_client.hpp"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    using namespace topsellers;

    Config cfg;
    try {
        cfg = parseArgs(argc, argv);
        if (cfg.showHelp) {
            std::cout << usage();
            return kExitOk;
        }
        validate(cfg);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << usage();
        return kExitFailure;
    }

    try {
        std::cout
            << "=== topsellers ===\n"
            << "Endpoint:     " << cfg.endpoint    << "\n"
            << "Listing:      " << cfg.filter << " / " << cfg.category << "\n"
            << "Pages:        " << cfg.totalPages  << " x " << cfg.pageSize << "\n"
            << "Concurrency:  " << cfg.concurrency << "\n"
            << "Timeout:      " << cfg.timeoutMs   << " ms\n"
            << "Policy:       " << (cfg.bestEffort ? "best-effort" : "strict")
                                << (cfg.failFast ? ", fail-fast" : "") << "\n"
            << "Output:       " << cfg.outputPath  << "\n"
            << "==================\n\n";

        HttpClient http(cfg.endpoint, cfg.timeoutMs);
        http.setVerbose(cfg.verbose);
        StoreClient store(http, {cfg.filter, cfg.category});

        return runPipeline(cfg, store, store);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return kExitFailure;
    }
}
