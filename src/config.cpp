#include "config.hpp"

#include <climits>
#include <cstdint>
#include <sstream>
#include <stdexcept>

namespace topsellers {

namespace {

int parseInt(const std::string& flag, const std::string& value) {
    std::size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
    return parsed;
}

void requirePositive(const char* name, int value) {
    if (value < 1) {
        throw std::invalid_argument(std::string(name) + " must be positive, got " +
                                    std::to_string(value));
    }
}

} // namespace

std::string usage() {
    std::ostringstream out;
    out << "Usage: topsellers [options]\n\n"
        << "Options:\n"
        << "  --endpoint URL            Store base URL       (default: "
        << endpoints::kDefaultEndpoint << ")\n"
        << "  --pages N                 Pages to fetch       (default: 2)\n"
        << "  --page-size N             Items per page       (default: 25)\n"
        << "  --concurrency N           Concurrent workers   (default: 2)\n"
        << "  --output PATH             Output JSON file     (default: search_results.json)\n"
        << "  --timeout-ms N            HTTP timeout in ms   (default: 10000)\n"
        << "  --max-attempts N          Attempts per page    (default: 3)\n"
        << "  --filter NAME             Listing filter       (default: "
        << endpoints::kDefaultFilter << ")\n"
        << "  --category ID             Listing category     (default: "
        << endpoints::kDefaultCategory << ")\n"
        << "  --best-effort             Write the pages that succeeded even if some failed\n"
        << "  --fail-fast               Cancel remaining pages after the first failure\n"
        << "  --details                 Attach store details to every app\n"
        << "  --details-concurrency N   Details workers      (default: 10)\n"
        << "  --verbose                 Enable verbose diagnostics\n"
        << "  --help, -h                Show this message\n";
    return out.str();
}

Config parseArgs(int argc, const char* const argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--endpoint") {
            cfg.endpoint = next();
        } else if (arg == "--pages") {
            cfg.totalPages = parseInt(arg, next());
        } else if (arg == "--page-size") {
            cfg.pageSize = parseInt(arg, next());
        } else if (arg == "--concurrency") {
            cfg.concurrency = parseInt(arg, next());
        } else if (arg == "--output") {
            cfg.outputPath = next();
        } else if (arg == "--timeout-ms") {
            cfg.timeoutMs = parseInt(arg, next());
        } else if (arg == "--max-attempts") {
            cfg.maxAttempts = parseInt(arg, next());
        } else if (arg == "--filter") {
            cfg.filter = next();
        } else if (arg == "--category") {
            cfg.category = next();
        } else if (arg == "--best-effort") {
            cfg.bestEffort = true;
        } else if (arg == "--fail-fast") {
            cfg.failFast = true;
        } else if (arg == "--details") {
            cfg.fetchDetails = true;
        } else if (arg == "--details-concurrency") {
            cfg.detailsConcurrency = parseInt(arg, next());
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            cfg.showHelp = true;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return cfg;
}

void validate(const Config& cfg) {
    requirePositive("pages", cfg.totalPages);
    requirePositive("page size", cfg.pageSize);
    requirePositive("concurrency", cfg.concurrency);
    requirePositive("timeout", cfg.timeoutMs);
    requirePositive("max attempts", cfg.maxAttempts);
    requirePositive("details concurrency", cfg.detailsConcurrency);
    // Offsets and ranks are ints; the last one must still fit.
    if (static_cast<int64_t>(cfg.totalPages) * cfg.pageSize > INT_MAX) {
        throw std::invalid_argument("pages x page size exceeds " +
                                    std::to_string(INT_MAX) + " items");
    }
    if (cfg.outputPath.empty()) {
        throw std::invalid_argument("output path must not be empty");
    }
    if (cfg.endpoint.empty()) {
        throw std::invalid_argument("endpoint must not be empty");
    }
}

} // namespace topsellers
