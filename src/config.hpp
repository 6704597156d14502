#pragma once

#include "endpoints.hpp"

#include <string>

namespace topsellers {

struct Config {
    std::string endpoint           = endpoints::kDefaultEndpoint;
    std::string filter             = endpoints::kDefaultFilter;
    std::string category           = endpoints::kDefaultCategory;
    std::string outputPath         = "search_results.json";
    int         totalPages         = 2;
    int         pageSize           = 25;
    int         concurrency        = 2;
    int         timeoutMs          = 10000;
    int         maxAttempts        = 3;
    bool        bestEffort         = false;
    bool        failFast           = false;
    bool        fetchDetails       = false;
    int         detailsConcurrency = 10;
    bool        verbose            = false;
    bool        showHelp           = false;
};

/// Parse command-line flags on top of the defaults above.
/// @throws std::invalid_argument on unknown flags, missing or non-numeric values.
Config parseArgs(int argc, const char* const argv[]);

/// @throws std::invalid_argument if a count, size or timeout is not positive,
///         pages x page size does not fit in an int, or the output path is empty.
void validate(const Config& cfg);

std::string usage();

} // namespace topsellers
