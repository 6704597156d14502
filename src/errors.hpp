#pragma once

#include "models.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace topsellers {

/// Network, TLS or timeout failure while talking to the remote endpoint.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A response arrived but its payload is not the expected shape.
class SchemaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The output file could not be written.
class IoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// One or more pages failed permanently under the strict policy.
class AggregationError : public std::runtime_error {
public:
    explicit AggregationError(std::vector<PageFailure> failures);

    const std::vector<PageFailure>& failures() const { return mFailures; }
    std::vector<int> failedIndices() const;

private:
    std::vector<PageFailure> mFailures;
};

/// "page 1 (TransportError: timed out), page 4 (HttpError: HTTP 503)"
std::string describeFailures(const std::vector<PageFailure>& failures);

} // namespace topsellers
