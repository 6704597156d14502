#include "errors.hpp"

#include <sstream>

namespace topsellers {

AggregationError::AggregationError(std::vector<PageFailure> failures)
    : std::runtime_error(std::to_string(failures.size()) +
                         " page(s) failed: " + describeFailures(failures))
    , mFailures(std::move(failures)) {}

std::vector<int> AggregationError::failedIndices() const {
    std::vector<int> indices;
    indices.reserve(mFailures.size());
    for (const auto& f : mFailures) {
        indices.push_back(f.index);
    }
    return indices;
}

std::string describeFailures(const std::vector<PageFailure>& failures) {
    std::ostringstream out;
    for (std::size_t i = 0; i < failures.size(); ++i) {
        const auto& f = failures[i];
        if (i > 0) out << ", ";
        out << "page " << f.index << " (" << toString(f.kind) << ": "
            << f.detail << ")";
    }
    return out.str();
}

} // namespace topsellers
