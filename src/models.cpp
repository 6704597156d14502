#include "models.hpp"

namespace topsellers {

const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::TransportError: return "TransportError";
    case ErrorKind::HttpError:      return "HttpError";
    case ErrorKind::SchemaError:    return "SchemaError";
    case ErrorKind::Cancelled:      return "Cancelled";
    }
    return "Unknown";
}

int pageIndex(const PageResult& result) {
    return std::visit([](const auto& r) { return r.index; }, result);
}

bool isSuccess(const PageResult& result) {
    return std::holds_alternative<PageSuccess>(result);
}

} // namespace topsellers
