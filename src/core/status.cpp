#include <vectrix/core/status.hpp>

namespace vectrix {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::CONFLICT: return "conflict";
        case ErrorKind::STATE: return "state";
        case ErrorKind::IO: return "io";
        case ErrorKind::UPSTREAM: return "upstream";
        case ErrorKind::NOT_FOUND: return "not_found";
        case ErrorKind::PARSE: return "parse";
        default: return "unknown";
    }
}

} // namespace vectrix
