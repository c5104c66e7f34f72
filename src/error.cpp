#include <dslrun/error.hpp>

namespace dslrun {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::TypeMismatch:    return "TypeMismatch";
        case ErrorKind::InvalidPosition: return "InvalidPosition";
        case ErrorKind::NotAFunction:    return "NotAFunction";
        case ErrorKind::OperationError:  return "OperationError";
        case ErrorKind::MalformedNode:   return "MalformedNode";
    }
    return "Unknown";
}

} // namespace dslrun
