// ============================================================================
// error.cpp — implementation for ventilink/error.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "ventilink/error.hpp"

#include <utility>

namespace ventilink {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                  return "none";
        case ErrorKind::InvalidArgument:       return "invalid_argument";
        case ErrorKind::Connection:            return "connection";
        case ErrorKind::ConnectionInterrupted: return "connection_interrupted";
        case ErrorKind::Read:                  return "read";
        case ErrorKind::Write:                 return "write";
        case ErrorKind::Busy:                  return "busy";
        case ErrorKind::Failure:               return "failure";
        case ErrorKind::Acknowledge:           return "acknowledge";
        case ErrorKind::Decode:                return "decode";
        case ErrorKind::PropertyNotSupported:  return "property_not_supported";
        case ErrorKind::Binding:               return "binding";
        case ErrorKind::NotImplemented:        return "not_implemented";
        case ErrorKind::NotFound:              return "not_found";
    }
    return "unknown";
}

bool fail(Error& err, ErrorKind kind, std::string reason, int exception_code) {
    err.kind = kind;
    err.exception_code = exception_code;
    err.reason = std::move(reason);
    return false;
}

std::string describe(const Error& err) {
    std::string s = "kind=";
    s += error_kind_name(err.kind);
    if (!err.reason.empty()) {
        s += " reason=";
        s += err.reason;
    }
    if (err.exception_code != 0) {
        s += " code=";
        s += std::to_string(err.exception_code);
    }
    return s;
}

} // namespace ventilink
