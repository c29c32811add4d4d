#pragma once
/**
 * @file error.hpp
 * @brief Closed error taxonomy shared by every ventilink layer.
 *
 * @details
 * PURPOSE
 * -------
 * ventilink never throws across its API. Every fallible call returns bool and
 * fills an Error out-parameter. The kind tells the caller what to do next
 * (retry, skip, give up, fix the call); the reason is a short stable token
 * that scripts can grep for ("not_readable:rf_address", "bind_step:abort").
 *
 * KINDS
 * -----
 * - InvalidArgument       caller precondition violated. Never retried.
 * - Connection            channel could not be (re)opened.
 * - ConnectionInterrupted I/O failed mid-exchange; channel was closed.
 * - Read / Write          protocol exception on a read or write.
 * - Busy                  device reported transient busy.
 * - Failure               device reported an internal failure.
 * - Acknowledge           device accepted the request but has no data yet.
 * - Decode                payload could not be turned into a value.
 * - PropertyNotSupported  no descriptor for that property on this device.
 * - Binding               a bind step failed.
 * - NotImplemented        product identity without a device model.
 * - NotFound              no bound node at that address.
 */

#include <cstdint>
#include <string>

namespace ventilink {

enum class ErrorKind : uint8_t {
    None = 0,
    InvalidArgument,
    Connection,
    ConnectionInterrupted,
    Read,
    Write,
    Busy,
    Failure,
    Acknowledge,
    Decode,
    PropertyNotSupported,
    Binding,
    NotImplemented,
    NotFound,
};

struct Error {
    ErrorKind   kind{ErrorKind::None};
    int         exception_code{0};   ///< Modbus exception code, 0 when not applicable
    std::string reason;              ///< stable token, optionally ":detail"

    bool ok() const { return kind == ErrorKind::None; }
    void clear() { kind = ErrorKind::None; exception_code = 0; reason.clear(); }
};

/// Lowercase token for logs and CLI output ("invalid_argument", "busy", ...).
const char* error_kind_name(ErrorKind kind);

/// Fill @p err and return false, so call sites can `return fail(err, ...)`.
bool fail(Error& err, ErrorKind kind, std::string reason, int exception_code = 0);

/// Single-line "kind=... reason=... code=..." rendering.
std::string describe(const Error& err);

} // namespace ventilink
