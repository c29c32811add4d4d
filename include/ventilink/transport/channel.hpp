#pragma once
/**
 * @file channel.hpp
 * @brief Register-level request/response channel every transport implements.
 *
 * Header-only. The Client owns exactly one channel and is the only caller,
 * so implementations need no locking of their own.
 */

#include <cstdint>

#include "ventilink/register.hpp"

namespace ventilink::transport {

enum class ChannelStatus : uint8_t {
    Ok = 0,
    Exception,       ///< device answered with a protocol exception; code is filled
    IoError,         ///< send/receive failed or timed out
    ConnectionLost,  ///< peer closed or the port went away
    Malformed,       ///< reply did not parse (bad CRC, wrong length, wrong echo)
};

/// Protocol exception codes the mapping layer cares about.
namespace exception_code {
constexpr uint8_t ILLEGAL_FUNCTION     = 0x01;
constexpr uint8_t ILLEGAL_DATA_ADDRESS = 0x02;
constexpr uint8_t ILLEGAL_DATA_VALUE   = 0x03;
constexpr uint8_t DEVICE_FAILURE       = 0x04;
constexpr uint8_t ACKNOWLEDGE          = 0x05;
constexpr uint8_t DEVICE_BUSY          = 0x06;
} // namespace exception_code

/**
 * @brief Channel trait the Client relies on.
 *
 * Contract:
 *  - connect() opens the port/socket; true when usable afterwards.
 *  - close() is idempotent.
 *  - read_registers() fills @p out with the words returned by the device.
 *    The count is whatever the device sent; the Client checks it.
 *  - write_registers() writes @p words starting at @p address. A single word
 *    may go out as a write-single request. Ok means the echo matched.
 *  - On ChannelStatus::Exception, @p exc holds the exception code.
 */
class IChannel {
public:
    virtual ~IChannel() = default;
    virtual bool          connect() = 0;
    virtual void          close() = 0;
    virtual bool          connected() const = 0;
    virtual ChannelStatus read_registers(uint8_t unit, uint16_t address, uint16_t count,
                                         Words& out, uint8_t& exc) = 0;
    virtual ChannelStatus write_registers(uint8_t unit, uint16_t address, const Words& words,
                                          uint8_t& exc) = 0;
    virtual const char*   name() const = 0;
};

} // namespace ventilink::transport
