#pragma once
/**
 * @page vl-client ventilink Transport Client
 * @file client.hpp
 * @brief The single gateway through which all register I/O passes.
 *
 * @details
 * PURPOSE
 * -------
 * The gateway answers one request at a time and has no way to correlate
 * out-of-order replies. The Client owns the channel and makes sure nobody
 * can talk over anybody else: every public operation holds one mutex for the
 * whole exchange, including the follow-up status read.
 *
 * WHAT THIS DOES
 * --------------
 * - Connects lazily. Before each operation, a channel that reports "not
 *   connected" gets exactly one reconnect attempt; if that fails the channel
 *   is closed and the call fails with ErrorKind::Connection.
 * - Paces commands. The end time of every exchange is recorded; the next
 *   exchange sleeps until min_command_delay has passed. The gateway drops
 *   requests that arrive too quickly.
 * - Maps channel outcomes to the error taxonomy:
 *     exception 6 (busy)        -> Busy
 *     exception 4 (failure)     -> Failure
 *     exception 5 (acknowledge) -> Acknowledge
 *     other exception           -> Read / Write with the code
 *     malformed reply           -> Read / Write, reason "malformed"
 *     wrong word count          -> Busy
 *     I/O error, link lost      -> ConnectionInterrupted, channel closed
 * - Checks capabilities and encodes values before touching the channel, so
 *   a bad call (reading a write-only register, wrong payload type) fails
 *   with InvalidArgument and costs no I/O.
 *
 * EXAMPLE
 * -------
 * @code
 *   ventilink::Client client(std::make_unique<ModbusTcpChannel>(tcp_cfg));
 *   ventilink::AnyValue v;
 *   ventilink::Error err;
 *   if (!client.get_register(desc, 207, v, err))
 *       std::cerr << "status=error " << ventilink::describe(err) << "\n";
 * @endcode
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

#include "ventilink/error.hpp"
#include "ventilink/register.hpp"
#include "ventilink/transport/channel.hpp"
#include "ventilink/values.hpp"

namespace ventilink {

constexpr std::chrono::milliseconds DEFAULT_MIN_COMMAND_DELAY{10};

class Client {
public:
    explicit Client(std::unique_ptr<transport::IChannel> channel,
                    std::chrono::milliseconds min_command_delay = DEFAULT_MIN_COMMAND_DELAY);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /// Open the channel now instead of on first use.
    bool connect(Error& err);

    void close();

    /// Read one register; with access::STATUS also reads and attaches Freshness.
    bool get_register(const RegisterDescriptor& d, uint8_t device, AnyValue& out, Error& err);

    /// Encode and write one register. True when the device echoed the request.
    bool set_register(const RegisterDescriptor& d, const Payload& value, uint8_t device, Error& err);

    /// Raw bulk read of @p count words, used by the batch reader.
    bool read_block(uint8_t device, uint16_t address, uint16_t count, Words& out, Error& err);

    std::chrono::milliseconds min_command_delay() const { return min_delay_; }

    const char* channel_name() const;

private:
    bool ensure_connected(Error& err);
    void pace();
    void mark_exchange_end();
    bool map_failure(transport::ChannelStatus st, uint8_t exc, bool is_write,
                     uint16_t address, Error& err);
    bool read_locked(uint8_t device, uint16_t address, uint16_t count, Words& out, Error& err);
    bool write_locked(uint8_t device, uint16_t address, const Words& words, Error& err);

    std::mutex                               mu_;
    std::unique_ptr<transport::IChannel>     channel_;
    std::chrono::milliseconds                min_delay_;
    std::chrono::steady_clock::time_point    last_exchange_{};
    bool                                     has_last_{false};
};

} // namespace ventilink
