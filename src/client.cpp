// ============================================================================
// client.cpp — implementation for ventilink/client.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "ventilink/client.hpp"
#include "ventilink/log.hpp"
#include "ventilink/status.hpp"

#include <thread>
#include <utility>

namespace ventilink {

using transport::ChannelStatus;
namespace exc_code = transport::exception_code;

Client::Client(std::unique_ptr<transport::IChannel> channel, std::chrono::milliseconds min_command_delay)
    : channel_(std::move(channel)), min_delay_(min_command_delay) {}

Client::~Client() {
    if (channel_) channel_->close();
}

const char* Client::channel_name() const {
    return channel_ ? channel_->name() : "none";
}

bool Client::connect(Error& err) {
    std::lock_guard<std::mutex> lock(mu_);
    return ensure_connected(err);
}

void Client::close() {
    std::lock_guard<std::mutex> lock(mu_);
    if (channel_) channel_->close();
}

// ---------------------------------------------------------------------------
// ensure_connected()
// ------------------
// One reconnect attempt per operation. A failed attempt closes the channel
// explicitly so no half-open handle survives into the next call.
// Caller holds mu_.
// ---------------------------------------------------------------------------
bool Client::ensure_connected(Error& err) {
    if (!channel_) return fail(err, ErrorKind::Connection, "no_channel");
    if (channel_->connected()) return true;

    log_debug(std::string("event=connect channel=") + channel_->name());
    if (channel_->connect()) return true;

    channel_->close();
    log_warn(std::string("event=connect_failed channel=") + channel_->name());
    return fail(err, ErrorKind::Connection, std::string("connect_failed:") + channel_->name());
}

// ---------------------------------------------------------------------------
// pace() / mark_exchange_end()
// ----------------------------
// Sleep out whatever is left of min_delay_ since the previous exchange ended.
// The timestamp is taken after every exchange, failed ones included, since
// the responder is just as busy after answering with an error.
// Caller holds mu_.
// ---------------------------------------------------------------------------
void Client::pace() {
    if (!has_last_) return;
    auto due = last_exchange_ + min_delay_;
    auto now = std::chrono::steady_clock::now();
    if (now < due) std::this_thread::sleep_for(due - now);
}

void Client::mark_exchange_end() {
    last_exchange_ = std::chrono::steady_clock::now();
    has_last_ = true;
}

bool Client::map_failure(ChannelStatus st, uint8_t exc, bool is_write, uint16_t address, Error& err) {
    const ErrorKind op_kind = is_write ? ErrorKind::Write : ErrorKind::Read;
    const std::string where = std::to_string(address);

    switch (st) {
        case ChannelStatus::Ok:
            return true;

        case ChannelStatus::Exception:
            if (exc == exc_code::DEVICE_BUSY)    return fail(err, ErrorKind::Busy, "device_busy:" + where, exc);
            if (exc == exc_code::DEVICE_FAILURE) return fail(err, ErrorKind::Failure, "device_failure:" + where, exc);
            if (exc == exc_code::ACKNOWLEDGE)    return fail(err, ErrorKind::Acknowledge, "acknowledge:" + where, exc);
            return fail(err, op_kind, "exception_code:" + std::to_string(exc) + " address=" + where, exc);

        case ChannelStatus::Malformed:
            return fail(err, op_kind, "malformed:" + where);

        case ChannelStatus::IoError:
        case ChannelStatus::ConnectionLost:
            channel_->close();
            log_warn(std::string("event=channel_closed channel=") + channel_->name() +
                     " address=" + where + (st == ChannelStatus::IoError ? " cause=io" : " cause=lost"));
            return fail(err, ErrorKind::ConnectionInterrupted,
                        std::string(st == ChannelStatus::IoError ? "io_error:" : "connection_lost:") + where);
    }
    return fail(err, op_kind, "unknown_channel_status");
}

bool Client::read_locked(uint8_t device, uint16_t address, uint16_t count, Words& out, Error& err) {
    if (!ensure_connected(err)) return false;
    pace();

    uint8_t exc = 0;
    out.clear();
    ChannelStatus st = channel_->read_registers(device, address, count, out, exc);
    mark_exchange_end();

    if (st != ChannelStatus::Ok) return map_failure(st, exc, false, address, err);

    // A short or long reply means the gateway answered from a stale buffer.
    if (out.size() != count) {
        return fail(err, ErrorKind::Busy,
                    "word_count_mismatch:" + std::to_string(address) + " want=" + std::to_string(count) +
                    " got=" + std::to_string(out.size()));
    }
    return true;
}

bool Client::write_locked(uint8_t device, uint16_t address, const Words& words, Error& err) {
    if (!ensure_connected(err)) return false;
    pace();

    uint8_t exc = 0;
    ChannelStatus st = channel_->write_registers(device, address, words, exc);
    mark_exchange_end();

    if (st != ChannelStatus::Ok) return map_failure(st, exc, true, address, err);
    return true;
}

// -------- public register operations --------

bool Client::get_register(const RegisterDescriptor& d, uint8_t device, AnyValue& out, Error& err) {
    if (!d.can_read())
        return fail(err, ErrorKind::InvalidArgument, "not_readable:" + property_name(d.property));
    if (d.has_status() && uint32_t(d.address) + STATUS_OFFSET > 0xFFFF)
        return fail(err, ErrorKind::InvalidArgument, "status_address_overflow:" + property_name(d.property));

    Words words;
    Words status;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!read_locked(device, d.address, d.length, words, err)) return false;
        if (d.has_status()) {
            if (!read_locked(device, uint16_t(d.address + STATUS_OFFSET), 1, status, err)) return false;
        }
    }

    AnyValue v;
    if (!decode_value(d, words.data(), words.size(), v.value, err)) return false;
    if (d.has_status()) v.freshness = decode_status(status[0]);
    out = std::move(v);
    return true;
}

bool Client::set_register(const RegisterDescriptor& d, const Payload& value, uint8_t device, Error& err) {
    if (!d.can_write())
        return fail(err, ErrorKind::InvalidArgument, "not_writable:" + property_name(d.property));

    Words words;
    if (!encode_value(d, value, words, err)) return false;

    std::lock_guard<std::mutex> lock(mu_);
    return write_locked(device, d.address, words, err);
}

bool Client::read_block(uint8_t device, uint16_t address, uint16_t count, Words& out, Error& err) {
    if (count == 0 || count > MAX_READ_WORDS)
        return fail(err, ErrorKind::InvalidArgument, "bad_count:" + std::to_string(count));

    std::lock_guard<std::mutex> lock(mu_);
    return read_locked(device, address, count, out, err);
}

} // namespace ventilink
