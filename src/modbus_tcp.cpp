// ============================================================================
// modbus_tcp.cpp — implementation for modbus_tcp.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "modbus_tcp.hpp"
#include "serial_io.hpp"   // read_exact() works on any pollable fd
#include "ventilink/log.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>

namespace ventilink {

using transport::ChannelStatus;

static constexpr std::size_t MBAP_LEN = 7;

static ChannelStatus from_read_status(ReadStatus rs) {
    switch (rs) {
        case ReadStatus::Ok:      return ChannelStatus::Ok;
        case ReadStatus::Closed:  return ChannelStatus::ConnectionLost;
        case ReadStatus::Timeout:
        case ReadStatus::Error:   return ChannelStatus::IoError;
    }
    return ChannelStatus::IoError;
}

static ChannelStatus from_pdu_result(modbus::PduResult r) {
    switch (r) {
        case modbus::PduResult::Ok:        return ChannelStatus::Ok;
        case modbus::PduResult::Exception: return ChannelStatus::Exception;
        case modbus::PduResult::Malformed: return ChannelStatus::Malformed;
    }
    return ChannelStatus::Malformed;
}

// ---------------------------------------------------------------------------
// connect_with_timeout()
// ----------------------
// Non-blocking connect, then poll for writability and read SO_ERROR.
// The socket stays non-blocking; all reads go through poll.
// ---------------------------------------------------------------------------
static int connect_with_timeout(const addrinfo* ai, int timeout_ms) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) return -1;

    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        ::close(fd);
        return -1;
    }

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
        if (errno != EINPROGRESS) {
            ::close(fd);
            return -1;
        }
        pollfd pfd{fd, POLLOUT, 0};
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::poll(&pfd, 1, timeout_ms) != 1 ||
            ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
            ::close(fd);
            return -1;
        }
    }

    int one = 1;
    if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0)
        log_debug("event=tcp_nodelay_failed errno=" + std::to_string(errno));
    return fd;
}

bool ModbusTcpChannel::connect() {
    close();

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    const std::string port = std::to_string(cfg_.port);
    if (::getaddrinfo(cfg_.host.c_str(), port.c_str(), &hints, &res) != 0) return false;

    for (addrinfo* ai = res; ai && fd_ < 0; ai = ai->ai_next) fd_ = connect_with_timeout(ai, cfg_.timeout_ms);
    ::freeaddrinfo(res);
    return fd_ >= 0;
}

void ModbusTcpChannel::close() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
}

static bool send_all(int fd, const uint8_t* data, std::size_t n, int timeout_ms) {
    std::size_t sent = 0;
    while (sent < n) {
        ssize_t w = ::send(fd, data + sent, n - sent, MSG_NOSIGNAL);
        if (w > 0) {
            sent += std::size_t(w);
            continue;
        }
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{fd, POLLOUT, 0};
            if (::poll(&pfd, 1, timeout_ms) != 1) return false;
            continue;
        }
        if (w < 0 && errno == EINTR) continue;
        return false;
    }
    return true;
}

ChannelStatus ModbusTcpChannel::exchange(uint8_t unit, const modbus::Bytes& pdu, modbus::Bytes& reply) {
    if (fd_ < 0) return ChannelStatus::ConnectionLost;

    const uint16_t tid = next_tid_++;
    const uint16_t len = uint16_t(pdu.size() + 1);

    modbus::Bytes frame;
    frame.reserve(MBAP_LEN + pdu.size());
    frame.push_back(uint8_t(tid >> 8));
    frame.push_back(uint8_t(tid & 0xFF));
    frame.push_back(0);
    frame.push_back(0);
    frame.push_back(uint8_t(len >> 8));
    frame.push_back(uint8_t(len & 0xFF));
    frame.push_back(unit);
    frame.insert(frame.end(), pdu.begin(), pdu.end());

    if (!send_all(fd_, frame.data(), frame.size(), cfg_.timeout_ms)) {
        return errno == EPIPE || errno == ECONNRESET ? ChannelStatus::ConnectionLost : ChannelStatus::IoError;
    }

    // Replies to earlier requests (a peer that answered twice, or answered
    // after we gave up) are dropped until ours arrives or the deadline passes.
    // A length we cannot frame, or a transaction id ahead of ours, means the
    // stream is out of step: report IoError so the client reconnects.
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(cfg_.timeout_ms);
    for (;;) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            log_debug("event=tcp_reply_timeout tid=" + std::to_string(tid));
            return ChannelStatus::IoError;
        }

        uint8_t head[MBAP_LEN];
        ReadStatus rs = read_exact(fd_, head, MBAP_LEN, int(left.count()));
        if (rs != ReadStatus::Ok) return from_read_status(rs);

        const uint16_t rtid = uint16_t((head[0] << 8) | head[1]);
        const uint16_t rpid = uint16_t((head[2] << 8) | head[3]);
        const uint16_t rlen = uint16_t((head[4] << 8) | head[5]);
        if (rlen < 2 || rlen > 254) {
            log_warn("event=tcp_desync reason=length len=" + std::to_string(rlen));
            return ChannelStatus::IoError;
        }

        reply.assign(rlen - 1, 0);
        rs = read_exact(fd_, reply.data(), reply.size(), cfg_.timeout_ms);
        if (rs != ReadStatus::Ok) return from_read_status(rs);

        if (rtid != tid) {
            if (int16_t(uint16_t(tid - rtid)) > 0) {
                log_info("event=tcp_stale_reply tid=" + std::to_string(rtid) + " want=" + std::to_string(tid));
                continue;
            }
            log_warn("event=tcp_desync reason=tid tid=" + std::to_string(rtid) + " want=" + std::to_string(tid));
            return ChannelStatus::IoError;
        }
        if (rpid != 0 || head[6] != unit) return ChannelStatus::Malformed;
        return ChannelStatus::Ok;
    }
}

ChannelStatus ModbusTcpChannel::read_registers(uint8_t unit, uint16_t address, uint16_t count,
                                               Words& out, uint8_t& exc) {
    modbus::Bytes pdu, reply;
    if (!modbus::build_read_request(address, count, pdu)) return ChannelStatus::Malformed;

    ChannelStatus st = exchange(unit, pdu, reply);
    if (st != ChannelStatus::Ok) return st;
    return from_pdu_result(modbus::parse_read_response(reply.data(), reply.size(), out, exc));
}

ChannelStatus ModbusTcpChannel::write_registers(uint8_t unit, uint16_t address, const Words& words,
                                                uint8_t& exc) {
    modbus::Bytes pdu, reply;
    if (!modbus::build_write_request(address, words, pdu)) return ChannelStatus::Malformed;

    ChannelStatus st = exchange(unit, pdu, reply);
    if (st != ChannelStatus::Ok) return st;
    return from_pdu_result(modbus::parse_write_response(reply.data(), reply.size(), address, words, exc));
}

} // namespace ventilink
