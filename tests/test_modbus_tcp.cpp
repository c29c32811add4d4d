#include <doctest/doctest.h>
#include "modbus_tcp.hpp"
#include "ventilink/client.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace ventilink;

namespace {

// Single-connection Modbus TCP responder on 127.0.0.1. Every read request is
// answered with each word equal to its own register address.
class LoopbackGateway {
public:
    enum class Mode { FirstReplyTwice, BadLength, TidAhead };

    explicit LoopbackGateway(Mode mode) : mode_(mode) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listen_fd_, 1);
        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this] { serve(); });
    }

    ~LoopbackGateway() {
        thread_.join();
        if (listen_fd_ >= 0) ::close(listen_fd_);
    }

    uint16_t port() const { return port_; }

private:
    static bool recv_exact(int fd, uint8_t* out, std::size_t n) {
        std::size_t got = 0;
        while (got < n) {
            ssize_t r = ::recv(fd, out + got, n - got, 0);
            if (r <= 0) return false;
            got += std::size_t(r);
        }
        return true;
    }

    static void send_all(int fd, const std::vector<uint8_t>& b) {
        std::size_t sent = 0;
        while (sent < b.size()) {
            ssize_t w = ::send(fd, b.data() + sent, b.size() - sent, MSG_NOSIGNAL);
            if (w <= 0) return;
            sent += std::size_t(w);
        }
    }

    void serve() {
        pollfd p{listen_fd_, POLLIN, 0};
        if (::poll(&p, 1, 3000) <= 0) return;
        int fd = ::accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) return;

        bool first = true;
        for (;;) {
            uint8_t head[7];
            if (!recv_exact(fd, head, sizeof(head))) break;
            const std::size_t body_len = std::size_t((head[4] << 8) | head[5]) - 1;
            std::vector<uint8_t> body(body_len);
            if (!recv_exact(fd, body.data(), body.size())) break;
            if (body.size() < 5 || body[0] != 0x03) break;

            const uint16_t start = uint16_t((body[1] << 8) | body[2]);
            const uint16_t count = uint16_t((body[3] << 8) | body[4]);
            uint16_t tid = uint16_t((head[0] << 8) | head[1]);
            if (mode_ == Mode::TidAhead) tid = uint16_t(tid + 5);
            const uint16_t len = mode_ == Mode::BadLength ? 0 : uint16_t(3 + 2 * count);

            std::vector<uint8_t> reply{uint8_t(tid >> 8), uint8_t(tid & 0xFF), 0, 0,
                                       uint8_t(len >> 8), uint8_t(len & 0xFF), head[6]};
            if (mode_ != Mode::BadLength) {
                reply.push_back(0x03);
                reply.push_back(uint8_t(2 * count));
                for (uint16_t i = 0; i < count; ++i) {
                    const uint16_t w = uint16_t(start + i);
                    reply.push_back(uint8_t(w >> 8));
                    reply.push_back(uint8_t(w & 0xFF));
                }
            }
            send_all(fd, reply);
            if (first && mode_ == Mode::FirstReplyTwice) send_all(fd, reply);
            first = false;
        }
        ::close(fd);
    }

    Mode        mode_;
    int         listen_fd_{-1};
    uint16_t    port_{0};
    std::thread thread_;
};

Client make_client(uint16_t port) {
    TcpConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = port;
    cfg.timeout_ms = 1000;
    return Client(std::make_unique<ModbusTcpChannel>(cfg), std::chrono::milliseconds(0));
}

} // namespace

TEST_CASE("TCP channel skips a repeated reply and stays in step") {
    LoopbackGateway gw(LoopbackGateway::Mode::FirstReplyTwice);
    Client client = make_client(gw.port());

    for (uint16_t i = 0; i < 6; ++i) {
        const uint16_t address = uint16_t(40005 + i);
        CAPTURE(address);
        const RegisterDescriptor d = reg_u16(Property::OemCode, address, access::READ);
        AnyValue v;
        Error err;
        REQUIRE_MESSAGE(client.get_register(d, 1, v, err), err.reason);
        CHECK(std::get<int64_t>(v.value) == address);
    }
}

TEST_CASE("TCP reply with an unframeable length interrupts the connection") {
    LoopbackGateway gw(LoopbackGateway::Mode::BadLength);
    Client client = make_client(gw.port());

    const RegisterDescriptor d = reg_u16(Property::OemCode, 40005, access::READ);
    AnyValue v;
    Error err;
    CHECK_FALSE(client.get_register(d, 1, v, err));
    CHECK(err.kind == ErrorKind::ConnectionInterrupted);
}

TEST_CASE("TCP reply from a later transaction interrupts the connection") {
    LoopbackGateway gw(LoopbackGateway::Mode::TidAhead);
    Client client = make_client(gw.port());

    const RegisterDescriptor d = reg_u16(Property::OemCode, 40005, access::READ);
    AnyValue v;
    Error err;
    CHECK_FALSE(client.get_register(d, 1, v, err));
    CHECK(err.kind == ErrorKind::ConnectionInterrupted);
}
