/**
 * @file fake_channel.hpp
 * @brief In-memory register channel for the unit tests.
 *
 * Serves words from a (unit, address) map, records every request with a
 * timestamp, and can be scripted to fail a request that starts at a given
 * address with a channel status and exception code.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <cstring>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ventilink/client.hpp"
#include "ventilink/transport/channel.hpp"

namespace ventilink::testing {

struct Request {
    enum Kind { Read, Write };
    Kind                                  kind{Read};
    uint8_t                               unit{0};
    uint16_t                              address{0};
    uint16_t                              count{0};
    std::vector<uint16_t>                 words;
    std::chrono::steady_clock::time_point at;
};

struct Fault {
    transport::ChannelStatus status{transport::ChannelStatus::Exception};
    uint8_t                  exception{0};
};

class FakeChannel : public transport::IChannel {
public:
    using Key = std::pair<uint8_t, uint16_t>;

    bool connect() override {
        ++connect_calls;
        if (refuse_connect) return false;
        open = true;
        return true;
    }
    void close() override {
        ++close_calls;
        open = false;
    }
    bool connected() const override { return open; }

    transport::ChannelStatus read_registers(uint8_t unit, uint16_t address, uint16_t count,
                                            Words& out, uint8_t& exc) override {
        requests.push_back(Request{Request::Read, unit, address, count, {}, std::chrono::steady_clock::now()});
        auto f = read_faults.find(Key{unit, address});
        if (f != read_faults.end()) {
            exc = f->second.exception;
            return f->second.status;
        }
        uint16_t n = short_reply ? uint16_t(count - 1) : count;
        for (uint16_t i = 0; i < n; ++i) out.push_back(word(unit, uint16_t(address + i)));
        return transport::ChannelStatus::Ok;
    }

    transport::ChannelStatus write_registers(uint8_t unit, uint16_t address, const Words& words,
                                             uint8_t& exc) override {
        requests.push_back(Request{Request::Write, unit, address, uint16_t(words.size()),
                                   std::vector<uint16_t>(words.begin(), words.end()),
                                   std::chrono::steady_clock::now()});
        auto f = write_faults.find(Key{unit, address});
        if (f != write_faults.end()) {
            exc = f->second.exception;
            return f->second.status;
        }
        for (std::size_t i = 0; i < words.size(); ++i) regs[Key{unit, uint16_t(address + i)}] = words[i];
        return transport::ChannelStatus::Ok;
    }

    const char* name() const override { return "fake"; }

    // ---- fixtures ----
    uint16_t word(uint8_t unit, uint16_t address) const {
        auto it = regs.find(Key{unit, address});
        return it == regs.end() ? 0 : it->second;
    }
    void set_u16(uint8_t unit, uint16_t address, uint16_t v) { regs[Key{unit, address}] = v; }
    void set_u32(uint8_t unit, uint16_t address, uint32_t v) {
        set_u16(unit, address, uint16_t(v & 0xFFFF));
        set_u16(unit, uint16_t(address + 1), uint16_t(v >> 16));
    }
    void set_float(uint8_t unit, uint16_t address, float f) {
        uint32_t bits;
        std::memcpy(&bits, &f, sizeof(bits));
        set_u32(unit, address, bits);
    }
    void fail_read(uint8_t unit, uint16_t address, transport::ChannelStatus st, uint8_t exc = 0) {
        read_faults[Key{unit, address}] = Fault{st, exc};
    }
    void fail_write(uint8_t unit, uint16_t address, transport::ChannelStatus st, uint8_t exc = 0) {
        write_faults[Key{unit, address}] = Fault{st, exc};
    }

    std::size_t count(Request::Kind kind) const {
        std::size_t n = 0;
        for (const auto& r : requests) n += r.kind == kind ? 1 : 0;
        return n;
    }

    std::map<Key, uint16_t> regs;
    std::map<Key, Fault>    read_faults;
    std::map<Key, Fault>    write_faults;
    std::vector<Request>    requests;

    bool open{false};
    bool refuse_connect{false};
    bool short_reply{false};
    int  connect_calls{0};
    int  close_calls{0};
};

/// Client wired to a FakeChannel the test keeps a handle on.
struct Rig {
    FakeChannel* ch;
    Client       client;

    explicit Rig(std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : ch(new FakeChannel), client(std::unique_ptr<transport::IChannel>(ch), delay) {}
};

} // namespace ventilink::testing
