// ============================================================================
// serial_io.cpp — implementation for serial_io.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file serial_io.cpp
 */

#include "serial_io.hpp"

// POSIX / termios headers for low-level serial port handling
#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, etc.)
#include <unistd.h>        // ::read, ::write, ::close, usleep
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for the deadline loop
#include <cerrno>

#include <chrono>

namespace ventilink {

// ---------------------------------------------------------------------------
// set_raw()
// ----------
// Configure a file descriptor for raw serial I/O.
// - cfmakeraw, then 8 data bits with the requested parity and stop bits.
// - No hardware flow control; RS485 adapters drive DE/RE themselves.
// - VMIN=0, VTIME=0: reads never block, poll() handles timing.
//
// Returns: true on success, false if tcgetattr/tcsetattr fails.
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud, char parity, int stop_bits) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;

    cfmakeraw(&tio);
    cfsetispeed(&tio, baud);
    cfsetospeed(&tio, baud);

    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CRTSCTS;
    tio.c_cflag &= ~CSIZE;
    tio.c_cflag |= CS8;

    tio.c_cflag &= ~(PARENB | PARODD);
    if (parity == 'E' || parity == 'e') {
        tio.c_cflag |= PARENB;
    } else if (parity == 'O' || parity == 'o') {
        tio.c_cflag |= PARENB | PARODD;
    }

    if (stop_bits == 2) tio.c_cflag |= CSTOPB;
    else                tio.c_cflag &= ~CSTOPB;

    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}

static speed_t baud_constant(int baud) {
    switch (baud) {
        case 300:    return B300;
        case 600:    return B600;
        case 1200:   return B1200;
        case 2400:   return B2400;
        case 4800:   return B4800;
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
        case 230400: return B230400;
        default:     return B19200;
    }
}

// ---------------------------------------------------------------------------
// open_serial()
// -------------
// Open and initialize a serial port.
// Returns: file descriptor (>=0) or -1 on failure. A port that opens but
// refuses the termios settings is closed again and reported as -1.
// ---------------------------------------------------------------------------
int open_serial(const std::string& dev, int baud, char parity, int stop_bits, int boot_delay_ms) {
    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) return -1;

    if (!set_raw(fd, baud_constant(baud), parity, stop_bits)) {
        ::close(fd);
        return -1;
    }

    if (boot_delay_ms > 0) {
        usleep(boot_delay_ms * 1000);             // allow USB-serial auto-reset
        tcflush(fd, TCIOFLUSH);                   // flush any reboot chatter
    }
    return fd;
}

void flush_input(int fd) {
    if (fd >= 0) tcflush(fd, TCIFLUSH);
}

bool write_bytes(int fd, const uint8_t* data, std::size_t n) {
    if (::write(fd, data, n) != (ssize_t)n) return false;
    return tcdrain(fd) == 0;
}

// ---------------------------------------------------------------------------
// read_exact()
// ------------
// Accumulate exactly n bytes. The timeout covers the whole call, not each
// poll, so a slow trickle of bytes cannot stretch it.
// ---------------------------------------------------------------------------
ReadStatus read_exact(int fd, uint8_t* out, std::size_t n, int timeout_ms) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);
    std::size_t got = 0;
    pollfd pfd{fd, POLLIN, 0};

    while (got < n) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
        if (left <= 0) return ReadStatus::Timeout;

        int pr = ::poll(&pfd, 1, int(left));
        if (pr == 0) return ReadStatus::Timeout;
        if (pr < 0) {
            if (errno == EINTR) continue;
            return ReadStatus::Error;
        }
        if (pfd.revents & POLLIN) {
            ssize_t r = ::read(fd, out + got, n - got);
            if (r < 0) {
                if (errno == EAGAIN || errno == EINTR) continue;
                return ReadStatus::Error;
            }
            if (r == 0) return ReadStatus::Closed;
            got += std::size_t(r);
            continue;
        }
        if (pfd.revents & POLLHUP) return ReadStatus::Closed;
        if (pfd.revents & (POLLERR | POLLNVAL)) return ReadStatus::Error;
    }
    return ReadStatus::Ok;
}

// ---------------------------------------------------------------------------
// close_serial()
// --------------
// Close a serial fd if valid (>=0).
// ---------------------------------------------------------------------------
void close_serial(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace ventilink
