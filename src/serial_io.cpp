// ============================================================================
// serial_io.cpp — implementation for serial_io.hpp
// For API/overview see the matching .hpp.
// ============================================================================

/**
 * @file serial_io.cpp
 */

#include "serial_io.hpp"

#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, etc.)
#include <unistd.h>        // ::read, ::write, ::close, usleep
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for timeout-based reads and write backpressure
#include <cerrno>

namespace bitflash {

// ---------------------------------------------------------------------------
// set_raw()
// ----------
// Configure a file descriptor for raw serial I/O at the given baud.
// - 8N1, no echo, no line processing, no flow control.
// - VMIN=0, VTIME=0: the fd is non-blocking and poll() does the waiting.
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;

    cfmakeraw(&tio);
    cfsetispeed(&tio, baud);
    cfsetospeed(&tio, baud);

    tio.c_cflag |= (CLOCAL | CREAD);              // ignore modem ctrl, enable read
    tio.c_cflag &= ~CRTSCTS;                      // disable hardware flow control
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}

static speed_t to_speed(int baud) {
    switch (baud) {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
#ifdef B230400
        case 230400: return B230400;
#endif
#ifdef B460800
        case 460800: return B460800;
#endif
        default:     return B115200;
    }
}


// ---------------------------------------------------------------------------
// open_serial()
// -------------
// Returns: file descriptor (>=0) or -1 on failure. A port that refuses raw
// mode is closed again and reported as a failure.
// ---------------------------------------------------------------------------
int open_serial(const std::string& dev, int baud, int boot_delay_ms) {
    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) return -1;

    if (!set_raw(fd, to_speed(baud))) {
        ::close(fd);
        return -1;
    }

    if (boot_delay_ms > 0) usleep(boot_delay_ms * 1000);   // allow USB-serial auto-reset
    tcflush(fd, TCIOFLUSH);                                // flush any reboot chatter
    return fd;
}


// ---------------------------------------------------------------------------
// write_all()
// -----------
// Loop until the whole buffer is written. On EAGAIN, wait for POLLOUT
// instead of spinning. A 256-byte frame usually goes out in one call.
// ---------------------------------------------------------------------------
bool write_all(int fd, const uint8_t* data, std::size_t len) {
    if (fd < 0) return false;
    std::size_t off = 0;
    pollfd pfd{fd, POLLOUT, 0};

    while (off < len) {
        ssize_t w = ::write(fd, data + off, len - off);
        if (w > 0) { off += static_cast<std::size_t>(w); continue; }
        if (w < 0 && errno == EINTR) continue;
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (::poll(&pfd, 1, -1) < 0 && errno != EINTR) return false;
            continue;
        }
        return false;
    }
    return true;
}


// ---------------------------------------------------------------------------
// read_byte()
// -----------
// poll() for readability, then read a single byte.
// - timeout_ms < 0 means poll(-1): block until the peer says something.
// - POLLHUP/POLLERR without data (cable pulled) is an error, not a timeout.
// ---------------------------------------------------------------------------
int read_byte(int fd, uint8_t& out, int timeout_ms) {
    if (fd < 0) return -1;
    pollfd pfd{fd, POLLIN, 0};

    for (;;) {
        int pr = ::poll(&pfd, 1, timeout_ms < 0 ? -1 : timeout_ms);
        if (pr == 0) return 0;                            // timeout expired
        if (pr < 0) {
            if (errno == EINTR) continue;
            return -1;
        }
        if (pfd.revents & POLLIN) {
            ssize_t n = ::read(fd, &out, 1);
            if (n == 1) return 1;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
            return -1;                                    // EOF or read error
        }
        if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) return -1;
    }
}


// ---------------------------------------------------------------------------
// close_serial()
// --------------
void close_serial(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace bitflash
