/**
 * @page bf-serial-io-hdr bitflash Serial I/O API (Header)
 * @file serial_io.hpp
 * @brief Free functions for opening a Linux TTY in raw mode and moving raw bytes.
 *
 * @details
 * PURPOSE
 * -------
 * This header declares the minimal POSIX surface needed to talk to a bootloader
 * over a serial link. It pairs with serial_io.cpp for the termios work. Framing
 * lives one layer up (packet.hpp); this layer only moves bytes.
 *
 * ROLE IN BITFLASH
 * ----------------
 * - bitflash::open_serial: acquire a descriptor, set raw 8N1 mode, and absorb
 *   the boot noise that follows a USB CDC auto-reset.
 * - bitflash::write_all: write a whole buffer, looping over partial writes.
 * - bitflash::read_byte: wait for one byte with a millisecond timeout (or forever).
 * - bitflash::close_serial: close the descriptor.
 *
 * These are used by transport::LinuxSerial, which wraps them into the
 * IByteStream contract and owns the descriptor.
 *
 * HOW IT FITS TOGETHER
 * --------------------
 *   [bitflash cli] -> LinuxSerial -> open_serial() -> write_all()/read_byte() -> close_serial()
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Device selection: prefer /dev/serial/by-id/... for stable paths.
 * - Permissions: the runtime user needs access to the TTY (dialout group or similar).
 * - Concurrency: do not share one fd between threads.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace bitflash {

/**
 * @brief Open a Linux TTY device, configure it for raw I/O, and return its file descriptor.
 *
 * What it does:
 *   - Opens the device path with O_RDWR | O_NOCTTY | O_NONBLOCK.
 *   - Puts the port into raw 8N1 mode without flow control.
 *   - Sets the baud rate (9600..460800; unknown values fall back to 115200).
 *   - Sleeps @p boot_delay_ms, then flushes anything the device printed while booting.
 *
 * @return File descriptor (non-negative) on success, or -1 on failure.
 */
int open_serial(const std::string& dev, int baud = 115200, int boot_delay_ms = 400);

/**
 * @brief Write all @p len bytes, waiting for the driver when its buffer is full.
 *
 * @return true once every byte was accepted; false on any write/poll error.
 */
bool write_all(int fd, const uint8_t* data, std::size_t len);

/**
 * @brief Read exactly one byte.
 *
 * @param timeout_ms  Milliseconds to wait; negative waits forever.
 * @return 1 on success, 0 on timeout, -1 on error (including hang-up).
 */
int read_byte(int fd, uint8_t& out, int timeout_ms);

/// Close a descriptor from open_serial(). Negative fds are ignored.
void close_serial(int fd);

} // namespace bitflash
