#pragma once
/**
 * @file stream_io.hpp
 * @brief POSIX byte-stream plumbing: serial TTYs and TCP sockets as plain fds.
 *
 * @details
 * Everything above this layer deals in file descriptors and byte buffers; it
 * never cares whether the gateway sits on a USB cable or across the LAN.
 *
 * Conventions:
 *  - Open functions return an fd >= 0, or -1 with @p error filled in
 *    ("open_failed: <strerror>", "dns_failed: <gai_strerror>", ...).
 *  - Every fd is non-blocking; waiting is done with poll() and a timeout.
 *  - Nothing here throws or logs. Callers decide what a failure means.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace meshgate {

/**
 * @brief Open and configure a serial TTY for raw 8N1 I/O.
 *
 * @param dev            Device path (e.g. /dev/ttyUSB0, /dev/serial/by-id/...).
 * @param baud           9600, 19200, 38400, 57600, 115200, 230400, 460800 or 921600.
 * @param boot_delay_ms  Sleep after opening so USB-serial bridges that reset the
 *                       board on open can finish booting; input is flushed after.
 * @param error          Filled on failure.
 * @return fd or -1.
 */
int open_serial(const std::string& dev, int baud, int boot_delay_ms, std::string& error);

/**
 * @brief Resolve @p host and connect a TCP socket, waiting at most @p timeout_ms.
 *
 * Tries each resolved address in turn. The returned socket is non-blocking with
 * TCP_NODELAY set.
 */
int open_tcp(const std::string& host, uint16_t port, int timeout_ms, std::string& error);

/**
 * @brief Bind and listen on @p host:@p port (SO_REUSEADDR). Port 0 picks a free port.
 * @param bound_port  Receives the port actually bound.
 */
int listen_tcp(const std::string& host, uint16_t port, uint16_t& bound_port, std::string& error);

/**
 * @brief Write all @p n bytes, polling for writability as needed.
 * @return false on error, on peer close, or if @p timeout_ms passes with bytes left.
 */
bool write_all(int fd, const uint8_t* data, size_t n, int timeout_ms, std::string& error);

/// Outcome of read_some().
enum class ReadResult : uint8_t { Data=0, Timeout=1, Closed=2, Error=3 };

/**
 * @brief Wait up to @p timeout_ms for readable bytes and read what is there.
 * @param got  Number of bytes placed in @p buf when the result is Data.
 */
ReadResult read_some(int fd, uint8_t* buf, size_t cap, int timeout_ms, size_t& got, std::string& error);

/// Close an fd if valid (>= 0). Safe to call twice with the same variable reset to -1.
void close_fd(int fd);

} // namespace meshgate
