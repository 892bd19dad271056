// ============================================================================
// stream_io.cpp: implementation for stream_io.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "meshgate/stream_io.hpp"

// POSIX / termios / sockets
#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, O_NONBLOCK)
#include <unistd.h>        // ::read, ::write, ::close, usleep
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for every timed wait
#include <netdb.h>         // getaddrinfo
#include <netinet/in.h>
#include <netinet/tcp.h>   // TCP_NODELAY
#include <sys/socket.h>

#include <cerrno>
#include <chrono>
#include <cstring>         // strerror

namespace meshgate {

static std::string os_error(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

static bool set_nonblocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Milliseconds left until `deadline`, clamped at 0.
static int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    using namespace std::chrono;
    const auto left = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

// ---------------------------------------------------------------------------
// set_raw()
// ----------
// Raw 8N1, no echo, no flow control, VMIN=VTIME=0 (poll() does the timing).
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;

    cfmakeraw(&tio);
    cfsetispeed(&tio, baud);
    cfsetospeed(&tio, baud);

    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CRTSCTS;
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}

static bool baud_constant(int baud, speed_t& out) {
    switch (baud) {
        case 9600:   out = B9600;   return true;
        case 19200:  out = B19200;  return true;
        case 38400:  out = B38400;  return true;
        case 57600:  out = B57600;  return true;
        case 115200: out = B115200; return true;
        case 230400: out = B230400; return true;
        case 460800: out = B460800; return true;
        case 921600: out = B921600; return true;
        default:     return false;
    }
}

int open_serial(const std::string& dev, int baud, int boot_delay_ms, std::string& error) {
    speed_t sp = B115200;
    if (!baud_constant(baud, sp)) {
        error = "unsupported_baud: " + std::to_string(baud);
        return -1;
    }

    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) { error = os_error("open_failed"); return -1; }

    if (!set_raw(fd, sp)) {
        error = os_error("termios_failed");
        ::close(fd);
        return -1;
    }

    if (boot_delay_ms > 0) usleep(static_cast<useconds_t>(boot_delay_ms) * 1000);
    tcflush(fd, TCIOFLUSH);                       // drop reboot chatter
    return fd;
}

// ---------------------------------------------------------------------------
// open_tcp()
// ----------
// getaddrinfo, then a non-blocking connect per candidate address, each bounded
// by what is left of timeout_ms. The first address that connects wins.
// ---------------------------------------------------------------------------
int open_tcp(const std::string& host, uint16_t port, int timeout_ms, std::string& error) {
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    const std::string service = std::to_string(port);
    const int gai = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0 || res == nullptr) {
        error = std::string("dns_failed: ") + ::gai_strerror(gai);
        return -1;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    int fd = -1;
    error = "connect_failed: no usable address";

    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) { error = os_error("socket_failed"); continue; }
        if (!set_nonblocking(fd)) { error = os_error("fcntl_failed"); ::close(fd); fd = -1; continue; }

        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            pollfd pfd{fd, POLLOUT, 0};
            rc = ::poll(&pfd, 1, remaining_ms(deadline));
            if (rc == 0) {
                error = "connect_failed: timeout";
                rc = -1;
            } else if (rc > 0) {
                int so_error = 0;
                socklen_t len = sizeof(so_error);
                if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
                    error = os_error("connect_failed");
                    rc = -1;
                } else if (so_error != 0) {
                    error = std::string("connect_failed: ") + std::strerror(so_error);
                    rc = -1;
                } else {
                    rc = 0;
                }
            } else {
                error = os_error("connect_failed");
            }
        } else if (rc != 0) {
            error = os_error("connect_failed");
        }

        if (rc == 0) break;
        ::close(fd);
        fd = -1;
        if (remaining_ms(deadline) == 0) break;
    }
    ::freeaddrinfo(res);

    if (fd >= 0) {
        int one = 1;
        if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0) {
            error = os_error("setsockopt_failed");
            ::close(fd);
            return -1;
        }
        error.clear();
    }
    return fd;
}

int listen_tcp(const std::string& host, uint16_t port, uint16_t& bound_port, std::string& error) {
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags    = AI_PASSIVE;

    addrinfo* res = nullptr;
    const std::string service = std::to_string(port);
    const int gai = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0 || res == nullptr) {
        error = std::string("dns_failed: ") + ::gai_strerror(gai);
        return -1;
    }

    int fd = -1;
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) { error = os_error("socket_failed"); continue; }

        int one = 1;
        if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) != 0 ||
            ::bind(fd, ai->ai_addr, ai->ai_addrlen) != 0 ||
            ::listen(fd, 16) != 0 ||
            !set_nonblocking(fd)) {
            error = os_error("listen_failed");
            ::close(fd);
            fd = -1;
            continue;
        }
        break;
    }
    ::freeaddrinfo(res);
    if (fd < 0) return -1;

    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        error = os_error("getsockname_failed");
        ::close(fd);
        return -1;
    }
    if (addr.ss_family == AF_INET6) {
        bound_port = ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    } else {
        bound_port = ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
    }
    return fd;
}

// ---------------------------------------------------------------------------
// write_all()
// -----------
// Loop until every byte is out. EAGAIN waits on POLLOUT within the deadline.
// MSG_NOSIGNAL is not available for TTYs, so SIGPIPE is ignored process-wide
// by the daemon instead.
// ---------------------------------------------------------------------------
bool write_all(int fd, const uint8_t* data, size_t n, int timeout_ms, std::string& error) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    size_t off = 0;
    while (off < n) {
        const ssize_t w = ::write(fd, data + off, n - off);
        if (w > 0) { off += static_cast<size_t>(w); continue; }
        if (w < 0 && errno == EINTR) continue;
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{fd, POLLOUT, 0};
            const int pr = ::poll(&pfd, 1, remaining_ms(deadline));
            if (pr == 0) { error = "write_timeout"; return false; }
            if (pr < 0 && errno != EINTR) { error = os_error("poll_failed"); return false; }
            if (pr > 0 && (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))) {
                error = "write_failed: peer closed";
                return false;
            }
            continue;
        }
        error = (w == 0) ? std::string("write_failed: zero bytes written") : os_error("write_failed");
        return false;
    }
    return true;
}

ReadResult read_some(int fd, uint8_t* buf, size_t cap, int timeout_ms, size_t& got, std::string& error) {
    got = 0;
    pollfd pfd{fd, POLLIN, 0};
    const int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr == 0) return ReadResult::Timeout;
    if (pr < 0) {
        if (errno == EINTR) return ReadResult::Timeout;
        error = os_error("poll_failed");
        return ReadResult::Error;
    }
    if (pfd.revents & POLLNVAL) { error = "read_failed: fd closed"; return ReadResult::Error; }

    const ssize_t n = ::read(fd, buf, cap);
    if (n > 0) { got = static_cast<size_t>(n); return ReadResult::Data; }
    if (n == 0) { error = "eof"; return ReadResult::Closed; }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return ReadResult::Timeout;
    error = os_error("read_failed");
    return ReadResult::Error;
}

void close_fd(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace meshgate
