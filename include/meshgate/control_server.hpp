#pragma once
/**
 * @file control_server.hpp
 * @brief Local TCP control port: one thread per client, one response per request line.
 *
 * @details
 * The server owns a listening socket and an accept thread. Each accepted
 * client gets its own thread that reads lines, hands them to the
 * RequestHandler and writes the reply line back. All waits are poll()s with a
 * short timeout so stop() is observed promptly; stop() joins every thread.
 *
 * serve_lines() is the per-client loop on its own, usable on any pair of fds
 * (the daemon runs it on stdin/stdout for the console).
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "meshgate/request_dispatch.hpp"

namespace meshgate {

/// Longest request line accepted; longer lines get a 400 and the client is closed.
static constexpr size_t MAX_REQUEST_LINE = 64 * 1024;

/**
 * @brief Answer request lines from @p in_fd on @p out_fd until EOF, error or @p stop.
 * @return Why the loop ended: "eof", "stopped", "line_too_long" or an I/O error text.
 */
std::string serve_lines(RequestHandler& handler, int in_fd, int out_fd,
                        const std::atomic<bool>& stop, int poll_ms = 200);

class ControlServer {
public:
  struct Options {
    std::string host{"127.0.0.1"};
    uint16_t    port{8080};     ///< 0 picks a free port (see port())
    int         poll_ms{200};
  };

  ControlServer(RequestHandler& handler, Options options);
  ~ControlServer();

  ControlServer(const ControlServer&) = delete;
  ControlServer& operator=(const ControlServer&) = delete;

  /// Bind, listen and start accepting. False with @p error on bind/listen failure.
  bool start(std::string& error);

  /// Stop accepting, close every client, join all threads. Idempotent.
  void stop();

  /// Port actually bound (valid after start()).
  uint16_t port() const { return bound_port_; }

  /// Clients currently connected.
  size_t clients() const;

private:
  struct Client {
    int               fd{-1};
    std::thread       thread;
    std::atomic<bool> done{false};
  };

  void accept_loop();
  void reap(bool all);

  RequestHandler& handler_;
  Options         options_;

  int               listen_fd_{-1};
  uint16_t          bound_port_{0};
  std::atomic<bool> stop_{false};
  std::thread       acceptor_;

  mutable std::mutex                  clients_mutex_;
  std::list<std::unique_ptr<Client>>  clients_;
};

} // namespace meshgate
