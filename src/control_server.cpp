// -----------------------------------------------------------------------------
// control_server.cpp: Implementation of ControlServer and serve_lines()
// -----------------------------------------------------------------------------
#include "meshgate/control_server.hpp"

#include <sys/socket.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

#include "meshgate/log.hpp"
#include "meshgate/stream_io.hpp"

namespace meshgate {

static constexpr int REPLY_TIMEOUT_MS = 5000;

static bool write_line(int fd, const std::string& line, std::string& error) {
  const std::string out = line + "\n";
  return write_all(fd, reinterpret_cast<const uint8_t*>(out.data()), out.size(), REPLY_TIMEOUT_MS, error);
}

// ---------------------------------------------------------------------------
// serve_lines()
// -------------
// Accumulate bytes, answer each complete line. A final line without '\n' is
// still answered at EOF.
// ---------------------------------------------------------------------------
std::string serve_lines(RequestHandler& handler, int in_fd, int out_fd,
                        const std::atomic<bool>& stop, int poll_ms) {
  std::string pending;
  uint8_t buf[4096];

  while (!stop) {
    size_t got = 0;
    std::string error;
    const ReadResult rr = read_some(in_fd, buf, sizeof(buf), poll_ms, got, error);
    if (rr == ReadResult::Timeout) continue;
    if (rr == ReadResult::Error) return error;
    if (rr == ReadResult::Closed) {
      if (!pending.empty()) {
        const std::string reply = handler.handle_line(pending);
        if (!reply.empty() && !write_line(out_fd, reply, error)) return error;
      }
      return "eof";
    }

    pending.append(reinterpret_cast<const char*>(buf), got);
    size_t nl;
    while ((nl = pending.find('\n')) != std::string::npos) {
      const std::string line = pending.substr(0, nl);
      pending.erase(0, nl + 1);
      const std::string reply = handler.handle_line(line);
      if (!reply.empty() && !write_line(out_fd, reply, error)) return error;
    }

    if (pending.size() > MAX_REQUEST_LINE) {
      const std::string reply = parser::response_line(400, parser::error_json("Request too long"));
      if (!write_line(out_fd, reply, error)) return error;
      return "line_too_long";
    }
  }
  return "stopped";
}

// ---------- ControlServer ----------

ControlServer::ControlServer(RequestHandler& handler, Options options)
: handler_(handler), options_(std::move(options)) {
}

ControlServer::~ControlServer() {
  stop();
}

bool ControlServer::start(std::string& error) {
  if (acceptor_.joinable()) return true;

  listen_fd_ = listen_tcp(options_.host, options_.port, bound_port_, error);
  if (listen_fd_ < 0) return false;

  stop_ = false;
  acceptor_ = std::thread([this]() { accept_loop(); });
  log::info("event=control_listening host=" + options_.host + " port=" + std::to_string(bound_port_));
  return true;
}

void ControlServer::stop() {
  stop_ = true;
  if (acceptor_.joinable()) acceptor_.join();
  reap(true);
  close_fd(listen_fd_);
  listen_fd_ = -1;
}

size_t ControlServer::clients() const {
  std::lock_guard<std::mutex> lock(clients_mutex_);
  size_t live = 0;
  for (const auto& c : clients_) if (!c->done) ++live;
  return live;
}

// ---------- private ----------

void ControlServer::accept_loop() {
  while (!stop_) {
    pollfd pfd{listen_fd_, POLLIN, 0};
    const int pr = ::poll(&pfd, 1, options_.poll_ms);
    reap(false);
    if (pr <= 0) {
      if (pr < 0 && errno != EINTR) {
        log::error(std::string("event=control_poll_failed reason=") + std::strerror(errno));
        return;
      }
      continue;
    }

    const int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) {
      if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
        log::error(std::string("event=control_accept_failed reason=") + std::strerror(errno));
      }
      continue;
    }

    auto client = std::make_unique<Client>();
    client->fd = fd;
    Client* raw = client.get();
    {
      std::lock_guard<std::mutex> lock(clients_mutex_);
      clients_.push_back(std::move(client));
    }
    log::debug("event=client_open fd=" + std::to_string(fd));
    raw->thread = std::thread([this, raw]() {
      const std::string reason = serve_lines(handler_, raw->fd, raw->fd, stop_, options_.poll_ms);
      log::debug("event=client_closed fd=" + std::to_string(raw->fd) + " reason=" + reason);
      raw->done = true;
    });
  }
}

// reap(): join finished client threads (all of them when stopping).
void ControlServer::reap(bool all) {
  std::list<std::unique_ptr<Client>> finished;
  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    for (auto it = clients_.begin(); it != clients_.end();) {
      if (all || (*it)->done) {
        finished.push_back(std::move(*it));
        it = clients_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& c : finished) {
    if (c->thread.joinable()) c->thread.join();
    close_fd(c->fd);
  }
}

} // namespace meshgate
