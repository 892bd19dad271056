// -----------------------------------------------------------------------------
// connection_manager.cpp: Implementation of ConnectionManager
//
// State machine & threading contract: include/meshgate/connection_manager.hpp
// Behaviour under failure: tests/test_connection_manager.cpp
// -----------------------------------------------------------------------------
#include "meshgate/connection_manager.hpp"

#include "meshgate/log.hpp"

namespace meshgate {

const char* to_string(LinkState s) {
  switch (s) {
    case LinkState::Disconnected: return "disconnected";
    case LinkState::Connecting:   return "connecting";
    case LinkState::Connected:    return "connected";
  }
  return "disconnected";
}

ConnectionManager::ConnectionManager(Connector& connector, EventDispatcher& dispatcher, Options options)
: connector_(connector), dispatcher_(dispatcher), options_(std::move(options)) {
}

ConnectionManager::~ConnectionManager() {
  stop();
}

void ConnectionManager::start() {
  if (worker_.joinable()) return;
  stop_requested_ = false;
  worker_ = std::thread([this]() { run(); });
}

// stop(): the flag is set under state_mutex_ so a waiter cannot miss the wakeup.
void ConnectionManager::stop() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    stop_requested_ = true;
  }
  state_cv_.notify_all();

  if (worker_.joinable()) worker_.join();
  if (!running_) drop_link();   // a run() on a caller's thread drops its own link
}

ConnectionState ConnectionManager::status() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

bool ConnectionManager::wait_connected(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(state_mutex_);
  return state_cv_.wait_for(lock, timeout, [this]() {
    return state_.state == LinkState::Connected;
  });
}

TxResult ConnectionManager::send(const std::string& text, const std::string& target, std::string& detail) {
  std::lock_guard<std::mutex> lock(link_mutex_);
  if (!link_) {
    detail = "Mesh interface not initialized";
    return TxResult::NotConnected;
  }
  return link_->send_text(text, target, detail);
}

// -----------------------------------------------------------------------------
// run(): connect, pump until the link dies, repeat. Never gives up.
// POLICY:
//   - Wait retry_ms after a failed connect, and after a link that died less
//     than retry_ms after connecting (a gateway that accepts and hangs up in
//     a loop). A link that stayed up longer is retried at once.
//   - Every exit path leaves state Disconnected and no link held.
// -----------------------------------------------------------------------------
void ConnectionManager::run() {
  running_ = true;
  while (!stop_requested_) {
    set_state(LinkState::Connecting);
    log::info("event=connecting address=" + options_.address);

    std::string error;
    std::unique_ptr<RadioLink> link = connector_.connect(options_.address, error);
    if (!link) {
      log::error("event=connect_failed address=" + options_.address + " reason=" + error);
      set_state(LinkState::Disconnected, error);
      wait_retry();
      continue;
    }

    if (stop_requested_) {      // stop() arrived while connect() was blocking
      link->close();
      break;
    }

    on_connected(std::move(link));
    const auto connected_at = std::chrono::steady_clock::now();

    const std::string reason = pump();
    drop_link();
    if (!reason.empty()) {
      const auto uptime = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - connected_at);
      log::error("event=link_lost address=" + options_.address + " reason=" + reason +
                 " uptime_ms=" + std::to_string(uptime.count()));
      set_state(LinkState::Disconnected, reason);
      if (uptime < std::chrono::milliseconds(options_.retry_ms)) wait_retry();
    }
  }
  set_state(LinkState::Disconnected);
  running_ = false;
}

// ---------- private ----------

void ConnectionManager::set_state(LinkState s, const std::string& error) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.state        = s;
    state_.is_connected = (s == LinkState::Connected);
    if (!error.empty()) state_.last_error = error;
  }
  state_cv_.notify_all();
}

// on_connected(): install the link, then publish the new state in one step.
void ConnectionManager::on_connected(std::unique_ptr<RadioLink> link) {
  const NodeNum local = link->local_node_id();
  const std::string link_name = link->name();
  {
    std::lock_guard<std::mutex> lock(link_mutex_);
    link_ = std::move(link);
  }
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.state               = LinkState::Connected;
    state_.is_connected        = true;
    state_.local_node_id       = local;
    state_.last_connected_at   = std::chrono::system_clock::now();
    state_.connection_attempts += 1;
  }
  state_cv_.notify_all();
  log::info("event=connected address=" + options_.address + " link=" + link_name +
            " node=" + std::to_string(local));
}

// drop_link(): close and release under link_mutex_; waits out any send in flight.
void ConnectionManager::drop_link() {
  std::lock_guard<std::mutex> lock(link_mutex_);
  if (link_) {
    link_->close();
    link_.reset();
  }
}

// pump(): only this thread replaces link_, so reading it without the lock is safe.
std::string ConnectionManager::pump() {
  RadioLink* link = link_.get();
  while (!stop_requested_) {
    PacketEvent event;
    std::string detail;
    switch (link->poll_event(event, options_.poll_ms, detail)) {
      case RxResult::Ok:
        dispatcher_.on_packet(event);
        break;
      case RxResult::None:
        break;
      case RxResult::Error:
        return detail.empty() ? std::string("link_error") : detail;
    }
  }
  return std::string();
}

void ConnectionManager::wait_retry() {
  std::unique_lock<std::mutex> lock(state_mutex_);
  state_cv_.wait_for(lock, std::chrono::milliseconds(options_.retry_ms),
                     [this]() { return stop_requested_.load(); });
}

} // namespace meshgate
