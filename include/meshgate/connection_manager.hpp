/**
 * @file connection_manager.hpp
 * @brief Owns the one live RadioLink: connect, retry forever, pump events.
 *
 * @details
 * ## Field Brief
 * Gateways get power-cycled, Wi-Fi drops, USB cables get yanked. The
 * ConnectionManager is the part that does not care: it keeps trying to reach
 * the gateway until the process is told to stop, and while connected it pulls
 * every decoded packet off the link and hands it to the EventDispatcher.
 *
 * @par Operational Model
 * ```
 *            start()
 *               │
 *   ┌──► Connecting ── connect(address) fails ──► log, wait retry_ms ──┐
 *   │           │                                                      │
 *   │           └─ ok ──► Connected ── poll_event() ──► on_packet()    │
 *   │                        │                                         │
 *   │                  link error ──► Disconnected ────────────────────┘
 *   │                                        │
 *   └────────────────────────────────────────┘
 *                 stop(): observed between attempts, during the wait,
 *                         and between polls; closes the link.
 * ```
 *
 * @par State ownership
 * - The background thread is the only writer of ConnectionState and the only
 *   thread that reads from the link or replaces it.
 * - status() copies the state under a short lock; it never waits on I/O.
 * - send() is the only way other threads reach the link. It holds the link
 *   mutex for the duration of the write so the link cannot be torn down
 *   underneath it.
 *
 * @par Counting
 * `connection_attempts` counts successful connections, not tries. A gateway
 * that refuses nine times and accepts on the tenth leaves it at 1.
 */
#ifndef MESHGATE_CONNECTION_MANAGER_HPP
#define MESHGATE_CONNECTION_MANAGER_HPP

#include <stdint.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "meshgate/event_dispatcher.hpp"
#include "meshgate/radio_link.hpp"

namespace meshgate {

enum class LinkState : uint8_t { Disconnected=0, Connecting=1, Connected=2 };

const char* to_string(LinkState s);

/// Snapshot of the connection as seen by readers.
struct ConnectionState {
  LinkState                                            state{LinkState::Disconnected};
  bool                                                 is_connected{false};
  std::optional<NodeNum>                               local_node_id;      ///< last known, kept across drops
  uint64_t                                             connection_attempts{0};
  std::optional<std::chrono::system_clock::time_point> last_connected_at;
  std::string                                          last_error;
};

class ConnectionManager {
public:
  /// Tunables. Defaults match a gateway on the local network.
  struct Options {
    std::string address;
    int retry_ms{1000};   ///< wait after a failed connect or a link that died younger than this
    int poll_ms{200};     ///< max wait per poll; bounds stop() latency while connected
  };

  ConnectionManager(Connector& connector, EventDispatcher& dispatcher, Options options);

  /// Stops the background thread (if running) and closes the link.
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  /// Spawn the background thread running run(). No-op if already started.
  void start();

  /**
   * @brief The connect / pump / retry loop. Returns only after stop().
   *
   * start() runs this on its own thread; tests may also call it directly.
   */
  void run();

  /// Signal shutdown, wake any wait, join the thread, close the link.
  void stop();

  /// Copy of the current connection state.
  ConnectionState status() const;

  /// Block until Connected or @p timeout elapses. Returns true if connected.
  bool wait_connected(std::chrono::milliseconds timeout) const;

  /**
   * @brief Send a text message through the live link.
   *
   * @param text    Message body.
   * @param target  Destination node ("!hex", decimal, "^all") or empty for broadcast.
   * @param detail  Receives a human-readable reason on anything but Ok.
   * @return NotConnected if no link is live, otherwise the link's result.
   */
  TxResult send(const std::string& text, const std::string& target, std::string& detail);

  const Options& options() const { return options_; }

private:
  void set_state(LinkState s, const std::string& error = std::string());
  void on_connected(std::unique_ptr<RadioLink> link);
  void drop_link();
  std::string pump();          // returns the reason the link died ("" on stop)
  void wait_retry();

  Connector&       connector_;
  EventDispatcher& dispatcher_;
  Options          options_;

  mutable std::mutex              state_mutex_;
  mutable std::condition_variable state_cv_;    ///< state changes and stop requests
  ConnectionState                 state_;

  std::mutex                 link_mutex_;       ///< guards replacing link_ vs send()
  std::unique_ptr<RadioLink> link_;

  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> running_{false};
  std::thread       worker_;
};

} // namespace meshgate

#endif // MESHGATE_CONNECTION_MANAGER_HPP
