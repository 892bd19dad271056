#pragma once
/**
 * @file stream_link.hpp
 * @brief The shipped RadioLink: SLIP-framed JSON over a TCP socket or serial TTY.
 *
 * @details
 * ## Address forms
 * | Form                          | Transport | Default           |
 * |-------------------------------|-----------|-------------------|
 * | `tcp://host[:port]`           | TCP       | port 4403         |
 * | `host[:port]`                 | TCP       | port 4403         |
 * | `serial:/dev/ttyX[@baud]`     | serial    | 115200 baud       |
 * | `/dev/...[@baud]`             | serial    | 115200 baud       |
 *
 * ## Session
 * 1. Open the byte stream.
 * 2. Write `{"want_config":true}`.
 * 3. Read frames until `{"myInfo":{"myNodeNum":N}}`. Packets seen before it
 *    are queued and handed out by the first poll_event() calls.
 * 4. From then on: packet frames become PacketEvents; sends are
 *    `{"sendText":{...}}` frames.
 *
 * ## Threads
 * One thread polls, any thread may send. Writes are serialized by a mutex so
 * two frames never interleave on the wire.
 */

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "meshgate/radio_link.hpp"
#include "meshgate/slip.hpp"

namespace meshgate {

/// Default TCP port of the gateway's stream API.
static constexpr uint16_t DEFAULT_GATEWAY_PORT = 4403;

/// Default serial speed.
static constexpr int DEFAULT_GATEWAY_BAUD = 115200;

/// Parsed gateway address.
struct GatewayAddress {
  enum class Kind : uint8_t { Tcp=0, Serial=1 };
  Kind        kind{Kind::Tcp};
  std::string host;                          ///< Tcp only
  uint16_t    port{DEFAULT_GATEWAY_PORT};    ///< Tcp only
  std::string device;                        ///< Serial only
  int         baud{DEFAULT_GATEWAY_BAUD};    ///< Serial only
};

/**
 * @brief Parse an address string (see table above).
 * @return false with @p error set for an empty host/device, a bad port or a bad baud.
 */
bool parse_gateway_address(const std::string& address, GatewayAddress& out, std::string& error);

/**
 * @brief Resolve a send target into a node number.
 *
 * Empty or `^all` means broadcast. `!` followed by 1 to 8 hex digits, or a
 * plain decimal number that fits 32 bits, names a node. Anything else is rejected.
 */
bool parse_destination(const std::string& target, NodeNum& out);

class StreamRadioLink : public RadioLink {
public:
  /**
   * @brief Take ownership of an open, non-blocking fd.
   * @param label            Shown in logs (e.g. "tcp:10.0.0.5:4403").
   * @param write_timeout_ms Bound on a single frame write.
   */
  StreamRadioLink(int fd, std::string label, int write_timeout_ms);
  ~StreamRadioLink() override;

  StreamRadioLink(const StreamRadioLink&) = delete;
  StreamRadioLink& operator=(const StreamRadioLink&) = delete;

  /// Run the want_config / myInfo exchange. Must succeed before the link is handed out.
  bool handshake(int timeout_ms, std::string& error);

  NodeNum     local_node_id() const override { return local_node_; }
  RxResult    poll_event(PacketEvent& out, int timeout_ms, std::string& detail) override;
  TxResult    send_text(const std::string& text, const std::string& target, std::string& detail) override;
  void        close() override;
  const char* name() const override { return label_.c_str(); }

  /// Packets decoded but not yet handed out.
  size_t pending() const { return pending_.size(); }

private:
  // Read whatever arrives within timeout_ms and decode every complete frame.
  RxResult pump_bytes(int timeout_ms, std::string& detail);
  void     on_frame(const std::vector<uint8_t>& frame);
  bool     write_frame(const std::string& payload, std::string& detail);

  int                     fd_;
  std::string             label_;
  int                     write_timeout_ms_;
  NodeNum                 local_node_{0};
  bool                    have_my_info_{false};

  slip::Decoder           decoder_;
  std::deque<PacketEvent> pending_;

  std::mutex              write_mutex_;
};

/**
 * @brief Connector that opens StreamRadioLinks from address strings.
 */
class StreamConnector : public Connector {
public:
  struct Options {
    int connect_timeout_ms{5000};
    int handshake_ms{5000};
    int write_timeout_ms{2000};
    int serial_boot_delay_ms{400};
  };

  StreamConnector() = default;
  explicit StreamConnector(Options options) : options_(options) {}

  std::unique_ptr<RadioLink> connect(const std::string& address, std::string& error) override;

private:
  Options options_;
};

} // namespace meshgate
