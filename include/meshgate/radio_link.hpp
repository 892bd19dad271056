#pragma once
/**
 * @file radio_link.hpp
 * @brief Transport seam between meshgate and the gateway radio.
 *
 * Header-only. The ConnectionManager only ever sees these two interfaces;
 * the shipped TCP/serial implementation lives in stream_link.hpp and tests
 * plug in fakes.
 */

#include <cstdint>
#include <memory>
#include <string>

#include "meshgate/packet.hpp"

namespace meshgate {

// Return codes kept small and explicit.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2, InvalidNode=3, NotConnected=4 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

/**
 * @brief One live connection to the gateway device.
 *
 * Contract:
 *  - local_node_id() is known from the moment connect() returns the link.
 *  - poll_event() waits up to timeout_ms for one decoded packet.
 *      Ok    -> @p out filled.
 *      None  -> nothing arrived (or only frames that were not packets).
 *      Error -> the link is dead; @p detail says why. Do not poll again.
 *    Only one thread polls.
 *  - send_text() may be called from any thread, concurrently with poll_event().
 *    An empty @p target means broadcast. InvalidNode means @p target is not a
 *    node address; nothing was transmitted.
 *  - close() releases the transport; later calls fail with Error.
 */
class RadioLink {
public:
  virtual ~RadioLink() = default;
  virtual NodeNum     local_node_id() const = 0;
  virtual RxResult    poll_event(PacketEvent& out, int timeout_ms, std::string& detail) = 0;
  virtual TxResult    send_text(const std::string& text, const std::string& target, std::string& detail) = 0;
  virtual void        close() = 0;
  virtual const char* name() const = 0;
};

/**
 * @brief Opens RadioLinks. Returns nullptr and fills @p error on failure.
 */
class Connector {
public:
  virtual ~Connector() = default;
  virtual std::unique_ptr<RadioLink> connect(const std::string& address, std::string& error) = 0;
};

} // namespace meshgate
