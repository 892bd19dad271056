/**
 * @file event_dispatcher.hpp
 * @brief Classify inbound packets and route them into the stores.
 *
 * @details
 * The dispatcher sits on the ingestion thread between the ConnectionManager
 * and the three stores. It does no I/O and never blocks beyond the store
 * mutexes, so the radio link is drained as fast as packets arrive.
 *
 * Routing rules (every rule is checked, a packet may match several):
 *
 * | Packet carries                                  | Action                            |
 * |-------------------------------------------------|-----------------------------------|
 * | sender + telemetry time + device metrics        | TelemetryStore::upsert_device     |
 * | sender + telemetry time + environment metrics   | TelemetryStore::upsert_environment|
 * | sender + text                                   | MessageStore::insert              |
 * | sender + long-form id                           | NodeRegistry::register_if_absent  |
 *
 * Anything else (position, routing, admin, half-decoded frames) is dropped
 * without comment. On a shared channel that is the common case, not a fault.
 */
#ifndef MESHGATE_EVENT_DISPATCHER_HPP
#define MESHGATE_EVENT_DISPATCHER_HPP

#include "meshgate/message_store.hpp"
#include "meshgate/node_registry.hpp"
#include "meshgate/packet.hpp"
#include "meshgate/telemetry_store.hpp"

namespace meshgate {

class EventDispatcher {
public:
  EventDispatcher(TelemetryStore& telemetry, MessageStore& messages, NodeRegistry& nodes);

  /// Route one packet. Safe to call with any combination of sections present.
  void on_packet(const PacketEvent& event);

private:
  void route_telemetry(NodeNum from, const TelemetryReading& reading);
  void route_text(NodeNum from, const std::string& text);

  TelemetryStore& telemetry_;
  MessageStore&   messages_;
  NodeRegistry&   nodes_;
};

} // namespace meshgate

#endif // MESHGATE_EVENT_DISPATCHER_HPP
