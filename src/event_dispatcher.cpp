// -----------------------------------------------------------------------------
// event_dispatcher.cpp: Implementation of EventDispatcher
//
// Routing table: include/meshgate/event_dispatcher.hpp
// -----------------------------------------------------------------------------
#include "meshgate/event_dispatcher.hpp"

#include "meshgate/log.hpp"

#include <string>

namespace meshgate {

static std::string opt_num(const std::optional<NodeNum>& n) {
  return n ? std::to_string(*n) : std::string("none");
}

EventDispatcher::EventDispatcher(TelemetryStore& telemetry, MessageStore& messages, NodeRegistry& nodes)
: telemetry_(telemetry), messages_(messages), nodes_(nodes) {
}

// on_packet(): apply every matching rule; no rule depends on another.
void EventDispatcher::on_packet(const PacketEvent& event) {
  log::debug("event=packet from=" + opt_num(event.from) + " to=" + opt_num(event.to) +
             " portnum=" + event.portnum);

  // Without a sender nothing below can be attributed to a node.
  if (!event.from) return;
  const NodeNum from = *event.from;

  if (event.telemetry) {
    route_telemetry(from, *event.telemetry);
  }

  if (event.text) {
    route_text(from, *event.text);
  }

  if (event.from_id) {
    if (nodes_.register_if_absent(from, *event.from_id)) {
      log::debug("event=node_seen node=" + std::to_string(from) + " long_id=" + *event.from_id);
    }
  }
}

// route_telemetry(): device and environment sections are independent caches.
void EventDispatcher::route_telemetry(NodeNum from, const TelemetryReading& reading) {
  if (!reading.time) return;   // a reading with no timestamp cannot be ordered

  if (reading.device) {
    DeviceTelemetrySample sample;
    sample.node_id = from;
    sample.time    = *reading.time;
    sample.metrics = *reading.device;
    telemetry_.upsert_device(sample);
  }

  if (reading.environment) {
    EnvironmentTelemetrySample sample;
    sample.node_id = from;
    sample.time    = *reading.time;
    sample.metrics = *reading.environment;
    telemetry_.upsert_environment(sample);
  }
}

void EventDispatcher::route_text(NodeNum from, const std::string& text) {
  MessageKey key;
  if (!messages_.insert(from, text, key)) {
    log::error("event=message_dropped node=" + std::to_string(from) + " reason=no_unique_key");
    return;
  }
  log::debug("event=message_cached node=" + std::to_string(from) + " id=" + key.c_str());
}

} // namespace meshgate
