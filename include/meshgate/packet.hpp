/**
 * @file packet.hpp
 * @brief Decoded mesh packet events as they leave the RadioLink boundary.
 *
 * @details
 * ## What a PacketEvent is
 * The gateway radio hands us packets it has already decoded. A PacketEvent
 * is that decoded packet reduced to the sections meshgate cares about, each
 * one explicitly optional:
 *
 * | Section       | Field(s)                      | Used by                      |
 * |---------------|-------------------------------|------------------------------|
 * | sender        | `from`, `from_id`             | every store, NodeRegistry    |
 * | routing       | `to`, `portnum`               | tracing only                 |
 * | telemetry     | `telemetry->device`           | TelemetryStore (device)      |
 * |               | `telemetry->environment`      | TelemetryStore (environment) |
 * | text          | `text`                        | MessageStore                 |
 *
 * A packet may carry any combination, including none of them (position
 * reports, routing chatter, admin traffic). Absence is the normal case and
 * is never an error.
 *
 * ## Where it is built
 * Decoding happens exactly once, in the link (see parser::decode_frame()).
 * Everything downstream reads typed optionals instead of poking into a
 * loosely typed document.
 */
#ifndef MESHGATE_PACKET_HPP
#define MESHGATE_PACKET_HPP

#include <stdint.h>
#include <optional>
#include <string>

namespace meshgate {

/// Numeric node address on the mesh (the radio's node number).
using NodeNum = uint32_t;

/// Destination used for "everyone on the channel".
static constexpr NodeNum BROADCAST_NODE = 0xFFFFFFFFu;

/// Device health section of a telemetry packet. Every reading is optional.
struct DeviceMetrics {
  std::optional<uint32_t> battery_level;        ///< percent, >100 means external power
  std::optional<double>   voltage;              ///< volts
  std::optional<double>   channel_utilization;  ///< percent of airtime seen busy
  std::optional<double>   air_util_tx;          ///< percent of airtime spent transmitting
};

/// Environment sensor section of a telemetry packet.
struct EnvironmentMetrics {
  std::optional<double> temperature;          ///< degrees Celsius
  std::optional<double> relative_humidity;    ///< percent
  std::optional<double> barometric_pressure;  ///< hPa
};

/// Telemetry payload. A sample without `time` is unusable and gets dropped.
struct TelemetryReading {
  std::optional<uint64_t>           time;
  std::optional<DeviceMetrics>      device;
  std::optional<EnvironmentMetrics> environment;
};

/// One decoded inbound packet.
struct PacketEvent {
  std::optional<NodeNum>          from;
  std::optional<NodeNum>          to;
  std::optional<std::string>      from_id;    ///< long-form id, e.g. "!a1b2c3d4"
  std::string                     portnum;    ///< application port name, "UNKNOWN" if absent
  std::optional<TelemetryReading> telemetry;
  std::optional<std::string>      text;
};

} // namespace meshgate

#endif // MESHGATE_PACKET_HPP
