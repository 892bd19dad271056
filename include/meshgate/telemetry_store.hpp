/**
 * @file telemetry_store.hpp
 * @brief Latest-value-wins telemetry caches, one per metrics kind.
 *
 * @details
 * Two independent maps keyed by node number: one for device metrics
 * (battery, voltage, airtime) and one for environment metrics
 * (temperature, humidity, pressure). A node that reports both kinds lands in
 * both maps; a new reading of one kind never touches the other.
 *
 * Each map has its own mutex, held only for a single upsert or a single
 * copy-out. Readers get a copy they can walk at leisure while the ingestion
 * thread keeps writing.
 *
 * There is no eviction: the map grows with the number of distinct nodes
 * ever heard, which on a LoRa mesh is tens to low hundreds.
 */
#ifndef MESHGATE_TELEMETRY_STORE_HPP
#define MESHGATE_TELEMETRY_STORE_HPP

#include <map>
#include <mutex>

#include "meshgate/packet.hpp"

namespace meshgate {

struct DeviceTelemetrySample {
  NodeNum       node_id{0};
  uint64_t      time{0};      ///< sender's timestamp (epoch seconds)
  DeviceMetrics metrics;
};

struct EnvironmentTelemetrySample {
  NodeNum            node_id{0};
  uint64_t           time{0};
  EnvironmentMetrics metrics;
};

using DeviceTelemetryMap      = std::map<NodeNum, DeviceTelemetrySample>;
using EnvironmentTelemetryMap = std::map<NodeNum, EnvironmentTelemetrySample>;

class TelemetryStore {
public:
  /// Replace the device sample for `sample.node_id`.
  void upsert_device(const DeviceTelemetrySample& sample);

  /// Replace the environment sample for `sample.node_id`.
  void upsert_environment(const EnvironmentTelemetrySample& sample);

  DeviceTelemetryMap      snapshot_device() const;
  EnvironmentTelemetryMap snapshot_environment() const;

private:
  mutable std::mutex      device_mutex_;
  DeviceTelemetryMap      device_;

  mutable std::mutex      environment_mutex_;
  EnvironmentTelemetryMap environment_;
};

} // namespace meshgate

#endif // MESHGATE_TELEMETRY_STORE_HPP
