// -----------------------------------------------------------------------------
// telemetry_store.cpp: Implementation of TelemetryStore
//
// API: include/meshgate/telemetry_store.hpp
// -----------------------------------------------------------------------------
#include "meshgate/telemetry_store.hpp"

namespace meshgate {

void TelemetryStore::upsert_device(const DeviceTelemetrySample& sample) {
  std::lock_guard<std::mutex> lock(device_mutex_);
  device_[sample.node_id] = sample;          // latest reading wins
}

void TelemetryStore::upsert_environment(const EnvironmentTelemetrySample& sample) {
  std::lock_guard<std::mutex> lock(environment_mutex_);
  environment_[sample.node_id] = sample;
}

DeviceTelemetryMap TelemetryStore::snapshot_device() const {
  std::lock_guard<std::mutex> lock(device_mutex_);
  return device_;                            // copy out; lock released on return
}

EnvironmentTelemetryMap TelemetryStore::snapshot_environment() const {
  std::lock_guard<std::mutex> lock(environment_mutex_);
  return environment_;
}

} // namespace meshgate
