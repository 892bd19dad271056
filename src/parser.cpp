/**
 * @file parser.cpp
 * @brief JSON layer for meshgate: gateway frames in, response documents out.
 * @details
 *   All conversion between raw JSON text and meshgate types lives here:
 *     - Decoding gateway frames into PacketEvent / handshake info (@c decode_frame).
 *     - Building the frames meshgate writes to the gateway (@c want_config_json,
 *       @c send_text_json).
 *     - Rendering store snapshots and outcomes into response bodies.
 *
 *   ## Error Suppression & Robustness
 *   Input comes off a radio and a socket, so nothing here throws:
 *    - Parsing uses nlohmann's non-throwing mode and checks @c is_discarded().
 *    - Every field is type-checked before it is read; a wrong type is the
 *      same as a missing field.
 *    - Serialization replaces invalid UTF-8 instead of throwing, since message
 *      text is whatever some node put on the air.
 */

#include "meshgate/parser.hpp"

#include <chrono>

using nlohmann::json;

namespace meshgate {
namespace parser {

// ---------- field readers (no exceptions) ----------

static const json* member(const json& obj, const char* key) {
  if (!obj.is_object()) return nullptr;
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return nullptr;
  return &*it;
}

static std::optional<uint64_t> read_u64(const json& obj, const char* key) {
  const json* v = member(obj, key);
  if (!v) return std::nullopt;
  if (v->is_number_unsigned()) return v->get<uint64_t>();
  if (v->is_number_integer()) {
    const int64_t i = v->get<int64_t>();
    if (i < 0) return std::nullopt;
    return static_cast<uint64_t>(i);
  }
  return std::nullopt;
}

static std::optional<uint32_t> read_u32(const json& obj, const char* key) {
  const std::optional<uint64_t> v = read_u64(obj, key);
  if (!v || *v > 0xFFFFFFFFull) return std::nullopt;
  return static_cast<uint32_t>(*v);
}

static std::optional<double> read_double(const json& obj, const char* key) {
  const json* v = member(obj, key);
  if (!v || !v->is_number()) return std::nullopt;
  return v->get<double>();
}

static std::optional<std::string> read_string(const json& obj, const char* key) {
  const json* v = member(obj, key);
  if (!v || !v->is_string()) return std::nullopt;
  return v->get<std::string>();
}

static DeviceMetrics read_device_metrics(const json& j) {
  DeviceMetrics m;
  m.battery_level       = read_u32(j, "batteryLevel");
  m.voltage             = read_double(j, "voltage");
  m.channel_utilization = read_double(j, "channelUtilization");
  m.air_util_tx         = read_double(j, "airUtilTx");
  return m;
}

static EnvironmentMetrics read_environment_metrics(const json& j) {
  EnvironmentMetrics m;
  m.temperature         = read_double(j, "temperature");
  m.relative_humidity   = read_double(j, "relativeHumidity");
  m.barometric_pressure = read_double(j, "barometricPressure");
  return m;
}

static TelemetryReading read_telemetry(const json& j) {
  TelemetryReading t;
  t.time = read_u64(j, "time");
  const json* dev = member(j, "deviceMetrics");
  if (dev && dev->is_object()) t.device = read_device_metrics(*dev);
  const json* env = member(j, "environmentMetrics");
  if (env && env->is_object()) t.environment = read_environment_metrics(*env);
  return t;
}

static PacketEvent read_packet(const json& j) {
  PacketEvent p;
  p.from    = read_u32(j, "from");
  p.to      = read_u32(j, "to");
  p.from_id = read_string(j, "fromId");
  p.portnum = "UNKNOWN";

  const json* decoded = member(j, "decoded");
  if (decoded && decoded->is_object()) {
    if (auto port = read_string(*decoded, "portnum")) p.portnum = *port;
    const json* tel = member(*decoded, "telemetry");
    if (tel && tel->is_object()) p.telemetry = read_telemetry(*tel);
    p.text = read_string(*decoded, "text");
  }
  return p;
}

/**
 * @brief Decode one gateway frame.
 *
 * @details
 *   - `{"myInfo":{"myNodeNum":N}}` → FrameKind::MyInfo (N must fit 32 bits).
 *   - any object carrying "from" or "decoded" → FrameKind::Packet.
 *   - any other object (config dumps, log records) → FrameKind::Unknown.
 */
bool decode_frame(const std::string& frame, GatewayFrame& out) {
  out = GatewayFrame{};
  const json j = json::parse(frame, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) return false;

  const json* info = member(j, "myInfo");
  if (info) {
    const std::optional<uint32_t> num = read_u32(*info, "myNodeNum");
    if (num) {
      out.kind = FrameKind::MyInfo;
      out.my_node_num = *num;
    }
    return true;
  }

  if (j.contains("from") || j.contains("decoded")) {
    out.kind = FrameKind::Packet;
    out.packet = read_packet(j);
  }
  return true;
}

std::string want_config_json() {
  json j;
  j["want_config"] = true;
  return j.dump();
}

std::string send_text_json(const std::string& text, NodeNum to) {
  json j;
  j["sendText"]["text"] = text;
  j["sendText"]["to"]   = to;
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// ---------- response bodies ----------

template <typename T>
static Document or_null(const std::optional<T>& v) {
  if (!v) return Document(nullptr);
  return Document(*v);
}

Document device_telemetry_json(const DeviceTelemetryMap& samples) {
  Document body = Document::object();
  for (const auto& kv : samples) {
    const DeviceMetrics& m = kv.second.metrics;
    Document entry;
    entry["time"] = kv.second.time;
    entry["deviceMetrics"]["batteryLevel"]       = or_null(m.battery_level);
    entry["deviceMetrics"]["voltage"]            = or_null(m.voltage);
    entry["deviceMetrics"]["channelUtilization"] = or_null(m.channel_utilization);
    entry["deviceMetrics"]["airUtilTx"]          = or_null(m.air_util_tx);
    body[std::to_string(kv.first)] = entry;
  }
  return body;
}

Document environment_telemetry_json(const EnvironmentTelemetryMap& samples) {
  Document body = Document::object();
  for (const auto& kv : samples) {
    const EnvironmentMetrics& m = kv.second.metrics;
    Document entry;
    entry["time"] = kv.second.time;
    entry["environmentMetrics"]["temperature"]        = or_null(m.temperature);
    entry["environmentMetrics"]["relativeHumidity"]   = or_null(m.relative_humidity);
    entry["environmentMetrics"]["barometricPressure"] = or_null(m.barometric_pressure);
    body[std::to_string(kv.first)] = entry;
  }
  return body;
}

// Oldest first; Document preserves the insertion order.
Document messages_json(const std::vector<MessageEntry>& entries) {
  Document body = Document::object();
  for (const MessageEntry& e : entries) {
    Document entry;
    entry["node_id"] = e.node_id;
    entry["message"] = e.text;
    body[std::string(e.id.c_str())] = entry;
  }
  return body;
}

Document nodes_json(const NodeMap& nodes) {
  Document body = Document::object();
  for (const auto& kv : nodes) {
    body[std::to_string(kv.first)]["long_id"] = kv.second.long_id;
  }
  return body;
}

/**
 * @brief Connection status body.
 *
 * `nodeid` is the decimal local node number, or null before the first
 * connection. `last_connection_time` is epoch seconds with sub-second
 * precision, or null if never connected.
 */
Document status_json(const ConnectionState& state) {
  Document body;
  body["connected"] = state.is_connected;
  body["nodeid"] = state.local_node_id ? Document(std::to_string(*state.local_node_id))
                                       : Document(nullptr);
  if (state.last_connected_at) {
    using namespace std::chrono;
    const duration<double> since_epoch = state.last_connected_at->time_since_epoch();
    body["last_connection_time"] = since_epoch.count();
  } else {
    body["last_connection_time"] = nullptr;
  }
  body["total_connection_attempts"] = state.connection_attempts;
  return body;
}

Document outcome_json(bool success, const std::string& message) {
  Document body;
  body["status"]  = success ? "success" : "error";
  body["message"] = message;
  return body;
}

Document error_json(const std::string& message) {
  Document body;
  body["error"] = message;
  return body;
}

std::string response_line(int code, const Document& body) {
  Document j;
  j["code"] = code;
  j["body"] = body;
  return j.dump(-1, ' ', false, Document::error_handler_t::replace);
}

} // namespace parser
} // namespace meshgate
