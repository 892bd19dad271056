#ifndef MESHGATE_PARSER_HPP
#define MESHGATE_PARSER_HPP

#include <stdint.h>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "meshgate/connection_manager.hpp"
#include "meshgate/message_store.hpp"
#include "meshgate/node_registry.hpp"
#include "meshgate/packet.hpp"
#include "meshgate/telemetry_store.hpp"

namespace meshgate {
namespace parser {

/// Response documents keep insertion order so message listings stay oldest-first.
using Document = nlohmann::ordered_json;

/// What a frame from the gateway turned out to be.
enum class FrameKind : uint8_t { Unknown=0, Packet=1, MyInfo=2 };

/// Result of decode_frame(). Only the member matching `kind` is meaningful.
struct GatewayFrame {
  FrameKind   kind{FrameKind::Unknown};
  PacketEvent packet;
  NodeNum     my_node_num{0};
};

/**
 * @brief Decode one SLIP payload received from the gateway.
 * @param frame  Raw bytes of the frame (UTF-8 JSON expected).
 * @param out    Filled on return.
 * @return false if the frame is not a JSON object. Unknown objects return
 *         true with kind Unknown.
 *
 * @details
 *   Never throws. Fields that are missing or carry the wrong JSON type are
 *   left absent in the PacketEvent rather than failing the whole frame.
 */
bool decode_frame(const std::string& frame, GatewayFrame& out);

/// The handshake request written right after the stream opens.
std::string want_config_json();

/// `{"sendText":{"text":...,"to":N}}`
std::string send_text_json(const std::string& text, NodeNum to);

/**
 * @name Response bodies
 * @{
 */
Document device_telemetry_json(const DeviceTelemetryMap& samples);
Document environment_telemetry_json(const EnvironmentTelemetryMap& samples);
Document messages_json(const std::vector<MessageEntry>& entries);
Document nodes_json(const NodeMap& nodes);
Document status_json(const ConnectionState& state);

/// `{"status":"success"|"error","message":...}`
Document outcome_json(bool success, const std::string& message);

/// `{"error":...}`
Document error_json(const std::string& message);
/** @} */

/// Envelope written on the control port: `{"code":N,"body":...}`.
std::string response_line(int code, const Document& body);

} // namespace parser
} // namespace meshgate

#endif // MESHGATE_PARSER_HPP
