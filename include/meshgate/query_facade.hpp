/**
 * @file query_facade.hpp
 * @brief The one door the request layer uses to reach meshgate state.
 *
 * @details
 * QueryFacade holds references to the three stores and the
 * ConnectionManager, all constructed once in `main`. Every method is safe to
 * call from any number of request threads at once: reads return copies,
 * writes are single-step store operations, and sends go through
 * ConnectionManager::send().
 *
 * Parameter checks happen here, before any store or the link is touched.
 *
 * | Operation             | Failure modes                                         |
 * |-----------------------|-------------------------------------------------------|
 * | send_message          | MissingParameter, NotConnected, InvalidNodeId, SendFailed |
 * | delete_message        | MissingParameter, NotFound                            |
 * | everything else       | none                                                  |
 */
#ifndef MESHGATE_QUERY_FACADE_HPP
#define MESHGATE_QUERY_FACADE_HPP

#include <stdint.h>
#include <optional>
#include <string>
#include <vector>

#include "meshgate/connection_manager.hpp"
#include "meshgate/message_store.hpp"
#include "meshgate/node_registry.hpp"
#include "meshgate/telemetry_store.hpp"

namespace meshgate {

enum class QueryError : uint8_t {
  None=0,
  MissingParameter,   ///< a required input was absent
  InvalidNodeId,      ///< send target is not a node address
  NotFound,           ///< message id not in the cache
  NotConnected,       ///< no live link to the gateway
  SendFailed          ///< the transport refused or failed the write
};

const char* to_string(QueryError e);

/// Outcome of a write operation. `detail` names the missing parameter or the transport reason.
struct QueryResult {
  QueryError  error{QueryError::None};
  std::string detail;

  bool ok() const { return error == QueryError::None; }
};

class QueryFacade {
public:
  QueryFacade(TelemetryStore& telemetry, MessageStore& messages, NodeRegistry& nodes,
              ConnectionManager& connection);

  /**
   * @brief Send a text message to the mesh.
   * @param text    Required body. Absent -> MissingParameter("message").
   * @param target  Optional destination node; absent or empty means broadcast.
   */
  QueryResult send_message(const std::optional<std::string>& text,
                           const std::optional<std::string>& target);

  /// Remove a cached message. Absent id -> MissingParameter("message_id").
  QueryResult delete_message(const std::optional<std::string>& message_id);

  DeviceTelemetryMap        device_telemetry() const;
  EnvironmentTelemetryMap   environment_telemetry() const;
  std::vector<MessageEntry> last_messages() const;
  NodeMap                   nodes() const;
  ConnectionState           status() const;

private:
  TelemetryStore&    telemetry_;
  MessageStore&      messages_;
  NodeRegistry&      nodes_;
  ConnectionManager& connection_;
};

} // namespace meshgate

#endif // MESHGATE_QUERY_FACADE_HPP
