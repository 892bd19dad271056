// -----------------------------------------------------------------------------
// query_facade.cpp: Implementation of QueryFacade
//
// Error table: include/meshgate/query_facade.hpp
// -----------------------------------------------------------------------------
#include "meshgate/query_facade.hpp"

#include "meshgate/log.hpp"

namespace meshgate {

const char* to_string(QueryError e) {
  switch (e) {
    case QueryError::None:             return "ok";
    case QueryError::MissingParameter: return "missing_parameter";
    case QueryError::InvalidNodeId:    return "invalid_node_id";
    case QueryError::NotFound:         return "not_found";
    case QueryError::NotConnected:     return "not_connected";
    case QueryError::SendFailed:       return "send_failed";
  }
  return "send_failed";
}

QueryFacade::QueryFacade(TelemetryStore& telemetry, MessageStore& messages, NodeRegistry& nodes,
                         ConnectionManager& connection)
: telemetry_(telemetry), messages_(messages), nodes_(nodes), connection_(connection) {
}

// send_message(): map the link's TxResult onto the caller-facing taxonomy.
QueryResult QueryFacade::send_message(const std::optional<std::string>& text,
                                      const std::optional<std::string>& target) {
  if (!text) return {QueryError::MissingParameter, "message"};

  std::string detail;
  const TxResult r = connection_.send(*text, target.value_or(std::string()), detail);
  switch (r) {
    case TxResult::Ok:
      return {};
    case TxResult::NotConnected:
      return {QueryError::NotConnected, detail};
    case TxResult::InvalidNode:
      return {QueryError::InvalidNodeId, detail};
    case TxResult::Busy:
    case TxResult::Error:
      break;
  }
  log::error("event=send_failed reason=" + detail);
  return {QueryError::SendFailed, detail};
}

// delete_message(): anything that is not key-shaped cannot be in the store.
QueryResult QueryFacade::delete_message(const std::optional<std::string>& message_id) {
  if (!message_id) return {QueryError::MissingParameter, "message_id"};
  if (!is_message_key(*message_id)) return {QueryError::NotFound, *message_id};

  if (!messages_.remove(MessageKey(message_id->c_str()))) {
    return {QueryError::NotFound, *message_id};
  }
  return {};
}

DeviceTelemetryMap QueryFacade::device_telemetry() const {
  return telemetry_.snapshot_device();
}

EnvironmentTelemetryMap QueryFacade::environment_telemetry() const {
  return telemetry_.snapshot_environment();
}

std::vector<MessageEntry> QueryFacade::last_messages() const {
  return messages_.snapshot();
}

NodeMap QueryFacade::nodes() const {
  return nodes_.snapshot();
}

ConnectionState QueryFacade::status() const {
  return connection_.status();
}

} // namespace meshgate
