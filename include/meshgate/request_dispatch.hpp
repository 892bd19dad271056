#pragma once
/**
 * @file request_dispatch.hpp
 * @brief Turns one request line into one QueryFacade call and one JSON response.
 *
 * @details
 * ## Overview
 * The control port and the stdin console speak the same tiny protocol:
 *
 * ```
 *   <operation> [--key value]...
 * ```
 *
 * `--message` is special: everything after it (one separating space dropped)
 * is the message text, verbatim, so text may contain spaces and `--`. Put the
 * target first:
 *
 * ```
 *   send_message --node_id !a1b2c3d4 --message hello there
 * ```
 *
 * A single trailing ` --node_id <id>` or ` --to <id>` after the text is still
 * read as the target, not as part of the message.
 * Every other value is the next whitespace-separated word.
 *
 * The reply is a single line: `{"code":<int>,"body":<json>}`.
 *
 * ## Dispatch
 * - A `RequestKind` enum lists every supported operation.
 * - `name_to_kind()` maps user spellings (including aliases) onto it.
 * - `RequestHandler::handle()` switches on the kind and calls the facade.
 *
 * Adding an operation = new enum entry + name mapping + switch case + help row.
 *
 * ## Codes
 * | code | meaning                                               |
 * |------|-------------------------------------------------------|
 * | 200  | handled (body may still report `"status":"error"`)    |
 * | 400  | bad input: invalid node id, unknown message id        |
 * | 404  | unknown operation or missing required parameter       |
 */

#include <map>
#include <string>

#include "meshgate/parser.hpp"
#include "meshgate/query_facade.hpp"

namespace meshgate {

enum class RequestKind {
  SEND_MESSAGE,
  GET_DEVICE_TELEMETRY,
  GET_ENVIRONMENT_TELEMETRY,
  GET_LAST_MESSAGES,
  DELETE_MESSAGE,
  NODES,
  STATUS,
  HELP
};

/// One parsed request line.
struct Request {
  std::string                        op;       ///< operation word as typed
  std::map<std::string, std::string> params;   ///< keys without the leading "--"
};

/**
 * @brief Split a request line.
 * @return false for a blank line (nothing to answer).
 */
bool parse_request(const std::string& line, Request& out);

/// Map an operation name (case-insensitive, '-' and '_' equivalent) to its kind.
bool name_to_kind(const std::string& name, RequestKind& out_kind);

struct Response {
  int              code{200};
  parser::Document body;
};

class RequestHandler {
public:
  explicit RequestHandler(QueryFacade& facade) : facade_(facade) {}

  Response handle(const Request& request);

  /// parse_request + handle + render. Returns "" for a blank line.
  std::string handle_line(const std::string& line);

private:
  Response send_message(const Request& request);
  Response delete_message(const Request& request);

  QueryFacade& facade_;
};

} // namespace meshgate
