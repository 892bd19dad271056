// -----------------------------------------------------------------------------
// Implementation for request_dispatch.hpp
//
// - See request_dispatch.hpp for the line protocol and response codes.
// - See tests/test_request_dispatch.cpp for runnable cases.
// -----------------------------------------------------------------------------

#include "meshgate/request_dispatch.hpp"

#include <cctype>
#include <optional>

namespace meshgate {

// ---------- lowercase normalizer ----------
// Lowercase and fold '-' into '_' so "get-last-messages" matches too.
static std::string normalize(std::string s) {
  for (auto& c : s) {
    c = (char)std::tolower((unsigned char)c);
    if (c == '-') c = '_';
  }
  return s;
}

static bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// A message written before its target ("--message hi --node_id !0a") ends in
// exactly " --node_id <word>" or " --to <word>"; move that pair into params.
static void split_trailing_target(std::string& text, std::map<std::string, std::string>& params) {
  size_t end = text.size();
  while (end > 0 && is_space(text[end - 1])) --end;
  size_t word = end;
  while (word > 0 && !is_space(text[word - 1])) --word;
  if (word == end || word == 0) return;

  for (const char* key : {"node_id", "to"}) {
    const std::string flag = std::string(" --") + key + " ";
    if (word < flag.size() || text.compare(word - flag.size(), flag.size(), flag) != 0) continue;
    params[key] = text.substr(word, end - word);
    text.erase(word - flag.size());
    return;
  }
}

// ---------------------------------------------------------------------------
// parse_request()
// ---------------
// Walk the line word by word. A word starting with "--" is a key; the value
// is the next word unless the key is "message", which swallows the rest of
// the line. Words that are not keys (and not a key's value) are ignored.
// ---------------------------------------------------------------------------
bool parse_request(const std::string& line, Request& out) {
  out = Request{};
  size_t i = 0;
  const size_t n = line.size();

  auto skip_space = [&]() { while (i < n && is_space(line[i])) ++i; };
  auto next_word = [&]() {
    const size_t start = i;
    while (i < n && !is_space(line[i])) ++i;
    return line.substr(start, i - start);
  };

  skip_space();
  if (i >= n) return false;
  out.op = next_word();

  while (true) {
    skip_space();
    if (i >= n) break;
    const std::string word = next_word();
    if (word.size() < 3 || word.compare(0, 2, "--") != 0) continue;

    const std::string key = word.substr(2);
    if (key == "message") {
      if (i < n) ++i;                        // the one separating space
      std::string text = line.substr(i);
      while (!text.empty() && (text.back() == '\r' || text.back() == '\n')) text.pop_back();
      split_trailing_target(text, out.params);
      out.params[key] = text;
      break;
    }

    skip_space();
    std::string value;
    if (i < n && line.compare(i, 2, "--") != 0) value = next_word();
    out.params[key] = value;
  }
  return true;
}

bool name_to_kind(const std::string& raw_name, RequestKind& out_kind) {
  const std::string name = normalize(raw_name);

  if (name == "send_message" || name == "send")        { out_kind = RequestKind::SEND_MESSAGE;              return true; }
  if (name == "get_device_telemetry")                  { out_kind = RequestKind::GET_DEVICE_TELEMETRY;      return true; }
  if (name == "get_environment_telemetry")             { out_kind = RequestKind::GET_ENVIRONMENT_TELEMETRY; return true; }
  if (name == "get_last_messages" || name == "messages") { out_kind = RequestKind::GET_LAST_MESSAGES;       return true; }
  if (name == "delete_message" || name == "delete")    { out_kind = RequestKind::DELETE_MESSAGE;            return true; }
  if (name == "nodes")                                 { out_kind = RequestKind::NODES;                     return true; }
  if (name == "status")                                { out_kind = RequestKind::STATUS;                    return true; }
  if (name == "help" || name == "index")               { out_kind = RequestKind::HELP;                      return true; }

  return false;
}

static std::optional<std::string> param(const Request& r, const char* key) {
  auto it = r.params.find(key);
  if (it == r.params.end()) return std::nullopt;
  return it->second;
}

// First present key wins; used for aliases like --node_id / --to.
static std::optional<std::string> param(const Request& r, const char* key, const char* alias) {
  std::optional<std::string> v = param(r, key);
  return v ? v : param(r, alias);
}

static Response help() {
  parser::Document ops = parser::Document::object();
  ops["send_message"]              = "[--node_id <!hex|decimal|^all>] --message <text>";
  ops["get_device_telemetry"]      = "latest device metrics per node";
  ops["get_environment_telemetry"] = "latest environment metrics per node";
  ops["get_last_messages"]         = "cached text messages, oldest first";
  ops["delete_message"]            = "--message_id <id>";
  ops["nodes"]                     = "nodes seen since start";
  ops["status"]                    = "gateway connection status";
  ops["help"]                      = "this list";

  parser::Document body;
  body["operations"] = ops;
  return {200, body};
}

Response RequestHandler::handle(const Request& request) {
  RequestKind kind;
  if (!name_to_kind(request.op, kind)) {
    return {404, parser::error_json("Unknown request: " + request.op)};
  }

  switch (kind) {
    case RequestKind::SEND_MESSAGE:
      return send_message(request);

    case RequestKind::GET_DEVICE_TELEMETRY:
      return {200, parser::device_telemetry_json(facade_.device_telemetry())};

    case RequestKind::GET_ENVIRONMENT_TELEMETRY:
      return {200, parser::environment_telemetry_json(facade_.environment_telemetry())};

    case RequestKind::GET_LAST_MESSAGES:
      return {200, parser::messages_json(facade_.last_messages())};

    case RequestKind::DELETE_MESSAGE:
      return delete_message(request);

    case RequestKind::NODES:
      return {200, parser::nodes_json(facade_.nodes())};

    case RequestKind::STATUS:
      return {200, parser::status_json(facade_.status())};

    case RequestKind::HELP:
      return help();
  }
  return {404, parser::error_json("Unknown request: " + request.op)};
}

std::string RequestHandler::handle_line(const std::string& line) {
  Request request;
  if (!parse_request(line, request)) return std::string();
  const Response r = handle(request);
  return parser::response_line(r.code, r.body);
}

// ---------- private ----------

Response RequestHandler::send_message(const Request& request) {
  const QueryResult r = facade_.send_message(param(request, "message"),
                                             param(request, "node_id", "to"));
  switch (r.error) {
    case QueryError::None:
      return {200, parser::outcome_json(true, "Message sent successfully")};
    case QueryError::MissingParameter:
      return {404, parser::error_json("Missing parameters: " + r.detail)};
    case QueryError::InvalidNodeId:
      return {400, parser::error_json("Invalid node ID")};
    case QueryError::NotConnected:
    case QueryError::SendFailed:
    case QueryError::NotFound:
      break;
  }
  return {200, parser::outcome_json(false, r.detail)};
}

Response RequestHandler::delete_message(const Request& request) {
  const QueryResult r = facade_.delete_message(param(request, "message_id", "id"));
  switch (r.error) {
    case QueryError::None:
      return {200, parser::outcome_json(true, "Message deleted successfully")};
    case QueryError::MissingParameter:
      return {404, parser::error_json("Missing parameters: " + r.detail)};
    case QueryError::NotFound:
    case QueryError::InvalidNodeId:
    case QueryError::NotConnected:
    case QueryError::SendFailed:
      break;
  }
  return {400, parser::error_json("Invalid message ID")};
}

} // namespace meshgate
