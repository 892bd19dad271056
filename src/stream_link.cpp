// -----------------------------------------------------------------------------
// stream_link.cpp: StreamRadioLink / StreamConnector
//
// Session and address rules: include/meshgate/stream_link.hpp
// -----------------------------------------------------------------------------
#include "meshgate/stream_link.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>

#include "meshgate/log.hpp"
#include "meshgate/parser.hpp"
#include "meshgate/stream_io.hpp"

namespace meshgate {

// ---------- local parsing helpers (no exceptions) ----------

static bool parse_decimal(const std::string& s, uint64_t max, uint64_t& out) {
  if (s.empty() || s.size() > 20) return false;
  for (char c : s) if (!std::isdigit((unsigned char)c)) return false;
  char* e = nullptr;
  const unsigned long long v = std::strtoull(s.c_str(), &e, 10);
  if (!e || *e || v > max) return false;
  out = v;
  return true;
}

static bool starts_with(const std::string& s, const char* prefix) {
  return s.rfind(prefix, 0) == 0;
}

bool parse_destination(const std::string& target, NodeNum& out) {
  if (target.empty() || target == "^all") { out = BROADCAST_NODE; return true; }

  if (target[0] == '!') {
    const std::string hex = target.substr(1);
    if (hex.empty() || hex.size() > 8) return false;
    for (char c : hex) if (!std::isxdigit((unsigned char)c)) return false;
    out = static_cast<NodeNum>(std::strtoul(hex.c_str(), nullptr, 16));
    return true;
  }

  uint64_t v = 0;
  if (!parse_decimal(target, 0xFFFFFFFFull, v)) return false;
  out = static_cast<NodeNum>(v);
  return true;
}

// ---------------------------------------------------------------------------
// parse_gateway_address()
// -----------------------
// Serial when the address says so ("serial:" or a /dev path); TCP otherwise.
// "host:port" splits on the last ':' unless the host is a bracketed IPv6
// literal ("[fe80::1]:4403").
// ---------------------------------------------------------------------------
bool parse_gateway_address(const std::string& address, GatewayAddress& out, std::string& error) {
  out = GatewayAddress{};

  std::string rest = address;
  bool serial = false;
  if (starts_with(rest, "serial:")) { rest = rest.substr(7); serial = true; }
  else if (starts_with(rest, "/dev/")) { serial = true; }
  else if (starts_with(rest, "tcp://")) { rest = rest.substr(6); }

  if (serial) {
    out.kind = GatewayAddress::Kind::Serial;
    const size_t at = rest.rfind('@');
    if (at != std::string::npos) {
      uint64_t baud = 0;
      if (!parse_decimal(rest.substr(at + 1), 4000000, baud) || baud == 0) {
        error = "bad_baud: " + rest.substr(at + 1);
        return false;
      }
      out.baud = static_cast<int>(baud);
      rest = rest.substr(0, at);
    }
    if (rest.empty()) { error = "empty_device"; return false; }
    out.device = rest;
    return true;
  }

  out.kind = GatewayAddress::Kind::Tcp;
  std::string port_str;
  if (!rest.empty() && rest[0] == '[') {
    const size_t close = rest.find(']');
    if (close == std::string::npos) { error = "bad_host: " + rest; return false; }
    out.host = rest.substr(1, close - 1);
    const std::string tail = rest.substr(close + 1);
    if (!tail.empty()) {
      if (tail[0] != ':') { error = "bad_host: " + rest; return false; }
      port_str = tail.substr(1);
    }
  } else {
    const size_t colon = rest.rfind(':');
    if (colon != std::string::npos && rest.find(':') == colon) {
      out.host = rest.substr(0, colon);
      port_str = rest.substr(colon + 1);
    } else {
      out.host = rest;      // bare IPv6 literals have several ':' and no port
    }
  }

  if (out.host.empty()) { error = "empty_host"; return false; }
  if (!port_str.empty()) {
    uint64_t port = 0;
    if (!parse_decimal(port_str, 65535, port) || port == 0) {
      error = "bad_port: " + port_str;
      return false;
    }
    out.port = static_cast<uint16_t>(port);
  }
  return true;
}

// ---------- StreamRadioLink ----------

StreamRadioLink::StreamRadioLink(int fd, std::string label, int write_timeout_ms)
: fd_(fd), label_(std::move(label)), write_timeout_ms_(write_timeout_ms) {
}

StreamRadioLink::~StreamRadioLink() {
  close();
}

// handshake(): packets that beat myInfo are queued, not dropped.
bool StreamRadioLink::handshake(int timeout_ms, std::string& error) {
  if (!write_frame(parser::want_config_json(), error)) return false;

  using namespace std::chrono;
  const auto deadline = steady_clock::now() + milliseconds(timeout_ms);
  while (!have_my_info_) {
    const auto left = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
    if (left <= 0) {
      error = "handshake_timeout: no myInfo";
      return false;
    }
    if (pump_bytes(static_cast<int>(left), error) == RxResult::Error) {
      error = "handshake_failed: " + error;
      return false;
    }
  }
  return true;
}

RxResult StreamRadioLink::poll_event(PacketEvent& out, int timeout_ms, std::string& detail) {
  if (pending_.empty()) {
    if (pump_bytes(timeout_ms, detail) == RxResult::Error) return RxResult::Error;
  }
  if (pending_.empty()) return RxResult::None;
  out = std::move(pending_.front());
  pending_.pop_front();
  return RxResult::Ok;
}

TxResult StreamRadioLink::send_text(const std::string& text, const std::string& target, std::string& detail) {
  NodeNum dest = BROADCAST_NODE;
  if (!parse_destination(target, dest)) {
    detail = "invalid destination: " + target;
    return TxResult::InvalidNode;
  }
  if (!write_frame(parser::send_text_json(text, dest), detail)) return TxResult::Error;
  return TxResult::Ok;
}

void StreamRadioLink::close() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  close_fd(fd_);
  fd_ = -1;
}

// ---------- private ----------

RxResult StreamRadioLink::pump_bytes(int timeout_ms, std::string& detail) {
  if (fd_ < 0) { detail = "closed"; return RxResult::Error; }

  uint8_t buf[1024];
  size_t got = 0;
  switch (read_some(fd_, buf, sizeof(buf), timeout_ms, got, detail)) {
    case ReadResult::Timeout:
      return RxResult::None;
    case ReadResult::Closed:
    case ReadResult::Error:
      return RxResult::Error;
    case ReadResult::Data:
      break;
  }

  std::vector<uint8_t> frame;
  for (size_t i = 0; i < got; ++i) {
    if (decoder_.feed(buf[i], frame)) on_frame(frame);
  }
  return RxResult::Ok;
}

void StreamRadioLink::on_frame(const std::vector<uint8_t>& frame) {
  parser::GatewayFrame decoded;
  if (!parser::decode_frame(std::string(frame.begin(), frame.end()), decoded)) {
    log::debug("event=frame_dropped link=" + label_ + " reason=not_json bytes=" +
               std::to_string(frame.size()));
    return;
  }
  switch (decoded.kind) {
    case parser::FrameKind::MyInfo:
      if (!have_my_info_) {
        local_node_   = decoded.my_node_num;
        have_my_info_ = true;
      }
      break;
    case parser::FrameKind::Packet:
      pending_.push_back(std::move(decoded.packet));
      break;
    case parser::FrameKind::Unknown:
      break;
  }
}

bool StreamRadioLink::write_frame(const std::string& payload, std::string& detail) {
  std::vector<uint8_t> wire;
  slip::encode(reinterpret_cast<const uint8_t*>(payload.data()), payload.size(), wire);

  std::lock_guard<std::mutex> lock(write_mutex_);
  if (fd_ < 0) { detail = "closed"; return false; }
  return write_all(fd_, wire.data(), wire.size(), write_timeout_ms_, detail);
}

// ---------- StreamConnector ----------

std::unique_ptr<RadioLink> StreamConnector::connect(const std::string& address, std::string& error) {
  GatewayAddress addr;
  if (!parse_gateway_address(address, addr, error)) return nullptr;

  int fd = -1;
  std::string label;
  if (addr.kind == GatewayAddress::Kind::Serial) {
    fd = open_serial(addr.device, addr.baud, options_.serial_boot_delay_ms, error);
    label = "serial:" + addr.device;
  } else {
    fd = open_tcp(addr.host, addr.port, options_.connect_timeout_ms, error);
    label = "tcp:" + addr.host + ":" + std::to_string(addr.port);
  }
  if (fd < 0) return nullptr;

  auto link = std::make_unique<StreamRadioLink>(fd, label, options_.write_timeout_ms);
  if (!link->handshake(options_.handshake_ms, error)) return nullptr;
  return link;
}

} // namespace meshgate
