/**
 * @file main.cpp
 * @brief meshgate-cli: one-shot client for the meshgated control port.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); everything after the options is the request
 *    line, joined with single spaces (e.g. `send_message --message hi there`).
 *  - Connect to the control port, send the line, read exactly one reply line.
 *  - Print it: `pretty` (indented, colored on a TTY), `json` (body only,
 *    indented) or `raw` (the reply line as received).
 *
 * Exit codes:
 *  0 success, 1 connect failure, 2 usage error, 3 I/O error or timeout,
 *  4 the daemon answered with an error (code != 200 or "status":"error").
 */

#include <cstdio>
#include <cstdint>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include "meshgate/stream_io.hpp"

using json = nlohmann::ordered_json;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim  (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red  (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  std::string green(const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
};

static std::string scalar_text(const json& v) {
  if (v.is_string()) return v.get<std::string>();
  return v.dump();
}

// Objects become indented "key: value" rows; null shows dimmed.
static void print_pretty(const json& v, const Ansi& ansi, int depth) {
  const std::string pad(static_cast<size_t>(depth) * 2, ' ');
  if (!v.is_object() && !v.is_array()) {
    std::cout << pad << (v.is_null() ? ansi.dim("(none)") : scalar_text(v)) << "\n";
    return;
  }
  if (v.empty()) { std::cout << pad << ansi.dim("(empty)") << "\n"; return; }

  for (auto it = v.begin(); it != v.end(); ++it) {
    const std::string key = v.is_object() ? it.key() : std::string("-");
    const json& val = it.value();
    if (val.is_object() || val.is_array()) {
      std::cout << pad << ansi.bold(key) << "\n";
      print_pretty(val, ansi, depth + 1);
    } else {
      std::cout << pad << ansi.bold(key) << ": "
                << (val.is_null() ? ansi.dim("(none)") : scalar_text(val)) << "\n";
    }
  }
}

// Read until the first '\n' or the deadline.
static bool read_reply(int fd, int timeout_ms, std::string& line, std::string& error) {
  using namespace std::chrono;
  const auto deadline = steady_clock::now() + milliseconds(timeout_ms);
  uint8_t buf[4096];
  while (true) {
    const auto left = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
    if (left <= 0) { error = "timeout"; return false; }

    size_t got = 0;
    switch (meshgate::read_some(fd, buf, sizeof(buf), static_cast<int>(left), got, error)) {
      case meshgate::ReadResult::Timeout:
        continue;
      case meshgate::ReadResult::Closed:
        if (line.empty()) { error = "closed_without_reply"; return false; }
        return true;
      case meshgate::ReadResult::Error:
        return false;
      case meshgate::ReadResult::Data:
        break;
    }
    line.append(reinterpret_cast<const char*>(buf), got);
    const size_t nl = line.find('\n');
    if (nl != std::string::npos) { line.resize(nl); return true; }
  }
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_host = "127.0.0.1";
  uint16_t    opt_port = 8080;
  std::string opt_format = "pretty"; // pretty|json|raw
  bool        opt_no_color = false;
  int         opt_timeout_ms = 5000;
  std::vector<std::string> words;

  CLI::App app{"meshgate-cli - query a running meshgated"};
  app.add_option("--host", opt_host, "Control host")->capture_default_str();
  app.add_option("--port", opt_port, "Control port")->capture_default_str();
  app.add_option("--format", opt_format, "Output format: pretty|json|raw")->check(CLI::IsMember({"pretty","json","raw"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_option("--timeout", opt_timeout_ms, "Reply timeout (ms)")->check(CLI::Range(1, 600000));
  app.footer("Request: <operation> [--key value]...   (try: meshgate-cli help)");
  app.prefix_command();    // the first request word and everything after it belong to the request

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }
  words = app.remaining();
  if (words.empty()) {
    std::cerr << "status=error reason=missing_request\n";
    return 2;
  }

  std::string request;
  for (const std::string& w : words) {
    if (!request.empty()) request += ' ';
    request += w;
  }
  if (request.find('\n') != std::string::npos) {
    std::cerr << "status=error reason=newline_in_request\n";
    return 2;
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && (opt_format=="pretty");

  std::string error;
  const int fd = meshgate::open_tcp(opt_host, opt_port, opt_timeout_ms, error);
  if (fd < 0) {
    std::cerr << "status=error reason=connect_failed host=" << opt_host << " port=" << opt_port
              << " detail=" << error << "\n";
    return 1;
  }

  const std::string out = request + "\n";
  if (!meshgate::write_all(fd, reinterpret_cast<const uint8_t*>(out.data()), out.size(), opt_timeout_ms, error)) {
    meshgate::close_fd(fd);
    std::cerr << "status=error reason=write_failed detail=" << error << "\n";
    return 3;
  }

  std::string line;
  const bool got = read_reply(fd, opt_timeout_ms, line, error);
  meshgate::close_fd(fd);
  if (!got) {
    std::cerr << "status=error reason=" << error << "\n";
    return 3;
  }

  const json reply = json::parse(line, nullptr, /*allow_exceptions=*/false);
  if (reply.is_discarded() || !reply.is_object() || !reply.contains("code")) {
    std::cerr << "status=error reason=bad_reply\n";
    if (opt_format == "raw") std::cout << line << "\n";
    return 3;
  }

  const int code = reply["code"].is_number_integer() ? reply["code"].get<int>() : 0;
  const json body = reply.contains("body") ? reply["body"] : json(nullptr);
  const bool failed = code != 200 ||
                      (body.is_object() && body.contains("status") && body["status"] == "error");

  if (opt_format == "raw") {
    std::cout << line << "\n";
  } else if (opt_format == "json") {
    std::cout << body.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
  } else {
    const std::string code_text = std::to_string(code);
    std::cout << ansi.bold("code") << ": " << (failed ? ansi.red(code_text) : ansi.green(code_text)) << "\n";
    print_pretty(body, ansi, 0);
  }

  return failed ? 4 : 0;
}
