// -----------------------------------------------------------------------------
// daemon_config.cpp: meshgated settings
// -----------------------------------------------------------------------------
#include "meshgate/daemon_config.hpp"

#include <fstream>
#include <iostream>

#include "CLI/CLI.hpp"

using nlohmann::json;

namespace meshgate {

static bool read_int(const json& j, const char* key, long lo, long hi, int& out, std::string& error) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_number_integer() || it->get<long>() < lo || it->get<long>() > hi) {
    error = std::string("bad_config_value: ") + key;
    return false;
  }
  out = static_cast<int>(it->get<long>());
  return true;
}

static bool read_string(const json& j, const char* key, std::string& out, std::string& error) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_string()) { error = std::string("bad_config_value: ") + key; return false; }
  out = it->get<std::string>();
  return true;
}

static bool read_bool(const json& j, const char* key, bool& out, std::string& error) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_boolean()) { error = std::string("bad_config_value: ") + key; return false; }
  out = it->get<bool>();
  return true;
}

bool apply_config_json(const json& j, DaemonConfig& cfg, std::string& error) {
  if (!j.is_object()) { error = "bad_config: not an object"; return false; }

  int port = cfg.control_port;
  const bool ok =
      read_string(j, "address", cfg.address, error) &&
      read_int(j, "retry_ms", 1, 3600000, cfg.retry_ms, error) &&
      read_int(j, "poll_ms", 1, 60000, cfg.poll_ms, error) &&
      read_int(j, "handshake_ms", 1, 600000, cfg.handshake_ms, error) &&
      read_int(j, "connect_timeout_ms", 1, 600000, cfg.connect_timeout_ms, error) &&
      read_string(j, "control_host", cfg.control_host, error) &&
      read_int(j, "control_port", 0, 65535, port, error) &&
      read_bool(j, "console", cfg.console, error) &&
      read_bool(j, "verbose", cfg.verbose, error);
  if (!ok) return false;
  cfg.control_port = static_cast<uint16_t>(port);
  return true;
}

bool load_config_file(const std::string& path, DaemonConfig& cfg, std::string& error) {
  std::ifstream in(path);
  if (!in) { error = "config_open_failed: " + path; return false; }
  const json j = json::parse(in, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) { error = "config_parse_failed: " + path; return false; }
  return apply_config_json(j, cfg, error);
}

bool validate_config(const DaemonConfig& cfg, std::string& error) {
  if (cfg.address.empty())      { error = "empty_address"; return false; }
  if (cfg.retry_ms <= 0)        { error = "bad_retry_ms"; return false; }
  if (cfg.poll_ms <= 0)         { error = "bad_poll_ms"; return false; }
  if (cfg.handshake_ms <= 0)    { error = "bad_handshake_ms"; return false; }
  if (cfg.connect_timeout_ms <= 0) { error = "bad_connect_timeout_ms"; return false; }
  return true;
}

// ---------------------------------------------------------------------------
// parse_daemon_args()
// -------------------
// CLI11 fills shadow variables; only options that were actually given are
// copied over the file/default values afterwards.
// ---------------------------------------------------------------------------
int parse_daemon_args(int argc, char** argv, DaemonConfig& cfg) {
  CLI::App app{"meshgated - mesh radio gateway bridge"};

  DaemonConfig cli;            // shadow values
  std::string config_path;

  CLI::Option* opt_address = app.add_option("--address,-a", cli.address,
      "Gateway: host[:port], tcp://host[:port], serial:/dev/ttyX[@baud] or /dev/...");
  CLI::Option* opt_retry = app.add_option("--retry-ms", cli.retry_ms, "Wait after a failed connect (ms)")
      ->check(CLI::Range(1, 3600000));
  CLI::Option* opt_poll = app.add_option("--poll-ms", cli.poll_ms, "Max wait per event poll (ms)")
      ->check(CLI::Range(1, 60000));
  CLI::Option* opt_handshake = app.add_option("--handshake-ms", cli.handshake_ms, "Wait for the gateway's myInfo (ms)")
      ->check(CLI::Range(1, 600000));
  CLI::Option* opt_connect = app.add_option("--connect-timeout-ms", cli.connect_timeout_ms, "TCP connect timeout (ms)")
      ->check(CLI::Range(1, 600000));
  CLI::Option* opt_host = app.add_option("--control-host", cli.control_host, "Control port bind address");
  CLI::Option* opt_port = app.add_option("--control-port", cli.control_port, "Control port (0 = any free port)");
  CLI::Option* opt_console = app.add_flag("--console", cli.console, "Also answer requests on stdin; EOF stops the daemon");
  CLI::Option* opt_verbose = app.add_flag("--verbose,-v", cli.verbose, "Debug logging, including per-packet trace");
  app.add_option("--config,-c", config_path, "JSON config file")->check(CLI::ExistingFile);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  std::string error;
  if (!config_path.empty() && !load_config_file(config_path, cfg, error)) {
    std::cerr << "status=error reason=" << error << "\n";
    return 2;
  }

  if (opt_address->count())   cfg.address            = cli.address;
  if (opt_retry->count())     cfg.retry_ms           = cli.retry_ms;
  if (opt_poll->count())      cfg.poll_ms            = cli.poll_ms;
  if (opt_handshake->count()) cfg.handshake_ms       = cli.handshake_ms;
  if (opt_connect->count())   cfg.connect_timeout_ms = cli.connect_timeout_ms;
  if (opt_host->count())      cfg.control_host       = cli.control_host;
  if (opt_port->count())      cfg.control_port       = cli.control_port;
  if (opt_console->count())   cfg.console            = cli.console;
  if (opt_verbose->count())   cfg.verbose            = cli.verbose;

  if (!validate_config(cfg, error)) {
    std::cerr << "status=error reason=" << error << "\n";
    return 2;
  }
  return -1;
}

} // namespace meshgate
