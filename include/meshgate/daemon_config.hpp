#pragma once
/**
 * @file daemon_config.hpp
 * @brief meshgated settings: defaults, optional JSON file, command line.
 *
 * Precedence, lowest first: built-in defaults, `--config <file>`, explicit
 * command-line options. JSON keys are the long option names with '_' for '-'
 * (`retry_ms`, `control_port`, ...).
 */

#include <cstdint>
#include <string>

#include "nlohmann/json.hpp"

namespace meshgate {

struct DaemonConfig {
  std::string address{"meshtastic.local"};
  int         retry_ms{1000};
  int         poll_ms{200};
  int         handshake_ms{5000};
  int         connect_timeout_ms{5000};
  std::string control_host{"127.0.0.1"};
  uint16_t    control_port{8080};
  bool        console{false};
  bool        verbose{false};
};

/**
 * @brief Overlay the keys present in @p j onto @p cfg.
 * @return false with @p error naming the first key of the wrong type or range.
 *         Unknown keys are ignored.
 */
bool apply_config_json(const nlohmann::json& j, DaemonConfig& cfg, std::string& error);

/// Read and apply a JSON config file.
bool load_config_file(const std::string& path, DaemonConfig& cfg, std::string& error);

/// Range checks that hold no matter where the values came from.
bool validate_config(const DaemonConfig& cfg, std::string& error);

/**
 * @brief Parse argv into @p cfg.
 *
 * @return -1 to continue, otherwise the process exit code (0 after --help,
 *         non-zero after a parse or config error, already reported on stderr).
 */
int parse_daemon_args(int argc, char** argv, DaemonConfig& cfg);

} // namespace meshgate
