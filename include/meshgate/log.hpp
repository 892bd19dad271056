/**
 * @file log.hpp
 * @brief Line logger for meshgate: one `key=value` line per event on stderr.
 *
 * @details
 * The daemon writes the same shape of line the command-line tools print on
 * failure (`status=error reason=...`), prefixed with a UTC timestamp and a
 * level tag so a journal or a `grep` can follow a reconnect storm:
 *
 * @code
 *   2026-10-19T18:46:02Z level=error event=connect_failed address=tcp://meshtastic.local:4403 reason=timeout
 * @endcode
 *
 * Writers from different threads never interleave inside a line. Debug
 * lines (per-packet tracing) are dropped unless verbose mode is on.
 */
#ifndef MESHGATE_LOG_HPP
#define MESHGATE_LOG_HPP

#include <string>

namespace meshgate {
namespace log {

enum class Level { Debug, Info, Error };

/// Enable or disable debug lines (process-wide).
void set_verbose(bool on);
bool verbose();

/// Emit one line. `line` is the body without timestamp/level.
void write(Level level, const std::string& line);

inline void debug(const std::string& line) { if (verbose()) write(Level::Debug, line); }
inline void info(const std::string& line)  { write(Level::Info, line); }
inline void error(const std::string& line) { write(Level::Error, line); }

} // namespace log
} // namespace meshgate

#endif // MESHGATE_LOG_HPP
