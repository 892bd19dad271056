// -----------------------------------------------------------------------------
// log.cpp: stderr line logger (see include/meshgate/log.hpp)
// -----------------------------------------------------------------------------
#include "meshgate/log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>

namespace meshgate {
namespace log {

static std::atomic<bool> g_verbose{false};
static std::mutex        g_write_mutex;   // one line at a time on stderr

void set_verbose(bool on) { g_verbose = on; }

bool verbose() { return g_verbose.load(); }

static const char* level_name(Level level) {
  switch (level) {
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Error: return "error";
  }
  return "info";
}

void write(Level level, const std::string& line) {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm utc{};
  gmtime_r(&now, &utc);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &utc);

  std::lock_guard<std::mutex> lock(g_write_mutex);
  std::cerr << stamp << " level=" << level_name(level) << " " << line << "\n";
}

} // namespace log
} // namespace meshgate
