// -----------------------------------------------------------------------------
// meshgated: mesh radio gateway bridge daemon
//
// Wires the stores, the connection manager and the request layer together,
// then waits for SIGINT/SIGTERM (or EOF on the console) and shuts down in
// reverse order.
// -----------------------------------------------------------------------------
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include <pthread.h>
#include <unistd.h>

#include "meshgate/connection_manager.hpp"
#include "meshgate/control_server.hpp"
#include "meshgate/daemon_config.hpp"
#include "meshgate/event_dispatcher.hpp"
#include "meshgate/log.hpp"
#include "meshgate/message_store.hpp"
#include "meshgate/node_registry.hpp"
#include "meshgate/query_facade.hpp"
#include "meshgate/request_dispatch.hpp"
#include "meshgate/stream_link.hpp"
#include "meshgate/telemetry_store.hpp"

using namespace meshgate;

int main(int argc, char** argv) {
  DaemonConfig cfg;
  const int rc = parse_daemon_args(argc, argv, cfg);
  if (rc >= 0) return rc;

  log::set_verbose(cfg.verbose);

  // Every thread inherits this mask; only sigwait() below sees the signals.
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  if (pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr) != 0) {
    std::cerr << "status=error reason=sigmask_failed\n";
    return 1;
  }
  if (std::signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
    std::cerr << "status=error reason=sigpipe_ignore_failed\n";
    return 1;
  }

  TelemetryStore  telemetry;
  MessageStore    messages;
  NodeRegistry    nodes;
  EventDispatcher dispatcher(telemetry, messages, nodes);

  StreamConnector::Options link_opts;
  link_opts.connect_timeout_ms = cfg.connect_timeout_ms;
  link_opts.handshake_ms       = cfg.handshake_ms;
  StreamConnector connector(link_opts);

  ConnectionManager::Options mgr_opts;
  mgr_opts.address  = cfg.address;
  mgr_opts.retry_ms = cfg.retry_ms;
  mgr_opts.poll_ms  = cfg.poll_ms;
  ConnectionManager manager(connector, dispatcher, mgr_opts);

  QueryFacade    facade(telemetry, messages, nodes, manager);
  RequestHandler handler(facade);

  ControlServer::Options srv_opts;
  srv_opts.host    = cfg.control_host;
  srv_opts.port    = cfg.control_port;
  srv_opts.poll_ms = cfg.poll_ms;
  ControlServer server(handler, srv_opts);

  std::string error;
  if (!server.start(error)) {
    std::cerr << "status=error reason=control_start_failed detail=" << error << "\n";
    return 1;
  }

  manager.start();
  log::info("event=started address=" + cfg.address);

  std::atomic<bool> console_stop{false};
  std::thread console;
  if (cfg.console) {
    console = std::thread([&]() {
      const std::string reason = serve_lines(handler, STDIN_FILENO, STDOUT_FILENO, console_stop, cfg.poll_ms);
      if (!console_stop) {
        log::info("event=console_closed reason=" + reason);
        if (::kill(::getpid(), SIGTERM) != 0) log::error("event=console_stop_signal_failed");
      }
    });
  }

  int sig = 0;
  if (sigwait(&stop_signals, &sig) != 0) {
    log::error("event=sigwait_failed");
  }
  log::info("event=stopping signal=" + std::to_string(sig));

  server.stop();
  console_stop = true;
  if (console.joinable()) console.join();
  manager.stop();

  log::info("event=stopped");
  return 0;
}
