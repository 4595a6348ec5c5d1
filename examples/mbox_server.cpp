#include "mbox.hpp"

#include <csignal>

#include <atomic>
#include <exception>
#include <iostream>
#include <string>

namespace {

std::atomic<mbox::Server*> g_server{nullptr};

extern "C" void handle_signal(int) {
  mbox::Server* server = g_server.load();
  if (server != nullptr) {
    server->stop();
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  // Defaults, then the port file, then the command line. The first pass only
  // validates the options and finds which port file to read.
  mbox::ServerConfig first_pass;
  bool help = false;
  if (!mbox::parse_args(argc, argv, first_pass, &help).has_value()) {
    std::cerr << mbox::usage(argv[0]);
    return 1;
  }
  if (help) {
    std::cout << mbox::usage(argv[0]);
    return 0;
  }

  mbox::ServerConfig config;
  config.port_file = first_pass.port_file;
  auto port = mbox::read_port_file(config.port_file);
  if (port.has_value()) {
    config.port = port.value();
  } else {
    MBOX_LOG_WARN("Could not read port from '" + config.port_file + "', using default port " +
                  std::to_string(config.port));
  }
  if (!mbox::parse_args(argc, argv, config).has_value()) {
    return 1;
  }

  try {
    mbox::SqliteStore store(config.db_path);
    mbox::Dispatcher dispatcher(store);
    mbox::Server server(config, dispatcher);

    g_server.store(&server);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGPIPE, SIG_IGN);

    std::cout << "mbox server v" << static_cast<int>(mbox::kProtocolVersion) << " listening on port "
              << server.port() << " (enter 'q' to quit)" << std::endl;
    {
      mbox::Console console(server);
      server.run();
    }

    g_server.store(nullptr);
    const mbox::ServerStats& stats = server.stats();
    MBOX_LOG_INFO("Served " + std::to_string(stats.requests_dispatched.load()) + " request(s) over " +
                  std::to_string(stats.total_connections.load()) + " connection(s)");
  } catch (const std::exception& e) {
    g_server.store(nullptr);
    MBOX_LOG_ERROR(std::string("Fatal error: ") + e.what());
    return 1;
  }

  return 0;
}
