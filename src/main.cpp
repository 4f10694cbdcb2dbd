// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --httpport=<port>    HTTP control port (default: 3001, env HTTP_PORT)\n"
      << "  --p2pport=<port>     Peer listen port (default: 6001, env P2P_PORT)\n"
      << "  --peers=<a,b,...>    Peers to connect to at startup (env PEERS)\n"
      << "                       Forms: host:port, [ipv6]:port, ws://host:port\n"
      << "  --nolisten           Disable inbound peer connections\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, sync, chain, http, app, all\n"
      << "                       Can be comma-separated: --debug=network,sync\n"
      << "  --logfile=<path>     Write logs to a rotating file instead of the console\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    relaychain::app::AppConfig config;
    std::string log_level = "info";
    std::string log_file;
    std::vector<std::string> debug_components;

    // Environment first; command line overrides it
    std::string env_error;
    if (!relaychain::app::ApplyProcessEnvironment(config, env_error)) {
      std::cerr << "Error: " << env_error << std::endl;
      return 1;
    }

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << relaychain::GetFullVersionString() << std::endl;
        std::cout << relaychain::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--httpport=") == 0) {
        auto port_opt = relaychain::util::SafeParsePort(arg.substr(11));
        if (!port_opt) {
          std::cerr << "Error: Invalid port number: " << arg.substr(11) << std::endl;
          std::cerr << "Port must be a number between 1 and 65535" << std::endl;
          return 1;
        }
        config.http_port = *port_opt;
      } else if (arg.find("--p2pport=") == 0) {
        auto port_opt = relaychain::util::SafeParsePort(arg.substr(10));
        if (!port_opt) {
          std::cerr << "Error: Invalid port number: " << arg.substr(10) << std::endl;
          std::cerr << "Port must be a number between 1 and 65535" << std::endl;
          return 1;
        }
        config.network_config.listen_port = *port_opt;
      } else if (arg.find("--peers=") == 0) {
        std::vector<std::string> peers = relaychain::util::SplitList(arg.substr(8));
        for (const auto &peer : peers) {
          if (!relaychain::util::ParsePeerAddress(peer)) {
            std::cerr << "Error: Invalid peer address: " << peer << std::endl;
            return 1;
          }
        }
        config.initial_peers = std::move(peers);
      } else if (arg == "--nolisten") {
        config.network_config.listen_enabled = false;
      } else if (arg == "--verbose") {
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        log_file = arg.substr(10);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=network,sync
        for (const auto &component : relaychain::util::SplitList(arg.substr(8))) {
          debug_components.push_back(component);
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (log_file.empty()) {
      relaychain::util::LogManager::Initialize(log_level);
    } else {
      relaychain::util::LogManager::Initialize(log_level, true, log_file);
    }

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        relaychain::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        relaychain::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        relaychain::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    {
      relaychain::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      // Run until shutdown requested
      app.wait_for_shutdown();
    }

    // Shutdown logging AFTER app is fully destroyed
    relaychain::util::LogManager::Shutdown();

    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    relaychain::util::LogManager::Shutdown();
    return 1;
  }
}
