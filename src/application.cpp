// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#include "application.hpp"
#include "chain/block.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace relaychain {
namespace app {

bool ApplyEnvironment(AppConfig &config, const EnvLookup &lookup, std::string &error) {
  if (auto value = lookup("HTTP_PORT")) {
    auto port = util::SafeParsePort(*value);
    if (!port) {
      error = "Invalid HTTP_PORT: " + *value;
      return false;
    }
    config.http_port = *port;
  }

  if (auto value = lookup("P2P_PORT")) {
    auto port = util::SafeParsePort(*value);
    if (!port) {
      error = "Invalid P2P_PORT: " + *value;
      return false;
    }
    config.network_config.listen_port = *port;
  }

  if (auto value = lookup("PEERS")) {
    std::vector<std::string> peers = util::SplitList(*value);
    for (const auto &peer : peers) {
      if (!util::ParsePeerAddress(peer)) {
        error = "Invalid peer address in PEERS: " + peer;
        return false;
      }
    }
    config.initial_peers = std::move(peers);
  }

  return true;
}

bool ApplyProcessEnvironment(AppConfig &config, std::string &error) {
  return ApplyEnvironment(
      config,
      [](const std::string &name) -> std::optional<std::string> {
        const char *value = std::getenv(name.c_str());
        if (!value) {
          return std::nullopt;
        }
        return std::string(value);
      },
      error);
}

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

bool Application::initialize() {
  // Print startup banner (use std::cout for immediate visibility before logger
  // fully initialized)
  std::cout << GetStartupBanner() << std::flush;

  LOG_APP_INFO("Initializing relaychain...");

  chainstate_manager_ = std::make_unique<validation::ChainstateManager>();
  LOG_APP_INFO("Chain initialized with genesis block {}",
           chainstate_manager_->GetLatestBlock().hash);

  LOG_APP_INFO("Initializing network manager...");
  network_manager_ = std::make_unique<network::NetworkManager>(
      *chainstate_manager_, config_.network_config);

  LOG_APP_INFO("Initializing HTTP server...");
  http_server_ = std::make_unique<http::HttpServer>(
      config_.http_port, *chainstate_manager_, *network_manager_);

  // Peer relay is driven by the synchronizer's own ChainTip subscription;
  // these only report chain activity
  block_sub_ = chainstate_manager_->Notifications().SubscribeBlockConnected(
      [](const chain::Block &block) {
        LOG_APP_INFO("Block connected: {}", block.ToString());
      });

  replace_sub_ = chainstate_manager_->Notifications().SubscribeChainReplaced(
      [](size_t old_length, size_t new_length) {
        LOG_APP_INFO("Chain replaced: length {} -> {}", old_length, new_length);
      });

  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }
  if (!network_manager_ || !http_server_) {
    LOG_APP_ERROR("Application not initialized");
    return false;
  }

  LOG_APP_INFO("Starting relaychain...");

  // Setup signal handlers
  setup_signal_handlers();

  // Start network manager
  if (!network_manager_->start()) {
    LOG_APP_ERROR("Failed to start network manager");
    return false;
  }

  // Start HTTP server
  if (!http_server_->Start()) {
    LOG_APP_ERROR("Failed to start HTTP server");
    network_manager_->stop();
    return false;
  }

  running_ = true;

  LOG_APP_INFO("relaychain started successfully");
  LOG_APP_INFO("HTTP control surface on port: {}", http_server_->port());

  if (config_.network_config.listen_enabled) {
    LOG_APP_INFO("Listening for peers on port: {}", config_.network_config.listen_port);
  } else {
    LOG_APP_INFO("Inbound connections disabled");
  }

  connect_initial_peers();

  LOG_APP_INFO("Press Ctrl+C to stop");

  return true;
}

void Application::connect_initial_peers() {
  for (const auto &peer : config_.initial_peers) {
    auto address = util::ParsePeerAddress(peer);
    if (!address) {
      LOG_APP_WARN("Skipping invalid peer address: {}", peer);
      continue;
    }

    auto result = network_manager_->connect_to(address->host, address->port);
    if (result != network::ConnectionResult::Success) {
      LOG_APP_WARN("Failed to connect to initial peer {}: {}", address->ToString(),
               network::ConnectionResultName(result));
    } else {
      LOG_APP_INFO("Connecting to initial peer {}", address->ToString());
    }
  }
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  // Wait for shutdown signal
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_APP_INFO("Shutting down relaychain...");

  running_ = false;

  // Unsubscribe from notifications BEFORE stopping components
  block_sub_.Unsubscribe();
  replace_sub_.Unsubscribe();

  // Stop HTTP server first (stop accepting new requests)
  if (http_server_) {
    LOG_APP_INFO("Stopping HTTP server...");
    http_server_->Stop();
  }

  // Stop network manager
  if (network_manager_) {
    LOG_APP_INFO("Stopping network manager...");
    network_manager_->stop();
  }

  LOG_APP_INFO("Shutdown complete");
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t written = write(STDOUT_FILENO, msg, 17);
    (void)written;

    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace relaychain
