// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include "chain/chainstate_manager.hpp"
#include "chain/notifications.hpp"
#include "network/http_server.hpp"
#include "network/network_manager.hpp"
#include "network/protocol.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relaychain {
namespace app {

// Application configuration
struct AppConfig {
  // HTTP control surface port
  uint16_t http_port = protocol::ports::DEFAULT_HTTP;

  // Network configuration (P2P listen port, inbound on/off)
  network::NetworkManager::Config network_config;

  // Peers dialed at startup ("host:port", "[ipv6]:port" or "ws://host:port")
  std::vector<std::string> initial_peers;
};

// Environment lookup (getenv-like; nullopt when unset)
using EnvLookup = std::function<std::optional<std::string>(const std::string &name)>;

// Apply HTTP_PORT, P2P_PORT and PEERS to config.
// Returns false with a message in error if a variable is set but invalid.
bool ApplyEnvironment(AppConfig &config, const EnvLookup &lookup, std::string &error);

// Same, reading the process environment
bool ApplyProcessEnvironment(AppConfig &config, std::string &error);

// Application - Main application coordinator
// Initializes components, manages lifecycle, handles signals, coordinates
// shutdown
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Component access
  network::NetworkManager &network_manager() { return *network_manager_; }
  validation::ChainstateManager &chainstate_manager() { return *chainstate_manager_; }
  http::HttpServer &http_server() { return *http_server_; }

  // Status
  bool is_running() const { return running_; }

  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  // Components (initialized in order)
  std::unique_ptr<validation::ChainstateManager> chainstate_manager_;
  std::unique_ptr<network::NetworkManager> network_manager_;
  std::unique_ptr<http::HttpServer> http_server_;

  // Notification subscriptions
  // IMPORTANT: Must be declared AFTER components so they are destroyed BEFORE
  ChainNotifications::Subscription block_sub_;
  ChainNotifications::Subscription replace_sub_;

  void connect_initial_peers();

  // Shutdown
  void shutdown();

  // Signal handling
  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace relaychain
