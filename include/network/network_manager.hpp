// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include "network/chain_sync_manager.hpp"
#include "network/peer.hpp"
#include "network/peer_manager.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace relaychain {

namespace validation {
class ChainstateManager;
}

namespace network {

// Connection result codes for better error reporting
enum class ConnectionResult {
  Success,        // Connect attempt initiated
  NotRunning,     // NetworkManager not started
  TransportFailed // Transport refused to create the connection
};

const char *ConnectionResultName(ConnectionResult result);

// NetworkManager - top-level coordinator for peer networking
// Owns the networking io_context (the reactor), the transport, the peer
// registry and the ChainSyncManager. Every peer event and protocol handler runs
// on the reactor thread, which gives the ledger protocol its single flow.
//
// Config::io_threads MUST be 1 in production (0 = external io_context driven
// by the caller, for tests).
class NetworkManager {
public:
  struct Config {
    uint16_t listen_port;  // Port to listen on for peers
    bool listen_enabled;   // Accept inbound connections
    size_t io_threads;     // Reactor threads (1; 0 = caller drives io_context)

    Config()
        : listen_port(protocol::ports::DEFAULT_P2P), listen_enabled(true),
          io_threads(1) {}
  };

  /**
   * @param chainstate          Node's chainstate (must outlive this object)
   * @param config              Network configuration
   * @param transport           Optional transport (nullptr = TCP RealTransport)
   * @param external_io_context Optional io_context (nullptr = owned; when
   *                            given, no reactor thread is started and the
   *                            caller runs/polls it)
   */
  explicit NetworkManager(
      validation::ChainstateManager &chainstate, const Config &config = Config{},
      std::shared_ptr<Transport> transport = nullptr,
      std::shared_ptr<boost::asio::io_context> external_io_context = nullptr);
  ~NetworkManager();

  NetworkManager(const NetworkManager &) = delete;
  NetworkManager &operator=(const NetworkManager &) = delete;

  // Start transport, reactor and listener. Returns false if already running
  // or the listen port cannot be bound.
  bool start();

  // Disconnect all peers and stop. Idempotent; may block while threads join.
  void stop();

  bool is_running() const { return running_; }

  // Initiate an outbound connection. On success the peer is registered and
  // sent QUERY_LATEST on the reactor; on failure nothing is registered and no
  // retry is made.
  ConnectionResult connect_to(const std::string &address, uint16_t port);

  // Returns true if peer existed and was disconnected
  bool disconnect_from(int peer_id);

  size_t active_peer_count() const;
  std::vector<std::string> peer_addresses() const;

  PeerManager &peer_manager() { return *peer_manager_; }
  ChainSyncManager &sync_manager() { return *sync_manager_; }
  boost::asio::io_context &io_context() { return *io_context_; }
  const Config &config() const { return config_; }

private:
  void handle_inbound_connection(TransportConnectionPtr connection);

  // Wire handlers, register, start and greet a freshly created peer
  void register_peer(const PeerPtr &peer);

  Config config_;
  std::shared_ptr<Transport> transport_;
  std::shared_ptr<boost::asio::io_context> io_context_;
  bool external_io_context_;

  validation::ChainstateManager &chainstate_;

  std::unique_ptr<PeerManager> peer_manager_;
  std::unique_ptr<ChainSyncManager> sync_manager_;

  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;

  std::atomic<bool> running_{false};
  std::mutex start_stop_mutex_;
  std::condition_variable stop_cv_;
  bool fully_stopped_{true};
};

} // namespace network
} // namespace relaychain
