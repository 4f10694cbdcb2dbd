// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#include "network/network_manager.hpp"
#include "chain/chainstate_manager.hpp"
#include "network/real_transport.hpp"
#include "util/logging.hpp"
#include <boost/asio/post.hpp>

namespace relaychain {
namespace network {

const char *ConnectionResultName(ConnectionResult result) {
  switch (result) {
  case ConnectionResult::Success:
    return "success";
  case ConnectionResult::NotRunning:
    return "network not running";
  case ConnectionResult::TransportFailed:
    return "transport failed";
  }
  return "unknown";
}

NetworkManager::NetworkManager(
    validation::ChainstateManager &chainstate, const Config &config,
    std::shared_ptr<Transport> transport,
    std::shared_ptr<boost::asio::io_context> external_io_context)
    : config_(config),
      transport_(transport ? transport
                           : std::make_shared<RealTransport>(
                                 config.io_threads > 0 ? config.io_threads : 1)),
      io_context_(external_io_context
                      ? external_io_context
                      : std::make_shared<boost::asio::io_context>()),
      external_io_context_(external_io_context != nullptr),
      chainstate_(chainstate) {
  peer_manager_ = std::make_unique<PeerManager>();
  sync_manager_ =
      std::make_unique<ChainSyncManager>(*io_context_, chainstate_, *peer_manager_);

  LOG_NET_TRACE("NetworkManager initialized (external_io_context: {})",
                external_io_context_ ? "yes" : "no");
}

NetworkManager::~NetworkManager() { stop(); }

bool NetworkManager::start() {
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  std::unique_lock<std::mutex> lock(start_stop_mutex_);

  // Wait for a pending stop() to finish joining threads
  stop_cv_.wait(lock, [this]() { return fully_stopped_; });

  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  running_.store(true, std::memory_order_release);
  fully_stopped_ = false;

  transport_->run();

  if (config_.io_threads > 0 && !external_io_context_) {
    io_context_->restart();
    work_guard_ = std::make_unique<
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
        boost::asio::make_work_guard(*io_context_));
    for (size_t i = 0; i < config_.io_threads; ++i) {
      io_threads_.emplace_back([this]() { io_context_->run(); });
    }
  }

  if (config_.listen_enabled && config_.listen_port > 0) {
    bool success = transport_->listen(
        config_.listen_port, [this](TransportConnectionPtr connection) {
          handle_inbound_connection(std::move(connection));
        });

    if (!success) {
      LOG_NET_ERROR("Failed to start listener on port {}", config_.listen_port);
      running_.store(false, std::memory_order_release);

      transport_->stop();
      work_guard_.reset();
      io_context_->stop();
      for (auto &thread : io_threads_) {
        if (thread.joinable()) {
          thread.join();
        }
      }
      io_threads_.clear();
      fully_stopped_ = true;
      return false;
    }
    LOG_NET_INFO("P2P listening on port {}", config_.listen_port);
  }

  return true;
}

void NetworkManager::stop() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  std::unique_lock<std::mutex> lock(start_stop_mutex_);
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  // running_ first: handlers check it and stop processing new messages
  running_.store(false, std::memory_order_release);

  // 1. Disconnect peers (posted onto the reactor)
  peer_manager_->disconnect_all();

  // 2. Let the reactor drain the posted disconnects, then join it
  work_guard_.reset();
  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  // 3. Stop accepting and close the transport's event loop
  transport_->stop();

  // 4. Stop the reactor (only if we own it)
  if (!external_io_context_) {
    io_context_->stop();
  }

  fully_stopped_ = true;
  lock.unlock();
  stop_cv_.notify_all();
}

ConnectionResult NetworkManager::connect_to(const std::string &address,
                                            uint16_t port) {
  if (!running_.load(std::memory_order_acquire)) {
    return ConnectionResult::NotRunning;
  }

  LOG_NET_DEBUG("trying connection {}:{}", address, port);

  // The transport may report completion before connect() returns; the holder
  // delivers the connection object to the posted handler either way.
  auto holder = std::make_shared<TransportConnectionPtr>();
  auto connection = transport_->connect(
      address, port, [this, holder, address, port](bool success) {
        boost::asio::post(*io_context_, [this, holder, address, port, success]() {
          TransportConnectionPtr conn = *holder;
          if (!success || !conn) {
            LOG_NET_WARN("connection to {}:{} failed", address, port);
            return;
          }
          if (!running_.load(std::memory_order_acquire)) {
            conn->close();
            return;
          }
          auto peer = Peer::create_outbound(*io_context_, conn, address, port);
          register_peer(peer);
        });
      });

  if (!connection) {
    LOG_NET_ERROR("transport refused connection to {}:{}", address, port);
    return ConnectionResult::TransportFailed;
  }
  *holder = connection;
  return ConnectionResult::Success;
}

void NetworkManager::handle_inbound_connection(TransportConnectionPtr connection) {
  if (!connection) {
    return;
  }
  // Accept callbacks arrive on the transport thread; hop onto the reactor
  boost::asio::post(*io_context_, [this, connection]() {
    if (!running_.load(std::memory_order_acquire)) {
      connection->close();
      return;
    }
    auto peer = Peer::create_inbound(*io_context_, connection);
    register_peer(peer);
  });
}

void NetworkManager::register_peer(const PeerPtr &peer) {
  peer->set_message_handler([this](PeerPtr p, message::Message msg) {
    if (!running_.load(std::memory_order_acquire)) {
      return;
    }
    sync_manager_->HandleMessage(p, msg);
  });
  peer->set_disconnect_handler([this](PeerPtr p) {
    LOG_NET_INFO("peer={} ({}) disconnected", p->id(), p->ToString());
    peer_manager_->remove_peer(p->id());
  });

  int peer_id = peer_manager_->add_peer(peer);
  if (peer_id < 0) {
    LOG_NET_DEBUG("peer {} not registered, closing", peer->ToString());
    peer->disconnect();
    return;
  }

  peer->start();
  LOG_NET_INFO("new {} peer connected: {} peer={}",
               peer->is_inbound() ? "inbound" : "outbound", peer->ToString(),
               peer_id);
  sync_manager_->OnPeerConnected(peer);
}

bool NetworkManager::disconnect_from(int peer_id) {
  if (!peer_manager_->get_peer(peer_id)) {
    return false;
  }
  peer_manager_->remove_peer(peer_id);
  return true;
}

size_t NetworkManager::active_peer_count() const {
  return peer_manager_->peer_count();
}

std::vector<std::string> NetworkManager::peer_addresses() const {
  return peer_manager_->peer_addresses();
}

} // namespace network
} // namespace relaychain
