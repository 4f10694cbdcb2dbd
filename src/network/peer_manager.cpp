// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#include "network/peer_manager.hpp"
#include "util/logging.hpp"

namespace relaychain {
namespace network {

int PeerManager::add_peer(PeerPtr peer) {
  if (!peer) {
    return -1;
  }
  if (stopping_all_.load(std::memory_order_acquire)) {
    LOG_NET_TRACE("add_peer: rejected while disconnect_all in progress");
    return -1;
  }

  int peer_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    peer_id = next_peer_id_++;
    peer->set_id(peer_id);
    peers_[peer_id] = peer;
  }

  LOG_NET_DEBUG("added peer={} ({} {})", peer_id,
                peer->is_inbound() ? "inbound" : "outbound", peer->ToString());
  return peer_id;
}

void PeerManager::remove_peer(int peer_id) {
  PeerPtr peer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
      return;
    }
    peer = std::move(it->second);
    peers_.erase(it);
  }

  LOG_NET_DEBUG("removed peer={} ({})", peer_id, peer->ToString());

  // Outside the lock: disconnect may run the peer's disconnect handler
  peer->disconnect();
}

PeerPtr PeerManager::get_peer(int peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(peer_id);
  return it == peers_.end() ? nullptr : it->second;
}

std::vector<PeerPtr> PeerManager::get_all_peers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerPtr> result;
  result.reserve(peers_.size());
  for (const auto &[id, peer] : peers_) {
    result.push_back(peer);
  }
  return result;
}

size_t PeerManager::peer_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

std::vector<std::string> PeerManager::peer_addresses() const {
  std::vector<std::string> result;
  for (const auto &peer : get_all_peers()) {
    result.push_back(peer->ToString());
  }
  return result;
}

void PeerManager::disconnect_all() {
  stopping_all_.store(true, std::memory_order_release);

  std::map<int, PeerPtr> to_disconnect;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    to_disconnect.swap(peers_);
  }

  for (auto &[id, peer] : to_disconnect) {
    peer->disconnect();
  }

  stopping_all_.store(false, std::memory_order_release);
}

} // namespace network
} // namespace relaychain
