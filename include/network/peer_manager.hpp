// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include "network/peer.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace relaychain {
namespace network {

// PeerManager - registry of live peer connections
// Allocates peer ids and hands out snapshots for broadcast. Thread-safe: the
// reactor adds and removes peers, the HTTP thread lists them.
class PeerManager {
public:
  PeerManager() = default;

  PeerManager(const PeerManager &) = delete;
  PeerManager &operator=(const PeerManager &) = delete;

  // Register a peer and assign its id. Returns -1 during disconnect_all().
  int add_peer(PeerPtr peer);

  // Deregister and disconnect (no-op if unknown)
  void remove_peer(int peer_id);

  PeerPtr get_peer(int peer_id) const;

  // Copy of the registry at call time
  std::vector<PeerPtr> get_all_peers() const;

  size_t peer_count() const;

  // "address:port" of every registered peer, in id order
  std::vector<std::string> peer_addresses() const;

  // Disconnect and deregister every peer (shutdown)
  void disconnect_all();

private:
  mutable std::mutex mutex_;
  std::map<int, PeerPtr> peers_;
  int next_peer_id_{0};
  std::atomic<bool> stopping_all_{false};
};

} // namespace network
} // namespace relaychain
