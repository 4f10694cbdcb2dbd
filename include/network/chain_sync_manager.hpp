// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/notifications.hpp"
#include "network/message.hpp"
#include "network/peer.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <memory>
#include <vector>

namespace relaychain {

namespace validation {
class ChainstateManager;
}

namespace network {

class PeerManager;

// ChainSyncManager - gossip and reconciliation of the ledger with peers
//
// Protocol (identical on every node):
//   connected        -> send QUERY_LATEST
//   QUERY_LATEST     -> reply RESPONSE_BLOCKCHAIN [latest]
//   QUERY_ALL        -> reply RESPONSE_BLOCKCHAIN [whole chain]
//   RESPONSE_BLOCKCHAIN blocks (sorted by index):
//     last.index <= our tip index        -> ignore
//     last.previous_hash == our tip hash -> append last
//     exactly one block received         -> send QUERY_ALL back to that peer
//     otherwise                          -> TryReplace(blocks)
//
// Every change of the local tip (mined, appended or replaced) is broadcast to
// all peers as RESPONSE_BLOCKCHAIN [tip]. The broadcast is posted onto the
// networking io_context, whichever thread changed the chain.
//
// All message handling runs on the networking reactor thread.
class ChainSyncManager {
public:
  ChainSyncManager(boost::asio::io_context &io_context,
                   validation::ChainstateManager &chainstate,
                   PeerManager &peer_manager);
  ~ChainSyncManager();

  ChainSyncManager(const ChainSyncManager &) = delete;
  ChainSyncManager &operator=(const ChainSyncManager &) = delete;

  // A peer was registered (inbound or outbound)
  void OnPeerConnected(const PeerPtr &peer);

  // Dispatch one parsed message from peer
  void HandleMessage(const PeerPtr &peer, const message::Message &msg);

  // Send msg to every peer registered at call time. A peer whose send fails
  // is deregistered; delivery to the others is unaffected. Returns the number
  // of peers the message was handed to.
  size_t Broadcast(const message::Message &msg);

  // RESPONSE_BLOCKCHAIN [current tip] to every peer
  size_t BroadcastLatest();

  // Counters (diagnostics and tests)
  uint64_t blocks_appended() const { return blocks_appended_; }
  uint64_t chains_replaced() const { return chains_replaced_; }
  uint64_t full_chain_requests() const { return full_chain_requests_; }

private:
  void HandleQueryLatest(const PeerPtr &peer);
  void HandleQueryAll(const PeerPtr &peer);
  void HandleChainResponse(const PeerPtr &peer, std::vector<chain::Block> blocks);

  boost::asio::io_context &io_context_;
  validation::ChainstateManager &chainstate_;
  PeerManager &peer_manager_;

  // Expires with this object; posted broadcasts check it before running
  std::shared_ptr<int> lifetime_token_;

  std::atomic<uint64_t> blocks_appended_{0};
  std::atomic<uint64_t> chains_replaced_{0};
  std::atomic<uint64_t> full_chain_requests_{0};

  // Declared last: unsubscribed before the members above are destroyed
  ChainNotifications::Subscription tip_sub_;
};

} // namespace network
} // namespace relaychain
