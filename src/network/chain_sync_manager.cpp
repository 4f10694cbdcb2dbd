// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#include "network/chain_sync_manager.hpp"
#include "chain/chainstate_manager.hpp"
#include "chain/validation.hpp"
#include "network/peer_manager.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>

namespace relaychain {
namespace network {

namespace {

template <class... Ts> struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

ChainSyncManager::ChainSyncManager(boost::asio::io_context &io_context,
                                   validation::ChainstateManager &chainstate,
                                   PeerManager &peer_manager)
    : io_context_(io_context), chainstate_(chainstate),
      peer_manager_(peer_manager), lifetime_token_(std::make_shared<int>(0)) {
  std::weak_ptr<int> token = lifetime_token_;
  tip_sub_ = chainstate_.Notifications().SubscribeChainTip(
      [this, token](const chain::Block &tip, size_t length) {
        LOG_SYNC_DEBUG("tip changed: index={} length={}, queueing broadcast",
                       tip.index, length);
        boost::asio::post(io_context_, [this, token, tip]() {
          if (token.expired()) {
            return;
          }
          Broadcast(message::ChainResponseMessage{{tip}});
        });
      });
}

ChainSyncManager::~ChainSyncManager() {
  tip_sub_.Unsubscribe();
  lifetime_token_.reset();
}

void ChainSyncManager::OnPeerConnected(const PeerPtr &peer) {
  if (!peer) {
    return;
  }
  LOG_SYNC_DEBUG("peer={} connected, sending query_latest", peer->id());
  peer->send_message(message::QueryLatestMessage{});
}

void ChainSyncManager::HandleMessage(const PeerPtr &peer,
                                     const message::Message &msg) {
  if (!peer) {
    return;
  }
  std::visit(Overloaded{
                 [&](const message::QueryLatestMessage &) { HandleQueryLatest(peer); },
                 [&](const message::QueryAllMessage &) { HandleQueryAll(peer); },
                 [&](const message::ChainResponseMessage &response) {
                   HandleChainResponse(peer, response.blocks);
                 },
             },
             msg);
}

void ChainSyncManager::HandleQueryLatest(const PeerPtr &peer) {
  LOG_SYNC_TRACE("query_latest from peer={}", peer->id());
  peer->send_message(message::ChainResponseMessage{{chainstate_.GetLatestBlock()}});
}

void ChainSyncManager::HandleQueryAll(const PeerPtr &peer) {
  auto blocks = chainstate_.GetBlocks();
  LOG_SYNC_DEBUG("query_all from peer={}, sending {} blocks", peer->id(),
                 blocks.size());
  peer->send_message(message::ChainResponseMessage{std::move(blocks)});
}

void ChainSyncManager::HandleChainResponse(const PeerPtr &peer,
                                           std::vector<chain::Block> blocks) {
  if (blocks.empty()) {
    LOG_SYNC_DEBUG("empty response_blockchain from peer={}, ignoring", peer->id());
    return;
  }

  std::stable_sort(blocks.begin(), blocks.end(),
                   [](const chain::Block &a, const chain::Block &b) {
                     return a.index < b.index;
                   });

  const chain::Block &received_latest = blocks.back();
  chain::Block my_latest = chainstate_.GetLatestBlock();

  if (received_latest.index <= my_latest.index) {
    LOG_SYNC_DEBUG("received latest index {} from peer={} not ahead of ours ({}), "
                   "nothing to do",
                   received_latest.index, peer->id(), my_latest.index);
    return;
  }

  LOG_SYNC_INFO("blockchain possibly behind: ours={} peer={} has {}",
                my_latest.index, peer->id(), received_latest.index);

  if (received_latest.previous_hash == my_latest.hash) {
    validation::ValidationState state;
    if (chainstate_.AcceptBlock(received_latest, state)) {
      blocks_appended_.fetch_add(1, std::memory_order_relaxed);
      LOG_SYNC_DEBUG("appended block {} from peer={}", received_latest.index,
                     peer->id());
    } else {
      LOG_SYNC_WARN("block {} from peer={} rejected: {} ({})",
                    received_latest.index, peer->id(), state.GetRejectReason(),
                    state.GetDebugMessage());
    }
    return;
  }

  if (blocks.size() == 1) {
    LOG_SYNC_DEBUG("cannot link block {} from peer={}, requesting full chain",
                   received_latest.index, peer->id());
    full_chain_requests_.fetch_add(1, std::memory_order_relaxed);
    peer->send_message(message::QueryAllMessage{});
    return;
  }

  LOG_SYNC_DEBUG("received {} blocks from peer={}, trying replacement",
                 blocks.size(), peer->id());
  validation::ValidationState state;
  if (chainstate_.TryReplace(std::move(blocks), state) ==
      validation::ReplaceResult::REPLACED) {
    chains_replaced_.fetch_add(1, std::memory_order_relaxed);
  } else {
    LOG_SYNC_WARN("chain from peer={} rejected: {} ({})", peer->id(),
                  state.GetRejectReason(), state.GetDebugMessage());
  }
}

size_t ChainSyncManager::Broadcast(const message::Message &msg) {
  auto peers = peer_manager_.get_all_peers();
  size_t delivered = 0;
  for (const auto &peer : peers) {
    if (peer->send_message(msg)) {
      ++delivered;
    } else {
      LOG_SYNC_DEBUG("broadcast of {} to peer={} failed, removing peer",
                     message::MessageName(msg), peer->id());
      peer_manager_.remove_peer(peer->id());
    }
  }
  LOG_SYNC_TRACE("broadcast {} to {}/{} peers", message::MessageName(msg),
                 delivered, peers.size());
  return delivered;
}

size_t ChainSyncManager::BroadcastLatest() {
  return Broadcast(message::ChainResponseMessage{{chainstate_.GetLatestBlock()}});
}

} // namespace network
} // namespace relaychain
