// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/chain.hpp"
#include "chain/notifications.hpp"
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace relaychain {
namespace validation {

class ValidationState;

enum class ReplaceResult {
  REPLACED, // Candidate adopted as the local chain
  REJECTED  // Local chain unchanged (see ValidationState for why)
};

// ChainstateManager - owner of the node's single Chain
// Every mutation (mining, direct append from a peer, wholesale replacement)
// goes through here, under one mutex, so check-then-mutate is atomic with
// respect to the HTTP thread and the network reactor. Notifications fire after
// the lock is released.
class ChainstateManager {
public:
  ChainstateManager();

  ChainstateManager(const ChainstateManager &) = delete;
  ChainstateManager &operator=(const ChainstateManager &) = delete;

  // Tip of the local chain (copy)
  chain::Block GetLatestBlock() const;

  // Snapshot of the whole chain, genesis first
  std::vector<chain::Block> GetBlocks() const;

  size_t GetChainLength() const;
  uint64_t GetChainHeight() const;

  // Build a successor of the current tip with the given payload, stamped with
  // the current time, and append it. Always succeeds.
  chain::Block MineBlock(const std::string &payload);

  // Append block if it is a valid successor of the current tip.
  // Returns false (reason in state) without touching the chain otherwise.
  bool AcceptBlock(const chain::Block &block, ValidationState &state);

  // Longest-valid-chain rule: adopt candidate iff it validates from genesis
  // and is strictly longer than the local chain. Equal length keeps the
  // incumbent ("chain-not-longer").
  ReplaceResult TryReplace(std::vector<chain::Block> candidate,
                           ValidationState &state);

  ChainNotifications &Notifications() { return notifications_; }

private:
  mutable std::mutex chain_mutex_;
  chain::Chain chain_;
  ChainNotifications notifications_;
};

} // namespace validation
} // namespace relaychain
