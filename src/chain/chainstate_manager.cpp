// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#include "chain/chainstate_manager.hpp"
#include "chain/validation.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace relaychain {
namespace validation {

ChainstateManager::ChainstateManager() = default;

chain::Block ChainstateManager::GetLatestBlock() const {
  std::lock_guard<std::mutex> lock(chain_mutex_);
  return chain_.Latest();
}

std::vector<chain::Block> ChainstateManager::GetBlocks() const {
  std::lock_guard<std::mutex> lock(chain_mutex_);
  return chain_.Blocks();
}

size_t ChainstateManager::GetChainLength() const {
  std::lock_guard<std::mutex> lock(chain_mutex_);
  return chain_.Size();
}

uint64_t ChainstateManager::GetChainHeight() const {
  std::lock_guard<std::mutex> lock(chain_mutex_);
  return chain_.Height();
}

chain::Block ChainstateManager::MineBlock(const std::string &payload) {
  chain::Block block;
  size_t length = 0;
  {
    std::lock_guard<std::mutex> lock(chain_mutex_);
    block = chain::NextBlock(chain_, payload, util::GetTimeSeconds());
    chain_.Append(block);
    length = chain_.Size();
  }

  LOG_CHAIN_INFO("Mined block index={} hash={} payload_size={}", block.index,
                 block.hash, block.payload.size());

  notifications_.NotifyBlockConnected(block);
  notifications_.NotifyChainTip(block, length);
  return block;
}

bool ChainstateManager::AcceptBlock(const chain::Block &block,
                                    ValidationState &state) {
  size_t length = 0;
  {
    std::lock_guard<std::mutex> lock(chain_mutex_);
    if (!IsValidSuccessor(block, chain_.Latest(), state)) {
      LOG_CHAIN_DEBUG("AcceptBlock: rejected block index={}: {} ({})",
                      block.index, state.GetRejectReason(),
                      state.GetDebugMessage());
      return false;
    }
    chain_.Append(block);
    length = chain_.Size();
  }

  LOG_CHAIN_INFO("Appended block index={} hash={}", block.index, block.hash);

  notifications_.NotifyBlockConnected(block);
  notifications_.NotifyChainTip(block, length);
  return true;
}

ReplaceResult ChainstateManager::TryReplace(std::vector<chain::Block> candidate,
                                            ValidationState &state) {
  if (!IsValidChain(candidate, state)) {
    LOG_CHAIN_WARN("TryReplace: received chain invalid: {} ({})",
                   state.GetRejectReason(), state.GetDebugMessage());
    return ReplaceResult::REJECTED;
  }

  size_t old_length = 0;
  size_t new_length = 0;
  chain::Block tip;
  {
    std::lock_guard<std::mutex> lock(chain_mutex_);
    old_length = chain_.Size();
    if (candidate.size() <= old_length) {
      state.Invalid(reject::NOT_LONGER,
                    fmt::format("candidate length {} <= local length {}",
                                candidate.size(), old_length));
      LOG_CHAIN_DEBUG("TryReplace: {}", state.GetDebugMessage());
      return ReplaceResult::REJECTED;
    }
    chain_ = chain::Chain(std::move(candidate));
    new_length = chain_.Size();
    tip = chain_.Latest();
  }

  LOG_CHAIN_INFO("Replaced local chain: length {} -> {}, new tip index={} hash={}",
                 old_length, new_length, tip.index, tip.hash);

  notifications_.NotifyChainReplaced(old_length, new_length);
  notifications_.NotifyChainTip(tip, new_length);
  return ReplaceResult::REPLACED;
}

} // namespace validation
} // namespace relaychain
