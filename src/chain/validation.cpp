// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#include "chain/validation.hpp"
#include "chain/block.hpp"
#include "chain/chain.hpp"
#include "util/logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace relaychain {
namespace validation {

bool IsValidSuccessor(const chain::Block &candidate,
                      const chain::Block &predecessor, ValidationState &state) {
  if (candidate.index != predecessor.index + 1) {
    return state.Invalid(reject::BAD_INDEX,
                         fmt::format("expected index {}, got {}",
                                     predecessor.index + 1, candidate.index));
  }

  if (candidate.previous_hash != predecessor.hash) {
    return state.Invalid(reject::BAD_PREVHASH,
                         fmt::format("block {} links to {}, predecessor is {}",
                                     candidate.index, candidate.previous_hash,
                                     predecessor.hash));
  }

  std::string recomputed = candidate.CalculateHash();
  if (recomputed != candidate.hash) {
    return state.Invalid(reject::BAD_HASH,
                         fmt::format("block {} claims hash {}, computed {}",
                                     candidate.index, candidate.hash, recomputed));
  }

  return true;
}

bool IsValidChain(const std::vector<chain::Block> &candidate,
                  ValidationState &state) {
  if (candidate.empty()) {
    return state.Invalid(reject::EMPTY_CHAIN, "candidate chain has no blocks");
  }

  static const chain::Block genesis = chain::CreateGenesisBlock();
  if (!(candidate.front() == genesis)) {
    return state.Invalid(reject::BAD_GENESIS,
                         fmt::format("first block {} is not the genesis block",
                                     candidate.front().hash));
  }

  for (size_t i = 1; i < candidate.size(); ++i) {
    if (!IsValidSuccessor(candidate[i], candidate[i - 1], state)) {
      LOG_CHAIN_TRACE("IsValidChain: rejected at position {}: {} ({})", i,
                      state.GetRejectReason(), state.GetDebugMessage());
      return false;
    }
  }

  return true;
}

bool IsValidChain(const chain::Chain &candidate, ValidationState &state) {
  return IsValidChain(candidate.Blocks(), state);
}

} // namespace validation
} // namespace relaychain
