// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#include "chain/chain.hpp"
#include "util/time.hpp"
#include <utility>

namespace relaychain {
namespace chain {

Chain::Chain() : blocks_{CreateGenesisBlock()} {}

Chain::Chain(std::vector<Block> blocks) : blocks_(std::move(blocks)) {}

const Block &Chain::Latest() const {
  if (blocks_.empty()) {
    throw EmptyChainError();
  }
  return blocks_.back();
}

const Block &Chain::Genesis() const {
  if (blocks_.empty()) {
    throw EmptyChainError();
  }
  return blocks_.front();
}

void Chain::Append(Block block) { blocks_.push_back(std::move(block)); }

Block NextBlock(const Chain &chain, const std::string &payload, double timestamp) {
  const Block &prev = chain.Latest();

  Block next;
  next.index = prev.index + 1;
  next.previous_hash = prev.hash;
  next.timestamp = timestamp;
  next.payload = payload;
  next.hash = next.CalculateHash();
  return next;
}

Block NextBlock(const Chain &chain, const std::string &payload) {
  return NextBlock(chain, payload, util::GetTimeSeconds());
}

} // namespace chain
} // namespace relaychain
