// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace relaychain {
namespace chain {

// Raised when the tip of a chain with no blocks is requested. Every Chain is
// seeded with genesis, so reaching this means an invariant was broken.
class EmptyChainError : public std::runtime_error {
public:
  EmptyChainError() : std::runtime_error("chain has no blocks") {}
};

// Chain - ordered in-memory sequence of blocks, genesis at position 0
// Value type: copied to take snapshots, replaced wholesale on reorg.
// Does not validate on Append(); callers validate first (see validation.hpp).
class Chain {
public:
  // Chain holding only the genesis block
  Chain();

  // Chain over an arbitrary (possibly unvalidated) block sequence
  explicit Chain(std::vector<Block> blocks);

  // Last block; throws EmptyChainError if there are no blocks
  const Block &Latest() const;

  const Block &Genesis() const;

  void Append(Block block);

  size_t Size() const { return blocks_.size(); }
  bool Empty() const { return blocks_.empty(); }

  // Index of the last block (equal to Size() - 1 for a well-formed chain)
  uint64_t Height() const { return Latest().index; }

  const Block &operator[](size_t pos) const { return blocks_.at(pos); }

  const std::vector<Block> &Blocks() const { return blocks_; }

private:
  std::vector<Block> blocks_;
};

// Build the successor of chain.Latest() carrying payload, stamped with the
// given timestamp. Pure: does not modify chain.
Block NextBlock(const Chain &chain, const std::string &payload, double timestamp);

// Same, stamped with the current (mockable) time
Block NextBlock(const Chain &chain, const std::string &payload);

} // namespace chain
} // namespace relaychain
