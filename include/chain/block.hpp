// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace relaychain {
namespace chain {

// Block - one hash-sealed record of the ledger
//
// The hash commits to (index, previous_hash, timestamp, payload) in that order.
// A block is never trusted as received: every ingestion path recomputes the
// hash through CalculateHash() before the block is accepted.
struct Block {
  uint64_t index{0};
  std::string previous_hash;   // Hex digest of the predecessor ("0" for genesis)
  double timestamp{0};         // Unix seconds, fractional allowed
  std::string payload;         // Opaque creator-supplied data
  std::string hash;            // Hex digest over the fields above

  // Recompute the digest from this block's own fields
  [[nodiscard]] std::string CalculateHash() const;

  // True if hash matches the recomputed digest
  [[nodiscard]] bool HasValidHash() const { return hash == CalculateHash(); }

  [[nodiscard]] std::string ToString() const;

  bool operator==(const Block &other) const = default;
};

// Digest of the block fields: SHA-256 over
// decimal(index) + previous_hash + FormatTimestamp(timestamp) + payload
[[nodiscard]] std::string CalculateBlockHash(uint64_t index,
                                             const std::string &previous_hash,
                                             double timestamp,
                                             const std::string &payload);

// Canonical text form of a timestamp used in the hash input.
// Integral values print without a fractional part ("1465154705"), other
// values use the shortest decimal that round-trips ("1465154705.25").
[[nodiscard]] std::string FormatTimestamp(double timestamp);

// Genesis constants (identical on every node)
constexpr uint64_t GENESIS_INDEX = 0;
constexpr const char *GENESIS_PREVIOUS_HASH = "0";
constexpr double GENESIS_TIMESTAMP = 1465154705;
constexpr const char *GENESIS_PAYLOAD = "Genesis Block";

// Build the fixed genesis block
[[nodiscard]] Block CreateGenesisBlock();

// JSON form: {"index","previousHash","timestamp","data","hash"}
void to_json(nlohmann::json &j, const Block &block);

// Strict parse of the JSON form. Returns std::nullopt if a field is missing
// or has the wrong JSON type. The hash is NOT verified here.
[[nodiscard]] std::optional<Block> BlockFromJson(const nlohmann::json &j);

} // namespace chain
} // namespace relaychain
