// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#include "chain/block.hpp"
#include "util/hash.hpp"
#include "util/time.hpp"
#include <cmath>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

namespace relaychain {
namespace chain {

std::string FormatTimestamp(double timestamp) {
  if (std::isfinite(timestamp) && std::trunc(timestamp) == timestamp &&
      std::fabs(timestamp) < 1e21) {
    return fmt::format("{:.0f}", timestamp);
  }
  return fmt::format("{}", timestamp);
}

std::string CalculateBlockHash(uint64_t index, const std::string &previous_hash,
                               double timestamp, const std::string &payload) {
  std::string input = std::to_string(index);
  input += previous_hash;
  input += FormatTimestamp(timestamp);
  input += payload;
  return util::Sha256Hex(input);
}

std::string Block::CalculateHash() const {
  return CalculateBlockHash(index, previous_hash, timestamp, payload);
}

std::string Block::ToString() const {
  // Peer-supplied timestamps are arbitrary doubles; only convert what fits
  std::string calendar = "out of range";
  if (std::isfinite(timestamp) && timestamp >= -9.2e18 && timestamp < 9.2e18) {
    calendar = util::FormatTime(static_cast<int64_t>(timestamp));
  }
  return fmt::format("Block(index={}, hash={}, prev={}, time={} ({}), payload_size={})",
                     index, hash, previous_hash, FormatTimestamp(timestamp), calendar,
                     payload.size());
}

Block CreateGenesisBlock() {
  Block genesis;
  genesis.index = GENESIS_INDEX;
  genesis.previous_hash = GENESIS_PREVIOUS_HASH;
  genesis.timestamp = GENESIS_TIMESTAMP;
  genesis.payload = GENESIS_PAYLOAD;
  genesis.hash = genesis.CalculateHash();
  return genesis;
}

void to_json(nlohmann::json &j, const Block &block) {
  j = nlohmann::json{
    {"index", block.index},
    {"previousHash", block.previous_hash},
    {"timestamp", block.timestamp},
    {"data", block.payload},
    {"hash", block.hash},
  };
}

std::optional<Block> BlockFromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return std::nullopt;
  }

  auto index = j.find("index");
  auto previous_hash = j.find("previousHash");
  auto timestamp = j.find("timestamp");
  auto data = j.find("data");
  auto hash = j.find("hash");

  if (index == j.end() || !index->is_number_unsigned()) {
    return std::nullopt;
  }
  if (previous_hash == j.end() || !previous_hash->is_string()) {
    return std::nullopt;
  }
  if (timestamp == j.end() || !timestamp->is_number()) {
    return std::nullopt;
  }
  if (data == j.end() || !data->is_string()) {
    return std::nullopt;
  }
  if (hash == j.end() || !hash->is_string()) {
    return std::nullopt;
  }

  Block block;
  block.index = index->get<uint64_t>();
  block.previous_hash = previous_hash->get<std::string>();
  block.timestamp = timestamp->get<double>();
  block.payload = data->get<std::string>();
  block.hash = hash->get<std::string>();
  return block;
}

} // namespace chain
} // namespace relaychain
