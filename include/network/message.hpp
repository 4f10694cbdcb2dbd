// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "network/protocol.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace relaychain {
namespace message {

// QUERY_LATEST - ask for the latest block
struct QueryLatestMessage {};

// QUERY_ALL - ask for the full chain
struct QueryAllMessage {};

// RESPONSE_BLOCKCHAIN - blocks in the order the sender listed them
struct ChainResponseMessage {
  std::vector<chain::Block> blocks;
};

// A protocol message is exactly one of the three shapes above. Handlers
// dispatch with std::visit, so a new alternative fails to compile until every
// visitor handles it.
using Message =
    std::variant<QueryLatestMessage, QueryAllMessage, ChainResponseMessage>;

protocol::MessageType GetType(const Message &msg);

// Human-readable name for logging ("query_latest", "query_all",
// "response_blockchain")
const char *MessageName(const Message &msg);

// Encode as a JSON envelope {"type": <int>, "data": <string>} (no trailing
// delimiter). For RESPONSE_BLOCKCHAIN, data is the JSON text of the block
// array; for the queries it is null.
std::string Serialize(const Message &msg);

// Decode one JSON envelope. Returns std::nullopt for anything malformed:
// invalid JSON, a missing or unknown "type", or block data that does not parse
// (either a JSON string holding the block array, or the array itself).
// Block hashes are NOT verified here.
std::optional<Message> Parse(std::string_view text);

} // namespace message
} // namespace relaychain
