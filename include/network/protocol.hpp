// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace relaychain {
namespace protocol {

// Wire message types ("type" field of the JSON envelope)
enum class MessageType : int {
  QUERY_LATEST = 0,        // Ask for the sender's latest block
  QUERY_ALL = 1,           // Ask for the sender's whole chain
  RESPONSE_BLOCKCHAIN = 2  // One or more blocks (answer to either query, or gossip)
};

// Default ports
namespace ports {
constexpr uint16_t DEFAULT_HTTP = 3001;
constexpr uint16_t DEFAULT_P2P = 6001;
} // namespace ports

// Framing: each message is one JSON document terminated by '\n'
constexpr char MESSAGE_DELIMITER = '\n';

// Size limits
constexpr size_t MAX_MESSAGE_SIZE = 0x02000000;             // 32 MiB - Single frame limit
constexpr size_t DEFAULT_SEND_QUEUE_SIZE = 64 * 1000 * 1000; // 64 MB - Send queue limit per peer

// Timeouts
constexpr std::chrono::seconds DEFAULT_CONNECT_TIMEOUT{10};

} // namespace protocol
} // namespace relaychain
