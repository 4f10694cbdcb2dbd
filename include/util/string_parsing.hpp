// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of operator input (environment, command line, HTTP bodies)
 - Centralized validation so malformed input never crashes the node

 Key functions:
 - SafeParseInt: Parse integer with bounds checking
 - SafeParsePort: Parse port number (1-65535)
 - ParsePeerAddress: Parse "host:port", "[ipv6]:port" or "ws://host:port"
 - SplitList: Split a comma-separated list, dropping empty items
 - JsonError / JsonSuccess: Small JSON bodies for the HTTP control surface

 All parsers return std::nullopt (or false) on any error and never throw.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace relaychain {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("6001") -> 6001
 *   SafeParsePort("0") -> std::nullopt (port 0 invalid)
 *   SafeParsePort("99999") -> std::nullopt (out of range)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

struct PeerAddress {
  std::string host;
  uint16_t port{0};

  std::string ToString() const;
};

/**
 * Parse a peer address
 *
 * Accepted forms:
 *   "127.0.0.1:6001", "localhost:6001", "[::1]:6001", "ws://localhost:6001"
 *   (a trailing '/' after the port is tolerated for the ws:// form)
 *
 * Unbracketed IPv6 addresses are rejected (ambiguous port separator).
 */
std::optional<PeerAddress> ParsePeerAddress(const std::string& str);

// Split on ',' trimming surrounding whitespace; empty items are dropped
std::vector<std::string> SplitList(const std::string& str);

/**
 * Escape special characters in string for JSON output
 *
 * Example:
 *   EscapeJSONString("hello\nworld") -> "hello\\nworld"
 */
std::string EscapeJSONString(const std::string& str);

/**
 * Create JSON error body
 *
 * Example:
 *   JsonError("Invalid parameter") -> "{\"error\":\"Invalid parameter\"}\n"
 */
std::string JsonError(const std::string& message);

/**
 * Create JSON success body with single result field
 *
 * Example:
 *   JsonSuccess("connecting") -> "{\"result\":\"connecting\"}\n"
 */
std::string JsonSuccess(const std::string& result);

} // namespace util
} // namespace relaychain
