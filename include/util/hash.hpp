// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include <string>
#include <string_view>

namespace relaychain {
namespace util {

// Length of a hex-encoded SHA-256 digest
constexpr size_t SHA256_HEX_SIZE = 64;

/**
 * SHA-256 of arbitrary bytes, rendered as 64 lowercase hex characters
 *
 * Backed by OpenSSL's EVP interface. Throws std::runtime_error if libcrypto
 * reports a failure (never expected for SHA-256).
 *
 * Example:
 *   Sha256Hex("abc") ->
 *     "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"
 */
std::string Sha256Hex(std::string_view data);

// Lowercase hex encoding of raw bytes
std::string HexEncode(const unsigned char* data, size_t len);

} // namespace util
} // namespace relaychain
