// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include <string>
#include <vector>

namespace relaychain {

namespace chain {
struct Block;
class Chain;
} // namespace chain

namespace validation {

/**
 * ============================================================================
 * BLOCK / CHAIN VALIDATION
 * ============================================================================
 *
 * IsValidSuccessor() : one candidate block against its immediate predecessor
 * IsValidChain()     : a whole candidate sequence, anchored at genesis
 *
 * Both are pure. Failures are reported through ValidationState with one of the
 * reject reasons below, never by exception.
 * ============================================================================
 */

// Machine-readable reject reasons
namespace reject {
constexpr const char *BAD_INDEX = "bad-index";         // index != predecessor.index + 1
constexpr const char *BAD_PREVHASH = "bad-prevhash";   // previous_hash != predecessor.hash
constexpr const char *BAD_HASH = "bad-hash";           // hash != recomputed digest
constexpr const char *BAD_GENESIS = "bad-genesis";     // element 0 is not the genesis block
constexpr const char *EMPTY_CHAIN = "empty-chain";     // candidate has no blocks
constexpr const char *NOT_LONGER = "chain-not-longer"; // replacement not strictly longer
} // namespace reject

/**
 * Validation state - tracks why validation failed
 */
class ValidationState {
public:
  enum class Result {
    VALID,
    INVALID, // Invalid block or chain
    ERROR    // System error
  };

  ValidationState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsInvalid() const { return result_ == Result::INVALID; }
  bool IsError() const { return result_ == Result::ERROR; }

  bool Invalid(const std::string &reject_reason,
               const std::string &debug_message = "") {
    result_ = Result::INVALID;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  bool Error(const std::string &reject_reason,
             const std::string &debug_message = "") {
    result_ = Result::ERROR;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  const std::string &GetRejectReason() const { return reject_reason_; }
  const std::string &GetDebugMessage() const { return debug_message_; }

private:
  Result result_;
  std::string reject_reason_;
  std::string debug_message_;
};

// Check candidate as the direct successor of predecessor.
// Checks, in order: index, previous hash linkage, recomputed hash.
bool IsValidSuccessor(const chain::Block &candidate,
                      const chain::Block &predecessor, ValidationState &state);

// Check a full candidate sequence: element 0 must equal the canonical genesis
// block, then every element must be a valid successor of the element before
// it (in the candidate itself, not the local chain). Stops at first failure.
bool IsValidChain(const std::vector<chain::Block> &candidate,
                  ValidationState &state);

bool IsValidChain(const chain::Chain &candidate, ValidationState &state);

} // namespace validation
} // namespace relaychain
