// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace relaychain {
namespace util {

/**
 * Node clock
 *
 * Block timestamps are Unix seconds with a fractional part, so the clock is
 * read as a double. Tests pin it with MockTimeScope; a mock value of 0 means
 * the system clock is used.
 */

// Unix time in seconds, millisecond resolution
double GetTimeSeconds();

// Whole seconds (truncated GetTimeSeconds())
int64_t GetTime();

// 0 disables mocking
void SetMockTime(double time);
double GetMockTime();

/**
 * Format a Unix timestamp as a human-readable UTC string
 *
 * Example: FormatTime(1465154705) -> "2016-06-05 19:25:05 UTC"
 */
std::string FormatTime(int64_t unix_time);

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(double time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope &) = delete;
  MockTimeScope &operator=(const MockTimeScope &) = delete;

private:
  const double previous_time_;
};

} // namespace util
} // namespace relaychain
