// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace relaychain {
namespace util {

namespace {
std::atomic<double> g_mock_time{0.0};
}

double GetTimeSeconds() {
  double mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0.0) {
    return mock;
  }
  auto now = std::chrono::system_clock::now().time_since_epoch();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
  return static_cast<double>(ms) / 1000.0;
}

int64_t GetTime() { return static_cast<int64_t>(std::floor(GetTimeSeconds())); }

void SetMockTime(double time) { g_mock_time.store(time, std::memory_order_relaxed); }

double GetMockTime() { return g_mock_time.load(std::memory_order_relaxed); }

std::string FormatTime(int64_t unix_time) {
  std::time_t t = static_cast<std::time_t>(unix_time);
  std::tm tm_utc;
  if (!gmtime_r(&t, &tm_utc)) {
    return "invalid";
  }
  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S UTC");
  return oss.str();
}

} // namespace util
} // namespace relaychain
