// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace relaychain {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One spdlog logger per node component, all sharing the same sinks. Every
 * method is thread-safe; only the first Initialize() call takes effect.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "relaychain.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "network", "sync", "chain")
   *
   * Auto-initializes if not initialized. Unknown names fall back to the
   * default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  // Set log level for a single component
  static void SetComponentLevel(const std::string &component, const std::string &level);

  // Names accepted by GetLogger() and SetComponentLevel()
  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace relaychain

// Convenience macros for logging
#define LOG_INFO(...)                                                          \
  relaychain::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  relaychain::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Node lifecycle (startup, shutdown, configuration)
#define LOG_APP_TRACE(...)                                                     \
  relaychain::util::LogManager::GetLogger("app")->trace(__VA_ARGS__)
#define LOG_APP_DEBUG(...)                                                     \
  relaychain::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...)                                                      \
  relaychain::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  relaychain::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  relaychain::util::LogManager::GetLogger("app")->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  relaychain::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  relaychain::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  relaychain::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  relaychain::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  relaychain::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_SYNC_TRACE(...)                                                    \
  relaychain::util::LogManager::GetLogger("sync")->trace(__VA_ARGS__)
#define LOG_SYNC_DEBUG(...)                                                    \
  relaychain::util::LogManager::GetLogger("sync")->debug(__VA_ARGS__)
#define LOG_SYNC_INFO(...)                                                     \
  relaychain::util::LogManager::GetLogger("sync")->info(__VA_ARGS__)
#define LOG_SYNC_WARN(...)                                                     \
  relaychain::util::LogManager::GetLogger("sync")->warn(__VA_ARGS__)

#define LOG_CHAIN_TRACE(...)                                                   \
  relaychain::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  relaychain::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  relaychain::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  relaychain::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  relaychain::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_HTTP_DEBUG(...)                                                    \
  relaychain::util::LogManager::GetLogger("http")->debug(__VA_ARGS__)
#define LOG_HTTP_INFO(...)                                                     \
  relaychain::util::LogManager::GetLogger("http")->info(__VA_ARGS__)
#define LOG_HTTP_WARN(...)                                                     \
  relaychain::util::LogManager::GetLogger("http")->warn(__VA_ARGS__)
#define LOG_HTTP_ERROR(...)                                                    \
  relaychain::util::LogManager::GetLogger("http")->error(__VA_ARGS__)
