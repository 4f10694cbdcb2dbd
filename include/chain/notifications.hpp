// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

namespace relaychain {

/**
 * Notification system for ledger events
 *
 * Owned by ChainstateManager. Callbacks run synchronously on the thread that
 * changed the chain, after the chain lock is released, so a callback may read
 * the chain. Subscriptions unsubscribe when destroyed.
 *
 * Events:
 * - BlockConnected: One block appended to the local chain
 * - ChainReplaced: Local chain swapped for a longer valid candidate
 * - ChainTip: Latest block changed (fires after either of the above)
 */
class ChainNotifications {
public:
  /**
   * Subscription handle - RAII wrapper
   * Automatically unsubscribes when destroyed
   */
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    // Movable but not copyable
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    void Unsubscribe();

  private:
    friend class ChainNotifications;
    Subscription(ChainNotifications *owner, size_t id);

    ChainNotifications *owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  using BlockConnectedCallback = std::function<void(const chain::Block &block)>;
  using ChainReplacedCallback =
      std::function<void(size_t old_length, size_t new_length)>;
  using ChainTipCallback =
      std::function<void(const chain::Block &tip, size_t length)>;

  ChainNotifications() = default;
  ChainNotifications(const ChainNotifications &) = delete;
  ChainNotifications &operator=(const ChainNotifications &) = delete;

  [[nodiscard]] Subscription SubscribeBlockConnected(BlockConnectedCallback callback);
  [[nodiscard]] Subscription SubscribeChainReplaced(ChainReplacedCallback callback);
  [[nodiscard]] Subscription SubscribeChainTip(ChainTipCallback callback);

  void NotifyBlockConnected(const chain::Block &block);
  void NotifyChainReplaced(size_t old_length, size_t new_length);
  void NotifyChainTip(const chain::Block &tip, size_t length);

  size_t SubscriberCount() const;

private:
  struct CallbackEntry {
    size_t id{0};
    BlockConnectedCallback block_connected;
    ChainReplacedCallback chain_replaced;
    ChainTipCallback chain_tip;
  };

  Subscription Add(CallbackEntry entry);
  void Unsubscribe(size_t id);

  // Copy of the callback list taken under the lock; callbacks run unlocked
  std::vector<CallbackEntry> Snapshot() const;

  mutable std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1};
};

} // namespace relaychain
