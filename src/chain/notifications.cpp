// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#include "chain/notifications.hpp"
#include <algorithm>

namespace relaychain {

ChainNotifications::Subscription::Subscription(ChainNotifications *owner,
                                               size_t id)
    : owner_(owner), id_(id), active_(true) {}

ChainNotifications::Subscription::~Subscription() { Unsubscribe(); }

ChainNotifications::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

ChainNotifications::Subscription &
ChainNotifications::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void ChainNotifications::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

ChainNotifications::Subscription ChainNotifications::Add(CallbackEntry entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  entry.id = next_id_++;
  size_t id = entry.id;
  callbacks_.push_back(std::move(entry));
  return Subscription(this, id);
}

ChainNotifications::Subscription
ChainNotifications::SubscribeBlockConnected(BlockConnectedCallback callback) {
  CallbackEntry entry;
  entry.block_connected = std::move(callback);
  return Add(std::move(entry));
}

ChainNotifications::Subscription
ChainNotifications::SubscribeChainReplaced(ChainReplacedCallback callback) {
  CallbackEntry entry;
  entry.chain_replaced = std::move(callback);
  return Add(std::move(entry));
}

ChainNotifications::Subscription
ChainNotifications::SubscribeChainTip(ChainTipCallback callback) {
  CallbackEntry entry;
  entry.chain_tip = std::move(callback);
  return Add(std::move(entry));
}

void ChainNotifications::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(),
                                  [id](const CallbackEntry &entry) {
                                    return entry.id == id;
                                  }),
                   callbacks_.end());
}

std::vector<ChainNotifications::CallbackEntry>
ChainNotifications::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_;
}

void ChainNotifications::NotifyBlockConnected(const chain::Block &block) {
  for (const auto &entry : Snapshot()) {
    if (entry.block_connected) {
      entry.block_connected(block);
    }
  }
}

void ChainNotifications::NotifyChainReplaced(size_t old_length,
                                             size_t new_length) {
  for (const auto &entry : Snapshot()) {
    if (entry.chain_replaced) {
      entry.chain_replaced(old_length, new_length);
    }
  }
}

void ChainNotifications::NotifyChainTip(const chain::Block &tip, size_t length) {
  for (const auto &entry : Snapshot()) {
    if (entry.chain_tip) {
      entry.chain_tip(tip, length);
    }
  }
}

size_t ChainNotifications::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_.size();
}

} // namespace relaychain
