// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#include "network/peer.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <boost/asio/post.hpp>
#include <cstring>

namespace relaychain {
namespace network {

Peer::Peer(PrivateTag, boost::asio::io_context &io_context,
           TransportConnectionPtr connection, bool is_inbound,
           const std::string &target_address, uint16_t target_port)
    : io_context_(io_context), connection_(std::move(connection)),
      is_inbound_(is_inbound),
      address_(connection_ && !connection_->remote_address().empty()
                   ? connection_->remote_address()
                   : target_address),
      port_(connection_ && connection_->remote_port() != 0
                ? connection_->remote_port()
                : target_port),
      state_(connection_ && connection_->is_open()
                 ? PeerConnectionState::CONNECTED
                 : PeerConnectionState::DISCONNECTED) {}

Peer::~Peer() {
  // Cleanup belongs in disconnect() while the shared_ptr is still alive
  if (state_ != PeerConnectionState::DISCONNECTED) {
    LOG_NET_ERROR("Peer destructor called without prior disconnect() - peer={}, "
                  "address={}",
                  id_, address_);
  }
}

PeerPtr Peer::create_outbound(boost::asio::io_context &io_context,
                              TransportConnectionPtr connection,
                              const std::string &target_address,
                              uint16_t target_port) {
  return std::make_shared<Peer>(PrivateTag{}, io_context, std::move(connection),
                                false, target_address, target_port);
}

PeerPtr Peer::create_inbound(boost::asio::io_context &io_context,
                             TransportConnectionPtr connection) {
  std::string addr = connection ? connection->remote_address() : "";
  uint16_t port = connection ? connection->remote_port() : 0;
  return std::make_shared<Peer>(PrivateTag{}, io_context, std::move(connection),
                                true, addr, port);
}

void Peer::start() {
  bool expected = false;
  if (!started_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    if (state_ != PeerConnectionState::CONNECTED) {
      LOG_NET_ERROR("Peer {} restart attempted after disconnect; Peer objects "
                    "are single-use",
                    id_);
    } else {
      LOG_NET_TRACE("Peer {} already started, ignoring duplicate call", id_);
    }
    return;
  }

  if (state_ != PeerConnectionState::CONNECTED || !connection_) {
    LOG_NET_ERROR("Cannot start disconnected peer - id:{}, address:{}", id_,
                  ToString());
    return;
  }

  stats_.connected_time.store(util::GetTime(), std::memory_order_relaxed);

  // Callbacks hold a shared_ptr so the peer outlives any in-flight delivery.
  // Each delivery is re-posted so peer logic runs on io_context_ only.
  PeerPtr self = shared_from_this();
  connection_->set_receive_callback([self](const std::vector<uint8_t> &data) {
    boost::asio::post(self->io_context_, [self, data]() {
      self->on_transport_receive(data);
    });
  });
  connection_->set_disconnect_callback([self]() {
    boost::asio::post(self->io_context_, [self]() {
      self->on_transport_disconnect();
    });
  });

  connection_->start();
  LOG_NET_DEBUG("peer {} started ({} {})", id_, is_inbound_ ? "inbound" : "outbound",
                ToString());
}

void Peer::disconnect() {
  if (io_context_.get_executor().running_in_this_thread()) {
    do_disconnect();
  } else {
    auto self = shared_from_this();
    boost::asio::post(io_context_, [self]() { self->do_disconnect(); });
  }
}

void Peer::do_disconnect() {
  if (state_ == PeerConnectionState::DISCONNECTED ||
      state_ == PeerConnectionState::DISCONNECTING) {
    return;
  }

  state_ = PeerConnectionState::DISCONNECTING;
  LOG_NET_DEBUG("disconnecting peer={} ({})", id_, ToString());

  if (connection_) {
    // Clear callbacks before closing: they hold a shared_ptr to this peer
    connection_->set_receive_callback({});
    connection_->set_disconnect_callback({});
    connection_->close();
    connection_.reset();
  }

  on_disconnect();
}

void Peer::post_disconnect() {
  auto self = shared_from_this();
  boost::asio::post(io_context_, [self]() { self->disconnect(); });
}

bool Peer::send_message(const message::Message &msg) {
  const char *name = message::MessageName(msg);

  if (state_ != PeerConnectionState::CONNECTED) {
    LOG_NET_TRACE("Cannot send {} to peer {} - not connected", name, id_);
    return false;
  }

  if (!connection_ || !connection_->is_open()) {
    LOG_NET_DEBUG("Cannot send {} to peer {} - transport not open", name, id_);
    post_disconnect();
    return false;
  }

  std::string text = message::Serialize(msg);
  std::vector<uint8_t> frame;
  frame.reserve(text.size() + 1);
  frame.insert(frame.end(), text.begin(), text.end());
  frame.push_back(static_cast<uint8_t>(protocol::MESSAGE_DELIMITER));

  if (!connection_->send(frame)) {
    LOG_NET_WARN("Failed to send {} to peer {} ({})", name, id_, ToString());
    post_disconnect();
    return false;
  }

  stats_.messages_sent.fetch_add(1, std::memory_order_relaxed);
  stats_.bytes_sent.fetch_add(frame.size(), std::memory_order_relaxed);
  LOG_NET_TRACE("sent {} to peer {} ({} bytes)", name, id_, frame.size());
  return true;
}

void Peer::set_message_handler(MessageHandler handler) {
  message_handler_ = std::move(handler);
}

void Peer::set_disconnect_handler(PeerDisconnectHandler handler) {
  disconnect_handler_ = std::move(handler);
}

std::string Peer::ToString() const {
  return util::PeerAddress{address_, port_}.ToString();
}

void Peer::on_disconnect() {
  state_ = PeerConnectionState::DISCONNECTED;
  message_handler_ = {};

  // Move to a local first: the handler may drop the owner's last reference
  PeerDisconnectHandler handler = std::move(disconnect_handler_);
  disconnect_handler_ = {};
  if (handler) {
    handler(shared_from_this());
  }
}

void Peer::on_transport_receive(const std::vector<uint8_t> &data) {
  if (state_ != PeerConnectionState::CONNECTED) {
    return;
  }

  // Compact once the consumed prefix dominates the buffer
  if (recv_buffer_offset_ > 0 && recv_buffer_offset_ >= recv_buffer_.size() / 2) {
    recv_buffer_.erase(recv_buffer_.begin(),
                       recv_buffer_.begin() + static_cast<std::ptrdiff_t>(recv_buffer_offset_));
    recv_buffer_offset_ = 0;
    if (recv_buffer_.size() < 1024) {
      recv_buffer_.shrink_to_fit();
    }
  }

  recv_buffer_.insert(recv_buffer_.end(), data.begin(), data.end());
  stats_.bytes_received.fetch_add(data.size(), std::memory_order_relaxed);

  process_received_data();
}

void Peer::on_transport_disconnect() {
  LOG_NET_DEBUG("transport closed: peer={} ({})", id_, ToString());

  if (state_ != PeerConnectionState::DISCONNECTED) {
    // Break the Peer -> connection_ -> callbacks -> Peer cycle
    if (connection_) {
      connection_->set_receive_callback({});
      connection_->set_disconnect_callback({});
      connection_.reset();
    }
    on_disconnect();
  }
}

void Peer::process_received_data() {
  while (state_ == PeerConnectionState::CONNECTED &&
         recv_buffer_offset_ < recv_buffer_.size()) {
    const uint8_t *read_ptr = recv_buffer_.data() + recv_buffer_offset_;
    size_t available = recv_buffer_.size() - recv_buffer_offset_;

    const void *delim = std::memchr(read_ptr, protocol::MESSAGE_DELIMITER, available);
    if (!delim) {
      if (available > protocol::MAX_MESSAGE_SIZE) {
        LOG_NET_WARN("unterminated frame exceeds {} bytes, disconnecting peer={}",
                     protocol::MAX_MESSAGE_SIZE, id_);
        post_disconnect();
      }
      return;
    }

    size_t frame_len = static_cast<const uint8_t *>(delim) - read_ptr;
    recv_buffer_offset_ += frame_len + 1;

    if (frame_len > protocol::MAX_MESSAGE_SIZE) {
      LOG_NET_WARN("frame of {} bytes exceeds {} bytes, disconnecting peer={}",
                   frame_len, protocol::MAX_MESSAGE_SIZE, id_);
      post_disconnect();
      return;
    }

    // Tolerate CRLF
    if (frame_len > 0 && read_ptr[frame_len - 1] == '\r') {
      --frame_len;
    }
    if (frame_len == 0) {
      continue;
    }

    process_frame(reinterpret_cast<const char *>(read_ptr), frame_len);
  }

  if (recv_buffer_offset_ == recv_buffer_.size()) {
    recv_buffer_.clear();
    recv_buffer_offset_ = 0;
  }
}

void Peer::process_frame(const char *data, size_t len) {
  auto msg = message::Parse(std::string_view(data, len));
  if (!msg) {
    stats_.messages_dropped.fetch_add(1, std::memory_order_relaxed);
    LOG_NET_WARN("dropping malformed message ({} bytes) from peer={} ({})", len,
                 id_, ToString());
    return;
  }

  stats_.messages_received.fetch_add(1, std::memory_order_relaxed);
  LOG_NET_TRACE("received {} from peer={}", message::MessageName(*msg), id_);

  if (message_handler_) {
    message_handler_(shared_from_this(), std::move(*msg));
  }
}

} // namespace network
} // namespace relaychain
