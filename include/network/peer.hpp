// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include "network/message.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace relaychain {
namespace network {

class Peer;
using PeerPtr = std::shared_ptr<Peer>;

// Peer connection states. There is no handshake: a peer is usable as soon as
// it is CONNECTED.
enum class PeerConnectionState {
  DISCONNECTED,  // Not connected (initial state without a transport, or final)
  CONNECTED,     // Transport open, messages flow
  DISCONNECTING  // Shutting down
};

// Peer connection statistics (atomic: read from HTTP/RPC threads)
struct PeerStats {
  std::atomic<uint64_t> bytes_sent{0};
  std::atomic<uint64_t> bytes_received{0};
  std::atomic<uint64_t> messages_sent{0};
  std::atomic<uint64_t> messages_received{0};
  std::atomic<uint64_t> messages_dropped{0}; // Malformed frames ignored
  std::atomic<int64_t> connected_time{0};      // Unix seconds at start()
};

// Invoked on the io_context for every well-formed message
using MessageHandler = std::function<void(PeerPtr peer, message::Message msg)>;

// Invoked once on the io_context when the peer reaches DISCONNECTED
using PeerDisconnectHandler = std::function<void(PeerPtr peer)>;

// Peer - one connection to a remote node
// Frames outgoing messages ('\n' delimited JSON), reassembles and parses
// incoming ones, and reports lifecycle events to its owner.
//
// Transport callbacks are re-posted onto io_context_, so every handler of this
// peer runs on the networking reactor thread (single flow).
//
// IMPORTANT: Peer is single-use. start() may be called exactly once; after
// disconnect() create a new Peer for any subsequent connection.
class Peer : public std::enable_shared_from_this<Peer> {
private:
  // Passkey idiom: allows make_shared while preventing direct construction
  struct PrivateTag {};

public:
  // Create outbound peer (we dialed target_address:target_port)
  static PeerPtr create_outbound(boost::asio::io_context &io_context,
                                 TransportConnectionPtr connection,
                                 const std::string &target_address,
                                 uint16_t target_port);

  // Create inbound peer (they connected to us)
  static PeerPtr create_inbound(boost::asio::io_context &io_context,
                                TransportConnectionPtr connection);

  Peer(PrivateTag, boost::asio::io_context &io_context,
       TransportConnectionPtr connection, bool is_inbound,
       const std::string &target_address, uint16_t target_port);
  ~Peer();

  Peer(const Peer &) = delete;
  Peer &operator=(const Peer &) = delete;

  // Attach transport callbacks and start receiving
  void start();

  // Thread-safe: posts to io_context when called from another thread
  void disconnect();

  // Frame and send one message. Returns false (and schedules a disconnect) if
  // the transport refused it.
  bool send_message(const message::Message &msg);

  void set_message_handler(MessageHandler handler);
  void set_disconnect_handler(PeerDisconnectHandler handler);

  void set_id(int id) { id_ = id; }
  int id() const { return id_; }

  PeerConnectionState state() const { return state_; }
  bool is_connected() const { return state_ == PeerConnectionState::CONNECTED; }
  bool is_inbound() const { return is_inbound_; }
  const PeerStats &stats() const { return stats_; }

  const std::string &address() const { return address_; }
  uint16_t port() const { return port_; }

  // "address:port" ("[v6]:port" for IPv6)
  std::string ToString() const;

private:
  void do_disconnect();
  void on_disconnect();
  void on_transport_receive(const std::vector<uint8_t> &data);
  void on_transport_disconnect();

  // Split recv_buffer_ into frames and dispatch each one
  void process_received_data();
  void process_frame(const char *data, size_t len);

  // Defer disconnect until the current call stack unwinds
  void post_disconnect();

  boost::asio::io_context &io_context_;
  TransportConnectionPtr connection_;
  bool is_inbound_;
  int id_{-1};

  // Cached so address()/port() still answer after the transport is released
  // Fixed at construction: read from other threads (registry listing)
  const std::string address_;
  const uint16_t port_;

  PeerConnectionState state_;
  std::atomic<bool> started_{false};
  PeerStats stats_;

  MessageHandler message_handler_;
  PeerDisconnectHandler disconnect_handler_;

  // Receive buffer; bytes before recv_buffer_offset_ are already consumed
  std::vector<uint8_t> recv_buffer_;
  size_t recv_buffer_offset_{0};
};

} // namespace network
} // namespace relaychain
