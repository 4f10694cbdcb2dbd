// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace relaychain {
namespace network {

// Byte-stream transport seen by Peer. Implementations:
// - RealTransport: TCP sockets via boost::asio
// - MockTransport: in-memory connections for tests (test/network/infra)

class Transport;
class TransportConnection;
using TransportConnectionPtr = std::shared_ptr<TransportConnection>;

using ConnectCallback = std::function<void(bool success)>;
using ReceiveCallback = std::function<void(const std::vector<uint8_t> &data)>;
using DisconnectCallback = std::function<void()>;
using AcceptCallback = std::function<void(TransportConnectionPtr)>;

// TransportConnection - one open byte stream to a remote node
class TransportConnection {
public:
  virtual ~TransportConnection() = default;

  // Begin delivering received bytes to the receive callback
  virtual void start() = 0;

  // Returns false if the connection is already closed at call time.
  // true only means the send attempt was accepted; a later overflow or write
  // error is reported through the disconnect callback.
  virtual bool send(const std::vector<uint8_t> &data) = 0;

  virtual void close() = 0;
  virtual bool is_open() const = 0;

  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;
  virtual bool is_inbound() const = 0;

  virtual void set_receive_callback(ReceiveCallback callback) = 0;
  virtual void set_disconnect_callback(DisconnectCallback callback) = 0;
};

// Transport - factory for outbound connections and acceptor for inbound ones
class Transport {
public:
  virtual ~Transport() = default;

  // Initiate an outbound connection. callback(success) fires once the connect
  // attempt resolves; the returned object is usable only after success.
  virtual TransportConnectionPtr connect(const std::string &address,
                                         uint16_t port,
                                         ConnectCallback callback) = 0;

  // Start accepting inbound connections (false if the port cannot be bound)
  virtual bool listen(uint16_t port, AcceptCallback accept_callback) = 0;

  virtual void stop_listening() = 0;

  // Start the transport's event loop (non-blocking)
  virtual void run() = 0;

  // Stop listening and the event loop
  virtual void stop() = 0;

  virtual bool is_running() const = 0;
};

} // namespace network
} // namespace relaychain
