// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <memory>
#include <deque>
#include <thread>
#include <vector>

namespace relaychain {
namespace network {

// One TCP connection carrying newline-framed messages. Socket state lives on
// strand_; receive callbacks run there, the disconnect callback is posted to
// the io_context once.
class RealTransportConnection
    : public TransportConnection,
      public std::enable_shared_from_this<RealTransportConnection> {
public:
  // Resolves and dials; callback(success) fires once
  static TransportConnectionPtr create_outbound(boost::asio::io_context &io_context,
                                                const std::string &address, uint16_t port,
                                                ConnectCallback callback);

  static TransportConnectionPtr create_inbound(boost::asio::io_context &io_context,
                                               boost::asio::ip::tcp::socket socket);

  ~RealTransportConnection() override = default;

  RealTransportConnection(const RealTransportConnection &) = delete;
  RealTransportConnection &operator=(const RealTransportConnection &) = delete;

  void start() override;
  bool send(const std::vector<uint8_t> &data) override;
  void close() override;
  bool is_open() const override;
  std::string remote_address() const override;
  uint16_t remote_port() const override;
  bool is_inbound() const override { return is_inbound_; }
  void set_receive_callback(ReceiveCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

#ifdef RELAYCHAIN_TESTS
  // 0 restores protocol::DEFAULT_SEND_QUEUE_SIZE
  static void SetSendQueueLimitForTest(size_t bytes);
  static void ResetSendQueueLimitForTest();
#endif

private:
  RealTransportConnection(boost::asio::io_context &io_context, bool is_inbound);

  void do_connect(const std::string &address, uint16_t port, ConnectCallback callback);
  void finish_connect(const ConnectCallback &callback, bool success);

  // strand_ only
  void start_read_impl();
  void do_write_impl();
  void close_impl();
  void deliver_disconnect_once();

  size_t send_queue_limit() const;

  boost::asio::io_context &io_context_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  bool is_inbound_;

  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;
  bool disconnect_delivered_{false};

  // Frames [0, in_flight_) belong to the current gathered write; push_back
  // keeps their storage in place.
  std::deque<std::vector<uint8_t>> send_queue_;
  size_t send_queue_bytes_{0};
  size_t in_flight_{0};
  static constexpr size_t MAX_WRITE_BATCH = 64;

  static constexpr size_t RECV_BUFFER_SIZE = 64 * 1024;
  std::vector<uint8_t> read_buf_;

  std::unique_ptr<boost::asio::steady_timer> connect_timer_;
  std::atomic<bool> connect_done_{false};
  std::shared_ptr<boost::asio::ip::tcp::resolver> resolver_;

#ifdef RELAYCHAIN_TESTS
  static std::atomic<size_t> send_queue_limit_override_bytes_;
#endif

  std::atomic<bool> open_{false};
  std::string remote_addr_;
  uint16_t remote_port_{0};
};

// TCP transport with its own io_context and I/O thread(s). Peers post what
// they receive onto the node reactor.
class RealTransport : public Transport {
public:
  explicit RealTransport(size_t io_threads = 1);
  ~RealTransport() override;

  RealTransport(const RealTransport &) = delete;
  RealTransport &operator=(const RealTransport &) = delete;

  TransportConnectionPtr connect(const std::string &address, uint16_t port,
                                 ConnectCallback callback) override;
  bool listen(uint16_t port, AcceptCallback accept_callback) override;
  void stop_listening() override;
  void run() override;
  void stop() override;
  bool is_running() const override { return running_; }

  // Port actually bound (resolves port 0); 0 when not listening
  uint16_t listening_port() const { return last_listen_port_; }

private:
  void start_accept();
  void handle_accept(const boost::system::error_code &ec,
                     boost::asio::ip::tcp::socket socket);

  // Destroyed last, after the I/O threads are joined
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> running_{false};
  size_t desired_io_threads_{1};

  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  AcceptCallback accept_callback_;
  uint16_t last_listen_port_{0};
};

} // namespace network
} // namespace relaychain
