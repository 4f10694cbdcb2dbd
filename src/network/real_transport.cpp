// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#include "network/real_transport.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <cassert>

namespace relaychain {
namespace network {

// ============================================================================
// RealTransportConnection
// ============================================================================

#ifdef RELAYCHAIN_TESTS
std::atomic<size_t> RealTransportConnection::send_queue_limit_override_bytes_{0};
#endif

namespace {

// Best-effort socket tuning; failures are ignored
void apply_socket_options(boost::asio::ip::tcp::socket &socket) {
  boost::system::error_code ec;
  socket.set_option(boost::asio::ip::tcp::no_delay(true), ec);
  socket.set_option(boost::asio::socket_base::keep_alive(true), ec);
}

} // namespace

TransportConnectionPtr RealTransportConnection::create_outbound(
    boost::asio::io_context &io_context, const std::string &address,
    uint16_t port, ConnectCallback callback) {
  auto conn = std::shared_ptr<RealTransportConnection>(
      new RealTransportConnection(io_context, false));
  // Defer do_connect onto the strand so shared_from_this() is safe
  boost::asio::post(conn->strand_, [conn, address, port, callback]() mutable {
    conn->do_connect(address, port, std::move(callback));
  });
  return conn;
}

TransportConnectionPtr
RealTransportConnection::create_inbound(boost::asio::io_context &io_context,
                                        boost::asio::ip::tcp::socket socket) {
  auto conn = std::shared_ptr<RealTransportConnection>(
      new RealTransportConnection(io_context, true));
  conn->socket_ = std::move(socket);
  conn->open_ = true;

  boost::system::error_code ec;
  auto remote_ep = conn->socket_.remote_endpoint(ec);
  if (ec) {
    LOG_NET_TRACE("failed to get remote endpoint: {}", ec.message());
  } else {
    conn->remote_addr_ = remote_ep.address().to_string();
    conn->remote_port_ = remote_ep.port();
  }

  return conn;
}

RealTransportConnection::RealTransportConnection(
    boost::asio::io_context &io_context, bool is_inbound)
    : io_context_(io_context), socket_(io_context),
      strand_(io_context.get_executor()), is_inbound_(is_inbound),
      read_buf_(RECV_BUFFER_SIZE),
      connect_timer_(std::make_unique<boost::asio::steady_timer>(io_context)) {}

void RealTransportConnection::finish_connect(const ConnectCallback &callback,
                                             bool success) {
  connect_done_ = true;
  if (connect_timer_) {
    (void)connect_timer_->cancel();
  }
  if (!callback) {
    return;
  }
  try {
    callback(success);
  } catch (const std::exception &e) {
    LOG_NET_ERROR("exception in connect callback for {}:{}: {}", remote_addr_,
                  remote_port_, e.what());
  }
}

void RealTransportConnection::do_connect(const std::string &address,
                                         uint16_t port,
                                         ConnectCallback callback) {
  remote_addr_ = address;
  remote_port_ = port;
  connect_done_ = false;

  if (connect_timer_) {
    connect_timer_->expires_after(protocol::DEFAULT_CONNECT_TIMEOUT);
    connect_timer_->async_wait(boost::asio::bind_executor(
        strand_, [this, self = shared_from_this(),
                  callback](const boost::system::error_code &ec) {
          if (ec == boost::asio::error::operation_aborted || connect_done_) {
            return;
          }
          LOG_NET_WARN("connect timeout to {}:{}", remote_addr_, remote_port_);
          boost::system::error_code ignored;
          if (resolver_) {
            resolver_->cancel();
          }
          socket_.cancel(ignored);
          socket_.close(ignored);
          finish_connect(callback, false);
        }));
  }

  resolver_ = std::make_shared<boost::asio::ip::tcp::resolver>(io_context_);
  resolver_->async_resolve(
      address, std::to_string(port),
      boost::asio::bind_executor(
          strand_,
          [this, self = shared_from_this(),
           callback](const boost::system::error_code &ec,
                     boost::asio::ip::tcp::resolver::results_type results) {
            if (connect_done_) {
              return;
            }
            if (ec) {
              LOG_NET_DEBUG("failed to resolve {}: {}", remote_addr_, ec.message());
              finish_connect(callback, false);
              return;
            }

            boost::asio::async_connect(
                socket_, results,
                boost::asio::bind_executor(
                    strand_,
                    [this, self, callback](const boost::system::error_code &ec,
                                           const boost::asio::ip::tcp::endpoint &) {
                      if (connect_done_) {
                        return;
                      }
                      if (ec) {
                        LOG_NET_DEBUG("failed to connect to {}:{}: {}",
                                      remote_addr_, remote_port_, ec.message());
                        finish_connect(callback, false);
                        return;
                      }

                      open_ = true;
                      apply_socket_options(socket_);

                      boost::system::error_code ep_ec;
                      auto ep = socket_.remote_endpoint(ep_ec);
                      if (!ep_ec) {
                        remote_addr_ = ep.address().to_string();
                        remote_port_ = ep.port();
                      }

                      LOG_NET_TRACE("connected to {}:{}", remote_addr_, remote_port_);
                      finish_connect(callback, true);
                    }));
          }));
}

void RealTransportConnection::start() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    if (!self->open_) {
      return;
    }
    self->start_read_impl();
  });
}

void RealTransportConnection::start_read_impl() {
  if (!open_) {
    return;
  }
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif

  // read_buf_ is reused: only one read is outstanding and the handler holds
  // a reference to this connection
  socket_.async_read_some(
      boost::asio::buffer(read_buf_),
      boost::asio::bind_executor(
          strand_, [this, self = shared_from_this()](const boost::system::error_code &ec,
                                                     size_t bytes_transferred) {
            if (!open_) {
              deliver_disconnect_once();
              close_impl();
              return;
            }

            if (ec) {
              if (ec != boost::asio::error::eof &&
                  ec != boost::asio::error::operation_aborted) {
                LOG_NET_DEBUG("read error from {}:{}: {}", remote_addr_,
                              remote_port_, ec.message());
              }
              deliver_disconnect_once();
              close_impl();
              return;
            }

            if (bytes_transferred > 0 && receive_callback_) {
              std::vector<uint8_t> data(read_buf_.begin(),
                                        read_buf_.begin() + bytes_transferred);
              ReceiveCallback on_receive = receive_callback_;
              try {
                on_receive(data);
              } catch (const std::exception &e) {
                LOG_NET_ERROR("exception in receive callback from {}:{}: {}",
                              remote_addr_, remote_port_, e.what());
              }
              if (!open_) {
                return;
              }
            }

            start_read_impl();
          }));
}

size_t RealTransportConnection::send_queue_limit() const {
#ifdef RELAYCHAIN_TESTS
  size_t limit = send_queue_limit_override_bytes_.load(std::memory_order_relaxed);
  if (limit != 0) {
    return limit;
  }
#endif
  return protocol::DEFAULT_SEND_QUEUE_SIZE;
}

bool RealTransportConnection::send(const std::vector<uint8_t> &data) {
  if (!open_) {
    return false;
  }
  // The frame is copied into the handler: the caller's buffer may be gone
  // when the strand runs
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), frame = data]() mutable {
    if (!open_) {
      return;
    }

    size_t limit = send_queue_limit();
    if (send_queue_bytes_ + frame.size() > limit) {
      LOG_NET_WARN("send queue overflow ({} + {} > {} bytes), disconnecting "
                   "slow-reading peer {}:{}",
                   send_queue_bytes_, frame.size(), limit, remote_addr_,
                   remote_port_);
      deliver_disconnect_once();
      close_impl();
      return;
    }

    send_queue_bytes_ += frame.size();
    send_queue_.push_back(std::move(frame));

    if (in_flight_ == 0) {
      do_write_impl();
    }
  });
  return true;
}

void RealTransportConnection::do_write_impl() {
  if (!open_ || send_queue_.empty()) {
    return;
  }
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif

  // Gossip produces bursts of small frames; flush them with one write
  std::vector<boost::asio::const_buffer> buffers;
  in_flight_ = std::min(send_queue_.size(), MAX_WRITE_BATCH);
  buffers.reserve(in_flight_);
  for (size_t i = 0; i < in_flight_; ++i) {
    buffers.push_back(boost::asio::buffer(send_queue_[i]));
  }

  boost::asio::async_write(
      socket_, buffers,
      boost::asio::bind_executor(
          strand_, [this, self = shared_from_this()](const boost::system::error_code &ec,
                                                     size_t bytes_written) {
            if (!open_) {
              return;
            }

            if (ec) {
              LOG_NET_DEBUG("write error to {}:{}: {}", remote_addr_,
                            remote_port_, ec.message());
              deliver_disconnect_once();
              close_impl();
              return;
            }

            send_queue_.erase(send_queue_.begin(),
                              send_queue_.begin() + static_cast<std::ptrdiff_t>(in_flight_));
            send_queue_bytes_ -= bytes_written;
            in_flight_ = 0;
            do_write_impl();
          }));
}

void RealTransportConnection::deliver_disconnect_once() {
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif
  if (disconnect_delivered_) {
    return;
  }
  disconnect_delivered_ = true;

  DisconnectCallback saved_disconnect_cb = std::move(disconnect_callback_);
  if (saved_disconnect_cb) {
    // Post to io_context (not strand) to avoid re-entering strand
    boost::asio::post(io_context_, [cb = std::move(saved_disconnect_cb)]() {
      try {
        cb();
      } catch (const std::exception &e) {
        LOG_NET_ERROR("exception in disconnect callback: {}", e.what());
      }
    });
  }
}

void RealTransportConnection::close() {
  boost::asio::dispatch(strand_, [this, self = shared_from_this()]() {
    close_impl();
  });
}

void RealTransportConnection::close_impl() {
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif
  if (!open_.exchange(false)) {
    return;
  }

  // Cancel outstanding I/O so pending handlers complete with
  // operation_aborted and release their shared_ptr to this object
  {
    boost::asio::ip::tcp::socket socket_to_cancel(std::move(socket_));
    boost::system::error_code ec;
    socket_to_cancel.cancel(ec);
    socket_to_cancel.close(ec);
  }

  receive_callback_ = {};
  disconnect_callback_ = {};

  // Destroy the timer here while the io_context is still alive
  {
    auto timer_to_destroy = std::move(connect_timer_);
    if (timer_to_destroy) {
      (void)timer_to_destroy->cancel();
    }
  }
  resolver_.reset();

  // A cancelled write may still reference the in-flight frames; they are
  // released with the connection
  if (in_flight_ == 0) {
    send_queue_.clear();
  }
  send_queue_bytes_ = 0;
}

bool RealTransportConnection::is_open() const { return open_; }

#ifdef RELAYCHAIN_TESTS
void RealTransportConnection::SetSendQueueLimitForTest(size_t bytes) {
  send_queue_limit_override_bytes_.store(bytes, std::memory_order_relaxed);
}

void RealTransportConnection::ResetSendQueueLimitForTest() {
  send_queue_limit_override_bytes_.store(0, std::memory_order_relaxed);
}
#endif

std::string RealTransportConnection::remote_address() const {
  return remote_addr_;
}

uint16_t RealTransportConnection::remote_port() const { return remote_port_; }

void RealTransportConnection::set_receive_callback(ReceiveCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(),
                                  cb = std::move(callback)]() mutable {
    receive_callback_ = std::move(cb);
  });
}

void RealTransportConnection::set_disconnect_callback(DisconnectCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(),
                                  cb = std::move(callback)]() mutable {
    disconnect_callback_ = std::move(cb);
  });
}

// ============================================================================
// RealTransport
// ============================================================================

RealTransport::RealTransport(size_t io_threads)
    : io_context_(std::make_unique<boost::asio::io_context>()),
      desired_io_threads_(io_threads == 0 ? 1 : io_threads) {}

RealTransport::~RealTransport() { stop(); }

TransportConnectionPtr RealTransport::connect(const std::string &address,
                                              uint16_t port,
                                              ConnectCallback callback) {
  if (!running_) {
    return {};
  }
  return RealTransportConnection::create_outbound(*io_context_, address, port,
                                                  std::move(callback));
}

bool RealTransport::listen(uint16_t port, AcceptCallback accept_callback) {
  if (acceptor_) {
    LOG_NET_DEBUG("already listening");
    return false;
  }

  accept_callback_ = std::move(accept_callback);

  using tcp = boost::asio::ip::tcp;
  acceptor_ = std::make_unique<tcp::acceptor>(*io_context_);

  // Dual-stack first (IPv6 with v6_only=false), IPv4-only as fallback
  auto try_bind = [&](const tcp &proto, bool dual_stack,
                      boost::system::error_code &ec) {
    acceptor_->open(proto, ec);
    if (ec) return;
    if (dual_stack) {
      acceptor_->set_option(boost::asio::ip::v6_only(false), ec);
      if (ec) return;
    }
    acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
    if (ec) return;
    acceptor_->bind(tcp::endpoint(proto, port), ec);
    if (ec) return;
    acceptor_->listen(boost::asio::socket_base::max_listen_connections, ec);
  };

  boost::system::error_code ec;
  try_bind(tcp::v6(), true, ec);
  if (ec) {
    boost::system::error_code ignored;
    acceptor_->close(ignored);
    ec.clear();
    try_bind(tcp::v4(), false, ec);
  }

  if (ec) {
    LOG_NET_ERROR("failed to listen on port {}: {}", port, ec.message());
    boost::system::error_code ignored;
    acceptor_->close(ignored);
    acceptor_.reset();
    accept_callback_ = {};
    return false;
  }

  boost::system::error_code ep_ec;
  auto ep = acceptor_->local_endpoint(ep_ec);
  last_listen_port_ = ep_ec ? port : ep.port();

  LOG_NET_INFO("listening on port {}", last_listen_port_);
  start_accept();
  return true;
}

void RealTransport::start_accept() {
  if (!acceptor_) {
    return;
  }
  // stop_listening()/stop() cancel the pending accept before destruction
  acceptor_->async_accept([this](const boost::system::error_code &ec,
                                 boost::asio::ip::tcp::socket socket) {
    handle_accept(ec, std::move(socket));
  });
}

void RealTransport::handle_accept(const boost::system::error_code &ec,
                                  boost::asio::ip::tcp::socket socket) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      LOG_NET_DEBUG("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }

  apply_socket_options(socket);

  auto conn = RealTransportConnection::create_inbound(*io_context_, std::move(socket));
  LOG_NET_DEBUG("connection from {}:{} accepted", conn->remote_address(),
                conn->remote_port());

  if (accept_callback_) {
    try {
      accept_callback_(conn);
    } catch (const std::exception &e) {
      LOG_NET_ERROR("exception in accept callback: {}", e.what());
    }
  }

  start_accept();
}

void RealTransport::stop_listening() {
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  last_listen_port_ = 0;
  accept_callback_ = {};
}

void RealTransport::run() {
  if (running_.exchange(true)) {
    return;
  }
  io_context_->restart();
  work_guard_ = std::make_unique<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(*io_context_));
  for (size_t i = 0; i < desired_io_threads_; i++) {
    io_threads_.emplace_back([this]() { io_context_->run(); });
  }
}

void RealTransport::stop() {
  running_.store(false);

  // No logging here: called from the destructor, the logger may be gone
  stop_listening();

  work_guard_.reset();
  if (io_context_) {
    io_context_->stop();
  }

  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
}

} // namespace network
} // namespace relaychain
