// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

/**
 * HTTP control surface - Boost.Beast
 *
 * One acceptor and one session object per TCP connection, all driven by a
 * private io_context on a dedicated thread. Requests are read with a bounded
 * body, routed through HandleRequest() and answered with a JSON body.
 * Connections honour HTTP/1.1 keep-alive and are dropped after
 * SESSION_TIMEOUT of inactivity.
 */

#include "network/http_server.hpp"
#include "chain/block.hpp"
#include "chain/chainstate_manager.hpp"
#include "network/network_manager.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>

namespace relaychain {
namespace http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;
using json = nlohmann::json;

namespace {

constexpr auto SESSION_TIMEOUT = std::chrono::seconds(30);

HttpResponse Error(unsigned status, const std::string &message) {
  return HttpResponse{status, util::JsonError(message)};
}

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket &&socket, HttpServer &server)
      : stream_(std::move(socket)), server_(server) {}

  void Run() {
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpSession::DoRead, shared_from_this()));
  }

private:
  void DoRead() {
    parser_.emplace();
    // Mined payloads may be as large as a peer frame
    parser_->body_limit(protocol::MAX_MESSAGE_SIZE);
    stream_.expires_after(SESSION_TIMEOUT);
    bhttp::async_read(stream_, buffer_, *parser_,
                      beast::bind_front_handler(&HttpSession::OnRead, shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t) {
    if (ec == bhttp::error::end_of_stream) {
      DoClose();
      return;
    }
    if (ec) {
      if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
        LOG_HTTP_DEBUG("HTTP read failed: {}", ec.message());
      }
      return;
    }

    const auto &req = parser_->get();
    std::string method(req.method_string());
    std::string target(req.target());
    LOG_HTTP_DEBUG("HTTP {} {}", method, target);

    HttpResponse result = server_.HandleRequest(method, target, req.body());

    auto res = std::make_shared<bhttp::response<bhttp::string_body>>(
        static_cast<bhttp::status>(result.status), req.version());
    res->set(bhttp::field::server, "relaychain");
    res->set(bhttp::field::content_type, "application/json");
    res->keep_alive(req.keep_alive());
    res->body() = std::move(result.body);
    res->prepare_payload();

    response_ = res;
    bhttp::async_write(stream_, *res,
                       beast::bind_front_handler(&HttpSession::OnWrite, shared_from_this(),
                                                 res->need_eof()));
  }

  void OnWrite(bool close, beast::error_code ec, std::size_t) {
    response_.reset();
    if (ec) {
      LOG_HTTP_DEBUG("HTTP write failed: {}", ec.message());
      return;
    }
    if (close) {
      DoClose();
      return;
    }
    DoRead();
  }

  void DoClose() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::optional<bhttp::request_parser<bhttp::string_body>> parser_;
  std::shared_ptr<void> response_;
  HttpServer &server_;
};

} // anonymous namespace

HttpServer::HttpServer(uint16_t port, validation::ChainstateManager &chainstate,
                       network::NetworkManager &network_manager)
    : port_(port), chainstate_(chainstate), network_manager_(network_manager) {
  RegisterHandlers();
}

HttpServer::~HttpServer() { Stop(); }

void HttpServer::RegisterHandlers() {
  handlers_["GET /blocks"] = [this](const auto &b) { return HandleGetBlocks(b); };
  handlers_["POST /mineBlock"] = [this](const auto &b) { return HandleMineBlock(b); };
  handlers_["GET /peers"] = [this](const auto &b) { return HandleGetPeers(b); };
  handlers_["POST /addPeer"] = [this](const auto &b) { return HandleAddPeer(b); };
}

bool HttpServer::Start() {
  if (running_) {
    return true;
  }

  beast::error_code ec;
  auto acceptor = std::make_unique<tcp::acceptor>(io_context_);
  tcp::endpoint endpoint(tcp::v4(), port_);

  acceptor->open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor->set_option(net::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor->bind(endpoint, ec);
  }
  if (!ec) {
    acceptor->listen(net::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    LOG_HTTP_ERROR("Failed to bind HTTP server to port {}: {}", port_, ec.message());
    return false;
  }

  bound_port_ = acceptor->local_endpoint(ec).port();
  acceptor_ = std::move(acceptor);

  // restart() so Start() after Stop() works
  io_context_.restart();
  running_ = true;
  DoAccept();

  server_thread_ = std::thread([this]() {
    LOG_HTTP_DEBUG("HTTP server thread started");
    while (true) {
      try {
        io_context_.run();
        break;
      } catch (const std::exception &e) {
        LOG_HTTP_ERROR("HTTP server loop error: {}", e.what());
      }
    }
    LOG_HTTP_DEBUG("HTTP server thread exiting");
  });

  LOG_HTTP_INFO("HTTP server listening on port {}", bound_port_);
  return true;
}

void HttpServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  io_context_.stop();
  if (server_thread_.joinable()) {
    server_thread_.join();
  }

  // Reactor is idle; pending handlers are released with the acceptor
  if (acceptor_) {
    beast::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  LOG_HTTP_INFO("HTTP server stopped");
}

void HttpServer::DoAccept() {
  acceptor_->async_accept(net::make_strand(io_context_),
                          [this](beast::error_code ec, tcp::socket socket) {
                            if (ec) {
                              if (ec != net::error::operation_aborted) {
                                LOG_HTTP_WARN("HTTP accept failed: {}", ec.message());
                              }
                            } else {
                              std::make_shared<HttpSession>(std::move(socket), *this)->Run();
                            }
                            if (running_ && acceptor_ && acceptor_->is_open()) {
                              DoAccept();
                            }
                          });
}

HttpResponse HttpServer::HandleRequest(const std::string &method, const std::string &target,
                                       const std::string &body) {
  // Query strings play no part in routing
  std::string path = target.substr(0, target.find('?'));

  auto it = handlers_.find(method + " " + path);
  if (it == handlers_.end()) {
    LOG_HTTP_DEBUG("No route for {} {}", method, path);
    return Error(404, "Not found: " + method + " " + path);
  }

  try {
    return it->second(body);
  } catch (const std::exception &e) {
    LOG_HTTP_ERROR("HTTP handler {} {} failed: {}", method, path, e.what());
    return Error(500, e.what());
  }
}

HttpResponse HttpServer::HandleGetBlocks(const std::string &) {
  json j = chainstate_.GetBlocks();
  return HttpResponse{200, j.dump()};
}

HttpResponse HttpServer::HandleMineBlock(const std::string &body) {
  json request = json::parse(body, nullptr, false);
  if (request.is_discarded() || !request.is_object()) {
    return Error(400, "Request body must be a JSON object");
  }
  auto data = request.find("data");
  if (data == request.end()) {
    return Error(400, "Missing 'data' field");
  }

  std::string payload = data->is_string() ? data->get<std::string>() : data->dump();
  chain::Block block = chainstate_.MineBlock(payload);
  LOG_HTTP_INFO("Mined block {} via HTTP", block.index);

  json j = block;
  return HttpResponse{200, j.dump()};
}

HttpResponse HttpServer::HandleGetPeers(const std::string &) {
  json j = network_manager_.peer_addresses();
  return HttpResponse{200, j.dump()};
}

HttpResponse HttpServer::HandleAddPeer(const std::string &body) {
  json request = json::parse(body, nullptr, false);
  if (request.is_discarded() || !request.is_object()) {
    return Error(400, "Request body must be a JSON object");
  }
  auto peer = request.find("peer");
  if (peer == request.end() || !peer->is_string()) {
    return Error(400, "Missing 'peer' field");
  }

  auto address = util::ParsePeerAddress(peer->get<std::string>());
  if (!address) {
    return Error(400, "Invalid peer address: " + peer->get<std::string>());
  }

  auto result = network_manager_.connect_to(address->host, address->port);
  switch (result) {
  case network::ConnectionResult::Success:
    LOG_HTTP_INFO("Connecting to peer {} via HTTP", address->ToString());
    return HttpResponse{200, util::JsonSuccess("connecting")};
  case network::ConnectionResult::NotRunning:
    return Error(503, "Network is not running");
  case network::ConnectionResult::TransportFailed:
    break;
  }
  return Error(500, std::string("Failed to connect: ") +
                        network::ConnectionResultName(result));
}

} // namespace http
} // namespace relaychain
