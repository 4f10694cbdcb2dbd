// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <thread>

namespace relaychain {

namespace network {
class NetworkManager;
}
namespace validation {
class ChainstateManager;
}

namespace http {

// Result of one control-surface request
struct HttpResponse {
  unsigned status{200};
  std::string body;
};

/**
 * HTTP control surface for the local operator (Boost.Beast, HTTP/1.1)
 *
 *   GET  /blocks     -> 200 [block, ...]
 *   POST /mineBlock  {"data": <value>}         -> 200 <mined block>
 *   GET  /peers      -> 200 ["address:port", ...]
 *   POST /addPeer    {"peer": "<host:port>"}   -> 200 {"result":"connecting"}
 *
 * Errors: 400 malformed body, 404 unknown route, 503 network not running,
 * 500 handler failure. Every error body is {"error": "<message>"}.
 *
 * Runs on its own io_context and thread; chain and network access go through
 * the thread-safe ChainstateManager / NetworkManager interfaces.
 */
class HttpServer {
public:
  using RouteHandler = std::function<HttpResponse(const std::string &body)>;

  // port 0 binds an ephemeral port (see port())
  HttpServer(uint16_t port, validation::ChainstateManager &chainstate,
             network::NetworkManager &network_manager);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  bool Start();
  void Stop();
  bool IsRunning() const { return running_; }

  // Bound port once started, else the configured one
  uint16_t port() const { return bound_port_ != 0 ? bound_port_ : port_; }

  // Route one request (transport independent)
  HttpResponse HandleRequest(const std::string &method, const std::string &target,
                             const std::string &body);

private:
  void RegisterHandlers();
  void DoAccept();

  HttpResponse HandleGetBlocks(const std::string &body);
  HttpResponse HandleMineBlock(const std::string &body);
  HttpResponse HandleGetPeers(const std::string &body);
  HttpResponse HandleAddPeer(const std::string &body);

  uint16_t port_;
  uint16_t bound_port_{0};
  validation::ChainstateManager &chainstate_;
  network::NetworkManager &network_manager_;

  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::thread server_thread_;
  std::atomic<bool> running_{false};

  // Keyed "METHOD /path"
  std::map<std::string, RouteHandler> handlers_;
};

} // namespace http
} // namespace relaychain
