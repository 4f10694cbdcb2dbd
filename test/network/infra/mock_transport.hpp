// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace relaychain {
namespace network {

// In-memory connection for unit tests. Two connections can be linked so that
// bytes sent on one arrive at the other's receive callback.
class MockTransportConnection : public TransportConnection,
                                public std::enable_shared_from_this<MockTransportConnection> {
public:
    MockTransportConnection() : open_(true) {}

    // Deliver anything that arrived before the reader was attached
    void start() override {
        started_ = true;
        std::vector<std::vector<uint8_t>> pending;
        pending.swap(pending_);
        for (const auto& data : pending) {
            simulate_receive(data);
        }
    }

    bool send(const std::vector<uint8_t>& data) override {
        std::shared_ptr<MockTransportConnection> remote;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_ || fail_sends_) return false;
            sent_messages_.push_back(data);
            remote = remote_.lock();
        }
        if (remote) {
            remote->simulate_receive(data);
        }
        return true;
    }

    void close() override {
        if (!open_) return;
        open_ = false;
        auto remote = remote_.lock();
        if (disconnect_callback_) {
            auto callback = disconnect_callback_;
            callback();
        }
        if (remote) {
            remote->close();
        }
    }

    bool is_open() const override { return open_; }
    std::string remote_address() const override { return remote_address_; }
    uint16_t remote_port() const override { return remote_port_; }
    bool is_inbound() const override { return is_inbound_; }

    void set_receive_callback(ReceiveCallback callback) override { receive_callback_ = callback; }
    void set_disconnect_callback(DisconnectCallback callback) override { disconnect_callback_ = callback; }

    void set_inbound(bool inbound) { is_inbound_ = inbound; }
    void set_remote(const std::string& address, uint16_t port) {
        remote_address_ = address;
        remote_port_ = port;
    }
    void set_fail_sends(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_sends_ = fail;
    }

    static void link(const std::shared_ptr<MockTransportConnection>& a,
                     const std::shared_ptr<MockTransportConnection>& b) {
        a->remote_ = b;
        b->remote_ = a;
        a->linked_ = true;
        b->linked_ = true;
    }

    void simulate_receive(const std::vector<uint8_t>& data) {
        if (linked_ && !started_) {
            pending_.push_back(data);
            return;
        }
        if (receive_callback_) {
            receive_callback_(data);
        }
    }

    void simulate_receive(const std::string& text) {
        simulate_receive(std::vector<uint8_t>(text.begin(), text.end()));
    }

    // Remote side hung up
    void simulate_disconnect() {
        open_ = false;
        if (disconnect_callback_) {
            auto callback = disconnect_callback_;
            callback();
        }
    }

    std::vector<std::vector<uint8_t>> get_sent_messages() {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_messages_;
    }

    // Sent frames as text, without the trailing newline
    std::vector<std::string> get_sent_lines() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> lines;
        for (const auto& frame : sent_messages_) {
            std::string line(frame.begin(), frame.end());
            if (!line.empty() && line.back() == '\n') line.pop_back();
            lines.push_back(line);
        }
        return lines;
    }

    void clear_sent_messages() {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_messages_.clear();
    }

    size_t sent_message_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_messages_.size();
    }

private:
    bool open_;
    bool is_inbound_ = false;
    bool fail_sends_ = false;
    bool linked_ = false;
    bool started_ = false;
    std::string remote_address_ = "127.0.0.1";
    uint16_t remote_port_ = 6001;
    std::weak_ptr<MockTransportConnection> remote_;
    ReceiveCallback receive_callback_;
    DisconnectCallback disconnect_callback_;
    std::mutex mutex_;
    std::vector<std::vector<uint8_t>> sent_messages_;
    std::vector<std::vector<uint8_t>> pending_;
};

class MockTransport;

// Port -> listening MockTransport; lets nodes in one test dial each other
class MockNetwork {
public:
    void register_listener(uint16_t port, MockTransport* transport) { listeners_[port] = transport; }
    void unregister_listener(uint16_t port) { listeners_.erase(port); }
    MockTransport* find_listener(uint16_t port) const {
        auto it = listeners_.find(port);
        return it == listeners_.end() ? nullptr : it->second;
    }

private:
    std::map<uint16_t, MockTransport*> listeners_;
};

// Transport mock: outbound connects either reach a listener on the shared
// MockNetwork or produce an unlinked connection the test drives by hand.
class MockTransport : public Transport {
public:
    explicit MockTransport(std::shared_ptr<MockNetwork> network = nullptr)
        : network_(std::move(network)) {}

    ~MockTransport() override { stop_listening(); }

    TransportConnectionPtr connect(const std::string& address, uint16_t port,
                                   ConnectCallback callback) override {
        ++connect_attempts_;
        if (fail_connect_ || !running_) {
            return nullptr;
        }

        auto outbound = std::make_shared<MockTransportConnection>();
        outbound->set_inbound(false);
        outbound->set_remote(address, port);
        outbound_.push_back(outbound);

        bool success = !refuse_connect_;
        if (success && network_) {
            MockTransport* listener = network_->find_listener(port);
            if (listener) {
                auto inbound = std::make_shared<MockTransportConnection>();
                inbound->set_inbound(true);
                inbound->set_remote("127.0.0.1", static_cast<uint16_t>(40000 + inbound_port_offset_++));
                MockTransportConnection::link(outbound, inbound);
                listener->simulate_inbound(inbound);
            } else {
                success = false;
            }
        }

        if (callback) {
            callback(success);
        }
        return outbound;
    }

    bool listen(uint16_t port, AcceptCallback accept_callback) override {
        if (fail_listen_) {
            return false;
        }
        accept_callback_ = std::move(accept_callback);
        listen_port_ = port;
        if (network_) {
            network_->register_listener(port, this);
        }
        return true;
    }

    void stop_listening() override {
        if (network_ && listen_port_ != 0) {
            network_->unregister_listener(listen_port_);
        }
        listen_port_ = 0;
        accept_callback_ = nullptr;
    }

    void run() override { running_ = true; }

    void stop() override {
        stop_listening();
        running_ = false;
    }

    bool is_running() const override { return running_; }

    void simulate_inbound(const TransportConnectionPtr& connection) {
        if (accept_callback_) {
            accept_callback_(connection);
        }
    }

    void set_fail_connect(bool fail) { fail_connect_ = fail; }
    void set_refuse_connect(bool refuse) { refuse_connect_ = refuse; }
    void set_fail_listen(bool fail) { fail_listen_ = fail; }

    bool is_listening() const { return listen_port_ != 0; }
    uint16_t listen_port() const { return listen_port_; }
    size_t connect_attempts() const { return connect_attempts_; }
    const std::vector<std::shared_ptr<MockTransportConnection>>& outbound_connections() const {
        return outbound_;
    }

private:
    std::shared_ptr<MockNetwork> network_;
    AcceptCallback accept_callback_;
    uint16_t listen_port_ = 0;
    bool running_ = false;
    bool fail_connect_ = false;
    bool refuse_connect_ = false;
    bool fail_listen_ = false;
    size_t connect_attempts_ = 0;
    int inbound_port_offset_ = 0;
    std::vector<std::shared_ptr<MockTransportConnection>> outbound_;
};

} // namespace network
} // namespace relaychain
