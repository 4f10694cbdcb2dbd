// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/real_transport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

using namespace relaychain::network;

namespace {

// Bind an ephemeral port and report what the OS assigned (0 on failure)
uint16_t listen_ephemeral(RealTransport& t, AcceptCallback accept_cb) {
    if (!t.listen(0, std::move(accept_cb))) {
        return 0;
    }
    return t.listening_port();
}

} // namespace

TEST_CASE("RealTransport lifecycle is idempotent", "[network][transport][real]") {
    RealTransport t(1);

    CHECK_FALSE(t.is_running());

    // stop() without run() should be safe
    t.stop();

    t.run();
    CHECK(t.is_running());
    t.run();
    CHECK(t.is_running());

    t.stop();
    t.stop();
    CHECK_FALSE(t.is_running());

    // Can be started again after stop
    t.run();
    CHECK(t.is_running());
    t.stop();
}

TEST_CASE("RealTransport refuses connect when not running", "[network][transport][real]") {
    RealTransport t(1);
    bool called = false;
    auto conn = t.connect("127.0.0.1", 6001, [&](bool) { called = true; });
    CHECK(conn == nullptr);
    CHECK_FALSE(called);
}

TEST_CASE("RealTransport listening_port returns bound ephemeral port", "[network][transport][real][listen]") {
    RealTransport t(1);

    uint16_t port = listen_ephemeral(t, [](TransportConnectionPtr) {});
    if (port == 0) {
        WARN("Skipping: unable to bind ephemeral port");
        t.stop();
        return;
    }
    CHECK(port > 0);

    t.stop_listening();
    CHECK(t.listening_port() == 0);
    t.stop();
}

TEST_CASE("RealTransport delivers newline-framed text both ways", "[network][transport][real]") {
    RealTransport server(1);
    RealTransport client(1);

    std::mutex m;
    std::condition_variable cv;
    TransportConnectionPtr inbound_conn;
    bool accepted = false;
    bool connected = false;
    std::string client_received;

    auto accept_cb = [&](TransportConnectionPtr c) {
        {
            std::lock_guard<std::mutex> lk(m);
            inbound_conn = c;
            accepted = true;
        }
        // Echo server
        std::weak_ptr<TransportConnection> weak = c;
        c->set_receive_callback([weak](const std::vector<uint8_t>& data) {
            if (auto self = weak.lock()) self->send(data);
        });
        c->start();
        cv.notify_all();
    };

    uint16_t port = listen_ephemeral(server, accept_cb);
    if (port == 0) {
        WARN("Skipping: unable to bind ephemeral port");
        return;
    }

    server.run();
    client.run();

    TransportConnectionPtr client_conn;
    client_conn = client.connect("127.0.0.1", port, [&](bool ok) {
        {
            std::lock_guard<std::mutex> lk(m);
            connected = ok;
        }
        cv.notify_all();
    });
    REQUIRE(client_conn);

    client_conn->set_receive_callback([&](const std::vector<uint8_t>& data) {
        {
            std::lock_guard<std::mutex> lk(m);
            client_received.append(data.begin(), data.end());
        }
        cv.notify_all();
    });

    {
        std::unique_lock<std::mutex> lk(m);
        cv.wait_for(lk, std::chrono::seconds(3), [&] { return accepted && connected; });
    }
    REQUIRE(accepted);
    REQUIRE(connected);
    client_conn->start();

    CHECK_FALSE(client_conn->remote_address().empty());
    CHECK(client_conn->remote_port() == port);
    CHECK_FALSE(client_conn->is_inbound());
    CHECK(inbound_conn->is_inbound());

    const std::string frames = "{\"type\":0}\n{\"type\":1}\n";
    CHECK(client_conn->send(std::vector<uint8_t>(frames.begin(), frames.end())));

    {
        std::unique_lock<std::mutex> lk(m);
        cv.wait_for(lk, std::chrono::seconds(3), [&] { return client_received.size() >= frames.size(); });
    }
    {
        std::lock_guard<std::mutex> lk(m);
        CHECK(client_received == frames);
    }

    // A burst of small frames spans several gathered writes and keeps its order
    std::string burst;
    for (int i = 0; i < 500; ++i) {
        std::string line = "{\"n\":" + std::to_string(i) + "}\n";
        burst += line;
        REQUIRE(client_conn->send(std::vector<uint8_t>(line.begin(), line.end())));
    }
    {
        std::unique_lock<std::mutex> lk(m);
        cv.wait_for(lk, std::chrono::seconds(5),
                    [&] { return client_received.size() >= frames.size() + burst.size(); });
        CHECK(client_received == frames + burst);
    }

    // Close is async via the strand; sends fail once it lands
    client_conn->close();
    for (int i = 0; i < 50 && client_conn->is_open(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    CHECK_FALSE(client_conn->send(std::vector<uint8_t>{'x'}));

    client.stop();
    server.stop();
}

TEST_CASE("RealTransport reports connect failure to a closed port", "[network][transport][real]") {
    // Find a port that is free right now
    uint16_t port = 0;
    {
        RealTransport scratch(1);
        port = listen_ephemeral(scratch, [](TransportConnectionPtr) {});
        scratch.stop();
    }
    if (port == 0) {
        WARN("Skipping: unable to bind ephemeral port");
        return;
    }

    RealTransport t(1);
    t.run();

    std::mutex m;
    std::condition_variable cv;
    bool done = false;
    bool ok = true;

    auto conn = t.connect("127.0.0.1", port, [&](bool success) {
        std::lock_guard<std::mutex> lk(m);
        ok = success;
        done = true;
        cv.notify_all();
    });
    REQUIRE(conn);

    {
        std::unique_lock<std::mutex> lk(m);
        REQUIRE(cv.wait_for(lk, std::chrono::seconds(5), [&] { return done; }));
    }
    CHECK_FALSE(ok);
    t.stop();
}

TEST_CASE("RealTransport disconnects when the send queue overflows", "[network][transport][real][dos]") {
    RealTransport server(1);
    RealTransport client(1);

    std::mutex m;
    std::condition_variable cv;
    TransportConnectionPtr inbound_conn;
    std::atomic<bool> disconnected{false};

    // Accept but never read: the peer's kernel buffers fill and our queue grows
    uint16_t port = listen_ephemeral(server, [&](TransportConnectionPtr c) {
        std::lock_guard<std::mutex> lk(m);
        inbound_conn = c;
        cv.notify_all();
    });
    if (port == 0) {
        WARN("Skipping: unable to bind ephemeral port");
        return;
    }
    server.run();
    client.run();

    RealTransportConnection::SetSendQueueLimitForTest(4096);

    bool connected = false;
    auto conn = client.connect("127.0.0.1", port, [&](bool ok) {
        std::lock_guard<std::mutex> lk(m);
        connected = ok;
        cv.notify_all();
    });
    REQUIRE(conn);
    conn->set_disconnect_callback([&]() {
        disconnected = true;
        cv.notify_all();
    });
    {
        std::unique_lock<std::mutex> lk(m);
        cv.wait_for(lk, std::chrono::seconds(3), [&] { return connected && inbound_conn; });
    }
    REQUIRE(connected);
    conn->start();

    std::vector<uint8_t> chunk(64 * 1024, 'a');
    for (int i = 0; i < 2000 && !disconnected; ++i) {
        if (!conn->send(chunk)) break;
    }
    {
        std::unique_lock<std::mutex> lk(m);
        cv.wait_for(lk, std::chrono::seconds(5), [&] { return disconnected.load(); });
    }
    CHECK(disconnected);

    RealTransportConnection::ResetSendQueueLimitForTest();
    client.stop();
    server.stop();
}
