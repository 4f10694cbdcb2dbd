// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "infra/mock_transport.hpp"
#include "network/message.hpp"
#include "network/peer.hpp"
#include "network/protocol.hpp"
#include "network_test_helpers.hpp"
#include "test_chain_helpers.hpp"
#include <boost/asio.hpp>
#include <memory>
#include <vector>

using namespace relaychain;
using namespace relaychain::network;
using relaychain::test::Drain;
using relaychain::test::Frame;

namespace {

struct PeerFixture {
    boost::asio::io_context io;
    std::shared_ptr<MockTransportConnection> conn = std::make_shared<MockTransportConnection>();
    PeerPtr peer;
    std::vector<message::Message> received;
    int disconnects = 0;

    PeerFixture() {
        conn->set_remote("10.0.0.7", 6005);
        peer = Peer::create_outbound(io, conn, "10.0.0.7", 6005);
        peer->set_message_handler([this](PeerPtr, message::Message msg) {
            received.push_back(std::move(msg));
        });
        peer->set_disconnect_handler([this](PeerPtr) { ++disconnects; });
        peer->start();
        Drain(io);
    }

    ~PeerFixture() {
        peer->disconnect();
        Drain(io);
    }
};

} // namespace

TEST_CASE("Peer - initial state", "[peer]") {
    boost::asio::io_context io;

    SECTION("outbound") {
        auto conn = std::make_shared<MockTransportConnection>();
        conn->set_remote("10.0.0.7", 6005);
        auto peer = Peer::create_outbound(io, conn, "10.0.0.7", 6005);
        CHECK(peer->is_connected());
        CHECK_FALSE(peer->is_inbound());
        CHECK(peer->id() == -1);
        CHECK(peer->ToString() == "10.0.0.7:6005");
        peer->disconnect();
        Drain(io);
    }

    SECTION("inbound takes the remote endpoint") {
        auto conn = std::make_shared<MockTransportConnection>();
        conn->set_inbound(true);
        conn->set_remote("192.168.1.20", 51234);
        auto peer = Peer::create_inbound(io, conn);
        CHECK(peer->is_inbound());
        CHECK(peer->address() == "192.168.1.20");
        CHECK(peer->port() == 51234);
        peer->disconnect();
        Drain(io);
    }

    SECTION("IPv6 address formatting") {
        auto conn = std::make_shared<MockTransportConnection>();
        conn->set_remote("::1", 6001);
        auto peer = Peer::create_outbound(io, conn, "::1", 6001);
        CHECK(peer->ToString() == "[::1]:6001");
        peer->disconnect();
        Drain(io);
    }

    SECTION("closed transport starts disconnected") {
        auto conn = std::make_shared<MockTransportConnection>();
        conn->close();
        auto peer = Peer::create_outbound(io, conn, "10.0.0.7", 6005);
        CHECK(peer->state() == PeerConnectionState::DISCONNECTED);
        peer->start();
        CHECK_FALSE(peer->send_message(message::QueryLatestMessage{}));
    }
}

TEST_CASE("Peer - sending frames", "[peer][messages]") {
    PeerFixture f;

    SECTION("each message is one newline-terminated JSON line") {
        REQUIRE(f.peer->send_message(message::QueryLatestMessage{}));
        REQUIRE(f.peer->send_message(message::ChainResponseMessage{test::BuildChain(2)}));

        auto frames = f.conn->get_sent_messages();
        REQUIRE(frames.size() == 2);
        for (const auto& frame : frames) {
            REQUIRE_FALSE(frame.empty());
            CHECK(frame.back() == '\n');
        }

        auto lines = f.conn->get_sent_lines();
        auto first = message::Parse(lines[0]);
        REQUIRE(first.has_value());
        CHECK(std::holds_alternative<message::QueryLatestMessage>(*first));
        auto second = message::Parse(lines[1]);
        REQUIRE(second.has_value());
        CHECK(std::get<message::ChainResponseMessage>(*second).blocks.size() == 2);

        CHECK(f.peer->stats().messages_sent.load() == 2);
    }

    SECTION("failed send disconnects the peer") {
        f.conn->set_fail_sends(true);
        CHECK_FALSE(f.peer->send_message(message::QueryAllMessage{}));
        Drain(f.io);
        CHECK(f.peer->state() == PeerConnectionState::DISCONNECTED);
        CHECK(f.disconnects == 1);
    }

    SECTION("cannot send after disconnect") {
        f.peer->disconnect();
        Drain(f.io);
        size_t before = f.conn->sent_message_count();
        CHECK_FALSE(f.peer->send_message(message::QueryAllMessage{}));
        CHECK(f.conn->sent_message_count() == before);
    }
}

TEST_CASE("Peer - receiving frames", "[peer][messages]") {
    PeerFixture f;

    SECTION("complete frame") {
        f.conn->simulate_receive(Frame(message::QueryAllMessage{}));
        Drain(f.io);
        REQUIRE(f.received.size() == 1);
        CHECK(std::holds_alternative<message::QueryAllMessage>(f.received[0]));
        CHECK(f.peer->stats().messages_received.load() == 1);
    }

    SECTION("frame split across deliveries") {
        std::string text = Frame(message::ChainResponseMessage{test::BuildChain(3)});
        size_t cut = text.size() / 3;
        f.conn->simulate_receive(text.substr(0, cut));
        Drain(f.io);
        CHECK(f.received.empty());
        f.conn->simulate_receive(text.substr(cut, cut));
        Drain(f.io);
        CHECK(f.received.empty());
        f.conn->simulate_receive(text.substr(2 * cut));
        Drain(f.io);
        REQUIRE(f.received.size() == 1);
        CHECK(std::get<message::ChainResponseMessage>(f.received[0]).blocks == test::BuildChain(3));
    }

    SECTION("several frames in one delivery, in order") {
        f.conn->simulate_receive(Frame(message::QueryLatestMessage{}) +
                                 Frame(message::QueryAllMessage{}) +
                                 Frame(message::QueryLatestMessage{}));
        Drain(f.io);
        REQUIRE(f.received.size() == 3);
        CHECK(std::holds_alternative<message::QueryLatestMessage>(f.received[0]));
        CHECK(std::holds_alternative<message::QueryAllMessage>(f.received[1]));
        CHECK(std::holds_alternative<message::QueryLatestMessage>(f.received[2]));
    }

    SECTION("CRLF and blank lines are tolerated") {
        f.conn->simulate_receive(std::string("\n\r\n{\"type\":1}\r\n\n"));
        Drain(f.io);
        REQUIRE(f.received.size() == 1);
        CHECK(std::holds_alternative<message::QueryAllMessage>(f.received[0]));
    }

    SECTION("malformed frame is dropped, connection kept") {
        f.conn->simulate_receive(std::string("this is not json\n{\"type\":7}\n"));
        f.conn->simulate_receive(Frame(message::QueryLatestMessage{}));
        Drain(f.io);
        CHECK(f.peer->is_connected());
        CHECK(f.disconnects == 0);
        CHECK(f.peer->stats().messages_dropped.load() == 2);
        REQUIRE(f.received.size() == 1);
        CHECK(std::holds_alternative<message::QueryLatestMessage>(f.received[0]));
    }

    SECTION("unterminated data beyond the frame limit disconnects") {
        std::vector<uint8_t> big(protocol::MAX_MESSAGE_SIZE + 1, 'a');
        f.conn->simulate_receive(big);
        Drain(f.io);
        CHECK(f.peer->state() == PeerConnectionState::DISCONNECTED);
        CHECK(f.disconnects == 1);
        CHECK(f.received.empty());
    }
}

TEST_CASE("Peer - lifecycle", "[peer][lifecycle]") {
    PeerFixture f;

    SECTION("remote close runs the disconnect handler once") {
        f.conn->simulate_disconnect();
        Drain(f.io);
        CHECK(f.peer->state() == PeerConnectionState::DISCONNECTED);
        CHECK(f.disconnects == 1);

        f.peer->disconnect();
        Drain(f.io);
        CHECK(f.disconnects == 1);
    }

    SECTION("local disconnect closes the transport") {
        f.peer->disconnect();
        Drain(f.io);
        CHECK_FALSE(f.conn->is_open());
        CHECK(f.peer->state() == PeerConnectionState::DISCONNECTED);
        CHECK(f.disconnects == 1);
    }

    SECTION("no messages are delivered after disconnect") {
        f.peer->disconnect();
        Drain(f.io);
        f.conn->simulate_receive(Frame(message::QueryLatestMessage{}));
        Drain(f.io);
        CHECK(f.received.empty());
    }

    SECTION("start is single-use") {
        f.peer->start();
        Drain(f.io);
        CHECK(f.peer->is_connected());
    }

    SECTION("address survives transport release") {
        f.peer->disconnect();
        Drain(f.io);
        CHECK(f.peer->ToString() == "10.0.0.7:6005");
    }
}
