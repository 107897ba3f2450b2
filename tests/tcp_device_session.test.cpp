#include <catch2/catch_all.hpp>
#include <mutex>
#include <thread>
#include "cmdrelay/core/session/tcp_device_session.hpp"
#include "cmdrelay/core/util/byteorder.hpp"
#include "loopback_peer.hpp"

using namespace cmdrelay;
using namespace cmdrelay::test;
using namespace std::chrono_literals;

namespace {
    std::vector<uint8_t> bytes(std::string_view s) { return { s.begin(), s.end() }; }

    DeviceEndpoint local(uint16_t port) { return DeviceEndpoint{ "dev-1", "127.0.0.1", port }; }
}

TEST_CASE("TcpDeviceSession: request and response over loopback", "[session][tcp]") {
    FrameCodec codec;
    LoopbackPeer peer([&](int fd) {
        auto req = LoopbackPeer::readFrame(fd);
        if (!req) return;
        std::vector<uint8_t> rsp(req->rbegin(), req->rend());
        LoopbackPeer::writeAll(fd, codec.encode(rsp));
        LoopbackPeer::waitForEof(fd);
    });

    TcpDeviceSession s(local(peer.port()));
    std::mutex mx;
    std::vector<SessionState> seen;
    s.setStateListener([&](SessionState, SessionState to) {
        std::scoped_lock lk(mx);
        seen.push_back(to);
    });

    REQUIRE(s.state() == SessionState::Disconnected);
    s.connect(1s);
    REQUIRE(s.isConnected());

    s.send(codec.encode(bytes("abc")), 1s);
    auto payload = s.receive(1s);
    REQUIRE(payload == bytes("cba"));
    REQUIRE(s.isConnected());

    s.close();
    REQUIRE(s.state() == SessionState::Disconnected);

    std::scoped_lock lk(mx);
    REQUIRE(seen == std::vector<SessionState>{
        SessionState::Connecting, SessionState::Connected,
        SessionState::Sending, SessionState::Connected,
        SessionState::Receiving, SessionState::Connected,
        SessionState::Closing, SessionState::Disconnected });
}

TEST_CASE("TcpDeviceSession: silent peer gives RecvTimeout", "[session][tcp]") {
    LoopbackPeer peer([](int fd) { LoopbackPeer::waitForEof(fd); });

    TcpDeviceSession s(local(peer.port()));
    s.connect(1s);

    auto start = SteadyClock::now();
    try {
        s.receive(100ms);
        FAIL("expected SessionError");
    }
    catch (const SessionError& e) {
        REQUIRE(e.code() == SessionErr::RecvTimeout);
    }
    REQUIRE(SteadyClock::now() - start >= 90ms);
    REQUIRE(s.state() == SessionState::Disconnected);
}

TEST_CASE("TcpDeviceSession: peer close gives PeerClosed", "[session][tcp]") {
    LoopbackPeer peer([](int) { /* close right away */ });

    TcpDeviceSession s(local(peer.port()));
    s.connect(1s);

    try {
        s.receive(1s);
        FAIL("expected SessionError");
    }
    catch (const SessionError& e) {
        REQUIRE(e.code() == SessionErr::PeerClosed);
    }
    REQUIRE_FALSE(s.isConnected());
}

TEST_CASE("TcpDeviceSession: nothing listening gives ConnectRefused", "[session][tcp]") {
    TcpDeviceSession s(local(closedPort()));
    try {
        s.connect(1s);
        FAIL("expected SessionError");
    }
    catch (const SessionError& e) {
        REQUIRE(e.code() == SessionErr::ConnectRefused);
    }
    REQUIRE(s.state() == SessionState::Disconnected);
}

TEST_CASE("TcpDeviceSession: coalesced frames come out one per receive", "[session][tcp]") {
    FrameCodec codec;
    LoopbackPeer peer([&](int fd) {
        auto a = codec.encode(bytes("one"));
        auto b = codec.encode(bytes("two"));
        a.insert(a.end(), b.begin(), b.end());
        LoopbackPeer::writeAll(fd, a);
        LoopbackPeer::waitForEof(fd);
    });

    TcpDeviceSession s(local(peer.port()));
    s.connect(1s);
    REQUIRE(s.receive(1s) == bytes("one"));
    REQUIRE(s.receive(1s) == bytes("two"));
    REQUIRE(s.bufferedBytes() == 0);
}

TEST_CASE("TcpDeviceSession: bad magic from the peer is a FrameError", "[session][tcp]") {
    LoopbackPeer peer([](int fd) {
        LoopbackPeer::writeAll(fd, bytes("HTTP/1.1 400 Bad Request\r\n\r\n"));
        LoopbackPeer::waitForEof(fd);
    });

    TcpDeviceSession s(local(peer.port()));
    s.connect(1s);
    try {
        s.receive(1s);
        FAIL("expected FrameError");
    }
    catch (const FrameError& e) {
        REQUIRE(e.code() == FrameErr::BadMagic);
    }
    REQUIRE(s.state() == SessionState::Disconnected);
}

TEST_CASE("TcpDeviceSession: oversized announced length is refused before reading it", "[session][tcp]") {
    LoopbackPeer peer([](int fd) {
        std::vector<uint8_t> hdr{ 0xF0, 0x0D, 0x01, 0, 0, 0, 0 };
        writeBe32(hdr.data() + 3, 1u << 20);
        LoopbackPeer::writeAll(fd, hdr);
        LoopbackPeer::waitForEof(fd);
    });

    TcpDeviceSession s(local(peer.port()), 1024);
    s.connect(1s);
    try {
        s.receive(1s);
        FAIL("expected FrameError");
    }
    catch (const FrameError& e) {
        REQUIRE(e.code() == FrameErr::FrameTooLarge);
    }
}

TEST_CASE("TcpDeviceSession: close from another thread unblocks receive", "[session][tcp]") {
    LoopbackPeer peer([](int fd) { LoopbackPeer::waitForEof(fd); });

    TcpDeviceSession s(local(peer.port()));
    s.connect(1s);

    std::thread closer([&] {
        std::this_thread::sleep_for(50ms);
        s.close();
    });

    auto start = SteadyClock::now();
    REQUIRE_THROWS_AS(s.receive(5s), SessionError);
    closer.join();

    REQUIRE(SteadyClock::now() - start < 2s);
    REQUIRE(s.state() == SessionState::Disconnected);
}

TEST_CASE("TcpDeviceSession: reset allows a second connect", "[session][tcp]") {
    LoopbackPeer peer([](int fd) { LoopbackPeer::waitForEof(fd); });

    TcpDeviceSession s(local(peer.port()));
    s.connect(1s);
    s.close();

    REQUIRE_THROWS_AS(s.send({ 1 }, 100ms), SessionError);
    s.reset();
    s.connect(1s);
    REQUIRE(s.isConnected());
    s.close();
}

TEST_CASE("TcpDeviceSession: operations in the wrong state throw IOError", "[session][tcp]") {
    TcpDeviceSession s(local(closedPort()));
    try {
        s.send({ 1, 2, 3 }, 100ms);
        FAIL("expected SessionError");
    }
    catch (const SessionError& e) {
        REQUIRE(e.code() == SessionErr::IOError);
    }
    REQUIRE_THROWS_AS(s.receive(10ms), SessionError);
    REQUIRE_NOTHROW(s.close());
    REQUIRE_NOTHROW(s.close());
}
