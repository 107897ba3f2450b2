#include <catch2/catch_all.hpp>
#include <future>
#include <thread>
#include "cmdrelay/core/queue/command_queue.hpp"

using namespace cmdrelay;
using namespace std::chrono_literals;

namespace {
    Command cmd(const std::string& id) {
        Command c;
        c.deviceId = "dev";
        c.msgId = id;
        return c;
    }
}

TEST_CASE("CommandQueue: FIFO order", "[queue]") {
    CommandQueue q(8, OverflowPolicy::RejectNew);
    for (auto id : { "1", "2", "3" })
        REQUIRE(q.enqueue(cmd(id)).accepted());

    REQUIRE(q.size() == 3);
    REQUIRE(q.dequeue(0ms)->msgId == "1");
    REQUIRE(q.dequeue(0ms)->msgId == "2");
    REQUIRE(q.dequeue(0ms)->msgId == "3");
    REQUIRE_FALSE(q.dequeue(10ms));
}

TEST_CASE("CommandQueue: reject-new refuses when full", "[queue]") {
    CommandQueue q(2, OverflowPolicy::RejectNew);
    REQUIRE(q.enqueue(cmd("a")).accepted());
    REQUIRE(q.enqueue(cmd("b")).accepted());

    auto r = q.enqueue(cmd("c"));
    REQUIRE_FALSE(r.accepted());
    REQUIRE(r.reason == FailReason::QueueFull);
    REQUIRE_FALSE(r.evicted);
    REQUIRE(q.size() == 2);
    REQUIRE(q.dequeue(0ms)->msgId == "a");
}

TEST_CASE("CommandQueue: drop-oldest evicts the head", "[queue]") {
    CommandQueue q(2, OverflowPolicy::DropOldest);
    q.enqueue(cmd("a"));
    q.enqueue(cmd("b"));

    auto r = q.enqueue(cmd("c"));
    REQUIRE(r.accepted());
    REQUIRE(r.evicted);
    REQUIRE(r.evicted->msgId == "a");
    REQUIRE(q.size() == 2);
    REQUIRE(q.dequeue(0ms)->msgId == "b");
    REQUIRE(q.dequeue(0ms)->msgId == "c");
}

TEST_CASE("CommandQueue: block-with-timeout gives up with QueueTimeout", "[queue]") {
    CommandQueue q(1, OverflowPolicy::BlockWithTimeout, 50ms);
    q.enqueue(cmd("a"));

    auto start = SteadyClock::now();
    auto r = q.enqueue(cmd("b"));
    auto waited = SteadyClock::now() - start;

    REQUIRE_FALSE(r.accepted());
    REQUIRE(r.reason == FailReason::QueueTimeout);
    REQUIRE(waited >= 45ms);
}

TEST_CASE("CommandQueue: block-with-timeout proceeds once room appears", "[queue]") {
    CommandQueue q(1, OverflowPolicy::BlockWithTimeout, 2s);
    q.enqueue(cmd("a"));

    auto producer = std::async(std::launch::async, [&] { return q.enqueue(cmd("b")); });
    std::this_thread::sleep_for(30ms);
    REQUIRE(q.dequeue(0ms)->msgId == "a");

    auto r = producer.get();
    REQUIRE(r.accepted());
    REQUIRE(q.dequeue(0ms)->msgId == "b");
}

TEST_CASE("CommandQueue: close wakes waiters and rejects producers", "[queue]") {
    CommandQueue q(1, OverflowPolicy::BlockWithTimeout, 5s);
    q.enqueue(cmd("a"));

    auto blocked = std::async(std::launch::async, [&] { return q.enqueue(cmd("b")); });
    std::this_thread::sleep_for(30ms);

    auto rest = q.close();
    REQUIRE(rest.size() == 1);
    REQUIRE(rest.front().msgId == "a");

    auto r = blocked.get();
    REQUIRE_FALSE(r.accepted());
    REQUIRE(r.reason == FailReason::EngineStopped);

    REQUIRE(q.closed());
    REQUIRE_FALSE(q.enqueue(cmd("c")).accepted());
    REQUIRE_FALSE(q.dequeue(1s));
}

TEST_CASE("CommandQueue: consumer waits for a producer", "[queue]") {
    CommandQueue q(4, OverflowPolicy::RejectNew);
    auto consumer = std::async(std::launch::async, [&] { return q.dequeue(2s); });
    std::this_thread::sleep_for(20ms);
    q.enqueue(cmd("x"));

    auto got = consumer.get();
    REQUIRE(got);
    REQUIRE(got->msgId == "x");
}

TEST_CASE("CommandQueue: remove takes a command out of the middle", "[queue]") {
    CommandQueue q(4, OverflowPolicy::RejectNew);
    q.enqueue(cmd("a"));
    q.enqueue(cmd("b"));
    q.enqueue(cmd("c"));

    REQUIRE(q.remove("b"));
    REQUIRE_FALSE(q.remove("b"));
    REQUIRE(q.dequeue(0ms)->msgId == "a");
    REQUIRE(q.dequeue(0ms)->msgId == "c");
}

TEST_CASE("CommandQueue: zero capacity is rejected", "[queue]") {
    REQUIRE_THROWS_AS(CommandQueue(0, OverflowPolicy::RejectNew), std::invalid_argument);
}
