#include <catch2/catch_all.hpp>
#include <atomic>
#include <future>
#include <stdexcept>
#include "cmdrelay/core/util/thread_pool.hpp"

using namespace cmdrelay;

TEST_CASE("ThreadPool: drain runs the whole backlog", "[pool]") {
    std::atomic<int> ran{ 0 };
    ThreadPool pool(4);
    REQUIRE(pool.workerCount() == 4);

    for (int i = 0; i < 100; ++i)
        REQUIRE(pool.trySubmit([&] { ++ran; }));
    pool.drain();

    REQUIRE(ran == 100);
    REQUIRE(pool.workerCount() == 0);
    REQUIRE_FALSE(pool.trySubmit([] {}));
    REQUIRE(pool.rejected() == 1);
    REQUIRE_NOTHROW(pool.drain());
}

TEST_CASE("ThreadPool: a full backlog refuses instead of waiting", "[pool]") {
    std::promise<void> gate;
    auto opened = gate.get_future().share();
    std::promise<void> started;

    ThreadPool pool(1, 1);
    REQUIRE(pool.trySubmit([&] { started.set_value(); opened.wait(); }));
    started.get_future().wait();

    REQUIRE(pool.trySubmit([] {}));         // waits in the backlog
    REQUIRE_FALSE(pool.trySubmit([] {}));
    REQUIRE(pool.backlog() == 1);
    REQUIRE(pool.rejected() == 1);

    gate.set_value();
    pool.drain();
    REQUIRE(pool.backlog() == 0);
}

TEST_CASE("ThreadPool: a throwing task is counted and the worker keeps going", "[pool]") {
    std::atomic<int> ran{ 0 };
    ThreadPool pool(1);
    pool.trySubmit([] { throw std::runtime_error("boom"); });
    pool.trySubmit([&] { ++ran; });
    pool.drain();

    REQUIRE(pool.failed() == 1);
    REQUIRE(ran == 1);
}

TEST_CASE("ThreadPool: zero workers means hardware concurrency", "[pool]") {
    ThreadPool pool;
    REQUIRE(pool.workerCount() >= 1);
}
