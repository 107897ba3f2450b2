#include <catch2/catch_all.hpp>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include "cmdrelay/core/observability/async_observer.hpp"
#include "mock_device_session.hpp"

using namespace cmdrelay;
using namespace cmdrelay::test;
using namespace std::chrono_literals;

namespace {
    AttemptEvent attempt(uint32_t n) {
        AttemptEvent ev;
        ev.msgId = "m";
        ev.deviceId = "lamp";
        ev.attemptNumber = n;
        return ev;
    }

    /// Blocks inside onAttempt until opened.
    class GateObserver : public RecordingObserver {
    public:
        void onAttempt(const AttemptEvent& ev) override {
            std::unique_lock lk(gmx_);
            ++entered_;
            gcv_.notify_all();
            gcv_.wait(lk, [&] { return open_; });
            lk.unlock();
            RecordingObserver::onAttempt(ev);
        }

        void open() {
            std::scoped_lock lk(gmx_);
            open_ = true;
            gcv_.notify_all();
        }

        bool waitEntered(int n) {
            std::unique_lock lk(gmx_);
            return gcv_.wait_for(lk, 2s, [&] { return entered_ >= n; });
        }

    private:
        std::mutex gmx_;
        std::condition_variable gcv_;
        int entered_{ 0 };
        bool open_{ false };
    };

    class ThrowingObserver : public IRelayObserver {
    public:
        void onAttempt(const AttemptEvent&) override { throw std::runtime_error("sink down"); }
        void onCompleted(const CommandResult&) override { throw std::runtime_error("sink down"); }
    };
}

TEST_CASE("AsyncObserver: events arrive in emission order", "[observer]") {
    auto rec = std::make_shared<RecordingObserver>();
    AsyncObserver obs(rec);

    for (uint32_t i = 1; i <= 50; ++i)
        obs.onAttempt(attempt(i));
    obs.onRetry("lamp", "m", 1, 10ms);
    obs.onStrayResponse("lamp", "x");
    obs.shutdown();

    std::scoped_lock lk(rec->mx);
    REQUIRE(rec->attempts.size() == 50);
    for (uint32_t i = 0; i < 50; ++i)
        REQUIRE(rec->attempts[i].attemptNumber == i + 1);
    REQUIRE(rec->retries == 1);
    REQUIRE(rec->strays == std::vector<std::string>{ "x" });
    REQUIRE(obs.dropped() == 0);
}

TEST_CASE("AsyncObserver: a stalled sink drops instead of blocking", "[observer]") {
    auto gate = std::make_shared<GateObserver>();
    AsyncObserver obs(gate, 2);

    obs.onAttempt(attempt(1));
    REQUIRE(gate->waitEntered(1));

    auto start = SteadyClock::now();
    for (uint32_t i = 2; i <= 6; ++i)
        obs.onAttempt(attempt(i));
    REQUIRE(SteadyClock::now() - start < 500ms);
    REQUIRE(obs.dropped() == 3);

    gate->open();
    obs.shutdown();

    std::scoped_lock lk(gate->mx);
    REQUIRE(gate->attempts.size() == 3);
    REQUIRE(gate->attempts[1].attemptNumber == 2);
    REQUIRE(gate->attempts[2].attemptNumber == 3);
}

TEST_CASE("AsyncObserver: events after shutdown are dropped", "[observer]") {
    auto rec = std::make_shared<RecordingObserver>();
    AsyncObserver obs(rec);
    obs.shutdown();
    obs.onAttempt(attempt(1));

    REQUIRE(obs.dropped() == 1);
    REQUIRE_NOTHROW(obs.shutdown());
}

TEST_CASE("AsyncObserver: requires an inner sink", "[observer]") {
    REQUIRE_THROWS_AS(AsyncObserver(nullptr), std::invalid_argument);
}

TEST_CASE("ObserverFanout: a throwing sink does not starve the rest", "[observer]") {
    auto rec = std::make_shared<RecordingObserver>();
    ObserverFanout fan;
    fan.add(std::make_shared<ThrowingObserver>());
    fan.add(rec);
    fan.add(nullptr);
    REQUIRE(fan.size() == 2);

    REQUIRE_NOTHROW(fan.onAttempt(attempt(1)));
    CommandResult res;
    REQUIRE_NOTHROW(fan.onCompleted(res));
    fan.onQueueRejected("lamp", FailReason::QueueFull);

    std::scoped_lock lk(rec->mx);
    REQUIRE(rec->attempts.size() == 1);
    REQUIRE(rec->completed.size() == 1);
    REQUIRE(rec->rejected == std::vector<FailReason>{ FailReason::QueueFull });
}
