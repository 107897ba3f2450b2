#include <catch2/catch_all.hpp>
#include "cmdrelay/core/observability/metrics_registry.hpp"

using namespace cmdrelay;
using Catch::Matchers::ContainsSubstring;

namespace {
    AttemptEvent attempt(const std::string& device, Outcome o, double ms) {
        AttemptEvent ev;
        ev.msgId = "m1";
        ev.deviceId = device;
        ev.attemptNumber = 1;
        ev.outcome = o;
        ev.elapsedMs = ms;
        ev.frameSent = true;
        return ev;
    }
}

TEST_CASE("MetricsRegistry: nothing rendered before the first event", "[metrics]") {
    MetricsRegistry m;
    REQUIRE(m.render().empty());
    REQUIRE(m.counter("cmdrelay_attempts_total", { { "device_id", "lamp" }, { "outcome", "success" } }) == 0);
}

TEST_CASE("MetricsRegistry: counters by label set", "[metrics]") {
    MetricsRegistry m;
    m.onAttempt(attempt("lamp", Outcome::Timeout, 12.0));
    m.onAttempt(attempt("lamp", Outcome::Success, 8.0));
    m.onAttempt(attempt("fan", Outcome::Success, 8.0));
    m.onRetry("lamp", "m1", 1, std::chrono::milliseconds(100));
    m.onIdempotentShortCircuit("lamp", "m1");
    m.onQueueRejected("fan", FailReason::QueueFull);
    m.onStrayResponse("fan", "zz");

    CommandResult ok;
    ok.deviceId = "lamp";
    ok.state = CommandState::Success;
    m.onCompleted(ok);

    REQUIRE(m.counter("cmdrelay_attempts_total", { { "device_id", "lamp" }, { "outcome", "timeout" } }) == 1);
    REQUIRE(m.counter("cmdrelay_attempts_total", { { "device_id", "lamp" }, { "outcome", "success" } }) == 1);
    REQUIRE(m.counter("cmdrelay_attempts_total", { { "device_id", "fan" }, { "outcome", "success" } }) == 1);
    REQUIRE(m.counter("cmdrelay_retries_total", { { "device_id", "lamp" } }) == 1);
    REQUIRE(m.counter("cmdrelay_idempotent_short_circuit_total", { { "device_id", "lamp" } }) == 1);
    REQUIRE(m.counter("cmdrelay_queue_rejected_total", { { "device_id", "fan" }, { "reason", "QueueFull" } }) == 1);
    REQUIRE(m.counter("cmdrelay_stray_responses_total", { { "device_id", "fan" } }) == 1);
    REQUIRE(m.counter("cmdrelay_commands_total",
        { { "device_id", "lamp" }, { "result", "success" }, { "reason", "None" } }) == 1);
    REQUIRE(m.latencyCount("lamp") == 2);
    REQUIRE(m.latencyCount("nobody") == 0);

    auto text = m.render();
    REQUIRE_THAT(text, ContainsSubstring("# TYPE cmdrelay_attempts_total counter\n"));
    REQUIRE_THAT(text, ContainsSubstring("cmdrelay_attempts_total{device_id=\"lamp\",outcome=\"timeout\"} 1\n"));
    REQUIRE_THAT(text, ContainsSubstring("cmdrelay_retries_total{device_id=\"lamp\"} 1\n"));
    REQUIRE_THAT(text, ContainsSubstring("# TYPE cmdrelay_attempt_latency_seconds histogram\n"));
}

TEST_CASE("MetricsRegistry: latency histogram is cumulative", "[metrics]") {
    MetricsRegistry m;
    m.onAttempt(attempt("lamp", Outcome::Success, 30.0));     // 0.03 s
    m.onAttempt(attempt("lamp", Outcome::Timeout, 9000.0));   // past the last bucket

    auto text = m.render();
    REQUIRE_THAT(text, ContainsSubstring("cmdrelay_attempt_latency_seconds_bucket{device_id=\"lamp\",le=\"0.025\"} 0\n"));
    REQUIRE_THAT(text, ContainsSubstring("cmdrelay_attempt_latency_seconds_bucket{device_id=\"lamp\",le=\"0.05\"} 1\n"));
    REQUIRE_THAT(text, ContainsSubstring("cmdrelay_attempt_latency_seconds_bucket{device_id=\"lamp\",le=\"5\"} 1\n"));
    REQUIRE_THAT(text, ContainsSubstring("cmdrelay_attempt_latency_seconds_bucket{device_id=\"lamp\",le=\"+Inf\"} 2\n"));
    REQUIRE_THAT(text, ContainsSubstring("cmdrelay_attempt_latency_seconds_count{device_id=\"lamp\"} 2\n"));
}

TEST_CASE("MetricsRegistry: label values are escaped", "[metrics]") {
    REQUIRE(renderLabels({}).empty());
    REQUIRE(renderLabels({ { "device_id", "a\"b\\c\nd" } }) == R"({device_id="a\"b\\c\nd"})");
    REQUIRE(renderLabels({ { "a", "1" }, { "b", "2" } }) == R"({a="1",b="2"})");
}

TEST_CASE("MetricsRegistry: attached cache is exported as gauges", "[metrics][cache]") {
    auto cache = std::make_shared<IdempotencyCache>(16, std::chrono::minutes(1));
    cache->record("m1", Outcome::Success);
    (void)cache->lookup("m1");
    (void)cache->lookup("m2");

    MetricsRegistry m;
    m.attachCache(cache);

    auto text = m.render();
    REQUIRE_THAT(text, ContainsSubstring("# TYPE cmdrelay_dedup_cache_entries gauge\n"));
    REQUIRE_THAT(text, ContainsSubstring("cmdrelay_dedup_cache_entries 1\n"));
    REQUIRE_THAT(text, ContainsSubstring("cmdrelay_dedup_cache_capacity 16\n"));
    REQUIRE_THAT(text, ContainsSubstring("cmdrelay_dedup_cache_hits_total 1\n"));
    REQUIRE_THAT(text, ContainsSubstring("cmdrelay_dedup_cache_misses_total 1\n"));
    REQUIRE_THAT(text, ContainsSubstring("cmdrelay_dedup_cache_evictions_total 0\n"));
}
