/**
 * @file metrics_registry.hpp
 * @brief In-process counters and latency histogram rendered as Prometheus text.
 *
 * Created once by the process, injected into the engine as an IRelayObserver
 * and handed to the HTTP exporter for rendering. There is no global registry.
 *
 * @date 2025
 */
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "cmdrelay/core/interfaces/irelay_observer.hpp"
#include "cmdrelay/core/cache/idempotency_cache.hpp"

namespace cmdrelay {

    using Labels = std::vector<std::pair<std::string, std::string>>;

    /**
     * @class MetricsRegistry
     * @brief IRelayObserver that aggregates events into metric families.
     *
     * Families:
     * - cmdrelay_attempts_total{device_id,outcome}
     * - cmdrelay_retries_total{device_id}
     * - cmdrelay_commands_total{device_id,result,reason}
     * - cmdrelay_idempotent_short_circuit_total{device_id}
     * - cmdrelay_queue_rejected_total{device_id,reason}
     * - cmdrelay_stray_responses_total{device_id}
     * - cmdrelay_attempt_latency_seconds{device_id} (histogram)
     * - cmdrelay_dedup_cache_* gauges when a cache is attached
     */
    class MetricsRegistry : public IRelayObserver {
    public:
        MetricsRegistry();

        void onAttempt(const AttemptEvent& ev) override;
        void onCompleted(const CommandResult& res) override;
        void onRetry(const std::string& deviceId, const std::string& msgId,
                     uint32_t failedAttempt, std::chrono::milliseconds delay) override;
        void onIdempotentShortCircuit(const std::string& deviceId, const std::string& msgId) override;
        void onQueueRejected(const std::string& deviceId, FailReason reason) override;
        void onStrayResponse(const std::string& deviceId, const std::string& msgId) override;

        /**
         * @brief Export the cache statistics as gauges on every render().
         */
        void attachCache(std::shared_ptr<const IdempotencyCache> cache);

        /**
         * @brief Current value of a counter sample, 0 if it was never incremented.
         */
        uint64_t counter(const std::string& family, const Labels& labels) const;

        /**
         * @brief Number of observations in the latency histogram for @p deviceId.
         */
        uint64_t latencyCount(const std::string& deviceId) const;

        /**
         * @brief Prometheus text exposition format (version 0.0.4).
         */
        std::string render() const;

        static const std::vector<double>& latencyBuckets();

    private:
        struct Histogram {
            std::vector<uint64_t> buckets;  ///< per bucket, not cumulative
            uint64_t count{ 0 };
            double   sum{ 0.0 };
        };

        void inc(const std::string& family, const Labels& labels, uint64_t by = 1);

        mutable std::mutex mx_;
        std::map<std::string, std::map<std::string, uint64_t>> counters_;  ///< family -> rendered labels -> value
        std::map<std::string, Histogram> latency_;                         ///< device_id -> histogram
        std::shared_ptr<const IdempotencyCache> cache_;
    };

    /**
     * @brief Render labels as {k="v",...} with Prometheus escaping.
     */
    std::string renderLabels(const Labels& labels);

}
