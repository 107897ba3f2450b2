/**
 * @file metrics_exporter.hpp
 * @brief HTTP endpoint serving a MetricsRegistry.
 *
 * GET /metrics  -> Prometheus text exposition
 * GET /healthz  -> "ok"
 *
 * Runs a uWebSockets event loop on its own thread. Owned by the process
 * (the harness), never by the transport core. Connections are not kept
 * alive, so stop() returns as soon as in-progress responses are written.
 *
 * @date 2025
 */
#pragma once
#include <cstdint>
#include <memory>
#include "cmdrelay/core/observability/metrics_registry.hpp"

namespace cmdrelay {

    /**
     * @class MetricsExporter
     * @brief Minimal Prometheus scrape target.
     */
    class MetricsExporter {
    public:
        explicit MetricsExporter(std::shared_ptr<const MetricsRegistry> registry);
        ~MetricsExporter();

        MetricsExporter(const MetricsExporter&) = delete;
        MetricsExporter& operator=(const MetricsExporter&) = delete;

        /**
         * @brief Bind @p port and start serving.
         * @throws std::runtime_error if the port cannot be bound or the exporter already runs
         */
        void start(uint16_t port);

        /**
         * @brief Close the listen socket and join the server thread. Idempotent.
         */
        void stop();

        bool running() const;
        uint16_t port() const;

    private:
        class Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
