#include "cmdrelay/transports/http/metrics_exporter.hpp"
#include "cmdrelay/core/util/logger.hpp"
#include <uwebsockets/App.h>
#include <atomic>
#include <format>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace cmdrelay {

    class MetricsExporter::Impl {
    public:
        explicit Impl(std::shared_ptr<const MetricsRegistry> r) : registry(std::move(r)) {}

        std::shared_ptr<const MetricsRegistry> registry;
        std::jthread serverTh;
        std::atomic<bool> running{ false };
        uint16_t port{ 0 };

        std::mutex mx;                              ///< guards loop and listenSocket
        uWS::Loop* loop{ nullptr };
        us_listen_socket_t* listenSocket{ nullptr };

        void serve(uint16_t p, std::promise<bool>& bound) {
            uWS::App app{};

            // Every response closes its connection: a kept-alive scraper would
            // otherwise hold run() open after the listen socket is gone.
            constexpr bool closeAfter = true;

            app.get("/metrics", [this](auto* res, auto* /*req*/) {
                    res->writeHeader("Content-Type", "text/plain; version=0.0.4; charset=utf-8")
                       ->end(registry->render(), closeAfter);
                })
                .get("/healthz", [](auto* res, auto* /*req*/) {
                    res->writeHeader("Content-Type", "text/plain")->end("ok", closeAfter);
                })
                .any("/*", [](auto* res, auto* /*req*/) {
                    res->writeStatus("404 Not Found")->end("not found", closeAfter);
                })
                .listen(p, [this, p, &bound](us_listen_socket_t* ls) {
                    {
                        std::scoped_lock lk(mx);
                        listenSocket = ls;
                        loop = uWS::Loop::get();
                    }
                    if (ls)
                        LOG_INFO(std::format("metrics exporter listening on :{}", p));
                    else
                        LOG_ERROR(std::format("metrics exporter: cannot bind port {}", p));
                    bound.set_value(ls != nullptr);
                });

            app.run();

            std::scoped_lock lk(mx);
            loop = nullptr;
            listenSocket = nullptr;
        }
    };

    MetricsExporter::MetricsExporter(std::shared_ptr<const MetricsRegistry> registry)
        : pImpl_(std::make_unique<Impl>(std::move(registry)))
    {
        if (!pImpl_->registry)
            throw std::invalid_argument("MetricsExporter: registry is required");
    }

    MetricsExporter::~MetricsExporter() {
        stop();
    }

    void MetricsExporter::start(uint16_t port) {
        if (pImpl_->serverTh.joinable())
            throw std::runtime_error("MetricsExporter already started");

        std::promise<bool> bound;
        auto boundFuture = bound.get_future();
        Impl* impl = pImpl_.get();
        pImpl_->serverTh = std::jthread([impl, port, &bound](std::stop_token) {
            impl->serve(port, bound);
        });

        if (!boundFuture.get()) {
            pImpl_->serverTh.join();
            throw std::runtime_error(std::format("metrics exporter: cannot bind port {}", port));
        }
        pImpl_->port = port;
        pImpl_->running = true;
    }

    void MetricsExporter::stop() {
        if (!pImpl_->serverTh.joinable()) return;

        {
            std::scoped_lock lk(pImpl_->mx);
            if (pImpl_->loop) {
                Impl* impl = pImpl_.get();
                // the loop returns from run() once its last socket is closed
                pImpl_->loop->defer([impl] {
                    std::scoped_lock lk2(impl->mx);
                    if (impl->listenSocket) {
                        us_listen_socket_close(0, impl->listenSocket);
                        impl->listenSocket = nullptr;
                    }
                });
            }
        }

        pImpl_->serverTh.join();
        pImpl_->running = false;
        LOG_DEBUG("metrics exporter stopped");
    }

    bool MetricsExporter::running() const {
        return pImpl_->running.load();
    }

    uint16_t MetricsExporter::port() const {
        return pImpl_->port;
    }

}
