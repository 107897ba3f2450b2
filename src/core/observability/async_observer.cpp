#include "cmdrelay/core/observability/async_observer.hpp"
#include "cmdrelay/core/util/logger.hpp"
#include <format>
#include <stdexcept>

namespace cmdrelay {

    /*──────────────── AsyncObserver ───────────────*/

    AsyncObserver::AsyncObserver(std::shared_ptr<IRelayObserver> inner, std::size_t maxPending)
        : inner_(std::move(inner)), pool_(1, maxPending)
    {
        if (!inner_)
            throw std::invalid_argument("AsyncObserver: inner sink is required");
    }

    AsyncObserver::~AsyncObserver() {
        shutdown();
    }

    void AsyncObserver::shutdown() {
        pool_.drain();
    }

    void AsyncObserver::post(std::function<void()> task) {
        if (!pool_.trySubmit(std::move(task))) {
            const auto n = ++dropped_;
            // first drop, then every 1000th
            if (n == 1 || n % 1000 == 0)
                LOG_WARN(std::format("observer backlog full, {} event(s) dropped so far", n));
        }
    }

    void AsyncObserver::onAttempt(const AttemptEvent& ev) {
        post([inner = inner_, ev] { inner->onAttempt(ev); });
    }

    void AsyncObserver::onCompleted(const CommandResult& res) {
        post([inner = inner_, res] { inner->onCompleted(res); });
    }

    void AsyncObserver::onRetry(const std::string& deviceId, const std::string& msgId,
                                uint32_t failedAttempt, std::chrono::milliseconds delay) {
        post([inner = inner_, deviceId, msgId, failedAttempt, delay] {
            inner->onRetry(deviceId, msgId, failedAttempt, delay);
        });
    }

    void AsyncObserver::onIdempotentShortCircuit(const std::string& deviceId, const std::string& msgId) {
        post([inner = inner_, deviceId, msgId] { inner->onIdempotentShortCircuit(deviceId, msgId); });
    }

    void AsyncObserver::onQueueRejected(const std::string& deviceId, FailReason reason) {
        post([inner = inner_, deviceId, reason] { inner->onQueueRejected(deviceId, reason); });
    }

    void AsyncObserver::onStrayResponse(const std::string& deviceId, const std::string& msgId) {
        post([inner = inner_, deviceId, msgId] { inner->onStrayResponse(deviceId, msgId); });
    }

    /*──────────────── ObserverFanout ───────────────*/

    void ObserverFanout::add(std::shared_ptr<IRelayObserver> sink) {
        if (!sink) return;
        std::scoped_lock lk(mx_);
        sinks_.push_back(std::move(sink));
    }

    std::size_t ObserverFanout::size() const {
        std::scoped_lock lk(mx_);
        return sinks_.size();
    }

    template<typename F>
    void ObserverFanout::each(const char* hook, F&& fn) {
        std::vector<std::shared_ptr<IRelayObserver>> copy;
        {
            std::scoped_lock lk(mx_);
            copy = sinks_;
        }
        for (auto& s : copy) {
            try {
                fn(*s);
            }
            catch (const std::exception& e) {
                LOG_ERROR(std::format("observer {} threw: {}", hook, e.what()));
            }
        }
    }

    void ObserverFanout::onAttempt(const AttemptEvent& ev) {
        each("onAttempt", [&](IRelayObserver& o) { o.onAttempt(ev); });
    }

    void ObserverFanout::onCompleted(const CommandResult& res) {
        each("onCompleted", [&](IRelayObserver& o) { o.onCompleted(res); });
    }

    void ObserverFanout::onRetry(const std::string& deviceId, const std::string& msgId,
                                 uint32_t failedAttempt, std::chrono::milliseconds delay) {
        each("onRetry", [&](IRelayObserver& o) { o.onRetry(deviceId, msgId, failedAttempt, delay); });
    }

    void ObserverFanout::onIdempotentShortCircuit(const std::string& deviceId, const std::string& msgId) {
        each("onIdempotentShortCircuit", [&](IRelayObserver& o) { o.onIdempotentShortCircuit(deviceId, msgId); });
    }

    void ObserverFanout::onQueueRejected(const std::string& deviceId, FailReason reason) {
        each("onQueueRejected", [&](IRelayObserver& o) { o.onQueueRejected(deviceId, reason); });
    }

    void ObserverFanout::onStrayResponse(const std::string& deviceId, const std::string& msgId) {
        each("onStrayResponse", [&](IRelayObserver& o) { o.onStrayResponse(deviceId, msgId); });
    }

}
