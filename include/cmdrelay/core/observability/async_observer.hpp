/**
 * @file async_observer.hpp
 * @brief Observer decorators: off-thread dispatch and fan-out.
 *
 * @date 2025
 */
#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>
#include "cmdrelay/core/interfaces/irelay_observer.hpp"
#include "cmdrelay/core/util/thread_pool.hpp"

namespace cmdrelay {

    /**
     * @class AsyncObserver
     * @brief Forwards events to an inner sink on a single worker thread.
     *
     * Hooks return immediately. When @p maxPending events are already waiting
     * the new one is dropped and counted, so a stalled sink can never stall a
     * device lane. Events are delivered in the order they were emitted.
     */
    class AsyncObserver : public IRelayObserver {
    public:
        explicit AsyncObserver(std::shared_ptr<IRelayObserver> inner, std::size_t maxPending = 1024);
        ~AsyncObserver() override;

        void onAttempt(const AttemptEvent& ev) override;
        void onCompleted(const CommandResult& res) override;
        void onRetry(const std::string& deviceId, const std::string& msgId,
                     uint32_t failedAttempt, std::chrono::milliseconds delay) override;
        void onIdempotentShortCircuit(const std::string& deviceId, const std::string& msgId) override;
        void onQueueRejected(const std::string& deviceId, FailReason reason) override;
        void onStrayResponse(const std::string& deviceId, const std::string& msgId) override;

        /**
         * @brief Deliver everything already queued, then stop accepting events.
         */
        void shutdown();

        uint64_t dropped() const { return dropped_.load(); }

    private:
        void post(std::function<void()> task);

        std::shared_ptr<IRelayObserver> inner_;
        ThreadPool pool_;
        std::atomic<uint64_t> dropped_{ 0 };
    };

    /**
     * @class ObserverFanout
     * @brief Forwards every event to each registered sink in turn.
     */
    class ObserverFanout : public IRelayObserver {
    public:
        void add(std::shared_ptr<IRelayObserver> sink);
        std::size_t size() const;

        void onAttempt(const AttemptEvent& ev) override;
        void onCompleted(const CommandResult& res) override;
        void onRetry(const std::string& deviceId, const std::string& msgId,
                     uint32_t failedAttempt, std::chrono::milliseconds delay) override;
        void onIdempotentShortCircuit(const std::string& deviceId, const std::string& msgId) override;
        void onQueueRejected(const std::string& deviceId, FailReason reason) override;
        void onStrayResponse(const std::string& deviceId, const std::string& msgId) override;

    private:
        template<typename F>
        void each(const char* hook, F&& fn);

        mutable std::mutex mx_;
        std::vector<std::shared_ptr<IRelayObserver>> sinks_;
    };

}
