/**
 * @file irelay_observer.hpp
 * @brief Observability sink fed by the retry engine.
 *
 * The engine calls these hooks synchronously from device lane threads. A sink
 * that does real I/O should be wrapped in AsyncObserver so the engine never
 * waits on it. Exceptions thrown by a sink are logged and ignored.
 *
 * @date 2025
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include "cmdrelay/core/types.hpp"

namespace cmdrelay {

    /**
     * @struct AttemptEvent
     * @brief One finished attempt.
     */
    struct AttemptEvent {
        std::string msgId;
        std::string deviceId;
        uint32_t    attemptNumber{ 0 };
        Outcome     outcome{ Outcome::Pending };
        double      elapsedMs{ 0.0 };
        bool        frameSent{ false };     ///< false if the attempt failed before the frame left
        std::string detail;
    };

    /**
     * @class IRelayObserver
     * @brief Receives per-attempt and per-command events.
     */
    class IRelayObserver {
    public:
        virtual ~IRelayObserver() = default;

        virtual void onAttempt(const AttemptEvent& ev) = 0;

        /**
         * @brief A command reached SUCCESS or FAILED.
         */
        virtual void onCompleted(const CommandResult& res) = 0;

        /**
         * @brief A retry was scheduled after attempt @p failedAttempt.
         */
        virtual void onRetry(const std::string& /*deviceId*/, const std::string& /*msgId*/,
                             uint32_t /*failedAttempt*/, std::chrono::milliseconds /*delay*/) {}

        /**
         * @brief A retry was skipped because the cache already held SUCCESS for the msg_id.
         */
        virtual void onIdempotentShortCircuit(const std::string& /*deviceId*/, const std::string& /*msgId*/) {}

        virtual void onQueueRejected(const std::string& /*deviceId*/, FailReason /*reason*/) {}

        /**
         * @brief A response did not match any command awaiting a response and was discarded.
         */
        virtual void onStrayResponse(const std::string& /*deviceId*/, const std::string& /*msgId*/) {}
    };

}
