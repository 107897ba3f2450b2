/**
 * @file options.hpp
 * @brief Delivery, retry and resource-bound options for cmdrelay.
 *
 * All knobs of the transport core live in one explicit structure. Invalid
 * combinations are rejected by validate() before anything is started.
 *
 * @date 2025
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string_view>
#include "cmdrelay/core/interfaces/IBackoffStrategy.hpp"

namespace cmdrelay {

    /**
     * @enum OverflowPolicy
     * @brief What enqueue does when a device queue is full.
     *
     * - RejectNew: fail the new command with QueueFull immediately
     * - DropOldest: evict the head so the newest desired state wins
     * - BlockWithTimeout: wait up to enqueueBlockTimeoutMs for room
     */
    enum class OverflowPolicy : uint8_t {
        RejectNew = 0,
        DropOldest,
        BlockWithTimeout
    };

    /**
     * @enum BackoffKind
     * @brief Built-in backoff growth used when no custom strategy is supplied.
     */
    enum class BackoffKind : uint8_t {
        Linear = 0,     ///< base * attempt
        Exponential     ///< base * 2^(attempt-1)
    };

    /**
     * @enum PayloadFormat
     * @brief Payload encoding carried inside the frame envelope.
     */
    enum class PayloadFormat : uint8_t {
        Json = 0,
        MsgPack
    };

    const char* toString(OverflowPolicy p);
    const char* toString(BackoffKind k);
    const char* toString(PayloadFormat f);

    /**
     * @struct RelayOptions
     * @brief Configuration of the queue, retry engine, cache and sessions.
     */
    struct RelayOptions {
        /*──────── queue ────────*/
        uint32_t       queueDepth{ 32 };                       ///< Per-device queue capacity
        OverflowPolicy overflowPolicy{ OverflowPolicy::RejectNew };
        uint32_t       enqueueBlockTimeoutMs{ 500 };           ///< Used by BlockWithTimeout

        /*──────── retry ────────*/
        uint32_t       maxAttempts{ 2 };                       ///< Including the first attempt
        uint32_t       baseBackoffMs{ 250 };                   ///< Delay after the first failed attempt
        uint32_t       maxBackoffMs{ 5000 };                   ///< Cap before jitter
        double         jitterFraction{ 0.1 };                  ///< Delay lies in [d*(1-j), d*(1+j)]
        BackoffKind    backoffKind{ BackoffKind::Linear };
        std::shared_ptr<IBackoffStrategy> backoffStrategy;     ///< Overrides backoffKind when set

        /*──────── idempotency cache ────────*/
        uint32_t       cacheCapacity{ 1000 };
        uint32_t       cacheTtlMs{ 5 * 60 * 1000 };            ///< Measured from insertion

        /*──────── framing / session ────────*/
        uint32_t       maxFrameBytes{ 64 * 1024 };             ///< Payload cap for encode and for reads
        uint32_t       connectTimeoutMs{ 1000 };
        uint32_t       sendTimeoutMs{ 1500 };
        uint32_t       ioTimeoutMs{ 1500 };                    ///< Response wait per attempt
        uint32_t       commandDeadlineMs{ 10000 };             ///< From submit to terminal outcome
        bool           reuseConnection{ false };               ///< Keep a healthy connection between attempts/commands
        PayloadFormat  payloadFormat{ PayloadFormat::Json };

        /**
         * @brief Check every field; throws std::invalid_argument naming the first bad one.
         */
        void validate() const;

        /**
         * @brief Backoff strategy with jitter applied, built from the fields above.
         */
        std::shared_ptr<IBackoffStrategy> makeBackoff() const;

        std::chrono::milliseconds connectTimeout() const { return std::chrono::milliseconds(connectTimeoutMs); }
        std::chrono::milliseconds sendTimeout() const { return std::chrono::milliseconds(sendTimeoutMs); }
        std::chrono::milliseconds ioTimeout() const { return std::chrono::milliseconds(ioTimeoutMs); }
        std::chrono::milliseconds commandDeadline() const { return std::chrono::milliseconds(commandDeadlineMs); }
        std::chrono::milliseconds cacheTtl() const { return std::chrono::milliseconds(cacheTtlMs); }
        std::chrono::milliseconds enqueueBlockTimeout() const { return std::chrono::milliseconds(enqueueBlockTimeoutMs); }
    };

    OverflowPolicy overflowPolicyFromString(std::string_view s);
    BackoffKind backoffKindFromString(std::string_view s);
    PayloadFormat payloadFormatFromString(std::string_view s);

}
