/**
 * @file IBackoffStrategy.hpp
 * @brief Delay policy between two attempts of the same command.
 *
 * RetryEngine calls nextDelay() with the number of the attempt that just
 * failed (1 after the first failure) and sleeps for the result before
 * re-sending, unless a late acknowledgement or a cancel wakes it first.
 * Strategies are shared between device lanes and must be safe to call
 * concurrently.
 *
 * @date 2025
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <string_view>

namespace cmdrelay {

    class IBackoffStrategy {
    public:
        virtual ~IBackoffStrategy() = default;

        /**
         * @param failedAttempt 1-based number of the attempt that failed; 0 is treated as 1
         */
        virtual std::chrono::milliseconds nextDelay(uint32_t failedAttempt) const = 0;

        /**
         * @brief Short label for logs ("linear", "exponential", ...).
         */
        virtual std::string_view name() const { return "custom"; }
    };

}
