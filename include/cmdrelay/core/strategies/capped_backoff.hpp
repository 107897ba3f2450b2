/**
 * @file capped_backoff.hpp
 * @brief Deterministic backoff curves bounded by a maximum delay.
 *
 * LinearBackoff waits base*k after failed attempt k, ExponentialBackoff waits
 * base*2^(k-1). Both clamp to the cap. Jitter is layered on top by
 * JitteredBackoff.
 *
 * @date 2025
 */
#pragma once
#include "../interfaces/IBackoffStrategy.hpp"
#include <algorithm>
#include <stdexcept>

namespace cmdrelay {

    /**
     * @class CappedBackoff
     * @brief Shared clamp for curves that only differ in their growth factor.
     */
    class CappedBackoff : public IBackoffStrategy {
    public:
        CappedBackoff(std::chrono::milliseconds base, std::chrono::milliseconds cap)
            : base_(base), cap_(cap)
        {
            if (base_.count() <= 0 || cap_ < base_)
                throw std::invalid_argument("backoff: need 0 < base <= cap");
        }

        std::chrono::milliseconds nextDelay(uint32_t failedAttempt) const final {
            const uint32_t k = std::max<uint32_t>(failedAttempt, 1);
            const long long factor = growth(k);
            // stop multiplying once the product would pass the cap
            if (factor >= cap_.count() / base_.count() + 1)
                return cap_;
            return std::min(cap_, base_ * factor);
        }

        std::chrono::milliseconds base() const { return base_; }
        std::chrono::milliseconds cap() const { return cap_; }

    protected:
        /// Multiplier of the base delay after failed attempt @p k (k >= 1).
        virtual long long growth(uint32_t k) const = 0;

    private:
        std::chrono::milliseconds base_;
        std::chrono::milliseconds cap_;
    };

    class LinearBackoff : public CappedBackoff {
    public:
        using CappedBackoff::CappedBackoff;
        std::string_view name() const override { return "linear"; }

    protected:
        long long growth(uint32_t k) const override { return k; }
    };

    class ExponentialBackoff : public CappedBackoff {
    public:
        using CappedBackoff::CappedBackoff;
        std::string_view name() const override { return "exponential"; }

    protected:
        long long growth(uint32_t k) const override {
            return 1LL << std::min<uint32_t>(k - 1, 62);
        }
    };

}
