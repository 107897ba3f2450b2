/**
 * @file jittered_backoff.hpp
 * @brief Decorator adding bounded random jitter to any backoff strategy.
 *
 * For an inner delay d and jitter fraction j the result is uniformly drawn
 * from [d*(1-j), d*(1+j)], so retries from many devices do not line up.
 *
 * @date 2025
 */
#pragma once
#include "../interfaces/IBackoffStrategy.hpp"
#include <functional>
#include <memory>
#include <stdexcept>

namespace cmdrelay {

    class JitteredBackoff : public IBackoffStrategy {
    public:
        /// Returns a value in [lo, hi]; injectable so tests can pin the draw.
        using Sampler = std::function<double(double lo, double hi)>;

        /**
         * @param inner Strategy producing the un-jittered delay
         * @param jitterFraction Fraction in [0, 1)
         * @param sampler Random source, defaults to a thread-local uniform draw
         */
        JitteredBackoff(std::shared_ptr<IBackoffStrategy> inner, double jitterFraction,
                        Sampler sampler = {});

        std::chrono::milliseconds nextDelay(uint32_t attempt) const override;

        /**
         * @brief The un-jittered delay for @p attempt.
         */
        std::chrono::milliseconds baseDelay(uint32_t attempt) const { return inner_->nextDelay(attempt); }

        double jitterFraction() const { return jitter_; }
        std::string_view name() const override { return inner_->name(); }

    private:
        std::shared_ptr<IBackoffStrategy> inner_;
        double jitter_;
        Sampler sampler_;
    };

}
