#include "cmdrelay/core/strategies/jittered_backoff.hpp"
#include "internal/core/util/random.hpp"
#include <cmath>

namespace cmdrelay {

    JitteredBackoff::JitteredBackoff(std::shared_ptr<IBackoffStrategy> inner, double jitterFraction,
                                     Sampler sampler)
        : inner_(std::move(inner)), jitter_(jitterFraction), sampler_(std::move(sampler))
    {
        if (!inner_)
            throw std::invalid_argument("JitteredBackoff: inner strategy is null");
        if (!(jitter_ >= 0.0 && jitter_ < 1.0))
            throw std::invalid_argument("JitteredBackoff: jitter fraction must be in [0, 1)");
        if (!sampler_)
            sampler_ = [](double lo, double hi) { return randomBetween(lo, hi); };
    }

    std::chrono::milliseconds JitteredBackoff::nextDelay(uint32_t attempt) const {
        const double d = static_cast<double>(inner_->nextDelay(attempt).count());
        const double lo = d * (1.0 - jitter_);
        const double hi = d * (1.0 + jitter_);
        double v = sampler_(lo, hi);
        // clamp a misbehaving sampler, then round inward so the bound holds after truncation
        if (v < lo) v = lo;
        if (v > hi) v = hi;
        auto ms = static_cast<long long>(std::ceil(v));
        if (static_cast<double>(ms) > hi) ms = static_cast<long long>(std::floor(hi));
        return std::chrono::milliseconds(ms);
    }

}
