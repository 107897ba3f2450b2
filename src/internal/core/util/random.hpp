/**
 * @file random.hpp
 * @brief Random number utility functions for cmdrelay.
 *
 * Provides the thread-local generator used for msg_id generation and for
 * backoff jitter.
 *
 * @date 2025
 */
#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <random>

namespace cmdrelay {

    /**
     * @brief Thread-local Mersenne Twister seeded with std::random_device and the high-resolution clock.
     */
    inline std::mt19937_64& threadRng()
    {
        static thread_local std::mt19937_64 rng{
            std::random_device{}() ^ (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count()
        };
        return rng;
    }

    /**
     * @brief Fill a 16-byte array with random data.
     *
     * @param tok Reference to a 16-byte array to fill with random bytes
     */
    inline void randomFill(std::array<uint8_t, 16>& tok)
    {
        auto& rng = threadRng();
        std::uniform_int_distribution<uint32_t> dist(0, 0xFFFFFFFF);

        for (size_t i = 0; i < 16; i += 4) {
            uint32_t rnd = dist(rng);
            tok[i] = static_cast<uint8_t>(rnd & 0xFF);
            tok[i + 1] = static_cast<uint8_t>((rnd >> 8) & 0xFF);
            tok[i + 2] = static_cast<uint8_t>((rnd >> 16) & 0xFF);
            tok[i + 3] = static_cast<uint8_t>((rnd >> 24) & 0xFF);
        }
    }

    /**
     * @brief Uniform double in [lo, hi].
     */
    inline double randomBetween(double lo, double hi)
    {
        if (hi <= lo) return lo;
        std::uniform_real_distribution<double> dist(lo, hi);
        return dist(threadRng());
    }

}
