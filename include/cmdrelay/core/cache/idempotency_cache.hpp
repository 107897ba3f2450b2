/**
 * @file idempotency_cache.hpp
 * @brief Bounded msg_id -> outcome store used to suppress duplicate device actions.
 *
 * The retry engine records SUCCESS when a correlated response arrives and
 * consults the cache before every re-send. The mock device uses the same class
 * on the other side of the wire to acknowledge a repeated msg_id without
 * toggling twice.
 *
 * Entries expire a fixed TTL after insertion (not a sliding window); when the
 * store is full the least recently used entry is evicted. All methods are
 * thread-safe and linearizable per key.
 *
 * @date 2025
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <folly/container/F14Map.h>
#include "cmdrelay/core/types.hpp"
#include "cmdrelay/core/util/time.hpp"

namespace cmdrelay {

    /**
     * @struct IdempotencyRecord
     * @brief Stored outcome for one msg_id.
     */
    struct IdempotencyRecord {
        Outcome   outcome{ Outcome::Pending };
        TimePoint recordedAt{};
    };

    /**
     * @struct CacheStats
     * @brief Counters since construction.
     */
    struct CacheStats {
        uint64_t    hits{ 0 };
        uint64_t    misses{ 0 };
        uint64_t    inserts{ 0 };
        uint64_t    evictions{ 0 };     ///< LRU evictions at capacity
        uint64_t    expirations{ 0 };   ///< Entries dropped because their TTL passed
        std::size_t size{ 0 };
        std::size_t capacity{ 0 };
    };

    /**
     * @class IdempotencyCache
     * @brief LRU + TTL bounded deduplication store keyed by msg_id.
     */
    class IdempotencyCache {
    public:
        static constexpr std::size_t DEFAULT_CAPACITY = 1000;
        static constexpr std::chrono::milliseconds DEFAULT_TTL{ 5 * 60 * 1000 };

        /**
         * @param capacity Maximum number of records, must be > 0
         * @param ttl Lifetime of a record measured from insertion, must be > 0
         * @param clock Time source; tests inject a manual clock
         * @throws std::invalid_argument on zero capacity or ttl
         */
        explicit IdempotencyCache(std::size_t capacity = DEFAULT_CAPACITY,
                                  std::chrono::milliseconds ttl = DEFAULT_TTL,
                                  ClockFn clock = {});

        IdempotencyCache(const IdempotencyCache&) = delete;
        IdempotencyCache& operator=(const IdempotencyCache&) = delete;

        /**
         * @brief Store @p outcome for @p msgId.
         *
         * An existing live record is updated in place and keeps its insertion
         * time. At capacity the least recently used record is evicted first.
         */
        void record(const std::string& msgId, Outcome outcome);

        /**
         * @brief Outcome for @p msgId, or nullopt if absent or expired.
         *
         * A hit marks the record as most recently used.
         */
        std::optional<Outcome> lookup(const std::string& msgId);

        /**
         * @brief Full record without touching LRU order or statistics.
         */
        std::optional<IdempotencyRecord> peek(const std::string& msgId) const;

        /**
         * @brief Remove @p msgId. Returns true if a record was present.
         */
        bool erase(const std::string& msgId);

        /**
         * @brief Drop every expired record.
         * @return Number of records removed
         */
        std::size_t purgeExpired();

        std::size_t size() const;
        std::size_t capacity() const { return capacity_; }
        std::chrono::milliseconds ttl() const { return ttl_; }
        CacheStats stats() const;

    private:
        struct Entry {
            std::string msgId;
            IdempotencyRecord rec;
        };
        using Lru = std::list<Entry>;   ///< front = most recently used

        bool expiredLocked(const Entry& e, TimePoint now) const { return now - e.rec.recordedAt >= ttl_; }
        void eraseLocked(Lru::iterator it);

        const std::size_t capacity_;
        const std::chrono::milliseconds ttl_;
        ClockFn clock_;

        mutable std::mutex mx_;
        Lru lru_;
        folly::F14FastMap<std::string, Lru::iterator> index_;

        uint64_t hits_{ 0 };
        uint64_t misses_{ 0 };
        uint64_t inserts_{ 0 };
        uint64_t evictions_{ 0 };
        uint64_t expirations_{ 0 };
    };

}
