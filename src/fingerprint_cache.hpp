#pragma once

#include "render_request.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

// Encoded-image cache keyed by request fingerprint.
//
// Entries expire on whichever comes first: time_to_live after insertion or
// time_to_idle after the last hit. The key space is split over independently
// locked shards that share one capacity budget. A new key is admitted only
// once a slot is reserved; when the cache is full an expired entry is
// dropped first, otherwise the least recently used entry across all shards.
//
// Stored bytes are immutable. lookup() hands out shared ownership, so a
// reader keeps its bytes even if the entry is evicted or replaced meanwhile.
class FingerprintCache {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Bytes     = std::shared_ptr<const std::vector<uint8_t>>;
    using NowFn     = std::function<TimePoint()>;

    struct Options {
        size_t               capacity      = 1000;
        std::chrono::seconds time_to_live  = std::chrono::seconds(3600);
        std::chrono::seconds time_to_idle  = std::chrono::seconds(1800);
        int                  shards        = 8;
    };

    explicit FingerprintCache(const Options& opts, NowFn now = Clock::now);

    FingerprintCache(const FingerprintCache&)            = delete;
    FingerprintCache& operator=(const FingerprintCache&) = delete;

    // nullptr when absent or expired. A hit refreshes the idle timer.
    Bytes lookup(const Fingerprint& fp);

    // Stores or replaces; both expiration clocks restart.
    void insert(const Fingerprint& fp, std::vector<uint8_t> bytes);
    void insert(const Fingerprint& fp, Bytes bytes);

    size_t size() const;
    size_t capacity() const { return max_entries; }

    // Drops every expired entry; returns how many were removed.
    size_t purge_expired();
    void   clear();

private:
    struct Entry {
        Bytes     bytes;
        TimePoint inserted;
        TimePoint last_access;
        std::list<Fingerprint>::iterator lru_pos;
    };

    struct Shard {
        mutable std::mutex                                   mtx;
        std::unordered_map<Fingerprint, Entry, FingerprintHash> entries;
        std::list<Fingerprint>                               lru;   // front = most recent
    };

    Shard& shard_for(const Fingerprint& fp);
    bool   expired(const Entry& e, TimePoint now) const;
    void   erase_locked(Shard& s, std::unordered_map<Fingerprint, Entry, FingerprintHash>::iterator it);
    void   reserve_slot(TimePoint now);
    bool   evict_one(TimePoint now);

    std::vector<std::unique_ptr<Shard>> shards;
    size_t                              max_entries;
    std::atomic<size_t>                 reserved{0};   // stored entries + pending inserts
    std::chrono::seconds                ttl;
    std::chrono::seconds                tti;
    NowFn                               now;
};
