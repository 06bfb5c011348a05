#include "fingerprint_cache.hpp"

#include <algorithm>
#include <thread>
#include <utility>

FingerprintCache::FingerprintCache(const Options& opts, NowFn now_fn)
    : max_entries(std::max<size_t>(opts.capacity, 1)),
      ttl(opts.time_to_live), tti(opts.time_to_idle), now(std::move(now_fn))
{
    // More shards than entries would only leave shards that can never fill.
    const size_t n = std::min(static_cast<size_t>(std::max(opts.shards, 1)), max_entries);

    shards.reserve(n);
    for (size_t i = 0; i < n; ++i)
        shards.push_back(std::make_unique<Shard>());
}

FingerprintCache::Shard& FingerprintCache::shard_for(const Fingerprint& fp)
{
    return *shards[FingerprintHash{}(fp) % shards.size()];
}

bool FingerprintCache::expired(const Entry& e, TimePoint t) const
{
    return t - e.inserted >= ttl || t - e.last_access >= tti;
}

void FingerprintCache::erase_locked(
    Shard& s, std::unordered_map<Fingerprint, Entry, FingerprintHash>::iterator it)
{
    s.lru.erase(it->second.lru_pos);
    s.entries.erase(it);
    reserved.fetch_sub(1);
}

// Removes one entry to free a slot. Idle expiry follows LRU order, so expired
// entries collect at the back of each shard and are taken before any live
// entry. Otherwise the victim is the shard tail with the oldest last access.
// Shards are locked one at a time.
bool FingerprintCache::evict_one(TimePoint t)
{
    for (auto& s : shards) {
        std::lock_guard<std::mutex> lock(s->mtx);
        if (s->lru.empty()) continue;
        auto it = s->entries.find(s->lru.back());
        if (expired(it->second, t)) {
            erase_locked(*s, it);
            return true;
        }
    }

    Shard*    victim = nullptr;
    TimePoint oldest = TimePoint::max();
    for (auto& s : shards) {
        std::lock_guard<std::mutex> lock(s->mtx);
        if (s->lru.empty()) continue;
        const TimePoint seen = s->entries.find(s->lru.back())->second.last_access;
        if (seen < oldest) {
            oldest = seen;
            victim = s.get();
        }
    }
    if (!victim)
        return false;

    std::lock_guard<std::mutex> lock(victim->mtx);
    if (victim->lru.empty())
        return false;
    erase_locked(*victim, victim->entries.find(victim->lru.back()));
    return true;
}

void FingerprintCache::reserve_slot(TimePoint t)
{
    for (;;) {
        size_t held = reserved.load();
        while (held < max_entries) {
            if (reserved.compare_exchange_weak(held, held + 1))
                return;
        }
        // Every slot is taken by a stored entry or by another insert that
        // has reserved but not yet stored.
        if (!evict_one(t))
            std::this_thread::yield();
    }
}

FingerprintCache::Bytes FingerprintCache::lookup(const Fingerprint& fp)
{
    Shard& s = shard_for(fp);
    const TimePoint t = now();

    std::lock_guard<std::mutex> lock(s.mtx);
    auto it = s.entries.find(fp);
    if (it == s.entries.end())
        return nullptr;

    if (expired(it->second, t)) {
        erase_locked(s, it);
        return nullptr;
    }

    it->second.last_access = t;
    s.lru.splice(s.lru.begin(), s.lru, it->second.lru_pos);
    return it->second.bytes;
}

void FingerprintCache::insert(const Fingerprint& fp, std::vector<uint8_t> bytes)
{
    insert(fp, std::make_shared<const std::vector<uint8_t>>(std::move(bytes)));
}

void FingerprintCache::insert(const Fingerprint& fp, Bytes bytes)
{
    Shard& s = shard_for(fp);
    const TimePoint t = now();

    auto replace_locked = [&](Entry& e) {
        e.bytes       = std::move(bytes);
        e.inserted    = t;
        e.last_access = t;
        s.lru.splice(s.lru.begin(), s.lru, e.lru_pos);
    };

    {
        std::lock_guard<std::mutex> lock(s.mtx);
        auto it = s.entries.find(fp);
        if (it != s.entries.end()) {
            replace_locked(it->second);
            return;
        }
    }

    reserve_slot(t);

    std::lock_guard<std::mutex> lock(s.mtx);
    auto it = s.entries.find(fp);
    if (it != s.entries.end()) {
        // Another insert stored the same key while the slot was reserved.
        reserved.fetch_sub(1);
        replace_locked(it->second);
        return;
    }
    s.lru.push_front(fp);
    s.entries.emplace(fp, Entry{std::move(bytes), t, t, s.lru.begin()});
}

size_t FingerprintCache::size() const
{
    size_t total = 0;
    for (const auto& s : shards) {
        std::lock_guard<std::mutex> lock(s->mtx);
        total += s->entries.size();
    }
    return total;
}

size_t FingerprintCache::purge_expired()
{
    const TimePoint t = now();
    size_t removed = 0;
    for (auto& s : shards) {
        std::lock_guard<std::mutex> lock(s->mtx);
        for (auto it = s->entries.begin(); it != s->entries.end();) {
            if (expired(it->second, t)) {
                s->lru.erase(it->second.lru_pos);
                it = s->entries.erase(it);
                reserved.fetch_sub(1);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

void FingerprintCache::clear()
{
    for (auto& s : shards) {
        std::lock_guard<std::mutex> lock(s->mtx);
        reserved.fetch_sub(s->entries.size());
        s->entries.clear();
        s->lru.clear();
    }
}
