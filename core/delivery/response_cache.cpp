#include "response_cache.hpp"

#include <algorithm>
#include <functional>

#include "logging/logger.hpp"

namespace avatarlink {
namespace delivery {

ResponseCache::ResponseCache(size_t capacity, std::chrono::milliseconds default_ttl, size_t shard_count)
    : default_ttl_(default_ttl), capacity_(std::max<size_t>(1, capacity)) {
    const size_t shards = std::max<size_t>(1, shard_count);

    shards_.reserve(shards);
    for (size_t i = 0; i < shards; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

size_t ResponseCache::shard_index(const std::string &fingerprint) const {
    return std::hash<std::string>{}(fingerprint) % shards_.size();
}

void ResponseCache::evict_lru(Shard &shard) {
    const std::string &victim = shard.lru.back();
    LOG_DEBUG("[Cache] Evicting " << victim.substr(0, 12));
    shard.entries.erase(victim);
    shard.lru.pop_back();
    entry_count_--;
}

std::optional<CacheEntry> ResponseCache::get(const std::string &fingerprint, Clock::time_point now) {
    Shard &shard = *shards_[shard_index(fingerprint)];
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.entries.find(fingerprint);
    if (it == shard.entries.end()) {
        return std::nullopt;
    }

    if (it->second.entry.expired(now)) {
        shard.lru.erase(it->second.position);
        shard.entries.erase(it);
        entry_count_--;
        return std::nullopt;
    }

    shard.lru.splice(shard.lru.begin(), shard.lru, it->second.position);
    return it->second.entry;
}

void ResponseCache::put(const std::string &fingerprint, const std::string &provider,
                        const std::string &response_body, Clock::time_point now) {
    put(fingerprint, provider, response_body, default_ttl_, now);
}

void ResponseCache::put(const std::string &fingerprint, const std::string &provider,
                        const std::string &response_body, std::chrono::milliseconds ttl, Clock::time_point now) {
    if (ttl.count() <= 0) {
        return;
    }

    const size_t home = shard_index(fingerprint);
    {
        Shard &shard = *shards_[home];
        std::lock_guard<std::mutex> lock(shard.mutex);

        CacheEntry entry{provider, response_body, now, ttl};

        auto it = shard.entries.find(fingerprint);
        if (it != shard.entries.end()) {
            it->second.entry = std::move(entry);
            shard.lru.splice(shard.lru.begin(), shard.lru, it->second.position);
            return;
        }

        shard.lru.push_front(fingerprint);
        shard.entries.emplace(fingerprint, Shard::Slot{std::move(entry), shard.lru.begin()});
        entry_count_++;

        // The new entry sits at the front, so it is never its own victim
        while (entry_count_.load() > capacity_ && shard.entries.size() > 1) {
            evict_lru(shard);
        }
    }

    // Home shard held only the new entry; take victims elsewhere, one lock at a time
    for (size_t step = 1; step < shards_.size() && entry_count_.load() > capacity_; ++step) {
        Shard &other = *shards_[(home + step) % shards_.size()];
        std::lock_guard<std::mutex> lock(other.mutex);
        while (entry_count_.load() > capacity_ && !other.entries.empty()) {
            evict_lru(other);
        }
    }
}

size_t ResponseCache::size() const {
    size_t total = 0;
    for (const auto &shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->entries.size();
    }
    return total;
}

void ResponseCache::clear() {
    for (auto &shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        entry_count_ -= shard->entries.size();
        shard->entries.clear();
        shard->lru.clear();
    }
}

size_t ResponseCache::purge_expired(Clock::time_point now) {
    size_t removed = 0;
    for (auto &shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (auto it = shard->entries.begin(); it != shard->entries.end();) {
            if (it->second.entry.expired(now)) {
                shard->lru.erase(it->second.position);
                it = shard->entries.erase(it);
                entry_count_--;
                ++removed;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

}  // namespace delivery
}  // namespace avatarlink
