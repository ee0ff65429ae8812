#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace avatarlink {
namespace delivery {

struct CacheEntry {
    std::string provider;  // provider that produced the response
    std::string response_body;
    std::chrono::steady_clock::time_point stored_at;
    std::chrono::milliseconds ttl{0};

    bool expired(std::chrono::steady_clock::time_point now) const { return now - stored_at >= ttl; }
};

/**
 * @brief Short-lived memo of successful deliveries, keyed by fingerprint
 *
 * Absorbs duplicate submissions of the same utterance. Entries expire by
 * TTL. When the whole cache goes over capacity the least recently used
 * entry of the shard being written goes (or, if that shard holds only the
 * new entry, the LRU entry of another shard).
 * Only successful deliveries are stored (the caller's responsibility).
 *
 * The key space is split into shards, each with its own mutex and LRU list,
 * so concurrent lookups of different fingerprints rarely contend.
 */
class ResponseCache {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param capacity Total entry bound across all shards (min 1)
     * @param default_ttl TTL used by put() when none is given
     * @param shard_count Number of independently locked shards (min 1)
     */
    ResponseCache(size_t capacity, std::chrono::milliseconds default_ttl, size_t shard_count = 8);

    ResponseCache(const ResponseCache &) = delete;
    ResponseCache &operator=(const ResponseCache &) = delete;

    // Returns nullopt on miss or expiry; a hit refreshes recency.
    std::optional<CacheEntry> get(const std::string &fingerprint, Clock::time_point now = Clock::now());

    void put(const std::string &fingerprint, const std::string &provider, const std::string &response_body,
             Clock::time_point now = Clock::now());
    void put(const std::string &fingerprint, const std::string &provider, const std::string &response_body,
             std::chrono::milliseconds ttl, Clock::time_point now = Clock::now());

    size_t size() const;
    void clear();

    // Drop expired entries in every shard; returns how many were removed
    size_t purge_expired(Clock::time_point now = Clock::now());

    size_t capacity() const { return capacity_; }
    std::chrono::milliseconds default_ttl() const { return default_ttl_; }

private:
    struct Shard {
        mutable std::mutex mutex;
        // Front = most recently used
        std::list<std::string> lru;
        struct Slot {
            CacheEntry entry;
            std::list<std::string>::iterator position;
        };
        std::unordered_map<std::string, Slot> entries;
    };

    size_t shard_index(const std::string &fingerprint) const;

    // Caller holds shard.mutex
    void evict_lru(Shard &shard);

    const std::chrono::milliseconds default_ttl_;
    const size_t capacity_;
    std::atomic<size_t> entry_count_{0};
    std::vector<std::unique_ptr<Shard>> shards_;
};

}  // namespace delivery
}  // namespace avatarlink
