// include/tcrimer/cache/cache_manager.hpp
#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "tcrimer/core/config_base.hpp"
#include "tcrimer/core/error.hpp"
#include "tcrimer/core/event_bus.hpp"

namespace tcrimer {

enum class CacheTier { MEMORY, SESSION };

std::string cache_tier_to_string(CacheTier tier);

using CacheBlob = std::vector<uint8_t>;

struct CacheConfig : public ConfigBase {
    size_t memory_max_entries{1000};
    size_t memory_max_bytes{64 * 1024 * 1024};
    size_t session_max_entries{10000};
    size_t session_max_bytes{256 * 1024 * 1024};
    std::chrono::milliseconds default_ttl{std::chrono::seconds(300)};  // 0 = no expiry
    std::chrono::milliseconds sweep_interval{0};                        // 0 = no sweeper

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

struct CacheEntry {
    using TimePoint = std::chrono::steady_clock::time_point;

    std::string key;
    CacheBlob value;
    CacheTier tier{CacheTier::MEMORY};
    TimePoint created_at;
    std::optional<TimePoint> expires_at;
    TimePoint last_accessed_at;
    size_t size_bytes{0};
};

struct CacheLookup {
    CacheBlob value;
    bool hit{false};
};

struct CacheStats {
    uint64_t requests{0};
    uint64_t hits{0};
    uint64_t misses{0};
    uint64_t memory_hits{0};
    uint64_t session_hits{0};
    uint64_t evictions{0};
    uint64_t expirations{0};
    uint64_t invalidations{0};
    uint64_t degraded{0};
    size_t memory_entries{0};
    size_t memory_bytes{0};
    size_t session_entries{0};
    size_t session_bytes{0};

    double hit_rate() const {
        return requests == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(requests);
    }
};

/**
 * @brief Two-tier LRU cache with TTL and explicit invalidation
 *
 * Lookups check the memory tier, then the session tier; a session hit is
 * copied into the memory tier. Each tier evicts least recently used entries
 * synchronously on insert, so neither ever exceeds its entry or byte bound.
 * Expired entries read as misses and are purged when touched or swept.
 *
 * All operations are safe for concurrent use and never fail: an internal
 * fault is logged and reads as a miss.
 */
class CacheManager {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFunction = std::function<Clock::time_point()>;
    using Loader = std::function<Result<CacheBlob>()>;

    /**
     * @param clock Time source; defaults to steady_clock, replaceable in tests
     */
    explicit CacheManager(CacheConfig config = {}, std::shared_ptr<EventBus> event_bus = nullptr,
                          ClockFunction clock = nullptr);
    ~CacheManager();

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    CacheLookup get(const std::string& key);

    /**
     * @brief Store a value
     *
     * An omitted ttl uses the configured default; an explicit zero means no
     * expiry. Storing into one tier drops any copy of the key held by the
     * other tier.
     * @return false if the value was not stored (too large, or degraded)
     */
    bool put(const std::string& key, CacheBlob value,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt,
             CacheTier tier = CacheTier::MEMORY);

    /**
     * @return true if an entry was removed from either tier
     */
    bool invalidate(const std::string& key);

    /**
     * @return Number of entries removed across both tiers
     */
    size_t invalidate_prefix(const std::string& prefix);

    /**
     * @brief Purge expired entries from both tiers
     * @return Number of entries purged
     */
    size_t cleanup_expired();

    void clear(std::optional<CacheTier> tier = std::nullopt);

    bool contains(const std::string& key, CacheTier tier) const;

    CacheStats stats() const;

    /**
     * @brief Emit a CACHE_STATS event to the event bus, if any
     */
    void publish_stats();

    /**
     * @brief Deterministic key from a prefix and a parameter object
     *
     * nlohmann::json objects serialize with sorted keys, so equal
     * parameters always give equal keys.
     */
    static std::string make_key(const std::string& prefix, const nlohmann::json& params);

    /**
     * @brief Return the cached value or load, store and return it
     *
     * Loader errors are returned unchanged and nothing is cached.
     */
    Result<CacheBlob> get_or_load(const std::string& key, const Loader& loader,
                                  std::optional<std::chrono::milliseconds> ttl = std::nullopt,
                                  CacheTier tier = CacheTier::MEMORY);

    const CacheConfig& config() const {
        return config_;
    }

private:
    struct Tier {
        size_t max_entries{0};
        size_t max_bytes{0};
        std::list<CacheEntry> entries;  // most recently used first
        std::unordered_map<std::string, std::list<CacheEntry>::iterator> index;
        size_t bytes{0};
    };

    Tier& tier_for(CacheTier tier) {
        return tiers_[static_cast<size_t>(tier)];
    }
    const Tier& tier_for(CacheTier tier) const {
        return tiers_[static_cast<size_t>(tier)];
    }

    // Requires mutex_. Returns the live entry, purging it if expired.
    CacheEntry* find_locked(Tier& tier, const std::string& key, Clock::time_point now);
    bool insert_locked(CacheTier tier, const std::string& key, CacheBlob value,
                       std::optional<Clock::time_point> expires_at, Clock::time_point now);
    void erase_locked(Tier& tier, std::list<CacheEntry>::iterator it);
    void note_degraded(const std::string& operation, const std::string& key,
                       const std::exception& e);
    void sweep_loop();

    CacheConfig config_;
    std::shared_ptr<EventBus> event_bus_;
    ClockFunction clock_;

    mutable std::mutex mutex_;
    std::array<Tier, 2> tiers_;
    CacheStats counters_;  // counters only; occupancy is read from tiers_
    std::atomic<uint64_t> degraded_{0};

    std::thread sweeper_;
    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    bool stopping_{false};
};

}  // namespace tcrimer
