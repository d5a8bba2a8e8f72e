// src/cache/cache_manager.cpp

#include "tcrimer/cache/cache_manager.hpp"
#include "tcrimer/core/logger.hpp"

namespace tcrimer {

std::string cache_tier_to_string(CacheTier tier) {
    return tier == CacheTier::MEMORY ? "memory" : "session";
}

nlohmann::json CacheConfig::to_json() const {
    nlohmann::json j;
    j["memory_max_entries"] = memory_max_entries;
    j["memory_max_bytes"] = memory_max_bytes;
    j["session_max_entries"] = session_max_entries;
    j["session_max_bytes"] = session_max_bytes;
    j["default_ttl_ms"] = default_ttl.count();
    j["sweep_interval_ms"] = sweep_interval.count();
    return j;
}

void CacheConfig::from_json(const nlohmann::json& j) {
    if (j.contains("memory_max_entries"))
        memory_max_entries = j.at("memory_max_entries").get<size_t>();
    if (j.contains("memory_max_bytes"))
        memory_max_bytes = j.at("memory_max_bytes").get<size_t>();
    if (j.contains("session_max_entries"))
        session_max_entries = j.at("session_max_entries").get<size_t>();
    if (j.contains("session_max_bytes"))
        session_max_bytes = j.at("session_max_bytes").get<size_t>();
    if (j.contains("default_ttl_ms"))
        default_ttl = std::chrono::milliseconds(j.at("default_ttl_ms").get<int64_t>());
    if (j.contains("sweep_interval_ms"))
        sweep_interval = std::chrono::milliseconds(j.at("sweep_interval_ms").get<int64_t>());
}

CacheManager::CacheManager(CacheConfig config, std::shared_ptr<EventBus> event_bus,
                           ClockFunction clock)
    : config_(std::move(config)), event_bus_(std::move(event_bus)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return Clock::now(); };
    }
    tier_for(CacheTier::MEMORY).max_entries = config_.memory_max_entries;
    tier_for(CacheTier::MEMORY).max_bytes = config_.memory_max_bytes;
    tier_for(CacheTier::SESSION).max_entries = config_.session_max_entries;
    tier_for(CacheTier::SESSION).max_bytes = config_.session_max_bytes;

    if (config_.sweep_interval.count() > 0) {
        sweeper_ = std::thread(&CacheManager::sweep_loop, this);
    }
}

CacheManager::~CacheManager() {
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        stopping_ = true;
    }
    sweeper_cv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
}

void CacheManager::note_degraded(const std::string& operation, const std::string& key,
                                 const std::exception& e) {
    ++degraded_;
    const TcrimerError error(ErrorCode::CACHE_DEGRADED,
                             operation + " degraded to miss for '" + key + "': " + e.what(),
                             "CacheManager");
    WARN(error.to_string());
    if (!event_bus_) {
        return;
    }
    MonitoringEvent event;
    event.type = MonitoringEventType::CACHE_STATS;
    event.source = "CacheManager";
    event.timestamp = std::chrono::system_clock::now();
    event.string_fields["error_code"] = error_code_to_string(error.code());
    event.string_fields["operation"] = operation;
    event.string_fields["key"] = key;
    event.numeric_fields["degraded"] = static_cast<double>(degraded_.load());
    event_bus_->publish(std::move(event));
}

void CacheManager::erase_locked(Tier& tier, std::list<CacheEntry>::iterator it) {
    tier.bytes -= it->size_bytes;
    tier.index.erase(it->key);
    tier.entries.erase(it);
}

CacheEntry* CacheManager::find_locked(Tier& tier, const std::string& key, Clock::time_point now) {
    auto found = tier.index.find(key);
    if (found == tier.index.end()) {
        return nullptr;
    }
    auto it = found->second;
    if (it->expires_at && *it->expires_at <= now) {
        erase_locked(tier, it);
        ++counters_.expirations;
        return nullptr;
    }
    it->last_accessed_at = now;
    tier.entries.splice(tier.entries.begin(), tier.entries, it);
    return &*it;
}

bool CacheManager::insert_locked(CacheTier tier_kind, const std::string& key, CacheBlob value,
                                 std::optional<Clock::time_point> expires_at,
                                 Clock::time_point now) {
    Tier& tier = tier_for(tier_kind);
    const size_t size = key.size() + value.size();
    if (tier.max_entries == 0 || size > tier.max_bytes) {
        WARN("Value for '" << key << "' (" << size << " bytes) does not fit the "
                           << cache_tier_to_string(tier_kind) << " tier");
        return false;
    }

    auto existing = tier.index.find(key);
    if (existing != tier.index.end()) {
        erase_locked(tier, existing->second);
    }

    while (!tier.entries.empty() &&
           (tier.entries.size() + 1 > tier.max_entries || tier.bytes + size > tier.max_bytes)) {
        auto victim = std::prev(tier.entries.end());
        TRACE("Evicting '" << victim->key << "' from " << cache_tier_to_string(tier_kind)
                           << " tier");
        erase_locked(tier, victim);
        ++counters_.evictions;
    }

    CacheEntry entry;
    entry.key = key;
    entry.value = std::move(value);
    entry.tier = tier_kind;
    entry.created_at = now;
    entry.expires_at = expires_at;
    entry.last_accessed_at = now;
    entry.size_bytes = size;

    tier.entries.push_front(std::move(entry));
    tier.index[key] = tier.entries.begin();
    tier.bytes += size;
    return true;
}

CacheLookup CacheManager::get(const std::string& key) {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_();
        ++counters_.requests;

        if (CacheEntry* entry = find_locked(tier_for(CacheTier::MEMORY), key, now)) {
            ++counters_.hits;
            ++counters_.memory_hits;
            return CacheLookup{entry->value, true};
        }

        if (CacheEntry* entry = find_locked(tier_for(CacheTier::SESSION), key, now)) {
            ++counters_.hits;
            ++counters_.session_hits;
            CacheLookup lookup{entry->value, true};
            insert_locked(CacheTier::MEMORY, key, entry->value, entry->expires_at, now);
            return lookup;
        }

        ++counters_.misses;
        return CacheLookup{};
    } catch (const std::exception& e) {
        note_degraded("get", key, e);
        return CacheLookup{};
    }
}

bool CacheManager::put(const std::string& key, CacheBlob value,
                       std::optional<std::chrono::milliseconds> ttl, CacheTier tier) {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_();

        const auto effective_ttl = ttl.value_or(config_.default_ttl);
        std::optional<Clock::time_point> expires_at;
        if (effective_ttl.count() > 0) {
            expires_at = now + effective_ttl;
        }

        const CacheTier other = tier == CacheTier::MEMORY ? CacheTier::SESSION : CacheTier::MEMORY;
        auto stale = tier_for(other).index.find(key);
        if (stale != tier_for(other).index.end()) {
            erase_locked(tier_for(other), stale->second);
        }

        return insert_locked(tier, key, std::move(value), expires_at, now);
    } catch (const std::exception& e) {
        note_degraded("put", key, e);
        return false;
    }
}

bool CacheManager::invalidate(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = false;
    for (auto& tier : tiers_) {
        auto found = tier.index.find(key);
        if (found != tier.index.end()) {
            erase_locked(tier, found->second);
            removed = true;
        }
    }
    if (removed) {
        ++counters_.invalidations;
    }
    return removed;
}

size_t CacheManager::invalidate_prefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto& tier : tiers_) {
        for (auto it = tier.entries.begin(); it != tier.entries.end();) {
            if (it->key.compare(0, prefix.size(), prefix) == 0) {
                auto victim = it++;
                erase_locked(tier, victim);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    counters_.invalidations += removed;
    if (removed > 0) {
        DEBUG("Invalidated " << removed << " cache entries with prefix '" << prefix << "'");
    }
    return removed;
}

size_t CacheManager::cleanup_expired() {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_();
        size_t purged = 0;
        for (auto& tier : tiers_) {
            for (auto it = tier.entries.begin(); it != tier.entries.end();) {
                if (it->expires_at && *it->expires_at <= now) {
                    auto victim = it++;
                    erase_locked(tier, victim);
                    ++purged;
                } else {
                    ++it;
                }
            }
        }
        counters_.expirations += purged;
        return purged;
    } catch (const std::exception& e) {
        note_degraded("cleanup", "*", e);
        return 0;
    }
}

void CacheManager::clear(std::optional<CacheTier> tier) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (CacheTier kind : {CacheTier::MEMORY, CacheTier::SESSION}) {
        if (tier && *tier != kind) {
            continue;
        }
        Tier& target = tier_for(kind);
        target.entries.clear();
        target.index.clear();
        target.bytes = 0;
    }
}

bool CacheManager::contains(const std::string& key, CacheTier tier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Tier& target = tier_for(tier);
    return target.index.find(key) != target.index.end();
}

CacheStats CacheManager::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats result = counters_;
    result.degraded = degraded_.load();
    result.memory_entries = tier_for(CacheTier::MEMORY).entries.size();
    result.memory_bytes = tier_for(CacheTier::MEMORY).bytes;
    result.session_entries = tier_for(CacheTier::SESSION).entries.size();
    result.session_bytes = tier_for(CacheTier::SESSION).bytes;
    return result;
}

void CacheManager::publish_stats() {
    if (!event_bus_) {
        return;
    }
    const CacheStats s = stats();
    MonitoringEvent event;
    event.type = MonitoringEventType::CACHE_STATS;
    event.source = "CacheManager";
    event.timestamp = std::chrono::system_clock::now();
    event.numeric_fields["requests"] = static_cast<double>(s.requests);
    event.numeric_fields["hits"] = static_cast<double>(s.hits);
    event.numeric_fields["misses"] = static_cast<double>(s.misses);
    event.numeric_fields["hit_rate"] = s.hit_rate();
    event.numeric_fields["evictions"] = static_cast<double>(s.evictions);
    event.numeric_fields["degraded"] = static_cast<double>(s.degraded);
    event.numeric_fields["memory_entries"] = static_cast<double>(s.memory_entries);
    event.numeric_fields["memory_bytes"] = static_cast<double>(s.memory_bytes);
    event.numeric_fields["session_entries"] = static_cast<double>(s.session_entries);
    event.numeric_fields["session_bytes"] = static_cast<double>(s.session_bytes);
    event_bus_->publish(std::move(event));
}

std::string CacheManager::make_key(const std::string& prefix, const nlohmann::json& params) {
    if (params.is_null() || (params.is_object() && params.empty())) {
        return prefix;
    }
    return prefix + ":" + params.dump();
}

Result<CacheBlob> CacheManager::get_or_load(const std::string& key, const Loader& loader,
                                            std::optional<std::chrono::milliseconds> ttl,
                                            CacheTier tier) {
    auto lookup = get(key);
    if (lookup.hit) {
        return std::move(lookup.value);
    }

    auto loaded = loader();
    if (loaded.is_error()) {
        return loaded;
    }
    put(key, loaded.value(), ttl, tier);
    return loaded;
}

void CacheManager::sweep_loop() {
    Logger::register_component("CacheSweeper");
    std::unique_lock<std::mutex> lock(sweeper_mutex_);
    while (!stopping_) {
        sweeper_cv_.wait_for(lock, config_.sweep_interval, [this] { return stopping_; });
        if (stopping_) {
            break;
        }
        lock.unlock();
        size_t purged = cleanup_expired();
        if (purged > 0) {
            DEBUG("Cache sweep purged " << purged << " expired entries");
        }
        lock.lock();
    }
}

}  // namespace tcrimer
