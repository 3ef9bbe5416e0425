#pragma once

#include "signspace/logging.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace signspace {

enum class CacheLevel : uint8_t {
    L1 = 0,          // small, recency-based
    L2 = 1,          // mid-size, frequency-based
    Predictive = 2   // large, adaptive, filled by preload
};

constexpr size_t CACHE_LEVEL_COUNT = 3;

enum class EvictionPolicy : uint8_t {
    LRU = 0,
    LFU = 1,
    FIFO = 2,
    ADAPTIVE = 3
};

enum class PreloadStrategy : uint8_t {
    None = 0,
    Adjacent = 1,   // keys read just before this one
    Pattern = 2,    // keys that historically followed this one
    Hybrid = 3
};

inline const char* cache_level_name(CacheLevel level) noexcept {
    switch (level) {
        case CacheLevel::L1: return "l1";
        case CacheLevel::L2: return "l2";
        case CacheLevel::Predictive: return "predictive";
    }
    return "unknown";
}

struct TierConfig {
    size_t max_size = 0;                         // 0 disables the tier
    EvictionPolicy policy = EvictionPolicy::LRU;
    std::chrono::milliseconds ttl{0};            // 0 = no expiry
};

struct CacheConfig {
    TierConfig l1{100, EvictionPolicy::LRU, std::chrono::milliseconds(60000)};
    TierConfig l2{500, EvictionPolicy::LFU, std::chrono::milliseconds(300000)};
    TierConfig predictive{200, EvictionPolicy::ADAPTIVE, std::chrono::milliseconds(600000)};
    PreloadStrategy preload = PreloadStrategy::Pattern;

    const TierConfig& tier(CacheLevel level) const noexcept {
        switch (level) {
            case CacheLevel::L1: return l1;
            case CacheLevel::L2: return l2;
            case CacheLevel::Predictive: return predictive;
        }
        return l1;
    }
};

struct CacheStats {
    std::array<uint64_t, CACHE_LEVEL_COUNT> hits{};
    std::array<uint64_t, CACHE_LEVEL_COUNT> evictions{};
    std::array<size_t, CACHE_LEVEL_COUNT> item_count{};
    uint64_t misses = 0;
    uint64_t expirations = 0;
    uint64_t preload_count = 0;

    uint64_t total_hits() const noexcept { return hits[0] + hits[1] + hits[2]; }
    uint64_t total_evictions() const noexcept { return evictions[0] + evictions[1] + evictions[2]; }
    size_t total_items() const noexcept { return item_count[0] + item_count[1] + item_count[2]; }

    double hit_ratio() const noexcept {
        const uint64_t requests = total_hits() + misses;
        return requests > 0 ? static_cast<double>(total_hits()) / static_cast<double>(requests) : 0.0;
    }
};

/**
 * Three-tier in-memory cache shared between concurrent callers.
 *
 * Lookups walk L1 -> L2 -> Predictive; hits below L1 are promoted to L1.
 * Each tier evicts with its own policy once full, entries expire after the
 * tier TTL, and successful lookups feed an access-pattern table used to
 * preload related keys into the predictive tier through an optional loader.
 *
 * Values are stored as shared_ptr<const T>: a cached value is never mutated
 * in place. Every public call holds one mutex for the whole tier update; the
 * loader runs outside the lock.
 */
template<typename T>
class MultiLevelCache {
public:
    using ValuePtr = std::shared_ptr<const T>;
    using Loader = std::function<ValuePtr(const std::string&)>;
    using Clock = std::chrono::steady_clock;

    static constexpr size_t MAX_PATTERN_FANOUT = 8;
    static constexpr size_t ACCESS_HISTORY = 5;

    explicit MultiLevelCache(CacheConfig config = {}) : config_(std::move(config)) {}

    MultiLevelCache(const MultiLevelCache&) = delete;
    MultiLevelCache& operator=(const MultiLevelCache&) = delete;

    void set_loader(Loader loader) {
        std::lock_guard<std::mutex> lock(mutex_);
        loader_ = std::move(loader);
    }

    bool set(const std::string& key, T value, CacheLevel level = CacheLevel::L1) {
        return set(key, std::make_shared<const T>(std::move(value)), level);
    }

    // Returns false when the target tier is disabled
    bool set(const std::string& key, ValuePtr value, CacheLevel level = CacheLevel::L1) {
        std::vector<std::string> related;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!insert_locked(level, key, std::move(value))) return false;
            if (level == CacheLevel::L1) related = preload_candidates_locked(key);
        }
        run_preload(related);
        return true;
    }

    ValuePtr get(const std::string& key) {
        ValuePtr result;
        std::vector<std::string> related;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto now = Clock::now();

            for (size_t i = 0; i < CACHE_LEVEL_COUNT && !result; ++i) {
                const auto level = static_cast<CacheLevel>(i);
                auto& tier = tiers_[i];
                auto it = tier.find(key);
                if (it == tier.end()) continue;

                if (expired(it->second, now)) {
                    tier.erase(it);
                    ++stats_.expirations;
                    --stats_.item_count[i];
                    continue;
                }

                it->second.last_access = now;
                it->second.last_access_seq = ++sequence_;
                ++it->second.access_count;
                result = it->second.value;
                ++stats_.hits[i];

                if (level != CacheLevel::L1 && insert_locked(CacheLevel::L1, key, result)) {
                    related = preload_candidates_locked(key);
                }
            }

            if (result) {
                record_access_locked(key);
            } else {
                ++stats_.misses;
                forget_pattern_locked(key);
            }
        }
        run_preload(related);
        return result;
    }

    // Presence in any tier, ignoring expiry; does not touch statistics
    bool contains(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return contains_locked(key);
    }

    bool contains(const std::string& key, CacheLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tiers_[static_cast<size_t>(level)].count(key) != 0;
    }

    // Removes the key from every tier; true if it was present anywhere
    bool remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        bool removed = false;
        for (size_t i = 0; i < CACHE_LEVEL_COUNT; ++i) {
            if (tiers_[i].erase(key) != 0) {
                --stats_.item_count[i];
                removed = true;
            }
        }
        patterns_.erase(key);
        return removed;
    }

    size_t purge_expired() {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = Clock::now();
        size_t purged = 0;
        std::vector<std::string> purged_keys;
        for (size_t i = 0; i < CACHE_LEVEL_COUNT; ++i) {
            auto& tier = tiers_[i];
            for (auto it = tier.begin(); it != tier.end();) {
                if (expired(it->second, now)) {
                    purged_keys.push_back(it->first);
                    it = tier.erase(it);
                    --stats_.item_count[i];
                    ++purged;
                } else {
                    ++it;
                }
            }
        }
        stats_.expirations += purged;
        for (const auto& key : purged_keys) forget_pattern_locked(key);
        if (purged > 0) {
            LOG_DEBUG("Purged ", purged, " expired cache entries");
        }
        return purged;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& tier : tiers_) tier.clear();
        stats_.item_count.fill(0);
        patterns_.clear();
        history_.clear();
    }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    size_t size(CacheLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tiers_[static_cast<size_t>(level)].size();
    }

    // Keys with a recorded follower set
    size_t pattern_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return patterns_.size();
    }

    const CacheConfig& config() const noexcept { return config_; }

private:
    struct Entry {
        ValuePtr value;
        Clock::time_point inserted;
        Clock::time_point last_access;
        uint64_t insert_seq = 0;
        uint64_t last_access_seq = 0;
        uint64_t access_count = 0;
        std::optional<Clock::time_point> expires_at;
    };

    using Tier = std::unordered_map<std::string, Entry>;

    static bool expired(const Entry& entry, Clock::time_point now) noexcept {
        return entry.expires_at && *entry.expires_at <= now;
    }

    bool contains_locked(const std::string& key) const {
        for (const auto& tier : tiers_) {
            if (tier.count(key) != 0) return true;
        }
        return false;
    }

    bool insert_locked(CacheLevel level, const std::string& key, ValuePtr value) {
        const size_t index = static_cast<size_t>(level);
        const TierConfig& tier_config = config_.tier(level);
        if (tier_config.max_size == 0) return false;

        auto& tier = tiers_[index];
        const auto now = Clock::now();

        auto existing = tier.find(key);
        if (existing == tier.end()) {
            while (tier.size() >= tier_config.max_size) {
                evict_one_locked(level);
            }
        }

        Entry entry;
        entry.value = std::move(value);
        entry.inserted = now;
        entry.last_access = now;
        entry.insert_seq = ++sequence_;
        entry.last_access_seq = entry.insert_seq;
        if (tier_config.ttl.count() > 0) {
            entry.expires_at = now + tier_config.ttl;
        }

        if (existing != tier.end()) {
            entry.access_count = existing->second.access_count;
            existing->second = std::move(entry);
        } else {
            tier.emplace(key, std::move(entry));
            ++stats_.item_count[index];
        }
        return true;
    }

    void evict_one_locked(CacheLevel level) {
        const size_t index = static_cast<size_t>(level);
        auto& tier = tiers_[index];
        if (tier.empty()) return;

        const auto now = Clock::now();
        const EvictionPolicy policy = config_.tier(level).policy;

        // Higher score = evicted first; ties go to the older insertion
        auto score = [&](const Entry& e) -> double {
            switch (policy) {
                case EvictionPolicy::LRU:
                    return -static_cast<double>(e.last_access_seq);
                case EvictionPolicy::LFU:
                    return -static_cast<double>(e.access_count);
                case EvictionPolicy::FIFO:
                    return -static_cast<double>(e.insert_seq);
                case EvictionPolicy::ADAPTIVE: {
                    const double age_minutes =
                        std::chrono::duration<double>(now - e.last_access).count() / 60.0;
                    return age_minutes * 0.5 + 0.3 / static_cast<double>(e.access_count + 1);
                }
            }
            return 0.0;
        };

        auto victim = tier.begin();
        double victim_score = score(victim->second);
        for (auto it = std::next(tier.begin()); it != tier.end(); ++it) {
            const double s = score(it->second);
            if (s > victim_score ||
                (s == victim_score && it->second.insert_seq < victim->second.insert_seq)) {
                victim = it;
                victim_score = s;
            }
        }

        LOG_DEBUG("Evicting '", victim->first, "' from ", cache_level_name(level));
        const std::string key = victim->first;
        tier.erase(victim);
        --stats_.item_count[index];
        ++stats_.evictions[index];
        forget_pattern_locked(key);
    }

    // Pattern rows live only as long as their key is cached somewhere
    void forget_pattern_locked(const std::string& key) {
        if (!contains_locked(key)) patterns_.erase(key);
    }

    void record_access_locked(const std::string& key) {
        if (!history_.empty() && history_.back() != key && contains_locked(history_.back())) {
            auto& followers = patterns_[history_.back()];
            if (followers.size() < MAX_PATTERN_FANOUT) followers.insert(key);
        }
        history_.push_back(key);
        if (history_.size() > ACCESS_HISTORY) history_.pop_front();
    }

    std::vector<std::string> preload_candidates_locked(const std::string& key) const {
        std::vector<std::string> candidates;
        if (!loader_ || config_.predictive.max_size == 0) return candidates;

        const PreloadStrategy strategy = config_.preload;
        if (strategy == PreloadStrategy::Pattern || strategy == PreloadStrategy::Hybrid) {
            auto it = patterns_.find(key);
            if (it != patterns_.end()) {
                candidates.insert(candidates.end(), it->second.begin(), it->second.end());
            }
        }
        if (strategy == PreloadStrategy::Adjacent || strategy == PreloadStrategy::Hybrid) {
            for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
                if (*it != key) candidates.push_back(*it);
            }
        }

        std::sort(candidates.begin(), candidates.end());
        candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [this](const std::string& k) { return contains_locked(k); }),
                         candidates.end());
        return candidates;
    }

    void run_preload(const std::vector<std::string>& keys) {
        if (keys.empty()) return;

        Loader loader;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            loader = loader_;
        }
        if (!loader) return;

        for (const auto& key : keys) {
            ValuePtr value;
            try {
                value = loader(key);
            } catch (const std::exception& e) {
                LOG_WARN("Preload of '", key, "' failed: ", e.what());
                continue;
            }
            if (!value) continue;

            std::lock_guard<std::mutex> lock(mutex_);
            if (contains_locked(key)) continue;
            if (insert_locked(CacheLevel::Predictive, key, std::move(value))) {
                ++stats_.preload_count;
            }
        }
    }

    CacheConfig config_;
    mutable std::mutex mutex_;
    std::array<Tier, CACHE_LEVEL_COUNT> tiers_;
    CacheStats stats_;
    uint64_t sequence_ = 0;
    Loader loader_;
    std::unordered_map<std::string, std::set<std::string>> patterns_;
    std::deque<std::string> history_;
};

} // namespace signspace
