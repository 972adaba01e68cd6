#ifndef TETHER_CORE_DISCOVERY_CACHE_HPP
#define TETHER_CORE_DISCOVERY_CACHE_HPP

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include "tether/utils/logging.hpp"

namespace tether {
namespace core {

/**
 * @brief Where a DiscoveryResult came from
 */
enum class DiscoverySource {
    Fresh,  ///< refresh function just ran
    Cache,  ///< entry still within its ttl
    Stale,  ///< expired entry served because a refresh was not possible
    None    ///< no data at all
};

inline const char* toString(DiscoverySource source) {
    switch (source) {
        case DiscoverySource::Fresh: return "fresh";
        case DiscoverySource::Cache: return "cache";
        case DiscoverySource::Stale: return "stale";
        case DiscoverySource::None: return "none";
    }
    return "none";
}

template <typename T>
struct DiscoveryEntry {
    T payload;
    std::chrono::system_clock::time_point cachedAt;
    std::chrono::seconds ttl{0};
};

/**
 * @brief Answer of DiscoveryCache::getOrRefresh
 *
 * An empty payload means "no data yet"; a payload with a warning means
 * "data temporarily unavailable, showing the last known value".
 */
template <typename T>
struct DiscoveryResult {
    std::optional<T> payload;
    bool cached{false};
    std::optional<std::chrono::system_clock::time_point> cachedAt;
    std::optional<std::string> warning;
    DiscoverySource source{DiscoverySource::None};

    bool hasData() const { return payload.has_value(); }
};

/**
 * @brief Statistics about discovery cache use.
 */
struct DiscoveryStats {
    std::size_t hits{0};          ///< Served within ttl
    std::size_t refreshes{0};     ///< Successful refresh calls
    std::size_t failures{0};      ///< Refresh calls that threw
    std::size_t staleServed{0};   ///< Expired entries served instead of refreshing
    std::size_t skippedDown{0};   ///< Refreshes skipped because the connection was down
};

/**
 * @brief TTL cache for expensive "enumerate sub-resources" calls.
 *
 * Entries are keyed by (connection id, resource key). When an entry is missing
 * or expired the cache asks the liveness probe whether the connection is up; a
 * refresh is only attempted against a live connection. Whenever a refresh
 * cannot produce data the last known entry is served with a warning.
 *
 * The refresh function runs without the cache lock held.
 */
template <typename T>
class DiscoveryCache {
public:
    using Clock = std::chrono::system_clock;
    using TimeSource = std::function<Clock::time_point()>;
    using LivenessProbe = std::function<bool(const std::string& connectionId)>;
    using RefreshFn = std::function<T()>;

    explicit DiscoveryCache(LivenessProbe isLive, TimeSource now = &Clock::now)
        : isLive_(std::move(isLive)), now_(std::move(now)) {}

    DiscoveryCache(const DiscoveryCache&) = delete;
    DiscoveryCache& operator=(const DiscoveryCache&) = delete;

    /**
     * @brief Return a cached payload or refresh it
     *
     * @param connectionId Owning connection
     * @param resourceKey What is being enumerated, e.g. "cameras"
     * @param refresh Produces a fresh payload; may throw
     * @param ttl How long a refreshed payload is served without refreshing
     * @param forceRefresh Skip the ttl check. The down-connection and failure
     *        fallbacks still apply.
     */
    DiscoveryResult<T> getOrRefresh(const std::string& connectionId,
                                    const std::string& resourceKey,
                                    const RefreshFn& refresh,
                                    std::chrono::seconds ttl,
                                    bool forceRefresh = false) {
        const Key key{connectionId, resourceKey};
        std::optional<DiscoveryEntry<T>> previous;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(key);
            if (it != entries_.end()) {
                if (!forceRefresh && now_() - it->second.cachedAt < it->second.ttl) {
                    ++stats_.hits;
                    TLOG_DEBUG("Discovery cache hit for " << connectionId << "/" << resourceKey);
                    return fromEntry(it->second, DiscoverySource::Cache, std::nullopt);
                }
                previous = it->second;
            }
        }

        if (isLive_ && !isLive_(connectionId)) {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.skippedDown;
            return fallback(previous, "Connection " + connectionId + " is down");
        }

        std::string failure;
        try {
            T payload = refresh();
            DiscoveryEntry<T> entry{std::move(payload), now_(), ttl};
            DiscoveryResult<T> result = fromEntry(entry, DiscoverySource::Fresh, std::nullopt);
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.refreshes;
            entries_[key] = std::move(entry);
            return result;
        } catch (const std::exception& e) {
            failure = e.what();
        }

        TLOG_WARN("Discovery refresh for " << connectionId << "/" << resourceKey << " failed: " << failure);
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.failures;
        return fallback(previous, failure);
    }

    std::optional<DiscoveryEntry<T>> peek(const std::string& connectionId, const std::string& resourceKey) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(Key{connectionId, resourceKey});
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void invalidate(const std::string& connectionId, const std::string& resourceKey) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.erase(Key{connectionId, resourceKey});
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    DiscoveryStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    using Key = std::pair<std::string, std::string>;

    static DiscoveryResult<T> fromEntry(const DiscoveryEntry<T>& entry,
                                        DiscoverySource source,
                                        std::optional<std::string> warning) {
        DiscoveryResult<T> result;
        result.payload = entry.payload;
        result.cached = source != DiscoverySource::Fresh;
        result.cachedAt = entry.cachedAt;
        result.warning = std::move(warning);
        result.source = source;
        return result;
    }

    // Caller holds mutex_
    DiscoveryResult<T> fallback(const std::optional<DiscoveryEntry<T>>& previous, const std::string& reason) {
        if (previous) {
            ++stats_.staleServed;
            return fromEntry(*previous, DiscoverySource::Stale, reason + " - returning cached results");
        }
        DiscoveryResult<T> result;
        result.source = DiscoverySource::None;
        result.warning = reason + " - no cached results available";
        return result;
    }

    LivenessProbe isLive_;
    TimeSource now_;
    mutable std::mutex mutex_;
    std::map<Key, DiscoveryEntry<T>> entries_;
    DiscoveryStats stats_;
};

} // namespace core
} // namespace tether

#endif // TETHER_CORE_DISCOVERY_CACHE_HPP
