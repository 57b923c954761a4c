// include/utils/ttl_cache.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace utils {

/**
 * Key -> value store with per-entry expiry and single-flight loading.
 *
 *  - Expired entries read as absent and are erased on that read (lazy purge).
 *  - get_or_load(): concurrent callers for the same key while a load is
 *    outstanding all wait on the one in-flight shared_future.
 *  - A loader that throws has its in-flight marker removed before the
 *    exception reaches the callers, so the next call runs the loader again.
 *
 * The mutex only guards the two maps; it is never held while a loader runs.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class TtlCache
{
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = Clock::duration;
    using NowFn     = std::function<TimePoint()>;

    explicit TtlCache(NowFn now = &Clock::now)
        : now_(std::move(now))
    {}

    std::optional<Value> get(const Key& key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup_locked(key, now_());
    }

    void set(const Key& key, Value value, Duration ttl)
    {
        const TimePoint expires_at = now_() + std::max(ttl, Duration::zero());
        std::lock_guard<std::mutex> lock(mutex_);
        store_.insert_or_assign(key, Entry{std::move(value), expires_at});
    }

    template <typename Loader>
    Value get_or_load(const Key& key, Duration ttl, Loader&& loader)
    {
        return get_or_load(
            key, [ttl](const Value&) { return ttl; }, std::forward<Loader>(loader));
    }

    /// As above, but the TTL is chosen from the loaded value. Used to keep
    /// negative results for a shorter time than positive ones.
    template <typename TtlFn, typename Loader,
              typename = std::enable_if_t<std::is_invocable_r_v<Duration, TtlFn, const Value&>>>
    Value get_or_load(const Key& key, TtlFn&& ttl_for, Loader&& loader)
    {
        std::promise<Value>       promise;
        std::shared_future<Value> waiter;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (auto hit = lookup_locked(key, now_())) {
                return *hit;
            }
            auto it = inflight_.find(key);
            if (it != inflight_.end()) {
                waiter = it->second;
            } else {
                inflight_.emplace(key, promise.get_future().share());
            }
        }

        if (waiter.valid()) {
            return waiter.get();
        }

        try {
            Value value = loader();
            const TimePoint expires_at = now_() + std::max(Duration(ttl_for(value)), Duration::zero());
            {
                std::lock_guard<std::mutex> lock(mutex_);
                inflight_.erase(key);
                store_.insert_or_assign(key, Entry{value, expires_at});
            }
            promise.set_value(value);
            return value;
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                inflight_.erase(key);
            }
            promise.set_exception(std::current_exception());
            throw;
        }
    }

    void erase(const Key& key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        store_.erase(key);
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        store_.clear();
    }

    /// Drop every expired entry.
    void cleanup()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cleanup_locked(now_());
    }

    /// Number of live (unexpired) entries.
    std::size_t size()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cleanup_locked(now_());
        return store_.size();
    }

    std::size_t inflight() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return inflight_.size();
    }

private:
    struct Entry
    {
        Value     value;
        TimePoint expires_at;
    };

    std::optional<Value> lookup_locked(const Key& key, TimePoint now)
    {
        auto it = store_.find(key);
        if (it == store_.end()) {
            return std::nullopt;
        }
        if (it->second.expires_at <= now) {
            store_.erase(it);
            return std::nullopt;
        }
        return it->second.value;
    }

    void cleanup_locked(TimePoint now)
    {
        for (auto it = store_.begin(); it != store_.end();) {
            if (it->second.expires_at <= now)
                it = store_.erase(it);
            else
                ++it;
        }
    }

    NowFn now_;

    mutable std::mutex                                     mutex_;
    std::unordered_map<Key, Entry, Hash>                   store_;
    std::unordered_map<Key, std::shared_future<Value>, Hash> inflight_;
};

} // namespace utils
