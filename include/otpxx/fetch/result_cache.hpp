/*

fetch/result_cache.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <otpxx/detail/log.hpp>
#include <otpxx/fetch/types.hpp>

namespace otpxx
{

/**
Time bounded store of the last successful result per key.

Expired entries are dropped lazily when read; purge_expired() sweeps them all.
When max_entries is reached the entry closest to expiry is evicted.

@tparam Clock Clock used for expiry, replaceable in tests.
**/
template<typename Clock = std::chrono::steady_clock>
class basic_result_cache
{
public:
    using clock_type = Clock;
    using duration = typename Clock::duration;
    using time_point = typename Clock::time_point;

    struct entry
    {
        fetch_result value;
        time_point expires_at;
    };

    explicit basic_result_cache(duration default_ttl = std::chrono::minutes{5}, std::size_t max_entries = 1000)
        : default_ttl_(default_ttl), max_entries_(max_entries)
    {
    }

    basic_result_cache(const basic_result_cache&) = delete;
    basic_result_cache& operator=(const basic_result_cache&) = delete;

    [[nodiscard]] std::optional<fetch_result> get(const cache_key& key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end())
            return std::nullopt;
        if (Clock::now() >= it->second.expires_at)
        {
            entries_.erase(it);
            return std::nullopt;
        }
        return it->second.value;
    }

    /// Replace any entry for `key`. A non-positive ttl removes it instead.
    void put(const cache_key& key, fetch_result value, duration ttl)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ttl <= duration::zero())
        {
            entries_.erase(key);
            return;
        }

        value.cached = false;
        const time_point expires_at = Clock::now() + ttl;
        auto it = entries_.find(key);
        if (it != entries_.end())
        {
            it->second = entry{std::move(value), expires_at};
            return;
        }
        if (max_entries_ > 0 && entries_.size() >= max_entries_)
            evict_one_locked();
        entries_.emplace(key, entry{std::move(value), expires_at});
    }

    void put(const cache_key& key, fetch_result value)
    {
        put(key, std::move(value), default_ttl_);
    }

    bool erase(const cache_key& key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.erase(key) > 0;
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    /// @return Number of entries removed.
    std::size_t purge_expired()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const time_point now = Clock::now();
        std::size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();)
        {
            if (now >= it->second.expires_at)
            {
                it = entries_.erase(it);
                ++removed;
            }
            else
                ++it;
        }
        if (removed > 0)
            OTPXX_LOG_DEBUG("cache", "purged " << removed << " expired entries");
        return removed;
    }

    /// Entries held, expired ones included until they are purged or read.
    [[nodiscard]] std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] duration default_ttl() const noexcept { return default_ttl_; }
    [[nodiscard]] std::size_t max_entries() const noexcept { return max_entries_; }

private:
    void evict_one_locked()
    {
        auto oldest = entries_.begin();
        for (auto it = entries_.begin(); it != entries_.end(); ++it)
        {
            if (it->second.expires_at < oldest->second.expires_at)
                oldest = it;
        }
        if (oldest != entries_.end())
        {
            OTPXX_LOG_DEBUG("cache", "evicting entry for " << oldest->first.recipient);
            entries_.erase(oldest);
        }
    }

    duration default_ttl_;
    std::size_t max_entries_;
    mutable std::mutex mutex_;
    std::map<cache_key, entry> entries_;
};

using result_cache = basic_result_cache<>;

} // namespace otpxx
