/*

pool/connection_pool.hpp
------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <otpxx/detail/asio_decl.hpp>
#include <otpxx/detail/log.hpp>
#include <otpxx/detail/result.hpp>
#include <otpxx/pool/pool_config.hpp>

namespace otpxx::pool
{

using otpxx::asio::any_io_executor;
using otpxx::asio::awaitable;
using otpxx::asio::steady_timer;

/**
 * Exception thrown when a pool is misconfigured.
 */
class pool_error : public std::runtime_error
{
public:
    explicit pool_error(const std::string& msg) : std::runtime_error(msg) {}
    explicit pool_error(const char* msg) : std::runtime_error(msg) {}
};


// Forward declaration
template<typename Client>
class connection_pool;


/**
 * RAII lease on a pooled session.
 * Returns the session to the pool when destroyed; a session that saw a
 * connection error must be invalidated first so that it is discarded.
 * The lease may outlive the pool, in which case the session is just closed.
 */
template<typename Client>
class pooled_connection
{
public:
    using pool_type = connection_pool<Client>;

    pooled_connection() = default;

    pooled_connection(pooled_connection&& other) noexcept
        : client_(std::move(other.client_))
        , metadata_(std::move(other.metadata_))
        , pool_(std::move(other.pool_))
        , valid_(other.valid_)
    {
        other.valid_ = false;
    }

    pooled_connection& operator=(pooled_connection&& other) noexcept
    {
        if (this != &other)
        {
            release(valid_);
            client_ = std::move(other.client_);
            metadata_ = std::move(other.metadata_);
            pool_ = std::move(other.pool_);
            valid_ = other.valid_;
            other.valid_ = false;
        }
        return *this;
    }

    // Non-copyable
    pooled_connection(const pooled_connection&) = delete;
    pooled_connection& operator=(const pooled_connection&) = delete;

    ~pooled_connection()
    {
        release(valid_);
    }

    /// Access the underlying client
    Client& operator*() { return *client_; }
    const Client& operator*() const { return *client_; }

    Client* operator->() { return client_.get(); }
    const Client* operator->() const { return client_.get(); }

    Client* get() { return client_.get(); }
    const Client* get() const { return client_.get(); }

    /// Check if the lease holds a usable session
    explicit operator bool() const noexcept { return valid_ && client_ != nullptr; }

    /// Mark the session as broken (it won't be returned to the pool)
    void invalidate() noexcept { valid_ = false; }

    /// Get connection metadata
    const connection_metadata& metadata() const { return metadata_; }

    /// Give the session back; healthy sessions go back to the idle set
    void release(bool healthy = true) noexcept
    {
        if (client_)
        {
            metadata_.mark_used();
            if (auto pool = pool_.lock())
                pool->return_connection(std::move(client_), std::move(metadata_), healthy && valid_);
        }
        pool_.reset();
        client_.reset();
        valid_ = false;
    }

private:
    friend class connection_pool<Client>;

    pooled_connection(std::unique_ptr<Client> client, connection_metadata meta, std::weak_ptr<pool_type> pool)
        : client_(std::move(client))
        , metadata_(std::move(meta))
        , pool_(std::move(pool))
        , valid_(true)
    {
    }

    std::unique_ptr<Client> client_;
    connection_metadata metadata_;
    std::weak_ptr<pool_type> pool_;
    bool valid_ = false;
};


/**
 * Bounded pool of authenticated sessions.
 *
 * The number of live sessions (idle, leased and being created) never exceeds
 * max_connections. acquire() suspends while the pool is at capacity, until a
 * session is returned or the timeout expires.
 *
 * The pool must be owned by a std::shared_ptr (see make_pool) so that leases
 * can detect its destruction.
 *
 * @tparam Client The session type
 */
template<typename Client>
class connection_pool : public std::enable_shared_from_this<connection_pool<Client>>
{
public:
    using client_type = Client;
    using pooled_type = pooled_connection<Client>;
    using factory_type = std::function<awaitable<result<std::unique_ptr<Client>>>()>;
    using validator_type = std::function<awaitable<bool>(Client&)>;
    using closer_type = std::function<awaitable<void>(Client&)>;

    /**
     * Create a connection pool.
     *
     * @param executor The executor for timers
     * @param config Pool configuration
     * @param factory Function that opens and authenticates new sessions
     * @throw pool_error if no factory is given.
     */
    connection_pool(any_io_executor executor, pool_config config, factory_type factory)
        : executor_(std::move(executor))
        , config_(std::move(config))
        , factory_(std::move(factory))
    {
        if (!factory_)
            throw pool_error("Factory function is required");
        if (config_.max_connections == 0)
            throw pool_error("max_connections must be positive");
    }

    // Non-copyable, non-movable
    connection_pool(const connection_pool&) = delete;
    connection_pool& operator=(const connection_pool&) = delete;
    connection_pool(connection_pool&&) = delete;
    connection_pool& operator=(connection_pool&&) = delete;

    /**
     * Set the liveness check run on sessions idle for validate_after_idle.
     */
    void set_validator(validator_type validator)
    {
        validator_ = std::move(validator);
    }

    /**
     * Set the graceful close run on idle sessions by drain().
     */
    void set_closer(closer_type closer)
    {
        closer_ = std::move(closer);
    }

    /**
     * Pre-create min_connections sessions.
     *
     * @return Number of sessions created. An authentication failure stops the
     *         warmup and is returned, other failures are only logged.
     */
    awaitable<result<std::size_t>> warmup()
    {
        OTPXX_LOG_INFO("pool", "warming up pool with " << config_.min_connections << " connections");

        std::size_t created = 0;
        for (std::size_t i = 0; i < config_.min_connections; ++i)
        {
            {
                std::lock_guard lock(mutex_);
                if (shutdown_ || live_locked() >= config_.max_connections)
                    break;
                ++creating_;
            }

            auto client = co_await create_connection();
            if (!client)
            {
                if (is_auth_error(client.error().code))
                    co_return std::unexpected(std::move(client).error());
                continue;
            }

            {
                std::lock_guard lock(mutex_);
                --creating_;
                idle_.push_back({std::move(*client), connection_metadata{}});
            }
            notify_one();
            ++created;
        }
        co_return ok(created);
    }

    /// Acquire with the configured acquire_timeout.
    awaitable<result<pooled_type>> acquire()
    {
        co_return co_await acquire(config_.acquire_timeout);
    }

    /**
     * Acquire a session from the pool.
     * Reuses an idle session, creates one if under capacity, or waits.
     *
     * @param timeout Maximum time to wait for capacity
     * @return A lease, errc::pool_exhausted on timeout, errc::pool_shutdown
     *         after drain(), or the factory's error.
     */
    awaitable<result<pooled_type>> acquire(std::chrono::steady_clock::duration timeout)
    {
        const auto start = std::chrono::steady_clock::now();
        const auto deadline = start + std::max(timeout, std::chrono::steady_clock::duration::zero());
        bool waited = false;

        {
            std::lock_guard lock(mutex_);
            ++stats_.acquisitions_total;
        }

        while (true)
        {
            enum class step { reuse, create, wait };
            step next = step::wait;
            pooled_entry entry;
            std::shared_ptr<steady_timer> waiter;

            {
                std::lock_guard lock(mutex_);
                if (shutdown_)
                    co_return fail<pooled_type>(errc::pool_shutdown, "Pool is shutting down.");

                if (!idle_.empty())
                {
                    entry = std::move(idle_.front());
                    idle_.pop_front();
                    ++leased_;
                    next = step::reuse;
                }
                else if (live_locked() < config_.max_connections)
                {
                    ++creating_;
                    next = step::create;
                }
                else if (std::chrono::steady_clock::now() >= deadline)
                {
                    ++stats_.acquisitions_timeout;
                    OTPXX_LOG_DEBUG("pool", "acquire timed out, " << leased_ << " sessions leased");
                    co_return fail<pooled_type>(errc::pool_exhausted, "Connection pool exhausted.");
                }
                else
                {
                    waiter = std::make_shared<steady_timer>(executor_);
                    waiter->expires_at(deadline);
                    waiters_.push_back(waiter);
                }
            }

            if (next == step::wait)
            {
                waited = true;
                co_await otpxx::asio::wait(*waiter);
                std::lock_guard lock(mutex_);
                auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
                if (it != waiters_.end())
                    waiters_.erase(it);
                continue;
            }

            if (next == step::reuse)
            {
                if (!co_await keep_idle(entry))
                {
                    discard_leased();
                    continue;
                }
                record_acquisition(waited);
                co_return ok(pooled_type(std::move(entry.client), std::move(entry.metadata), this->weak_from_this()));
            }

            auto client = co_await create_connection();
            if (!client)
                co_return std::unexpected(std::move(client).error());
            {
                std::lock_guard lock(mutex_);
                --creating_;
                ++leased_;
            }
            record_acquisition(waited);
            co_return ok(pooled_type(std::move(*client), connection_metadata{}, this->weak_from_this()));
        }
    }

    /**
     * Stop handing out sessions, log out idle ones and wait for leased ones
     * to come back, at most max_wait.
     */
    awaitable<void> drain(std::chrono::steady_clock::duration max_wait = std::chrono::seconds{5})
    {
        OTPXX_LOG_INFO("pool", "draining pool");
        std::deque<pooled_entry> idle;
        {
            std::lock_guard lock(mutex_);
            shutdown_ = true;
            idle.swap(idle_);
        }
        notify_all();

        for (auto& entry : idle)
        {
            if (closer_)
                co_await closer_(*entry.client);
            entry.client.reset();
            std::lock_guard lock(mutex_);
            ++stats_.connections_closed;
        }

        const auto deadline = std::chrono::steady_clock::now() + max_wait;
        while (std::chrono::steady_clock::now() < deadline)
        {
            {
                std::lock_guard lock(mutex_);
                if (leased_ == 0 && creating_ == 0)
                    break;
            }
            co_await otpxx::asio::sleep_for(std::chrono::milliseconds{50});
        }

        OTPXX_LOG_INFO("pool", "pool drained");
    }

    /**
     * Get current pool statistics.
     */
    pool_stats stats() const
    {
        std::lock_guard lock(mutex_);
        pool_stats out = stats_;
        out.idle_connections = idle_.size();
        out.in_use_connections = leased_;
        out.total_connections = idle_.size() + leased_;
        out.pending_requests = waiters_.size();
        return out;
    }

    /**
     * Get number of available (idle) sessions.
     */
    std::size_t available() const
    {
        std::lock_guard lock(mutex_);
        return idle_.size();
    }

    /**
     * Get number of sessions currently leased.
     */
    std::size_t in_use() const
    {
        std::lock_guard lock(mutex_);
        return leased_;
    }

    /**
     * Get number of live sessions.
     */
    std::size_t size() const
    {
        std::lock_guard lock(mutex_);
        return live_locked();
    }

    bool is_shutdown() const
    {
        std::lock_guard lock(mutex_);
        return shutdown_;
    }

    const pool_config& config() const { return config_; }

private:
    friend class pooled_connection<Client>;

    struct pooled_entry
    {
        std::unique_ptr<Client> client;
        connection_metadata metadata;
    };

    std::size_t live_locked() const noexcept
    {
        return idle_.size() + leased_ + creating_;
    }

    /// Calls the factory; on failure the reserved creation slot is given back.
    awaitable<result<std::unique_ptr<Client>>> create_connection()
    {
        auto client = co_await factory_();
        if (client && *client == nullptr)
            client = fail<std::unique_ptr<Client>>(errc::internal_error, "Factory returned no session.");

        if (!client)
        {
            OTPXX_LOG_WARN("pool", "failed to create connection: " << describe(client.error()));
            {
                std::lock_guard lock(mutex_);
                --creating_;
                ++stats_.connections_failed;
            }
            notify_one();
            co_return std::move(client);
        }

        std::lock_guard lock(mutex_);
        ++stats_.connections_created;
        co_return std::move(client);
    }

    /// Lifetime and liveness checks on a session taken from the idle set.
    awaitable<bool> keep_idle(pooled_entry& entry)
    {
        if (config_.max_lifetime.count() > 0 && entry.metadata.age() >= config_.max_lifetime)
        {
            OTPXX_LOG_DEBUG("pool", "connection exceeded max lifetime, recycling");
            std::lock_guard lock(mutex_);
            ++stats_.connections_recycled;
            co_return false;
        }

        if (config_.validate_on_acquire && validator_ && entry.metadata.idle_time() >= config_.validate_after_idle)
        {
            if (!co_await validator_(*entry.client))
            {
                OTPXX_LOG_DEBUG("pool", "connection validation failed, recycling");
                std::lock_guard lock(mutex_);
                ++stats_.connections_failed;
                co_return false;
            }
        }
        co_return true;
    }

    void discard_leased()
    {
        {
            std::lock_guard lock(mutex_);
            --leased_;
            ++stats_.connections_closed;
        }
        notify_one();
    }

    void record_acquisition(bool waited)
    {
        std::lock_guard lock(mutex_);
        if (waited)
            ++stats_.acquisitions_waited;
        else
            ++stats_.acquisitions_immediate;
    }

    void return_connection(std::unique_ptr<Client> client, connection_metadata metadata, bool healthy)
    {
        bool keep = healthy;
        {
            std::lock_guard lock(mutex_);
            --leased_;

            if (shutdown_)
                keep = false;
            else if (keep && config_.max_uses > 0 && metadata.times_used >= config_.max_uses)
            {
                keep = false;
                ++stats_.connections_recycled;
            }
            else if (keep && config_.max_lifetime.count() > 0 && metadata.age() >= config_.max_lifetime)
            {
                keep = false;
                ++stats_.connections_recycled;
            }

            if (keep)
                idle_.push_back({std::move(client), std::move(metadata)});
            else
                ++stats_.connections_closed;
        }

        if (!keep)
        {
            OTPXX_LOG_DEBUG("pool", "closing returned connection, healthy=" << healthy);
            client.reset();
        }
        notify_one();
    }

    /// Wake the oldest waiter. Moving the expiry also wakes a waiter whose wait has not started.
    void notify_one()
    {
        std::shared_ptr<steady_timer> waiter;
        {
            std::lock_guard lock(mutex_);
            if (waiters_.empty())
                return;
            waiter = waiters_.front();
            waiters_.erase(waiters_.begin());
        }
        waiter->expires_at(std::chrono::steady_clock::time_point::min());
    }

    void notify_all()
    {
        std::vector<std::shared_ptr<steady_timer>> waiters;
        {
            std::lock_guard lock(mutex_);
            waiters.swap(waiters_);
        }
        for (auto& waiter : waiters)
            waiter->expires_at(std::chrono::steady_clock::time_point::min());
    }

    any_io_executor executor_;
    pool_config config_;
    factory_type factory_;
    validator_type validator_;
    closer_type closer_;

    mutable std::mutex mutex_;
    std::deque<pooled_entry> idle_;
    std::size_t leased_ = 0;
    std::size_t creating_ = 0;
    std::vector<std::shared_ptr<steady_timer>> waiters_;
    bool shutdown_ = false;
    pool_stats stats_;
};


/**
 * Create a shared pool.
 */
template<typename Client>
auto make_pool(
    any_io_executor executor,
    pool_config config,
    typename connection_pool<Client>::factory_type factory)
{
    return std::make_shared<connection_pool<Client>>(
        std::move(executor), std::move(config), std::move(factory));
}

} // namespace otpxx::pool
