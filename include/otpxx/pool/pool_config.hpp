/*

pool/pool_config.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>
#include <chrono>

namespace otpxx::pool
{

/**
 * Configuration for connection pools.
 */
struct pool_config
{
    /// Sessions created by warmup()
    std::size_t min_connections = 1;

    /// Maximum live sessions (idle + leased + being created)
    std::size_t max_connections = 10;

    /// Recycle sessions after this duration (0 = never)
    std::chrono::seconds max_lifetime{3600};

    /// Default timeout when waiting to acquire a session
    std::chrono::milliseconds acquire_timeout{5000};

    /// Retire a session after this many leases (0 = unlimited)
    std::size_t max_uses = 50;

    /// Run the validator on sessions idle for at least this long (0 = always)
    std::chrono::seconds validate_after_idle{30};

    /// Run the validator at all
    bool validate_on_acquire = true;

    /// Default configuration for low-traffic applications
    static pool_config low_traffic()
    {
        pool_config cfg;
        cfg.min_connections = 1;
        cfg.max_connections = 5;
        cfg.validate_after_idle = std::chrono::seconds{10};
        return cfg;
    }

    /// Configuration for high-traffic applications
    static pool_config high_traffic()
    {
        pool_config cfg;
        cfg.min_connections = 5;
        cfg.max_connections = 20;
        cfg.max_uses = 200;
        cfg.validate_on_acquire = false;  // Trust sessions for speed
        return cfg;
    }
};


/**
 * Pool statistics for monitoring.
 */
struct pool_stats
{
    std::size_t total_connections = 0;     ///< Idle + in use
    std::size_t idle_connections = 0;      ///< Available in pool
    std::size_t in_use_connections = 0;    ///< Currently leased
    std::size_t pending_requests = 0;      ///< Waiting for a session

    std::size_t connections_created = 0;   ///< Total created since start
    std::size_t connections_closed = 0;    ///< Total closed since start
    std::size_t connections_recycled = 0;  ///< Closed due to max_lifetime or max_uses
    std::size_t connections_failed = 0;    ///< Failed to create or validate

    std::size_t acquisitions_total = 0;    ///< Total acquire() calls
    std::size_t acquisitions_immediate = 0;///< Served without waiting
    std::size_t acquisitions_waited = 0;   ///< Had to wait for a session
    std::size_t acquisitions_timeout = 0;  ///< Timed out waiting

    /// Pool utilization (in_use / total)
    [[nodiscard]] double utilization() const noexcept
    {
        return total_connections > 0
            ? static_cast<double>(in_use_connections) / total_connections
            : 0.0;
    }

    /// Hit rate (immediate / total)
    [[nodiscard]] double hit_rate() const noexcept
    {
        return acquisitions_total > 0
            ? static_cast<double>(acquisitions_immediate) / acquisitions_total
            : 0.0;
    }
};


/**
 * Connection metadata stored alongside each pooled session.
 */
struct connection_metadata
{
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point last_used_at;
    std::size_t times_used = 0;

    connection_metadata()
        : created_at(std::chrono::steady_clock::now())
        , last_used_at(created_at)
    {
    }

    void mark_used()
    {
        last_used_at = std::chrono::steady_clock::now();
        ++times_used;
    }

    [[nodiscard]] std::chrono::steady_clock::duration age() const
    {
        return std::chrono::steady_clock::now() - created_at;
    }

    [[nodiscard]] std::chrono::steady_clock::duration idle_time() const
    {
        return std::chrono::steady_clock::now() - last_used_at;
    }
};

} // namespace otpxx::pool
