/*

async_event.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

#include <otpxx/detail/asio_decl.hpp>

namespace otpxx::detail
{

/**
One-shot broadcast event for coroutines.

Waiters park on a steady_timer armed with their deadline; set() expires
every parked timer. Once set, the event stays set and later waits complete
immediately.
**/
class async_event
{
public:
    using clock_type = std::chrono::steady_clock;

    explicit async_event(otpxx::asio::any_io_executor executor)
        : executor_(std::move(executor))
    {
    }

    async_event(const async_event&) = delete;
    async_event& operator=(const async_event&) = delete;

    [[nodiscard]] bool is_set() const noexcept
    {
        return set_.load(std::memory_order_acquire);
    }

    void set() noexcept
    {
        std::vector<std::shared_ptr<otpxx::asio::steady_timer>> waiters;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (set_.exchange(true, std::memory_order_acq_rel))
                return;
            waiters.swap(waiters_);
        }

        // Moving the expiry also completes a wait that has not been started yet.
        for (auto& timer : waiters)
            timer->expires_at(clock_type::time_point::min());
    }

    /// Wait for set() or the deadline. Returns true when the event is set.
    otpxx::asio::awaitable<bool> wait_until(clock_type::time_point deadline)
    {
        auto timer = std::make_shared<otpxx::asio::steady_timer>(executor_);
        timer->expires_at(deadline);
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (set_.load(std::memory_order_acquire))
                co_return true;
            waiters_.push_back(timer);
        }

        co_await otpxx::asio::wait(*timer);

        std::lock_guard<std::mutex> guard(mutex_);
        auto it = std::find(waiters_.begin(), waiters_.end(), timer);
        if (it != waiters_.end())
            waiters_.erase(it);
        co_return set_.load(std::memory_order_acquire);
    }

    otpxx::asio::awaitable<void> wait()
    {
        co_await wait_until(clock_type::time_point::max());
    }

private:
    otpxx::asio::any_io_executor executor_;
    std::atomic<bool> set_{false};
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<otpxx::asio::steady_timer>> waiters_;
};

} // namespace otpxx::detail
