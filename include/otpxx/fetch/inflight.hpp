/*

fetch/inflight.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <otpxx/detail/asio_decl.hpp>
#include <otpxx/detail/async_event.hpp>
#include <otpxx/fetch/types.hpp>

namespace otpxx
{

/**
Per key registry of running fetches.

The first caller for a key becomes the leader and runs the poll; later callers
for the same key become followers and receive the leader's outcome.
The registry must outlive every ticket it hands out.
**/
class inflight_registry
{
    struct slot
    {
        explicit slot(asio::any_io_executor executor) : done(std::move(executor)) {}

        detail::async_event done;
        std::optional<fetch_outcome> outcome;
    };

public:
    /**
    Handle returned by join(). A leader ticket that is destroyed without
    publishing releases its followers with errc::internal_error.
    **/
    class ticket
    {
    public:
        ticket(ticket&& other) noexcept
            : registry_(std::exchange(other.registry_, nullptr))
            , key_(std::move(other.key_))
            , slot_(std::move(other.slot_))
            , leader_(other.leader_)
        {
        }

        ticket& operator=(ticket&&) = delete;
        ticket(const ticket&) = delete;
        ticket& operator=(const ticket&) = delete;

        ~ticket()
        {
            if (leader_ && registry_ != nullptr && !slot_->done.is_set())
                publish(fail<std::optional<fetch_result>>(errc::internal_error, "Fetch abandoned."));
        }

        [[nodiscard]] bool is_leader() const noexcept
        {
            return leader_;
        }

        /// Leader only: hand the outcome to followers and unregister the key.
        void publish(fetch_outcome outcome)
        {
            if (!leader_ || registry_ == nullptr)
                return;
            registry_->complete(key_, slot_, std::move(outcome));
        }

        /// Follower only: wait for the leader's outcome.
        asio::awaitable<fetch_outcome> wait()
        {
            co_await slot_->done.wait();
            std::lock_guard<std::mutex> lock(registry_->mutex_);
            co_return *slot_->outcome;
        }

        /// Follower only: wait for the leader's outcome, giving up at the deadline.
        asio::awaitable<std::optional<fetch_outcome>> wait_until(std::chrono::steady_clock::time_point deadline)
        {
            if (!co_await slot_->done.wait_until(deadline))
                co_return std::nullopt;
            std::lock_guard<std::mutex> lock(registry_->mutex_);
            co_return std::optional<fetch_outcome>(*slot_->outcome);
        }

    private:
        friend class inflight_registry;

        ticket(inflight_registry* registry, cache_key key, std::shared_ptr<slot> s, bool leader)
            : registry_(registry), key_(std::move(key)), slot_(std::move(s)), leader_(leader)
        {
        }

        inflight_registry* registry_;
        cache_key key_;
        std::shared_ptr<slot> slot_;
        bool leader_;
    };

    inflight_registry() = default;
    inflight_registry(const inflight_registry&) = delete;
    inflight_registry& operator=(const inflight_registry&) = delete;

    [[nodiscard]] ticket join(const cache_key& key, asio::any_io_executor executor)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(key);
        if (it != slots_.end())
            return ticket(this, key, it->second, false);

        auto s = std::make_shared<slot>(std::move(executor));
        slots_.emplace(key, s);
        return ticket(this, key, std::move(s), true);
    }

    /// Keys with a running leader.
    [[nodiscard]] std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return slots_.size();
    }

private:
    void complete(const cache_key& key, const std::shared_ptr<slot>& s, fetch_outcome outcome)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (s->outcome.has_value())
                return;
            s->outcome = std::move(outcome);
            auto it = slots_.find(key);
            if (it != slots_.end() && it->second == s)
                slots_.erase(it);
        }
        s->done.set();
    }

    mutable std::mutex mutex_;
    std::map<cache_key, std::shared_ptr<slot>> slots_;
};

} // namespace otpxx
