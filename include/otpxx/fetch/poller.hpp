/*

fetch/poller.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <otpxx/detail/asio_decl.hpp>
#include <otpxx/detail/async_event.hpp>
#include <otpxx/detail/log.hpp>
#include <otpxx/detail/result.hpp>
#include <otpxx/fetch/folder_scanner.hpp>
#include <otpxx/fetch/inflight.hpp>
#include <otpxx/fetch/message_parser.hpp>
#include <otpxx/fetch/result_cache.hpp>
#include <otpxx/fetch/session.hpp>
#include <otpxx/fetch/types.hpp>
#include <otpxx/pool/connection_pool.hpp>

namespace otpxx
{

enum class poll_state
{
    idle,
    cache_lookup,
    scanning,
    backoff,
    success,
    timeout,
    error
};

[[nodiscard]] constexpr std::string_view to_string(poll_state state) noexcept
{
    switch (state)
    {
        case poll_state::idle: return "idle";
        case poll_state::cache_lookup: return "cache_lookup";
        case poll_state::scanning: return "scanning";
        case poll_state::backoff: return "backoff";
        case poll_state::success: return "success";
        case poll_state::timeout: return "timeout";
        case poll_state::error: return "error";
    }
    return "unknown";
}

/// Delay between rounds. A multiplier of 1 keeps it constant.
struct backoff_policy
{
    std::chrono::milliseconds initial{500};
    double multiplier = 1.0;
    std::chrono::milliseconds max{5000};

    [[nodiscard]] std::chrono::milliseconds next(std::chrono::milliseconds current) const noexcept
    {
        if (multiplier <= 1.0)
            return current;
        const auto widened = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(
            static_cast<double>(current.count()) * multiplier));
        return std::min(widened, std::max(max, initial));
    }
};

struct poller_options
{
    std::vector<std::string> folders{"INBOX"};
    std::size_t scan_limit = 30;

    /// Only search mail received within this window (0 = no limit).
    std::chrono::seconds max_message_age{24 * 3600};

    /// Also require the target recipient among To/Cc/Delivered-To.
    bool filter_recipient = false;

    std::chrono::milliseconds cache_ttl{5 * 60 * 1000};
    backoff_policy backoff;

    /// Extra attempts per folder and round after a connection error.
    std::size_t connection_retry_count = 2;

    /// A round waits for its scans at least this long, even past the deadline.
    std::chrono::milliseconds scan_grace{2000};
};

/// Counters since construction.
struct poller_stats
{
    std::size_t requests = 0;
    std::size_t cache_hits = 0;
    std::size_t joined = 0;
    std::size_t rounds = 0;
    std::size_t scans = 0;
    std::size_t successes = 0;
    std::size_t timeouts = 0;
    std::size_t errors = 0;
};


/**
Drives a fetch request to completion.

A request first consults the cache. On a miss, concurrent requests for the same
key share one poll: the first becomes the leader, the others wait for its
outcome until their own deadline. The leader runs rounds; each round scans every configured folder in
parallel, each scan on its own pooled session. The earliest received match of
the round wins. Without a match the poller sleeps for the backoff delay and
starts another round, unless that would overrun the deadline.

The poller must outlive the io_context work it starts, including scans
abandoned at the deadline.
**/
class poller
{
public:
    using pool_type = pool::connection_pool<mailbox_session>;
    using state_callback = std::function<void(const cache_key&, poll_state)>;

    poller(std::shared_ptr<pool_type> pool, result_cache& cache, const message_parser& parser, poller_options opts = {})
        : pool_(std::move(pool)), cache_(cache), scanner_(parser), options_(std::move(opts))
    {
        if (!pool_)
            throw std::invalid_argument("poller requires a connection pool");
    }

    poller(const poller&) = delete;
    poller& operator=(const poller&) = delete;

    /// Observe state transitions. Called from the io_context threads.
    void set_state_callback(state_callback callback)
    {
        on_state_ = std::move(callback);
    }

    /**
    Fetch the OTP for a request.

    @return The result, an empty optional when the deadline passes without a
            match, or an error: errc::imap_auth_failed for rejected credentials,
            a connection error once retries are exhausted, errc::pool_shutdown
            after shutdown, errc::invalid_argument for a malformed request.
    **/
    asio::awaitable<fetch_outcome> fetch(fetch_request request)
    {
        const auto start = steady_clock::now();
        const auto deadline = start + std::max(request.max_wait, std::chrono::milliseconds::zero());
        ++counters_.requests;

        const cache_key key = make_cache_key(request);
        if (request.senders.empty())
            co_return finish(key, fail<std::optional<fetch_result>>(errc::invalid_argument, "At least one sender is required."));

        transition(key, poll_state::cache_lookup);
        if (auto hit = cached(key, start))
        {
            ++counters_.cache_hits;
            co_return finish(key, ok(std::optional<fetch_result>(std::move(*hit))));
        }

        auto ticket = inflight_.join(key, co_await asio::this_coro::executor);
        if (!ticket.is_leader())
        {
            ++counters_.joined;
            OTPXX_LOG_DEBUG("poller", "joining running fetch for " << key.recipient);
            auto shared = co_await ticket.wait_until(deadline);
            if (!shared.has_value())
            {
                OTPXX_LOG_DEBUG("poller", "deadline passed while waiting on the running fetch for " << key.recipient);
                co_return finish(key, ok(std::optional<fetch_result>()));
            }
            co_return finish(key, std::move(*shared));
        }

        // A previous leader may have filled the cache since the first lookup.
        if (auto hit = cached(key, start))
        {
            ++counters_.cache_hits;
            fetch_outcome outcome = ok(std::optional<fetch_result>(std::move(*hit)));
            ticket.publish(outcome);
            co_return finish(key, std::move(outcome));
        }

        fetch_outcome outcome = co_await poll(request, key, start, deadline);
        if (outcome && outcome->has_value())
            cache_.put(key, **outcome, options_.cache_ttl);
        ticket.publish(outcome);
        co_return finish(key, std::move(outcome));
    }

    [[nodiscard]] poller_stats stats() const noexcept
    {
        poller_stats out;
        out.requests = counters_.requests.load();
        out.cache_hits = counters_.cache_hits.load();
        out.joined = counters_.joined.load();
        out.rounds = counters_.rounds.load();
        out.scans = counters_.scans.load();
        out.successes = counters_.successes.load();
        out.timeouts = counters_.timeouts.load();
        out.errors = counters_.errors.load();
        return out;
    }

    [[nodiscard]] const poller_options& options() const noexcept { return options_; }

    [[nodiscard]] std::size_t inflight_count() const { return inflight_.size(); }

private:
    using scan_result = result<std::vector<otp_candidate>>;

    /// Shared between a round and the scans it spawned; scans may outlive the round.
    struct round_state
    {
        round_state(asio::any_io_executor executor, std::size_t scans)
            : done(std::move(executor)), pending(scans)
        {
        }

        detail::async_event done;

        /// Set once the round is decided; scans still running stop retrying.
        std::atomic<bool> stopped{false};
        std::mutex mutex;
        std::size_t pending;
        std::vector<otp_candidate> candidates;
        std::optional<error_info> fatal;
    };

    struct counters
    {
        std::atomic<std::size_t> requests{0};
        std::atomic<std::size_t> cache_hits{0};
        std::atomic<std::size_t> joined{0};
        std::atomic<std::size_t> rounds{0};
        std::atomic<std::size_t> scans{0};
        std::atomic<std::size_t> successes{0};
        std::atomic<std::size_t> timeouts{0};
        std::atomic<std::size_t> errors{0};
    };

    std::optional<fetch_result> cached(const cache_key& key, steady_clock::time_point start)
    {
        auto hit = cache_.get(key);
        if (!hit)
            return std::nullopt;
        hit->cached = true;
        hit->fetch_time = std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock::now() - start);
        OTPXX_LOG_DEBUG("poller", "cache hit for " << key.recipient);
        return hit;
    }

    void transition(const cache_key& key, poll_state state)
    {
        OTPXX_LOG_TRACE("poller", key.recipient << " -> " << to_string(state));
        if (on_state_)
            on_state_(key, state);
    }

    fetch_outcome finish(const cache_key& key, fetch_outcome outcome)
    {
        if (!outcome)
        {
            ++counters_.errors;
            transition(key, poll_state::error);
        }
        else if (outcome->has_value())
        {
            ++counters_.successes;
            transition(key, poll_state::success);
        }
        else
        {
            ++counters_.timeouts;
            transition(key, poll_state::timeout);
        }
        return outcome;
    }

    scan_filter make_filter(const fetch_request& request) const
    {
        scan_filter filter;
        filter.senders = request.senders;
        filter.subjects = request.subjects;
        filter.kind = request.kind;
        if (options_.filter_recipient)
            filter.recipient = request.target_recipient;
        filter.limit = options_.scan_limit;
        if (options_.max_message_age.count() > 0)
            filter.since = std::chrono::system_clock::now() - options_.max_message_age;
        return filter;
    }

    asio::awaitable<fetch_outcome> poll(const fetch_request& request, const cache_key& key,
        steady_clock::time_point start, steady_clock::time_point deadline)
    {
        const scan_filter filter = make_filter(request);
        auto delay = options_.backoff.initial;

        while (true)
        {
            transition(key, poll_state::scanning);
            const std::size_t round = ++counters_.rounds;

            std::optional<otp_candidate> winner;
            OTPXX_CO_TRY_ASSIGN(winner, co_await run_round(filter, deadline));
            if (winner.has_value())
            {
                fetch_result res;
                res.otp = std::move(winner->otp);
                res.reset_link = std::move(winner->reset_link);
                res.folder = std::move(winner->folder);
                res.subject = std::move(winner->subject);
                res.cached = false;
                res.fetch_time = std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock::now() - start);
                OTPXX_LOG_INFO("poller", to_string(request.kind) << " found in " << res.folder << " after " << res.fetch_time.count()
                    << " ms, round " << round);
                co_return ok(std::optional<fetch_result>(std::move(res)));
            }

            if (steady_clock::now() + delay > deadline)
            {
                OTPXX_LOG_INFO("poller", "no " << to_string(request.kind) << " for " << key.recipient << " after " << round << " rounds");
                co_return ok(std::optional<fetch_result>());
            }

            transition(key, poll_state::backoff);
            co_await asio::sleep_for(delay);
            delay = options_.backoff.next(delay);
        }
    }

    /// One scan per folder, in parallel. Returns the earliest match, if any.
    asio::awaitable<result<std::optional<otp_candidate>>> run_round(const scan_filter& filter,
        steady_clock::time_point deadline)
    {
        auto executor = co_await asio::this_coro::executor;
        if (options_.folders.empty())
            co_return ok(std::optional<otp_candidate>());

        const auto round_start = steady_clock::now();
        auto state = std::make_shared<round_state>(executor, options_.folders.size());
        for (const auto& folder : options_.folders)
        {
            ++counters_.scans;
            asio::co_spawn(executor, scan_folder(folder, filter, deadline, state),
                [state](std::exception_ptr ep, scan_result res)
                {
                    if (ep)
                        res = fail<std::vector<otp_candidate>>(errc::internal_error, "Folder scan raised an exception.");
                    bool finished = false;
                    {
                        std::lock_guard<std::mutex> lock(state->mutex);
                        if (res)
                        {
                            for (auto& candidate : *res)
                                state->candidates.push_back(std::move(candidate));
                        }
                        else if (!state->fatal.has_value())
                        {
                            state->fatal = std::move(res).error();
                            state->stopped = true;
                        }
                        finished = --state->pending == 0 || state->fatal.has_value();
                    }
                    if (finished)
                        state->done.set();
                });
        }

        const bool complete = co_await state->done.wait_until(std::max(deadline, round_start + options_.scan_grace));
        state->stopped = true;

        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->fatal.has_value())
            co_return fail<std::optional<otp_candidate>>(*state->fatal);
        if (!complete)
            OTPXX_LOG_DEBUG("poller", state->pending << " scans still running at the deadline");
        if (state->candidates.empty())
            co_return ok(std::optional<otp_candidate>());
        auto best = std::min_element(state->candidates.begin(), state->candidates.end(), earlier_candidate);
        co_return ok(std::optional<otp_candidate>(*best));
    }

    /// Scan one folder on a leased session, retrying on connection errors until the round is decided.
    asio::awaitable<scan_result> scan_folder(std::string folder, scan_filter filter, steady_clock::time_point deadline,
        std::shared_ptr<round_state> round)
    {
        std::size_t attempt = 0;
        while (true)
        {
            if (round->stopped)
            {
                OTPXX_LOG_DEBUG("poller", "round over, not scanning " << folder);
                co_return ok(std::vector<otp_candidate>());
            }

            const auto remaining = std::max(deadline - steady_clock::now(), steady_clock::duration::zero());
            auto lease = co_await pool_->acquire(remaining);
            if (!lease)
            {
                const error_info& err = lease.error();
                if (err.code == errc::pool_exhausted)
                {
                    OTPXX_LOG_DEBUG("poller", "no session available for " << folder);
                    co_return ok(std::vector<otp_candidate>());
                }
                if (is_connection_error(err.code) && attempt < options_.connection_retry_count)
                {
                    ++attempt;
                    OTPXX_LOG_WARN("poller", "connect failed for " << folder << ", retry " << attempt << ": " << describe(err));
                    continue;
                }
                co_return std::unexpected(std::move(lease).error());
            }
            if (round->stopped)
            {
                lease->release(true);
                co_return ok(std::vector<otp_candidate>());
            }

            auto res = co_await scanner_.scan(**lease, folder, filter);
            if (res)
            {
                lease->release(true);
                co_return res;
            }

            const errc code = res.error().code;
            if (is_folder_error(code))
            {
                OTPXX_LOG_WARN("poller", "folder " << folder << " refused: " << describe(res.error()));
                lease->release(true);
                co_return ok(std::vector<otp_candidate>());
            }

            lease->invalidate();
            lease->release(false);
            if (is_connection_error(code) && attempt < options_.connection_retry_count)
            {
                ++attempt;
                OTPXX_LOG_WARN("poller", "session lost while scanning " << folder << ", retry " << attempt
                    << ": " << describe(res.error()));
                continue;
            }
            co_return res;
        }
    }

    std::shared_ptr<pool_type> pool_;
    result_cache& cache_;
    folder_scanner scanner_;
    poller_options options_;
    inflight_registry inflight_;
    state_callback on_state_;
    counters counters_;
};

} // namespace otpxx
