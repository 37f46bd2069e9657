/*

otp_fetcher.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <otpxx/detail/asio_decl.hpp>
#include <otpxx/detail/log.hpp>
#include <otpxx/detail/result.hpp>
#include <otpxx/fetch/fetcher_config.hpp>
#include <otpxx/fetch/imap_session.hpp>
#include <otpxx/fetch/message_parser.hpp>
#include <otpxx/fetch/poller.hpp>
#include <otpxx/fetch/result_cache.hpp>
#include <otpxx/fetch/sender_presets.hpp>
#include <otpxx/fetch/session.hpp>
#include <otpxx/fetch/types.hpp>
#include <otpxx/net/tls_options.hpp>
#include <otpxx/pool/connection_pool.hpp>

namespace otpxx
{

struct fetcher_stats
{
    pool::pool_stats connections;
    poller_stats polling;
    std::size_t cache_size = 0;
    std::size_t inflight = 0;
};


/**
Facade over the fetch engine: owns the TLS context, the session pool, the
result cache and the poller for one mailbox.

The fetcher must outlive every coroutine started through it; call shutdown()
before stopping the io_context to log out cleanly.
**/
class otp_fetcher
{
public:
    using pool_type = pool::connection_pool<mailbox_session>;
    using session_factory = pool_type::factory_type;

    /**
    Fetcher whose sessions are IMAP connections to `config.endpoint`.

    @throw std::invalid_argument The configuration does not validate or the TLS
           context cannot be set up.
    **/
    otp_fetcher(asio::any_io_executor executor, fetcher_config config)
        : otp_fetcher(executor, std::move(config), session_factory{})
    {
    }

    /**
    Fetcher over sessions made by `factory`. An empty factory opens IMAP
    sessions to `config.endpoint`.

    @throw std::invalid_argument The configuration does not validate or the TLS
           context cannot be set up.
    **/
    otp_fetcher(asio::any_io_executor executor, fetcher_config config, session_factory factory)
        : executor_(std::move(executor))
        , config_(std::move(config))
        , parser_(config_.extraction_rules, config_.link_rules)
        , cache_(config_.cache_ttl, config_.cache_max_entries)
    {
        if (auto valid = config_.validate(); !valid)
            throw std::invalid_argument(describe(valid.error()));

        if (!factory)
        {
            if (config_.endpoint.tls != net::tls_mode::none)
            {
                tls_ctx_ = std::make_unique<asio::ssl::context>(asio::ssl::context::tls_client);
                if (auto configured = net::configure_context(*tls_ctx_, config_.imap_options.tls); !configured)
                    throw std::invalid_argument(describe(configured.error()));
            }
            factory = [this]() -> asio::awaitable<result<std::unique_ptr<mailbox_session>>>
            {
                co_return co_await open_imap_session(executor_, config_.endpoint, config_.credentials,
                    config_.auth, config_.imap_options, tls_ctx_.get());
            };
        }

        pool_ = pool::make_pool<mailbox_session>(executor_, config_.pool_options, std::move(factory));
        pool_->set_validator([](mailbox_session& session) -> asio::awaitable<bool>
        {
            auto alive = co_await session.noop();
            co_return alive.has_value();
        });
        pool_->set_closer([](mailbox_session& session) -> asio::awaitable<void>
        {
            auto res = co_await session.logout();
            if (!res)
                OTPXX_LOG_DEBUG("fetcher", "logout failed for " << session.identity() << ": " << describe(res.error()));
        });

        poller_ = std::make_unique<poller>(pool_, cache_, parser_, config_.make_poller_options());
    }

    otp_fetcher(const otp_fetcher&) = delete;
    otp_fetcher& operator=(const otp_fetcher&) = delete;

    /**
    Open `min_connections` sessions ahead of the first request.

    @return Sessions opened, or errc::imap_auth_failed when the credentials are rejected.
    **/
    asio::awaitable<result<std::size_t>> warmup()
    {
        co_return co_await pool_->warmup();
    }

    asio::awaitable<fetch_outcome> fetch(fetch_request request)
    {
        co_return co_await poller_->fetch(std::move(request));
    }

    /// Fetch with the configured default wait when `max_wait` is not given.
    asio::awaitable<fetch_outcome> fetch(std::string recipient, std::vector<std::string> senders,
        std::optional<std::chrono::milliseconds> max_wait = std::nullopt)
    {
        fetch_request request;
        request.target_recipient = std::move(recipient);
        request.senders = std::move(senders);
        request.max_wait = max_wait.value_or(config_.default_max_wait);
        co_return co_await poller_->fetch(std::move(request));
    }

    /**
    Fetch a code or link from a known service, using its preset senders and subject terms.

    @return As fetch(); errc::invalid_argument when the service is unknown.
    **/
    asio::awaitable<fetch_outcome> fetch_service(std::string recipient, std::string_view service,
        fetch_kind kind = fetch_kind::otp, std::optional<std::chrono::milliseconds> max_wait = std::nullopt)
    {
        fetch_request request;
        request.target_recipient = std::move(recipient);
        request.senders = senders_for_service(service);
        request.subjects = subjects_for_service(service, kind);
        request.kind = kind;
        request.max_wait = max_wait.value_or(config_.default_max_wait);
        if (request.senders.empty())
            co_return fail<std::optional<fetch_result>>(errc::invalid_argument, "Unknown service.", std::string(service));
        co_return co_await poller_->fetch(std::move(request));
    }

    /// Log out pooled sessions and forget cached results.
    asio::awaitable<void> shutdown()
    {
        OTPXX_LOG_INFO("fetcher", "shutting down");
        co_await pool_->drain();
        cache_.clear();
    }

    [[nodiscard]] fetcher_stats stats() const
    {
        fetcher_stats out;
        out.connections = pool_->stats();
        out.polling = poller_->stats();
        out.cache_size = cache_.size();
        out.inflight = poller_->inflight_count();
        return out;
    }

    [[nodiscard]] result_cache& cache() noexcept { return cache_; }

    [[nodiscard]] poller& get_poller() noexcept { return *poller_; }

    [[nodiscard]] const fetcher_config& config() const noexcept { return config_; }

private:
    asio::any_io_executor executor_;
    fetcher_config config_;
    message_parser parser_;
    result_cache cache_;
    std::unique_ptr<asio::ssl::context> tls_ctx_;
    std::shared_ptr<pool_type> pool_;
    std::unique_ptr<poller> poller_;
};

} // namespace otpxx
