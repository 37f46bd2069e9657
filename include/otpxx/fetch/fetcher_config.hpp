/*

fetch/fetcher_config.hpp
------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <otpxx/detail/result.hpp>
#include <otpxx/fetch/imap_session.hpp>
#include <otpxx/fetch/message_parser.hpp>
#include <otpxx/fetch/poller.hpp>
#include <otpxx/imap/types.hpp>
#include <otpxx/pool/pool_config.hpp>

namespace otpxx
{

/**
Everything an otp_fetcher needs: where the mailbox is, how to log in, and how
to poll it.
**/
struct fetcher_config
{
    imap_endpoint endpoint;
    imap::credentials credentials;
    imap::auth_method auth = imap::auth_method::auto_detect;
    imap::options imap_options;
    pool::pool_config pool_options;

    std::vector<std::string> folders{"INBOX"};
    std::size_t scan_limit = 30;
    std::chrono::seconds max_message_age{24 * 3600};
    bool filter_recipient = false;

    std::chrono::milliseconds cache_ttl{5 * 60 * 1000};
    std::size_t cache_max_entries = 1000;

    backoff_policy backoff;
    std::chrono::milliseconds default_max_wait{30000};
    std::size_t connection_retry_count = 2;

    std::vector<extraction_rule> extraction_rules = default_extraction_rules();

    /// Account link patterns for reset_link and both requests; empty disables link extraction.
    std::vector<extraction_rule> link_rules = default_link_rules();

    /// Gmail over implicit TLS with an app password; also scans the spam folder.
    static fetcher_config gmail(std::string username, std::string app_password)
    {
        fetcher_config cfg;
        cfg.endpoint.host = "imap.gmail.com";
        cfg.endpoint.port = 993;
        cfg.endpoint.tls = net::tls_mode::implicit;
        cfg.credentials = {std::move(username), std::move(app_password)};
        cfg.folders = {"INBOX", "[Gmail]/Spam"};
        cfg.pool_options.min_connections = 5;
        cfg.pool_options.max_connections = 10;
        return cfg;
    }

    /// Clear text server on the local machine, for development and tests.
    static fetcher_config local_plain(std::string host, unsigned short port, std::string username, std::string password)
    {
        fetcher_config cfg;
        cfg.endpoint.host = std::move(host);
        cfg.endpoint.port = port;
        cfg.endpoint.tls = net::tls_mode::none;
        cfg.credentials = {std::move(username), std::move(password)};
        cfg.imap_options.allow_cleartext_auth = true;
        cfg.imap_options.require_tls_for_auth = false;
        cfg.pool_options = pool::pool_config::low_traffic();
        return cfg;
    }

    [[nodiscard]] result_void validate() const
    {
        if (endpoint.host.empty())
            return fail_void(errc::invalid_argument, "Host is required.");
        if (endpoint.port == 0)
            return fail_void(errc::invalid_argument, "Port is required.");
        if (credentials.username.empty())
            return fail_void(errc::invalid_argument, "Username is required.");
        if (folders.empty())
            return fail_void(errc::invalid_argument, "At least one folder is required.");
        if (pool_options.max_connections == 0)
            return fail_void(errc::invalid_argument, "Pool size must be positive.");
        if (pool_options.min_connections > pool_options.max_connections)
            return fail_void(errc::invalid_argument, "min_connections exceeds max_connections.");
        if (scan_limit == 0)
            return fail_void(errc::invalid_argument, "Scan limit must be positive.");
        if (backoff.initial.count() <= 0)
            return fail_void(errc::invalid_argument, "Backoff interval must be positive.");
        if (backoff.multiplier < 1.0)
            return fail_void(errc::invalid_argument, "Backoff multiplier must be at least 1.");
        if (extraction_rules.empty())
            return fail_void(errc::invalid_argument, "At least one extraction rule is required.");
        return ok();
    }

    [[nodiscard]] poller_options make_poller_options() const
    {
        poller_options opts;
        opts.folders = folders;
        opts.scan_limit = scan_limit;
        opts.max_message_age = max_message_age;
        opts.filter_recipient = filter_recipient;
        opts.cache_ttl = cache_ttl;
        opts.backoff = backoff;
        opts.connection_retry_count = connection_retry_count;
        return opts;
    }
};

} // namespace otpxx
