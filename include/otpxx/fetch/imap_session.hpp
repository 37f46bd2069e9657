/*

fetch/imap_session.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <memory>
#include <string>
#include <utility>
#include <otpxx/detail/asio_decl.hpp>
#include <otpxx/detail/log.hpp>
#include <otpxx/detail/result.hpp>
#include <otpxx/fetch/session.hpp>
#include <otpxx/imap/client.hpp>
#include <otpxx/net/tls_mode.hpp>

namespace otpxx
{

/// Where the mailbox lives.
struct imap_endpoint
{
    std::string host;
    unsigned short port = 993;
    net::tls_mode tls = net::tls_mode::implicit;
    std::string sni;
};


/**
mailbox_session over an IMAP connection.
**/
class imap_session final : public mailbox_session
{
public:
    imap_session(std::unique_ptr<imap::client> client, std::string identity)
        : client_(std::move(client)), identity_(std::move(identity))
    {
    }

    ~imap_session() override
    {
        if (client_)
            client_->close();
    }

    [[nodiscard]] const std::string& identity() const noexcept override
    {
        return identity_;
    }

    asio::awaitable<result<imap::mailbox_stat>> examine(std::string_view folder) override
    {
        std::pair<imap::response, imap::mailbox_stat> res;
        OTPXX_CO_TRY_ASSIGN(res, co_await client_->examine(folder));
        co_return ok(res.second);
    }

    asio::awaitable<result<std::vector<std::uint32_t>>> uid_search(std::string_view criteria) override
    {
        co_return co_await client_->uid_search(criteria);
    }

    asio::awaitable<result<std::vector<imap::fetched_message>>> uid_fetch_messages(
        const std::vector<std::uint32_t>& uids) override
    {
        co_return co_await client_->uid_fetch_messages(uids);
    }

    asio::awaitable<result_void> noop() override
    {
        OTPXX_TRY_CO_AWAIT(client_->noop());
        co_return ok();
    }

    asio::awaitable<result_void> logout() override
    {
        if (!client_->is_connected())
            co_return ok();
        OTPXX_TRY_CO_AWAIT(client_->logout());
        co_return ok();
    }

    imap::client& imap_client() noexcept
    {
        return *client_;
    }

private:
    std::unique_ptr<imap::client> client_;
    std::string identity_;
};


/**
Connect, read the greeting and authenticate.

A NO answer to LOGIN or AUTHENTICATE is reported as errc::imap_auth_failed.

@param executor    Executor the connection runs on.
@param endpoint    Server address and TLS mode.
@param cred        Mailbox credentials.
@param method      Authentication mechanism.
@param opts        IMAP client options.
@param tls_ctx     TLS context; required unless endpoint.tls is none.
**/
inline asio::awaitable<result<std::unique_ptr<mailbox_session>>> open_imap_session(
    asio::any_io_executor executor,
    imap_endpoint endpoint,
    imap::credentials cred,
    imap::auth_method method,
    imap::options opts,
    asio::ssl::context* tls_ctx)
{
    if (endpoint.tls != net::tls_mode::none && tls_ctx == nullptr)
        co_return fail<std::unique_ptr<mailbox_session>>(errc::invalid_argument, "TLS context is required.");

    auto client = std::make_unique<imap::client>(executor, std::move(opts));
    OTPXX_TRY_CO_AWAIT(client->connect(endpoint.host, endpoint.port, endpoint.tls, tls_ctx, endpoint.sni));
    if (endpoint.tls != net::tls_mode::starttls)
        OTPXX_TRY_CO_AWAIT(client->read_greeting());

    auto auth = co_await client->authenticate(cred, method);
    if (!auth)
    {
        error_info err = std::move(auth).error();
        client->close();
        if (err.code == errc::imap_tagged_no)
        {
            OTPXX_LOG_ERROR("imap", "authentication rejected for " << cred.username);
            err.code = errc::imap_auth_failed;
            err.message = "Authentication rejected by the server.";
        }
        co_return std::unexpected(std::move(err));
    }

    OTPXX_LOG_DEBUG("imap", "session opened for " << cred.username << " on " << endpoint.host);
    co_return ok(std::unique_ptr<mailbox_session>(
        std::make_unique<imap_session>(std::move(client), cred.username)));
}

} // namespace otpxx
