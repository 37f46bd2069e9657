/*

fetch/session.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <otpxx/detail/asio_decl.hpp>
#include <otpxx/detail/result.hpp>
#include <otpxx/imap/types.hpp>

namespace otpxx
{

/**
An authenticated, read-only view of a mailbox.

Sessions are owned by the connection pool and leased to one scan at a time.
None of the operations modifies mail: folders are opened with EXAMINE and
bodies are fetched with BODY.PEEK[].
**/
class mailbox_session
{
public:
    virtual ~mailbox_session() = default;

    /// Account the session is logged in as.
    [[nodiscard]] virtual const std::string& identity() const noexcept = 0;

    virtual asio::awaitable<result<imap::mailbox_stat>> examine(std::string_view folder) = 0;

    /// UIDs matching an IMAP search criteria string, in server order.
    virtual asio::awaitable<result<std::vector<std::uint32_t>>> uid_search(std::string_view criteria) = 0;

    virtual asio::awaitable<result<std::vector<imap::fetched_message>>> uid_fetch_messages(
        const std::vector<std::uint32_t>& uids) = 0;

    /// Keep-alive check.
    virtual asio::awaitable<result_void> noop() = 0;

    virtual asio::awaitable<result_void> logout() = 0;
};

} // namespace otpxx
