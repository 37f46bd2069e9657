/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Centralized Boost.Asio declarations for otpxx.
Only the coroutine subset available since Boost.Asio 1.18 is used: awaitable,
co_spawn, use_awaitable and redirect_error.

*/

#pragma once

#include <utility>

#include <boost/asio/version.hpp>
#if BOOST_ASIO_VERSION < 101800 // Boost.Asio 1.18.0
#error "Boost.Asio version 1.18.0 or higher is required (Boost 1.74+)"
#endif

#include <boost/asio.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ssl.hpp>

#if !defined(BOOST_ASIO_HAS_CO_AWAIT)
#error "otpxx requires coroutine support (C++20)"
#endif

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <chrono>

namespace otpxx::asio
{
    // Core types
    using boost::asio::awaitable;
    using boost::asio::buffer;
    using boost::asio::co_spawn;
    using boost::asio::detached;
    using boost::asio::use_awaitable;
    using boost::asio::io_context;
    using boost::asio::any_io_executor;
    using boost::asio::steady_timer;
    using boost::asio::redirect_error;
    using boost::asio::post;
    namespace this_coro = boost::asio::this_coro;

    // IP networking
    namespace ip = boost::asio::ip;
    using tcp = boost::asio::ip::tcp;

    // Async operations
    using boost::asio::async_write;
    using boost::asio::async_read;
    using boost::asio::async_read_until;
    using boost::asio::async_compose;
    using boost::asio::async_connect;
    using boost::asio::dynamic_buffer;
    using boost::asio::transfer_exactly;

    namespace ssl = boost::asio::ssl;
    namespace error = boost::asio::error;

    using error_code = boost::system::error_code;
    using system_error = boost::system::system_error;

    /// Suspend on a timer, ignoring cancellation. Returns the wait status.
    inline awaitable<error_code> wait(steady_timer& timer)
    {
        error_code ec;
        co_await timer.async_wait(redirect_error(use_awaitable, ec));
        co_return ec;
    }

    /// Suspend the calling coroutine for the given duration.
    inline awaitable<void> sleep_for(std::chrono::steady_clock::duration delay)
    {
        steady_timer timer(co_await boost::asio::this_coro::executor);
        timer.expires_after(delay);
        error_code ec;
        co_await timer.async_wait(redirect_error(use_awaitable, ec));
    }

} // namespace otpxx::asio

namespace otpxx
{
    using namespace std::literals::chrono_literals;
    using std::chrono::steady_clock;
}
