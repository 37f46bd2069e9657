/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
Library operations report failures through result<T>; exceptions are reserved
for misuse detected at construction time.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace otpxx
{

/// Error kinds reported by otpxx operations
enum class errc : std::uint16_t
{
    ok = 0,

    // Network
    net_resolve_failed,
    net_connect_failed,
    net_connection_refused,
    net_connection_reset,
    net_timeout,
    net_eof,
    net_io_failed,
    net_cancelled,

    // TLS
    tls_handshake_failed,
    tls_verify_failed,

    // IMAP
    imap_tagged_no,
    imap_tagged_bad,
    imap_bye,
    imap_parse_error,
    imap_invalid_state,
    imap_continuation_expected,
    imap_auth_failed,

    // Pool
    pool_exhausted,
    pool_shutdown,

    // Message handling
    codec_invalid_input,
    mime_parse_error,
    otp_not_found,

    // Generic
    invalid_argument,
    internal_error
};

[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::ok: return "ok";
        case errc::net_resolve_failed: return "net_resolve_failed";
        case errc::net_connect_failed: return "net_connect_failed";
        case errc::net_connection_refused: return "net_connection_refused";
        case errc::net_connection_reset: return "net_connection_reset";
        case errc::net_timeout: return "net_timeout";
        case errc::net_eof: return "net_eof";
        case errc::net_io_failed: return "net_io_failed";
        case errc::net_cancelled: return "net_cancelled";
        case errc::tls_handshake_failed: return "tls_handshake_failed";
        case errc::tls_verify_failed: return "tls_verify_failed";
        case errc::imap_tagged_no: return "imap_tagged_no";
        case errc::imap_tagged_bad: return "imap_tagged_bad";
        case errc::imap_bye: return "imap_bye";
        case errc::imap_parse_error: return "imap_parse_error";
        case errc::imap_invalid_state: return "imap_invalid_state";
        case errc::imap_continuation_expected: return "imap_continuation_expected";
        case errc::imap_auth_failed: return "imap_auth_failed";
        case errc::pool_exhausted: return "pool_exhausted";
        case errc::pool_shutdown: return "pool_shutdown";
        case errc::codec_invalid_input: return "codec_invalid_input";
        case errc::mime_parse_error: return "mime_parse_error";
        case errc::otp_not_found: return "otp_not_found";
        case errc::invalid_argument: return "invalid_argument";
        case errc::internal_error: return "internal_error";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, errc code)
{
    return os << to_string(code);
}

struct error_info
{
    errc code = errc::ok;
    std::string message;
    std::string detail;
    std::error_code sys;
    std::source_location where = std::source_location::current();
};

/// Credentials were rejected by the server. Never retried.
[[nodiscard]] constexpr bool is_auth_error(errc code) noexcept
{
    return code == errc::imap_auth_failed;
}

/// The session can no longer be trusted and has to be discarded.
[[nodiscard]] constexpr bool is_connection_error(errc code) noexcept
{
    switch (code)
    {
        case errc::net_resolve_failed:
        case errc::net_connect_failed:
        case errc::net_connection_refused:
        case errc::net_connection_reset:
        case errc::net_timeout:
        case errc::net_eof:
        case errc::net_io_failed:
        case errc::net_cancelled:
        case errc::tls_handshake_failed:
        case errc::tls_verify_failed:
        case errc::imap_bye:
        case errc::imap_parse_error:
        case errc::imap_invalid_state:
        case errc::imap_continuation_expected:
            return true;
        default:
            return false;
    }
}

/// The server refused a folder level command; the session itself is fine.
[[nodiscard]] constexpr bool is_folder_error(errc code) noexcept
{
    return code == errc::imap_tagged_no || code == errc::imap_tagged_bad;
}

template<typename T>
using result = std::expected<T, error_info>;

using result_void = result<void>;

template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline result_void ok()
{
    return result_void{};
}

template<typename T>
[[nodiscard]] inline result<T> fail(error_info info)
{
    return std::unexpected(std::move(info));
}

template<typename T>
[[nodiscard]] inline result<T> fail(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return std::unexpected(error_info{code, std::move(message), std::move(detail), sys, where});
}

[[nodiscard]] inline result_void fail_void(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return fail<void>(code, std::move(message), std::move(detail), sys, where);
}

/// One line description for logs.
[[nodiscard]] inline std::string describe(const error_info& err)
{
    std::string out(to_string(err.code));
    if (!err.message.empty())
    {
        out += ": ";
        out += err.message;
    }
    if (err.sys)
    {
        out += " (";
        out += err.sys.message();
        out += ")";
    }
    return out;
}

} // namespace otpxx

// Coroutine helpers. Each propagates the error of a failed result to the
// enclosing awaitable<result<...>>.

#define OTPXX_CO_TRY_VOID(expr) \
    do { \
        auto&& otpxx_try_result_ = (expr); \
        if (!otpxx_try_result_) [[unlikely]] \
            co_return std::unexpected(std::move(otpxx_try_result_).error()); \
    } while (0)

#define OTPXX_CO_TRY_ASSIGN(lhs, expr) \
    do { \
        auto&& otpxx_try_result_ = (expr); \
        if (!otpxx_try_result_) [[unlikely]] \
            co_return std::unexpected(std::move(otpxx_try_result_).error()); \
        lhs = std::move(*otpxx_try_result_); \
    } while (0)

#define OTPXX_TRY_CO_AWAIT(expr) OTPXX_CO_TRY_VOID(co_await (expr))
