/*

error_mapping.hpp
-----------------

Centralized mapping between Asio error codes and otpxx::errc for network I/O.

*/

#pragma once

#include <string_view>
#include <system_error>

#include <otpxx/detail/asio_decl.hpp>
#include <otpxx/detail/error_detail.hpp>
#include <otpxx/detail/result.hpp>

namespace otpxx::net
{

enum class io_stage
{
    resolve,
    connect,
    read,
    write,
    handshake
};

[[nodiscard]] constexpr std::string_view stage_name(io_stage stage) noexcept
{
    switch (stage)
    {
        case io_stage::resolve: return "resolve";
        case io_stage::connect: return "connect";
        case io_stage::read: return "read";
        case io_stage::write: return "write";
        case io_stage::handshake: return "handshake";
    }
    return "unknown";
}

[[nodiscard]] inline errc map_net_error(io_stage stage, const otpxx::asio::error_code& ec, bool timeout_triggered) noexcept
{
    namespace error = otpxx::asio::error;

    if (timeout_triggered || ec == error::timed_out)
        return errc::net_timeout;
    if (ec == error::operation_aborted)
        return errc::net_cancelled;
    if (ec == error::eof)
        return errc::net_eof;
    if (ec == error::connection_refused)
        return errc::net_connection_refused;
    if (ec == error::connection_reset || ec == error::broken_pipe)
        return errc::net_connection_reset;
    if (ec == error::host_not_found || ec == error::host_not_found_try_again)
        return errc::net_resolve_failed;

    switch (stage)
    {
        case io_stage::resolve: return errc::net_resolve_failed;
        case io_stage::connect: return errc::net_connect_failed;
        case io_stage::read: return errc::net_io_failed;
        case io_stage::write: return errc::net_io_failed;
        case io_stage::handshake: return errc::tls_handshake_failed;
    }
    return errc::net_io_failed;
}

[[nodiscard]] inline detail::error_detail make_net_detail(
    std::string_view proto,
    std::string_view host,
    io_stage stage)
{
    detail::error_detail detail;
    detail.add("proto", proto);
    detail.add("host", host);
    detail.add("stage", stage_name(stage));
    return detail;
}

/// Build a failed result from an Asio error code.
template<typename T>
[[nodiscard]] inline result<T> fail_from_asio(io_stage stage, const otpxx::asio::error_code& ec,
    bool timeout_triggered = false, std::string_view host = {})
{
    std::string message = "Network ";
    message += stage_name(stage);
    message += " failed.";
    return fail<T>(map_net_error(stage, ec, timeout_triggered), std::move(message),
        make_net_detail("imap", host, stage).add_ec("ec", ec).str(), ec);
}

} // namespace otpxx::net
