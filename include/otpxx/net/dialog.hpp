/*

dialog.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <otpxx/detail/asio_decl.hpp>
#include <otpxx/detail/log.hpp>
#include <otpxx/detail/redact.hpp>
#include <otpxx/detail/result.hpp>
#include <otpxx/net/error_mapping.hpp>

namespace otpxx
{
namespace net
{

/// Default maximum line length for protocol lines.
inline constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 8192;

/// Absolute maximum line length to prevent excessive memory allocation (1 MB)
inline constexpr std::size_t MAX_ALLOWED_LINE_LENGTH = 1024 * 1024;

/**
Dealing with network in a line oriented fashion.
Wraps a Boost.Asio stream; every operation is bounded by the optional timeout,
on expiry the lowest layer is cancelled and the operation fails with
errc::net_timeout.
**/
template<typename Stream>
class dialog
{
public:
    using duration = std::chrono::steady_clock::duration;

    dialog(Stream stream,
        std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH,
        std::optional<duration> timeout = std::nullopt)
        : stream_(std::move(stream)),
          max_line_length_(std::min(max_line_length, MAX_ALLOWED_LINE_LENGTH)),
          timeout_(timeout)
    {
    }

    dialog(const dialog&) = delete;
    dialog& operator=(const dialog&) = delete;

    void set_trace_protocol(std::string protocol)
    {
        trace_protocol_ = std::move(protocol);
    }

    void set_trace_redaction(bool enabled) noexcept
    {
        redact_secrets_in_trace_ = enabled;
    }

    /// Send a line, CRLF is appended if missing.
    otpxx::asio::awaitable<result_void> write_line(std::string_view line)
    {
        std::string payload = normalize_line(line);
        trace_line(otpxx::log::direction::send, payload);

        otpxx::asio::error_code ec;
        bool timed_out = false;
        co_await run_with_timeout([this, &payload](auto token)
            {
                return otpxx::asio::async_write(stream_, otpxx::asio::buffer(payload), std::move(token));
            }, ec, timed_out);
        if (ec)
            co_return fail_from_asio<void>(io_stage::write, ec, timed_out);
        co_return ok();
    }

    /// Receive one line, without its line terminator.
    otpxx::asio::awaitable<result<std::string>> read_line()
    {
        while (true)
        {
            const auto pos = read_buffer_.find('\n');
            if (pos != std::string::npos)
            {
                const std::size_t line_length = (pos > 0 && read_buffer_[pos - 1] == '\r') ? pos - 1 : pos;
                if (line_length > max_line_length_)
                    co_return fail<std::string>(errc::net_io_failed, "Line exceeds the maximum length.");
                std::string line = read_buffer_.substr(0, line_length);
                read_buffer_.erase(0, pos + 1);
                trace_line(otpxx::log::direction::receive, line);
                co_return ok(std::move(line));
            }
            if (read_buffer_.size() > max_line_length_ + 2)
                co_return fail<std::string>(errc::net_io_failed, "Line exceeds the maximum length.");

            otpxx::asio::error_code ec;
            bool timed_out = false;
            const std::size_t max_size = max_line_length_ + 2;
            co_await run_with_timeout([this, max_size](auto token)
                {
                    return otpxx::asio::async_read_until(stream_,
                        otpxx::asio::dynamic_buffer(read_buffer_, max_size), '\n', std::move(token));
                }, ec, timed_out);
            if (ec)
                co_return fail_from_asio<std::string>(io_stage::read, ec, timed_out);
        }
    }

    /// Receive exactly n bytes (an IMAP literal).
    otpxx::asio::awaitable<result<std::string>> read_exactly(std::size_t n)
    {
        if (read_buffer_.size() < n)
        {
            const std::size_t remaining = n - read_buffer_.size();
            otpxx::asio::error_code ec;
            bool timed_out = false;
            co_await run_with_timeout([this, remaining](auto token)
                {
                    return otpxx::asio::async_read(stream_, otpxx::asio::dynamic_buffer(read_buffer_),
                        otpxx::asio::transfer_exactly(remaining), std::move(token));
                }, ec, timed_out);
            if (ec)
                co_return fail_from_asio<std::string>(io_stage::read, ec, timed_out);
            if (read_buffer_.size() < n)
                co_return fail<std::string>(errc::net_eof, "Literal truncated.");
        }

        std::string out(read_buffer_.data(), n);
        read_buffer_.erase(0, n);
        trace_payload(n);
        co_return ok(std::move(out));
    }

    [[nodiscard]] Stream& stream() noexcept { return stream_; }
    [[nodiscard]] const Stream& stream() const noexcept { return stream_; }

    [[nodiscard]] std::size_t max_line_length() const noexcept { return max_line_length_; }
    [[nodiscard]] std::optional<duration> timeout() const noexcept { return timeout_; }

protected:
    struct timeout_state
    {
        bool timed_out = false;
    };

    /**
    Run one async operation with the configured timeout. The initiation is
    called with a completion token and must return the awaitable.
    **/
    template<typename Initiation>
    otpxx::asio::awaitable<std::size_t> run_with_timeout(Initiation initiation,
        otpxx::asio::error_code& ec, bool& timed_out)
    {
        auto state = std::make_shared<timeout_state>();
        std::shared_ptr<otpxx::asio::steady_timer> timer;
        if (timeout_.has_value())
        {
            timer = std::make_shared<otpxx::asio::steady_timer>(stream_.get_executor());
            timer->expires_after(*timeout_);
            std::weak_ptr<bool> alive = alive_;
            timer->async_wait([this, state, alive](const otpxx::asio::error_code& timer_ec)
                {
                    if (timer_ec || alive.expired())
                        return;
                    state->timed_out = true;
                    otpxx::asio::error_code ignored;
                    stream_.lowest_layer().cancel(ignored);
                });
        }

        const std::size_t bytes = co_await initiation(
            otpxx::asio::redirect_error(otpxx::asio::use_awaitable, ec));
        if (timer)
            timer->cancel();
        timed_out = state->timed_out;
        if (timed_out && ec == otpxx::asio::error::operation_aborted)
            ec = otpxx::asio::error::timed_out;
        co_return bytes;
    }

    static std::string normalize_line(std::string_view line)
    {
        std::string out(line);
        while (!out.empty() && (out.back() == '\n' || out.back() == '\r'))
            out.pop_back();
        out += "\r\n";
        return out;
    }

    void trace_line(otpxx::log::direction dir, std::string_view data) const
    {
        auto& logger = otpxx::log::logger::instance();
        if (!logger.is_trace_enabled())
            return;
        if (dir == otpxx::log::direction::send && redact_secrets_in_trace_)
        {
            logger.trace_protocol(trace_protocol_, dir, otpxx::detail::redact_line(data));
            return;
        }
        logger.trace_protocol(trace_protocol_, dir, data);
    }

    void trace_payload(std::size_t bytes) const
    {
        auto& logger = otpxx::log::logger::instance();
        if (!logger.is_trace_enabled())
            return;
        std::string line = "literal bytes=";
        line += std::to_string(bytes);
        logger.trace_protocol(trace_protocol_, otpxx::log::direction::receive, line);
    }

    Stream stream_;
    std::string read_buffer_;
    std::size_t max_line_length_;
    std::optional<duration> timeout_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    std::string trace_protocol_{"NET"};
    bool redact_secrets_in_trace_{true};
};

} // namespace net
} // namespace otpxx
