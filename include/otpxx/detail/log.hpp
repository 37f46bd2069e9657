/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for otpxx.
Supports log levels, an optional callback sink, and protocol tracing.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>

namespace otpxx::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Protocol-level tracing (very verbose)
    debug = 1,   ///< Debug information
    info = 2,    ///< Informational messages
    warn = 3,    ///< Warnings (non-fatal issues)
    error = 4,   ///< Errors (operation failures)
    off = 5      ///< Logging disabled
};

/// Direction for protocol tracing
enum class direction : std::uint8_t
{
    send,
    receive
};

/// Log entry passed to callbacks
struct entry
{
    level lvl = level::info;
    std::chrono::system_clock::time_point timestamp;
    std::string category;
    std::string message;
    std::source_location location;

    struct trace_info_t
    {
        direction dir;
        std::string protocol;
        std::string data;
    };
    std::optional<trace_info_t> trace_info;
};

using callback_t = std::function<void(const entry&)>;

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Global logger configuration (thread-safe singleton)
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off
            && static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /// Replace the default stderr output.
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    void set_trace_enabled(bool enabled) noexcept
    {
        trace_enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return trace_enabled_.load(std::memory_order_relaxed);
    }

    void log(level lvl, std::string_view category, std::string_view message,
        std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e;
        e.lvl = lvl;
        e.timestamp = std::chrono::system_clock::now();
        e.category = std::string(category);
        e.message = std::string(message);
        e.location = loc;
        dispatch(e);
    }

    void trace_protocol(std::string_view protocol, direction dir, std::string_view data,
        std::source_location loc = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;

        entry e;
        e.lvl = level::trace;
        e.timestamp = std::chrono::system_clock::now();
        e.category = std::string(protocol);
        e.location = loc;
        e.trace_info = entry::trace_info_t{dir, std::string(protocol), std::string(data)};
        dispatch(e);
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
            callback_(e);
        else
            default_output(e);
    }

    static void default_output(const entry& e)
    {
        const auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            e.timestamp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time, &tm_buf);

        char stamp[32];
        std::snprintf(stamp, sizeof(stamp), "[%02d:%02d:%02d.%03d]",
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));

        if (e.trace_info)
        {
            const char* dir_str = (e.trace_info->dir == direction::send) ? ">>>" : "<<<";
            std::cerr << stamp << ' ' << e.trace_info->protocol << ' ' << dir_str << ' '
                << sanitize_trace(e.trace_info->data) << '\n';
            return;
        }

        std::cerr << stamp << " [" << level_to_string(e.lvl) << "] ";
        if (!e.category.empty())
            std::cerr << '[' << e.category << "] ";
        std::cerr << e.message << '\n';
    }

    /// Truncate long payloads and mask control characters.
    [[nodiscard]] static std::string sanitize_trace(std::string_view data)
    {
        std::string out(data);
        constexpr std::size_t max_len = 500;
        if (out.size() > max_len)
        {
            out.resize(max_len);
            out += "... [truncated]";
        }
        for (char& c : out)
        {
            if (static_cast<unsigned char>(c) < 32 && c != '\r' && c != '\n')
                c = '.';
        }
        return out;
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::warn)};
    std::atomic<bool> trace_enabled_{false};
    std::mutex mutex_;
    callback_t callback_;
};

} // namespace otpxx::log

#define OTPXX_LOG_AT(lvl, category, expr) \
    do { \
        auto& otpxx_logger_ = ::otpxx::log::logger::instance(); \
        if (otpxx_logger_.is_enabled(lvl)) \
        { \
            std::ostringstream otpxx_log_stream_; \
            otpxx_log_stream_ << expr; \
            otpxx_logger_.log(lvl, category, otpxx_log_stream_.str()); \
        } \
    } while (0)

#define OTPXX_LOG_TRACE(category, expr) OTPXX_LOG_AT(::otpxx::log::level::trace, category, expr)
#define OTPXX_LOG_DEBUG(category, expr) OTPXX_LOG_AT(::otpxx::log::level::debug, category, expr)
#define OTPXX_LOG_INFO(category, expr) OTPXX_LOG_AT(::otpxx::log::level::info, category, expr)
#define OTPXX_LOG_WARN(category, expr) OTPXX_LOG_AT(::otpxx::log::level::warn, category, expr)
#define OTPXX_LOG_ERROR(category, expr) OTPXX_LOG_AT(::otpxx::log::level::error, category, expr)
