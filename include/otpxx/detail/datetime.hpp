/*

datetime.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Date helpers shared by the MIME Date header and IMAP INTERNALDATE / SEARCH
SINCE formats.

*/


#pragma once

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <otpxx/detail/ascii.hpp>

namespace otpxx::detail
{

inline constexpr std::array<std::string_view, 12> MONTH_NAMES{
    "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

/// Month number in [1, 12] from its English abbreviation, case insensitive.
[[nodiscard]] inline std::optional<unsigned> month_from_name(std::string_view name) noexcept
{
    if (name.size() < 3)
        return std::nullopt;
    name = name.substr(0, 3);
    for (std::size_t i = 0; i < MONTH_NAMES.size(); ++i)
    {
        if (iequals_ascii(MONTH_NAMES[i], name))
            return static_cast<unsigned>(i + 1);
    }
    return std::nullopt;
}

/**
Build a UTC time point from broken down local time and its zone offset.

@return Nothing if the calendar date is invalid.
**/
[[nodiscard]] inline std::optional<std::chrono::system_clock::time_point> make_time_point(
    int year, unsigned month, unsigned day, int hour, int minute, int second, int tz_offset_minutes)
{
    using namespace std::chrono;
    const year_month_day ymd{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
    if (!ymd.ok() || hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60)
        return std::nullopt;

    sys_seconds tp = sys_days{ymd};
    tp += hours{hour} + minutes{minute} + seconds{second};
    tp -= minutes{tz_offset_minutes};
    return system_clock::time_point{tp};
}

/// Cursor based scanner for the fixed date layouts used by mail headers.
class date_scanner
{
public:
    explicit date_scanner(std::string_view in) noexcept : in_(in)
    {
    }

    void skip_space() noexcept
    {
        while (!in_.empty() && (in_.front() == ' ' || in_.front() == '\t'))
            in_.remove_prefix(1);
    }

    bool consume(char ch) noexcept
    {
        if (in_.empty() || in_.front() != ch)
            return false;
        in_.remove_prefix(1);
        return true;
    }

    bool number(std::size_t min_digits, std::size_t max_digits, int& out) noexcept
    {
        std::size_t n = 0;
        int value = 0;
        while (n < in_.size() && n < max_digits && is_ascii_digit(in_[n]))
        {
            value = value * 10 + (in_[n] - '0');
            ++n;
        }
        if (n < min_digits)
            return false;
        in_.remove_prefix(n);
        out = value;
        return true;
    }

    std::string_view word() noexcept
    {
        std::size_t n = 0;
        while (n < in_.size() && is_ascii_alpha(in_[n]))
            ++n;
        std::string_view w = in_.substr(0, n);
        in_.remove_prefix(n);
        return w;
    }

    /// "+hhmm" / "-hhmm", or a named zone (UT, GMT, Z are zero, others ignored).
    bool zone(int& offset_minutes) noexcept
    {
        offset_minutes = 0;
        if (in_.empty())
            return true;
        const char sign = in_.front();
        if (sign == '+' || sign == '-')
        {
            in_.remove_prefix(1);
            int hh = 0;
            int mm = 0;
            if (!number(2, 2, hh) || !number(2, 2, mm))
                return false;
            offset_minutes = (hh * 60 + mm) * (sign == '-' ? -1 : 1);
            return true;
        }
        word();
        return true;
    }

    [[nodiscard]] std::string_view rest() const noexcept
    {
        return in_;
    }

private:
    std::string_view in_;
};

/**
Parse an RFC 5322 Date header, e.g. "Tue, 1 Jul 2003 10:52:37 +0200".
The day name and the seconds are optional.
**/
[[nodiscard]] inline std::optional<std::chrono::system_clock::time_point> parse_rfc5322_date(std::string_view text)
{
    date_scanner in(trim_view(text));
    in.skip_space();
    // Optional day of week.
    if (!in.rest().empty() && is_ascii_alpha(in.rest().front()))
    {
        in.word();
        if (!in.consume(','))
            return std::nullopt;
        in.skip_space();
    }

    int day = 0;
    int year = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int offset = 0;
    if (!in.number(1, 2, day))
        return std::nullopt;
    in.skip_space();
    const auto month = month_from_name(in.word());
    if (!month)
        return std::nullopt;
    in.skip_space();
    if (!in.number(2, 4, year))
        return std::nullopt;
    if (year < 100)
        year += year < 50 ? 2000 : 1900;
    in.skip_space();
    if (!in.number(1, 2, hour) || !in.consume(':') || !in.number(2, 2, minute))
        return std::nullopt;
    if (in.consume(':') && !in.number(2, 2, second))
        return std::nullopt;
    in.skip_space();
    if (!in.zone(offset))
        return std::nullopt;
    return make_time_point(year, *month, static_cast<unsigned>(day), hour, minute, second, offset);
}

/// Format a date as "d-Mon-yyyy", the IMAP SEARCH date syntax.
[[nodiscard]] inline std::string format_imap_date(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;
    const year_month_day ymd{floor<days>(tp)};
    std::string out = std::to_string(static_cast<unsigned>(ymd.day()));
    out += '-';
    out += MONTH_NAMES[static_cast<unsigned>(ymd.month()) - 1];
    out += '-';
    out += std::to_string(static_cast<int>(ymd.year()));
    return out;
}

} // namespace otpxx::detail
