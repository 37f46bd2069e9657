/*

append.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace otpxx
{
namespace detail
{

inline void append_sv(std::string& out, std::string_view sv)
{
    out.append(sv.data(), sv.size());
}

inline void append_char(std::string& out, char ch)
{
    out.push_back(ch);
}

inline void append_space(std::string& out)
{
    append_char(out, ' ');
}

inline void append_uint(std::string& out, std::uint64_t value)
{
    char buffer[20];
    const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (result.ec != std::errc())
        return;
    out.append(buffer, static_cast<std::size_t>(result.ptr - buffer));
}

/// Appends a comma separated IMAP sequence set ("4,9,12").
template<typename Range>
inline void append_uid_set(std::string& out, const Range& uids)
{
    bool first = true;
    for (const auto uid : uids)
    {
        if (!first)
            append_char(out, ',');
        append_uint(out, uid);
        first = false;
    }
}

} // namespace detail
} // namespace otpxx
