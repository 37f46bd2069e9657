/*

sanitize.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>

#include <otpxx/detail/result.hpp>

namespace otpxx
{
namespace detail
{

inline bool contains_crlf_or_nul(std::string_view value) noexcept
{
    for (char ch : value)
    {
        if (ch == '\r' || ch == '\n' || ch == '\0')
            return true;
    }
    return false;
}

/// Rejects values that would break out of a single protocol line.
[[nodiscard]] inline result_void ensure_no_crlf_or_nul(std::string_view value, const char* field_name)
{
    if (!contains_crlf_or_nul(value))
        return ok();

    std::string message = "Invalid ";
    message += field_name ? field_name : "value";
    message += ": CR/LF or NUL not allowed.";
    return fail_void(errc::invalid_argument, std::move(message));
}

} // namespace detail
} // namespace otpxx
