/*

tls_mode.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <ostream>
#include <string_view>

namespace otpxx::net
{

/**
TLS mode for the mailbox connection. IMAP servers normally expect implicit
TLS on port 993; starttls and none exist for local and test servers.
**/
enum class tls_mode
{
    none,
    starttls,
    implicit
};

[[nodiscard]] constexpr std::string_view to_string(tls_mode mode) noexcept
{
    switch (mode)
    {
        case tls_mode::none: return "none";
        case tls_mode::starttls: return "starttls";
        case tls_mode::implicit: return "implicit";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, tls_mode mode)
{
    return os << to_string(mode);
}

} // namespace otpxx::net
