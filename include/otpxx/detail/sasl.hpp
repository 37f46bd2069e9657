/*

sasl.hpp
--------

SASL helpers for otpxx. Only the PLAIN mechanism (RFC 4616) is implemented.

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <string_view>

#include <otpxx/codec/base64.hpp>
#include <otpxx/detail/result.hpp>

namespace otpxx::sasl
{

/**
 * Encode credentials for SASL PLAIN: base64 of "\0username\0password".
 *
 * @return Single line base64 text, or errc::invalid_argument if a field
 *         contains a NUL byte.
 */
inline result<std::string> encode_plain(std::string_view username, std::string_view password)
{
    if (username.find('\0') != std::string_view::npos || password.find('\0') != std::string_view::npos)
        return fail<std::string>(errc::invalid_argument, "SASL PLAIN fields must not contain NUL.");

    std::string plain;
    plain.reserve(2 + username.size() + password.size());
    plain.push_back('\0');
    plain += username;
    plain.push_back('\0');
    plain += password;
    return ok(codec::base64_encode(plain));
}

} // namespace otpxx::sasl
