/*

base64.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Base64 transfer encoding (RFC 2045) on top of OpenSSL EVP block functions.

*/


#pragma once

#include <string>
#include <string_view>

#include <openssl/evp.h>

#include <otpxx/detail/result.hpp>

namespace otpxx::codec
{

/// Encode into a single line without wrapping.
[[nodiscard]] inline std::string base64_encode(std::string_view input)
{
    if (input.empty())
        return {};
    std::string out(4 * ((input.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
        reinterpret_cast<const unsigned char*>(input.data()), static_cast<int>(input.size()));
    out.resize(written > 0 ? static_cast<std::size_t>(written) : 0);
    return out;
}

/**
Decode base64 text. Line breaks and other whitespace are skipped, missing
padding is restored.

@return Decoded bytes or errc::codec_invalid_input.
**/
[[nodiscard]] inline result<std::string> base64_decode(std::string_view input)
{
    std::string compact;
    compact.reserve(input.size());
    for (char ch : input)
    {
        if (ch == '\r' || ch == '\n' || ch == ' ' || ch == '\t')
            continue;
        compact.push_back(ch);
    }
    if (compact.empty())
        return ok(std::string());
    if (compact.size() % 4 != 0)
        compact.append(4 - compact.size() % 4, '=');

    std::string out(3 * (compact.size() / 4), '\0');
    const int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
        reinterpret_cast<const unsigned char*>(compact.data()), static_cast<int>(compact.size()));
    if (written < 0)
        return fail<std::string>(errc::codec_invalid_input, "Invalid base64 input.");

    // EVP_DecodeBlock counts padding bytes as output.
    std::size_t size = static_cast<std::size_t>(written);
    std::size_t padding = 0;
    for (auto it = compact.rbegin(); it != compact.rend() && *it == '=' && padding < 2; ++it)
        ++padding;
    size = size >= padding ? size - padding : 0;
    out.resize(size);
    return ok(std::move(out));
}

} // namespace otpxx::codec
