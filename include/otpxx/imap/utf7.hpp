/*

utf7.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Modified UTF-7 encoding of mailbox names (RFC 3501 section 5.1.3).

*/


#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <otpxx/codec/base64.hpp>
#include <otpxx/detail/result.hpp>

namespace otpxx::imap
{

namespace utf7
{

/// Decode one UTF-8 sequence starting at index, advancing it.
inline bool decode_utf8(std::string_view text, std::size_t& index, std::uint32_t& cp)
{
    const auto lead = static_cast<unsigned char>(text[index]);
    std::size_t extra = 0;
    if (lead < 0x80)
        cp = lead;
    else if ((lead & 0xE0) == 0xC0)
    {
        cp = lead & 0x1F;
        extra = 1;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
        cp = lead & 0x0F;
        extra = 2;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
        cp = lead & 0x07;
        extra = 3;
    }
    else
        return false;

    if (index + extra >= text.size())
        return false;
    for (std::size_t i = 1; i <= extra; ++i)
    {
        const auto cont = static_cast<unsigned char>(text[index + i]);
        if ((cont & 0xC0) != 0x80)
            return false;
        cp = (cp << 6) | (cont & 0x3F);
    }
    index += extra + 1;
    return cp < 0x110000;
}

/// Flush pending UTF-16BE bytes as a "&...-" shifted run.
inline void flush_run(std::string& out, std::string& utf16)
{
    if (utf16.empty())
        return;
    std::string encoded = codec::base64_encode(utf16);
    while (!encoded.empty() && encoded.back() == '=')
        encoded.pop_back();
    for (char& ch : encoded)
    {
        if (ch == '/')
            ch = ',';
    }
    out.push_back('&');
    out += encoded;
    out.push_back('-');
    utf16.clear();
}

inline void append_utf16be(std::string& out, std::uint16_t unit)
{
    out.push_back(static_cast<char>(unit >> 8));
    out.push_back(static_cast<char>(unit & 0xFF));
}

} // namespace utf7

/**
Encode a UTF-8 mailbox name in modified UTF-7.

@return The encoded name, or errc::invalid_argument on malformed UTF-8.
**/
[[nodiscard]] inline result<std::string> encode_modified_utf7(std::string_view name)
{
    std::string out;
    std::string utf16;
    std::size_t i = 0;
    while (i < name.size())
    {
        const char ch = name[i];
        if (ch >= 0x20 && ch <= 0x7E)
        {
            utf7::flush_run(out, utf16);
            if (ch == '&')
                out += "&-";
            else
                out.push_back(ch);
            ++i;
            continue;
        }

        std::uint32_t cp = 0;
        if (!utf7::decode_utf8(name, i, cp))
            return fail<std::string>(errc::invalid_argument, "Mailbox name is not valid UTF-8.");
        if (cp >= 0x10000)
        {
            cp -= 0x10000;
            utf7::append_utf16be(utf16, static_cast<std::uint16_t>(0xD800 | (cp >> 10)));
            utf7::append_utf16be(utf16, static_cast<std::uint16_t>(0xDC00 | (cp & 0x3FF)));
        }
        else
            utf7::append_utf16be(utf16, static_cast<std::uint16_t>(cp));
    }
    utf7::flush_run(out, utf16);
    return ok(std::move(out));
}

} // namespace otpxx::imap
