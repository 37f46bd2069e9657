/*

encoded_word.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Decoding of RFC 2047 encoded words in header values.

*/


#pragma once

#include <string>
#include <string_view>

#include <otpxx/codec/base64.hpp>
#include <otpxx/codec/quoted_printable.hpp>
#include <otpxx/detail/ascii.hpp>

namespace otpxx::codec
{

/// Latin-1 bytes to UTF-8.
[[nodiscard]] inline std::string latin1_to_utf8(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char ch : text)
    {
        const auto byte = static_cast<unsigned char>(ch);
        if (byte < 0x80)
        {
            out.push_back(ch);
            continue;
        }
        out.push_back(static_cast<char>(0xC0 | (byte >> 6)));
        out.push_back(static_cast<char>(0x80 | (byte & 0x3F)));
    }
    return out;
}

/**
Decode a single "=?charset?enc?text?=" word.

@return False if the token is not a well formed encoded word.
**/
inline bool decode_encoded_word(std::string_view word, std::string& out)
{
    if (word.size() < 8 || word.substr(0, 2) != "=?" || word.substr(word.size() - 2) != "?=")
        return false;

    const std::string_view inner = word.substr(2, word.size() - 4);
    const auto q1 = inner.find('?');
    if (q1 == std::string_view::npos)
        return false;
    const auto q2 = inner.find('?', q1 + 1);
    if (q2 == std::string_view::npos || q2 != q1 + 2)
        return false;

    std::string_view charset = inner.substr(0, q1);
    // RFC 2231 language suffix
    if (const auto star = charset.find('*'); star != std::string_view::npos)
        charset = charset.substr(0, star);
    const char encoding = detail::ascii_toupper(inner[q1 + 1]);
    const std::string_view text = inner.substr(q2 + 1);

    std::string decoded;
    if (encoding == 'B')
    {
        auto bytes = base64_decode(text);
        if (!bytes)
            return false;
        decoded = std::move(*bytes);
    }
    else if (encoding == 'Q')
        decoded = decode_quoted_printable(text, true);
    else
        return false;

    if (detail::iequals_ascii(charset, "iso-8859-1") || detail::iequals_ascii(charset, "latin1")
        || detail::iequals_ascii(charset, "windows-1252"))
        out += latin1_to_utf8(decoded);
    else
        out += decoded;
    return true;
}

/**
Decode every encoded word of a header value. Whitespace between two adjacent
encoded words is dropped (RFC 2047 section 6.2). Malformed words are kept as
they are.
**/
[[nodiscard]] inline std::string decode_header_value(std::string_view value)
{
    std::string out;
    out.reserve(value.size());

    std::size_t pos = 0;
    bool previous_was_word = false;

    while (pos < value.size())
    {
        const auto start = value.find("=?", pos);
        if (start == std::string_view::npos)
        {
            out.append(value.substr(pos));
            break;
        }

        std::string_view between = value.substr(pos, start - pos);
        const bool only_space = detail::trim_view(between).empty();

        // Locate "?=" after charset and encoding markers.
        const auto q1 = value.find('?', start + 2);
        const auto q2 = q1 == std::string_view::npos ? q1 : value.find('?', q1 + 1);
        const auto end = q2 == std::string_view::npos ? q2 : value.find("?=", q2 + 1);
        if (end == std::string_view::npos)
        {
            out.append(value.substr(pos));
            break;
        }

        const std::string_view word = value.substr(start, end + 2 - start);
        std::string decoded;
        if (decode_encoded_word(word, decoded))
        {
            if (!(previous_was_word && only_space))
                out.append(between);
            out += decoded;
            previous_was_word = true;
        }
        else
        {
            out.append(between);
            out.append(word);
            previous_was_word = false;
        }
        pos = end + 2;
    }
    return out;
}

} // namespace otpxx::codec
