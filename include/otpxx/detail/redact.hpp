/*

redact.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Masks credentials in IMAP command lines before they reach traces or error
details.

*/

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <otpxx/detail/ascii.hpp>

namespace otpxx::detail
{

inline void split_tokens(std::string_view text, std::vector<std::string_view>& out)
{
    out.clear();
    while (!text.empty())
    {
        while (!text.empty() && text.front() == ' ')
            text.remove_prefix(1);
        if (text.empty())
            break;
        const auto pos = text.find(' ');
        if (pos == std::string_view::npos)
        {
            out.push_back(text);
            break;
        }
        out.push_back(text.substr(0, pos));
        text.remove_prefix(pos + 1);
    }
}

[[nodiscard]] inline bool looks_like_base64(std::string_view text) noexcept
{
    if (text.size() < 12)
        return false;
    for (char ch : text)
    {
        const bool valid = is_ascii_alpha(ch) || is_ascii_digit(ch) || ch == '+' || ch == '/' || ch == '=';
        if (!valid)
            return false;
    }
    return true;
}

/**
Redact the secret part of LOGIN and AUTHENTICATE commands.

`a1 LOGIN "user" "pass"` becomes `a1 LOGIN "user" <redacted>`; a bare SASL
continuation line that looks like base64 is fully masked.
**/
[[nodiscard]] inline std::string redact_line(std::string_view line)
{
    std::string_view core = line;
    while (!core.empty() && (core.back() == '\r' || core.back() == '\n'))
        core.remove_suffix(1);
    const std::string_view suffix = line.substr(core.size());

    std::vector<std::string_view> tokens;
    split_tokens(core, tokens);
    if (tokens.empty())
        return std::string(line);

    bool redacted = false;
    for (std::size_t i = 0; i < tokens.size(); ++i)
    {
        if (iequals_ascii(tokens[i], "LOGIN"))
        {
            if (i + 2 < tokens.size())
            {
                tokens.resize(i + 3);
                tokens[i + 2] = "<redacted>";
                redacted = true;
            }
            break;
        }
        if (iequals_ascii(tokens[i], "AUTHENTICATE"))
        {
            if (i + 2 < tokens.size())
            {
                tokens.resize(i + 3);
                tokens[i + 2] = "<redacted>";
                redacted = true;
            }
            break;
        }
    }

    if (!redacted && tokens.size() == 1 && looks_like_base64(tokens.front()))
    {
        tokens[0] = "<redacted>";
        redacted = true;
    }

    if (!redacted)
        return std::string(line);

    std::string out;
    out.reserve(core.size() + suffix.size() + 16);
    for (std::size_t i = 0; i < tokens.size(); ++i)
    {
        if (i > 0)
            out.push_back(' ');
        out.append(tokens[i].data(), tokens[i].size());
    }
    out.append(suffix.data(), suffix.size());
    return out;
}

} // namespace otpxx::detail
