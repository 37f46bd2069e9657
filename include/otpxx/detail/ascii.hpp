/*

ascii.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cctype>
#include <string>
#include <string_view>

namespace otpxx
{
namespace detail
{
    [[nodiscard]] constexpr char ascii_tolower(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
    }

    [[nodiscard]] constexpr char ascii_toupper(char c) noexcept
    {
        return (c >= 'a' && c <= 'z') ? static_cast<char>(c - ('a' - 'A')) : c;
    }

    [[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size())
            return false;

        for (std::size_t i = 0; i < a.size(); ++i)
        {
            if (ascii_tolower(a[i]) != ascii_tolower(b[i]))
                return false;
        }
        return true;
    }

    [[nodiscard]] inline bool starts_with_ci(std::string_view text, std::string_view prefix) noexcept
    {
        if (text.size() < prefix.size())
            return false;
        return iequals_ascii(text.substr(0, prefix.size()), prefix);
    }

    /// Case-insensitive substring search. Returns npos when absent.
    [[nodiscard]] inline std::size_t ifind_ascii(std::string_view haystack, std::string_view needle) noexcept
    {
        if (needle.empty())
            return 0;
        if (haystack.size() < needle.size())
            return std::string_view::npos;
        for (std::size_t i = 0; i + needle.size() <= haystack.size(); ++i)
        {
            if (iequals_ascii(haystack.substr(i, needle.size()), needle))
                return i;
        }
        return std::string_view::npos;
    }

    [[nodiscard]] inline std::string to_lower_copy(std::string_view text)
    {
        std::string out;
        out.reserve(text.size());
        for (char ch : text)
            out.push_back(ascii_tolower(ch));
        return out;
    }

    [[nodiscard]] inline std::string to_upper_copy(std::string_view text)
    {
        std::string out;
        out.reserve(text.size());
        for (char ch : text)
            out.push_back(ascii_toupper(ch));
        return out;
    }

    [[nodiscard]] inline std::string_view trim_view(std::string_view sv) noexcept
    {
        auto is_space = [](unsigned char c) noexcept { return std::isspace(c) != 0; };

        while (!sv.empty() && is_space(static_cast<unsigned char>(sv.front())))
            sv.remove_prefix(1);
        while (!sv.empty() && is_space(static_cast<unsigned char>(sv.back())))
            sv.remove_suffix(1);
        return sv;
    }

    [[nodiscard]] inline std::string trim_copy(std::string_view sv)
    {
        return std::string(trim_view(sv));
    }

    [[nodiscard]] constexpr bool is_ascii_digit(char c) noexcept
    {
        return c >= '0' && c <= '9';
    }

    [[nodiscard]] constexpr bool is_ascii_alpha(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }
}
}
