/*

regex.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>

#include <boost/regex.hpp>

namespace otpxx::detail
{
using regex = boost::regex;
using smatch = boost::smatch;
using regex_error = boost::regex_error;
using match_flag_type = boost::match_flag_type;

constexpr regex::flag_type regex_icase = boost::regex::perl | boost::regex::icase;

inline bool regex_search(const std::string& input, smatch& matches, const regex& pattern)
{
    return boost::regex_search(input, matches, pattern);
}

inline std::string regex_replace(const std::string& input, const regex& pattern, const std::string& with)
{
    return boost::regex_replace(input, pattern, with);
}
} // namespace otpxx::detail
