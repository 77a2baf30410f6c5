/*

regex.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <smtpsink/config.hpp>

#if SMTPSINK_STD_REGEX_ENABLED
#include <regex>
#else
#include <boost/regex.hpp>
#endif

namespace smtpsink::detail
{
#if SMTPSINK_STD_REGEX_ENABLED
using regex = std::regex;
using smatch = std::smatch;

inline bool regex_match(const std::string& input, smatch& matches, const regex& pattern)
{
    return std::regex_match(input, matches, pattern);
}
#else
using regex = boost::regex;
using smatch = boost::smatch;

inline bool regex_match(const std::string& input, smatch& matches, const regex& pattern)
{
    return boost::regex_match(input, matches, pattern);
}
#endif
} // namespace smtpsink::detail
