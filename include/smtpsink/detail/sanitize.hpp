/*

sanitize.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace smtpsink::detail
{

/// Throws if `text` would not fit on one wire line.
inline void ensure_single_line(std::string_view text)
{
    if (text.find_first_of(std::string_view("\r\n\0", 3)) == std::string_view::npos)
        return;
    throw std::invalid_argument("line break or NUL inside reply text: " + std::string(text.substr(0, 64)));
}

} // namespace smtpsink::detail
