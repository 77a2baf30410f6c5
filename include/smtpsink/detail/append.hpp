/*

append.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <charconv>
#include <cstdint>
#include <system_error>

namespace smtpsink
{
namespace detail
{

inline void append_sv(std::string& out, std::string_view sv)
{
    out.reserve(out.size() + sv.size());
    out.append(sv.data(), sv.size());
}

inline void append_char(std::string& out, char ch)
{
    out.reserve(out.size() + 1);
    out.push_back(ch);
}

inline void append_crlf(std::string& out)
{
    out.reserve(out.size() + 2);
    out.append("\r\n", 2);
}

inline void append_uint(std::string& out, std::uint64_t value)
{
    char buffer[20];
    const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (result.ec != std::errc())
        return;
    const auto len = static_cast<std::size_t>(result.ptr - buffer);
    out.reserve(out.size() + len);
    out.append(buffer, len);
}

inline void append_angle_addr(std::string& out, std::string_view addr)
{
    out.reserve(out.size() + addr.size() + 2);
    out.push_back('<');
    out.append(addr.data(), addr.size());
    out.push_back('>');
}

/// Appends `line` followed by CRLF.
inline void append_line(std::string& out, std::string_view line)
{
    append_sv(out, line);
    append_crlf(out);
}

} // namespace detail
} // namespace smtpsink
