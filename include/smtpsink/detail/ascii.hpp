/*

ascii.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <cctype>

namespace smtpsink
{
namespace detail
{
    [[nodiscard]] inline std::string_view trim_view(std::string_view sv) noexcept
    {
        auto is_space = [](unsigned char c) noexcept { return std::isspace(c) != 0; };

        while (!sv.empty() && is_space(static_cast<unsigned char>(sv.front())))
            sv.remove_prefix(1);
        while (!sv.empty() && is_space(static_cast<unsigned char>(sv.back())))
            sv.remove_suffix(1);
        return sv;
    }

    [[nodiscard]] inline bool is_blank(std::string_view sv) noexcept
    {
        return trim_view(sv).empty();
    }

    /// Splits at the first space: ("EHLO a b") -> {"EHLO", "a b"}.
    /// The second part is empty when there is no space.
    [[nodiscard]] inline std::pair<std::string_view, std::string_view> split_first_space(std::string_view sv) noexcept
    {
        const auto pos = sv.find(' ');
        if (pos == std::string_view::npos)
            return {sv, std::string_view{}};
        return {sv.substr(0, pos), sv.substr(pos + 1)};
    }
} // namespace detail
} // namespace smtpsink
