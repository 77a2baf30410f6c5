/*

parser.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Parsing of command lines and of the DATA block.

*/


#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <smtpsink/detail/ascii.hpp>
#include <smtpsink/detail/regex.hpp>

namespace smtpsink::smtp
{

/// Leading keyword of a command line, case preserved. Empty for a blank line.
[[nodiscard]] inline std::string_view extract_verb(std::string_view line) noexcept
{
    return smtpsink::detail::split_first_space(smtpsink::detail::trim_view(line)).first;
}

struct greeting_args
{
    std::string verb;
    std::string client_name;
};

/// Splits a HELO/EHLO line into the verb and the rest of the line.
[[nodiscard]] inline std::optional<greeting_args> parse_greeting(std::string_view line)
{
    const std::string_view trimmed = smtpsink::detail::trim_view(line);
    if (trimmed.find(' ') == std::string_view::npos)
        return std::nullopt;

    const auto [verb, rest] = smtpsink::detail::split_first_space(trimmed);
    return greeting_args{std::string(verb), std::string(rest)};
}

namespace detail
{
    [[nodiscard]] inline std::optional<std::string> match_path(const std::string& line,
        const smtpsink::detail::regex& pattern)
    {
        smtpsink::detail::smatch matches;
        if (!smtpsink::detail::regex_match(line, matches, pattern) || matches.size() != 2)
            return std::nullopt;
        return std::string(matches[1].first, matches[1].second);
    }
} // namespace detail

/// Address of `MAIL FROM:<address>`; spaces are allowed after the colon and after `>`.
[[nodiscard]] inline std::optional<std::string> parse_mail_from(const std::string& line)
{
    static const smtpsink::detail::regex pattern("^MAIL FROM: *<([^>]+)> *$");
    return detail::match_path(line, pattern);
}

/// Address of `RCPT TO:<address>`, same grammar as parse_mail_from().
[[nodiscard]] inline std::optional<std::string> parse_rcpt_to(const std::string& line)
{
    static const smtpsink::detail::regex pattern("^RCPT TO: *<([^>]+)> *$");
    return detail::match_path(line, pattern);
}

struct data_content
{
    std::vector<std::string> headers;
    std::string body;
};

/**
Splits the lines of a DATA block. Lines up to the first blank one are
headers, kept verbatim; that blank line is dropped; every later line goes to
the body followed by CRLF.
**/
[[nodiscard]] inline data_content split_data(const std::vector<std::string>& lines)
{
    data_content out;
    bool in_body = false;
    for (const auto& line : lines)
    {
        if (!in_body && smtpsink::detail::is_blank(line))
        {
            in_body = true;
            continue;
        }
        if (in_body)
        {
            out.body += line;
            out.body += "\r\n";
        }
        else
        {
            out.headers.push_back(line);
        }
    }
    return out;
}

} // namespace smtpsink::smtp
