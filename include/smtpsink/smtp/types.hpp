/*

types.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <smtpsink/detail/append.hpp>
#include <smtpsink/detail/sanitize.hpp>

namespace smtpsink
{
namespace smtp
{

/**
Reply sent to the client: one status code and one or more text lines.
Multi-line replies use `-` after the code on all but the last line.
**/
struct reply
{
    int status = 0;
    std::vector<std::string> lines;

    [[nodiscard]] bool is_positive_completion() const noexcept { return status / 100 == 2; }
    [[nodiscard]] bool is_permanent_negative() const noexcept { return status / 100 == 5; }

    /// Lines as written on the wire, without terminators.
    [[nodiscard]] std::vector<std::string> wire_lines() const
    {
        std::vector<std::string> out;
        if (lines.empty())
        {
            std::string line;
            append_status(line, ' ');
            out.push_back(std::move(line));
            return out;
        }

        out.reserve(lines.size());
        for (std::size_t i = 0; i < lines.size(); ++i)
        {
            smtpsink::detail::ensure_single_line(lines[i]);
            std::string line;
            append_status(line, i + 1 < lines.size() ? '-' : ' ');
            smtpsink::detail::append_sv(line, lines[i]);
            out.push_back(std::move(line));
        }
        return out;
    }

private:
    void append_status(std::string& out, char separator) const
    {
        smtpsink::detail::append_uint(out, static_cast<std::uint64_t>(status));
        smtpsink::detail::append_char(out, separator);
    }
};

/**
Envelope and transport identity collected on one connection.
The session has started once `greeting_verb` is set.
**/
struct session_state
{
    std::string greeting_verb;
    std::string server_name;
    std::string client_name;
    std::string return_path;
    std::vector<std::string> recipients;
    std::vector<std::string> headers;
    std::string body;

    [[nodiscard]] bool has_started() const noexcept { return !greeting_verb.empty(); }

    /// Drops the envelope; the greeting and both names are kept.
    void reset()
    {
        return_path.clear();
        recipients.clear();
        headers.clear();
        body.clear();
    }
};

/**
Canonical text form of the captured envelope: MAIL FROM, one RCPT TO per
recipient, DATA, the headers, a blank line and the body as received.
**/
[[nodiscard]] inline std::string to_string(const session_state& st)
{
    using namespace smtpsink::detail;

    std::string out;
    append_sv(out, "MAIL FROM: ");
    append_angle_addr(out, st.return_path);
    append_crlf(out);
    for (const auto& rcpt : st.recipients)
    {
        append_sv(out, "RCPT TO: ");
        append_angle_addr(out, rcpt);
        append_crlf(out);
    }
    append_line(out, "DATA");
    for (const auto& header : st.headers)
        append_line(out, header);
    append_crlf(out);
    append_sv(out, st.body);
    return out;
}

struct session_options
{
    std::string server_name = "localhost";
    std::string greeting = "Simple Mail Transfer service ready";
};

struct server_options
{
    std::string address = "127.0.0.1";
    unsigned short port = 1025;
    session_options session;
};

} // namespace smtp
} // namespace smtpsink
