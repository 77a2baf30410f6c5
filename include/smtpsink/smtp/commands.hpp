/*

commands.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Command handlers and the verb dispatch table.

*/


#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include <smtpsink/detail/asio_decl.hpp>
#include <smtpsink/detail/result.hpp>
#include <smtpsink/net/line_channel.hpp>
#include <smtpsink/smtp/parser.hpp>
#include <smtpsink/smtp/types.hpp>

namespace smtpsink::smtp
{

enum class command_kind
{
    helo,
    ehlo,
    mail,
    rcpt,
    rset,
    vrfy,
    noop,
    quit,
    data
};

[[nodiscard]] constexpr std::string_view command_name(command_kind k) noexcept
{
    switch (k)
    {
        case command_kind::helo: return "helo";
        case command_kind::ehlo: return "ehlo";
        case command_kind::mail: return "mail";
        case command_kind::rcpt: return "rcpt";
        case command_kind::rset: return "rset";
        case command_kind::vrfy: return "vrfy";
        case command_kind::noop: return "noop";
        case command_kind::quit: return "quit";
        case command_kind::data: return "data";
    }
    return "other";
}

/// Fixed reply lines.
namespace replies
{
    inline constexpr std::string_view ok = "250 OK";
    inline constexpr std::string_view bye = "221 Bye";
    inline constexpr std::string_view session_started = "550 Session has started";
    inline constexpr std::string_view session_not_started = "550 Session has not started yet.";
    inline constexpr std::string_view greeting_syntax = "550 Invalid syntax (EHLO|HELO) domain";
    inline constexpr std::string_view mail_syntax = "550 Invalid syntax MAIL FROM: <foo@example.net>";
    inline constexpr std::string_view rcpt_syntax = "550 Invalid syntax RCPT TO: <foo@example.net>";
    inline constexpr std::string_view vrfy_not_supported = "550 VRFY not supported";
    inline constexpr std::string_view empty_command = "550 Command must not be empty";
    inline constexpr std::string_view not_recognized = "550 Command not recognized";
} // namespace replies

using channel_type = smtpsink::net::line_channel<smtpsink::asio::tcp::socket>;

/// What a handler may touch: the connection and the state of this session.
struct command_context
{
    channel_type& channel;
    session_state& state;
};

using command_handler = smtpsink::asio::awaitable<result_void> (*)(command_context&, const std::string&);

namespace handlers
{

inline smtpsink::asio::awaitable<result_void> send(command_context& ctx, std::string_view line)
{
    co_return co_await ctx.channel.write_line(std::string(line));
}

inline smtpsink::asio::awaitable<result_void> hello(command_context& ctx, const std::string& line)
{
    if (ctx.state.has_started())
        co_return co_await send(ctx, replies::session_started);

    auto args = parse_greeting(line);
    if (!args)
        co_return co_await send(ctx, replies::greeting_syntax);

    ctx.state.greeting_verb = std::move(args->verb);
    ctx.state.client_name = std::move(args->client_name);

    const reply rep{250, {ctx.state.server_name, "AUTH PLAIN", "HELP"}};
    co_return co_await ctx.channel.write_lines(rep.wire_lines());
}

inline smtpsink::asio::awaitable<result_void> mail(command_context& ctx, const std::string& line)
{
    if (!ctx.state.has_started())
        co_return co_await send(ctx, replies::session_not_started);

    auto address = parse_mail_from(line);
    if (!address)
        co_return co_await send(ctx, replies::mail_syntax);

    ctx.state.return_path = std::move(*address);
    co_return co_await send(ctx, replies::ok);
}

inline smtpsink::asio::awaitable<result_void> rcpt(command_context& ctx, const std::string& line)
{
    if (!ctx.state.has_started())
        co_return co_await send(ctx, replies::session_not_started);

    auto address = parse_rcpt_to(line);
    if (!address)
        co_return co_await send(ctx, replies::rcpt_syntax);

    ctx.state.recipients.push_back(std::move(*address));
    co_return co_await send(ctx, replies::ok);
}

inline smtpsink::asio::awaitable<result_void> rset(command_context& ctx, const std::string&)
{
    ctx.state.reset();
    co_return co_await send(ctx, replies::ok);
}

inline smtpsink::asio::awaitable<result_void> vrfy(command_context& ctx, const std::string&)
{
    co_return co_await send(ctx, replies::vrfy_not_supported);
}

inline smtpsink::asio::awaitable<result_void> noop(command_context& ctx, const std::string&)
{
    co_return co_await send(ctx, replies::ok);
}

// The link is closed before the reply is written, so the reply normally
// fails to go out and the session ends through the I/O error path.
inline smtpsink::asio::awaitable<result_void> quit(command_context& ctx, const std::string&)
{
    auto closed = ctx.channel.close();
    if (!closed)
        co_return closed;
    co_return co_await send(ctx, replies::bye);
}

// No check that MAIL or RCPT came first. Nothing is sent once the block is read.
inline smtpsink::asio::awaitable<result_void> data(command_context& ctx, const std::string&)
{
    SMTPSINK_CO_TRY_VOID(co_await send(ctx, replies::ok));

    auto lines = co_await ctx.channel.read_dot_lines();
    if (!lines)
        co_return fail(std::move(lines).error());

    auto content = split_data(*lines);
    ctx.state.headers = std::move(content.headers);
    ctx.state.body = std::move(content.body);
    co_return ok();
}

} // namespace handlers

struct command_entry
{
    command_kind kind;
    command_handler handler;
};

/// Verb to handler table. Built on first use and never modified afterwards.
[[nodiscard]] inline const std::unordered_map<std::string_view, command_entry>& command_table()
{
    static const std::unordered_map<std::string_view, command_entry> table{
        {"HELO", {command_kind::helo, &handlers::hello}},
        {"EHLO", {command_kind::ehlo, &handlers::hello}},
        {"MAIL", {command_kind::mail, &handlers::mail}},
        {"RCPT", {command_kind::rcpt, &handlers::rcpt}},
        {"RSET", {command_kind::rset, &handlers::rset}},
        {"VRFY", {command_kind::vrfy, &handlers::vrfy}},
        {"NOOP", {command_kind::noop, &handlers::noop}},
        {"QUIT", {command_kind::quit, &handlers::quit}},
        {"DATA", {command_kind::data, &handlers::data}},
    };
    return table;
}

/// Looks a verb up; verbs are matched case-sensitively.
[[nodiscard]] inline const command_entry* find_command(std::string_view verb)
{
    const auto& table = command_table();
    auto it = table.find(verb);
    return it == table.end() ? nullptr : &it->second;
}

} // namespace smtpsink::smtp
