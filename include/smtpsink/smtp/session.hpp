/*

session.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include <smtpsink/detail/asio_decl.hpp>
#include <smtpsink/detail/ascii.hpp>
#include <smtpsink/detail/log.hpp>
#include <smtpsink/detail/result.hpp>
#include <smtpsink/smtp/commands.hpp>
#include <smtpsink/smtp/types.hpp>

namespace smtpsink::smtp
{

/**
One accepted connection, from the service ready line to the close.

Commands are read and handled one at a time. Protocol errors are answered
and the session goes on; the first I/O error ends it.
**/
class session
{
public:
    /// Receives the final state once QUIT has been handled.
    using consumer_type = std::function<void(const session_state&)>;

    explicit session(smtpsink::asio::tcp::socket socket, session_options opts = {}, consumer_type consumer = {})
        : channel_(std::move(socket)),
          options_(std::move(opts)),
          consumer_(std::move(consumer))
    {
        channel_.set_trace_protocol("SMTP");
        state_.server_name = options_.server_name;

        smtpsink::asio::error_code ec;
        const auto endpoint = channel_.stream().remote_endpoint(ec);
        if (!ec)
            peer_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        else
            peer_ = "unknown peer";
    }

    session(const session&) = delete;
    session& operator=(const session&) = delete;

    /**
    Runs the session to its end and closes the connection.

    @return Success, or the I/O error that ended the session. A QUIT whose
            closing reply could not be written reports that write error.
    **/
    smtpsink::asio::awaitable<result_void> run()
    {
        SMTPSINK_DEBUG("session started with " + peer_);
        auto res = co_await serve();

        if (auto closed = channel_.close(); !closed)
            SMTPSINK_WARN("closing connection to " + peer_ + " failed: " + closed.error().to_string());

        if (quit_received_)
        {
            SMTPSINK_INFO("session with " + peer_ + " ended by QUIT, " +
                std::to_string(state_.recipients.size()) + " recipient(s)");
            if (consumer_)
                consumer_(state_);
        }
        else if (!res && res.error().is(error_code::connection_closed))
        {
            SMTPSINK_DEBUG("session with " + peer_ + " closed by peer: " + res.error().message());
        }
        else if (!res && res.error().is(error_code::cancelled))
        {
            SMTPSINK_DEBUG("session with " + peer_ + " closed by server");
        }
        else if (!res)
        {
            SMTPSINK_WARN("session with " + peer_ + " failed: " + res.error().to_string());
        }
        co_return res;
    }

    /**
    Closes the connection from outside the session. The pending read fails
    and run() returns `cancelled`; the consumer is not called.
    **/
    void close()
    {
        if (auto closed = channel_.close(); !closed)
            SMTPSINK_WARN("closing connection to " + peer_ + " failed: " + closed.error().to_string());
    }

    [[nodiscard]] const session_state& state() const noexcept { return state_; }
    [[nodiscard]] const std::string& peer() const noexcept { return peer_; }
    [[nodiscard]] bool quit_received() const noexcept { return quit_received_; }

private:
    smtpsink::asio::awaitable<result_void> serve()
    {
        std::string greeting = "220 ";
        greeting += options_.greeting;
        SMTPSINK_CO_TRY_VOID(co_await channel_.write_line(std::move(greeting)));

        while (channel_.is_open())
        {
            auto line = co_await channel_.read_line();
            if (!line)
                co_return fail(std::move(line).error());
            SMTPSINK_CO_TRY_VOID(co_await dispatch(*line));
        }
        co_return ok();
    }

    smtpsink::asio::awaitable<result_void> dispatch(const std::string& line)
    {
        const std::string_view verb = extract_verb(line);
        if (verb.empty())
            co_return co_await channel_.write_line(std::string(replies::empty_command));

        const command_entry* entry = find_command(verb);
        if (entry == nullptr)
        {
            SMTPSINK_DEBUG("unrecognized command from " + peer_ + ": " + std::string(verb));
            co_return co_await channel_.write_line(std::string(replies::not_recognized));
        }

        SMTPSINK_TRACE(std::string(command_name(entry->kind)) + " from " + peer_);
        if (entry->kind == command_kind::quit)
            quit_received_ = true;

        command_context ctx{channel_, state_};
        co_return co_await entry->handler(ctx, line);
    }

    channel_type channel_;
    session_state state_;
    session_options options_;
    consumer_type consumer_;
    std::string peer_;
    bool quit_received_ = false;
};

} // namespace smtpsink::smtp
