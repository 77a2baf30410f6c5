/*

line_channel.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <smtpsink/detail/asio_decl.hpp>
#include <smtpsink/detail/asio_error.hpp>
#include <smtpsink/detail/log.hpp>
#include <smtpsink/detail/result.hpp>

namespace smtpsink
{
namespace net
{

// Import Asio types from the centralized declarations
using namespace smtpsink::asio;

/// Line terminating a dot-terminated block.
inline constexpr std::string_view DOT_LINE = ".";

/**
Dealing with network in a line oriented fashion.
Wraps a Boost.Asio stream (usually a tcp socket). Every line on the wire is
terminated by CRLF; a bare LF is accepted on input.
**/
template<typename Stream>
class line_channel
{
public:
    explicit line_channel(Stream stream)
        : stream_(std::move(stream))
    {
    }

    ~line_channel() = default;

    line_channel(const line_channel&) = delete;
    line_channel& operator=(const line_channel&) = delete;

    void set_trace_protocol(std::string protocol)
    {
        trace_protocol_ = std::move(protocol);
    }

    /**
    Receiving a line from network asynchronously.
    The terminator is stripped from the delivered line.

    @param token Completion token.
    **/
    template<typename CompletionToken>
    auto async_read_line(CompletionToken&& token)
    {
        return asio::async_compose<CompletionToken, void(asio::error_code, std::string)>(
            [this, started = false](auto& self, asio::error_code ec = {}, std::size_t = 0) mutable
            {
                if (!started)
                {
                    started = true;
                    if (read_buffer_.find('\n') != std::string::npos)
                    {
                        self.complete(ec, take_line());
                        return;
                    }

                    auto buffer = asio::dynamic_buffer(read_buffer_);
                    asio::async_read_until(stream_, buffer, '\n', std::move(self));
                    return;
                }

                if (ec)
                {
                    self.complete(ec, std::string());
                    return;
                }

                if (read_buffer_.find('\n') == std::string::npos)
                {
                    self.complete(asio::error::invalid_argument, std::string());
                    return;
                }
                self.complete(ec, take_line());
            }, token, stream_);
    }

    /**
    Reads one line.

    @return The line without its terminator, or the I/O error.
    **/
    awaitable<result<std::string>> read_line()
    {
        asio::error_code ec;
        std::string line = co_await async_read_line(asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
            co_return fail<std::string>(error_from_asio(ec));
        co_return line;
    }

    /**
    Reads lines up to a line holding a single dot. The dot line is consumed
    and not returned; a leading dot on any other line is removed.
    End of stream before the dot line is an error.
    **/
    awaitable<result<std::vector<std::string>>> read_dot_lines()
    {
        std::vector<std::string> lines;
        for (;;)
        {
            auto line = co_await read_line();
            if (!line)
                co_return fail<std::vector<std::string>>(std::move(line).error());
            if (*line == DOT_LINE)
                co_return lines;
            if (!line->empty() && line->front() == '.')
                line->erase(0, 1);
            lines.push_back(std::move(*line));
        }
    }

    /**
    Writes each line followed by CRLF, in order.
    A failure may leave part of the lines on the wire.
    **/
    awaitable<result_void> write_lines(std::vector<std::string> lines)
    {
        std::string payload;
        for (const auto& line : lines)
        {
            trace_line(smtpsink::log::direction::send, line);
            payload += normalize_line(line);
        }

        asio::error_code ec;
        co_await asio::async_write(stream_, asio::buffer(payload), asio::redirect_error(asio::use_awaitable, ec));
        co_return to_result(ec);
    }

    awaitable<result_void> write_line(std::string line)
    {
        std::vector<std::string> lines;
        lines.push_back(std::move(line));
        co_return co_await write_lines(std::move(lines));
    }

    /**
    Closes the underlying stream. Later reads and writes fail.
    Closing an already closed channel does nothing.
    **/
    result_void close()
    {
        if (!stream_.is_open())
            return ok();

        asio::error_code ec;
        stream_.close(ec);
        return to_result(ec);
    }

    [[nodiscard]] bool is_open() const { return stream_.is_open(); }

    [[nodiscard]] Stream& stream() noexcept { return stream_; }
    [[nodiscard]] const Stream& stream() const noexcept { return stream_; }

protected:
    static std::string normalize_line(std::string_view line)
    {
        if (line.size() >= 2 && line.substr(line.size() - 2) == "\r\n")
            return std::string(line);
        if (!line.empty() && line.back() == '\n')
        {
            std::string out(line.substr(0, line.size() - 1));
            out += "\r\n";
            return out;
        }
        std::string out(line);
        out += "\r\n";
        return out;
    }

    /// Removes the first complete line from the read buffer.
    std::string take_line()
    {
        const auto pos = read_buffer_.find('\n');
        std::size_t line_length = (pos > 0 && read_buffer_[pos - 1] == '\r') ? pos - 1 : pos;
        std::string line = read_buffer_.substr(0, line_length);
        read_buffer_.erase(0, pos + 1);
        trace_line(smtpsink::log::direction::receive, line);
        return line;
    }

    Stream stream_;
    std::string read_buffer_;

    std::string trace_protocol_{"NET"};

    void trace_line(smtpsink::log::direction dir, std::string_view data) const
    {
        if (dir == smtpsink::log::direction::send)
            SMTPSINK_TRACE_SEND(trace_protocol_, data);
        else
            SMTPSINK_TRACE_RECV(trace_protocol_, data);
    }
};

} // namespace net
} // namespace smtpsink
