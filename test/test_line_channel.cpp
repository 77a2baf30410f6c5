/*

test_line_channel.cpp
---------------------

Verifies line framing over a loopback TCP connection: terminator stripping,
dot-terminated blocks and behaviour after close.


Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE line_channel_test

#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <smtpsink/net/line_channel.hpp>
#include "loopback.hpp"

using smtpsink::error_code;
using smtpsink::test::line_client;
using smtpsink::test::run_coro;
using smtpsink::test::socket_pair;

namespace asio = smtpsink::asio;
using channel = smtpsink::net::line_channel<asio::tcp::socket>;


BOOST_AUTO_TEST_CASE(read_line_strips_crlf_and_lf)
{
    asio::io_context ctx;
    socket_pair pair(ctx);
    line_client client(std::move(pair.client));
    channel ch(std::move(pair.server));

    client.send_raw("EHLO a\r\nNOOP\nRSET\r\n");

    auto first = run_coro(ctx, ch.read_line());
    BOOST_REQUIRE(first.has_value());
    BOOST_TEST(*first == "EHLO a");

    auto second = run_coro(ctx, ch.read_line());
    BOOST_REQUIRE(second.has_value());
    BOOST_TEST(*second == "NOOP");

    auto third = run_coro(ctx, ch.read_line());
    BOOST_REQUIRE(third.has_value());
    BOOST_TEST(*third == "RSET");
}

BOOST_AUTO_TEST_CASE(read_line_keeps_inner_spaces_and_empty_lines)
{
    asio::io_context ctx;
    socket_pair pair(ctx);
    line_client client(std::move(pair.client));
    channel ch(std::move(pair.server));

    client.send_raw("\r\n  MAIL FROM: <a@b.c>  \r\n");

    auto empty = run_coro(ctx, ch.read_line());
    BOOST_REQUIRE(empty.has_value());
    BOOST_TEST(empty->empty());

    auto line = run_coro(ctx, ch.read_line());
    BOOST_REQUIRE(line.has_value());
    BOOST_TEST(*line == "  MAIL FROM: <a@b.c>  ");
}

BOOST_AUTO_TEST_CASE(read_line_fails_at_end_of_stream)
{
    asio::io_context ctx;
    socket_pair pair(ctx);
    line_client client(std::move(pair.client));
    channel ch(std::move(pair.server));

    client.send_raw("partial");
    client.close();

    auto line = run_coro(ctx, ch.read_line());
    BOOST_REQUIRE(!line.has_value());
    BOOST_TEST(line.error().is(error_code::connection_closed));
}

BOOST_AUTO_TEST_CASE(dot_lines_stop_at_lone_dot)
{
    asio::io_context ctx;
    socket_pair pair(ctx);
    line_client client(std::move(pair.client));
    channel ch(std::move(pair.server));

    client.send_raw("Subject: hi\r\n\r\nline1\r\n\r\nline2\r\n.\r\nNOOP\r\n");

    auto lines = run_coro(ctx, ch.read_dot_lines());
    BOOST_REQUIRE(lines.has_value());
    const std::vector<std::string> expected{"Subject: hi", "", "line1", "", "line2"};
    BOOST_TEST(*lines == expected, boost::test_tools::per_element());

    auto next = run_coro(ctx, ch.read_line());
    BOOST_REQUIRE(next.has_value());
    BOOST_TEST(*next == "NOOP");
}

BOOST_AUTO_TEST_CASE(dot_lines_remove_stuffed_dot)
{
    asio::io_context ctx;
    socket_pair pair(ctx);
    line_client client(std::move(pair.client));
    channel ch(std::move(pair.server));

    client.send_raw("..\r\n..leading\r\n.x\r\n. \r\n.\r\n");

    auto lines = run_coro(ctx, ch.read_dot_lines());
    BOOST_REQUIRE(lines.has_value());
    const std::vector<std::string> expected{".", ".leading", "x", " "};
    BOOST_TEST(*lines == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(dot_lines_empty_block)
{
    asio::io_context ctx;
    socket_pair pair(ctx);
    line_client client(std::move(pair.client));
    channel ch(std::move(pair.server));

    client.send_raw(".\r\n");

    auto lines = run_coro(ctx, ch.read_dot_lines());
    BOOST_REQUIRE(lines.has_value());
    BOOST_TEST(lines->empty());
}

BOOST_AUTO_TEST_CASE(dot_lines_fail_without_terminator)
{
    asio::io_context ctx;
    socket_pair pair(ctx);
    line_client client(std::move(pair.client));
    channel ch(std::move(pair.server));

    client.send_raw("Subject: cut\r\n\r\nbody\r\n");
    client.close();

    auto lines = run_coro(ctx, ch.read_dot_lines());
    BOOST_REQUIRE(!lines.has_value());
    BOOST_TEST(lines.error().is(error_code::connection_closed));
}

BOOST_AUTO_TEST_CASE(write_lines_appends_crlf_in_order)
{
    asio::io_context ctx;
    socket_pair pair(ctx);
    line_client client(std::move(pair.client));
    channel ch(std::move(pair.server));

    auto written = run_coro(ctx, ch.write_lines({"250-server", "250-AUTH PLAIN", "250 HELP"}));
    BOOST_REQUIRE(written.has_value());

    const std::vector<std::string> expected{"250-server", "250-AUTH PLAIN", "250 HELP"};
    BOOST_TEST(client.read_lines(3) == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(write_line_keeps_existing_terminator)
{
    asio::io_context ctx;
    socket_pair pair(ctx);
    line_client client(std::move(pair.client));
    channel ch(std::move(pair.server));

    BOOST_REQUIRE(run_coro(ctx, ch.write_line("250 OK\r\n")).has_value());
    BOOST_REQUIRE(run_coro(ctx, ch.write_line("221 Bye\n")).has_value());

    BOOST_TEST(client.read_line() == "250 OK");
    BOOST_TEST(client.read_line() == "221 Bye");
}

BOOST_AUTO_TEST_CASE(io_fails_after_close)
{
    asio::io_context ctx;
    socket_pair pair(ctx);
    line_client client(std::move(pair.client));
    channel ch(std::move(pair.server));

    BOOST_TEST(ch.is_open());
    BOOST_TEST(ch.close().has_value());
    BOOST_TEST(!ch.is_open());

    auto written = run_coro(ctx, ch.write_line("221 Bye"));
    BOOST_REQUIRE(!written.has_value());
    BOOST_TEST(written.error().is(error_code::connection_closed));

    auto read = run_coro(ctx, ch.read_line());
    BOOST_TEST(!read.has_value());

    // second close is a no-op
    BOOST_TEST(ch.close().has_value());

    std::string line;
    asio::error_code ec;
    BOOST_TEST(!client.try_read_line(line, ec));
    BOOST_TEST((ec == asio::error::eof));
}
