/*

capture_server.cpp
------------------

Accepts SMTP submissions on a local port and prints every captured envelope
to standard output once the client has sent QUIT. SIGINT or SIGTERM closes
the listener and every open connection.

Usage: smtpsink_capture [address] [port] [server-name]
Set SMTPSINK_TRACE to print the protocol lines exchanged.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <charconv>
#include <cstdlib>
#include <csignal>
#include <iostream>
#include <string>
#include <string_view>
#include <smtpsink/smtpsink.hpp>


using smtpsink::smtp::server;
using smtpsink::smtp::server_options;
using smtpsink::smtp::session_state;
using std::cerr;
using std::cout;
using std::endl;


namespace
{

bool parse_port(std::string_view text, unsigned short& port)
{
    unsigned int value = 0;
    const auto res = std::from_chars(text.data(), text.data() + text.size(), value);
    if (res.ec != std::errc() || res.ptr != text.data() + text.size() || value > 65535)
        return false;
    port = static_cast<unsigned short>(value);
    return true;
}

} // namespace


int main(int argc, char* argv[])
{
    server_options options;
    if (argc > 1)
        options.address = argv[1];
    if (argc > 2 && !parse_port(argv[2], options.port))
    {
        cerr << "invalid port: " << argv[2] << endl;
        return EXIT_FAILURE;
    }
    if (argc > 3)
        options.session.server_name = argv[3];

    if (std::getenv("SMTPSINK_TRACE") != nullptr)
    {
        smtpsink::log::logger::instance().set_level(smtpsink::log::level::trace);
        smtpsink::log::logger::instance().set_trace_enabled(true);
    }

    smtpsink::asio::io_context io_ctx;
    server srv(io_ctx, options, [](const session_state& st)
    {
        cout << smtpsink::smtp::to_string(st) << endl;
    });

    if (auto opened = srv.open(); !opened)
    {
        cerr << opened.error().to_string() << endl;
        return EXIT_FAILURE;
    }

    smtpsink::asio::signal_set signals(io_ctx, SIGINT, SIGTERM);
    signals.async_wait([&srv](const smtpsink::asio::error_code& ec, int)
    {
        if (!ec)
            srv.shutdown();
    });

    int status = EXIT_SUCCESS;
    smtpsink::asio::co_spawn(io_ctx,
        [&]() -> smtpsink::asio::awaitable<void>
        {
            auto res = co_await srv.serve();
            if (!res)
            {
                cerr << res.error().to_string() << endl;
                status = EXIT_FAILURE;
            }
            signals.cancel();
        },
        smtpsink::asio::detached);

    io_ctx.run();
    return status;
}
