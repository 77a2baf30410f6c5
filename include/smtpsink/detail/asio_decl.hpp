/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Centralized Boost.Asio / standalone Asio declarations for smtpsink.
Everything the session engine and the listener need is reachable through
smtpsink::asio.

*/

#pragma once


// Check for standalone Asio first
#if defined(SMTPSINK_USE_STANDALONE_ASIO)

#include <asio/version.hpp>
#if ASIO_VERSION < 101800 // Asio 1.18.0
#error "Asio version 1.18.0 or higher is required"
#endif

#include <asio.hpp>

#if defined(ASIO_HAS_CO_AWAIT)
#include <asio/redirect_error.hpp>

namespace smtpsink::asio
{
    // Core types
    using ::asio::awaitable;
    using ::asio::buffer;
    using ::asio::co_spawn;
    using ::asio::detached;
    using ::asio::use_awaitable;
    using ::asio::io_context;
    using ::asio::any_io_executor;
    using ::asio::redirect_error;
    using ::asio::signal_set;

    // IP networking
    namespace ip = ::asio::ip;
    using tcp = ::asio::ip::tcp;

    // Async operations
    using ::asio::async_write;
    using ::asio::write;
    using ::asio::read_until;
    using ::asio::streambuf;
    using ::asio::post;
    using ::asio::async_read_until;
    using ::asio::async_compose;
    using ::asio::dynamic_buffer;

    namespace error = ::asio::error;

    using error_code = ::asio::error_code;
    using system_error = ::asio::system_error;

} // namespace smtpsink::asio

#else
#error "smtpsink requires coroutine support (C++20) and Asio 1.18+"
#endif

#else // Use Boost.Asio (default)

#include <boost/asio/version.hpp>
#if BOOST_ASIO_VERSION < 101800 // Boost.Asio 1.18.0
#error "Boost.Asio version 1.18.0 or higher is required (Boost 1.74+)"
#endif

#include <boost/asio.hpp>
#include <boost/asio/error.hpp>

#if defined(BOOST_ASIO_HAS_CO_AWAIT)
#include <boost/asio/redirect_error.hpp>

namespace smtpsink::asio
{
    // Core types
    using boost::asio::awaitable;
    using boost::asio::buffer;
    using boost::asio::co_spawn;
    using boost::asio::detached;
    using boost::asio::use_awaitable;
    using boost::asio::io_context;
    using boost::asio::any_io_executor;
    using boost::asio::redirect_error;
    using boost::asio::signal_set;

    // IP networking
    namespace ip = boost::asio::ip;
    using tcp = boost::asio::ip::tcp;

    // Async operations
    using boost::asio::async_write;
    using boost::asio::write;
    using boost::asio::read_until;
    using boost::asio::streambuf;
    using boost::asio::post;
    using boost::asio::async_read_until;
    using boost::asio::async_compose;
    using boost::asio::dynamic_buffer;

    namespace error = boost::asio::error;

    using error_code = boost::system::error_code;
    using system_error = boost::system::system_error;

} // namespace smtpsink::asio

#else
#error "smtpsink requires coroutine support (C++20) and Boost.Asio 1.18+ (Boost 1.74+)"
#endif

#endif // SMTPSINK_USE_STANDALONE_ASIO
