/*

asio_error.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Utility functions to convert Asio error codes to smtpsink::error.
This file bridges asio_decl.hpp and result.hpp.

*/

#pragma once

#include <smtpsink/detail/asio_decl.hpp>
#include <smtpsink/detail/result.hpp>

namespace smtpsink
{

/// Convert asio::error_code to smtpsink::error
[[nodiscard]] inline error error_from_asio(const asio::error_code& ec)
{
    if (!ec)
        return error{};

    error_code code = error_code::socket_error;

    // Connection closed errors, by the peer or by our own close()
    if (ec == asio::error::eof ||
        ec == asio::error::connection_reset ||
        ec == asio::error::connection_aborted ||
        ec == asio::error::broken_pipe ||
        ec == asio::error::bad_descriptor ||
        ec == asio::error::not_connected ||
        ec == asio::error::shut_down)
    {
        code = error_code::connection_closed;
    }
    // Cancelled operations
    else if (ec == asio::error::operation_aborted)
    {
        code = error_code::cancelled;
    }

    return error(code, ec.message());
}

/// Helper for void operations
[[nodiscard]] inline result_void to_result(const asio::error_code& ec)
{
    if (ec)
        return fail(error_from_asio(ec));
    return ok();
}

} // namespace smtpsink
