/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
The session engine reports I/O failures through result<T>; protocol errors
are answered on the wire and never surface here.

*/

#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <cstdint>
#include <utility>

namespace smtpsink
{

/// Error categories for smtpsink operations
enum class error_code : std::uint16_t
{
    success = 0,

    // Network errors (100-199)
    connection_closed = 101,
    socket_error = 106,
    bind_failed = 107,
    accept_failed = 108,

    // Protocol errors (200-299)
    invalid_state = 204,

    // Internal errors (900-999)
    internal_error = 900,
    cancelled = 902,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view error_code_to_string(error_code ec) noexcept
{
    switch (ec)
    {
        case error_code::success: return "Success";
        case error_code::connection_closed: return "Connection closed";
        case error_code::socket_error: return "Socket error";
        case error_code::bind_failed: return "Bind failed";
        case error_code::accept_failed: return "Accept failed";
        case error_code::invalid_state: return "Invalid state";
        case error_code::internal_error: return "Internal error";
        case error_code::cancelled: return "Operation cancelled";
    }
    return "Unknown error";
}

/// Rich error type with code, message, and optional detail (endpoint, address)
class error
{
public:
    error() noexcept : code_(error_code::success) {}

    explicit error(error_code code)
        : code_(code), message_(error_code_to_string(code)) {}

    error(error_code code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    error(error_code code, std::string message, std::string detail) noexcept
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    [[nodiscard]] bool is_success() const noexcept { return code_ == error_code::success; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_success(); }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        std::string out = "[";
        out += std::to_string(static_cast<int>(code_));
        out += "] ";
        out += message_;
        if (!detail_.empty())
        {
            out += ": ";
            out += detail_;
        }
        return out;
    }

    /// Check if this is a specific error
    [[nodiscard]] bool is(error_code ec) const noexcept { return code_ == ec; }

    /// Check if this is a network error
    [[nodiscard]] bool is_network_error() const noexcept
    {
        auto c = static_cast<std::uint16_t>(code_);
        return c >= 100 && c < 200;
    }

private:
    error_code code_;
    std::string message_;
    std::string detail_;
};

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error>;

/// Void result for operations that don't return a value
using result_void = std::expected<void, error>;

/// Helper to create successful result
template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

/// Helper to create void success
[[nodiscard]] inline constexpr result_void ok()
{
    return result_void{};
}

/// Helper to create error result
template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code)
{
    return std::unexpected(error(code));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code, std::string message)
{
    return std::unexpected(error(code, std::move(message)));
}

// ==================== Coroutine Helpers ====================

/// Same as propagating an error from a void result inside a coroutine
/// returning result<T>.
/// Usage: SMTPSINK_CO_TRY_VOID(co_await channel.write_lines(...));
#define SMTPSINK_CO_TRY_VOID(expr) \
    do { \
        auto&& _result = (expr); \
        if (!_result) [[unlikely]] \
            co_return std::unexpected(std::move(_result).error()); \
    } while(0)

} // namespace smtpsink
