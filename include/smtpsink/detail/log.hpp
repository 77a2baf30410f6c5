/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for smtpsink.
Supports multiple log levels, optional callbacks, and protocol tracing.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>

namespace smtpsink::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Protocol-level tracing (very verbose)
    debug = 1,   ///< Debug information
    info = 2,    ///< Informational messages
    warn = 3,    ///< Warnings (non-fatal issues)
    error = 4,   ///< Errors (operation failures)
    fatal = 5,   ///< Fatal errors (unrecoverable)
    off = 6      ///< Logging disabled
};

/// Direction for protocol tracing
enum class direction : std::uint8_t
{
    send,     ///< Data sent to the client
    receive   ///< Data received from the client
};

/// Log entry structure passed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;

    // Optional protocol trace info
    struct trace_info_t
    {
        direction dir;
        std::string protocol;  // "SMTP"
        std::string data;      // Raw protocol line
    };
    std::optional<trace_info_t> trace_info;
};

/// Log callback signature
using callback_t = std::function<void(const entry&)>;

/// Convert level to string
[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Global logger configuration (thread-safe singleton)
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    /// Set minimum log level
    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    /// Get current minimum log level
    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    /// Check if level is enabled
    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /// Set custom log callback (replaces default stderr output)
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    /// Clear custom callback (restore default stderr output)
    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    /// Enable/disable protocol tracing
    void set_trace_enabled(bool enabled) noexcept
    {
        trace_enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return trace_enabled_.load(std::memory_order_relaxed);
    }

    /// Log a message
    void log(level lvl, std::string_view message,
             std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .message = std::string(message),
            .location = loc,
            .trace_info = std::nullopt
        };

        dispatch(e);
    }

    /// Log protocol trace
    void trace_protocol(std::string_view protocol, direction dir, std::string_view data,
                       std::source_location loc = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;

        entry e{
            .lvl = level::trace,
            .timestamp = std::chrono::system_clock::now(),
            .message = {},
            .location = loc,
            .trace_info = entry::trace_info_t{
                .dir = dir,
                .protocol = std::string(protocol),
                .data = std::string(data)
            }
        };

        dispatch(e);
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
        {
            callback_(e);
        }
        else
        {
            default_output(e);
        }
    }

    void default_output(const entry& e)
    {
        auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            e.timestamp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif

        std::ostringstream out;
        out << '[' << std::setfill('0')
            << std::setw(2) << tm_buf.tm_hour << ':'
            << std::setw(2) << tm_buf.tm_min << ':'
            << std::setw(2) << tm_buf.tm_sec << '.'
            << std::setw(3) << ms.count() << "] ";

        if (e.trace_info)
        {
            // Protocol trace format
            const char* dir_str = (e.trace_info->dir == direction::send) ? ">>>" : "<<<";
            out << e.trace_info->protocol << ' ' << dir_str << ' ' << sanitize_trace(e.trace_info->data);
        }
        else
        {
            // Regular log format
            out << '[' << level_to_string(e.lvl) << "] " << e.message;
        }
        out << '\n';
        std::cerr << out.str();
    }

    /// Sanitize trace data (truncate long data, mask control characters)
    [[nodiscard]] static std::string sanitize_trace(std::string_view data)
    {
        std::string result(data);

        // Truncate very long data
        constexpr std::size_t max_len = 500;
        if (result.size() > max_len)
        {
            result.resize(max_len);
            result += "... [truncated]";
        }

        // Replace control characters (except CR/LF) with dots
        for (std::size_t i = 0; i < result.size(); ++i)
        {
            char c = result[i];
            if (static_cast<unsigned char>(c) < 32 && c != '\r' && c != '\n')
            {
                result[i] = '.';
            }
        }

        // Remove trailing CRLF for cleaner output
        while (!result.empty() && (result.back() == '\r' || result.back() == '\n'))
            result.pop_back();

        return result;
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::atomic<bool> trace_enabled_{false};
    std::mutex mutex_;
    callback_t callback_;
};

// Convenience macros for logging with source location
#define SMTPSINK_LOG(lvl, msg) \
    ::smtpsink::log::logger::instance().log(lvl, msg, std::source_location::current())

#define SMTPSINK_TRACE(msg)  SMTPSINK_LOG(::smtpsink::log::level::trace, msg)
#define SMTPSINK_DEBUG(msg)  SMTPSINK_LOG(::smtpsink::log::level::debug, msg)
#define SMTPSINK_INFO(msg)   SMTPSINK_LOG(::smtpsink::log::level::info, msg)
#define SMTPSINK_WARN(msg)   SMTPSINK_LOG(::smtpsink::log::level::warn, msg)
#define SMTPSINK_ERROR(msg)  SMTPSINK_LOG(::smtpsink::log::level::error, msg)
#define SMTPSINK_FATAL(msg)  SMTPSINK_LOG(::smtpsink::log::level::fatal, msg)

/// Protocol trace helper
#define SMTPSINK_TRACE_SEND(protocol, data) \
    ::smtpsink::log::logger::instance().trace_protocol(protocol, ::smtpsink::log::direction::send, data)

#define SMTPSINK_TRACE_RECV(protocol, data) \
    ::smtpsink::log::logger::instance().trace_protocol(protocol, ::smtpsink::log::direction::receive, data)

/// RAII guard restoring the logger level and callback (handy in tests)
class scoped_config
{
public:
    scoped_config()
        : level_(logger::instance().get_level()),
          trace_(logger::instance().is_trace_enabled())
    {
    }

    ~scoped_config()
    {
        auto& lg = logger::instance();
        lg.set_level(level_);
        lg.set_trace_enabled(trace_);
        lg.clear_callback();
    }

    scoped_config(const scoped_config&) = delete;
    scoped_config& operator=(const scoped_config&) = delete;

private:
    level level_;
    bool trace_;
};

} // namespace smtpsink::log
