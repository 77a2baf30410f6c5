/*

server.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <smtpsink/detail/asio_decl.hpp>
#include <smtpsink/detail/asio_error.hpp>
#include <smtpsink/detail/log.hpp>
#include <smtpsink/detail/result.hpp>
#include <smtpsink/smtp/session.hpp>
#include <smtpsink/smtp/types.hpp>

namespace smtpsink::smtp
{

/**
Listening socket spawning one session coroutine per accepted connection.
Sessions share nothing but the read-only command table.
**/
class server
{
public:
    using executor_type = smtpsink::asio::any_io_executor;
    using consumer_type = session::consumer_type;

    explicit server(executor_type executor, server_options opts = {}, consumer_type consumer = {})
        : acceptor_(executor),
          options_(std::move(opts)),
          consumer_(std::move(consumer))
    {
    }

    explicit server(smtpsink::asio::io_context& context, server_options opts = {}, consumer_type consumer = {})
        : server(context.get_executor(), std::move(opts), std::move(consumer))
    {
    }

    server(const server&) = delete;
    server& operator=(const server&) = delete;

    executor_type get_executor() { return acceptor_.get_executor(); }

    /// Binds and listens on options.address:options.port. Port 0 picks a free port.
    result_void open()
    {
        smtpsink::asio::error_code ec;
        const auto address = smtpsink::asio::ip::make_address(options_.address, ec);
        if (ec)
            return fail(error(error_code::bind_failed, ec.message(), options_.address));

        const smtpsink::asio::tcp::endpoint endpoint(address, options_.port);
        acceptor_.open(endpoint.protocol(), ec);
        if (!ec)
            acceptor_.set_option(smtpsink::asio::tcp::acceptor::reuse_address(true), ec);
        if (!ec)
            acceptor_.bind(endpoint, ec);
        if (!ec)
            acceptor_.listen(smtpsink::asio::tcp::acceptor::max_listen_connections, ec);
        if (ec)
        {
            smtpsink::asio::error_code ignore_ec;
            acceptor_.close(ignore_ec);
            return fail(error(error_code::bind_failed, ec.message(), options_.address + ":" + std::to_string(options_.port)));
        }

        SMTPSINK_INFO("listening on " + endpoint_string());
        return ok();
    }

    /**
    Accepts connections until stop() is called.

    @return Success after stop(), or the accept error that ended the loop.
    **/
    smtpsink::asio::awaitable<result_void> serve()
    {
        if (!acceptor_.is_open())
            co_return fail(error_code::invalid_state, "server is not open");

        for (;;)
        {
            smtpsink::asio::error_code ec;
            smtpsink::asio::tcp::socket socket = co_await acceptor_.async_accept(
                smtpsink::asio::redirect_error(smtpsink::asio::use_awaitable, ec));
            if (ec == smtpsink::asio::error::operation_aborted || !acceptor_.is_open())
                break;
            if (ec)
            {
                SMTPSINK_ERROR("accept failed: " + ec.message());
                co_return fail(error_code::accept_failed, ec.message());
            }

            auto s = std::make_shared<session>(std::move(socket), options_.session, consumer_);
            std::erase_if(sessions_, [](const std::weak_ptr<session>& w) { return w.expired(); });
            sessions_.push_back(s);
            smtpsink::asio::co_spawn(acceptor_.get_executor(), run_session(std::move(s)), smtpsink::asio::detached);
        }

        SMTPSINK_INFO("listener stopped");
        co_return ok();
    }

    /// Stops accepting. Running sessions go on until their peers leave.
    void stop()
    {
        if (!acceptor_.is_open())
            return;
        smtpsink::asio::error_code ec;
        acceptor_.close(ec);
        if (ec)
            SMTPSINK_WARN("closing listener failed: " + ec.message());
    }

    /// Stops accepting and closes every running session.
    void shutdown()
    {
        stop();
        for (auto& w : sessions_)
        {
            if (auto s = w.lock())
                s->close();
        }
        sessions_.clear();
    }

    [[nodiscard]] bool is_open() const { return acceptor_.is_open(); }

    [[nodiscard]] smtpsink::asio::tcp::endpoint local_endpoint() const
    {
        smtpsink::asio::error_code ec;
        auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? smtpsink::asio::tcp::endpoint{} : endpoint;
    }

    [[nodiscard]] const server_options& options() const noexcept { return options_; }

private:
    static smtpsink::asio::awaitable<void> run_session(std::shared_ptr<session> s)
    {
        // run() logs how the session ended
        try
        {
            [[maybe_unused]] auto res = co_await s->run();
        }
        catch (const std::exception& exc)
        {
            SMTPSINK_ERROR("session with " + s->peer() + " aborted: " + exc.what());
        }
    }

    std::string endpoint_string() const
    {
        const auto endpoint = local_endpoint();
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    smtpsink::asio::tcp::acceptor acceptor_;
    server_options options_;
    consumer_type consumer_;
    std::vector<std::weak_ptr<session>> sessions_;
};

} // namespace smtpsink::smtp
