/*

exporter.hpp
------------

Prometheus text exposition of the account counters, served over a minimal
HTTP/1.0 listener.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/async_event.hpp>
#include <mailmirror/detail/deadline.hpp>
#include <mailmirror/detail/log.hpp>
#include <mailmirror/detail/result.hpp>
#include <mailmirror/net/connect.hpp>
#include <mailmirror/sync/account.hpp>

namespace mailmirror::metrics
{

inline constexpr std::size_t MAX_REQUEST_SIZE = 8192;
inline constexpr std::chrono::seconds REQUEST_TIMEOUT{5};
inline constexpr std::chrono::seconds ACCEPT_BACKOFF{1};

namespace detail
{

/// Label values escape backslash, double quote and newline.
[[nodiscard]] inline std::string escape_label(std::string_view value)
{
    std::string out;
    out.reserve(value.size());
    for (char ch : value)
    {
        if (ch == '\\')
            out += "\\\\";
        else if (ch == '"')
            out += "\\\"";
        else if (ch == '\n')
            out += "\\n";
        else
            out += ch;
    }
    return out;
}

} // namespace detail

[[nodiscard]] inline std::string render(const std::vector<const sync::account*>& accounts)
{
    std::string out;
    out += "# HELP mail_account_state State of mail accounts.\n";
    out += "# TYPE mail_account_state gauge\n";
    for (const auto* acct : accounts)
    {
        out += fmt::format("mail_account_state{{name=\"{}\"}} {}\n",
            detail::escape_label(acct->name()), static_cast<unsigned>(acct->state()));
    }
    out += "# HELP mail_account_messages_total Number of processed messages.\n";
    out += "# TYPE mail_account_messages_total counter\n";
    for (const auto* acct : accounts)
    {
        out += fmt::format("mail_account_messages_total{{name=\"{}\"}} {}\n",
            detail::escape_label(acct->name()), acct->processed());
    }
    return out;
}

/// First line of an HTTP request split into method and target.
[[nodiscard]] inline std::pair<std::string, std::string> parse_request_line(std::string_view request)
{
    const auto eol = request.find("\r\n");
    std::string_view line = request.substr(0, eol);
    const auto first_space = line.find(' ');
    if (first_space == std::string_view::npos)
        return {};
    std::string method(line.substr(0, first_space));
    line.remove_prefix(first_space + 1);
    const auto second_space = line.find(' ');
    std::string target(line.substr(0, second_space));
    return {std::move(method), std::move(target)};
}

[[nodiscard]] inline std::string make_http_response(std::string_view status, std::string_view content_type,
    std::string_view body)
{
    return fmt::format("HTTP/1.0 {}\r\nContent-Type: {}\r\nContent-Length: {}\r\nConnection: close\r\n\r\n{}",
        status, content_type, body.size(), body);
}

/// Answer for one request text; GET /metrics is the only resource.
[[nodiscard]] inline std::string respond(std::string_view request, const std::vector<const sync::account*>& accounts)
{
    const auto [method, target] = parse_request_line(request);
    if (method != "GET" && method != "HEAD")
        return make_http_response("405 Method Not Allowed", "text/plain", "method not allowed\n");
    if (target != "/metrics")
        return make_http_response("404 Not Found", "text/plain", "not found\n");
    const std::string body = render(accounts);
    if (method == "HEAD")
    {
        std::string head = make_http_response("200 OK", "text/plain; version=0.0.4", body);
        return head.substr(0, head.size() - body.size());
    }
    return make_http_response("200 OK", "text/plain; version=0.0.4", body);
}

class exporter
{
public:
    exporter(mailmirror::asio::any_io_executor executor, std::vector<const sync::account*> accounts)
        : executor_(std::move(executor)),
          acceptor_(executor_),
          accounts_(std::move(accounts))
    {
    }

    /// Bind `listen` (`host:port`).
    result_void open(const std::string& listen)
    {
        std::pair<std::string, std::string> address;
        MAILMIRROR_TRY(address, mailmirror::net::split_host_port(listen, "9090"));

        mailmirror::asio::error_code ec;
        mailmirror::asio::tcp::resolver resolver(executor_);
        auto endpoints = resolver.resolve(address.first, address.second, ec);
        if (ec || endpoints.empty())
            return fail<void>(errc::config_invalid, "cannot resolve metrics address " + listen, ec.message(), ec);
        const auto endpoint = endpoints.begin()->endpoint();

        acceptor_.open(endpoint.protocol(), ec);
        if (!ec)
            acceptor_.set_option(mailmirror::asio::tcp::acceptor::reuse_address(true), ec);
        if (!ec)
            acceptor_.bind(endpoint, ec);
        if (!ec)
            acceptor_.listen(mailmirror::asio::tcp::acceptor::max_listen_connections, ec);
        if (ec)
            return fail<void>(errc::net_io_failed, "cannot listen on " + listen, ec.message(), ec);

        MAILMIRROR_INFO("metrics listening on {}", listen);
        return ok();
    }

    [[nodiscard]] unsigned short port() const
    {
        mailmirror::asio::error_code ec;
        const auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? 0 : endpoint.port();
    }

    /**
    Accept connections until `stop` is requested, answering each one in its own
    coroutine. A request must arrive within REQUEST_TIMEOUT. Stopping closes the
    acceptor and every open connection, and serve() returns once they are gone.
    **/
    mailmirror::asio::awaitable<void> serve(std::stop_token stop)
    {
        mailmirror::detail::wait_group connections(executor_);
        std::stop_callback on_stop(stop, [this]
        {
            mailmirror::asio::post(executor_, [this]
            {
                shutdown();
            });
        });

        while (!stop.stop_requested() && acceptor_.is_open())
        {
            mailmirror::asio::error_code ec;
            auto socket = std::make_shared<mailmirror::asio::tcp::socket>(executor_);
            co_await acceptor_.async_accept(*socket, mailmirror::asio::redirect_error(mailmirror::asio::use_awaitable, ec));
            if (ec == mailmirror::asio::error::operation_aborted)
                continue;
            if (ec)
            {
                MAILMIRROR_WARN("metrics accept failed: {}", ec.message());
                if (!co_await mailmirror::detail::sleep_for(ACCEPT_BACKOFF, stop))
                    break;
                continue;
            }

            open_.insert(socket);
            connections.add();
            mailmirror::asio::co_spawn(executor_, [this, socket, &connections]() -> mailmirror::asio::awaitable<void>
            {
                co_await answer(socket);
                open_.erase(socket);
                connections.done();
            }, mailmirror::asio::detached);
        }

        shutdown();
        co_await connections.wait();
    }

private:
    void shutdown() noexcept
    {
        mailmirror::asio::error_code ignored;
        acceptor_.close(ignored);
        for (const auto& socket : open_)
            socket->close(ignored);
    }

    mailmirror::asio::awaitable<void> answer(std::shared_ptr<mailmirror::asio::tcp::socket> connection)
    {
        auto& socket = *connection;
        mailmirror::asio::steady_timer watchdog(executor_);
        watchdog.expires_after(REQUEST_TIMEOUT);
        watchdog.async_wait([connection](mailmirror::asio::error_code timer_ec)
        {
            if (timer_ec)
                return;
            mailmirror::asio::error_code ignored;
            connection->close(ignored);
        });

        mailmirror::asio::error_code ec;
        std::string request;
        co_await mailmirror::asio::async_read_until(socket,
            mailmirror::asio::dynamic_buffer(request, MAX_REQUEST_SIZE), "\r\n\r\n",
            mailmirror::asio::redirect_error(mailmirror::asio::use_awaitable, ec));
        watchdog.cancel();
        if (ec)
        {
            MAILMIRROR_DEBUG("metrics request dropped: {}", ec.message());
            co_return;
        }

        const std::string reply = respond(request, accounts_);
        co_await mailmirror::asio::async_write(socket, mailmirror::asio::buffer(reply),
            mailmirror::asio::redirect_error(mailmirror::asio::use_awaitable, ec));
        if (ec)
            MAILMIRROR_DEBUG("metrics reply failed: {}", ec.message());
        socket.shutdown(mailmirror::asio::tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }

    mailmirror::asio::any_io_executor executor_;
    mailmirror::asio::tcp::acceptor acceptor_;
    std::vector<const sync::account*> accounts_;
    std::set<std::shared_ptr<mailmirror::asio::tcp::socket>> open_;
};

} // namespace mailmirror::metrics
