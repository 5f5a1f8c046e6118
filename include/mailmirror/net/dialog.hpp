/*

dialog.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/log.hpp>
#include <mailmirror/detail/redact.hpp>
#include <mailmirror/detail/result.hpp>
#include <mailmirror/net/error_mapping.hpp>

namespace mailmirror::net
{

namespace asio = mailmirror::asio;

inline constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 8192;

/// Upper bound for any configured line length (1 MB).
inline constexpr std::size_t MAX_ALLOWED_LINE_LENGTH = 1024 * 1024;

/**
Line oriented exchange over a stream, shared by the IMAP and MQTT clients.

Every operation is a coroutine reporting mailmirror errors. When a timeout is
set each read or write is bounded by it and fails with net_timeout; cancel()
makes pending operations fail with net_cancelled.
**/
template<typename Stream>
class dialog
{
public:
    using duration = std::chrono::steady_clock::duration;

    explicit dialog(Stream stream, std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH,
        std::optional<duration> timeout = std::nullopt)
        : stream_(std::move(stream)),
          max_line_length_(std::min(max_line_length, MAX_ALLOWED_LINE_LENGTH)),
          timeout_(timeout)
    {
    }

    /// Label of trace records and error details, e.g. "IMAP".
    void set_trace_protocol(std::string protocol)
    {
        protocol_ = std::move(protocol);
    }

    void set_trace_redaction(bool enabled) noexcept
    {
        redact_sent_ = enabled;
    }

    /// Next line without its CRLF.
    asio::awaitable<result<std::string>> read_line_r()
    {
        std::size_t eol = buffer_.find('\n');
        if (eol == std::string::npos)
        {
            asio::error_code ec;
            co_await bounded([this](auto token)
            {
                return asio::async_read_until(stream_, asio::dynamic_buffer(buffer_, max_line_length_ + 2), '\n',
                    std::move(token));
            }, ec);
            if (ec == asio::error::not_found)
                ec = asio::error::message_size;
            if (ec)
                co_return fail<std::string>(make_net_error(io_stage::read, ec, io_detail("read_line")));
            eol = buffer_.find('\n');
        }

        const std::size_t length = (eol > 0 && buffer_[eol - 1] == '\r') ? eol - 1 : eol;
        std::string line = buffer_.substr(0, length);
        buffer_.erase(0, eol + 1);
        trace(mailmirror::log::direction::receive, line);
        co_return ok(std::move(line));
    }

    /// Exactly `n` bytes, e.g. the body of an IMAP literal.
    asio::awaitable<result<std::string>> read_exactly_r(std::size_t n)
    {
        if (buffer_.size() < n)
        {
            asio::error_code ec;
            const std::size_t missing = n - buffer_.size();
            co_await bounded([this, missing](auto token)
            {
                return asio::async_read(stream_, asio::dynamic_buffer(buffer_), asio::transfer_exactly(missing),
                    std::move(token));
            }, ec);
            if (ec)
                co_return fail<std::string>(make_net_error(io_stage::read, ec, io_detail("read_exactly")));
        }
        std::string data = buffer_.substr(0, n);
        buffer_.erase(0, n);
        co_return ok(std::move(data));
    }

    /// Send `line`, terminated by exactly one CRLF.
    asio::awaitable<result_void> write_line_r(std::string_view line)
    {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
            line.remove_suffix(1);
        std::string payload(line);
        payload += "\r\n";
        trace(mailmirror::log::direction::send, payload);

        asio::error_code ec;
        co_await bounded([this, &payload](auto token)
        {
            return asio::async_write(stream_, asio::buffer(payload), std::move(token));
        }, ec);
        if (ec)
            co_return fail<void>(make_net_error(io_stage::write, ec, io_detail("write_line")));
        co_return ok();
    }

    /// Send `buffers` untouched and untraced; they must outlive the call.
    template<typename ConstBufferSequence>
    asio::awaitable<result_void> write_raw_r(const ConstBufferSequence& buffers)
    {
        asio::error_code ec;
        co_await bounded([this, &buffers](auto token)
        {
            return asio::async_write(stream_, buffers, std::move(token));
        }, ec);
        if (ec)
            co_return fail<void>(make_net_error(io_stage::write, ec, io_detail("write_raw")));
        co_return ok();
    }

    void cancel() noexcept
    {
        asio::error_code ignored;
        stream_.lowest_layer().cancel(ignored);
    }

    [[nodiscard]] Stream& stream() noexcept
    {
        return stream_;
    }

private:
    /// Run `op(token)` under the watchdog; a fired watchdog turns the abort into timed_out.
    template<typename Op>
    asio::awaitable<std::size_t> bounded(Op op, asio::error_code& ec)
    {
        const auto on_error = asio::redirect_error(asio::use_awaitable, ec);
        if (!timeout_)
            co_return co_await op(on_error);

        auto fired = std::make_shared<bool>(false);
        asio::steady_timer watchdog(stream_.get_executor());
        watchdog.expires_after(*timeout_);
        watchdog.async_wait([this, fired](asio::error_code timer_ec)
        {
            if (timer_ec)
                return;
            *fired = true;
            cancel();
        });

        const std::size_t n = co_await op(on_error);
        watchdog.cancel();
        if (*fired && ec == asio::error::operation_aborted)
            ec = asio::error::timed_out;
        co_return n;
    }

    [[nodiscard]] mailmirror::detail::error_detail io_detail(std::string_view op) const
    {
        mailmirror::detail::error_detail detail;
        detail.add("proto", protocol_).add("op", op);
        return detail;
    }

    void trace(mailmirror::log::direction dir, std::string_view data) const
    {
        auto& logger = mailmirror::log::logger::instance();
        if (!logger.is_trace_enabled())
            return;
        if (dir == mailmirror::log::direction::send && redact_sent_)
            logger.trace_protocol(protocol_, dir, mailmirror::detail::redact_line(data));
        else
            logger.trace_protocol(protocol_, dir, data);
    }

    Stream stream_;
    std::string buffer_;
    std::size_t max_line_length_;
    std::optional<duration> timeout_;
    std::string protocol_{"NET"};
    bool redact_sent_{true};
};

} // namespace mailmirror::net
