/*

imap/client.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailmirror/detail/append.hpp>
#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/async_mutex.hpp>
#include <mailmirror/detail/log.hpp>
#include <mailmirror/detail/redact.hpp>
#include <mailmirror/detail/result.hpp>
#include <mailmirror/detail/sanitize.hpp>
#include <mailmirror/detail/sasl.hpp>
#include <mailmirror/imap/fetch_parser.hpp>
#include <mailmirror/imap/types.hpp>
#include <mailmirror/net/connect.hpp>
#include <mailmirror/net/dialog.hpp>
#include <mailmirror/net/upgradable_stream.hpp>

namespace mailmirror::imap
{

using mailmirror::asio::any_io_executor;
using mailmirror::asio::awaitable;
using mailmirror::asio::buffer;
using mailmirror::result;
using mailmirror::result_void;
namespace ssl = mailmirror::asio::ssl;

class client
{
public:
    using executor_type = any_io_executor;
    using dialog_type = mailmirror::net::dialog<mailmirror::net::upgradable_stream>;

    /**
    An IDLE command in progress. It owns the client's command lock until the
    tagged completion has been read, so no other command can interleave.

    read_line() and done() may be pending at the same time: DONE is written
    while the reader waits for the completion.
    **/
    class idle_session
    {
    public:
        idle_session() = default;
        idle_session(const idle_session&) = delete;
        idle_session& operator=(const idle_session&) = delete;

        idle_session(idle_session&& other) noexcept
            : owner_(std::exchange(other.owner_, nullptr)),
              lock_(std::move(other.lock_)),
              tag_(std::move(other.tag_)),
              pending_(std::move(other.pending_)),
              active_(std::exchange(other.active_, false)),
              done_sent_(std::exchange(other.done_sent_, false))
        {
        }

        idle_session& operator=(idle_session&& other) noexcept
        {
            if (this != &other)
            {
                owner_ = std::exchange(other.owner_, nullptr);
                lock_ = std::move(other.lock_);
                tag_ = std::move(other.tag_);
                pending_ = std::move(other.pending_);
                active_ = std::exchange(other.active_, false);
                done_sent_ = std::exchange(other.done_sent_, false);
            }
            return *this;
        }

        ~idle_session() = default;

        [[nodiscard]] bool active() const noexcept
        {
            return active_;
        }

        [[nodiscard]] const std::string& tag() const noexcept
        {
            return tag_;
        }

        /// Next server line: untagged data, or the tagged completion after DONE.
        awaitable<result<std::string>> read_line()
        {
            if (!active_ || owner_ == nullptr)
                co_return inactive<std::string>();

            if (!pending_.empty())
            {
                std::string line = std::move(pending_.front());
                pending_.pop_front();
                co_return mailmirror::ok(std::move(line));
            }

            dialog_type* dlg = nullptr;
            MAILMIRROR_CO_TRY_ASSIGN(dlg, owner_->dialog_ptr());
            std::string line;
            MAILMIRROR_CO_TRY_ASSIGN(line, co_await dlg->read_line_r());
            co_return mailmirror::ok(std::move(line));
        }

        /// Ask the server to end IDLE. Only the first call writes.
        awaitable<result_void> done()
        {
            if (!active_ || owner_ == nullptr)
                co_return inactive<void>();
            if (done_sent_)
                co_return mailmirror::ok();
            done_sent_ = true;

            dialog_type* dlg = nullptr;
            MAILMIRROR_CO_TRY_ASSIGN(dlg, owner_->dialog_ptr());
            MAILMIRROR_TRY_CO_AWAIT(dlg->write_line_r("DONE"));
            co_return mailmirror::ok();
        }

        [[nodiscard]] bool done_sent() const noexcept
        {
            return done_sent_;
        }

        [[nodiscard]] bool is_completion(std::string_view line) const noexcept
        {
            return active_ && client::is_tagged_line(line, tag_);
        }

        /// Consume the tagged completion line and release the command lock.
        result_void finish(std::string_view line)
        {
            if (!active_ || owner_ == nullptr)
                return inactive<void>();

            response resp;
            resp.tag = tag_;
            client::handle_line(resp, std::string(line), tag_);
            client* owner = owner_;
            release();
            auto res = owner->finalize_response(std::move(resp), "IDLE");
            if (!res)
                return mailmirror::fail<void>(std::move(res).error());
            return mailmirror::ok();
        }

        /// Drop the session without a completion, e.g. after a transport failure.
        void abandon() noexcept
        {
            release();
        }

        /// Abort a pending read_line().
        void cancel() noexcept
        {
            if (owner_ != nullptr && owner_->dialog_.has_value())
                owner_->dialog_->cancel();
        }

    private:
        friend class client;

        idle_session(client* owner, mailmirror::detail::async_mutex::scoped_lock lock,
            std::string tag, std::deque<std::string> pending)
            : owner_(owner),
              lock_(std::move(lock)),
              tag_(std::move(tag)),
              pending_(std::move(pending)),
              active_(true)
        {
        }

        template<typename T>
        static result<T> inactive()
        {
            return mailmirror::fail<T>(
                mailmirror::errc::imap_invalid_state,
                "IDLE is not active.",
                make_imap_detail({}, "IDLE", {}, 0, 0));
        }

        void release() noexcept
        {
            active_ = false;
            owner_ = nullptr;
            lock_ = mailmirror::detail::async_mutex::scoped_lock();
        }

        client* owner_{nullptr};
        mailmirror::detail::async_mutex::scoped_lock lock_;
        std::string tag_;
        std::deque<std::string> pending_;
        bool active_{false};
        bool done_sent_{false};
    };

    explicit client(executor_type executor, options opts = {})
        : executor_(executor),
          options_(std::move(opts)),
          mutex_(executor_)
    {
    }

    client(const client&) = delete;
    client& operator=(const client&) = delete;

    executor_type get_executor() const { return executor_; }

    /// Connect with implicit TLS when `tls_ctx` is set, read the greeting and the capabilities.
    awaitable<result_void> connect(const std::string& host, const std::string& service, ssl::context* tls_ctx)
    {
        [[maybe_unused]] auto guard = co_await mutex_.lock();
        co_return co_await connect_impl(host, service, tls_ctx);
    }

    awaitable<result<response>> capability()
    {
        [[maybe_unused]] auto guard = co_await mutex_.lock();
        co_return co_await capability_impl();
    }

    /// Case-insensitive lookup in the last CAPABILITY answer, e.g. "IDLE" or "AUTH=XOAUTH2".
    [[nodiscard]] bool supports(std::string_view cap) const
    {
        const std::string key = detail::to_upper_ascii(cap);
        for (const auto& token : capabilities_)
        {
            if (token == key)
                return true;
        }
        return false;
    }

    awaitable<result<response>> login(std::string_view username, std::string_view password)
    {
        [[maybe_unused]] auto guard = co_await mutex_.lock();
        response resp;
        MAILMIRROR_CO_TRY_ASSIGN(resp, co_await login_impl(username, password));
        MAILMIRROR_TRY_CO_AWAIT(capability_impl());
        co_return mailmirror::ok(std::move(resp));
    }

    awaitable<result<response>> authenticate_xoauth2(std::string_view username, std::string_view access_token)
    {
        [[maybe_unused]] auto guard = co_await mutex_.lock();
        response resp;
        MAILMIRROR_CO_TRY_ASSIGN(resp, co_await authenticate_xoauth2_impl(username, access_token));
        MAILMIRROR_TRY_CO_AWAIT(capability_impl());
        co_return mailmirror::ok(std::move(resp));
    }

    awaitable<result<mailbox_stat>> select(std::string_view mailbox)
    {
        [[maybe_unused]] auto guard = co_await mutex_.lock();
        co_return co_await open_mailbox_impl("SELECT", mailbox);
    }

    awaitable<result<mailbox_stat>> examine(std::string_view mailbox)
    {
        [[maybe_unused]] auto guard = co_await mutex_.lock();
        co_return co_await open_mailbox_impl("EXAMINE", mailbox);
    }

    /**
    FETCH `seq` (UID FLAGS INTERNALDATE BODY[]) and hand every record with a
    body to `handler` as soon as it is complete. Once the handler returns false
    the rest of the response is read and discarded. Returns the number of
    messages handed over.
    **/
    awaitable<result<std::size_t>> fetch_messages(std::string_view seq, fetch_handler handler)
    {
        [[maybe_unused]] auto guard = co_await mutex_.lock();
        co_return co_await fetch_messages_impl(seq, std::move(handler));
    }

    /// APPEND `body` with the given flags (without parentheses) and INTERNALDATE.
    awaitable<result_void> append(std::string_view mailbox, std::string_view body,
        const std::vector<std::string>& flags, std::string_view internal_date)
    {
        [[maybe_unused]] auto guard = co_await mutex_.lock();
        std::string flag_list;
        for (const auto& flag : flags)
        {
            if (!flag_list.empty())
                mailmirror::detail::append_space(flag_list);
            mailmirror::detail::append_sv(flag_list, flag);
        }
        response resp;
        MAILMIRROR_CO_TRY_ASSIGN(resp, co_await append_impl(mailbox, body, flag_list, internal_date));
        co_return mailmirror::ok();
    }

    awaitable<result<response>> uid_store(std::string_view seq, std::string_view item)
    {
        [[maybe_unused]] auto guard = co_await mutex_.lock();
        MAILMIRROR_CO_TRY_VOID(mailmirror::detail::ensure_no_crlf_or_nul(seq, "seq_set"));
        std::string cmd;
        mailmirror::detail::append_sv(cmd, "UID STORE");
        mailmirror::detail::append_space(cmd);
        mailmirror::detail::append_sv(cmd, seq);
        mailmirror::detail::append_space(cmd);
        mailmirror::detail::append_sv(cmd, item);
        co_return co_await command_impl(cmd);
    }

    awaitable<result<response>> noop()
    {
        [[maybe_unused]] auto guard = co_await mutex_.lock();
        co_return co_await command_impl("NOOP");
    }

    awaitable<result<response>> logout()
    {
        [[maybe_unused]] auto guard = co_await mutex_.lock();
        auto res = co_await command_impl("LOGOUT");
        disconnect();
        co_return res;
    }

    /// Start IDLE; resolves once the server sent its continuation.
    awaitable<result<idle_session>> idle()
    {
        auto guard = co_await mutex_.lock();

        std::string tag = next_tag();
        dialog_type* dlg = nullptr;
        MAILMIRROR_CO_TRY_ASSIGN(dlg, dialog_ptr());
        MAILMIRROR_TRY_CO_AWAIT(dlg->write_line_r(tag + " IDLE"));

        std::deque<std::string> pending;
        response resp;
        resp.tag = tag;
        while (true)
        {
            std::string line;
            MAILMIRROR_CO_TRY_ASSIGN(line, co_await dlg->read_line_r());
            if (!line.empty() && line[0] == '+')
                break;
            if (is_tagged_line(line, tag))
            {
                handle_line(resp, line, tag);
                auto done = finalize_response(std::move(resp), "IDLE");
                if (!done)
                    co_return mailmirror::fail<idle_session>(std::move(done).error());
                co_return imap_fail<idle_session>(errc::imap_continuation_expected,
                    "IMAP continuation expected.", tag, "IDLE", line);
            }
            pending.push_back(std::move(line));
        }

        co_return mailmirror::ok(idle_session(this, std::move(guard), std::move(tag), std::move(pending)));
    }

    /// Abort pending I/O; callers see net_cancelled.
    void cancel() noexcept
    {
        if (dialog_.has_value())
            dialog_->cancel();
    }

    /// Close the transport without LOGOUT.
    void disconnect() noexcept
    {
        if (dialog_.has_value())
        {
            dialog_->stream().close();
            dialog_.reset();
        }
    }

    [[nodiscard]] bool connected() const noexcept
    {
        return dialog_.has_value();
    }

private:
    /// Error of kind `code` carrying the exchange that produced it.
    template<typename T>
    [[nodiscard]] static result<T> imap_fail(errc code, std::string_view message, std::string_view tag,
        std::string_view command, std::string_view tagged_line, const response* resp = nullptr)
    {
        const std::size_t untagged = resp != nullptr ? resp->untagged_lines.size() : 0;
        const std::size_t literals = resp != nullptr ? resp->literals.size() : 0;
        return mailmirror::fail<T>(code, std::string(message),
            make_imap_detail(tag, command, tagged_line, untagged, literals));
    }

    [[nodiscard]] static std::string_view tagged_line_or_text(const response& resp) noexcept
    {
        if (!resp.tagged_lines.empty())
            return resp.tagged_lines.back();
        return resp.text;
    }

    result<dialog_type*> dialog_ptr()
    {
        if (!dialog_.has_value())
            return mailmirror::fail<dialog_type*>(
                mailmirror::errc::imap_invalid_state,
                "Connection is not established.",
                make_imap_detail({}, "CONNECT", {}, 0, 0));
        return mailmirror::ok(&*dialog_);
    }

    std::string next_tag()
    {
        std::string tag("A");
        mailmirror::detail::append_uint(tag, ++tag_counter_);
        return tag;
    }

    void trace_payload(std::string_view label, std::size_t bytes) const
    {
        auto& logger = mailmirror::log::logger::instance();
        if (!logger.is_trace_enabled())
            return;
        std::string line;
        line.reserve(label.size() + 32);
        mailmirror::detail::append_sv(line, label);
        mailmirror::detail::append_sv(line, " literal bytes=");
        mailmirror::detail::append_uint(line, static_cast<std::uint64_t>(bytes));
        logger.trace_protocol("IMAP", mailmirror::log::direction::send, line);
    }

    awaitable<result_void> connect_impl(const std::string& host, const std::string& service, ssl::context* tls_ctx)
    {
        if (dialog_.has_value())
            co_return mailmirror::fail<void>(
                mailmirror::errc::imap_invalid_state,
                "Connection is already established.",
                make_imap_detail({}, "CONNECT", {}, 0, 0));

        auto stream_res = co_await mailmirror::net::open_stream(executor_, host, service, tls_ctx, options_.tls, "imap");
        if (!stream_res)
            co_return mailmirror::fail<void>(std::move(stream_res).error());

        dialog_.emplace(std::move(*stream_res), options_.max_line_length, options_.timeout);
        dialog_->set_trace_protocol("IMAP");
        dialog_->set_trace_redaction(options_.redact_secrets_in_trace);
        tag_counter_ = 0;
        capabilities_.clear();

        MAILMIRROR_TRY_CO_AWAIT(read_greeting_impl());
        MAILMIRROR_TRY_CO_AWAIT(capability_impl());
        co_return mailmirror::ok();
    }

    awaitable<result<response>> read_greeting_impl()
    {
        response resp;
        dialog_type* dlg = nullptr;
        MAILMIRROR_CO_TRY_ASSIGN(dlg, dialog_ptr());
        std::string line;
        MAILMIRROR_CO_TRY_ASSIGN(line, co_await dlg->read_line_r());
        handle_line(resp, line, std::string_view{});
        parse_capability_line(capabilities_, line);
        if (resp.st == status::bye)
            co_return imap_fail<response>(errc::imap_bye, "IMAP server refused the connection.",
                {}, "GREETING", line, &resp);
        if (resp.st == status::preauth)
            resp.st = status::ok;
        co_return finalize_response(std::move(resp), "GREETING");
    }

    awaitable<result<response>> capability_impl()
    {
        response resp;
        MAILMIRROR_CO_TRY_ASSIGN(resp, co_await command_impl("CAPABILITY"));
        capabilities_.clear();
        for (const auto& line : resp.untagged_lines)
            parse_capability_line(capabilities_, line);
        for (const auto& line : resp.tagged_lines)
            parse_capability_line(capabilities_, line);
        co_return mailmirror::ok(std::move(resp));
    }

    awaitable<result<response>> login_impl(std::string_view username, std::string_view password)
    {
        std::string user;
        MAILMIRROR_CO_TRY_ASSIGN(user, mailmirror::imap::to_astring(username));
        std::string pass;
        MAILMIRROR_CO_TRY_ASSIGN(pass, mailmirror::imap::to_astring(password));
        std::string cmd;
        mailmirror::detail::append_sv(cmd, "LOGIN");
        mailmirror::detail::append_space(cmd);
        mailmirror::detail::append_sv(cmd, user);
        mailmirror::detail::append_space(cmd);
        mailmirror::detail::append_sv(cmd, pass);
        co_return co_await command_impl(cmd);
    }

    /**
    AUTHENTICATE XOAUTH2, with the initial response inline when SASL-IR is
    advertised. A continuation after the initial response carries the error
    challenge; it is answered with an empty line and surfaced as
    sasl_xoauth2_error.
    **/
    awaitable<result<response>> authenticate_xoauth2_impl(std::string_view username, std::string_view access_token)
    {
        MAILMIRROR_CO_TRY_VOID(mailmirror::detail::ensure_no_crlf_or_nul(username, "username"));
        MAILMIRROR_CO_TRY_VOID(mailmirror::detail::ensure_no_crlf_or_nul(access_token, "access_token"));
        const std::string encoded = mailmirror::sasl::encode_xoauth2(username, access_token);
        const bool inline_ir = supports("SASL-IR");

        std::string cmd("AUTHENTICATE XOAUTH2");
        if (inline_ir)
        {
            mailmirror::detail::append_space(cmd);
            mailmirror::detail::append_sv(cmd, encoded);
        }

        const std::string tag = next_tag();
        dialog_type* dlg = nullptr;
        MAILMIRROR_CO_TRY_ASSIGN(dlg, dialog_ptr());
        MAILMIRROR_TRY_CO_AWAIT(dlg->write_line_r(tag + " " + cmd));

        response resp;
        resp.tag = tag;
        bool initial_sent = inline_ir;
        std::optional<mailmirror::sasl::xoauth2_error> challenge;
        while (true)
        {
            std::string line;
            MAILMIRROR_CO_TRY_ASSIGN(line, co_await dlg->read_line_r());
            handle_line(resp, line, tag);

            if (!line.empty() && line[0] == '+')
            {
                if (!initial_sent)
                {
                    initial_sent = true;
                    MAILMIRROR_TRY_CO_AWAIT(dlg->write_line_r(encoded));
                }
                else
                {
                    challenge = mailmirror::sasl::decode_xoauth2_error(detail::ltrim(std::string_view(line).substr(1)));
                    MAILMIRROR_TRY_CO_AWAIT(dlg->write_line_r(""));
                }
                continue;
            }

            if (is_tagged_line(line, tag))
                break;
        }

        if (challenge.has_value())
        {
            auto err = mailmirror::sasl::make_xoauth2_error(*challenge);
            mailmirror::detail::error_detail detail;
            detail.merge({}, err.detail);
            detail.merge({}, make_imap_detail(tag, "AUTHENTICATE XOAUTH2", tagged_line_or_text(resp),
                resp.untagged_lines.size(), resp.literals.size()).str());
            err.detail = detail.str();
            co_return mailmirror::fail<response>(std::move(err));
        }
        co_return finalize_response(std::move(resp), "AUTHENTICATE XOAUTH2");
    }

    awaitable<result<mailbox_stat>> open_mailbox_impl(std::string_view verb, std::string_view mailbox)
    {
        std::string quoted;
        MAILMIRROR_CO_TRY_ASSIGN(quoted, mailmirror::imap::to_astring(mailbox));
        std::string cmd;
        mailmirror::detail::append_sv(cmd, verb);
        mailmirror::detail::append_space(cmd);
        mailmirror::detail::append_sv(cmd, quoted);

        response resp;
        MAILMIRROR_CO_TRY_ASSIGN(resp, co_await command_impl(cmd));
        mailbox_stat stat;
        for (const auto& line : resp.untagged_lines)
            parse_mailbox_stat(line, stat);
        co_return mailmirror::ok(stat);
    }

    awaitable<result<std::size_t>> fetch_messages_impl(std::string_view seq, fetch_handler handler)
    {
        MAILMIRROR_CO_TRY_VOID(mailmirror::detail::ensure_no_crlf_or_nul(seq, "seq_set"));
        std::string cmd;
        mailmirror::detail::append_sv(cmd, "FETCH");
        mailmirror::detail::append_space(cmd);
        mailmirror::detail::append_sv(cmd, seq);
        mailmirror::detail::append_sv(cmd, " (UID FLAGS INTERNALDATE BODY[])");

        const std::string tag = next_tag();
        dialog_type* dlg = nullptr;
        MAILMIRROR_CO_TRY_ASSIGN(dlg, dialog_ptr());
        MAILMIRROR_TRY_CO_AWAIT(dlg->write_line_r(tag + " " + cmd));

        response resp;
        resp.tag = tag;
        bool deliver = true;
        std::size_t delivered = 0;
        std::optional<error_info> parse_failure;

        while (true)
        {
            std::string line;
            MAILMIRROR_CO_TRY_ASSIGN(line, co_await dlg->read_line_r());

            if (is_tagged_line(line, tag))
            {
                handle_line(resp, line, tag);
                break;
            }

            if (classify_untagged(line) != event_kind::message)
            {
                handle_line(resp, line, tag);
                MAILMIRROR_TRY_CO_AWAIT(read_literals(*dlg, resp, line, tag, cmd));
                continue;
            }

            fetch_record record;
            record.text = line;
            std::string current = std::move(line);
            std::size_t literal_size = 0;
            while (extract_literal_size(current, literal_size))
            {
                std::string literal;
                MAILMIRROR_CO_TRY_ASSIGN(literal, co_await dlg->read_exactly_r(literal_size));
                trace_payload("FETCH", literal.size());
                record.literals.push_back(std::move(literal));
                MAILMIRROR_CO_TRY_ASSIGN(current, co_await dlg->read_line_r());
                record.text += current;
            }

            if (!deliver)
                continue;

            auto parsed = parse_fetch_record(record);
            if (!parsed)
            {
                parse_failure = std::move(parsed).error();
                deliver = false;
                continue;
            }
            if (!parsed->has_value())
                continue;

            ++delivered;
            if (!co_await handler(std::move(**parsed)))
                deliver = false;
        }

        auto done = finalize_response(std::move(resp), cmd);
        if (!done)
            co_return mailmirror::fail<std::size_t>(std::move(done).error());
        if (parse_failure)
            co_return mailmirror::fail<std::size_t>(std::move(*parse_failure));
        co_return mailmirror::ok(delivered);
    }

    awaitable<result<response>> append_impl(std::string_view mailbox, std::string_view data,
        std::string_view flags, std::string_view date_time)
    {
        const bool use_literal_plus = supports("LITERAL+");
        std::string cmd;
        MAILMIRROR_CO_TRY_ASSIGN(cmd, mailmirror::imap::detail::build_append_command(
            mailbox, data.size(), flags, date_time, use_literal_plus));

        const std::string tag = next_tag();
        dialog_type* dlg = nullptr;
        MAILMIRROR_CO_TRY_ASSIGN(dlg, dialog_ptr());
        MAILMIRROR_TRY_CO_AWAIT(dlg->write_line_r(tag + " " + cmd));

        response resp;
        resp.tag = tag;

        if (!use_literal_plus)
        {
            while (true)
            {
                std::string resp_line;
                MAILMIRROR_CO_TRY_ASSIGN(resp_line, co_await dlg->read_line_r());
                handle_line(resp, resp_line, tag);

                if (!resp_line.empty() && resp_line[0] == '+')
                    break;

                if (is_tagged_line(resp_line, tag))
                {
                    auto early = finalize_response(std::move(resp), cmd);
                    if (!early)
                        co_return early;
                    co_return imap_fail<response>(errc::imap_continuation_expected,
                        "IMAP continuation expected.", tag, cmd, resp_line);
                }
            }
        }

        trace_payload("APPEND", data.size());
        MAILMIRROR_TRY_CO_AWAIT(dlg->write_raw_r(buffer(data.data(), data.size())));
        MAILMIRROR_TRY_CO_AWAIT(dlg->write_line_r(""));
        MAILMIRROR_TRY_CO_AWAIT(read_response_until_tag(*dlg, resp, tag, cmd));
        co_return finalize_response(std::move(resp), cmd);
    }

    awaitable<result<response>> command_impl(std::string_view cmd)
    {
        MAILMIRROR_CO_TRY_VOID(mailmirror::detail::ensure_no_crlf_or_nul(cmd, "command"));

        const std::string tag = next_tag();
        std::string line = tag;
        if (!cmd.empty())
        {
            mailmirror::detail::append_space(line);
            mailmirror::detail::append_sv(line, cmd);
        }

        dialog_type* dlg = nullptr;
        MAILMIRROR_CO_TRY_ASSIGN(dlg, dialog_ptr());
        MAILMIRROR_TRY_CO_AWAIT(dlg->write_line_r(line));
        response resp;
        resp.tag = tag;
        MAILMIRROR_TRY_CO_AWAIT(read_response_until_tag(*dlg, resp, tag, cmd));
        co_return finalize_response(std::move(resp), cmd);
    }

    awaitable<result_void> read_response_until_tag(dialog_type& dlg, response& resp, const std::string& tag,
        std::string_view command)
    {
        while (true)
        {
            std::string line;
            MAILMIRROR_CO_TRY_ASSIGN(line, co_await dlg.read_line_r());
            handle_line(resp, line, tag);
            MAILMIRROR_TRY_CO_AWAIT(read_literals(dlg, resp, line, tag, command));
            if (is_tagged_line(line, tag))
                break;
        }
        co_return mailmirror::ok();
    }

    /// Read the literal announced at the end of `line`, if any, and the lines continuing it.
    awaitable<result_void> read_literals(dialog_type& dlg, response& resp, std::string line,
        const std::string& tag, std::string_view command)
    {
        std::size_t literal_size = 0;
        while (extract_literal_size(line, literal_size))
        {
            std::string literal;
            MAILMIRROR_CO_TRY_ASSIGN(literal, co_await dlg.read_exactly_r(literal_size));
            if (literal.size() != literal_size)
            {
                co_return imap_fail<void>(errc::imap_parse_error, "IMAP literal size mismatch.",
                    tag, command, line, &resp);
            }
            resp.literals.push_back(std::move(literal));
            MAILMIRROR_CO_TRY_ASSIGN(line, co_await dlg.read_line_r());
            if (!resp.untagged_lines.empty())
                resp.untagged_lines.back() += line;
        }
        co_return mailmirror::ok();
    }

    static bool extract_literal_size(std::string_view line, std::size_t& out)
    {
        if (line.size() < 3 || line.back() != '}')
            return false;

        const auto brace = line.rfind('{');
        if (brace == std::string_view::npos)
            return false;

        std::string_view inner = line.substr(brace + 1, line.size() - brace - 2);
        if (!inner.empty() && inner.back() == '+')
            inner.remove_suffix(1);
        if (inner.empty())
            return false;

        std::size_t value = 0;
        for (char ch : inner)
        {
            if (ch < '0' || ch > '9')
                return false;
            value = value * 10 + static_cast<std::size_t>(ch - '0');
        }

        out = value;
        return true;
    }

    static bool is_tagged_line(std::string_view line, std::string_view tag)
    {
        if (tag.empty() || line.size() <= tag.size())
            return false;
        if (!line.starts_with(tag))
            return false;
        return line[tag.size()] == ' ';
    }

    static status parse_status_word(std::string_view word)
    {
        const std::string upper = detail::to_upper_ascii(word);
        if (upper == "OK")
            return status::ok;
        if (upper == "NO")
            return status::no;
        if (upper == "BAD")
            return status::bad;
        if (upper == "PREAUTH")
            return status::preauth;
        if (upper == "BYE")
            return status::bye;
        return status::unknown;
    }

    static void apply_status_from_untagged(response& resp, std::string_view line)
    {
        std::string_view rest = detail::ltrim(line.substr(1));
        auto [word, tail] = detail::split_token(rest);
        status st = parse_status_word(word);
        if (st != status::unknown && resp.st == status::unknown)
        {
            resp.st = st;
            resp.text.assign(tail.begin(), tail.end());
        }
    }

    static void apply_status_from_tagged(response& resp, std::string_view line, std::string_view tag)
    {
        std::string_view rest = detail::ltrim(line.substr(tag.size()));
        auto [word, tail] = detail::split_token(rest);
        resp.st = parse_status_word(word);
        resp.text.assign(tail.begin(), tail.end());
    }

    static void handle_line(response& resp, const std::string& line, std::string_view tag)
    {
        if (!tag.empty() && is_tagged_line(line, tag))
        {
            resp.tagged_lines.push_back(line);
            apply_status_from_tagged(resp, line, tag);
            return;
        }

        if (!line.empty() && line[0] == '*')
        {
            resp.untagged_lines.push_back(line);
            // Untagged status only stands in for the greeting; tagged completion decides otherwise.
            if (tag.empty())
                apply_status_from_untagged(resp, line);
            return;
        }

        if (!line.empty() && line[0] == '+')
        {
            resp.continuation.push_back(line);
            return;
        }

        resp.untagged_lines.push_back(line);
    }

    /// A completed command succeeds on OK (or PREAUTH for the greeting) only.
    static result<response> finalize_response(response&& resp, std::string_view command)
    {
        errc code = errc::imap_parse_error;
        std::string_view message = "IMAP response carries no status.";
        switch (resp.st)
        {
            case status::ok:
            case status::preauth:
                return mailmirror::ok(std::move(resp));
            case status::no:
                code = errc::imap_tagged_no;
                message = "IMAP command rejected (NO).";
                break;
            case status::bad:
                code = errc::imap_tagged_bad;
                message = "IMAP command rejected (BAD).";
                break;
            case status::bye:
                code = errc::imap_bye;
                message = "IMAP server closed the session.";
                break;
            default:
                break;
        }
        return imap_fail<response>(code, message, resp.tag, command, tagged_line_or_text(resp), &resp);
    }

    static void parse_capability_line(std::vector<std::string>& caps, std::string_view line)
    {
        const std::string upper = detail::to_upper_ascii(line);
        auto pos = upper.find("CAPABILITY");
        if (pos == std::string::npos)
            return;
        std::string_view rest = std::string_view(upper).substr(pos + std::string_view("CAPABILITY").size());
        const auto close = rest.find(']');
        if (close != std::string_view::npos)
            rest = rest.substr(0, close);

        while (!rest.empty())
        {
            auto [token, remaining] = detail::split_token(rest);
            if (token.empty())
                break;
            caps.emplace_back(token);
            rest = remaining;
        }
    }

    executor_type executor_;
    options options_;
    mailmirror::detail::async_mutex mutex_;
    std::optional<dialog_type> dialog_;
    std::uint64_t tag_counter_{0};
    std::vector<std::string> capabilities_;
};

} // namespace mailmirror::imap
