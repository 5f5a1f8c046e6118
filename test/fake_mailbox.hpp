/*

fake_mailbox.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

In-memory IMAP sessions for the sync tests. One server holds both mailboxes,
records every command and scripts the lines seen while idling.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/test/unit_test.hpp>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/async_event.hpp>
#include <mailmirror/detail/result.hpp>
#include <mailmirror/imap/fetch_parser.hpp>
#include <mailmirror/imap/types.hpp>
#include <mailmirror/sync/account.hpp>
#include <mailmirror/sync/connection_manager.hpp>

namespace fake
{

namespace asio = mailmirror::asio;
using mailmirror::result;
using mailmirror::result_void;
using mailmirror::imap::fetched_message;

inline constexpr std::string_view IDLE_TAG = "A1";

struct appended_message
{
    std::string mailbox;
    std::string body;
    std::vector<std::string> flags;
    std::string internal_date;
};

struct mailbox_server
{
    explicit mailbox_server(asio::any_io_executor executor)
        : idle_cond(std::move(executor))
    {
    }

    // source mailbox
    std::vector<fetched_message> source_messages;
    // target mailbox
    std::vector<appended_message> appended;

    std::vector<std::string> journal;
    std::vector<std::string> uid_stores;
    int examines = 0;

    std::optional<std::string> reject_append_body;
    bool reject_uid_store = false;
    bool idle_supported = true;

    // Held closed, EXAMINE waits until it is set.
    mailmirror::detail::async_event* examine_gate = nullptr;

    std::deque<std::string> idle_lines;
    mailmirror::detail::async_condition idle_cond;
    int idle_rounds = 0;

    void add_message(std::uint32_t uid, std::vector<std::string> flags = {})
    {
        fetched_message msg;
        msg.seq = static_cast<std::uint32_t>(source_messages.size() + 1);
        msg.uid = uid;
        msg.flags = std::move(flags);
        msg.internal_date = "01-Jan-2025 10:00:00 +0000";
        msg.body = "Subject: message " + std::to_string(uid) + "\r\n\r\nbody\r\n";
        source_messages.push_back(std::move(msg));
    }

    void push_idle_line(std::string line)
    {
        idle_lines.push_back(std::move(line));
        idle_cond.notify_all();
    }

    /// Apply `+FLAGS (\Deleted)` to every UID of a `1:3,5` set.
    void flag_deleted(std::string_view seq)
    {
        std::set<std::uint32_t> uids;
        while (!seq.empty())
        {
            const auto comma = seq.find(',');
            const std::string_view part = seq.substr(0, comma);
            const auto colon = part.find(':');
            const auto first = static_cast<std::uint32_t>(std::stoul(std::string(part.substr(0, colon))));
            const auto last = colon == std::string_view::npos ? first
                : static_cast<std::uint32_t>(std::stoul(std::string(part.substr(colon + 1))));
            for (std::uint32_t uid = first; uid <= last; ++uid)
                uids.insert(uid);
            if (comma == std::string_view::npos)
                break;
            seq.remove_prefix(comma + 1);
        }
        for (auto& msg : source_messages)
        {
            if (uids.count(msg.uid) != 0)
                msg.flags.push_back("\\Deleted");
        }
    }
};

/// IDLE in progress on a fake session; lines come from the server script.
class idle_session
{
public:
    idle_session() = default;

    explicit idle_session(mailbox_server* server)
        : server_(server)
    {
    }

    idle_session(idle_session&&) noexcept = default;
    idle_session& operator=(idle_session&&) noexcept = default;

    asio::awaitable<result<std::string>> read_line()
    {
        while (true)
        {
            if (cancelled_)
                co_return mailmirror::fail<std::string>(mailmirror::errc::net_cancelled, "IDLE read cancelled");
            if (!server_->idle_lines.empty())
            {
                std::string line = std::move(server_->idle_lines.front());
                server_->idle_lines.pop_front();
                co_return mailmirror::ok(std::move(line));
            }
            if (done_sent_)
                co_return mailmirror::ok(std::string(IDLE_TAG) + " OK IDLE terminated");
            co_await server_->idle_cond.wait();
        }
    }

    asio::awaitable<result_void> done()
    {
        done_sent_ = true;
        server_->journal.push_back("DONE");
        server_->idle_cond.notify_all();
        co_return mailmirror::ok();
    }

    [[nodiscard]] bool is_completion(std::string_view line) const noexcept
    {
        return line.substr(0, IDLE_TAG.size() + 1) == std::string(IDLE_TAG) + " ";
    }

    result_void finish(std::string_view line)
    {
        if (line.find(" OK ") == std::string_view::npos)
            return mailmirror::fail<void>(mailmirror::errc::imap_tagged_no, "IDLE rejected", std::string(line));
        return mailmirror::ok();
    }

    void abandon() noexcept
    {
        abandoned_ = true;
    }

    void cancel() noexcept
    {
        cancelled_ = true;
        if (server_ != nullptr)
            server_->idle_cond.notify_all();
    }

private:
    mailbox_server* server_ = nullptr;
    bool done_sent_ = false;
    bool cancelled_ = false;
    bool abandoned_ = false;
};

class session
{
public:
    session(mailbox_server& server, mailmirror::sync::store_role role)
        : server_(server),
          role_(role)
    {
    }

    [[nodiscard]] bool supports(std::string_view cap) const
    {
        return cap == "IDLE" && server_.idle_supported;
    }

    asio::awaitable<result<mailmirror::imap::mailbox_stat>> examine(std::string_view mailbox)
    {
        ++server_.examines;
        server_.journal.push_back("EXAMINE " + std::string(mailbox));
        if (server_.examine_gate != nullptr)
            co_await server_.examine_gate->wait();
        mailmirror::imap::mailbox_stat stat;
        stat.messages_no = static_cast<std::uint32_t>(server_.source_messages.size());
        co_return mailmirror::ok(stat);
    }

    asio::awaitable<result<mailmirror::imap::mailbox_stat>> select(std::string_view mailbox)
    {
        server_.journal.push_back(std::string(role_ == mailmirror::sync::store_role::source ? "source" : "target")
            + " SELECT " + std::string(mailbox));
        co_return mailmirror::ok(mailmirror::imap::mailbox_stat{});
    }

    asio::awaitable<result<std::size_t>> fetch_messages(std::string_view seq, mailmirror::imap::fetch_handler handler)
    {
        server_.journal.push_back("FETCH " + std::string(seq));
        std::size_t delivered = 0;
        const auto snapshot = server_.source_messages;
        for (const auto& msg : snapshot)
        {
            server_.journal.push_back("fetched " + std::to_string(msg.uid));
            ++delivered;
            if (!co_await handler(msg))
                break;
        }
        co_return mailmirror::ok(delivered);
    }

    asio::awaitable<result_void> append(std::string_view mailbox, std::string_view body,
        const std::vector<std::string>& flags, std::string_view internal_date)
    {
        server_.journal.push_back("APPEND " + std::string(mailbox));
        if (server_.reject_append_body && *server_.reject_append_body == body)
            co_return mailmirror::fail<void>(mailmirror::errc::imap_tagged_no, "APPEND rejected");
        server_.appended.push_back(appended_message{std::string(mailbox), std::string(body), flags,
            std::string(internal_date)});
        co_return mailmirror::ok();
    }

    asio::awaitable<result<mailmirror::imap::response>> uid_store(std::string_view seq, std::string_view item)
    {
        server_.journal.push_back("UID STORE " + std::string(seq) + " " + std::string(item));
        if (server_.reject_uid_store)
            co_return mailmirror::fail<mailmirror::imap::response>(mailmirror::errc::imap_tagged_no, "STORE rejected");
        server_.uid_stores.emplace_back(seq);
        server_.flag_deleted(seq);
        mailmirror::imap::response resp;
        resp.st = mailmirror::imap::status::ok;
        co_return mailmirror::ok(std::move(resp));
    }

    asio::awaitable<result<mailmirror::imap::response>> noop()
    {
        mailmirror::imap::response resp;
        resp.st = mailmirror::imap::status::ok;
        while (!server_.idle_lines.empty())
        {
            resp.untagged_lines.push_back(std::move(server_.idle_lines.front()));
            server_.idle_lines.pop_front();
        }
        co_return mailmirror::ok(std::move(resp));
    }

    asio::awaitable<result<idle_session>> idle()
    {
        ++server_.idle_rounds;
        server_.journal.push_back("IDLE");
        co_return mailmirror::ok(idle_session(&server_));
    }

private:
    mailbox_server& server_;
    mailmirror::sync::store_role role_;
};

/// Connector handing out fake sessions; `fail_role` makes open() fail for that store.
class connector
{
public:
    using session_type = session;

    explicit connector(mailbox_server& server)
        : server_(server)
    {
    }

    asio::awaitable<result<std::unique_ptr<session>>> open(mailmirror::sync::store_role role,
        mailmirror::sync::open_mode mode, std::stop_token)
    {
        const std::string role_name(mailmirror::sync::to_string(role));
        server_.journal.push_back("OPEN " + role_name + (mode == mailmirror::sync::open_mode::idle ? " idle" : ""));
        if (fail_role && *fail_role == role)
            co_return mailmirror::fail<std::unique_ptr<session>>(mailmirror::errc::connection_failed,
                "cannot connect to " + role_name);
        ++open_sessions;
        co_return mailmirror::ok(std::make_unique<session>(server_, role));
    }

    asio::awaitable<result_void> close(session&)
    {
        server_.journal.push_back("CLOSE");
        --open_sessions;
        co_return mailmirror::ok();
    }

    std::optional<mailmirror::sync::store_role> fail_role;
    int open_sessions = 0;

private:
    mailbox_server& server_;
};

inline mailmirror::sync::account make_account(std::string name = "john.doe@example.com")
{
    mailmirror::sync::source_store source;
    source.store.server = "imap.source.example:993";
    source.store.username = "john";
    source.store.password = "secret";
    mailmirror::sync::target_store target;
    target.store.server = "imap.target.example:993";
    target.store.username = "john";
    target.store.password = "secret";
    target.store.mailbox = "Archive";
    return mailmirror::sync::account(std::move(name), source, target);
}

/// Poll `pred` every few milliseconds; fails the test after `limit`.
inline asio::awaitable<void> wait_until(std::function<bool()> pred,
    std::chrono::milliseconds limit = std::chrono::seconds{5})
{
    asio::steady_timer timer(co_await asio::this_coro::executor);
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!pred())
    {
        BOOST_REQUIRE(std::chrono::steady_clock::now() < deadline);
        timer.expires_after(std::chrono::milliseconds{5});
        asio::error_code ec;
        co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
}

/// Let other coroutines run for a while.
inline asio::awaitable<void> settle(std::chrono::milliseconds period = std::chrono::milliseconds{50})
{
    asio::steady_timer timer(co_await asio::this_coro::executor);
    timer.expires_after(period);
    asio::error_code ec;
    co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
}

} // namespace fake
