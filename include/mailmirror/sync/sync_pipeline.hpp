/*

sync_pipeline.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Fetch, store and cleanup stages of one mirror cycle.

*/

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/async_event.hpp>
#include <mailmirror/detail/async_queue.hpp>
#include <mailmirror/detail/exception_bridge.hpp>
#include <mailmirror/detail/log.hpp>
#include <mailmirror/detail/redact.hpp>
#include <mailmirror/detail/result.hpp>
#include <mailmirror/imap/fetch_parser.hpp>
#include <mailmirror/imap/seq_set.hpp>
#include <mailmirror/sync/account.hpp>

namespace mailmirror::sync
{

/// Capacity of the message and delete queues between the stages.
inline constexpr std::size_t STAGE_QUEUE_CAPACITY = 1;

inline constexpr std::string_view DELETED_FLAG = "\\Deleted";

/// Flags to carry over to the target, or nullopt for a message marked \Deleted.
[[nodiscard]] inline std::optional<std::vector<std::string>> forwarded_flags(const std::vector<std::string>& flags)
{
    std::vector<std::string> out;
    for (const auto& flag : flags)
    {
        if (mailmirror::detail::iequals_ascii(flag, DELETED_FLAG))
            return std::nullopt;
        if (mailmirror::detail::iequals_ascii(flag, "\\Seen") || mailmirror::detail::iequals_ascii(flag, "\\Recent"))
            continue;
        out.push_back(flag);
    }
    return out;
}

/**
One mirror cycle over two sessions. The stages run concurrently and only talk
through the queues; closing a queue releases whoever waits on it. The first
stage error becomes the result of run().

`Session` needs examine(), select(), fetch_messages(), append() and uid_store()
with the signatures of imap::client.
**/
template<typename Session>
class sync_pipeline
{
public:
    using message_queue = mailmirror::detail::async_queue<mailmirror::imap::fetched_message>;
    using delete_queue = mailmirror::detail::async_queue<std::uint32_t>;

    explicit sync_pipeline(account& acct)
        : account_(acct)
    {
    }

    mailmirror::asio::awaitable<result_void> run(Session& source, Session& target)
    {
        auto executor = co_await mailmirror::asio::this_coro::executor;
        message_queue messages(executor, STAGE_QUEUE_CAPACITY);
        delete_queue deletes(executor, STAGE_QUEUE_CAPACITY);
        mailmirror::detail::wait_group stages(executor);
        std::optional<error_info> first_error;

        const auto launch = [&](auto body, errc kind)
        {
            stages.add();
            mailmirror::asio::co_spawn(executor,
                [&, body = std::move(body), kind]() mutable -> mailmirror::asio::awaitable<void>
                {
                    auto res = co_await protect_awaitable(std::move(body), kind);
                    if (!res && !first_error)
                        first_error = std::move(res).error();
                    stages.done();
                },
                mailmirror::asio::detached);
        };

        launch([&] { return fetch(source, messages); }, errc::fetch_failed);
        launch([&] { return store(target, messages, deletes); }, errc::store_failed);
        launch([&] { return cleanup(source, deletes); }, errc::cleanup_failed);

        co_await stages.wait();

        if (first_error)
            co_return fail<void>(std::move(*first_error));
        co_return ok();
    }

private:
    mailmirror::asio::awaitable<result_void> fetch(Session& source, message_queue& messages)
    {
        const std::string& mailbox = account_.source().store.mailbox;
        auto stat = co_await source.examine(mailbox);
        if (!stat)
        {
            messages.close();
            co_return fail<void>(nest_error(errc::fetch_failed, fmt::format("cannot examine {}", mailbox),
                std::move(stat).error()));
        }

        if (stat->messages_no == 0)
        {
            MAILMIRROR_DEBUG("{}: {} is empty", account_.prefix(), mailbox);
            messages.close();
            co_return ok();
        }

        mailmirror::imap::seq_set range;
        range.add_range(1, stat->messages_no);
        auto fetched = co_await source.fetch_messages(range.str(),
            [&messages](mailmirror::imap::fetched_message msg) -> mailmirror::asio::awaitable<bool>
            {
                co_return co_await messages.push(std::move(msg));
            });
        messages.close();
        if (!fetched)
            co_return fail<void>(nest_error(errc::fetch_failed, "cannot fetch messages", std::move(fetched).error()));
        co_return ok();
    }

    mailmirror::asio::awaitable<result_void> store(Session& target, message_queue& messages, delete_queue& deletes)
    {
        const std::string& mailbox = account_.target().store.mailbox;
        auto selected = co_await target.select(mailbox);
        if (!selected)
        {
            messages.close();
            deletes.close();
            co_return fail<void>(nest_error(errc::store_failed, fmt::format("cannot select {}", mailbox),
                std::move(selected).error()));
        }

        while (auto msg = co_await messages.pop())
        {
            MAILMIRROR_INFO("{}: handling message {}", account_.prefix(), msg->uid);

            const auto flags = forwarded_flags(msg->flags);
            if (!flags)
            {
                MAILMIRROR_INFO("{}: ignoring message {}", account_.prefix(), msg->uid);
                continue;
            }

            MAILMIRROR_INFO("{}: storing message {}", account_.prefix(), msg->uid);
            auto appended = co_await target.append(mailbox, msg->body, *flags, msg->internal_date);
            if (!appended)
            {
                messages.close();
                deletes.close();
                co_return fail<void>(nest_error(errc::store_failed,
                    fmt::format("cannot store message {}", msg->uid), std::move(appended).error()));
            }
            account_.add_processed();

            if (!co_await deletes.push(msg->uid))
                break;
        }

        deletes.close();
        co_return ok();
    }

    mailmirror::asio::awaitable<result_void> cleanup(Session& source, delete_queue& deletes)
    {
        mailmirror::imap::seq_set uids;
        while (auto uid = co_await deletes.pop())
        {
            MAILMIRROR_INFO("{}: deleting message {}", account_.prefix(), *uid);
            uids.add(*uid);
        }

        if (uids.empty())
            co_return ok();

        const std::string& mailbox = account_.source().store.mailbox;
        auto selected = co_await source.select(mailbox);
        if (!selected)
            co_return fail<void>(nest_error(errc::cleanup_failed, fmt::format("cannot select {}", mailbox),
                std::move(selected).error()));

        auto flagged = co_await source.uid_store(uids.str(), "+FLAGS (\\Deleted)");
        if (!flagged)
            co_return fail<void>(nest_error(errc::cleanup_failed, "cannot flag messages as deleted",
                std::move(flagged).error()));
        co_return ok();
    }

    account& account_;
};

} // namespace mailmirror::sync
