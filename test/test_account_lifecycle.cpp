/*

test_account_lifecycle.cpp
--------------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE account_lifecycle_test

#include <boost/test/unit_test.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <mailmirror/detail/asio_decl.hpp>
#include <mailmirror/detail/async_queue.hpp>
#include <mailmirror/detail/latest_slot.hpp>
#include <mailmirror/detail/log.hpp>
#include <mailmirror/sync/account.hpp>


namespace asio = mailmirror::asio;
using mailmirror::sync::account;
using mailmirror::sync::lifecycle;
using mailmirror::sync::state_guard;

namespace
{

account make_account(std::string name)
{
    mailmirror::sync::source_store source;
    source.store.server = "imap.source.example:993";
    mailmirror::sync::target_store target;
    target.store.server = "imap.target.example:993";
    return account(std::move(name), source, target);
}

}


BOOST_AUTO_TEST_CASE(transition_table)
{
    using mailmirror::sync::is_valid_transition;
    BOOST_TEST(is_valid_transition(lifecycle::initial, lifecycle::connecting));
    BOOST_TEST(is_valid_transition(lifecycle::connecting, lifecycle::connected));
    BOOST_TEST(is_valid_transition(lifecycle::connected, lifecycle::watching));
    BOOST_TEST(is_valid_transition(lifecycle::connected, lifecycle::handling));
    BOOST_TEST(is_valid_transition(lifecycle::watching, lifecycle::handling));
    BOOST_TEST(is_valid_transition(lifecycle::handling, lifecycle::watching));
    BOOST_TEST(is_valid_transition(lifecycle::shutdown, lifecycle::initial));
    BOOST_TEST(is_valid_transition(lifecycle::handling, lifecycle::shutdown));

    BOOST_TEST(!is_valid_transition(lifecycle::initial, lifecycle::handling));
    BOOST_TEST(!is_valid_transition(lifecycle::connecting, lifecycle::watching));
    BOOST_TEST(!is_valid_transition(lifecycle::shutdown, lifecycle::connecting));
}

BOOST_AUTO_TEST_CASE(rejected_transition_keeps_state)
{
    auto acct = make_account("a@b.c");
    BOOST_TEST(!acct.transition(lifecycle::watching));
    BOOST_TEST((acct.state() == lifecycle::initial));
    BOOST_TEST(acct.prefix() == "a@b.c [initial]");
}

BOOST_AUTO_TEST_CASE(guard_restores_previous_state)
{
    auto acct = make_account("a@b.c");
    BOOST_REQUIRE(acct.transition(lifecycle::connecting));
    BOOST_REQUIRE(acct.transition(lifecycle::connected));
    {
        state_guard watching(acct, lifecycle::watching);
        BOOST_TEST(watching.entered());
        {
            state_guard handling(acct, lifecycle::handling);
            BOOST_TEST(handling.entered());
            BOOST_TEST((handling.previous() == lifecycle::watching));
            BOOST_TEST(acct.prefix() == "a@b.c [handling]");
        }
        BOOST_TEST((acct.state() == lifecycle::watching));
    }
    BOOST_TEST((acct.state() == lifecycle::connected));
}

BOOST_AUTO_TEST_CASE(guard_restore_does_not_log)
{
    auto acct = make_account("a@b.c");
    BOOST_REQUIRE(acct.transition(lifecycle::connecting));
    BOOST_REQUIRE(acct.transition(lifecycle::connected));

    auto& logger = mailmirror::log::logger::instance();
    logger.set_level(mailmirror::log::level::trace);
    {
        state_guard handling(acct, lifecycle::handling);
        BOOST_REQUIRE(handling.entered());
        logger.set_sink([](const mailmirror::log::record&) { throw std::runtime_error("sink failure"); });
    }
    logger.set_sink(nullptr);
    logger.set_level(mailmirror::log::level::info);
    BOOST_TEST((acct.state() == lifecycle::connected));
}

BOOST_AUTO_TEST_CASE(guard_does_not_undo_shutdown)
{
    auto acct = make_account("a@b.c");
    BOOST_REQUIRE(acct.transition(lifecycle::connecting));
    BOOST_REQUIRE(acct.transition(lifecycle::connected));
    {
        state_guard handling(acct, lifecycle::handling);
        BOOST_REQUIRE(handling.entered());
        BOOST_REQUIRE(acct.transition(lifecycle::shutdown));
    }
    BOOST_TEST((acct.state() == lifecycle::shutdown));
}

BOOST_AUTO_TEST_CASE(guard_not_entered_leaves_state)
{
    auto acct = make_account("a@b.c");
    {
        state_guard handling(acct, lifecycle::handling);
        BOOST_TEST(!handling.entered());
    }
    BOOST_TEST((acct.state() == lifecycle::initial));
}

BOOST_AUTO_TEST_CASE(counters_and_last_error)
{
    auto acct = make_account("a@b.c");
    acct.add_processed();
    acct.add_processed(2);
    BOOST_TEST(acct.processed() == 3u);

    acct.set_last_error(mailmirror::make_error(mailmirror::errc::fetch_failed, "boom"));
    BOOST_REQUIRE(acct.last_error().has_value());
    BOOST_TEST(acct.last_error()->code == mailmirror::errc::fetch_failed);
    acct.set_last_error(std::nullopt);
    BOOST_TEST(!acct.last_error().has_value());
}

BOOST_AUTO_TEST_CASE(latest_slot_keeps_newest)
{
    asio::io_context ctx;
    auto fut = asio::co_spawn(ctx,
        [&]() -> asio::awaitable<std::vector<int>>
        {
            mailmirror::detail::latest_slot<int> slot(ctx.get_executor());
            BOOST_TEST(!slot.put(1));
            BOOST_TEST(slot.put(2));
            BOOST_TEST(slot.put(3));
            BOOST_TEST(slot.coalesced() == 2u);

            std::vector<int> taken;
            auto first = co_await slot.take();
            taken.push_back(first.value_or(-1));

            slot.put(4);
            slot.close();
            BOOST_TEST(!slot.put(5));
            auto pending = co_await slot.take();
            taken.push_back(pending.value_or(-1));
            auto after_close = co_await slot.take();
            BOOST_TEST(!after_close.has_value());
            co_return taken;
        }, asio::use_future);

    ctx.run();
    BOOST_TEST(fut.get() == (std::vector<int>{3, 4}), boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(queue_drains_after_close)
{
    asio::io_context ctx;
    auto fut = asio::co_spawn(ctx,
        [&]() -> asio::awaitable<std::vector<int>>
        {
            mailmirror::detail::async_queue<int> queue(ctx.get_executor(), 1);
            std::vector<int> popped;

            asio::co_spawn(ctx, [&]() -> asio::awaitable<void>
            {
                for (int i = 1; i <= 3; ++i)
                {
                    if (!co_await queue.push(i))
                        break;
                }
                queue.close();
            }, asio::detached);

            while (auto item = co_await queue.pop())
                popped.push_back(*item);
            const bool pushed_after_close = co_await queue.push(9);
            BOOST_TEST(!pushed_after_close);
            co_return popped;
        }, asio::use_future);

    ctx.run();
    BOOST_TEST(fut.get() == (std::vector<int>{1, 2, 3}), boost::test_tools::per_element());
}
