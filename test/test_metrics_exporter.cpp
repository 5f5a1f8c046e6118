/*

test_metrics_exporter.cpp
-------------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE metrics_exporter_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <future>
#include <stop_token>
#include <string>
#include <vector>

#include <mailmirror/metrics/exporter.hpp>


namespace asio = mailmirror::asio;
using mailmirror::sync::account;
using mailmirror::sync::lifecycle;

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

bool contains(const std::string& text, const std::string& part)
{
    return text.find(part) != std::string::npos;
}

}


BOOST_AUTO_TEST_CASE(render_exposes_state_and_counter)
{
    auto first = make_account("john.doe@example.com");
    auto second = make_account("jane\"q\"@example.com");
    BOOST_REQUIRE(first.transition(lifecycle::connecting));
    BOOST_REQUIRE(first.transition(lifecycle::connected));
    BOOST_REQUIRE(first.transition(lifecycle::watching));
    first.add_processed(7);

    const std::string text = mailmirror::metrics::render({&first, &second});
    BOOST_TEST(contains(text, "# TYPE mail_account_state gauge\n"));
    BOOST_TEST(contains(text, "# TYPE mail_account_messages_total counter\n"));
    BOOST_TEST(contains(text, "mail_account_state{name=\"john.doe@example.com\"} 3\n"));
    BOOST_TEST(contains(text, "mail_account_state{name=\"jane\\\"q\\\"@example.com\"} 0\n"));
    BOOST_TEST(contains(text, "mail_account_messages_total{name=\"john.doe@example.com\"} 7\n"));
    BOOST_TEST(contains(text, "mail_account_messages_total{name=\"jane\\\"q\\\"@example.com\"} 0\n"));
}

BOOST_AUTO_TEST_CASE(escape_label_values)
{
    BOOST_TEST(mailmirror::metrics::detail::escape_label("a\\b\"c\nd") == "a\\\\b\\\"c\\nd");
}

BOOST_AUTO_TEST_CASE(respond_routes_requests)
{
    auto acct = make_account("a@b.c");
    const std::vector<const account*> accounts{&acct};

    const auto ok = mailmirror::metrics::respond("GET /metrics HTTP/1.1\r\nHost: x\r\n\r\n", accounts);
    BOOST_TEST(ok.rfind("HTTP/1.0 200 OK\r\n", 0) == 0u);
    BOOST_TEST(contains(ok, "Content-Type: text/plain; version=0.0.4\r\n"));
    BOOST_TEST(contains(ok, "mail_account_state{name=\"a@b.c\"} 0\n"));

    const auto head = mailmirror::metrics::respond("HEAD /metrics HTTP/1.1\r\n\r\n", accounts);
    BOOST_TEST(head.rfind("HTTP/1.0 200 OK\r\n", 0) == 0u);
    BOOST_TEST(head.substr(head.size() - 4) == "\r\n\r\n");

    const auto missing = mailmirror::metrics::respond("GET / HTTP/1.1\r\n\r\n", accounts);
    BOOST_TEST(missing.rfind("HTTP/1.0 404 Not Found\r\n", 0) == 0u);

    const auto post = mailmirror::metrics::respond("POST /metrics HTTP/1.1\r\n\r\n", accounts);
    BOOST_TEST(post.rfind("HTTP/1.0 405 Method Not Allowed\r\n", 0) == 0u);

    const auto garbage = mailmirror::metrics::respond("nonsense", accounts);
    BOOST_TEST(garbage.rfind("HTTP/1.0 405", 0) == 0u);
}

BOOST_AUTO_TEST_CASE(serves_over_tcp)
{
    auto acct = make_account("a@b.c");
    acct.add_processed(2);

    asio::io_context ctx;
    mailmirror::metrics::exporter exporter(ctx.get_executor(), {&acct});
    auto opened = exporter.open("127.0.0.1:0");
    BOOST_REQUIRE(opened.has_value());
    const unsigned short port = exporter.port();
    BOOST_REQUIRE(port != 0);

    std::stop_source stop;
    asio::co_spawn(ctx, exporter.serve(stop.get_token()), asio::detached);

    auto fut = asio::co_spawn(ctx,
        [&]() -> asio::awaitable<std::string>
        {
            asio::tcp::socket socket(ctx);
            asio::error_code ec;
            co_await socket.async_connect(asio::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port),
                asio::redirect_error(asio::use_awaitable, ec));
            std::string reply;
            if (!ec)
            {
                const std::string request = "GET /metrics HTTP/1.0\r\n\r\n";
                co_await asio::async_write(socket, asio::buffer(request), asio::redirect_error(asio::use_awaitable, ec));
                co_await asio::async_read(socket, asio::dynamic_buffer(reply),
                    asio::redirect_error(asio::use_awaitable, ec));
            }
            stop.request_stop();
            co_return reply;
        }, asio::use_future);

    ctx.run();
    const std::string reply = fut.get();
    BOOST_TEST(reply.rfind("HTTP/1.0 200 OK\r\n", 0) == 0u);
    BOOST_TEST(contains(reply, "mail_account_messages_total{name=\"a@b.c\"} 2\n"));
}

BOOST_AUTO_TEST_CASE(silent_client_does_not_block_scrapes_or_stop)
{
    auto acct = make_account("a@b.c");

    asio::io_context ctx;
    mailmirror::metrics::exporter exporter(ctx.get_executor(), {&acct});
    BOOST_REQUIRE(exporter.open("127.0.0.1:0").has_value());
    const asio::tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), exporter.port());

    std::stop_source stop;
    auto served = asio::co_spawn(ctx, exporter.serve(stop.get_token()), asio::use_future);

    auto fut = asio::co_spawn(ctx,
        [&]() -> asio::awaitable<std::string>
        {
            asio::error_code ec;
            asio::tcp::socket silent(ctx);
            co_await silent.async_connect(endpoint, asio::redirect_error(asio::use_awaitable, ec));

            asio::tcp::socket scraper(ctx);
            std::string reply;
            co_await scraper.async_connect(endpoint, asio::redirect_error(asio::use_awaitable, ec));
            if (!ec)
            {
                const std::string request = "GET /metrics HTTP/1.0\r\n\r\n";
                co_await asio::async_write(scraper, asio::buffer(request), asio::redirect_error(asio::use_awaitable, ec));
                co_await asio::async_read(scraper, asio::dynamic_buffer(reply),
                    asio::redirect_error(asio::use_awaitable, ec));
            }
            stop.request_stop();
            co_return reply;
        }, asio::use_future);

    ctx.run_for(std::chrono::seconds(3));
    BOOST_REQUIRE(fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    BOOST_TEST(fut.get().rfind("HTTP/1.0 200 OK\r\n", 0) == 0u);
    BOOST_TEST((served.wait_for(std::chrono::seconds(0)) == std::future_status::ready));
    BOOST_TEST(ctx.stopped());
}
