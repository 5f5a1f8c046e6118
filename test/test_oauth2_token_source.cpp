/*

test_oauth2_token_source.cpp
----------------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE oauth2_token_source_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <mailmirror/oauth2/token_source.hpp>


namespace asio = mailmirror::asio;
using mailmirror::oauth2::clock_type;
using mailmirror::oauth2::device_challenge;
using mailmirror::oauth2::provider;
using mailmirror::oauth2::token;

namespace
{

class recording_backend : public mailmirror::oauth2::token_backend
{
public:
    asio::awaitable<mailmirror::result<std::optional<token>>> load_token(std::stop_token) override
    {
        calls.push_back("load");
        if (load_error)
            co_return mailmirror::fail<std::optional<token>>(*load_error);
        co_return mailmirror::ok(stored);
    }

    asio::awaitable<mailmirror::result_void> save_token(const token& tok) override
    {
        calls.push_back("save");
        saved.push_back(tok);
        co_return mailmirror::ok();
    }

    asio::awaitable<mailmirror::result_void> notify(const device_challenge& challenge) override
    {
        calls.push_back("notify " + challenge.user_code);
        co_return mailmirror::ok();
    }

    std::optional<token> stored;
    std::optional<mailmirror::error_info> load_error;
    std::vector<token> saved;
    std::vector<std::string> calls;
};

class scripted_server : public mailmirror::oauth2::authorization_server
{
public:
    asio::awaitable<mailmirror::result<device_challenge>> device_auth(const provider& p) override
    {
        calls.push_back("device_auth " + p.name);
        device_challenge challenge;
        challenge.device_code = "device";
        challenge.user_code = "ABCD-EFGH";
        challenge.verification_uri = "https://microsoft.com/devicelogin";
        challenge.expires_in = std::chrono::seconds{900};
        challenge.interval = std::chrono::seconds{5};
        co_return mailmirror::ok(challenge);
    }

    asio::awaitable<mailmirror::result<token>> device_access_token(const provider&,
        const device_challenge& challenge, std::stop_token) override
    {
        calls.push_back("device_access_token " + challenge.device_code);
        if (deny)
            co_return mailmirror::fail<token>(mailmirror::errc::oauth2_access_denied, "user declined");
        co_return mailmirror::ok(token{"granted", "Bearer", "refresh-1", clock_type::now() + std::chrono::hours{1}});
    }

    asio::awaitable<mailmirror::result<token>> refresh(const provider&, const std::string& refresh_token) override
    {
        calls.push_back("refresh " + refresh_token);
        co_return mailmirror::ok(refreshed);
    }

    bool deny = false;
    token refreshed{"refreshed", "Bearer", "", clock_type::now() + std::chrono::hours{1}};
    std::vector<std::string> calls;
};

struct fixture
{
    std::shared_ptr<recording_backend> backend = std::make_shared<recording_backend>();
    std::shared_ptr<scripted_server> server = std::make_shared<scripted_server>();

    mailmirror::result<token> fetch(std::string provider_name = "microsoft")
    {
        mailmirror::oauth2::token_source source(server, backend, mailmirror::oauth2::default_providers(),
            std::move(provider_name), "john.doe@example.com");
        asio::io_context ctx;
        auto fut = asio::co_spawn(ctx,
            [&]() -> asio::awaitable<mailmirror::result<token>>
            {
                co_return co_await source.token(std::stop_token{});
            }, asio::use_future);
        ctx.run();
        return fut.get();
    }
};

}


BOOST_FIXTURE_TEST_CASE(valid_stored_token_is_used_as_is, fixture)
{
    backend->stored = token{"cached", "Bearer", "refresh-0", clock_type::now() + std::chrono::minutes{30}};

    auto res = fetch();
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(res->access_token == "cached");
    BOOST_TEST(server->calls.empty());
    BOOST_TEST(backend->calls == (std::vector<std::string>{"load", "save"}), boost::test_tools::per_element());
}

BOOST_FIXTURE_TEST_CASE(missing_token_starts_device_authorization, fixture)
{
    auto res = fetch();
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(res->access_token == "granted");
    BOOST_TEST(server->calls == (std::vector<std::string>{"device_auth microsoft", "device_access_token device"}),
        boost::test_tools::per_element());
    BOOST_TEST(backend->calls == (std::vector<std::string>{"load", "notify ABCD-EFGH", "save"}),
        boost::test_tools::per_element());
    BOOST_REQUIRE(backend->saved.size() == 1u);
    BOOST_TEST(backend->saved[0].refresh_token == "refresh-1");
}

BOOST_FIXTURE_TEST_CASE(expired_token_is_refreshed_keeping_refresh_token, fixture)
{
    backend->stored = token{"stale", "Bearer", "refresh-0", clock_type::now() - std::chrono::minutes{1}};

    auto res = fetch();
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(res->access_token == "refreshed");
    BOOST_TEST(res->refresh_token == "refresh-0");
    BOOST_TEST(server->calls == (std::vector<std::string>{"refresh refresh-0"}), boost::test_tools::per_element());
    BOOST_REQUIRE(backend->saved.size() == 1u);
    BOOST_TEST(backend->saved[0].access_token == "refreshed");
}

BOOST_FIXTURE_TEST_CASE(token_within_skew_counts_as_expired, fixture)
{
    backend->stored = token{"almost", "Bearer", "refresh-0", clock_type::now() + std::chrono::seconds{3}};

    auto res = fetch();
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(res->access_token == "refreshed");
}

BOOST_FIXTURE_TEST_CASE(refresh_returning_expired_token_fails, fixture)
{
    backend->stored = token{"stale", "Bearer", "refresh-0", clock_type::now() - std::chrono::minutes{1}};
    server->refreshed.expiry = clock_type::now() - std::chrono::minutes{1};

    auto res = fetch();
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code == mailmirror::errc::auth_failed);
    BOOST_TEST(backend->saved.empty());
}

BOOST_FIXTURE_TEST_CASE(denied_authorization_is_auth_failed, fixture)
{
    server->deny = true;

    auto res = fetch();
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code == mailmirror::errc::auth_failed);
    BOOST_TEST(res.error().detail.find("cause=oauth2_access_denied") != std::string::npos);
    BOOST_TEST(backend->saved.empty());
}

BOOST_FIXTURE_TEST_CASE(unknown_provider_is_auth_failed, fixture)
{
    auto res = fetch("google");
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code == mailmirror::errc::auth_failed);
    BOOST_TEST(backend->calls.empty());
}

BOOST_FIXTURE_TEST_CASE(broker_failure_is_passed_through, fixture)
{
    backend->load_error = mailmirror::make_error(mailmirror::errc::broker_failed, "broker connection failed");

    auto res = fetch();
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code == mailmirror::errc::broker_failed);
    BOOST_TEST(server->calls.empty());
}
