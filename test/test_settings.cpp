/*

test_settings.cpp
-----------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE settings_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <string>

#include <mailmirror/config/settings.hpp>


using mailmirror::config::parse_settings;
using mailmirror::errc;

namespace
{

const std::string MINIMAL = R"({
    "accounts": [
        {
            "name": "john.doe@example.com",
            "source": {"server": "imap.source.example:993", "username": "john", "password": "secret"},
            "target": {"server": "imap.target.example:993", "username": "john", "password": "secret",
                       "mailbox": "Archive"}
        }
    ]
})";

bool names_key(const mailmirror::error_info& err, const std::string& key)
{
    return err.detail.find("key=" + key + "\n") != std::string::npos;
}

}


BOOST_AUTO_TEST_CASE(minimal_document_uses_defaults)
{
    auto res = parse_settings(MINIMAL);
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST((res->log.level == mailmirror::log::level::info));
    BOOST_TEST(!res->log.trace);
    BOOST_TEST(!res->metrics_listen.has_value());
    BOOST_TEST(!res->broker.has_value());
    BOOST_TEST(res->providers.count("microsoft") == 1u);

    BOOST_REQUIRE(res->accounts.size() == 1u);
    const auto& acct = res->accounts[0];
    BOOST_TEST(acct.name == "john.doe@example.com");
    BOOST_TEST(acct.source.store.mailbox == "INBOX");
    BOOST_TEST(acct.target.store.mailbox == "Archive");
    BOOST_TEST((acct.source.store.auth == mailmirror::sync::auth_mode::password));
    BOOST_TEST(acct.source.idle_fallback.count() == 0);
    BOOST_TEST(!acct.uses_oauth2());
}

BOOST_AUTO_TEST_CASE(full_document)
{
    const std::string text = R"({
        "log": {"level": "debug", "trace": true},
        "metrics": {"listen": "127.0.0.1:9100"},
        "broker": {"host": "mqtt.example", "tls": true, "client_id": "mailmirror", "username": "u", "password": "p"},
        "providers": {"microsoft": {"client_id": "custom-client"}},
        "accounts": [
            {
                "name": "jane@example.com",
                "source": {"server": "outlook.office365.com:993", "username": "jane", "auth": "oauth2",
                           "idle_fallback": 120},
                "target": {"server": "imap.target.example", "username": "jane", "password": "secret"}
            }
        ]
    })";

    auto res = parse_settings(text);
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST((res->log.level == mailmirror::log::level::debug));
    BOOST_TEST(res->log.trace);
    BOOST_TEST(res->metrics_listen.value_or("") == "127.0.0.1:9100");

    BOOST_REQUIRE(res->broker.has_value());
    BOOST_TEST(res->broker->port == "8883");
    BOOST_TEST(res->broker->client_id == "mailmirror");

    const auto& ms = res->providers.at("microsoft");
    BOOST_TEST(ms.client_id == "custom-client");
    BOOST_TEST(!ms.token_url.empty());

    const auto& acct = res->accounts.at(0);
    BOOST_TEST(acct.uses_oauth2());
    BOOST_TEST(acct.source.store.provider == "microsoft");
    BOOST_TEST(acct.source.idle_fallback.count() == 120);
}

BOOST_AUTO_TEST_CASE(plain_broker_defaults_to_1883)
{
    const std::string text = R"({
        "broker": {"host": "mqtt.example", "client_id": "mailmirror"},
        "accounts": [
            {"name": "a", "source": {"server": "s", "username": "u", "password": "p"},
             "target": {"server": "t", "username": "u", "password": "p"}}
        ]
    })";
    auto res = parse_settings(text);
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(res->broker->port == "1883");
    BOOST_TEST(!res->broker->tls);
}

BOOST_AUTO_TEST_CASE(missing_key_names_its_path)
{
    const std::string text = R"({
        "accounts": [
            {"name": "a", "source": {"server": "s", "username": "u", "password": "p"},
             "target": {"server": "t", "password": "p"}}
        ]
    })";
    auto res = parse_settings(text);
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code == errc::config_invalid);
    BOOST_TEST(names_key(res.error(), "accounts[0].target.username"));
}

BOOST_AUTO_TEST_CASE(oauth2_requires_broker)
{
    const std::string text = R"({
        "accounts": [
            {"name": "a", "source": {"server": "s", "username": "u", "auth": "oauth2"},
             "target": {"server": "t", "username": "u", "password": "p"}}
        ]
    })";
    auto res = parse_settings(text);
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(names_key(res.error(), "broker"));
}

BOOST_AUTO_TEST_CASE(rejected_documents)
{
    auto not_json = parse_settings("{ accounts: ");
    BOOST_REQUIRE(!not_json.has_value());
    BOOST_TEST(not_json.error().code == errc::config_invalid);

    auto no_accounts = parse_settings(R"({"accounts": []})");
    BOOST_REQUIRE(!no_accounts.has_value());
    BOOST_TEST(names_key(no_accounts.error(), "accounts"));

    auto bad_level = parse_settings(R"({"log": {"level": "chatty"}, "accounts": []})");
    BOOST_REQUIRE(!bad_level.has_value());
    BOOST_TEST(names_key(bad_level.error(), "log.level"));

    auto bad_auth = parse_settings(R"({"accounts": [
        {"name": "a", "source": {"server": "s", "username": "u", "auth": "kerberos"},
         "target": {"server": "t", "username": "u", "password": "p"}}]})");
    BOOST_REQUIRE(!bad_auth.has_value());
    BOOST_TEST(names_key(bad_auth.error(), "accounts[0].source.auth"));

    auto unknown_provider = parse_settings(R"({"broker": {"host": "h", "client_id": "c"}, "accounts": [
        {"name": "a", "source": {"server": "s", "username": "u", "auth": "oauth2", "provider": "google"},
         "target": {"server": "t", "username": "u", "password": "p"}}]})");
    BOOST_REQUIRE(!unknown_provider.has_value());
    BOOST_TEST(names_key(unknown_provider.error(), "accounts[0].source.provider"));

    auto bad_port = parse_settings(R"({"broker": {"host": "h", "port": 70000, "client_id": "c"}, "accounts": []})");
    BOOST_REQUIRE(!bad_port.has_value());
    BOOST_TEST(names_key(bad_port.error(), "broker.port"));
}

BOOST_AUTO_TEST_CASE(duplicate_account_names)
{
    const std::string text = R"({
        "accounts": [
            {"name": "a", "source": {"server": "s", "username": "u", "password": "p"},
             "target": {"server": "t", "username": "u", "password": "p"}},
            {"name": "a", "source": {"server": "s2", "username": "u", "password": "p"},
             "target": {"server": "t2", "username": "u", "password": "p"}}
        ]
    })";
    auto res = parse_settings(text);
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(names_key(res.error(), "accounts[1].name"));
}

BOOST_AUTO_TEST_CASE(account_names_with_same_topic_key)
{
    const std::string text = R"({
        "accounts": [
            {"name": "a@b", "source": {"server": "s", "username": "u", "password": "p"},
             "target": {"server": "t", "username": "u", "password": "p"}},
            {"name": "a.b", "source": {"server": "s2", "username": "u", "password": "p"},
             "target": {"server": "t2", "username": "u", "password": "p"}}
        ]
    })";
    auto res = parse_settings(text);
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code == errc::config_invalid);
    BOOST_TEST(names_key(res.error(), "accounts[1].name"));
    BOOST_TEST(res.error().message.find("\"a.b\" collides with account \"a@b\"") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(missing_file)
{
    auto res = mailmirror::config::load_settings("/nonexistent/mailmirror.json");
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code == errc::config_invalid);
}
