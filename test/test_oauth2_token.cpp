/*

test_oauth2_token.cpp
---------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE oauth2_token_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <string>

#include <mailmirror/detail/json.hpp>
#include <mailmirror/oauth2/curl_authorization_server.hpp>
#include <mailmirror/oauth2/provider.hpp>
#include <mailmirror/oauth2/token.hpp>


using mailmirror::oauth2::clock_type;

namespace
{

clock_type::time_point at_epoch_seconds(long long seconds)
{
    return clock_type::time_point(std::chrono::seconds{seconds});
}

}


BOOST_AUTO_TEST_CASE(token_validity_honours_skew)
{
    const auto now = clock_type::now();
    mailmirror::oauth2::token tok{"access", "Bearer", "refresh", now + std::chrono::seconds{30}};
    BOOST_TEST(tok.valid(now));

    tok.expiry = now + std::chrono::seconds{5};
    BOOST_TEST(!tok.valid(now));

    tok.expiry.reset();
    BOOST_TEST(tok.valid(now));

    tok.access_token.clear();
    BOOST_TEST(!tok.valid(now));
}

BOOST_AUTO_TEST_CASE(rfc3339_format_trims_fraction)
{
    BOOST_TEST(mailmirror::oauth2::format_rfc3339(at_epoch_seconds(1700000000)) == "2023-11-14T22:13:20Z");
    const auto with_fraction = at_epoch_seconds(1700000000) + std::chrono::milliseconds{500};
    BOOST_TEST(mailmirror::oauth2::format_rfc3339(with_fraction) == "2023-11-14T22:13:20.5Z");
}

BOOST_AUTO_TEST_CASE(rfc3339_parse_offset)
{
    auto parsed = mailmirror::oauth2::parse_rfc3339("2023-11-14T23:13:20+01:00");
    BOOST_REQUIRE(parsed.has_value());
    BOOST_REQUIRE(parsed->has_value());
    BOOST_TEST((**parsed == at_epoch_seconds(1700000000)));
}

BOOST_AUTO_TEST_CASE(rfc3339_zero_time_means_no_expiry)
{
    auto parsed = mailmirror::oauth2::parse_rfc3339("0001-01-01T00:00:00Z");
    BOOST_REQUIRE(parsed.has_value());
    BOOST_TEST(!parsed->has_value());
}

BOOST_AUTO_TEST_CASE(rfc3339_rejects_garbage)
{
    auto parsed = mailmirror::oauth2::parse_rfc3339("tomorrow");
    BOOST_REQUIRE(!parsed.has_value());
    BOOST_TEST(parsed.error().code == mailmirror::errc::codec_invalid_input);
}

BOOST_AUTO_TEST_CASE(token_json_document)
{
    mailmirror::oauth2::token tok{"access", "Bearer", "refresh", at_epoch_seconds(1700000000)};
    auto doc = mailmirror::detail::parse_json(mailmirror::oauth2::to_json_string(tok));
    BOOST_REQUIRE(doc.has_value());
    BOOST_TEST((*doc)["access_token"].asString() == "access");
    BOOST_TEST((*doc)["token_type"].asString() == "Bearer");
    BOOST_TEST((*doc)["refresh_token"].asString() == "refresh");
    BOOST_TEST((*doc)["expiry"].asString() == "2023-11-14T22:13:20Z");

    mailmirror::oauth2::token bare{"access", {}, {}, std::nullopt};
    auto bare_doc = mailmirror::detail::parse_json(mailmirror::oauth2::to_json_string(bare));
    BOOST_REQUIRE(bare_doc.has_value());
    BOOST_TEST(!bare_doc->isMember("refresh_token"));
    BOOST_TEST((*bare_doc)["expiry"].asString() == "0001-01-01T00:00:00Z");
}

BOOST_AUTO_TEST_CASE(token_from_stored_document)
{
    auto tok = mailmirror::oauth2::token_from_json(
        R"({"access_token":"a","refresh_token":"r","expiry":"2023-11-14T22:13:20.25Z","extra":1})");
    BOOST_REQUIRE(tok.has_value());
    BOOST_TEST(tok->access_token == "a");
    BOOST_TEST(tok->refresh_token == "r");
    BOOST_REQUIRE(tok->expiry.has_value());
    BOOST_TEST((*tok->expiry == at_epoch_seconds(1700000000) + std::chrono::milliseconds{250}));

    auto wrong = mailmirror::oauth2::token_from_json(R"({"access_token":42})");
    BOOST_REQUIRE(!wrong.has_value());
    BOOST_TEST(wrong.error().code == mailmirror::errc::codec_invalid_input);
}

BOOST_AUTO_TEST_CASE(default_provider_table)
{
    const auto table = mailmirror::oauth2::default_providers();
    auto found = mailmirror::oauth2::find_provider(table, "microsoft");
    BOOST_REQUIRE(found.has_value());
    BOOST_TEST(mailmirror::oauth2::scope_string(*found)
        == "https://outlook.office.com/IMAP.AccessAsUser.All offline_access");

    auto missing = mailmirror::oauth2::find_provider(table, "google");
    BOOST_REQUIRE(!missing.has_value());
    BOOST_TEST(missing.error().code == mailmirror::errc::oauth2_unknown_provider);
}

BOOST_AUTO_TEST_CASE(device_challenge_accepts_verification_url)
{
    auto doc = mailmirror::detail::parse_json(
        R"({"device_code":"dc","user_code":"ABCD-EFGH","verification_url":"https://example.com/device","expires_in":900,"interval":5})");
    BOOST_REQUIRE(doc.has_value());
    auto challenge = mailmirror::oauth2::detail::parse_device_challenge(*doc);
    BOOST_REQUIRE(challenge.has_value());
    BOOST_TEST(challenge->user_code == "ABCD-EFGH");
    BOOST_TEST(challenge->verification_uri == "https://example.com/device");
    BOOST_TEST(challenge->expires_in.count() == 900);
    BOOST_TEST(challenge->interval.count() == 5);
}

BOOST_AUTO_TEST_CASE(device_challenge_incomplete)
{
    auto doc = mailmirror::detail::parse_json(R"({"error":"invalid_client","error_description":"bad id"})");
    BOOST_REQUIRE(doc.has_value());
    auto challenge = mailmirror::oauth2::detail::parse_device_challenge(*doc);
    BOOST_REQUIRE(!challenge.has_value());
    BOOST_TEST(challenge.error().code == mailmirror::errc::oauth2_invalid_response);
    BOOST_TEST(challenge.error().detail.find("oauth2.error=invalid_client") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(token_response_expiry_is_relative)
{
    const auto now = at_epoch_seconds(1700000000);
    auto doc = mailmirror::detail::parse_json(
        R"({"access_token":"a","token_type":"Bearer","refresh_token":"r","expires_in":3600})");
    BOOST_REQUIRE(doc.has_value());
    auto tok = mailmirror::oauth2::detail::parse_token_response(*doc, now);
    BOOST_REQUIRE(tok.has_value());
    BOOST_REQUIRE(tok->expiry.has_value());
    BOOST_TEST((*tok->expiry == now + std::chrono::hours{1}));
    BOOST_TEST(tok->refresh_token == "r");
}
