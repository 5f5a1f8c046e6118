/*

test_imap_parse.cpp
-------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE imap_parse_test

#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailmirror/detail/sasl.hpp>
#include <mailmirror/imap/fetch_parser.hpp>
#include <mailmirror/imap/seq_set.hpp>
#include <mailmirror/imap/types.hpp>


using mailmirror::imap::event_kind;


BOOST_AUTO_TEST_CASE(seq_set_collapses_ranges)
{
    mailmirror::imap::seq_set set;
    for (std::uint32_t uid : {7u, 1u, 2u, 3u, 9u, 10u})
        set.add(uid);
    set.add(0);
    BOOST_TEST(set.size() == 6u);
    BOOST_TEST(set.str() == "1:3,7,9:10");
}

BOOST_AUTO_TEST_CASE(seq_set_full_range)
{
    mailmirror::imap::seq_set set;
    set.add_range(1, 4);
    BOOST_TEST(set.str() == "1:4");
    BOOST_TEST(mailmirror::imap::seq_set{}.empty());
}

BOOST_AUTO_TEST_CASE(fetch_record_with_literal_body)
{
    mailmirror::imap::fetch_record record{
        "* 2 FETCH (UID 42 FLAGS (\\Seen $Label1) INTERNALDATE \"17-Jul-1996 02:44:25 -0700\" BODY[] {11})",
        {"hello world"}};

    auto parsed = mailmirror::imap::parse_fetch_record(record);
    BOOST_REQUIRE(parsed.has_value());
    BOOST_REQUIRE(parsed->has_value());
    const auto& msg = **parsed;
    BOOST_TEST(msg.seq == 2u);
    BOOST_TEST(msg.uid == 42u);
    BOOST_TEST(msg.flags == (std::vector<std::string>{"\\Seen", "$Label1"}), boost::test_tools::per_element());
    BOOST_TEST(msg.internal_date == "17-Jul-1996 02:44:25 -0700");
    BOOST_TEST(msg.body == "hello world");
}

BOOST_AUTO_TEST_CASE(fetch_record_without_body_is_skipped)
{
    mailmirror::imap::fetch_record record{"* 3 FETCH (FLAGS (\\Deleted))", {}};
    auto parsed = mailmirror::imap::parse_fetch_record(record);
    BOOST_REQUIRE(parsed.has_value());
    BOOST_TEST(!parsed->has_value());
}

BOOST_AUTO_TEST_CASE(fetch_record_malformed)
{
    mailmirror::imap::fetch_record record{"* x FETCH (UID 1", {}};
    auto parsed = mailmirror::imap::parse_fetch_record(record);
    BOOST_REQUIRE(!parsed.has_value());
    BOOST_TEST(parsed.error().code == mailmirror::errc::imap_parse_error);
}

BOOST_AUTO_TEST_CASE(fetch_record_body_needs_uid)
{
    mailmirror::imap::fetch_record record{"* 4 FETCH (BODY[] {2})", {"hi"}};
    auto parsed = mailmirror::imap::parse_fetch_record(record);
    BOOST_REQUIRE(!parsed.has_value());
    BOOST_TEST(parsed.error().code == mailmirror::errc::imap_parse_error);
    BOOST_TEST(parsed.error().detail.find("fetch.error=missing UID\n") != std::string::npos);

    mailmirror::imap::fetch_record zero{"* 4 FETCH (UID 0 BODY[] {2})", {"hi"}};
    BOOST_TEST(!mailmirror::imap::parse_fetch_record(zero).has_value());
}

BOOST_AUTO_TEST_CASE(classify_idle_updates)
{
    BOOST_TEST((mailmirror::imap::classify_untagged("* 4 EXISTS") == event_kind::mailbox_status));
    BOOST_TEST((mailmirror::imap::classify_untagged("* 1 RECENT") == event_kind::mailbox_status));
    BOOST_TEST((mailmirror::imap::classify_untagged("* FLAGS (\\Seen \\Deleted)") == event_kind::mailbox_status));
    BOOST_TEST((mailmirror::imap::classify_untagged("* 3 EXPUNGE") == event_kind::expunge));
    BOOST_TEST((mailmirror::imap::classify_untagged("* 2 FETCH (FLAGS (\\Seen))") == event_kind::message));
    BOOST_TEST((mailmirror::imap::classify_untagged("* OK Still here") == event_kind::status));
    BOOST_TEST((mailmirror::imap::classify_untagged("+ idling") == event_kind::other));
}

BOOST_AUTO_TEST_CASE(bye_detection)
{
    BOOST_TEST(mailmirror::imap::is_bye_line("* BYE server shutting down"));
    BOOST_TEST(!mailmirror::imap::is_bye_line("* OK BYE"));
}

BOOST_AUTO_TEST_CASE(sasl_xoauth2_encoding)
{
    const std::string encoded = mailmirror::sasl::encode_xoauth2("user@example.com", "token");
    auto decoded = mailmirror::detail::base64_decode(encoded);
    BOOST_REQUIRE(decoded.has_value());
    BOOST_TEST(*decoded == std::string("user=user@example.com\x01" "auth=Bearer token\x01\x01"));
}

BOOST_AUTO_TEST_CASE(sasl_xoauth2_error_challenge)
{
    const std::string challenge = mailmirror::detail::base64_encode(
        R"({"status":"401","schemes":"bearer","scope":"https://mail.google.com/"})");
    const auto decoded = mailmirror::sasl::decode_xoauth2_error(challenge);
    BOOST_TEST(decoded.status == "401");
    BOOST_TEST(decoded.schemes == "bearer");

    const auto err = mailmirror::sasl::make_xoauth2_error(decoded);
    BOOST_TEST(err.code == mailmirror::errc::sasl_xoauth2_error);
    BOOST_TEST(err.detail.find("xoauth2.scope=https://mail.google.com/") != std::string::npos);
}
