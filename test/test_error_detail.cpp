/*

test_error_detail.cpp
---------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE error_detail_test

#include <boost/test/unit_test.hpp>

#include <string>

#include <mailmirror/detail/error_detail.hpp>
#include <mailmirror/detail/result.hpp>


BOOST_AUTO_TEST_CASE(error_detail_key_value_lines)
{
    mailmirror::detail::error_detail detail;
    detail.add("key", "accounts[0].name").add_int("http.status", 400);
    BOOST_TEST(detail.str() == "key=accounts[0].name\nhttp.status=400\n");
}

BOOST_AUTO_TEST_CASE(error_detail_redacts_login)
{
    mailmirror::detail::error_detail detail;
    detail.add_redacted("line", "A1 LOGIN user secret");
    BOOST_TEST(detail.str() == "line=A1 LOGIN user <redacted>\n");
}

BOOST_AUTO_TEST_CASE(error_detail_merge_prefixes_entries)
{
    mailmirror::detail::error_detail detail;
    detail.merge("cause.", "imap.command=SELECT\nimap.status=NO\n");
    BOOST_TEST(detail.str() == "cause.imap.command=SELECT\ncause.imap.status=NO\n");
}

BOOST_AUTO_TEST_CASE(nest_error_wraps_protocol_failure)
{
    auto cause = mailmirror::make_error(mailmirror::errc::imap_tagged_no, "mailbox does not exist", "imap.command=SELECT\n");
    auto err = mailmirror::nest_error(mailmirror::errc::store_failed, "cannot select Archive", cause);

    BOOST_TEST(err.code == mailmirror::errc::store_failed);
    BOOST_TEST(err.message == "cannot select Archive: mailbox does not exist");
    BOOST_TEST(err.detail == "cause=imap_tagged_no\ncause.imap.command=SELECT\n");
}

BOOST_AUTO_TEST_CASE(nest_error_keeps_engine_kind)
{
    auto cause = mailmirror::make_error(mailmirror::errc::auth_failed, "no token");
    auto err = mailmirror::nest_error(mailmirror::errc::connection_failed, "source", cause);
    BOOST_TEST(err.code == mailmirror::errc::auth_failed);
    BOOST_TEST(err.message == "no token");
}

BOOST_AUTO_TEST_CASE(format_error_names_kind)
{
    auto err = mailmirror::make_error(mailmirror::errc::cleanup_failed, "cannot flag messages as deleted");
    BOOST_TEST(mailmirror::format_error(err) == "cleanup_failed: cannot flag messages as deleted");
}
