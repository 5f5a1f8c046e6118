/*

test_redact.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE redact_test

#include <boost/test/unit_test.hpp>
#include <mailmirror/detail/redact.hpp>


BOOST_AUTO_TEST_CASE(redact_login)
{
    BOOST_TEST(mailmirror::detail::redact_line("A1 LOGIN user pass\r\n") == "A1 LOGIN user <redacted>\r\n");
}

BOOST_AUTO_TEST_CASE(redact_authenticate_initial_response)
{
    BOOST_TEST(mailmirror::detail::redact_line("A2 AUTHENTICATE XOAUTH2 dXNlcj1hQGIuYwFhdXRo")
        == "A2 AUTHENTICATE XOAUTH2 <redacted>");
}

BOOST_AUTO_TEST_CASE(redact_bare_sasl_continuation)
{
    BOOST_TEST(mailmirror::detail::redact_line("dXNlcj1hQGIuYwFhdXRoPUJlYXJlcg==") == "<redacted>");
}

BOOST_AUTO_TEST_CASE(keep_ordinary_commands)
{
    BOOST_TEST(mailmirror::detail::redact_line("A3 SELECT INBOX") == "A3 SELECT INBOX");
    BOOST_TEST(mailmirror::detail::redact_line("DONE") == "DONE");
}
