/*

test_sanitize.cpp
-----------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE sanitize_test

#include <boost/test/unit_test.hpp>
#include <string>
#include <otpxx/detail/redact.hpp>
#include <otpxx/detail/sanitize.hpp>


BOOST_AUTO_TEST_CASE(reject_line_breaks_and_nul)
{
    BOOST_TEST(otpxx::detail::ensure_no_crlf_or_nul("noreply@openai.com", "sender").has_value());

    auto crlf = otpxx::detail::ensure_no_crlf_or_nul("a\r\nb", "sender");
    BOOST_REQUIRE(!crlf.has_value());
    BOOST_TEST(crlf.error().code == otpxx::errc::invalid_argument);
    BOOST_TEST(crlf.error().message == "Invalid sender: CR/LF or NUL not allowed.");

    const std::string with_nul("a\0b", 3);
    BOOST_TEST(!otpxx::detail::ensure_no_crlf_or_nul(with_nul, nullptr).has_value());
}

BOOST_AUTO_TEST_CASE(redact_login)
{
    BOOST_TEST(otpxx::detail::redact_line("a1 LOGIN \"user\" \"pass\"\r\n") == "a1 LOGIN \"user\" <redacted>\r\n");
    BOOST_TEST(otpxx::detail::redact_line("a1 login user pass") == "a1 login user <redacted>");
}

BOOST_AUTO_TEST_CASE(redact_authenticate)
{
    BOOST_TEST(otpxx::detail::redact_line("a2 AUTHENTICATE PLAIN AHVzZXIAcGFzc3dvcmQ=") ==
        "a2 AUTHENTICATE PLAIN <redacted>");
    BOOST_TEST(otpxx::detail::redact_line("dXNlckBleGFtcGxlLmNvbQ==") == "<redacted>");
}

BOOST_AUTO_TEST_CASE(leave_other_commands)
{
    BOOST_TEST(otpxx::detail::redact_line("a3 UID SEARCH UNSEEN") == "a3 UID SEARCH UNSEEN");
    BOOST_TEST(otpxx::detail::redact_line("a4 AUTHENTICATE XOAUTH2") == "a4 AUTHENTICATE XOAUTH2");
    BOOST_TEST(otpxx::detail::redact_line("short") == "short");
    BOOST_TEST(otpxx::detail::redact_line("").empty());
}
