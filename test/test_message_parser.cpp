/*

test_message_parser.cpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE message_parser_test

#include <stdexcept>
#include <boost/test/unit_test.hpp>
#include <otpxx/fetch/message_parser.hpp>

using otpxx::candidate_message;
using otpxx::errc;
using otpxx::extraction_rule;
using otpxx::message_parser;
using otpxx::rule_scope;


BOOST_AUTO_TEST_CASE(code_in_body)
{
    message_parser parser;
    auto code = parser.extract("Verify your email", "Hello,\r\nYour verification code is: 482913\r\nThanks");
    BOOST_REQUIRE(code.has_value());
    BOOST_TEST(*code == "482913");

    auto upper = parser.extract("", "YOUR CODE IS 1234");
    BOOST_REQUIRE(upper.has_value());
    BOOST_TEST(*upper == "1234");
}

BOOST_AUTO_TEST_CASE(code_in_subject)
{
    message_parser parser;
    auto code = parser.extract("123456 \xE2\x80\x93 Your ChatGPT code", "Use 999999 if asked twice.");
    BOOST_REQUIRE(code.has_value());
    BOOST_TEST(*code == "123456");

    auto hyphen = parser.extract("654321 - your login code", "");
    BOOST_REQUIRE(hyphen.has_value());
    BOOST_TEST(*hyphen == "654321");
}

BOOST_AUTO_TEST_CASE(specific_phrasing_wins_over_bare_digits)
{
    message_parser parser;
    auto code = parser.extract("Login attempt", "Order 123456 shipped. Your login code is 9911.");
    BOOST_REQUIRE(code.has_value());
    BOOST_TEST(*code == "9911");

    auto enter = parser.extract("Sign in", "Enter this code to sign in:\r\n\r\n  5521");
    BOOST_REQUIRE(enter.has_value());
    BOOST_TEST(*enter == "5521");
}

BOOST_AUTO_TEST_CASE(non_breaking_space)
{
    message_parser parser;
    auto code = parser.extract("", "Code:\xC2\xA0 7788");
    BOOST_REQUIRE(code.has_value());
    BOOST_TEST(*code == "7788");

    BOOST_TEST(message_parser::normalize("  a\t\tb \xC2\xA0 c  ") == "a b c");
}

BOOST_AUTO_TEST_CASE(nothing_to_extract)
{
    message_parser parser;
    auto none = parser.extract("Welcome aboard", "Thanks for signing up. Ticket 1234567.");
    BOOST_REQUIRE(!none.has_value());
    BOOST_TEST(none.error().code == errc::otp_not_found);

    otpxx::candidate_message empty;
    BOOST_TEST(!parser.parse(empty).has_value());
}

BOOST_AUTO_TEST_CASE(custom_rules_and_scope)
{
    message_parser parser({{"ref", R"(ref-(\d+))", rule_scope::body}});
    auto code = parser.extract("ref-11", "see ref-22");
    BOOST_REQUIRE(code.has_value());
    BOOST_TEST(*code == "22");

    BOOST_TEST(!parser.extract("ref-11", "").has_value());
}

BOOST_AUTO_TEST_CASE(invalid_rules_throw)
{
    BOOST_CHECK_THROW(message_parser({{"broken", "(\\d+", rule_scope::any}}), std::invalid_argument);
    BOOST_CHECK_THROW(message_parser({{"no_group", "\\d{6}", rule_scope::any}}), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(service_link_before_generic_link)
{
    message_parser parser;
    candidate_message msg;
    msg.body = "Forgot your password? See https://help.svc.com/verify-later or "
        "https://accounts.spotify.com/en/password-reset/complete?flow_ctx=abc to choose a new one.";
    auto link = parser.find_link(msg);
    BOOST_REQUIRE(link.has_value());
    BOOST_TEST(*link == "https://accounts.spotify.com/en/password-reset/complete?flow_ctx=abc");
}

BOOST_AUTO_TEST_CASE(link_only_in_html)
{
    message_parser parser;
    candidate_message msg;
    msg.body = "Use the button below to confirm your address.";
    msg.html = R"(<p>Welcome</p><a href="https://app.svc.com/account/confirm?token=Zx9">Confirm</a>)";
    auto link = parser.find_link(msg);
    BOOST_REQUIRE(link.has_value());
    BOOST_TEST(*link == "https://app.svc.com/account/confirm?token=Zx9");

    msg.html.clear();
    BOOST_TEST(!parser.find_link(msg).has_value());
}

BOOST_AUTO_TEST_CASE(no_link)
{
    message_parser parser;
    candidate_message msg;
    msg.body = "Your code is 123456. Visit https://svc.com/help for support.";
    BOOST_TEST(!parser.find_link(msg).has_value());

    message_parser codes_only(otpxx::default_extraction_rules(), {});
    msg.body = "https://accounts.spotify.com/password-reset?x=1";
    BOOST_TEST(!codes_only.find_link(msg).has_value());
    BOOST_TEST(codes_only.link_rules().empty());
}

BOOST_AUTO_TEST_CASE(invalid_link_rule_throws)
{
    BOOST_CHECK_THROW(message_parser(otpxx::default_extraction_rules(), {{"broken", "(https://", rule_scope::body}}),
        std::invalid_argument);
}
