/*

test_codec.cpp
--------------

Base64, quoted printable and RFC 2047 encoded word decoding.

*/

#define BOOST_TEST_MODULE codec_test

#include <boost/test/unit_test.hpp>
#include <string>
#include <otpxx/codec/base64.hpp>
#include <otpxx/codec/encoded_word.hpp>
#include <otpxx/codec/quoted_printable.hpp>

using namespace otpxx;


BOOST_AUTO_TEST_CASE(base64_encode_decode)
{
    BOOST_TEST(codec::base64_encode("hello") == "aGVsbG8=");
    BOOST_TEST(codec::base64_encode("").empty());

    auto wrapped = codec::base64_decode("aGVs\r\nbG8=");
    BOOST_REQUIRE(wrapped.has_value());
    BOOST_TEST(*wrapped == "hello");
}

BOOST_AUTO_TEST_CASE(base64_missing_padding)
{
    auto one = codec::base64_decode("aGVsbG8");
    BOOST_REQUIRE(one.has_value());
    BOOST_TEST(*one == "hello");

    auto two = codec::base64_decode("Zm9vYg");
    BOOST_REQUIRE(two.has_value());
    BOOST_TEST(*two == "foob");
}

BOOST_AUTO_TEST_CASE(base64_invalid_input)
{
    auto bad = codec::base64_decode("a$b=");
    BOOST_REQUIRE(!bad.has_value());
    BOOST_TEST(bad.error().code == errc::codec_invalid_input);
}

BOOST_AUTO_TEST_CASE(quoted_printable)
{
    BOOST_TEST(codec::decode_quoted_printable("Code=3A 482913=\r\n is valid") == "Code: 482913 is valid");
    BOOST_TEST(codec::decode_quoted_printable("=E2=80=93") == "\xE2\x80\x93");
    BOOST_TEST(codec::decode_quoted_printable("caf=c3=a9") == "caf\xC3\xA9");
    BOOST_TEST(codec::decode_quoted_printable("bad=ZZ end=") == "bad=ZZ end");
    BOOST_TEST(codec::decode_quoted_printable("a_b", true) == "a b");
    BOOST_TEST(codec::decode_quoted_printable("a_b") == "a_b");
}

BOOST_AUTO_TEST_CASE(encoded_words)
{
    BOOST_TEST(codec::decode_header_value("=?UTF-8?B?WW91ciBjb2Rl?=") == "Your code");
    BOOST_TEST(codec::decode_header_value("=?ISO-8859-1?Q?Caf=E9?= au lait") == "Caf\xC3\xA9 au lait");
    BOOST_TEST(codec::decode_header_value("=?utf-8?q?a?= =?utf-8?q?b?=") == "ab");
    BOOST_TEST(codec::decode_header_value("Code: =?utf-8?q?123_456?=") == "Code: 123 456");
}

BOOST_AUTO_TEST_CASE(malformed_encoded_words_are_kept)
{
    BOOST_TEST(codec::decode_header_value("plain subject") == "plain subject");
    BOOST_TEST(codec::decode_header_value("=?bogus?=") == "=?bogus?=");
    BOOST_TEST(codec::decode_header_value("=?utf-8?X?abc?=") == "=?utf-8?X?abc?=");
}
