/*

test_folder_scanner.cpp
-----------------------

Search criteria and candidate selection for one folder.

*/

#define BOOST_TEST_MODULE folder_scanner_test

#include <boost/test/unit_test.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <otpxx/fetch/folder_scanner.hpp>
#include <otpxx/fetch/sender_presets.hpp>
#include "fake_mailbox.hpp"

using namespace otpxx;

namespace
{

const auto BASE_TIME = std::chrono::sys_days{std::chrono::year{2024} / std::chrono::January / 2};

fake::mail otp_mail(const std::string& from, const std::string& code, int minute)
{
    fake::mail m;
    m.from = from;
    m.to = "me@example.com";
    m.subject = "Your verification code";
    m.body = "Your verification code is " + code;
    m.received = BASE_TIME + std::chrono::minutes{minute};
    return m;
}

/// Run one scan on a fresh session and return its outcome.
result<std::vector<otp_candidate>> run_scan(std::shared_ptr<fake::mailbox> box, const std::string& folder,
    const scan_filter& filter)
{
    asio::io_context ctx;
    message_parser parser;
    folder_scanner scanner(parser);
    fake::session session(box, "user@example.com");
    std::optional<result<std::vector<otp_candidate>>> outcome;

    asio::co_spawn(ctx,
        [&]() -> asio::awaitable<void>
        {
            outcome = co_await scanner.scan(session, folder, filter);
        },
        asio::detached);
    ctx.run();

    BOOST_REQUIRE(outcome.has_value());
    return std::move(*outcome);
}

scan_filter sender_filter(std::vector<std::string> senders)
{
    scan_filter filter;
    filter.senders = std::move(senders);
    return filter;
}

} // namespace


BOOST_AUTO_TEST_CASE(search_criteria)
{
    scan_filter filter;
    filter.senders = {"a@x.com", " b@y.com ", "c@z.com"};
    filter.recipient = "me@example.com";
    filter.since = std::chrono::system_clock::time_point{BASE_TIME + std::chrono::hours{13}};

    auto criteria = build_search_criteria(filter);
    BOOST_REQUIRE(criteria.has_value());
    BOOST_TEST(*criteria == "UNSEEN OR FROM \"a@x.com\" OR FROM \"b@y.com\" FROM \"c@z.com\" "
        "TO \"me@example.com\" SINCE 2-Jan-2024");

    auto single = build_search_criteria(sender_filter({"noreply@openai.com"}));
    BOOST_REQUIRE(single.has_value());
    BOOST_TEST(*single == "UNSEEN FROM \"noreply@openai.com\"");

    auto injected = build_search_criteria(sender_filter({"a@x.com\r\nA1 LOGOUT"}));
    BOOST_REQUIRE(!injected.has_value());
    BOOST_TEST(injected.error().code == errc::invalid_argument);
}

BOOST_AUTO_TEST_CASE(keeps_matching_unread_mail_with_a_code)
{
    auto box = std::make_shared<fake::mailbox>();
    box->add("INBOX", otp_mail("noreply@svc.com", "111111", 1));
    box->add("INBOX", otp_mail("promo@other.com", "222222", 2));
    auto seen = otp_mail("noreply@svc.com", "333333", 3);
    seen.seen = true;
    box->add("INBOX", seen);
    auto welcome = otp_mail("noreply@svc.com", "", 4);
    welcome.subject = "Welcome";
    welcome.body = "Thanks for joining.";
    box->add("INBOX", welcome);

    auto found = run_scan(box, "INBOX", sender_filter({"NoReply@svc.com"}));
    BOOST_REQUIRE(found.has_value());
    BOOST_REQUIRE(found->size() == 1u);
    const auto& candidate = (*found)[0];
    BOOST_TEST(candidate.otp == "111111");
    BOOST_TEST(candidate.folder == "INBOX");
    BOOST_TEST(candidate.uid == 1u);
    BOOST_TEST(candidate.subject == "Your verification code");
    BOOST_TEST((candidate.received_at == BASE_TIME + std::chrono::minutes{1}));

    BOOST_TEST(box->examines == 1);
    BOOST_TEST(box->searches == 1);
    BOOST_TEST(box->criteria[0] == "UNSEEN FROM \"NoReply@svc.com\"");
}

BOOST_AUTO_TEST_CASE(fetch_is_bounded_to_newest_messages)
{
    auto box = std::make_shared<fake::mailbox>();
    for (int i = 1; i <= 5; ++i)
        box->add("INBOX", otp_mail("noreply@svc.com", std::to_string(100000 + i), i));

    auto filter = sender_filter({"noreply@svc.com"});
    filter.limit = 2;
    auto found = run_scan(box, "INBOX", filter);
    BOOST_REQUIRE(found.has_value());
    BOOST_REQUIRE(found->size() == 2u);
    BOOST_TEST((*found)[0].uid == 4u);
    BOOST_TEST((*found)[1].uid == 5u);
    BOOST_TEST(box->largest_fetch == 2u);
}

BOOST_AUTO_TEST_CASE(recipient_filter)
{
    auto box = std::make_shared<fake::mailbox>();
    auto other = otp_mail("noreply@svc.com", "111111", 1);
    other.to = "someone@example.com";
    box->add("INBOX", other);
    box->add("INBOX", otp_mail("noreply@svc.com", "222222", 2));

    auto filter = sender_filter({"noreply@svc.com"});
    filter.recipient = "ME@example.com";
    auto found = run_scan(box, "INBOX", filter);
    BOOST_REQUIRE(found.has_value());
    BOOST_REQUIRE(found->size() == 1u);
    BOOST_TEST((*found)[0].otp == "222222");
}

BOOST_AUTO_TEST_CASE(domain_sender_entries)
{
    auto msg = mime::message::parse("From: Service <noreply@svc.com>\r\nTo: me@example.com\r\n\r\nbody");
    auto spoof = mime::message::parse("From: x@evilsvc.com\r\n\r\nbody");
    BOOST_REQUIRE(msg.has_value());
    BOOST_REQUIRE(spoof.has_value());

    const auto domain = sender_filter({"@svc.com"});
    BOOST_TEST(folder_scanner::matches_filter(*msg, domain));
    BOOST_TEST(!folder_scanner::matches_filter(*spoof, domain));
    BOOST_TEST(!folder_scanner::matches_filter(*msg, sender_filter({"other@svc.com"})));
    BOOST_TEST(folder_scanner::matches_filter(*msg, scan_filter{}));
}

BOOST_AUTO_TEST_CASE(missing_or_empty_folder)
{
    auto box = std::make_shared<fake::mailbox>();
    box->add_folder("Spam");

    auto missing = run_scan(box, "Archive", sender_filter({"noreply@svc.com"}));
    BOOST_REQUIRE(missing.has_value());
    BOOST_TEST(missing->empty());

    auto empty = run_scan(box, "Spam", sender_filter({"noreply@svc.com"}));
    BOOST_REQUIRE(empty.has_value());
    BOOST_TEST(empty->empty());
    BOOST_TEST(box->searches == 0);
}

BOOST_AUTO_TEST_CASE(connection_error_is_returned)
{
    auto box = std::make_shared<fake::mailbox>();
    box->add("INBOX", otp_mail("noreply@svc.com", "111111", 1));
    box->scan_failures = 1;

    auto failed = run_scan(box, "INBOX", sender_filter({"noreply@svc.com"}));
    BOOST_REQUIRE(!failed.has_value());
    BOOST_TEST(failed.error().code == errc::net_connection_reset);
}

BOOST_AUTO_TEST_CASE(subject_terms_in_search_criteria)
{
    auto login = sender_filter({"no-reply@spotify.com"});
    login.subjects = subjects_for_service("Spotify", fetch_kind::otp);
    auto criteria = build_search_criteria(login);
    BOOST_REQUIRE(criteria.has_value());
    BOOST_TEST(*criteria == "UNSEEN FROM \"no-reply@spotify.com\" OR SUBJECT \"login code\" SUBJECT \"Spotify login code\"");

    auto reset = sender_filter({"no-reply@spotify.com"});
    reset.subjects = subjects_for_service("spotify", fetch_kind::reset_link);
    criteria = build_search_criteria(reset);
    BOOST_REQUIRE(criteria.has_value());
    BOOST_TEST(*criteria == "UNSEEN FROM \"no-reply@spotify.com\" SUBJECT \"Reset your password\"");

    BOOST_TEST(subjects_for_service("canva", fetch_kind::otp).empty());
    BOOST_TEST(subjects_for_service("spotify", fetch_kind::both).empty());

    reset.subjects = {"Reset\r\nA1 LOGOUT"};
    BOOST_TEST(!build_search_criteria(reset).has_value());
}

BOOST_AUTO_TEST_CASE(kind_selects_codes_or_links)
{
    auto box = std::make_shared<fake::mailbox>();
    box->add("INBOX", otp_mail("noreply@svc.com", "111111", 1));
    auto reset = otp_mail("noreply@svc.com", "", 2);
    reset.subject = "Reset your password";
    reset.body = "Use the button below to choose a new password.";
    reset.html = R"(<a href="https://accounts.spotify.com/password-reset/complete?token=T1">Reset</a>)";
    box->add("INBOX", reset);

    auto filter = sender_filter({"noreply@svc.com"});
    auto codes = run_scan(box, "INBOX", filter);
    BOOST_REQUIRE(codes.has_value());
    BOOST_REQUIRE(codes->size() == 1u);
    BOOST_TEST((*codes)[0].otp == "111111");
    BOOST_TEST(!(*codes)[0].reset_link.has_value());

    filter.kind = fetch_kind::reset_link;
    auto links = run_scan(box, "INBOX", filter);
    BOOST_REQUIRE(links.has_value());
    BOOST_REQUIRE(links->size() == 1u);
    BOOST_TEST((*links)[0].uid == 2u);
    BOOST_TEST((*links)[0].otp.empty());
    BOOST_REQUIRE((*links)[0].reset_link.has_value());
    BOOST_TEST(*(*links)[0].reset_link == "https://accounts.spotify.com/password-reset/complete?token=T1");

    filter.kind = fetch_kind::both;
    auto either = run_scan(box, "INBOX", filter);
    BOOST_REQUIRE(either.has_value());
    BOOST_TEST(either->size() == 2u);
}

BOOST_AUTO_TEST_CASE(undated_message_counts_as_just_received)
{
    auto box = std::make_shared<fake::mailbox>();
    box->add("INBOX", otp_mail("noreply@svc.com", "111111", 1));
    auto undated = otp_mail("noreply@svc.com", "222222", 0);
    undated.received = {};
    box->add("INBOX", undated);

    const auto before = std::chrono::system_clock::now();
    auto found = run_scan(box, "INBOX", sender_filter({"noreply@svc.com"}));
    BOOST_REQUIRE(found.has_value());
    BOOST_REQUIRE(found->size() == 2u);
    BOOST_TEST((*found)[1].otp == "222222");
    BOOST_TEST(((*found)[1].received_at >= before));
    BOOST_TEST(earlier_candidate((*found)[0], (*found)[1]));
}
