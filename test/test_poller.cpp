/*

test_poller.cpp
---------------

Rounds, deadlines, caching and request sharing of the poller, against an
in-memory mailbox.

*/

#define BOOST_TEST_MODULE poller_test

#include <boost/test/unit_test.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <otpxx/fetch/poller.hpp>
#include "fake_mailbox.hpp"

using namespace otpxx;
using std::chrono::milliseconds;

namespace
{

const auto BASE_TIME = std::chrono::system_clock::now() - std::chrono::hours{1};

fake::mail otp_mail(const std::string& code, int minute, const std::string& from = "noreply@svc.com")
{
    fake::mail m;
    m.from = from;
    m.to = "me@example.com";
    m.subject = "Sign in";
    m.body = "Your login code is " + code;
    m.received = BASE_TIME + std::chrono::minutes{minute};
    return m;
}

poller_options fast_options(std::vector<std::string> folders = {"INBOX"})
{
    poller_options opts;
    opts.folders = std::move(folders);
    opts.backoff.initial = milliseconds{20};
    opts.scan_grace = milliseconds{200};
    opts.max_message_age = std::chrono::seconds{0};
    return opts;
}

fetch_request request_for(std::string recipient, milliseconds max_wait = milliseconds{1000})
{
    return fetch_request{std::move(recipient), {"noreply@svc.com"}, max_wait};
}

struct harness
{
    explicit harness(poller_options opts = fast_options())
    {
        pool::pool_config cfg;
        cfg.min_connections = 0;
        cfg.max_connections = 4;
        cfg.acquire_timeout = std::chrono::seconds{1};
        pool = pool::make_pool<mailbox_session>(ctx.get_executor(), cfg, fake::make_factory(box));
        engine = std::make_unique<poller>(pool, cache, parser, std::move(opts));
    }

    fetch_outcome run(fetch_request request)
    {
        std::optional<fetch_outcome> outcome;
        asio::co_spawn(ctx,
            [&]() -> asio::awaitable<void>
            {
                outcome = co_await engine->fetch(std::move(request));
            },
            asio::detached);
        ctx.run();
        ctx.restart();
        BOOST_REQUIRE(outcome.has_value());
        return std::move(*outcome);
    }

    asio::io_context ctx;
    std::shared_ptr<fake::mailbox> box = std::make_shared<fake::mailbox>();
    result_cache cache;
    message_parser parser;
    std::shared_ptr<poller::pool_type> pool;
    std::unique_ptr<poller> engine;
};

} // namespace


BOOST_AUTO_TEST_CASE(cached_result_skips_the_mailbox)
{
    harness h;
    fetch_result stored;
    stored.otp = "111111";
    stored.folder = "INBOX";
    h.cache.put(make_cache_key("a@x", {"b@y"}), stored);

    auto outcome = h.run(fetch_request{"A@X", {"b@y"}, milliseconds{1000}});
    BOOST_REQUIRE(outcome.has_value());
    BOOST_REQUIRE(outcome->has_value());
    BOOST_TEST((*outcome)->otp == "111111");
    BOOST_TEST((*outcome)->cached);

    BOOST_TEST(h.box->sessions_opened == 0);
    BOOST_TEST(h.box->examines == 0);
    BOOST_TEST(h.engine->stats().cache_hits == 1u);
}

BOOST_AUTO_TEST_CASE(zero_deadline_runs_one_round)
{
    harness h;
    h.box->add_folder("INBOX");

    auto outcome = h.run(request_for("me@example.com", milliseconds{0}));
    BOOST_REQUIRE(outcome.has_value());
    BOOST_TEST(!outcome->has_value());

    const auto stats = h.engine->stats();
    BOOST_TEST(stats.rounds == 1u);
    BOOST_TEST(stats.timeouts == 1u);
    BOOST_TEST(h.box->examines == 1);
}

BOOST_AUTO_TEST_CASE(code_found_and_cached)
{
    harness h;
    h.box->add("INBOX", otp_mail("482913", 1));

    auto first = h.run(request_for("me@example.com"));
    BOOST_REQUIRE(first.has_value());
    BOOST_REQUIRE(first->has_value());
    BOOST_TEST((*first)->otp == "482913");
    BOOST_TEST((*first)->folder == "INBOX");
    BOOST_TEST((*first)->subject == "Sign in");
    BOOST_TEST(!(*first)->cached);

    auto second = h.run(request_for("me@example.com"));
    BOOST_REQUIRE(second.has_value());
    BOOST_REQUIRE(second->has_value());
    BOOST_TEST((*second)->otp == "482913");
    BOOST_TEST((*second)->cached);

    BOOST_TEST(h.box->sessions_opened == 1);
    BOOST_TEST(h.box->searches == 1);
    BOOST_TEST(h.cache.size() == 1u);
}

BOOST_AUTO_TEST_CASE(code_arriving_during_backoff)
{
    harness h;
    h.box->add_folder("INBOX");
    std::optional<fetch_outcome> outcome;

    asio::co_spawn(h.ctx,
        [&]() -> asio::awaitable<void>
        {
            outcome = co_await h.engine->fetch(request_for("me@example.com", milliseconds{3000}));
        },
        asio::detached);
    asio::co_spawn(h.ctx,
        [&]() -> asio::awaitable<void>
        {
            co_await asio::sleep_for(milliseconds{100});
            h.box->add("INBOX", otp_mail("654321", 2));
        },
        asio::detached);
    h.ctx.run();

    BOOST_REQUIRE(outcome.has_value());
    BOOST_REQUIRE(outcome->has_value());
    BOOST_REQUIRE((*outcome)->has_value());
    BOOST_TEST((**outcome)->otp == "654321");
    BOOST_TEST(h.engine->stats().rounds > 1u);
    BOOST_TEST(h.box->sessions_opened == 1);
}

BOOST_AUTO_TEST_CASE(rejected_credentials_fail_fast)
{
    harness h(fast_options({"INBOX", "Spam"}));
    h.box->add("INBOX", otp_mail("482913", 1));
    h.box->reject_login = true;

    const auto start = std::chrono::steady_clock::now();
    auto outcome = h.run(request_for("me@example.com", milliseconds{5000}));
    BOOST_REQUIRE(!outcome.has_value());
    BOOST_TEST(outcome.error().code == errc::imap_auth_failed);
    BOOST_TEST((std::chrono::steady_clock::now() - start < std::chrono::seconds{2}));

    const auto stats = h.engine->stats();
    BOOST_TEST(stats.errors == 1u);
    BOOST_TEST(stats.rounds == 1u);
    BOOST_TEST(h.cache.size() == 0u);
}

BOOST_AUTO_TEST_CASE(earliest_match_across_folders_wins)
{
    harness h(fast_options({"INBOX", "Spam"}));
    h.box->add("INBOX", otp_mail("222222", 5));
    h.box->add("Spam", otp_mail("111111", 1));

    auto outcome = h.run(request_for("me@example.com"));
    BOOST_REQUIRE(outcome.has_value());
    BOOST_REQUIRE(outcome->has_value());
    BOOST_TEST((*outcome)->otp == "111111");
    BOOST_TEST((*outcome)->folder == "Spam");
}

BOOST_AUTO_TEST_CASE(simultaneous_matches_break_ties_by_folder_name)
{
    harness h(fast_options({"Spam", "INBOX"}));
    h.box->add("Spam", otp_mail("111111", 3));
    h.box->add("INBOX", otp_mail("222222", 3));

    auto outcome = h.run(request_for("me@example.com"));
    BOOST_REQUIRE(outcome.has_value());
    BOOST_REQUIRE(outcome->has_value());
    BOOST_TEST((*outcome)->folder == "INBOX");
    BOOST_TEST((*outcome)->otp == "222222");
}

BOOST_AUTO_TEST_CASE(concurrent_requests_share_one_poll)
{
    harness h;
    h.box->add("INBOX", otp_mail("482913", 1));
    h.box->latency = milliseconds{30};
    std::vector<std::string> codes;

    for (int i = 0; i < 3; ++i)
    {
        asio::co_spawn(h.ctx,
            [&]() -> asio::awaitable<void>
            {
                auto outcome = co_await h.engine->fetch(request_for("me@example.com"));
                if (outcome && outcome->has_value())
                    codes.push_back((*outcome)->otp);
            },
            asio::detached);
    }
    h.ctx.run();

    BOOST_REQUIRE(codes.size() == 3u);
    for (const auto& code : codes)
        BOOST_TEST(code == "482913");

    const auto stats = h.engine->stats();
    BOOST_TEST(stats.requests == 3u);
    BOOST_TEST(stats.joined == 2u);
    BOOST_TEST(stats.successes == 3u);
    BOOST_TEST(stats.rounds == 1u);
    BOOST_TEST(h.box->examines == 1);
    BOOST_TEST(h.engine->inflight_count() == 0u);
}

BOOST_AUTO_TEST_CASE(joined_request_keeps_its_own_deadline)
{
    harness h;
    h.box->add_folder("INBOX");
    std::optional<fetch_outcome> leader;
    std::optional<fetch_outcome> follower;
    std::chrono::steady_clock::duration follower_took{};
    std::vector<poll_state> finals;
    h.engine->set_state_callback([&](const cache_key&, poll_state state)
    {
        if (state == poll_state::success || state == poll_state::timeout || state == poll_state::error)
            finals.push_back(state);
    });

    asio::co_spawn(h.ctx,
        [&]() -> asio::awaitable<void>
        {
            leader = co_await h.engine->fetch(request_for("me@example.com", milliseconds{1500}));
        },
        asio::detached);
    asio::co_spawn(h.ctx,
        [&]() -> asio::awaitable<void>
        {
            const auto start = std::chrono::steady_clock::now();
            follower = co_await h.engine->fetch(request_for("me@example.com", milliseconds{100}));
            follower_took = std::chrono::steady_clock::now() - start;
        },
        asio::detached);
    h.ctx.run();

    BOOST_REQUIRE(follower.has_value());
    BOOST_REQUIRE(follower->has_value());
    BOOST_TEST(!(*follower)->has_value());
    BOOST_TEST((follower_took < milliseconds{1000}));

    BOOST_REQUIRE(leader.has_value());
    BOOST_REQUIRE(leader->has_value());
    BOOST_TEST(!(*leader)->has_value());

    const auto stats = h.engine->stats();
    BOOST_TEST(stats.joined == 1u);
    BOOST_TEST(stats.timeouts == 2u);
    BOOST_TEST(stats.rounds > 1u);
    BOOST_REQUIRE(finals.size() == 2u);
    BOOST_TEST((finals[0] == poll_state::timeout));
    BOOST_TEST((finals[1] == poll_state::timeout));
}

BOOST_AUTO_TEST_CASE(reset_link_request)
{
    harness h;
    auto reset = otp_mail("", 1);
    reset.subject = "Reset your password";
    reset.body = "Choose a new password: https://accounts.spotify.com/password-reset/complete?token=T1";
    h.box->add("INBOX", reset);

    fetch_request request = request_for("me@example.com");
    request.kind = fetch_kind::reset_link;
    request.subjects = {"Reset your password"};
    auto outcome = h.run(request);
    BOOST_REQUIRE(outcome.has_value());
    BOOST_REQUIRE(outcome->has_value());
    BOOST_REQUIRE((*outcome)->reset_link.has_value());
    BOOST_TEST(*(*outcome)->reset_link == "https://accounts.spotify.com/password-reset/complete?token=T1");
    BOOST_TEST((*outcome)->otp.empty());
    BOOST_TEST(h.box->criteria.back() == "UNSEEN FROM \"noreply@svc.com\" SUBJECT \"Reset your password\"");

    BOOST_TEST(h.cache.get(make_cache_key("me@example.com", {"noreply@svc.com"}, fetch_kind::reset_link)).has_value());
    BOOST_TEST(!h.cache.get(make_cache_key("me@example.com", {"noreply@svc.com"})).has_value());
}

BOOST_AUTO_TEST_CASE(fatal_scan_stops_retries_elsewhere)
{
    harness h(fast_options({"INBOX", "Spam"}));
    h.box->add_folder("INBOX");
    h.box->add("Spam", otp_mail("482913", 1));
    h.box->examine_errors["INBOX"] = errc::internal_error;
    h.box->scan_failures = 5;
    h.box->latency = milliseconds{20};

    auto outcome = h.run(request_for("me@example.com", milliseconds{2000}));
    BOOST_REQUIRE(!outcome.has_value());
    BOOST_TEST(outcome.error().code == errc::internal_error);
    BOOST_TEST(h.box->searches == 1);
    BOOST_TEST(h.box->sessions_opened == 2);
    BOOST_TEST(h.pool->stats().in_use_connections == 0u);
}

BOOST_AUTO_TEST_CASE(lost_session_is_replaced)
{
    harness h;
    h.box->add("INBOX", otp_mail("482913", 1));
    h.box->connect_failures = 1;
    h.box->scan_failures = 1;

    auto outcome = h.run(request_for("me@example.com"));
    BOOST_REQUIRE(outcome.has_value());
    BOOST_REQUIRE(outcome->has_value());
    BOOST_TEST((*outcome)->otp == "482913");

    BOOST_TEST(h.box->sessions_opened == 2);
    BOOST_TEST(h.pool->stats().connections_failed == 1u);
    BOOST_TEST(h.pool->stats().connections_closed == 1u);
}

BOOST_AUTO_TEST_CASE(connection_errors_exhaust_retries)
{
    auto opts = fast_options();
    opts.connection_retry_count = 1;
    harness h(opts);
    h.box->add("INBOX", otp_mail("482913", 1));
    h.box->connect_failures = 10;

    auto outcome = h.run(request_for("me@example.com"));
    BOOST_REQUIRE(!outcome.has_value());
    BOOST_TEST(outcome.error().code == errc::net_connection_refused);
    BOOST_TEST(h.box->connect_failures == 8);
}

BOOST_AUTO_TEST_CASE(refused_folder_does_not_fail_the_request)
{
    harness h(fast_options({"Archive", "INBOX"}));
    h.box->add("INBOX", otp_mail("482913", 1));

    auto outcome = h.run(request_for("me@example.com"));
    BOOST_REQUIRE(outcome.has_value());
    BOOST_REQUIRE(outcome->has_value());
    BOOST_TEST((*outcome)->otp == "482913");
}

BOOST_AUTO_TEST_CASE(request_without_senders)
{
    harness h;
    auto outcome = h.run(fetch_request{"me@example.com", {}, milliseconds{1000}});
    BOOST_REQUIRE(!outcome.has_value());
    BOOST_TEST(outcome.error().code == errc::invalid_argument);
}

BOOST_AUTO_TEST_CASE(state_transitions)
{
    harness h;
    h.box->add_folder("INBOX");
    std::vector<poll_state> states;
    h.engine->set_state_callback([&](const cache_key& key, poll_state state)
    {
        BOOST_TEST(key.recipient == "me@example.com");
        states.push_back(state);
    });

    auto outcome = h.run(request_for("me@example.com", milliseconds{30}));
    BOOST_REQUIRE(outcome.has_value());
    BOOST_TEST(!outcome->has_value());

    BOOST_REQUIRE(states.size() >= 3u);
    BOOST_TEST((states.front() == poll_state::cache_lookup));
    BOOST_TEST((states[1] == poll_state::scanning));
    BOOST_TEST((states.back() == poll_state::timeout));
}

BOOST_AUTO_TEST_CASE(missing_pool_throws)
{
    result_cache cache;
    message_parser parser;
    BOOST_CHECK_THROW(poller(nullptr, cache, parser), std::invalid_argument);
}
