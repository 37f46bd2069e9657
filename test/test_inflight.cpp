/*

test_inflight.cpp
-----------------

Leader and follower hand-off for concurrent fetches of the same key.

*/

#define BOOST_TEST_MODULE inflight_test

#include <boost/test/unit_test.hpp>
#include <chrono>
#include <optional>
#include <otpxx/fetch/inflight.hpp>

using namespace otpxx;


BOOST_AUTO_TEST_CASE(follower_receives_leader_outcome)
{
    asio::io_context ctx;
    inflight_registry registry;
    const auto key = make_cache_key("a@x", {"b@y"});
    std::optional<fetch_outcome> seen;

    auto leader = registry.join(key, ctx.get_executor());
    BOOST_TEST(leader.is_leader());
    BOOST_TEST(registry.size() == 1u);

    asio::co_spawn(ctx,
        [&]() -> asio::awaitable<void>
        {
            auto follower = registry.join(key, ctx.get_executor());
            BOOST_TEST(!follower.is_leader());
            seen = co_await follower.wait();
        },
        asio::detached);

    asio::co_spawn(ctx,
        [&]() -> asio::awaitable<void>
        {
            co_await asio::sleep_for(std::chrono::milliseconds{10});
            fetch_result res;
            res.otp = "482913";
            leader.publish(std::optional<fetch_result>(res));
        },
        asio::detached);

    ctx.run();

    BOOST_REQUIRE(seen.has_value());
    BOOST_REQUIRE(seen->has_value());
    BOOST_REQUIRE((*seen)->has_value());
    BOOST_TEST((**seen)->otp == "482913");
    BOOST_TEST(registry.size() == 0u);
}

BOOST_AUTO_TEST_CASE(distinct_keys_each_lead)
{
    asio::io_context ctx;
    inflight_registry registry;

    auto first = registry.join(make_cache_key("a@x", {"b@y"}), ctx.get_executor());
    auto second = registry.join(make_cache_key("c@x", {"b@y"}), ctx.get_executor());
    BOOST_TEST(first.is_leader());
    BOOST_TEST(second.is_leader());
    BOOST_TEST(registry.size() == 2u);

    first.publish(std::optional<fetch_result>{});
    BOOST_TEST(registry.size() == 1u);

    auto again = registry.join(make_cache_key("a@x", {"b@y"}), ctx.get_executor());
    BOOST_TEST(again.is_leader());
}

BOOST_AUTO_TEST_CASE(abandoned_leader_releases_followers)
{
    asio::io_context ctx;
    inflight_registry registry;
    const auto key = make_cache_key("a@x", {"b@y"});
    std::optional<fetch_outcome> seen;

    auto leader = std::make_optional(registry.join(key, ctx.get_executor()));

    asio::co_spawn(ctx,
        [&]() -> asio::awaitable<void>
        {
            auto follower = registry.join(key, ctx.get_executor());
            seen = co_await follower.wait();
        },
        asio::detached);

    asio::co_spawn(ctx,
        [&]() -> asio::awaitable<void>
        {
            co_await asio::sleep_for(std::chrono::milliseconds{10});
            leader.reset();
        },
        asio::detached);

    ctx.run();

    BOOST_REQUIRE(seen.has_value());
    BOOST_REQUIRE(!seen->has_value());
    BOOST_TEST(seen->error().code == errc::internal_error);
    BOOST_TEST(registry.size() == 0u);
}

BOOST_AUTO_TEST_CASE(follower_gives_up_at_its_deadline)
{
    asio::io_context ctx;
    inflight_registry registry;
    const auto key = make_cache_key("a@x", {"b@y"});
    std::optional<std::optional<fetch_outcome>> early;
    std::optional<std::optional<fetch_outcome>> late;

    auto leader = registry.join(key, ctx.get_executor());

    asio::co_spawn(ctx,
        [&]() -> asio::awaitable<void>
        {
            auto follower = registry.join(key, ctx.get_executor());
            early = co_await follower.wait_until(std::chrono::steady_clock::now() + std::chrono::milliseconds{10});
            late = co_await follower.wait_until(std::chrono::steady_clock::now() + std::chrono::seconds{5});
        },
        asio::detached);

    asio::co_spawn(ctx,
        [&]() -> asio::awaitable<void>
        {
            co_await asio::sleep_for(std::chrono::milliseconds{50});
            leader.publish(std::optional<fetch_result>());
        },
        asio::detached);

    ctx.run();

    BOOST_REQUIRE(early.has_value());
    BOOST_TEST(!early->has_value());
    BOOST_REQUIRE(late.has_value());
    BOOST_REQUIRE(late->has_value());
    BOOST_REQUIRE((*late)->has_value());
    BOOST_TEST(!(**late)->has_value());
}
