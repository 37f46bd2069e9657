/*

test_result_cache.cpp
---------------------

Expiry, replacement and capacity of the result cache, driven by a manual clock.

*/

#define BOOST_TEST_MODULE result_cache_test

#include <boost/test/unit_test.hpp>
#include <chrono>
#include <otpxx/fetch/result_cache.hpp>

using namespace otpxx;

namespace
{

struct manual_clock
{
    using duration = std::chrono::milliseconds;
    using rep = duration::rep;
    using period = duration::period;
    using time_point = std::chrono::time_point<manual_clock, duration>;
    static constexpr bool is_steady = true;

    static time_point now() noexcept
    {
        return time_point{current};
    }

    static void advance(duration d) noexcept
    {
        current += d;
    }

    static inline duration current{0};
};

using test_cache = basic_result_cache<manual_clock>;

fetch_result make_result(const std::string& otp)
{
    fetch_result res;
    res.otp = otp;
    res.folder = "INBOX";
    res.subject = "Your code";
    res.fetch_time = std::chrono::milliseconds{120};
    return res;
}

} // namespace


BOOST_AUTO_TEST_CASE(hit_within_ttl_miss_after)
{
    test_cache cache(std::chrono::seconds{10});
    const auto key = make_cache_key("a@x", {"b@y"});
    cache.put(key, make_result("111111"));

    manual_clock::advance(std::chrono::seconds{9});
    auto hit = cache.get(key);
    BOOST_REQUIRE(hit.has_value());
    BOOST_TEST(hit->otp == "111111");
    BOOST_TEST(!hit->cached);

    manual_clock::advance(std::chrono::seconds{1});
    BOOST_TEST(!cache.get(key).has_value());
    BOOST_TEST(cache.size() == 0u);
}

BOOST_AUTO_TEST_CASE(keys_are_normalized)
{
    test_cache cache;
    cache.put(make_cache_key(" A@X ", {"c@z", "B@Y"}), make_result("222222"));

    auto hit = cache.get(make_cache_key("a@x", {"b@y", "c@z", "c@z"}));
    BOOST_REQUIRE(hit.has_value());
    BOOST_TEST(hit->otp == "222222");

    BOOST_TEST(!cache.get(make_cache_key("a@x", {"b@y"})).has_value());
}

BOOST_AUTO_TEST_CASE(put_replaces_existing_entry)
{
    test_cache cache(std::chrono::seconds{10});
    const auto key = make_cache_key("a@x", {"b@y"});
    cache.put(key, make_result("111111"));
    manual_clock::advance(std::chrono::seconds{8});
    cache.put(key, make_result("333333"));
    manual_clock::advance(std::chrono::seconds{8});

    auto hit = cache.get(key);
    BOOST_REQUIRE(hit.has_value());
    BOOST_TEST(hit->otp == "333333");
    BOOST_TEST(cache.size() == 1u);
}

BOOST_AUTO_TEST_CASE(non_positive_ttl_erases)
{
    test_cache cache;
    const auto key = make_cache_key("a@x", {"b@y"});
    cache.put(key, make_result("111111"));
    cache.put(key, make_result("444444"), manual_clock::duration::zero());

    BOOST_TEST(!cache.get(key).has_value());
    BOOST_TEST(cache.size() == 0u);
}

BOOST_AUTO_TEST_CASE(purge_removes_only_expired)
{
    test_cache cache(std::chrono::seconds{10});
    cache.put(make_cache_key("a@x", {"s@y"}), make_result("1"), std::chrono::seconds{1});
    cache.put(make_cache_key("b@x", {"s@y"}), make_result("2"), std::chrono::seconds{2});
    cache.put(make_cache_key("c@x", {"s@y"}), make_result("3"), std::chrono::seconds{30});

    manual_clock::advance(std::chrono::seconds{5});
    BOOST_TEST(cache.size() == 3u);
    BOOST_TEST(cache.purge_expired() == 2u);
    BOOST_TEST(cache.size() == 1u);
    BOOST_TEST(cache.get(make_cache_key("c@x", {"s@y"})).has_value());
}

BOOST_AUTO_TEST_CASE(capacity_evicts_closest_to_expiry)
{
    test_cache cache(std::chrono::seconds{10}, 2);
    const auto first = make_cache_key("a@x", {"s@y"});
    const auto second = make_cache_key("b@x", {"s@y"});
    const auto third = make_cache_key("c@x", {"s@y"});

    cache.put(first, make_result("1"), std::chrono::seconds{20});
    cache.put(second, make_result("2"), std::chrono::seconds{5});
    cache.put(third, make_result("3"));

    BOOST_TEST(cache.size() == 2u);
    BOOST_TEST(cache.get(first).has_value());
    BOOST_TEST(!cache.get(second).has_value());
    BOOST_TEST(cache.get(third).has_value());
}

BOOST_AUTO_TEST_CASE(erase_and_clear)
{
    test_cache cache;
    const auto key = make_cache_key("a@x", {"b@y"});
    cache.put(key, make_result("1"));
    cache.put(make_cache_key("c@x", {"b@y"}), make_result("2"));

    BOOST_TEST(cache.erase(key));
    BOOST_TEST(!cache.erase(key));
    BOOST_TEST(cache.size() == 1u);
    cache.clear();
    BOOST_TEST(cache.size() == 0u);
}
