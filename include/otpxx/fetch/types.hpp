/*

fetch/types.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>
#include <otpxx/detail/ascii.hpp>
#include <otpxx/detail/result.hpp>

namespace otpxx
{

/// What a request waits for.
enum class fetch_kind
{
    otp,
    reset_link,
    both
};

[[nodiscard]] constexpr std::string_view to_string(fetch_kind kind) noexcept
{
    switch (kind)
    {
        case fetch_kind::otp: return "otp";
        case fetch_kind::reset_link: return "reset_link";
        case fetch_kind::both: return "both";
    }
    return "unknown";
}

/**
A request for one OTP or account link.

`senders` lists the accepted From addresses; `target_recipient` is the address
the code was sent to, used for caching and, when enabled, for filtering.
`subjects`, when not empty, narrows the server search to any of these
Subject substrings.
**/
struct fetch_request
{
    std::string target_recipient;
    std::vector<std::string> senders;
    std::chrono::milliseconds max_wait{30000};
    fetch_kind kind = fetch_kind::otp;
    std::vector<std::string> subjects;
};

/// Cache and de-duplication key: (target recipient, sender filter, kind).
struct cache_key
{
    std::string recipient;
    std::string sender;
    fetch_kind kind = fetch_kind::otp;

    friend bool operator==(const cache_key&, const cache_key&) = default;

    friend bool operator<(const cache_key& lhs, const cache_key& rhs) noexcept
    {
        return std::tie(lhs.recipient, lhs.sender, lhs.kind) < std::tie(rhs.recipient, rhs.sender, rhs.kind);
    }
};

/// Addresses are compared case-insensitively; the sender list is order-insensitive.
[[nodiscard]] inline cache_key make_cache_key(std::string_view recipient, const std::vector<std::string>& senders,
    fetch_kind kind = fetch_kind::otp)
{
    std::vector<std::string> normalized;
    normalized.reserve(senders.size());
    for (const auto& sender : senders)
        normalized.push_back(detail::to_lower_copy(detail::trim_view(sender)));
    std::sort(normalized.begin(), normalized.end());
    normalized.erase(std::unique(normalized.begin(), normalized.end()), normalized.end());

    cache_key key;
    key.recipient = detail::to_lower_copy(detail::trim_view(recipient));
    key.kind = kind;
    for (const auto& sender : normalized)
    {
        if (!key.sender.empty())
            key.sender.push_back(',');
        key.sender += sender;
    }
    return key;
}

[[nodiscard]] inline cache_key make_cache_key(const fetch_request& request)
{
    return make_cache_key(request.target_recipient, request.senders, request.kind);
}

/// A message pulled from a folder, before extraction.
struct candidate_message
{
    std::string folder;
    std::uint32_t uid = 0;
    std::string subject;
    std::string body;

    /// Raw HTML part, searched for links that the text rendering drops.
    std::string html;
    std::chrono::system_clock::time_point received_at{};
    bool seen = false;
};

/// A message from which a code or a link was extracted. `otp` is empty when only a link was found.
struct otp_candidate
{
    std::string otp;
    std::optional<std::string> reset_link;
    std::string folder;
    std::uint32_t uid = 0;
    std::string subject;
    std::chrono::system_clock::time_point received_at{};
};

/// Earliest received first; ties broken by folder name, then UID.
[[nodiscard]] inline bool earlier_candidate(const otp_candidate& lhs, const otp_candidate& rhs) noexcept
{
    return std::tie(lhs.received_at, lhs.folder, lhs.uid) < std::tie(rhs.received_at, rhs.folder, rhs.uid);
}

struct fetch_result
{
    std::string otp;
    std::optional<std::string> reset_link;
    std::string folder;
    std::string subject;
    bool cached = false;
    std::chrono::milliseconds fetch_time{0};
};

/// A value on success, an empty optional on timeout, an error otherwise.
using fetch_outcome = result<std::optional<fetch_result>>;

} // namespace otpxx
