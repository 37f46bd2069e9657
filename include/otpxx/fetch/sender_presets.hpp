#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>
#include <otpxx/detail/ascii.hpp>
#include <otpxx/fetch/types.hpp>

namespace otpxx
{

struct sender_preset
{
    std::string_view service;
    std::array<std::string_view, 4> senders;
};

/// Sender addresses used by well known services for their login codes.
inline constexpr std::array<sender_preset, 10> SENDER_PRESETS{{
    {"spotify", {"no-reply@spotify.com", "no-reply@alerts.spotify.com"}},
    {"canva", {"no-reply@canva.com", "no-reply@account.canva.com"}},
    {"paypal", {"service@intl.paypal.com"}},
    {"hbo", {"no-reply@hbomax.com", "noreply@hbo.com", "no-reply@updates.hbomax.com"}},
    {"scribd", {"no-reply@scribd.com", "accounts@scribd.com", "support@scribd.com", "support@account.scribd.com"}},
    {"quizlet", {"no-reply@quizlet.com", "account@account.quizlet.com", "team@quizlet.com"}},
    {"perplexity", {"no-reply@perplexity.ai", "support@perplexity.ai", "team@mail.perplexity.ai", "team@perplexity.ai"}},
    {"grammarly", {"hello@notification.grammarly.com", "support@grammarly.com"}},
    {"airwallex", {"noreply@airwallex.com"}},
    {"openai", {"noreply@tm.openai.com", "noreply@openai.com"}}
}};

/// Senders for a service name (case-insensitive); empty when unknown.
[[nodiscard]] inline std::vector<std::string> senders_for_service(std::string_view service)
{
    std::vector<std::string> out;
    for (const auto& preset : SENDER_PRESETS)
    {
        if (!detail::iequals_ascii(preset.service, service))
            continue;
        for (std::string_view sender : preset.senders)
        {
            if (!sender.empty())
                out.emplace_back(sender);
        }
        break;
    }
    return out;
}

/// Subject terms that narrow a service's search to one kind of mail; empty when none apply.
[[nodiscard]] inline std::vector<std::string> subjects_for_service(std::string_view service, fetch_kind kind)
{
    if (!detail::iequals_ascii(service, "spotify"))
        return {};
    switch (kind)
    {
        case fetch_kind::otp: return {"login code", "Spotify login code"};
        case fetch_kind::reset_link: return {"Reset your password"};
        case fetch_kind::both: break;
    }
    return {};
}

} // namespace otpxx
