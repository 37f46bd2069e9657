/*

fetch/message_parser.hpp
------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <otpxx/detail/ascii.hpp>
#include <otpxx/detail/regex.hpp>
#include <otpxx/detail/result.hpp>
#include <otpxx/fetch/types.hpp>

namespace otpxx
{

/// Which part of a message a rule looks at.
enum class rule_scope
{
    subject,
    body,
    any
};

/**
One extraction rule. The first capture group of `pattern` is the code.
Patterns are Perl syntax and matched case-insensitively.
**/
struct extraction_rule
{
    std::string name;
    std::string pattern;
    rule_scope scope = rule_scope::any;
};

/// Rules from the most specific phrasing down to a bare six digit run.
[[nodiscard]] inline std::vector<extraction_rule> default_extraction_rules()
{
    return {
        {"subject_code_prefix", R"(^(\d{6})\s*(?:–|—|-)\s*your .*code)", rule_scope::subject},
        {"enter_this_code", R"(enter this code[^\d]*(\d{4,8}))", rule_scope::any},
        {"code_is", R"((?:verification code is|your code is|login code is)[:\s]*(\d{4,8}))", rule_scope::any},
        {"confirmation_code_is", R"((?:verification|confirmation) code[:\s]*is[:\s]*(\d{4,8}))", rule_scope::any},
        {"code_prefix", R"(\bcode[:\s]*(\d{4,8})\b)", rule_scope::any},
        {"six_digits", R"(\b(\d{6})\b)", rule_scope::any}
    };
}

/// Account links: service specific URLs first, then any reset or confirmation URL.
[[nodiscard]] inline std::vector<extraction_rule> default_link_rules()
{
    return {
        {"capcut_reset", R"re((https://www\.capcut\.com/forget-password[^\s<>"]+))re", rule_scope::body},
        {"spotify_reset", R"re((https://accounts\.spotify\.com/[^\s<>"']*password-reset[^\s<>"']*))re", rule_scope::body},
        {"spotify_account", R"re((https://accounts\.spotify\.com/[^\s<>"']+))re", rule_scope::body},
        {"scribd_verify", R"re((https://www\.scribd\.com/[^\s<>"']*(?:verify|confirm|activate)[^\s<>"']*))re", rule_scope::body},
        {"scribd_account", R"re((https://account\.scribd\.com/[^\s<>"']+))re", rule_scope::body},
        {"quizlet_confirm", R"re((https://(?:www\.)?quizlet\.com/[^\s<>"']*(?:confirm|verify|activate)[^\s<>"']*))re", rule_scope::body},
        {"hbo_set_password", R"re((https://auth\.hbomax\.com/set-new-password[^\s<>"']*))re", rule_scope::body},
        {"hbo_account", R"re((https://www\.hbomax\.com/[^\s<>"']*(?:verify|confirm|reset|account)[^\s<>"']*))re", rule_scope::body},
        {"perplexity_verify", R"re((https://(?:www\.)?perplexity\.ai/[^\s<>"']*(?:verify|confirm|reset)[^\s<>"']*))re", rule_scope::body},
        {"generic_reset", R"re((https?://[^\s<>"']+(?:reset|password|recovery|forget|confirm|verify|activate)[^\s<>"']*))re", rule_scope::body}
    };
}


/**
Extracts an OTP from a candidate message.

Rules are tried in order. Each rule is matched against the subject first, then
the body; the first match wins. Text is normalized beforehand: non-breaking
spaces become spaces and whitespace runs collapse to one space.

Link rules are tried in order against the body text followed by the raw HTML
part, so that links only present in `href` attributes are found.
**/
class message_parser
{
public:
    message_parser() : message_parser(default_extraction_rules())
    {
    }

    /**
    @throw std::invalid_argument A pattern does not compile or has no capture group.
    **/
    explicit message_parser(std::vector<extraction_rule> rules,
        std::vector<extraction_rule> link_rules = default_link_rules())
        : rules_(std::move(rules)), link_rules_(std::move(link_rules))
    {
        compiled_ = compile(rules_);
        compiled_links_ = compile(link_rules_);
    }

    /// @return The code, or errc::otp_not_found.
    [[nodiscard]] result<std::string> parse(const candidate_message& msg) const
    {
        return extract(msg.subject, msg.body);
    }

    [[nodiscard]] result<std::string> extract(std::string_view subject, std::string_view body) const
    {
        const std::string subject_text = normalize(subject);
        const std::string body_text = normalize(body);

        for (std::size_t i = 0; i < compiled_.size(); ++i)
        {
            const rule_scope scope = rules_[i].scope;
            if (scope != rule_scope::body)
            {
                if (auto code = match(compiled_[i], subject_text))
                    return ok(std::move(*code));
            }
            if (scope != rule_scope::subject)
            {
                if (auto code = match(compiled_[i], body_text))
                    return ok(std::move(*code));
            }
        }
        return fail<std::string>(errc::otp_not_found, "No code found in message.");
    }

    /// @return The first account link in the message, if any.
    [[nodiscard]] std::optional<std::string> find_link(const candidate_message& msg) const
    {
        std::string text = normalize(msg.body);
        if (!msg.html.empty())
        {
            text.push_back('\n');
            text += msg.html;
        }
        for (const auto& pattern : compiled_links_)
        {
            if (auto link = match(pattern, text))
                return link;
        }
        return std::nullopt;
    }

    [[nodiscard]] const std::vector<extraction_rule>& rules() const noexcept
    {
        return rules_;
    }

    [[nodiscard]] const std::vector<extraction_rule>& link_rules() const noexcept
    {
        return link_rules_;
    }

    /// Replace non-breaking spaces, collapse whitespace and trim.
    [[nodiscard]] static std::string normalize(std::string_view text)
    {
        std::string out;
        out.reserve(text.size());
        bool pending_space = false;
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            const char ch = text[i];
            bool space = ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '\f' || ch == '\v';
            if (!space && static_cast<unsigned char>(ch) == 0xC2 && i + 1 < text.size()
                && static_cast<unsigned char>(text[i + 1]) == 0xA0)
            {
                space = true;
                ++i;
            }

            if (space)
            {
                pending_space = !out.empty();
                continue;
            }
            if (pending_space)
            {
                out.push_back(' ');
                pending_space = false;
            }
            out.push_back(ch);
        }
        return out;
    }

private:
    static std::vector<detail::regex> compile(const std::vector<extraction_rule>& rules)
    {
        std::vector<detail::regex> out;
        out.reserve(rules.size());
        for (const auto& rule : rules)
        {
            try
            {
                out.emplace_back(rule.pattern, detail::regex_icase);
            }
            catch (const detail::regex_error& exc)
            {
                throw std::invalid_argument("Invalid extraction rule `" + rule.name + "`: " + exc.what());
            }
            if (out.back().mark_count() < 1)
                throw std::invalid_argument("Extraction rule `" + rule.name + "` has no capture group.");
        }
        return out;
    }

    static std::optional<std::string> match(const detail::regex& pattern, const std::string& text)
    {
        if (text.empty())
            return std::nullopt;
        detail::smatch found;
        if (!detail::regex_search(text, found, pattern) || !found[1].matched)
            return std::nullopt;
        return found[1].str();
    }

    std::vector<extraction_rule> rules_;
    std::vector<extraction_rule> link_rules_;
    std::vector<detail::regex> compiled_;
    std::vector<detail::regex> compiled_links_;
};

} // namespace otpxx
