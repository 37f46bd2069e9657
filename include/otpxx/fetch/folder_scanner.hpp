/*

fetch/folder_scanner.hpp
------------------------

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
#include <vector>
#include <otpxx/detail/append.hpp>
#include <otpxx/detail/ascii.hpp>
#include <otpxx/detail/asio_decl.hpp>
#include <otpxx/detail/datetime.hpp>
#include <otpxx/detail/log.hpp>
#include <otpxx/detail/result.hpp>
#include <otpxx/fetch/message_parser.hpp>
#include <otpxx/fetch/session.hpp>
#include <otpxx/fetch/types.hpp>
#include <otpxx/imap/types.hpp>
#include <otpxx/mime/message.hpp>

namespace otpxx
{

/// What a scan looks for in one folder.
struct scan_filter
{
    /// Accepted From addresses. An entry starting with '@' accepts a whole domain.
    std::vector<std::string> senders;

    /// Any of these Subject substrings; empty disables the check.
    std::vector<std::string> subjects;

    /// Required To/Cc/Delivered-To address; empty disables the check.
    std::string recipient;

    /// A code, a link, or either makes a message a candidate.
    fetch_kind kind = fetch_kind::otp;

    /// Newest unread messages inspected per scan.
    std::size_t limit = 30;

    /// Ignore mail received before this day.
    std::optional<std::chrono::system_clock::time_point> since;
};


/**
Build the UID SEARCH criteria for a filter:
`UNSEEN [OR FROM a ...] FROM z [OR SUBJECT s ...] [SUBJECT t] [TO r] [SINCE d-Mon-yyyy]`.

@return The criteria, or errc::invalid_argument when an address or subject contains CR, LF or NUL.
**/
[[nodiscard]] inline result<std::string> build_search_criteria(const scan_filter& filter)
{
    std::string criteria = "UNSEEN";
    for (std::size_t i = 0; i < filter.senders.size(); ++i)
    {
        auto sender = imap::to_astring(detail::trim_view(filter.senders[i]));
        if (!sender)
            return std::unexpected(std::move(sender).error());
        detail::append_space(criteria);
        if (i + 1 < filter.senders.size())
            detail::append_sv(criteria, "OR ");
        detail::append_sv(criteria, "FROM ");
        detail::append_sv(criteria, *sender);
    }

    for (std::size_t i = 0; i < filter.subjects.size(); ++i)
    {
        auto subject = imap::to_astring(filter.subjects[i]);
        if (!subject)
            return std::unexpected(std::move(subject).error());
        detail::append_space(criteria);
        if (i + 1 < filter.subjects.size())
            detail::append_sv(criteria, "OR ");
        detail::append_sv(criteria, "SUBJECT ");
        detail::append_sv(criteria, *subject);
    }

    if (!filter.recipient.empty())
    {
        auto recipient = imap::to_astring(detail::trim_view(filter.recipient));
        if (!recipient)
            return std::unexpected(std::move(recipient).error());
        detail::append_sv(criteria, " TO ");
        detail::append_sv(criteria, *recipient);
    }

    if (filter.since.has_value())
    {
        detail::append_sv(criteria, " SINCE ");
        detail::append_sv(criteria, detail::format_imap_date(*filter.since));
    }
    return ok(std::move(criteria));
}


/**
Retrieves the newest unread messages of a folder and turns the matching ones
into candidates.

Messages that are already seen, that cannot be parsed, or that fail the sender
or recipient check are skipped, as are messages without what the filter's kind
asks for: a code, a link, or either. A folder the server refuses to open yields
no candidates.
**/
class folder_scanner
{
public:
    explicit folder_scanner(const message_parser& parser) : parser_(parser)
    {
    }

    asio::awaitable<result<std::vector<otp_candidate>>> scan(mailbox_session& session, std::string folder,
        scan_filter filter) const
    {
        std::vector<otp_candidate> found;

        auto stat = co_await session.examine(folder);
        if (!stat)
        {
            if (is_folder_error(stat.error().code))
            {
                OTPXX_LOG_WARN("scanner", "cannot open folder " << folder << ": " << describe(stat.error()));
                co_return ok(std::move(found));
            }
            co_return std::unexpected(std::move(stat).error());
        }
        if (stat->messages_no == 0)
            co_return ok(std::move(found));

        std::string criteria;
        OTPXX_CO_TRY_ASSIGN(criteria, build_search_criteria(filter));
        std::vector<std::uint32_t> uids;
        OTPXX_CO_TRY_ASSIGN(uids, co_await session.uid_search(criteria));
        if (uids.empty() || filter.limit == 0)
            co_return ok(std::move(found));

        // Higher UIDs are newer.
        std::sort(uids.begin(), uids.end());
        uids.erase(std::unique(uids.begin(), uids.end()), uids.end());
        if (uids.size() > filter.limit)
            uids.erase(uids.begin(), uids.end() - static_cast<std::ptrdiff_t>(filter.limit));

        std::vector<imap::fetched_message> messages;
        OTPXX_CO_TRY_ASSIGN(messages, co_await session.uid_fetch_messages(uids));
        OTPXX_LOG_DEBUG("scanner", folder << ": " << uids.size() << " unread candidates, "
            << messages.size() << " fetched");

        for (const auto& fetched : messages)
        {
            if (fetched.seen())
                continue;

            auto parsed = mime::message::parse(fetched.raw);
            if (!parsed)
            {
                OTPXX_LOG_DEBUG("scanner", folder << " uid " << fetched.uid << ": " << describe(parsed.error()));
                continue;
            }
            if (!matches_filter(*parsed, filter))
                continue;

            candidate_message candidate = make_candidate(folder, fetched, *parsed);
            auto otp = parser_.parse(candidate);
            std::optional<std::string> link;
            if (filter.kind != fetch_kind::otp)
                link = parser_.find_link(candidate);

            const bool wanted = filter.kind == fetch_kind::otp ? otp.has_value()
                : filter.kind == fetch_kind::reset_link ? link.has_value()
                : otp.has_value() || link.has_value();
            if (!wanted)
            {
                OTPXX_LOG_DEBUG("scanner", folder << " uid " << fetched.uid << ": no " << to_string(filter.kind) << " found");
                continue;
            }

            otp_candidate match;
            if (otp)
                match.otp = std::move(*otp);
            match.reset_link = std::move(link);
            match.folder = folder;
            match.uid = candidate.uid;
            match.subject = std::move(candidate.subject);
            match.received_at = candidate.received_at;
            found.push_back(std::move(match));
        }
        co_return ok(std::move(found));
    }

    /// Client side recheck of the server search.
    [[nodiscard]] static bool matches_filter(const mime::message& msg, const scan_filter& filter)
    {
        if (!filter.senders.empty())
        {
            bool sender_ok = false;
            for (const auto& from : msg.from())
            {
                for (const auto& sender : filter.senders)
                {
                    if (address_matches(from.address, sender))
                    {
                        sender_ok = true;
                        break;
                    }
                }
            }
            if (!sender_ok)
                return false;
        }

        if (!filter.recipient.empty())
        {
            const std::string_view wanted = detail::trim_view(filter.recipient);
            return std::any_of(msg.recipients().begin(), msg.recipients().end(),
                [wanted](const mime::mail_address& to) { return detail::iequals_ascii(to.address, wanted); });
        }
        return true;
    }

    [[nodiscard]] static candidate_message make_candidate(std::string_view folder, const imap::fetched_message& fetched,
        const mime::message& msg)
    {
        candidate_message candidate;
        candidate.folder = std::string(folder);
        candidate.uid = fetched.uid;
        candidate.subject = msg.subject();
        candidate.body = msg.body_text();
        candidate.html = msg.html_text();
        candidate.seen = fetched.seen();
        if (fetched.internal_date.has_value())
            candidate.received_at = *fetched.internal_date;
        else if (msg.date().has_value())
            candidate.received_at = *msg.date();
        else
            candidate.received_at = std::chrono::system_clock::now();
        return candidate;
    }

private:
    static bool address_matches(std::string_view address, std::string_view sender)
    {
        sender = detail::trim_view(sender);
        if (sender.empty())
            return false;
        if (sender.front() == '@')
        {
            return address.size() > sender.size()
                && detail::iequals_ascii(address.substr(address.size() - sender.size()), sender);
        }
        return detail::iequals_ascii(address, sender);
    }

    const message_parser& parser_;
};

} // namespace otpxx
