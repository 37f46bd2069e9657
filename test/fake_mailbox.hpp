/*

fake_mailbox.hpp
----------------

In-memory mailbox shared by the fetch engine tests.

*/

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <otpxx/detail/asio_decl.hpp>
#include <otpxx/detail/result.hpp>
#include <otpxx/fetch/session.hpp>
#include <otpxx/imap/types.hpp>


namespace fake
{

struct mail
{
    std::uint32_t uid = 0;
    std::string from;
    std::string to;
    std::string subject;
    std::string body;

    /// When set, sent as the text/html alternative of `body`.
    std::string html;

    /// Left at the epoch, the message has neither INTERNALDATE nor Date.
    std::chrono::system_clock::time_point received{};
    bool seen = false;
};

inline std::string to_raw(const mail& m)
{
    std::string raw;
    raw += "From: " + m.from + "\r\n";
    raw += "To: " + m.to + "\r\n";
    raw += "Subject: " + m.subject + "\r\n";
    if (m.html.empty())
    {
        raw += "Content-Type: text/plain; charset=utf-8\r\n";
        raw += "\r\n";
        raw += m.body + "\r\n";
        return raw;
    }

    raw += "MIME-Version: 1.0\r\n";
    raw += "Content-Type: multipart/alternative; boundary=\"alt\"\r\n";
    raw += "\r\n";
    raw += "--alt\r\n";
    raw += "Content-Type: text/plain; charset=utf-8\r\n\r\n";
    raw += m.body + "\r\n";
    raw += "--alt\r\n";
    raw += "Content-Type: text/html; charset=utf-8\r\n\r\n";
    raw += m.html + "\r\n";
    raw += "--alt--\r\n";
    return raw;
}


/// Server side state, shared by every session opened on it.
class mailbox
{
public:
    void add(const std::string& folder, mail m)
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto& box = folders[folder];
        if (m.uid == 0)
            m.uid = static_cast<std::uint32_t>(box.size() + 1);
        box.push_back(std::move(m));
    }

    void add_folder(const std::string& folder)
    {
        std::lock_guard<std::mutex> lock(mutex);
        folders[folder];
    }

    std::mutex mutex;
    std::map<std::string, std::vector<mail>> folders;

    // Failure injection
    bool reject_login = false;
    int connect_failures = 0;
    int scan_failures = 0;
    bool noop_fails = false;
    std::map<std::string, otpxx::errc> examine_errors;
    std::chrono::milliseconds latency{0};

    // Observations
    int sessions_opened = 0;
    int examines = 0;
    int searches = 0;
    int fetches = 0;
    int logouts = 0;
    std::size_t largest_fetch = 0;
    std::vector<std::string> criteria;
};


class session : public otpxx::mailbox_session
{
public:
    session(std::shared_ptr<mailbox> box, std::string user) : box_(std::move(box)), user_(std::move(user))
    {
    }

    const std::string& identity() const noexcept override
    {
        return user_;
    }

    otpxx::asio::awaitable<otpxx::result<otpxx::imap::mailbox_stat>> examine(std::string_view folder) override
    {
        co_await delay();
        std::lock_guard<std::mutex> lock(box_->mutex);
        ++box_->examines;
        if (auto failure = box_->examine_errors.find(std::string(folder)); failure != box_->examine_errors.end())
            co_return otpxx::fail<otpxx::imap::mailbox_stat>(failure->second, "Examine failed.");
        auto it = box_->folders.find(std::string(folder));
        if (it == box_->folders.end())
            co_return otpxx::fail<otpxx::imap::mailbox_stat>(otpxx::errc::imap_tagged_no, "Mailbox doesn't exist.");
        selected_ = it->first;
        otpxx::imap::mailbox_stat stat;
        stat.messages_no = static_cast<std::uint32_t>(it->second.size());
        co_return otpxx::ok(stat);
    }

    otpxx::asio::awaitable<otpxx::result<std::vector<std::uint32_t>>> uid_search(std::string_view criteria) override
    {
        co_await delay();
        std::lock_guard<std::mutex> lock(box_->mutex);
        ++box_->searches;
        box_->criteria.emplace_back(criteria);
        if (box_->scan_failures > 0)
        {
            --box_->scan_failures;
            co_return otpxx::fail<std::vector<std::uint32_t>>(otpxx::errc::net_connection_reset, "Connection reset.");
        }
        std::vector<std::uint32_t> uids;
        for (const auto& m : box_->folders[selected_])
        {
            if (!m.seen)
                uids.push_back(m.uid);
        }
        co_return otpxx::ok(std::move(uids));
    }

    otpxx::asio::awaitable<otpxx::result<std::vector<otpxx::imap::fetched_message>>> uid_fetch_messages(
        const std::vector<std::uint32_t>& uids) override
    {
        co_await delay();
        std::lock_guard<std::mutex> lock(box_->mutex);
        ++box_->fetches;
        box_->largest_fetch = std::max(box_->largest_fetch, uids.size());
        std::vector<otpxx::imap::fetched_message> out;
        for (const auto& m : box_->folders[selected_])
        {
            if (std::find(uids.begin(), uids.end(), m.uid) == uids.end())
                continue;
            otpxx::imap::fetched_message msg;
            msg.uid = m.uid;
            if (m.seen)
                msg.flags.push_back("\\Seen");
            if (m.received != std::chrono::system_clock::time_point{})
                msg.internal_date = m.received;
            msg.raw = to_raw(m);
            out.push_back(std::move(msg));
        }
        co_return otpxx::ok(std::move(out));
    }

    otpxx::asio::awaitable<otpxx::result_void> noop() override
    {
        if (box_->noop_fails)
            co_return otpxx::fail_void(otpxx::errc::net_eof, "Connection closed.");
        co_return otpxx::ok();
    }

    otpxx::asio::awaitable<otpxx::result_void> logout() override
    {
        std::lock_guard<std::mutex> lock(box_->mutex);
        ++box_->logouts;
        co_return otpxx::ok();
    }

private:
    otpxx::asio::awaitable<void> delay()
    {
        if (box_->latency.count() > 0)
            co_await otpxx::asio::sleep_for(box_->latency);
    }

    std::shared_ptr<mailbox> box_;
    std::string user_;
    std::string selected_;
};


/// Session factory for connection_pool<mailbox_session>.
inline auto make_factory(std::shared_ptr<mailbox> box)
{
    return [box]() -> otpxx::asio::awaitable<otpxx::result<std::unique_ptr<otpxx::mailbox_session>>>
    {
        using result_type = otpxx::result<std::unique_ptr<otpxx::mailbox_session>>;
        std::lock_guard<std::mutex> lock(box->mutex);
        if (box->reject_login)
            co_return result_type(otpxx::fail<std::unique_ptr<otpxx::mailbox_session>>(
                otpxx::errc::imap_auth_failed, "Invalid credentials."));
        if (box->connect_failures > 0)
        {
            --box->connect_failures;
            co_return result_type(otpxx::fail<std::unique_ptr<otpxx::mailbox_session>>(
                otpxx::errc::net_connection_refused, "Connection refused."));
        }
        ++box->sessions_opened;
        co_return result_type(std::make_unique<session>(box, "user@example.com"));
    };
}

} // namespace fake
