/*

imap/client.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <otpxx/detail/append.hpp>
#include <otpxx/detail/ascii.hpp>
#include <otpxx/detail/asio_decl.hpp>
#include <otpxx/detail/log.hpp>
#include <otpxx/detail/redact.hpp>
#include <otpxx/detail/result.hpp>
#include <otpxx/detail/sanitize.hpp>
#include <otpxx/detail/sasl.hpp>
#include <otpxx/imap/error_mapping.hpp>
#include <otpxx/imap/types.hpp>
#include <otpxx/net/dialog.hpp>
#include <otpxx/net/error_mapping.hpp>
#include <otpxx/net/tls_mode.hpp>
#include <otpxx/net/upgradable_stream.hpp>

namespace otpxx::imap
{

using otpxx::asio::any_io_executor;
using otpxx::asio::awaitable;
using otpxx::asio::io_context;
using otpxx::asio::use_awaitable;
using otpxx::asio::tcp;
namespace ssl = otpxx::asio::ssl;

/**
Read-only IMAP4rev1 client.

Only the commands needed to look for messages are provided; nothing that
changes a mailbox is ever sent. A client is not safe for concurrent use: the
caller (usually the connection pool) guarantees that one coroutine drives it
at a time.
**/
class client
{
public:
    using executor_type = any_io_executor;
    using dialog_type = otpxx::net::dialog<otpxx::net::upgradable_stream>;

    explicit client(executor_type executor, options opts = {})
        : executor_(executor),
          options_(std::move(opts))
    {
    }

    explicit client(io_context& context, options opts = {})
        : client(context.get_executor(), std::move(opts))
    {
    }

    client(const client&) = delete;
    client& operator=(const client&) = delete;

    executor_type get_executor() const { return executor_; }

    [[nodiscard]] bool is_connected() const noexcept
    {
        return dialog_.has_value();
    }

    [[nodiscard]] bool is_tls() const noexcept
    {
        return dialog_.has_value() && dialog_->stream().is_tls();
    }

    [[nodiscard]] const options& get_options() const noexcept
    {
        return options_;
    }

    /**
    Resolve and connect. With tls_mode::implicit the TLS handshake is done
    before the greeting; with tls_mode::starttls the greeting is read and
    STARTTLS negotiated, so read_greeting() must not be called afterwards.
    **/
    awaitable<result_void> connect(const std::string& host, unsigned short port,
        otpxx::net::tls_mode mode = otpxx::net::tls_mode::none,
        ssl::context* tls_ctx = nullptr, std::string sni = {})
    {
        co_return co_await connect_impl(host, std::to_string(port), mode, tls_ctx, std::move(sni));
    }

    awaitable<result<response>> read_greeting()
    {
        dialog_type* dlg = nullptr;
        OTPXX_CO_TRY_ASSIGN(dlg, dialog_ptr());
        response resp;
        std::string line;
        OTPXX_CO_TRY_ASSIGN(line, co_await dlg->read_line());
        handle_line(resp, line, std::string_view{});
        if (resp.st == status::bye)
            co_return imap_fail<response>(error_kind::bye, "IMAP server refused the connection.", {}, "GREETING", line, resp);
        if (resp.st != status::ok && resp.st != status::preauth)
            co_return imap_fail<response>(error_kind::parse, "Unexpected IMAP greeting.", {}, "GREETING", line, resp);
        parse_capability_line(line);
        co_return ok(std::move(resp));
    }

    awaitable<result<response>> command(std::string_view cmd)
    {
        co_return co_await command_impl(cmd);
    }

    awaitable<result<response>> capability()
    {
        response resp;
        OTPXX_CO_TRY_ASSIGN(resp, co_await command_impl("CAPABILITY"));
        capabilities_.clear();
        for (const auto& line : resp.untagged_lines)
            parse_capability_line(line);
        capabilities_known_ = true;
        co_return ok(std::move(resp));
    }

    [[nodiscard]] bool has_capability(std::string_view name) const noexcept
    {
        for (const auto& cap : capabilities_)
        {
            if (otpxx::detail::iequals_ascii(cap, name))
                return true;
        }
        return false;
    }

    awaitable<result<response>> login(std::string_view username, std::string_view password)
    {
        dialog_type* dlg = nullptr;
        OTPXX_CO_TRY_ASSIGN(dlg, dialog_ptr());
        OTPXX_CO_TRY_VOID(enforce_auth_tls_policy(*dlg));
        std::string user;
        OTPXX_CO_TRY_ASSIGN(user, to_astring(username));
        std::string pass;
        OTPXX_CO_TRY_ASSIGN(pass, to_astring(password));
        std::string cmd;
        otpxx::detail::append_sv(cmd, "LOGIN");
        otpxx::detail::append_space(cmd);
        otpxx::detail::append_sv(cmd, user);
        otpxx::detail::append_space(cmd);
        otpxx::detail::append_sv(cmd, pass);
        co_return co_await command_impl(cmd);
    }

    /// Authenticate; auto_detect picks AUTHENTICATE PLAIN when advertised, LOGIN otherwise.
    awaitable<result<response>> authenticate(credentials cred, auth_method method)
    {
        OTPXX_CO_TRY_VOID(otpxx::detail::ensure_no_crlf_or_nul(cred.username, "username"));
        OTPXX_CO_TRY_VOID(otpxx::detail::ensure_no_crlf_or_nul(cred.secret, "secret"));

        if (!capabilities_known_ && method != auth_method::login)
            OTPXX_TRY_CO_AWAIT(capability());

        auth_method resolved = method;
        if (method == auth_method::auto_detect)
            resolved = has_capability("AUTH=PLAIN") ? auth_method::plain : auth_method::login;

        if (resolved == auth_method::plain)
            co_return co_await authenticate_plain(cred);
        co_return co_await login(cred.username, cred.secret);
    }

    /// Open a mailbox read-only.
    awaitable<result<std::pair<response, mailbox_stat>>> examine(std::string_view mailbox)
    {
        OTPXX_CO_TRY_VOID(otpxx::detail::ensure_no_crlf_or_nul(mailbox, "mailbox"));

        std::string box;
        OTPXX_CO_TRY_ASSIGN(box, to_mailbox(mailbox));
        std::string cmd;
        otpxx::detail::append_sv(cmd, "EXAMINE");
        otpxx::detail::append_space(cmd);
        otpxx::detail::append_sv(cmd, box);

        response resp;
        OTPXX_CO_TRY_ASSIGN(resp, co_await command_impl(cmd));
        mailbox_stat stat;
        for (const auto& line : resp.untagged_lines)
            parse_mailbox_stat(line, stat);
        selected_ = std::string(mailbox);
        co_return ok(std::make_pair(std::move(resp), stat));
    }

    awaitable<result<std::vector<std::uint32_t>>> uid_search(std::string_view criteria)
    {
        OTPXX_CO_TRY_VOID(otpxx::detail::ensure_no_crlf_or_nul(criteria, "criteria"));

        std::string cmd;
        otpxx::detail::append_sv(cmd, "UID SEARCH");
        if (!criteria.empty())
        {
            otpxx::detail::append_space(cmd);
            otpxx::detail::append_sv(cmd, criteria);
        }

        response resp;
        OTPXX_CO_TRY_ASSIGN(resp, co_await command_impl(cmd));
        std::vector<std::uint32_t> ids;
        for (const auto& line : resp.untagged_lines)
        {
            auto parsed = parse_search_ids(line);
            if (!parsed.empty())
                ids.insert(ids.end(), parsed.begin(), parsed.end());
        }

        co_return ok(std::move(ids));
    }

    awaitable<result<response>> uid_fetch(std::string_view uid_set, std::string_view items)
    {
        OTPXX_CO_TRY_VOID(otpxx::detail::ensure_no_crlf_or_nul(uid_set, "uid_set"));
        OTPXX_CO_TRY_VOID(otpxx::detail::ensure_no_crlf_or_nul(items, "items"));

        std::string cmd;
        otpxx::detail::append_sv(cmd, "UID FETCH");
        otpxx::detail::append_space(cmd);
        otpxx::detail::append_sv(cmd, uid_set);
        otpxx::detail::append_space(cmd);
        otpxx::detail::append_sv(cmd, items);
        co_return co_await command_impl(cmd);
    }

    /// Fetch full messages without setting \Seen (BODY.PEEK).
    awaitable<result<std::vector<fetched_message>>> uid_fetch_messages(const std::vector<std::uint32_t>& uids)
    {
        if (uids.empty())
            co_return ok(std::vector<fetched_message>{});

        std::string set;
        otpxx::detail::append_uid_set(set, uids);
        response resp;
        OTPXX_CO_TRY_ASSIGN(resp, co_await uid_fetch(set, "(UID FLAGS INTERNALDATE BODY.PEEK[])"));
        co_return parse_fetch_response(resp);
    }

    awaitable<result<response>> noop()
    {
        co_return co_await command_impl("NOOP");
    }

    /// Send LOGOUT and close the connection. The server's BYE is expected here.
    awaitable<result<response>> logout()
    {
        auto res = co_await command_impl("LOGOUT");
        close();
        co_return res;
    }

    awaitable<result_void> start_tls(ssl::context& context, std::string sni = {})
    {
        OTPXX_TRY_CO_AWAIT(command_impl("STARTTLS"));

        dialog_type* dlg = nullptr;
        OTPXX_CO_TRY_ASSIGN(dlg, dialog_ptr());
        const std::size_t max_len = dlg->max_line_length();
        const auto timeout = dlg->timeout();

        otpxx::net::upgradable_stream stream = std::move(dlg->stream());
        dialog_.reset();

        std::string resolved_sni;
        OTPXX_CO_TRY_ASSIGN(resolved_sni, resolve_sni(remote_host_, std::move(sni)));
        OTPXX_TRY_CO_AWAIT(start_tls_stream(stream, context, std::move(resolved_sni)));

        dialog_.emplace(std::move(stream), max_len, timeout);
        configure_trace();
        capabilities_.clear();
        capabilities_known_ = false;
        co_return ok();
    }

    /// Drop the connection without a LOGOUT.
    void close() noexcept
    {
        if (!dialog_.has_value())
            return;
        dialog_->stream().close();
        dialog_.reset();
        selected_.clear();
    }

    [[nodiscard]] const std::string& selected_mailbox() const noexcept
    {
        return selected_;
    }

private:
    [[nodiscard]] otpxx::detail::error_detail imap_detail(
        std::string_view tag,
        std::string_view command,
        std::string_view tagged_line,
        std::size_t untagged_count,
        std::size_t literals_count) const
    {
        std::string command_value;
        std::string tagged_value;
        if (options_.redact_secrets_in_trace)
        {
            command_value = otpxx::detail::redact_line(command);
            tagged_value = otpxx::detail::redact_line(tagged_line);
        }
        else
        {
            command_value.assign(command.begin(), command.end());
            tagged_value.assign(tagged_line.begin(), tagged_line.end());
        }
        return make_imap_detail(tag, command_value, tagged_value, untagged_count, literals_count);
    }

    template<typename T>
    [[nodiscard]] result<T> imap_fail(
        error_kind kind,
        std::string_view message,
        std::string_view tag,
        std::string_view command,
        std::string_view tagged_line,
        const response& resp) const
    {
        return fail<T>(
            map_imap_error(kind),
            std::string(message),
            imap_detail(tag, command, tagged_line, resp.untagged_lines.size(), resp.literals.size()).str());
    }

    [[nodiscard]] static std::string_view tagged_line_or_text(const response& resp) noexcept
    {
        if (!resp.tagged_lines.empty())
            return resp.tagged_lines.back();
        return resp.text;
    }

    result<std::string> resolve_sni(std::string_view host, std::string sni) const
    {
        if (sni.empty())
            sni = options_.default_sni;
        if (sni.empty())
            sni.assign(host.begin(), host.end());
        if (otpxx::detail::contains_crlf_or_nul(sni))
            return fail<std::string>(errc::invalid_argument, "Invalid sni: CR/LF or NUL not allowed.");
        return ok(std::move(sni));
    }

    result<dialog_type*> dialog_ptr()
    {
        if (!dialog_.has_value())
            return fail<dialog_type*>(
                errc::imap_invalid_state,
                "Connection is not established.",
                imap_detail({}, "CONNECT", {}, 0, 0).str());
        return ok(&*dialog_);
    }

    void configure_trace()
    {
        if (!dialog_.has_value())
            return;
        dialog_->set_trace_protocol("IMAP");
        dialog_->set_trace_redaction(options_.redact_secrets_in_trace);
    }

    awaitable<result_void> connect_impl(const std::string& host, const std::string& service,
        otpxx::net::tls_mode mode, ssl::context* tls_ctx, std::string sni)
    {
        if (dialog_.has_value())
            co_return fail_void(
                errc::imap_invalid_state,
                "Connection is already established.",
                imap_detail({}, "CONNECT", {}, 0, 0).str());
        OTPXX_CO_TRY_VOID(otpxx::detail::ensure_no_crlf_or_nul(host, "host"));
        OTPXX_CO_TRY_VOID(otpxx::detail::ensure_no_crlf_or_nul(service, "service"));
        if (mode != otpxx::net::tls_mode::none && tls_ctx == nullptr)
            co_return fail_void(errc::imap_invalid_state, "TLS context is required.",
                imap_detail({}, "CONNECT", {}, 0, 0).str());
        remote_host_ = host;

        OTPXX_LOG_DEBUG("imap", "connecting to " << host << ":" << service << " tls=" << mode);

        otpxx::net::upgradable_stream stream(executor_);
        OTPXX_TRY_CO_AWAIT(connect_socket(stream, host, service));

        if (mode == otpxx::net::tls_mode::implicit)
        {
            std::string resolved_sni;
            OTPXX_CO_TRY_ASSIGN(resolved_sni, resolve_sni(host, sni));
            OTPXX_TRY_CO_AWAIT(start_tls_stream(stream, *tls_ctx, std::move(resolved_sni)));
        }

        dialog_.emplace(std::move(stream), options_.max_line_length, options_.timeout);
        configure_trace();
        tag_counter_ = 0;
        capabilities_.clear();
        capabilities_known_ = false;

        if (mode == otpxx::net::tls_mode::starttls)
        {
            OTPXX_TRY_CO_AWAIT(read_greeting());
            OTPXX_TRY_CO_AWAIT(start_tls(*tls_ctx, std::move(sni)));
        }

        co_return ok();
    }

    /// Resolve and connect, bounded by the I/O timeout.
    awaitable<result_void> connect_socket(otpxx::net::upgradable_stream& stream,
        const std::string& host, const std::string& service)
    {
        struct connect_state
        {
            bool timed_out = false;
            bool done = false;
        };
        auto state = std::make_shared<connect_state>();
        auto timer = std::make_shared<otpxx::asio::steady_timer>(executor_);
        auto resolver = std::make_shared<tcp::resolver>(executor_);
        if (options_.timeout.has_value())
        {
            timer->expires_after(*options_.timeout);
            timer->async_wait([resolver, state, &stream](const otpxx::asio::error_code& ec)
                {
                    if (ec || state->done)
                        return;
                    state->timed_out = true;
                    resolver->cancel();
                    otpxx::asio::error_code ignored;
                    stream.lowest_layer().cancel(ignored);
                });
        }

        otpxx::asio::error_code ec;
        auto endpoints = co_await resolver->async_resolve(host, service,
            otpxx::asio::redirect_error(use_awaitable, ec));
        if (!ec)
        {
            co_await otpxx::asio::async_connect(stream.lowest_layer(), endpoints,
                otpxx::asio::redirect_error(use_awaitable, ec));
            if (ec)
            {
                state->done = true;
                timer->cancel();
                co_return otpxx::net::fail_from_asio<void>(otpxx::net::io_stage::connect, ec, state->timed_out, host);
            }
        }
        state->done = true;
        timer->cancel();
        if (ec)
            co_return otpxx::net::fail_from_asio<void>(otpxx::net::io_stage::resolve, ec, state->timed_out, host);
        co_return ok();
    }

    awaitable<result_void> start_tls_stream(otpxx::net::upgradable_stream& stream,
        ssl::context& context, std::string sni)
    {
        auto tls_res = co_await stream.start_tls(context, std::move(sni), options_.tls);
        if (!tls_res)
            co_return fail<void>(std::move(tls_res).error());
        co_return ok();
    }

    awaitable<result<response>> authenticate_plain(const credentials& cred)
    {
        dialog_type* dlg = nullptr;
        OTPXX_CO_TRY_ASSIGN(dlg, dialog_ptr());
        OTPXX_CO_TRY_VOID(enforce_auth_tls_policy(*dlg));
        std::string encoded;
        OTPXX_CO_TRY_ASSIGN(encoded, otpxx::sasl::encode_plain(cred.username, cred.secret));

        if (has_capability("SASL-IR"))
        {
            std::string cmd;
            otpxx::detail::append_sv(cmd, "AUTHENTICATE PLAIN");
            otpxx::detail::append_space(cmd);
            otpxx::detail::append_sv(cmd, encoded);
            co_return co_await command_impl(cmd);
        }

        co_return co_await command_with_one_continuation("AUTHENTICATE PLAIN", encoded);
    }

    result_void enforce_auth_tls_policy(dialog_type& dlg)
    {
        if (dlg.stream().is_tls() || !options_.require_tls_for_auth)
            return ok();
        if (options_.allow_cleartext_auth)
        {
            OTPXX_LOG_WARN("imap", "authentication without TLS allowed by configuration");
            return ok();
        }
        return fail_void(
            errc::imap_invalid_state,
            "TLS required for authentication; use tls_mode::implicit or tls_mode::starttls",
            imap_detail({}, "AUTH", "tls required", 0, 0).str());
    }

    std::string next_tag()
    {
        std::string tag = "A";
        otpxx::detail::append_uint(tag, ++tag_counter_);
        return tag;
    }

    awaitable<result<response>> command_impl(std::string_view cmd)
    {
        OTPXX_CO_TRY_VOID(otpxx::detail::ensure_no_crlf_or_nul(cmd, "command"));

        const std::string tag = next_tag();
        std::string line = tag;
        if (!cmd.empty())
        {
            otpxx::detail::append_space(line);
            otpxx::detail::append_sv(line, cmd);
        }

        dialog_type* dlg = nullptr;
        OTPXX_CO_TRY_ASSIGN(dlg, dialog_ptr());
        OTPXX_TRY_CO_AWAIT(dlg->write_line(line));
        response resp;
        resp.tag = tag;
        OTPXX_TRY_CO_AWAIT(read_response_until_tag(*dlg, resp, tag, cmd));
        co_return finalize_response(std::move(resp), cmd);
    }

    awaitable<result<response>> command_with_one_continuation(
        std::string_view cmd, std::string_view continuation_line)
    {
        OTPXX_CO_TRY_VOID(otpxx::detail::ensure_no_crlf_or_nul(cmd, "command"));
        OTPXX_CO_TRY_VOID(otpxx::detail::ensure_no_crlf_or_nul(continuation_line, "continuation"));

        const std::string tag = next_tag();
        std::string line = tag;
        otpxx::detail::append_space(line);
        otpxx::detail::append_sv(line, cmd);

        dialog_type* dlg = nullptr;
        OTPXX_CO_TRY_ASSIGN(dlg, dialog_ptr());
        OTPXX_TRY_CO_AWAIT(dlg->write_line(line));

        response resp;
        resp.tag = tag;

        bool continuation_sent = false;
        while (true)
        {
            std::string resp_line;
            OTPXX_CO_TRY_ASSIGN(resp_line, co_await dlg->read_line());
            handle_line(resp, resp_line, tag);

            if (!continuation_sent && !resp_line.empty() && resp_line[0] == '+')
            {
                continuation_sent = true;
                OTPXX_TRY_CO_AWAIT(dlg->write_line(continuation_line));
            }

            if (is_tagged_line(resp_line, tag))
                break;
        }

        if (!continuation_sent && resp.st == status::ok)
        {
            co_return imap_fail<response>(
                error_kind::continuation_expected,
                "IMAP continuation expected.",
                tag,
                cmd,
                tagged_line_or_text(resp),
                resp);
        }

        co_return finalize_response(std::move(resp), cmd);
    }

    awaitable<result_void> read_response_until_tag(dialog_type& dlg, response& resp, const std::string& tag,
        std::string_view command)
    {
        while (true)
        {
            std::string line;
            OTPXX_CO_TRY_ASSIGN(line, co_await dlg.read_line());
            handle_line(resp, line, tag);

            std::size_t literal_size = 0;
            if (parse::extract_literal_size(line, literal_size))
            {
                std::string literal;
                OTPXX_CO_TRY_ASSIGN(literal, co_await dlg.read_exactly(literal_size));
                resp.literals.push_back(std::move(literal));
            }

            if (is_tagged_line(line, tag))
                break;

            // An untagged BYE ends the session unless we asked for it.
            if (resp.st == status::bye && !otpxx::detail::iequals_ascii(command, "LOGOUT"))
            {
                co_return imap_fail<void>(
                    error_kind::bye,
                    "IMAP server closed the session.",
                    tag,
                    command,
                    line,
                    resp);
            }
        }
        co_return ok();
    }

    static bool is_tagged_line(std::string_view line, std::string_view tag)
    {
        if (tag.empty() || line.size() <= tag.size())
            return false;
        if (!line.starts_with(tag))
            return false;
        return line[tag.size()] == ' ';
    }

    static status parse_status_word(std::string_view word)
    {
        const std::string upper = otpxx::detail::to_upper_copy(word);
        if (upper == "OK")
            return status::ok;
        if (upper == "NO")
            return status::no;
        if (upper == "BAD")
            return status::bad;
        if (upper == "PREAUTH")
            return status::preauth;
        if (upper == "BYE")
            return status::bye;
        return status::unknown;
    }

    static void handle_line(response& resp, const std::string& line, std::string_view tag)
    {
        if (!tag.empty() && is_tagged_line(line, tag))
        {
            resp.tagged_lines.push_back(line);
            auto [word, tail] = parse::split_token(std::string_view(line).substr(tag.size()));
            resp.st = parse_status_word(word);
            resp.text.assign(tail.begin(), tail.end());
            return;
        }

        if (!line.empty() && line[0] == '*')
        {
            resp.untagged_lines.push_back(line);
            auto [word, tail] = parse::split_token(std::string_view(line).substr(1));
            const status st = parse_status_word(word);
            if (st == status::bye || (st != status::unknown && resp.st == status::unknown))
            {
                resp.st = st;
                resp.text.assign(tail.begin(), tail.end());
            }
            return;
        }

        if (!line.empty() && line[0] == '+')
        {
            resp.continuation.push_back(line);
            return;
        }

        resp.untagged_lines.push_back(line);
    }

    result<response> finalize_response(response&& resp, std::string_view command)
    {
        if (resp.st == status::no)
        {
            return imap_fail<response>(
                error_kind::tagged_no,
                "IMAP tagged NO.",
                resp.tag,
                command,
                tagged_line_or_text(resp),
                resp);
        }
        if (resp.st == status::bad)
        {
            return imap_fail<response>(
                error_kind::tagged_bad,
                "IMAP tagged BAD.",
                resp.tag,
                command,
                tagged_line_or_text(resp),
                resp);
        }
        if (resp.st != status::ok)
        {
            return imap_fail<response>(
                error_kind::parse,
                "IMAP parse error.",
                resp.tag,
                command,
                tagged_line_or_text(resp),
                resp);
        }
        return ok(std::move(resp));
    }

    void parse_capability_line(std::string_view line)
    {
        const auto pos = otpxx::detail::ifind_ascii(line, "CAPABILITY");
        if (pos == std::string_view::npos)
            return;
        std::string_view rest = line.substr(pos + std::string_view("CAPABILITY").size());
        while (!rest.empty())
        {
            auto [token, remaining] = parse::split_token(rest);
            if (token.empty())
                break;
            // Response code form: "[CAPABILITY ...] text"
            const bool last = token.back() == ']';
            while (!token.empty() && token.back() == ']')
                token.remove_suffix(1);
            if (!token.empty())
                capabilities_.emplace_back(otpxx::detail::to_upper_copy(token));
            if (last)
                break;
            rest = remaining;
        }
        capabilities_known_ = !capabilities_.empty();
    }

    executor_type executor_;
    options options_;
    std::optional<dialog_type> dialog_;
    std::string remote_host_;
    std::string selected_;
    std::uint64_t tag_counter_{0};
    std::vector<std::string> capabilities_;
    bool capabilities_known_{false};
};

} // namespace otpxx::imap
