#pragma once

#include <chrono>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstddef>
#include <system_error>
#include <otpxx/detail/append.hpp>
#include <otpxx/detail/ascii.hpp>
#include <otpxx/detail/datetime.hpp>
#include <otpxx/detail/result.hpp>
#include <otpxx/detail/sanitize.hpp>
#include <otpxx/imap/utf7.hpp>
#include <otpxx/net/dialog.hpp>
#include <otpxx/net/tls_options.hpp>

namespace otpxx::imap
{

enum class status
{
    ok,
    no,
    bad,
    preauth,
    bye,
    unknown
};

enum class auth_method
{
    login,
    plain,
    auto_detect
};

struct credentials
{
    std::string username;
    std::string secret;
};

/// Quote a string argument, escaping '"' and '\'.
[[nodiscard]] inline result<std::string> to_astring(std::string_view text)
{
    auto checked = otpxx::detail::ensure_no_crlf_or_nul(text, "astring");
    if (!checked)
        return std::unexpected(std::move(checked).error());
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char ch : text)
    {
        if (ch == '"' || ch == '\\')
            out.push_back('\\');
        out.push_back(ch);
    }
    out.push_back('"');
    return ok(std::move(out));
}

[[nodiscard]] inline result<std::string> to_mailbox(std::string_view utf8_mailbox)
{
    auto encoded = encode_modified_utf7(utf8_mailbox);
    if (!encoded)
        return encoded;
    return to_astring(*encoded);
}

struct mailbox_stat
{
    std::uint32_t messages_no = 0;
    std::uint32_t recent = 0;
    std::uint32_t unseen = 0;
    std::uint32_t uid_next = 0;
    std::uint32_t uid_validity = 0;
};

/// One message returned by UID FETCH (UID FLAGS INTERNALDATE BODY.PEEK[]).
struct fetched_message
{
    std::uint32_t uid = 0;
    std::vector<std::string> flags;
    std::optional<std::chrono::system_clock::time_point> internal_date;
    std::string raw;

    [[nodiscard]] bool has_flag(std::string_view flag) const noexcept
    {
        for (const auto& f : flags)
        {
            if (otpxx::detail::iequals_ascii(f, flag))
                return true;
        }
        return false;
    }

    [[nodiscard]] bool seen() const noexcept
    {
        return has_flag("\\Seen");
    }
};

struct response
{
    std::string tag;
    status st = status::unknown;
    std::string text;
    std::vector<std::string> untagged_lines;
    std::vector<std::string> continuation;
    std::vector<std::string> tagged_lines;
    std::vector<std::string> literals;
};

struct options
{
    std::size_t max_line_length = 64 * 1024;
    std::optional<std::chrono::steady_clock::duration> timeout = std::chrono::seconds(30);
    std::string default_sni;
    bool allow_cleartext_auth = false;
    bool require_tls_for_auth = true;
    otpxx::net::tls_options tls;
    bool redact_secrets_in_trace = true;
};

namespace parse
{
    [[nodiscard]] inline std::string_view ltrim(std::string_view text)
    {
        while (!text.empty() && text.front() == ' ')
            text.remove_prefix(1);
        return text;
    }

    [[nodiscard]] inline std::pair<std::string_view, std::string_view> split_token(std::string_view text)
    {
        text = ltrim(text);
        auto pos = text.find(' ');
        if (pos == std::string_view::npos)
            return {text, std::string_view{}};
        return {text.substr(0, pos), ltrim(text.substr(pos + 1))};
    }

    [[nodiscard]] inline bool parse_uint32(std::string_view token, std::uint32_t& out)
    {
        if (token.empty())
            return false;
        std::uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (ec != std::errc{} || ptr != token.data() + token.size())
            return false;
        out = value;
        return true;
    }

    /// Literal announcement "{n}" or "{n+}" at the end of a line.
    [[nodiscard]] inline bool extract_literal_size(std::string_view line, std::size_t& out)
    {
        if (line.size() < 3 || line.back() != '}')
            return false;

        const auto brace = line.rfind('{');
        if (brace == std::string_view::npos)
            return false;

        std::string_view inner = line.substr(brace + 1, line.size() - brace - 2);
        if (!inner.empty() && inner.back() == '+')
            inner.remove_suffix(1);
        if (inner.empty())
            return false;

        std::size_t value = 0;
        for (char ch : inner)
        {
            if (ch < '0' || ch > '9')
                return false;
            value = value * 10 + static_cast<std::size_t>(ch - '0');
        }

        out = value;
        return true;
    }

    /**
    Cursor over the attribute list of one FETCH response. Literal placeholders
    ("{n}") are resolved against the literals received with the response, in
    order of appearance.
    **/
    class fetch_cursor
    {
    public:
        fetch_cursor(std::string_view text, const std::vector<std::string>& literals, std::size_t first_literal)
            : text_(text), literals_(literals), next_literal_(first_literal)
        {
        }

        void skip_space() noexcept
        {
            while (!text_.empty() && (text_.front() == ' ' || text_.front() == '\r' || text_.front() == '\n'))
                text_.remove_prefix(1);
        }

        [[nodiscard]] bool at(char ch) noexcept
        {
            skip_space();
            return !text_.empty() && text_.front() == ch;
        }

        bool consume(char ch) noexcept
        {
            if (!at(ch))
                return false;
            text_.remove_prefix(1);
            return true;
        }

        [[nodiscard]] bool empty() noexcept
        {
            skip_space();
            return text_.empty();
        }

        /// Attribute name, including a section such as "BODY[]" or "BODY[HEADER.FIELDS (FROM)]".
        std::string_view attribute_name() noexcept
        {
            skip_space();
            std::size_t n = 0;
            int depth = 0;
            while (n < text_.size())
            {
                const char ch = text_[n];
                if (ch == '[')
                    ++depth;
                else if (ch == ']')
                    --depth;
                else if (depth == 0 && (ch == ' ' || ch == '(' || ch == ')'))
                    break;
                ++n;
            }
            std::string_view name = text_.substr(0, n);
            text_.remove_prefix(n);
            return name;
        }

        std::string_view atom() noexcept
        {
            skip_space();
            std::size_t n = 0;
            while (n < text_.size() && text_[n] != ' ' && text_[n] != '(' && text_[n] != ')')
                ++n;
            std::string_view word = text_.substr(0, n);
            text_.remove_prefix(n);
            return word;
        }

        /// String value: quoted, literal or NIL.
        bool string_value(std::string& out)
        {
            skip_space();
            if (text_.empty())
                return false;
            if (text_.front() == '"')
            {
                text_.remove_prefix(1);
                out.clear();
                while (!text_.empty())
                {
                    const char ch = text_.front();
                    text_.remove_prefix(1);
                    if (ch == '"')
                        return true;
                    if (ch == '\\' && !text_.empty())
                    {
                        out.push_back(text_.front());
                        text_.remove_prefix(1);
                        continue;
                    }
                    out.push_back(ch);
                }
                return false;
            }
            if (text_.front() == '{')
            {
                const auto close = text_.find('}');
                if (close == std::string_view::npos || next_literal_ >= literals_.size())
                    return false;
                text_.remove_prefix(close + 1);
                out = literals_[next_literal_++];
                return true;
            }
            const std::string_view word = atom();
            if (!otpxx::detail::iequals_ascii(word, "NIL"))
                return false;
            out.clear();
            return true;
        }

        /// Parenthesized list of atoms, e.g. FLAGS.
        bool atom_list(std::vector<std::string>& out)
        {
            if (!consume('('))
                return false;
            out.clear();
            while (!at(')'))
            {
                const std::string_view word = atom();
                if (word.empty())
                    return false;
                out.emplace_back(word);
            }
            return consume(')');
        }

        /// Skip any value, keeping literal bookkeeping in sync.
        bool skip_value()
        {
            skip_space();
            if (text_.empty())
                return false;
            if (text_.front() == '(')
            {
                text_.remove_prefix(1);
                while (!at(')'))
                {
                    if (!skip_value())
                        return false;
                }
                return consume(')');
            }
            if (text_.front() == '"' || text_.front() == '{')
            {
                std::string ignored;
                return string_value(ignored);
            }
            return !atom().empty();
        }

        [[nodiscard]] std::size_t next_literal() const noexcept
        {
            return next_literal_;
        }

    private:
        std::string_view text_;
        const std::vector<std::string>& literals_;
        std::size_t next_literal_;
    };
} // namespace parse

[[nodiscard]] inline bool parse_exists(std::string_view line, std::uint32_t& out)
{
    auto [star, rest] = parse::split_token(line);
    if (star != "*")
        return false;
    auto [num, rest2] = parse::split_token(rest);
    if (!parse::parse_uint32(num, out))
        return false;
    auto [keyword, rest3] = parse::split_token(rest2);
    (void)rest3;
    return otpxx::detail::iequals_ascii(keyword, "EXISTS");
}

[[nodiscard]] inline bool parse_recent(std::string_view line, std::uint32_t& out)
{
    auto [star, rest] = parse::split_token(line);
    if (star != "*")
        return false;
    auto [num, rest2] = parse::split_token(rest);
    if (!parse::parse_uint32(num, out))
        return false;
    auto [keyword, rest3] = parse::split_token(rest2);
    (void)rest3;
    return otpxx::detail::iequals_ascii(keyword, "RECENT");
}

[[nodiscard]] inline bool parse_ok_item(std::string_view line, std::string_view key, std::uint32_t& out)
{
    auto [star, rest] = parse::split_token(line);
    if (star != "*")
        return false;
    auto [ok_word, rest2] = parse::split_token(rest);
    if (!otpxx::detail::iequals_ascii(ok_word, "OK"))
        return false;
    if (rest2.empty() || rest2.front() != '[')
        return false;
    auto close = rest2.find(']');
    if (close == std::string_view::npos)
        return false;
    std::string_view inner = rest2.substr(1, close - 1);
    auto [inner_key, inner_rest] = parse::split_token(inner);
    if (!otpxx::detail::iequals_ascii(inner_key, key))
        return false;
    auto [value_token, ignored] = parse::split_token(inner_rest);
    (void)ignored;
    return parse::parse_uint32(value_token, out);
}

inline void parse_mailbox_stat(std::string_view line, mailbox_stat& stat)
{
    std::uint32_t value = 0;
    if (parse_exists(line, value))
        stat.messages_no = value;
    else if (parse_recent(line, value))
        stat.recent = value;
    else if (parse_ok_item(line, "UNSEEN", value))
        stat.unseen = value;
    else if (parse_ok_item(line, "UIDNEXT", value))
        stat.uid_next = value;
    else if (parse_ok_item(line, "UIDVALIDITY", value))
        stat.uid_validity = value;
}

[[nodiscard]] inline std::vector<std::uint32_t> parse_search_ids(std::string_view line)
{
    std::vector<std::uint32_t> ids;
    auto [star, rest] = parse::split_token(line);
    if (star != "*")
        return ids;
    auto [keyword, rest2] = parse::split_token(rest);
    if (!otpxx::detail::iequals_ascii(keyword, "SEARCH"))
        return ids;
    while (!rest2.empty())
    {
        auto [id_token, remaining] = parse::split_token(rest2);
        std::uint32_t value = 0;
        if (!parse::parse_uint32(id_token, value))
            break;
        ids.push_back(value);
        rest2 = remaining;
    }
    return ids;
}

/// INTERNALDATE value, e.g. "17-Jul-1996 02:44:25 -0700". The day may be space padded.
[[nodiscard]] inline std::optional<std::chrono::system_clock::time_point> parse_internaldate(std::string_view text)
{
    otpxx::detail::date_scanner in(otpxx::detail::trim_view(text));
    int day = 0;
    int year = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int offset = 0;
    if (!in.number(1, 2, day) || !in.consume('-'))
        return std::nullopt;
    const auto month = otpxx::detail::month_from_name(in.word());
    if (!month || !in.consume('-') || !in.number(4, 4, year))
        return std::nullopt;
    in.skip_space();
    if (!in.number(2, 2, hour) || !in.consume(':') || !in.number(2, 2, minute) || !in.consume(':')
        || !in.number(2, 2, second))
        return std::nullopt;
    in.skip_space();
    if (!in.zone(offset))
        return std::nullopt;
    return otpxx::detail::make_time_point(year, *month, static_cast<unsigned>(day), hour, minute, second, offset);
}

/**
Collect the messages of a UID FETCH response.

Untagged lines are grouped by their leading "* n FETCH"; lines that follow a
literal continue the previous group. Groups that are not FETCH data are
skipped, as are FETCH groups without a UID.
**/
[[nodiscard]] inline result<std::vector<fetched_message>> parse_fetch_response(const response& resp)
{
    struct group
    {
        std::string text;
        std::size_t first_literal = 0;
        std::size_t literal_count = 0;
    };

    std::vector<group> groups;
    std::size_t literal_index = 0;
    for (const auto& line : resp.untagged_lines)
    {
        if (line.starts_with("* ") || groups.empty())
        {
            group g;
            g.first_literal = literal_index;
            groups.push_back(std::move(g));
        }
        else
            groups.back().text.push_back(' ');
        groups.back().text += line;

        std::size_t size = 0;
        if (parse::extract_literal_size(line, size))
        {
            ++groups.back().literal_count;
            ++literal_index;
        }
    }

    std::vector<fetched_message> messages;
    for (const auto& g : groups)
    {
        auto [star, rest] = parse::split_token(g.text);
        auto [seq, rest2] = parse::split_token(rest);
        auto [keyword, body] = parse::split_token(rest2);
        std::uint32_t seq_no = 0;
        if (star != "*" || !parse::parse_uint32(seq, seq_no) || !otpxx::detail::iequals_ascii(keyword, "FETCH"))
            continue;

        parse::fetch_cursor cursor(body, resp.literals, g.first_literal);
        if (!cursor.consume('('))
            return fail<std::vector<fetched_message>>(errc::imap_parse_error, "Malformed FETCH response.", g.text);

        fetched_message msg;
        bool has_uid = false;
        while (!cursor.at(')'))
        {
            if (cursor.empty())
                return fail<std::vector<fetched_message>>(errc::imap_parse_error, "Truncated FETCH response.");

            const std::string name = otpxx::detail::to_upper_copy(cursor.attribute_name());
            bool parsed = true;
            if (name == "UID")
                parsed = has_uid = parse::parse_uint32(cursor.atom(), msg.uid);
            else if (name == "FLAGS")
                parsed = cursor.atom_list(msg.flags);
            else if (name == "INTERNALDATE")
            {
                std::string value;
                parsed = cursor.string_value(value);
                if (parsed)
                    msg.internal_date = parse_internaldate(value);
            }
            else if (name == "BODY[]" || name == "RFC822" || name.starts_with("BODY[]<"))
                parsed = cursor.string_value(msg.raw);
            else if (name.empty())
                parsed = false;
            else
                parsed = cursor.skip_value();

            if (!parsed)
                return fail<std::vector<fetched_message>>(errc::imap_parse_error,
                    "Malformed FETCH attribute.", name);
        }
        cursor.consume(')');

        // Unsolicited flag updates
        if (!has_uid)
            continue;
        messages.push_back(std::move(msg));
    }
    return ok(std::move(messages));
}

} // namespace otpxx::imap
